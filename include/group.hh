#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <vector>

#include "fingerprint.hh"

namespace fsclean {

inline namespace detail_v1_0_0 {

struct dupe_group_t {
  fingerprint_t fp;
  // insertion order
  std::vector<std::filesystem::path> paths;
};

/**
 * @brief accumulates fingerprint -> paths over a whole tree walk,
 * single writer. Zero-size records are never grouped.
 */
class dupe_grouper_t {
  std::map<fingerprint_t, std::size_t> _index;
  std::vector<dupe_group_t> _groups;

 public:
  /**
   * @return false if the record was ignored (zero size)
   */
  bool add(std::filesystem::path path, const fingerprint_t &fp);

  // distinct fingerprints seen
  inline std::size_t size() const noexcept { return _groups.size(); }

  /**
   * @brief groups with at least two paths, ordered by first insertion
   */
  std::vector<dupe_group_t> groups() const;
};

}  // namespace detail_v1_0_0

}  // namespace fsclean
