#include "group.hh"

#include <utility>

namespace fsclean {

inline namespace detail_v1_0_0 {

bool dupe_grouper_t::add(std::filesystem::path path,
                         const fingerprint_t &fp) {
  if (fp.size == 0) {
    return false;
  }
  auto [it, inserted] = _index.try_emplace(fp, _groups.size());
  if (inserted) {
    _groups.push_back({fp, {}});
  }
  _groups[it->second].paths.emplace_back(std::move(path));
  return true;
}

std::vector<dupe_group_t> dupe_grouper_t::groups() const {
  std::vector<dupe_group_t> dupe_list;
  for (const auto &group : _groups) {
    if (group.paths.size() > 1) {
      dupe_list.push_back(group);
    }
  }
  return dupe_list;
}

}  // namespace detail_v1_0_0

}  // namespace fsclean
