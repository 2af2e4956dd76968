#pragma once

#include <cstdint>
#include <filesystem>
#include <utility>
#include <vector>

#include "log.hh"

namespace fsclean {

inline namespace detail_v1_0_0 {

class file_entry_t {
  std::filesystem::path _path;
  uint64_t _size = 0;

 public:
  template <typename Tp>
  inline file_entry_t(Tp &&path, const uint64_t size) noexcept(
      noexcept(std::filesystem::path(std::forward<Tp>(path))))
      : _path(std::forward<Tp>(path)), _size(size) {}

  inline const std::filesystem::path &path() const noexcept { return _path; }
  inline uint64_t size() const noexcept { return _size; }
};

/**
 * @brief content of one directory level
 */
struct dir_batch_t {
  std::filesystem::path dir;
  // regular files, sorted by name
  std::vector<file_entry_t> files;
  // real directories (no symlink), sorted by name
  std::vector<std::filesystem::path> subdirs;
};

/**
 * @brief lazy depth-first (pre-order) directory walker,
 * never follows symlinks. A directory that fails to enumerate is
 * logged and its subtree skipped, the walk goes on with its siblings.
 */
class dir_walker_t {
  std::vector<std::filesystem::path> _stack;
  bool _recursive;
  const logger_t &_log;

  bool read_dir(const std::filesystem::path &dir, dir_batch_t &batch) const;

 public:
  /**
   * @param root directory to walk
   * @param recursive false yields the root batch only
   * @param log logger for traversal errors
   * @throws std::invalid_argument if root is not a directory
   */
  dir_walker_t(const std::filesystem::path &root, const bool recursive,
               const logger_t &log);

  dir_walker_t(const dir_walker_t &) = delete;
  dir_walker_t &operator=(const dir_walker_t &) = delete;

  /**
   * @brief produce next directory batch
   *
   * @param[out] batch overwritten with the next directory
   * @return false when the walk is exhausted
   */
  bool next(dir_batch_t &batch);
};

}  // namespace detail_v1_0_0

}  // namespace fsclean
