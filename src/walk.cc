#include "walk.hh"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace fsclean {

inline namespace detail_v1_0_0 {

namespace fs = std::filesystem;

dir_walker_t::dir_walker_t(const fs::path &root, const bool recursive,
                           const logger_t &log)
    : _recursive(recursive), _log(log) {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    throw std::invalid_argument("not a directory: " + root.string());
  }
  _stack.emplace_back(root);
}

bool dir_walker_t::read_dir(const fs::path &dir, dir_batch_t &batch) const {
  batch.dir = dir;
  batch.files.clear();
  batch.subdirs.clear();
  try {
    for (const auto &dir_entry : fs::directory_iterator(dir)) {
      std::error_code ec;
      const auto st = dir_entry.symlink_status(ec);
      if (ec) {
        // entry vanished or unreadable, skip
        _log.warn("skip entry: ", dir_entry.path(), " - ", ec.message());

      } else if (fs::is_symlink(st)) {
        // symlink, never followed
        _log.debug("skip symlink: ", dir_entry.path());

      } else if (fs::is_directory(st)) {
        batch.subdirs.emplace_back(dir_entry.path());

      } else if (fs::is_regular_file(st)) {
        auto file_size = dir_entry.file_size(ec);
        if (ec) {
          _log.warn("skip file: ", dir_entry.path(), " - ", ec.message());
        } else {
          batch.files.emplace_back(dir_entry.path(), file_size);
        }

      } else {
        // fifo, socket, device
        _log.debug("skip unsupported file: ", dir_entry.path());
      }
    }
  } catch (fs::filesystem_error &e) {
    if (e.code() == std::errc::no_such_file_or_directory) {
      // removed since its parent was listed
      _log.debug("skip vanished directory: ", dir);
    } else {
      _log.warn("skip directory: ", dir, " - ", e.code().message());
    }
    return false;
  }

  std::sort(batch.files.begin(), batch.files.end(),
            [](const auto &lhs, const auto &rhs) {
              return lhs.path().filename() < rhs.path().filename();
            });
  std::sort(batch.subdirs.begin(), batch.subdirs.end(),
            [](const auto &lhs, const auto &rhs) {
              return lhs.filename() < rhs.filename();
            });
  return true;
}

bool dir_walker_t::next(dir_batch_t &batch) {
  while (!_stack.empty()) {
    auto dir = std::move(_stack.back());
    _stack.pop_back();
    if (!read_dir(dir, batch)) {
      continue;
    }
    if (_recursive) {
      // reversed so the first subdirectory is visited next
      _stack.insert(_stack.end(), batch.subdirs.rbegin(),
                    batch.subdirs.rend());
    }
    return true;
  }
  return false;
}

}  // namespace detail_v1_0_0

}  // namespace fsclean
