#include "empties.hh"

#include <system_error>
#include <utility>

#include "config.hh"
#include "walk.hh"

namespace fsclean {

inline namespace detail_v1_0_0 {

namespace fs = std::filesystem;

namespace {

void remove_entry(const fs::path &path, const bool dry_run,
                  change_ledger_t &ledger, const logger_t &log) {
  change_t change;
  change.operation = op_empties;
  change.path = path;
  if (!dry_run) {
    std::error_code ec;
    if (!fs::remove(path, ec) || ec) {
      if (ec) {
        log.err("failed to remove ", path, " - ", ec.message());
        change.fail(ec);
      } else {
        log.err("failed to remove ", path, " - does not exist");
        change.message = "does not exist";
      }
    } else {
      change.executed = true;
    }
  }
  ledger.add(std::move(change));
}

}  // namespace

FSCLEAN_EXPORT void remove_empty(const fs::path &root, const bool recursive,
                                 const bool dry_run, change_ledger_t &ledger,
                                 const logger_t &log) {
  dir_walker_t walker(root, recursive, log);
  dir_batch_t batch;
  while (walker.next(batch)) {
    for (const auto &file : batch.files) {
      if (file.size() == 0) {
        log.info("remove empty file ", file.path());
        remove_entry(file.path(), dry_run, ledger, log);
      }
    }
    for (const auto &sub_dir : batch.subdirs) {
      std::error_code ec;
      const bool empty = fs::is_empty(sub_dir, ec);
      if (ec == std::errc::no_such_file_or_directory) {
        continue;
      }
      if (ec) {
        log.err("failed to list directory ", sub_dir, " - ", ec.message());
        change_t change;
        change.operation = op_empties;
        change.path = sub_dir;
        ledger.add(std::move(change.fail(ec)));
        continue;
      }
      if (empty) {
        log.info("remove empty directory ", sub_dir);
        remove_entry(sub_dir, dry_run, ledger, log);
      }
    }
  }
}

}  // namespace detail_v1_0_0

}  // namespace fsclean
