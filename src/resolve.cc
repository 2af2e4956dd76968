#include "resolve.hh"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace fsclean {

inline namespace detail_v1_0_0 {

namespace fs = std::filesystem;

std::size_t stem_length(const fs::path &path) {
  const auto stem = path.stem().string();
  // skip utf-8 continuation bytes
  return (std::size_t)std::count_if(stem.begin(), stem.end(), [](char c) {
    return ((unsigned char)c & 0xc0) != 0x80;
  });
}

survivor_t select_survivor(const std::vector<fs::path> &paths,
                           const logger_t &log) {
  if (paths.empty()) {
    throw std::invalid_argument("select_survivor: empty group");
  }

  std::vector<std::size_t> lengths;
  lengths.reserve(paths.size());
  for (const auto &path : paths) {
    lengths.push_back(stem_length(path));
  }
  const auto min_len = *std::min_element(lengths.begin(), lengths.end());

  std::vector<std::size_t> shortest;
  for (std::size_t i = 0; i < paths.size(); ++i) {
    if (lengths[i] == min_len) {
      shortest.push_back(i);
    }
  }

  auto mtime = [&](const fs::path &path) {
    std::error_code ec;
    auto time = fs::last_write_time(path, ec);
    if (ec) {
      log.warn("cannot read mtime: ", path, " - ", ec.message());
      return fs::file_time_type::min();
    }
    return time;
  };

  auto kept = shortest.front();
  if (shortest.size() > 1) {
    // most recent wins, then smallest path
    auto kept_time = mtime(paths[kept]);
    for (auto it = shortest.begin() + 1; it != shortest.end(); ++it) {
      const auto cur_time = mtime(paths[*it]);
      if (cur_time > kept_time ||
          (cur_time == kept_time && paths[*it] < paths[kept])) {
        kept = *it;
        kept_time = cur_time;
      }
    }
  }

  survivor_t survivor{paths[kept], {}};
  survivor.remove.reserve(paths.size() - 1);
  for (std::size_t i = 0; i < paths.size(); ++i) {
    if (i != kept) {
      survivor.remove.push_back(paths[i]);
    }
  }
  return survivor;
}

uint64_t resolve_group(const dupe_group_t &group, const survivor_t &survivor,
                       const bool dry_run, change_ledger_t &ledger,
                       const logger_t &log) {
  uint64_t bytes_freed = 0;
  for (const auto &dup : survivor.remove) {
    log.info(survivor.kept, ": remove duplicate ", dup);

    change_t change;
    change.operation = op_duplicates;
    change.path = dup;
    change.original = survivor.kept;

    if (dry_run) {
      ledger.add(std::move(change));
      continue;
    }

    std::error_code ec;
    const bool exists = fs::exists(dup, ec);
    if (ec) {
      log.err(survivor.kept, ": failed to remove ", dup, " - ", ec.message());
      ledger.add(std::move(change.fail(ec)));
      continue;
    }
    if (!exists) {
      log.err(survivor.kept, ": duplicate does not exist ", dup);
      change.message = "duplicate does not exist";
      ledger.add(std::move(change));
      continue;
    }

    auto size = fs::file_size(dup, ec);
    if (ec) {
      size = group.fp.size;
      ec.clear();
    }
    if (!fs::remove(dup, ec) || ec) {
      if (ec) {
        log.err(survivor.kept, ": failed to remove ", dup, " - ",
                ec.message());
        change.fail(ec);
      } else {
        // lost a race with another process
        log.err(survivor.kept, ": duplicate does not exist ", dup);
        change.message = "duplicate does not exist";
      }
      ledger.add(std::move(change));
      continue;
    }
    change.executed = true;
    ledger.add(std::move(change));
    bytes_freed += size;
  }
  return bytes_freed;
}

}  // namespace detail_v1_0_0

}  // namespace fsclean
