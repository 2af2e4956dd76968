#include "dedupe.hh"

#include <chrono>
#include <exception>
#include <map>
#include <optional>
#include <utility>

#include "fingerprint.hh"
#include "resolve.hh"
#include "walk.hh"

#ifndef BOOST_ASIO_HAS_STD_INVOKE_RESULT
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT
#endif

#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>

namespace fsclean {

inline namespace detail_v1_0_0 {

namespace fs = std::filesystem;

namespace {

class stopwatch_t {
  std::chrono::steady_clock::time_point _prev_time;

 public:
  stopwatch_t() noexcept : _prev_time(std::chrono::steady_clock::now()) {}
  std::chrono::milliseconds time() noexcept {
    auto cur_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        cur_time - _prev_time);
    _prev_time = cur_time;
    return duration;
  }
};

// run job(i) for every index on a pool, returns once all are done
template <typename Fn>
void run_jobs(const std::vector<std::size_t> &idx_list,
              const uint32_t max_thread, Fn job) {
  if (idx_list.empty()) {
    return;
  }
  boost::asio::thread_pool pool(max_thread == 0 ? 1 : max_thread);
  for (const auto idx : idx_list) {
    boost::asio::post(pool, [&job, idx] { job(idx); });
  }
  pool.join();
}

}  // namespace

std::vector<dupe_group_t> scan_dupes(const fs::path &root,
                                     const dedupe_opts_t &opts,
                                     const logger_t &log) {
  const EVP_MD *hash_type = opts.hash_type != nullptr
                                ? opts.hash_type
                                : digest_by_name(default_hash_algo);

  // generate file list, walk order
  stopwatch_t timer;
  std::vector<file_entry_t> file_list;
  log.debug("list files: ", root);
  {
    dir_walker_t walker(root, opts.recursive, log);
    dir_batch_t batch;
    while (walker.next(batch)) {
      log.debug("working in ", batch.dir, " (", batch.files.size(),
                " files, ", batch.subdirs.size(), " sub directories)");
      for (auto &file : batch.files) {
        // zero-byte files belong to the empties pass
        if (file.size() > 0) {
          file_list.emplace_back(std::move(file));
        }
      }
    }
  }
  log.debug("file count: ", file_list.size(), ", elapsed: ",
            timer.time().count(), "ms");

  // union of same file size
  std::map<uint64_t, std::vector<std::size_t>> size_map;
  for (std::size_t i = 0; i < file_list.size(); ++i) {
    size_map[file_list[i].size()].push_back(i);
  }

  std::vector<std::size_t> head_jobs;
  std::vector<bool> candidate(file_list.size(), false);
  for (const auto &[size, idx_list] : size_map) {
    if (idx_list.size() < 2) {
      continue;
    }
    for (const auto idx : idx_list) {
      if (size > head_blk_sz) {
        head_jobs.push_back(idx);
      } else {
        // head hash would cover the whole file
        candidate[idx] = true;
      }
    }
  }

  // pre-filter same size files by head hash
  std::vector<std::optional<XXH128_hash_t>> heads(file_list.size());
  run_jobs(head_jobs, opts.max_thread, [&](const std::size_t idx) {
    heads[idx] = head_hash(file_list[idx].path());
    if (!heads[idx]) {
      log.warn("skip unreadable file: ", file_list[idx].path());
    }
  });
  for (const auto &[size, idx_list] : size_map) {
    if (idx_list.size() < 2 || size <= head_blk_sz) {
      continue;
    }
    std::map<std::pair<uint64_t, uint64_t>, std::vector<std::size_t>> head_map;
    for (const auto idx : idx_list) {
      if (heads[idx]) {
        head_map[{heads[idx]->high64, heads[idx]->low64}].push_back(idx);
      }
    }
    for (const auto &[head, same_head] : head_map) {
      if (same_head.size() > 1) {
        for (const auto idx : same_head) {
          candidate[idx] = true;
        }
      }
    }
  }

  // full digest of remaining candidates
  std::vector<std::size_t> digest_jobs;
  for (std::size_t i = 0; i < file_list.size(); ++i) {
    if (candidate[i]) {
      digest_jobs.push_back(i);
    }
  }
  log.debug("digest jobs: ", digest_jobs.size(), " of ", file_list.size(),
            " files");
  std::vector<std::optional<fingerprint_t>> fps(file_list.size());
  run_jobs(digest_jobs, opts.max_thread, [&](const std::size_t idx) {
    try {
      fps[idx] = fingerprint(file_list[idx].path(), hash_type);
      if (!fps[idx]) {
        log.warn("skip unreadable file: ", file_list[idx].path());
      }
    } catch (std::exception &e) {
      log.err("failed to hash: ", file_list[idx].path(), " - ", e.what());
    }
  });

  // pool joined, group in walk order
  dupe_grouper_t grouper;
  for (const auto idx : digest_jobs) {
    if (fps[idx]) {
      log.debug(fps[idx]->hex(), "  ", file_list[idx].path());
      grouper.add(file_list[idx].path(), *fps[idx]);
    }
  }
  auto dupe_list = grouper.groups();
  log.debug("duplicate group count: ", dupe_list.size(), ", elapsed: ",
            timer.time().count(), "ms");
  return dupe_list;
}

FSCLEAN_EXPORT uint64_t remove_duplicates(const fs::path &root,
                                          const dedupe_opts_t &opts,
                                          change_ledger_t &ledger,
                                          const logger_t &log) {
  const auto dupe_list = scan_dupes(root, opts, log);

  uint64_t bytes_freed = 0;
  for (const auto &group : dupe_list) {
    const auto survivor = select_survivor(group.paths, log);
    log.info(survivor.kept, ": ", survivor.remove.size(),
             " duplicates found");
    bytes_freed +=
        resolve_group(group, survivor, opts.dry_run, ledger, log);
  }
  return bytes_freed;
}

}  // namespace detail_v1_0_0

}  // namespace fsclean
