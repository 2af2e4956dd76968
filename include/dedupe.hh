#pragma once

#include <openssl/evp.h>

#include <cstdint>
#include <filesystem>
#include <vector>

#include "config.hh"
#include "group.hh"
#include "ledger.hh"
#include "log.hh"

namespace fsclean {

inline namespace detail_v1_0_0 {

struct dedupe_opts_t {
  bool recursive = false;
  bool dry_run = false;
  uint32_t max_thread = default_max_thread;
  // nullptr selects default_hash_algo
  const EVP_MD *hash_type = nullptr;
};

/**
 * @brief detects byte-identical files under root by size, head hash
 * and full digest. Zero-byte and unreadable files never form a group.
 *
 * @param root directory to search
 * @param opts recursion, digest and thread count
 * @return duplicate groups ordered by first appearance in the walk
 * @throws std::invalid_argument if root is not a directory
 */
std::vector<dupe_group_t> scan_dupes(const std::filesystem::path &root,
                                     const dedupe_opts_t &opts,
                                     const logger_t &log);

/**
 * @brief find duplicates under root and remove all but one file per group
 *
 * @param ledger receives one change per scheduled removal
 * @return bytes freed
 * @throws std::invalid_argument if root is not a directory
 */
uint64_t remove_duplicates(const std::filesystem::path &root,
                           const dedupe_opts_t &opts, change_ledger_t &ledger,
                           const logger_t &log);

}  // namespace detail_v1_0_0

}  // namespace fsclean
