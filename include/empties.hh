#pragma once

#include <filesystem>

#include "ledger.hh"
#include "log.hh"

namespace fsclean {

inline namespace detail_v1_0_0 {

/**
 * @brief remove zero-byte files and empty directories
 *
 * Every visited directory has its zero-byte regular files and its
 * immediate empty subdirectories removed.
 *
 * @param root directory to clean
 * @param recursive false visits the root directory only
 * @param dry_run record changes without touching the filesystem
 * @throws std::invalid_argument if root is not a directory
 */
void remove_empty(const std::filesystem::path &root, const bool recursive,
                  const bool dry_run, change_ledger_t &ledger,
                  const logger_t &log);

}  // namespace detail_v1_0_0

}  // namespace fsclean
