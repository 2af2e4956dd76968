#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

#include "group.hh"
#include "ledger.hh"
#include "log.hh"

namespace fsclean {

inline namespace detail_v1_0_0 {

struct survivor_t {
  std::filesystem::path kept;
  // group order, never contains kept
  std::vector<std::filesystem::path> remove;
};

/**
 * @brief length in code points of the file name without extension
 */
std::size_t stem_length(const std::filesystem::path &path);

/**
 * @brief pick the file to keep out of a duplicate group
 *
 * Shortest stem wins; a tie goes to the most recently modified file,
 * a full tie to the lexicographically smallest path.
 *
 * @param paths duplicate group, at least one path
 * @throws std::invalid_argument if paths is empty
 */
survivor_t select_survivor(const std::vector<std::filesystem::path> &paths,
                           const logger_t &log);

/**
 * @brief remove (or in dry run only record) every path of
 * survivor.remove, one ledger entry per path
 *
 * @return bytes actually freed
 */
uint64_t resolve_group(const dupe_group_t &group, const survivor_t &survivor,
                       const bool dry_run, change_ledger_t &ledger,
                       const logger_t &log);

}  // namespace detail_v1_0_0

}  // namespace fsclean
