#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config.hh"
#include "log.hh"

namespace fsclean {

inline namespace detail_v1_0_0 {

class usage_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief command line as given, option values are interpreted
 * (and rejected item by item) by run()
 */
struct run_opts_t {
  std::vector<std::filesystem::path> targets;
  // comma separated operation names
  std::string operations;
  std::optional<std::filesystem::path> changelog_path;
  bool dry_run = false;
  bool recursive = false;
  std::optional<std::string> style;
  std::optional<std::string> space_char;
  level_t log_level = level_t::info;
  uint32_t max_thread = default_max_thread;
  std::string hash_algo = default_hash_algo;
  bool help = false;
};

/**
 * @brief parse the command line
 * @throws usage_error on unknown option, missing operand, bad number,
 * or missing operation or target list
 */
run_opts_t parse_args(int argc, const char *const argv[]);

std::string usage();

}  // namespace detail_v1_0_0

}  // namespace fsclean
