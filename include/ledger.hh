#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

namespace fsclean {

inline namespace detail_v1_0_0 {

// operation tags
constexpr auto op_duplicates = "duplicates";
constexpr auto op_empties = "empties";
constexpr auto op_naming = "naming";

/**
 * @brief one attempted filesystem mutation, executed or not
 */
struct change_t {
  uint64_t id = 0;
  std::string operation;
  bool executed = false;
  std::filesystem::path path;
  // duplicates: the survivor kept in place of path
  std::optional<std::filesystem::path> original;
  // naming: rename destination
  std::optional<std::filesystem::path> dest;
  std::optional<std::string> message;
  std::optional<int> error;

  inline change_t &fail(const std::error_code &ec) {
    message = ec.message();
    error = ec.value();
    return *this;
  }
};

void to_json(nlohmann::json &j, const change_t &change);

struct run_summary_t {
  std::chrono::system_clock::time_point start;
  // milliseconds
  double duration = 0.0;
  uint64_t bytes_freed = 0;
};

/**
 * @brief append-only record of every attempted change of a run,
 * persisted once as a JSON report.
 */
class change_ledger_t {
  std::vector<change_t> _changes;
  uint64_t _counter = 0;

 public:
  /**
   * @brief append a change, the id is assigned here
   * @return id of the stored change
   */
  uint64_t add(change_t change);

  inline const std::vector<change_t> &changes() const noexcept {
    return _changes;
  }
  inline std::size_t size() const noexcept { return _changes.size(); }
  std::size_t executed_count() const noexcept;

  nlohmann::json to_json(const run_summary_t &summary) const;

  /**
   * @brief write the report to path
   * @throws std::runtime_error if the file cannot be written
   */
  void save(const std::filesystem::path &path,
            const run_summary_t &summary) const;
};

// local time, ISO-8601 with microseconds
std::string iso_time(const std::chrono::system_clock::time_point tp);

}  // namespace detail_v1_0_0

}  // namespace fsclean
