#include "ledger.hh"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <stdexcept>
#include <utility>

#include "config.hh"

namespace fsclean {

inline namespace detail_v1_0_0 {

void to_json(nlohmann::json &j, const change_t &change) {
  j = nlohmann::json{{"id", change.id},
                     {"operation", change.operation},
                     {"executed", change.executed},
                     {"path", change.path.string()}};
  if (change.original) {
    j["original"] = change.original->string();
  }
  if (change.dest) {
    j["dest"] = change.dest->string();
  }
  if (change.message) {
    j["message"] = *change.message;
  }
  if (change.error) {
    j["errno"] = *change.error;
  }
}

uint64_t change_ledger_t::add(change_t change) {
  change.id = _counter++;
  _changes.push_back(std::move(change));
  return _changes.back().id;
}

std::size_t change_ledger_t::executed_count() const noexcept {
  return (std::size_t)std::count_if(
      _changes.begin(), _changes.end(),
      [](const auto &change) { return change.executed; });
}

nlohmann::json change_ledger_t::to_json(const run_summary_t &summary) const {
  nlohmann::json root;
  root["changes"] = _changes;
  root["version"] = changelog_version;
  root["start"] = iso_time(summary.start);
  root["duration"] = summary.duration;
  root["bytes_freed"] = summary.bytes_freed;
  return root;
}

void change_ledger_t::save(const std::filesystem::path &path,
                           const run_summary_t &summary) const {
  // paths that are not valid utf-8 are written with U+FFFD in place of the
  // offending bytes
  const auto text = to_json(summary).dump(
      1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::ofstream ofs(path, std::ios::out | std::ios::trunc);
  if (!ofs.is_open()) {
    throw std::runtime_error("cannot open " + path.string());
  }
  ofs << text << '\n';
  ofs.close();
  if (!ofs) {
    throw std::runtime_error("cannot write " + path.string());
  }
}

std::string iso_time(const std::chrono::system_clock::time_point tp) {
  namespace cn = std::chrono;
  const auto secs = cn::time_point_cast<cn::seconds>(tp);
  auto usec = cn::duration_cast<cn::microseconds>(tp - secs).count();
  if (usec < 0) {
    usec = 0;
  }
  const std::time_t tt = cn::system_clock::to_time_t(secs);
  std::tm tm{};
  localtime_r(&tt, &tm);
  char buf[64];
  const auto len = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  std::snprintf(buf + len, sizeof(buf) - len, ".%06ld", (long)usec);
  return buf;
}

}  // namespace detail_v1_0_0

}  // namespace fsclean
