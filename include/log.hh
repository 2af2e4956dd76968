#pragma once

#include <iostream>
#include <syncstream>
#include <utility>

namespace fsclean {

inline namespace detail_v1_0_0 {

using oss = std::osyncstream;

enum class level_t : int {
  debug = 10,
  info = 20,
  warn = 30,
  err = 40,
  crit = 50
};

/**
 * @brief line oriented logger, one osyncstream per line so
 * lines from worker threads never interleave.
 */
class logger_t {
  std::ostream &_os;
  level_t _level;

  static constexpr const char *tag(const level_t lvl) noexcept {
    switch (lvl) {
      case level_t::debug:
        return "[dbg] ";
      case level_t::info:
        return "[log] ";
      case level_t::warn:
        return "[warn] ";
      case level_t::err:
        return "[err] ";
      case level_t::crit:
        return "[crit] ";
    }
    return "";
  }

 public:
  explicit logger_t(std::ostream &os = std::cerr,
                    const level_t level = level_t::info) noexcept
      : _os(os), _level(level) {}

  logger_t(const logger_t &) = delete;
  logger_t &operator=(const logger_t &) = delete;

  inline level_t level() const noexcept { return _level; }
  inline void set_level(const level_t level) noexcept { _level = level; }
  inline bool enabled(const level_t lvl) const noexcept {
    return static_cast<int>(lvl) >= static_cast<int>(_level);
  }

  template <typename... Args>
  void log(const level_t lvl, Args &&...args) const {
    if (!enabled(lvl)) {
      return;
    }
    oss out(_os);
    out << tag(lvl);
    (out << ... << std::forward<Args>(args));
    out << '\n';
  }

  template <typename... Args>
  inline void debug(Args &&...args) const {
    log(level_t::debug, std::forward<Args>(args)...);
  }
  template <typename... Args>
  inline void info(Args &&...args) const {
    log(level_t::info, std::forward<Args>(args)...);
  }
  template <typename... Args>
  inline void warn(Args &&...args) const {
    log(level_t::warn, std::forward<Args>(args)...);
  }
  template <typename... Args>
  inline void err(Args &&...args) const {
    log(level_t::err, std::forward<Args>(args)...);
  }
  template <typename... Args>
  inline void crit(Args &&...args) const {
    log(level_t::crit, std::forward<Args>(args)...);
  }
};

}  // namespace detail_v1_0_0

}  // namespace fsclean
