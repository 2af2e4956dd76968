#include "fsclean.hh"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "config.hh"

namespace fsclean {

inline namespace detail_v1_0_0 {

namespace fs = std::filesystem;

namespace {

std::string trim_lower(const std::string &str) {
  std::string out;
  for (const auto c : str) {
    if (!std::isspace((unsigned char)c)) {
      out += (char)std::tolower((unsigned char)c);
    }
  }
  return out;
}

}  // namespace

std::set<op_t> parse_ops(const std::string &text, const logger_t &log) {
  std::set<op_t> ops;
  std::istringstream is(text);
  std::string item;
  while (std::getline(is, item, ',')) {
    const auto name = trim_lower(item);
    if (name == op_duplicates) {
      ops.insert(op_t::duplicates);
    } else if (name == op_empties) {
      ops.insert(op_t::empties);
    } else if (name == op_naming) {
      ops.insert(op_t::naming);
    } else {
      log.warn("ignoring unknown operation \"", item, '"');
    }
  }
  return ops;
}

naming_opts_t parse_naming_opts(const run_opts_t &opts, const logger_t &log) {
  naming_opts_t naming;
  if (opts.style) {
    auto style = parse_style(*opts.style);
    if (style) {
      naming.style = *style;
    } else {
      log.warn("ignoring unknown style \"", *opts.style, '"');
    }
  }
  if (opts.space_char) {
    if (opts.space_char->size() == 1) {
      naming.space_char = opts.space_char->front();
    } else {
      log.err("ignoring space character \"", *opts.space_char,
              "\": must be exactly one character");
    }
  }
  return naming;
}

const EVP_MD *parse_hash(const std::string &name, const logger_t &log) {
  try {
    return digest_by_name(name);
  } catch (const std::invalid_argument &e) {
    log.warn(e.what(), ", using ", default_hash_algo);
  }
  return digest_by_name(default_hash_algo);
}

FSCLEAN_EXPORT run_summary_t run(const run_opts_t &opts,
                                 change_ledger_t &ledger,
                                 const logger_t &log) {
  run_summary_t summary;
  summary.start = std::chrono::system_clock::now();
  const auto st_time = std::chrono::steady_clock::now();

  if (opts.dry_run) {
    log.info("dry run enabled");
  }
  if (opts.recursive) {
    log.info("recursive search enabled");
  }

  const auto ops = parse_ops(opts.operations, log);

  std::vector<fs::path> valid_targets;
  for (const auto &target : opts.targets) {
    std::error_code ec;
    if (!fs::is_directory(target, ec)) {
      log.err("invalid target ", target, ": not a directory");
    } else {
      valid_targets.push_back(target);
    }
  }

  for (const auto op : ops) {
    switch (op) {
      case op_t::duplicates: {
        log.info("operation: duplicate search");
        dedupe_opts_t dedupe_opts;
        dedupe_opts.recursive = opts.recursive;
        dedupe_opts.dry_run = opts.dry_run;
        dedupe_opts.max_thread = opts.max_thread;
        dedupe_opts.hash_type = parse_hash(opts.hash_algo, log);
        for (const auto &target : valid_targets) {
          try {
            summary.bytes_freed +=
                remove_duplicates(target, dedupe_opts, ledger, log);
          } catch (const std::invalid_argument &e) {
            log.err("failed to search ", target, ": ", e.what());
          }
        }
      } break;
      case op_t::empties:
        log.info("operation: empty files and directories");
        for (const auto &target : valid_targets) {
          try {
            remove_empty(target, opts.recursive, opts.dry_run, ledger, log);
          } catch (const std::invalid_argument &e) {
            log.err("failed to search ", target, ": ", e.what());
          }
        }
        break;
      case op_t::naming: {
        log.info("operation: filename consistency");
        const auto naming = parse_naming_opts(opts, log);
        for (const auto &target : valid_targets) {
          try {
            rename_dir(target, opts.recursive, opts.dry_run, naming, ledger,
                       log);
          } catch (const std::invalid_argument &e) {
            log.err("failed to enumerate ", target, ": ", e.what());
          }
        }
      } break;
    }
  }

  summary.duration = std::chrono::duration<double, std::milli>(
                         std::chrono::steady_clock::now() - st_time)
                         .count();
  log.info(ledger.size(), " changes (", ledger.executed_count(),
           " executed) in ", pretty_ms(summary.duration), ", ",
           summary.bytes_freed, " bytes freed");
  return summary;
}

std::string pretty_ms(const double ms) {
  char buf[32];
  if (ms <= 1000.0) {
    std::snprintf(buf, sizeof(buf), "%.2fms", ms);
  } else if (ms <= 60000.0) {
    std::snprintf(buf, sizeof(buf), "%.2fs", ms / 1000.0);
  } else {
    std::snprintf(buf, sizeof(buf), "%.2fmin", ms / 60000.0);
  }
  return buf;
}

}  // namespace detail_v1_0_0

}  // namespace fsclean
