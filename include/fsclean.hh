#pragma once

#include <openssl/evp.h>

#include <set>
#include <string>

#include "args.hh"
#include "dedupe.hh"
#include "empties.hh"
#include "ledger.hh"
#include "log.hh"
#include "naming.hh"

namespace fsclean {

inline namespace detail_v1_0_0 {

// declaration order is execution order
enum class op_t { duplicates, empties, naming };

/**
 * @brief parse a comma separated operation list, unknown names are
 * logged and ignored
 */
std::set<op_t> parse_ops(const std::string &text, const logger_t &log);

/**
 * @brief naming options from the command line, an unknown style or a
 * space replacement longer than one character is logged and ignored
 */
naming_opts_t parse_naming_opts(const run_opts_t &opts, const logger_t &log);

/**
 * @brief digest by name, falls back to default_hash_algo with a warning
 */
const EVP_MD *parse_hash(const std::string &name, const logger_t &log);

/**
 * @brief run the selected operations over every valid target,
 * duplicates first, then empties, then naming
 *
 * Targets that are not directories are logged and skipped.
 *
 * @return start time, duration and bytes freed, for the report
 */
run_summary_t run(const run_opts_t &opts, change_ledger_t &ledger,
                  const logger_t &log);

/**
 * @brief human readable duration, ms up to a second, then s, then min
 */
std::string pretty_ms(const double ms);

}  // namespace detail_v1_0_0

}  // namespace fsclean
