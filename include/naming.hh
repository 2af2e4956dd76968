#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "ledger.hh"
#include "log.hh"

namespace fsclean {

inline namespace detail_v1_0_0 {

enum class naming_style_t {
  none,
  capitalized,  // "My file name"
  titlecase,    // "My File Name"
  lowercase,    // "my file name"
  uppercase     // "MY FILE NAME"
};

/**
 * @brief parse a style name, case and surrounding blanks ignored
 * @return std::nullopt if unknown
 */
std::optional<naming_style_t> parse_style(std::string_view name);

const char *style_name(const naming_style_t style) noexcept;

struct naming_opts_t {
  naming_style_t style = naming_style_t::none;
  // replaces spaces in the stem
  std::optional<char> space_char;
};

/**
 * @brief correct the consistency errors of one file name
 *
 * Strips " _-" from both ends of the stem, collapses blank runs,
 * applies the style and space replacement, removes spaces from and
 * lowercases the extension, then drops anything but alphanumerics
 * and brackets next to a period.
 *
 * @param filename file name without directory
 * @return corrected file name, equal to filename if nothing to fix
 */
std::string check_filename(const std::string &filename,
                           const naming_opts_t &opts, const logger_t &log);

/**
 * @brief rename the files of root whose names need correction,
 * an existing destination is never overwritten
 *
 * @throws std::invalid_argument if root is not a directory
 */
void rename_dir(const std::filesystem::path &root, const bool recursive,
                const bool dry_run, const naming_opts_t &opts,
                change_ledger_t &ledger, const logger_t &log);

}  // namespace detail_v1_0_0

}  // namespace fsclean
