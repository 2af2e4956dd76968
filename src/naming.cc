#include "naming.hh"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <regex>
#include <system_error>
#include <utility>

#include "config.hh"
#include "walk.hh"

namespace fsclean {

inline namespace detail_v1_0_0 {

namespace fs = std::filesystem;

namespace {

constexpr auto stripping_chars = " _-";

// runs over code points, one wchar_t per character
const std::wregex &adjacent_period() {
  static const std::wregex re(LR"(([^A-Z\d)\]])?\.([^A-Z\d(\[])?)",
                              std::regex::ECMAScript | std::regex::icase);
  return re;
}

// bytes that are not valid utf-8 map to U+DC80..U+DCFF and back
constexpr uint32_t escape_base = 0xdc00;

std::wstring decode_utf8(const std::string &str) {
  std::wstring out;
  out.reserve(str.size());
  std::size_t i = 0;
  while (i < str.size()) {
    const auto b0 = (unsigned char)str[i];
    std::size_t len = 0;
    uint32_t cp = 0;
    if (b0 < 0x80) {
      len = 1;
      cp = b0;
    } else if (b0 >= 0xc2 && b0 <= 0xdf) {
      len = 2;
      cp = b0 & 0x1f;
    } else if (b0 >= 0xe0 && b0 <= 0xef) {
      len = 3;
      cp = b0 & 0x0f;
    } else if (b0 >= 0xf0 && b0 <= 0xf4) {
      len = 4;
      cp = b0 & 0x07;
    }
    bool valid = len != 0 && i + len <= str.size();
    for (std::size_t k = 1; valid && k < len; ++k) {
      const auto bk = (unsigned char)str[i + k];
      valid = (bk & 0xc0) == 0x80;
      cp = (cp << 6) | (bk & 0x3f);
    }
    if (valid && len == 3) {
      valid = cp >= 0x800 && (cp < 0xd800 || cp > 0xdfff);
    } else if (valid && len == 4) {
      valid = cp >= 0x10000 && cp <= 0x10ffff;
    }
    if (valid) {
      out += (wchar_t)cp;
      i += len;
    } else {
      out += (wchar_t)(escape_base + b0);
      ++i;
    }
  }
  return out;
}

std::string encode_utf8(const std::wstring &str) {
  std::string out;
  out.reserve(str.size());
  for (const auto wc : str) {
    const auto cp = (uint32_t)wc;
    if (cp >= escape_base + 0x80 && cp <= escape_base + 0xff) {
      out += (char)(cp - escape_base);
    } else if (cp < 0x80) {
      out += (char)cp;
    } else if (cp < 0x800) {
      out += (char)(0xc0 | (cp >> 6));
      out += (char)(0x80 | (cp & 0x3f));
    } else if (cp < 0x10000) {
      out += (char)(0xe0 | (cp >> 12));
      out += (char)(0x80 | ((cp >> 6) & 0x3f));
      out += (char)(0x80 | (cp & 0x3f));
    } else {
      out += (char)(0xf0 | (cp >> 18));
      out += (char)(0x80 | ((cp >> 12) & 0x3f));
      out += (char)(0x80 | ((cp >> 6) & 0x3f));
      out += (char)(0x80 | (cp & 0x3f));
    }
  }
  return out;
}

inline char upper(const char c) {
  return (char)std::toupper((unsigned char)c);
}
inline char lower(const char c) {
  return (char)std::tolower((unsigned char)c);
}
inline bool is_alpha(const char c) { return std::isalpha((unsigned char)c); }

std::string strip(const std::string &str) {
  const auto st = str.find_first_not_of(stripping_chars);
  if (st == std::string::npos) {
    return {};
  }
  const auto ed = str.find_last_not_of(stripping_chars);
  return str.substr(st, ed - st + 1);
}

// join blank separated words with a single space
std::string collapse_blanks(const std::string &str) {
  std::string out;
  bool blank = false;
  for (const auto c : str) {
    if (std::isspace((unsigned char)c)) {
      blank = true;
      continue;
    }
    if (blank && !out.empty()) {
      out += ' ';
    }
    blank = false;
    out += c;
  }
  return out;
}

std::string apply_style(std::string name, const naming_style_t style) {
  switch (style) {
    case naming_style_t::capitalized:
      for (std::size_t i = 0; i < name.size(); ++i) {
        name[i] = i == 0 ? upper(name[i]) : lower(name[i]);
      }
      break;
    case naming_style_t::titlecase: {
      bool prev_alpha = false;
      for (auto &c : name) {
        if (is_alpha(c)) {
          c = prev_alpha ? lower(c) : upper(c);
          prev_alpha = true;
        } else if ((unsigned char)c & 0x80) {
          // part of a non-ascii letter, left as is
          prev_alpha = true;
        } else {
          prev_alpha = false;
        }
      }
    } break;
    case naming_style_t::lowercase:
      std::transform(name.begin(), name.end(), name.begin(), lower);
      break;
    case naming_style_t::uppercase:
      std::transform(name.begin(), name.end(), name.begin(), upper);
      break;
    case naming_style_t::none:
      break;
  }
  return name;
}

}  // namespace

std::optional<naming_style_t> parse_style(std::string_view name) {
  std::string key;
  for (const auto c : name) {
    if (!std::isspace((unsigned char)c)) {
      key += lower(c);
    }
  }
  for (const auto style :
       {naming_style_t::capitalized, naming_style_t::titlecase,
        naming_style_t::lowercase, naming_style_t::uppercase}) {
    if (key == style_name(style)) {
      return style;
    }
  }
  return std::nullopt;
}

const char *style_name(const naming_style_t style) noexcept {
  switch (style) {
    case naming_style_t::capitalized:
      return "capitalized";
    case naming_style_t::titlecase:
      return "titlecase";
    case naming_style_t::lowercase:
      return "lowercase";
    case naming_style_t::uppercase:
      return "uppercase";
    case naming_style_t::none:
      break;
  }
  return "none";
}

std::string check_filename(const std::string &filename,
                           const naming_opts_t &opts, const logger_t &log) {
  const fs::path path(filename);
  auto name = path.stem().string();
  auto ext = path.extension().string();

  if (!name.empty()) {
    const auto name_stripped = strip(name);
    if (name_stripped != name) {
      log.debug('"', filename, "\": needed stripping");
    }
    auto name_blanks = collapse_blanks(name_stripped);
    if (name_blanks != name_stripped) {
      log.debug('"', filename, "\": had extraneous spaces");
    }
    name = std::move(name_blanks);

    if (opts.style != naming_style_t::none) {
      auto name_styled = apply_style(name, opts.style);
      if (name_styled != name) {
        log.debug('"', filename, "\": naming style enforced");
      }
      name = std::move(name_styled);
    }

    if (opts.space_char) {
      auto name_replaced = name;
      std::replace(name_replaced.begin(), name_replaced.end(), ' ',
                   *opts.space_char);
      if (name_replaced != name) {
        log.debug('"', filename, "\": spaces replaced with '",
                  *opts.space_char, '\'');
      }
      name = std::move(name_replaced);
    }
  }

  std::string ext_fixed;
  for (const auto c : ext) {
    if (c != ' ') {
      ext_fixed += lower(c);
    }
  }
  if (ext_fixed != ext) {
    log.debug('"', filename, "\": extension fixed");
  }

  const auto first_stage = name + ext_fixed;
  auto second_stage = encode_utf8(
      std::regex_replace(decode_utf8(first_stage), adjacent_period(), L"."));
  if (second_stage != first_stage) {
    log.debug('"', filename, "\": removed chars adjacent to period");
  }
  return second_stage;
}

FSCLEAN_EXPORT void rename_dir(const fs::path &root, const bool recursive,
                               const bool dry_run, const naming_opts_t &opts,
                               change_ledger_t &ledger, const logger_t &log) {
  dir_walker_t walker(root, recursive, log);
  dir_batch_t batch;
  while (walker.next(batch)) {
    log.info("working in ", batch.dir, " (", batch.files.size(), " files, ",
             batch.subdirs.size(), " sub directories)");

    for (const auto &file : batch.files) {
      const auto &src = file.path();
      const auto filename = src.filename().string();
      const auto new_name = check_filename(filename, opts, log);
      if (new_name == filename) {
        log.debug('"', filename, "\": no change");
        continue;
      }
      if (new_name.empty()) {
        log.warn(src, ": nothing left of the name, skipped");
        continue;
      }

      const auto dest = batch.dir / new_name;
      log.info(src, ": rename ", dest.filename());

      change_t change;
      change.operation = op_naming;
      change.path = src;
      change.dest = dest;

      if (!dry_run) {
        std::error_code ec;
        const bool exists = fs::exists(dest, ec);
        if (ec) {
          log.err("failed to rename ", src, " - ", ec.message());
          change.fail(ec);
        } else if (exists) {
          log.warn(src, ": destination already exists");
          change.message = "destination already exists";
        } else {
          fs::rename(src, dest, ec);
          if (ec) {
            log.err("failed to rename ", src, " - ", ec.message());
            change.fail(ec);
          } else {
            change.executed = true;
          }
        }
      }
      ledger.add(std::move(change));
    }
  }
}

}  // namespace detail_v1_0_0

}  // namespace fsclean
