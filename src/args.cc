#include "args.hh"

#include <sstream>
#include <string_view>

namespace fsclean {

inline namespace detail_v1_0_0 {

using namespace std::literals;

namespace {

unsigned long parse_num(const char *opt, const char *str) {
  std::size_t pos = 0;
  unsigned long num = 0;
  try {
    num = std::stoul(str, &pos);
  } catch (const std::logic_error &) {
    pos = 0;
  }
  if (pos == 0 || str[pos] != '\0' || str[0] == '-') {
    throw usage_error("invalid number for "s + opt + ": " + str);
  }
  return num;
}

level_t to_level(const unsigned long num) {
  if (num < 10 || num > 50) {
    throw usage_error("log level must be >= 10 and <= 50");
  }
  if (num < 20) return level_t::debug;
  if (num < 30) return level_t::info;
  if (num < 40) return level_t::warn;
  if (num < 50) return level_t::err;
  return level_t::crit;
}

}  // namespace

run_opts_t parse_args(int argc, const char *const argv[]) {
  run_opts_t opts;
  bool positional_only = false;

  auto operand = [&](int &i) -> const char * {
    const char *opt = argv[i];
    ++i;
    if (i >= argc) {
      throw usage_error("missing value for "s + opt);
    }
    return argv[i];
  };

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (positional_only || arg.empty() || arg[0] != '-' || arg == "-"sv) {
      opts.targets.emplace_back(argv[i]);
    } else if (arg == "--"sv) {
      positional_only = true;
    } else if (arg == "-o"sv || arg == "--op"sv) {
      opts.operations = operand(i);
    } else if (arg == "-c"sv || arg == "--changelog"sv) {
      // the path is optional, a following option or the end of the
      // command line leaves the default name
      if (i + 1 < argc && argv[i + 1][0] != '-' && argv[i + 1][0] != '\0') {
        opts.changelog_path = argv[++i];
      } else {
        opts.changelog_path = default_changelog;
      }
    } else if (arg.substr(0, 2) == "-c"sv) {
      opts.changelog_path = std::string(arg.substr(2));
    } else if (arg.substr(0, 12) == "--changelog="sv) {
      if (arg.size() == 12) {
        throw usage_error("missing value for --changelog");
      }
      opts.changelog_path = std::string(arg.substr(12));
    } else if (arg == "-d"sv || arg == "--dry"sv) {
      opts.dry_run = true;
    } else if (arg == "-r"sv || arg == "--recurse"sv) {
      opts.recursive = true;
    } else if (arg == "-s"sv || arg == "--style"sv) {
      opts.style = operand(i);
    } else if (arg == "-S"sv || arg == "--space"sv) {
      opts.space_char = operand(i);
    } else if (arg == "-l"sv || arg == "--level"sv) {
      const char *opt = argv[i];
      opts.log_level = to_level(parse_num(opt, operand(i)));
    } else if (arg == "-j"sv || arg == "--jobs"sv) {
      const char *opt = argv[i];
      const auto jobs = parse_num(opt, operand(i));
      if (jobs == 0 || jobs > 256) {
        throw usage_error("jobs must be > 0 and <= 256");
      }
      opts.max_thread = (uint32_t)jobs;
    } else if (arg == "-a"sv || arg == "--hash"sv) {
      opts.hash_algo = operand(i);
    } else if (arg == "-h"sv || arg == "--help"sv) {
      opts.help = true;
    } else {
      throw usage_error("unknown option: "s + argv[i]);
    }
  }

  if (opts.help) {
    return opts;
  }
  if (opts.operations.empty()) {
    throw usage_error("missing operation list (-o)");
  }
  if (opts.targets.empty()) {
    throw usage_error("missing target directories");
  }
  return opts;
}

std::string usage() {
  std::ostringstream os;
  os << description << "\n\n"
     << "usage: fsclean -o OPS [options] TARGET...\n\n"
     << "  -o, --op OPS          operations, comma-separated: "
        "duplicates, empties, naming\n"
     << "  -c, --changelog [PATH]\n"
     << "                        write a JSON report of all changes (default "
     << default_changelog << ")\n"
     << "  -d, --dry             record changes without touching files\n"
     << "  -r, --recurse         enter subdirectories\n"
     << "  -s, --style NAME      naming: capitalized, titlecase, "
        "lowercase, uppercase\n"
     << "  -S, --space CHAR      naming: replace spaces with CHAR\n"
     << "  -l, --level N         logging level 10-50 (default 20)\n"
     << "  -j, --jobs N          hashing threads (default "
     << default_max_thread << ")\n"
     << "  -a, --hash NAME       digest algorithm (default "
     << default_hash_algo << ")\n"
     << "  -h, --help            show this help\n";
  return os.str();
}

}  // namespace detail_v1_0_0

}  // namespace fsclean
