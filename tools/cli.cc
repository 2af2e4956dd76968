#include <exception>
#include <iostream>

#include "config.hh"
#include "fsclean.hh"

int main(int argc, char* argv[]) {
  fsclean::run_opts_t opts;
  try {
    opts = fsclean::parse_args(argc, argv);
  } catch (const fsclean::usage_error& e) {
    std::cerr << e.what() << "\n\n" << fsclean::usage();
    return 1;
  }
  if (opts.help) {
    std::cout << fsclean::usage();
    return 0;
  }

  fsclean::logger_t log(std::cerr, opts.log_level);
  log.info(fsclean::description);

  fsclean::change_ledger_t ledger;
  const auto summary = fsclean::run(opts, ledger, log);

  if (!opts.changelog_path) {
    log.info("no changelog specified");
    return 0;
  }
  log.info("writing changelog to ", *opts.changelog_path);
  try {
    ledger.save(*opts.changelog_path, summary);
  } catch (const std::exception& e) {
    log.crit("could not write changelog to ", *opts.changelog_path, ": ",
             e.what());
    return 2;
  }
  return 0;
}
