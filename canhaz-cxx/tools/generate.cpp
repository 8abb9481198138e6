// Copyright (c) 2025 canhaz authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#include <canhaz/password.hpp>
#include <canhaz/rand.hpp>
#include <canhaz/tool.hpp>
#include <canhaz/util/log.hpp>
#include <canhaz/util/print.hpp>

#include <cxxopts.hpp>

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include "canhaz/config.hpp"

using namespace canhaz::password;
using namespace canhaz::rand;
using namespace canhaz::tool;
using namespace canhaz::util;

int main(int argc, char **argv) {
  try {
    cxxopts::Options options(argv[0], "canhaz: Generate weighted random passwords");
    options.add_options()
      ("l,length",
       "minimum length of the generated password (the actual length is random, up to 1.5 times this)",
       cxxopts::value<int>()->default_value(CANHAZ_STRFY(CANHAZ_DEFAULT_LENGTH)),
       "NUM")
      ("no-special",
       "do not include special characters",
       cxxopts::value<bool>()->default_value("false"))
      ("r,rule",
       "JSON file describing the password rule (overrides --length and --no-special)",
       cxxopts::value<std::string>(),
       "FILE")
      ("n",
       "number of passwords to generate",
       cxxopts::value<int>()->default_value("1"),
       "NUM")
      ("memo-size",
       "memoize the last NUM unique passwords; if a memoized password is generated again, it is discarded and generation of a unique password is retried",
       cxxopts::value<int>()->default_value("0"),
       "NUM")
      ("unique-attempts",
       "limit on how many times to try to generate a unique (i.e., non-memoized) password; no effect if --memo-size=0",
       cxxopts::value<int>()->default_value("2"),
       "NUM")
      ("o,out",
       "output file name pattern (%d is replaced by the index of the password)",
       cxxopts::value<std::string>()->default_value(""),
       "FILE")
      ("stdout",
       "print passwords to stdout (alias for --out='')",
       cxxopts::value<bool>())
      ("random-seed",
       "use a seeded pseudo-random generator instead of the secure random source (for testing only; the passwords are NOT secure)",
       cxxopts::value<std::uint64_t>(),
       "NUM")
      ("dry-run",
       "generate passwords without writing them to file or printing to stdout",
       cxxopts::value<bool>()->default_value("false"))
      ("log-level",
       "verbosity of diagnostics on stderr (0: off, 1: fatal, 2: error, 3: warn, 4: info, 5: debug, 6: trace; capped by the build)",
       cxxopts::value<int>()->default_value(CANHAZ_STRFY(CANHAZ_LOG_LEVEL)),
       "LEVEL")
      ("version", "print version and exit")
      ("help", "print help and exit")
      ;
    auto args = options.parse(argc, argv);

    if (args.count("help")) {
      pout(options.help());
      exit(0);
    }
    if (args.count("version")) {
      poutf("{} {}", argv[0], CANHAZ_STRFY(CANHAZ_VERSION));
      exit(0);
    }

    set_log_threshold(args["log-level"].as<int>());

    std::unique_ptr<Rule> rule;
    if (args.count("rule")) {
      Configuration config{};
      std::vector<std::string> forbidden;
      if (!JsonRuleLoader().load(args["rule"].as<std::string>(), config, forbidden)) {
        exit(1);
      }
      rule = std::make_unique<JsonRule>(config, forbidden);
    } else {
      rule = std::make_unique<DemoRule>(args["length"].as<int>(), !args["no-special"].as<bool>());
    }

    RandomSource* source;
    if (args.count("random-seed")) {
      CANHAZ_LOG_WARN("random seed given, the generated passwords are reproducible and not secure");
      source = new SeededRandomSource(args["random-seed"].as<std::uint64_t>());
    } else {
      source = new CryptoRandomSource();
    }

    Generator generator(*rule, source);
    GeneratorTool tool(generator,  // generator
                       args.count("stdout") ? "" : args["out"].as<std::string>(),  // out_format
                       args["memo-size"].as<int>(),  // memo_size
                       args["unique-attempts"].as<int>(),  // unique_attempts
                       args["dry-run"].as<bool>()  // dry_run
                       );

    for (int i = 0, n = args["n"].as<int>(); i < n; ++i) {
      tool.create_password(i);
    }
  } catch (const cxxopts::exceptions::exception &e) {
    perrf("error parsing options: {}", e.what());
    exit(1);
  } catch (const ConfigurationError &e) {
    perrf("invalid password rule: {}", e.what());
    exit(1);
  } catch (const RuleRejectionError &e) {
    perrf("{}", e.what());
    exit(1);
  } catch (const EntropyError &e) {
    perrf("fatal: {}", e.what());
    exit(1);
  }
}
