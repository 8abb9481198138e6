// Copyright (c) 2025 canhaz authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef CANHAZ_TOOL_GENERATORTOOL_HPP
#define CANHAZ_TOOL_GENERATORTOOL_HPP

#include "../password/Generator.hpp"
#include "../util/log.hpp"
#include "../util/print.hpp"

#include <xxhash.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <list>
#include <set>
#include <string>

namespace canhaz {
namespace tool {

/*
 * Drives a password generator for the command line: optionally suppresses
 * recently emitted duplicates and writes each password either to stdout or
 * to a file named after out_format ("%d" is replaced by the index).
 */
class GeneratorTool {
private:
  password::Generator& generator;
  std::string out_format;
  int memo_size;
  int unique_attempts;
  bool dry_run;

  std::set<XXH64_hash_t> memo;
  std::list<std::set<XXH64_hash_t>::iterator> memo_order;

public:
  explicit GeneratorTool(password::Generator& generator, const std::string& out_format = "",
                         int memo_size = 0, int unique_attempts = 2, bool dry_run = false)
      : generator(generator), out_format(out_format), memo_size(memo_size),
        unique_attempts(std::max(unique_attempts, 1)), dry_run(dry_run) {
    if (!out_format.empty() && !dry_run) {
      std::filesystem::path directoryPath = std::filesystem::path(out_format).parent_path();

      if (!directoryPath.empty() && !std::filesystem::exists(directoryPath))
        std::filesystem::create_directories(directoryPath);
    }
  }

  GeneratorTool(const GeneratorTool& other) = delete;
  GeneratorTool& operator=(const GeneratorTool& other) = delete;
  GeneratorTool(GeneratorTool&& other) = delete;
  GeneratorTool& operator=(GeneratorTool&& other) = delete;
  ~GeneratorTool() = default;

  // Generates, memoizes and emits password #index; returns the password.
  std::string create_password(int index) {
    std::string password;
    for (int attempt = 1; attempt <= unique_attempts; ++attempt) {
      password = generator.generate();

      if (memoize_password(password)) {
        break;
      }
      CANHAZ_LOG_INFO("password #{}, attempt {}/{}: already generated among the last {} unique passwords", index, attempt, unique_attempts, memo.size());
    }

    if (!dry_run) {
      if (!out_format.empty()) {
        std::string password_fn = out_format;
        size_t pos = password_fn.find("%d");
        if (pos != std::string::npos) {
          password_fn.replace(pos, 2, std::to_string(index));
        }
        std::ofstream file(password_fn);
        if (!file) {
          util::perrf("Failed to open output file for writing: {}", password_fn);
        } else {
          util::write(file, password);
        }
      } else {
        util::pout(password);
      }
    }

    return password;
  }

  bool memoize_password(const std::string& password) {
    // Memoize the (hash of the) password. The size of the memo is capped by
    // ``memo_size``, i.e., it contains at most that many passwords.
    // Returns ``false`` if the password was already in the memo, ``true``
    // if it got added now (or memoization is disabled by ``memo_size=0``).
    // When the memo is full and a new password is added, the oldest entry
    // is evicted.
    if (memo_size < 1) {
      return true;
    }

    auto hash = XXH3_64bits(password.data(), password.size());
    auto inserted = memo.insert(hash);  // {iterator, success}
    if (!inserted.second) {
      return false;
    }
    memo_order.push_back(inserted.first);

    if (memo.size() > static_cast<size_t>(memo_size)) {
      memo.erase(memo_order.front());
      memo_order.pop_front();
    }

    return true;
  }

  size_t memoized() const noexcept { return memo.size(); }
};

} // namespace tool
} // namespace canhaz

#endif // CANHAZ_TOOL_GENERATORTOOL_HPP
