// Copyright (c) 2025 canhaz authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef CANHAZ_TOOL_JSONRULE_HPP
#define CANHAZ_TOOL_JSONRULE_HPP

#include "../password/Configuration.hpp"
#include "../password/Errors.hpp"
#include "../password/Rule.hpp"
#include "../util/unicode.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace canhaz {
namespace tool {

// Rule with a fixed configuration that rejects candidates containing any of
// a list of forbidden substrings.
class JsonRule : public password::Rule {
private:
  password::Configuration config_;
  std::vector<std::u32string> forbidden_{};

public:
  explicit JsonRule(password::Configuration config, const std::vector<std::string>& forbidden = {})
      : config_(std::move(config)) {
    for (const auto& sequence : forbidden) {
      if (sequence.empty()) {
        continue;
      }
      try {
        forbidden_.push_back(util::utf8_decode(sequence));
      } catch (const std::invalid_argument& e) {
        throw password::ConfigurationError(std::format("forbidden sequence: {}", e.what()));
      }
    }
  }

  JsonRule(const JsonRule& other) = delete;
  JsonRule& operator=(const JsonRule& other) = delete;
  JsonRule(JsonRule&& other) = delete;
  JsonRule& operator=(JsonRule&& other) = delete;
  ~JsonRule() override = default;

  password::Configuration config() override {
    return config_;
  }

  bool valid(const std::u32string& password) override {
    return std::none_of(forbidden_.begin(), forbidden_.end(), [&password](const std::u32string& sequence) {
      return password.find(sequence) != std::u32string::npos;
    });
  }
};

} // namespace tool
} // namespace canhaz

#endif // CANHAZ_TOOL_JSONRULE_HPP
