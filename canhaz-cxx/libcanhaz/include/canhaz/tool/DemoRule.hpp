// Copyright (c) 2025 canhaz authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef CANHAZ_TOOL_DEMORULE_HPP
#define CANHAZ_TOOL_DEMORULE_HPP

#include "../password/Configuration.hpp"
#include "../password/Rule.hpp"

#include <cmath>
#include <string>

namespace canhaz {
namespace tool {

/*
 * Rule of the command line tool: widely compatible, unambiguous characters
 * (no 0/O, 1/l/I) with the class minimums set as a share of the length.
 * Every candidate is accepted.
 */
class DemoRule : public password::Rule {
public:
  static constexpr const char* UnambiguousLetters = "ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnpqrstuvwxyz";
  static constexpr const char* UnambiguousDigits = "23456789";
  static constexpr const char* SpecialCharacters = "_-@!*.";

private:
  int length_;
  bool special_characters_;

public:
  DemoRule(int length, bool special_characters) : length_(length), special_characters_(special_characters) {}
  DemoRule(const DemoRule& other) = delete;
  DemoRule& operator=(const DemoRule& other) = delete;
  DemoRule(DemoRule&& other) = delete;
  DemoRule& operator=(DemoRule&& other) = delete;
  ~DemoRule() override = default;

  password::Configuration config() override {
    password::Configuration config{length_, {
      {UnambiguousLetters, share(0.5)},
      {UnambiguousDigits, share(0.33)},
    }};
    if (special_characters_) {
      config.character_classes.push_back({SpecialCharacters, share(0.17)});
    }
    return config;
  }

  bool valid(const std::u32string&) override {
    return true;
  }

private:
  int share(double ratio) const {
    return static_cast<int>(std::ceil(length_ * ratio));
  }
};

} // namespace tool
} // namespace canhaz

#endif // CANHAZ_TOOL_DEMORULE_HPP
