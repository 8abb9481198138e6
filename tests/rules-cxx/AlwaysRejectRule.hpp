// Copyright (c) 2025 canhaz authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

// A broken rule that rejects every candidate.

#ifndef ALWAYSREJECTRULE_HPP
#define ALWAYSREJECTRULE_HPP

#include <canhaz/password.hpp>

#include <string>

class AlwaysRejectRule : public canhaz::password::Rule {
public:
  int valid_calls = 0;

  canhaz::password::Configuration config() override {
    return canhaz::password::Configuration{8, {
      {std::string(canhaz::password::LowercaseCharacters) + std::string(canhaz::password::UppercaseCharacters), 8},
    }};
  }

  bool valid(const std::u32string&) override {
    valid_calls++;
    return false;
  }
};

#endif // ALWAYSREJECTRULE_HPP
