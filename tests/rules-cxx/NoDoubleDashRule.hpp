// Copyright (c) 2025 canhaz authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

// Short passwords of letters, digits and URL-safe specials, rejecting
// consecutive dashes.

#ifndef NODOUBLEDASHRULE_HPP
#define NODOUBLEDASHRULE_HPP

#include <canhaz/password.hpp>

#include <string>

class NoDoubleDashRule : public canhaz::password::Rule {
public:
  canhaz::password::Configuration config() override {
    using namespace canhaz::password;
    return Configuration{8, {
      {std::string(LowercaseCharacters) + std::string(UppercaseCharacters), 3},
      {std::string(DigitCharacters), 3},
      {std::string(URLSafeSpecialCharacters), 1},
    }};
  }

  bool valid(const std::u32string& password) override {
    return password.find(U"--") == std::u32string::npos;
  }
};

#endif // NODOUBLEDASHRULE_HPP
