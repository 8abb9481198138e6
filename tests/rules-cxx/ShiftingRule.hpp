// Copyright (c) 2025 canhaz authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

// Returns one configuration on the first call of config() (when the
// generator derives its weights) and another one on every later call.

#ifndef SHIFTINGRULE_HPP
#define SHIFTINGRULE_HPP

#include <canhaz/password.hpp>

#include <string>
#include <utility>

class ShiftingRule : public canhaz::password::Rule {
private:
  canhaz::password::Configuration initial_;
  canhaz::password::Configuration later_;
  int calls_ = 0;

public:
  ShiftingRule(canhaz::password::Configuration initial, canhaz::password::Configuration later)
      : initial_(std::move(initial)), later_(std::move(later)) {}

  canhaz::password::Configuration config() override {
    return calls_++ == 0 ? initial_ : later_;
  }

  bool valid(const std::u32string&) override {
    return true;
  }
};

#endif // SHIFTINGRULE_HPP
