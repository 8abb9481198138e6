// Copyright (c) 2025 canhaz authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef CANHAZ_PASSWORD_RULE_HPP
#define CANHAZ_PASSWORD_RULE_HPP

#include "Configuration.hpp"

#include <string>

namespace canhaz {
namespace password {

/*
 * Sets the behaviour of the password generator: the composition of the
 * password and a predicate that rejects unwanted candidates.
 *
 * valid() is called with every partial candidate, right after a character
 * was appended. Returning false drops that character only.
 */
class Rule {
public:
  Rule() = default;
  Rule(const Rule& other) = delete;
  Rule& operator=(const Rule& other) = delete;
  Rule(Rule&& other) = delete;
  Rule& operator=(Rule&& other) = delete;
  virtual ~Rule() = default;

  virtual Configuration config() = 0;
  virtual bool valid(const std::u32string& password) = 0;
};

} // namespace password
} // namespace canhaz

#endif // CANHAZ_PASSWORD_RULE_HPP
