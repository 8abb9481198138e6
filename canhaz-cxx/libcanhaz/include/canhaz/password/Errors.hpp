// Copyright (c) 2025 canhaz authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef CANHAZ_PASSWORD_ERRORS_HPP
#define CANHAZ_PASSWORD_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace canhaz {
namespace password {

// The rule rejected so many candidate characters that generation gave up.
class RuleRejectionError : public std::runtime_error {
public:
  RuleRejectionError() : std::runtime_error("password rule rejected too many passwords") {}
};

// The configuration of a rule cannot produce any password.
class ConfigurationError : public std::invalid_argument {
public:
  explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace password
} // namespace canhaz

#endif // CANHAZ_PASSWORD_ERRORS_HPP
