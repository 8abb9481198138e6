// Copyright (c) 2025 canhaz authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef CANHAZ_PASSWORD_CHARACTERS_HPP
#define CANHAZ_PASSWORD_CHARACTERS_HPP

#include <string_view>

namespace canhaz {
namespace password {

// Common character sets for use as character classes.
inline constexpr std::string_view DigitCharacters = "0123456789";
inline constexpr std::string_view UppercaseCharacters = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
inline constexpr std::string_view LowercaseCharacters = "abcdefghijklmnopqrstuvwxyz";
// OWASP recommended password special characters.
inline constexpr std::string_view SpecialCharacters = "!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~";
inline constexpr std::string_view URLSafeSpecialCharacters = "-_";

} // namespace password
} // namespace canhaz

#endif // CANHAZ_PASSWORD_CHARACTERS_HPP
