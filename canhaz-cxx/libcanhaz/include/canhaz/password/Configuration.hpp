// Copyright (c) 2025 canhaz authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef CANHAZ_PASSWORD_CONFIGURATION_HPP
#define CANHAZ_PASSWORD_CONFIGURATION_HPP

#include "../util/unicode.hpp"
#include "Errors.hpp"

#include <algorithm>
#include <iterator>
#include <format>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace canhaz {
namespace password {

// Configures one class of characters of the password composition.
struct CharacterClassConfiguration {
  // The characters included in this class (UTF-8).
  std::string characters;
  // The minimum number of characters from this class to include.
  int minimum;
};

struct Configuration {
  /* Minimum length of the password.
   * The actual length is random, in the range length <= n <= 1.5 * length.
   * Random lengths allow the minimum complexity requirements to be met
   * without enforcing a strict composition (eg. exactly 2 digits and
   * exactly 1 special character).
   */
  int length;
  std::vector<CharacterClassConfiguration> character_classes;

  // Longest candidate kept before generation restarts from scratch.
  size_t max_length() const noexcept {
    return static_cast<size_t>(length * 1.5);
  }
};

// Decoded, sorted and deduplicated characters of a class.
inline std::u32string class_characters(const CharacterClassConfiguration& character_class) {
  std::u32string chars;
  try {
    chars = util::utf8_decode(character_class.characters);
  } catch (const std::invalid_argument& e) {
    throw ConfigurationError(std::format("character class '{}': {}", character_class.characters, e.what()));
  }
  std::sort(chars.begin(), chars.end());
  chars.erase(std::unique(chars.begin(), chars.end()), chars.end());
  return chars;
}

/*
 * Rejects configurations for which generation could never complete:
 * non-positive length, negative minimums, classes with a minimum but no
 * characters, no required characters at all, or more required characters
 * than fit before the overflow restart.
 *
 * Required classes sharing characters (directly or through other classes)
 * form a group; one character may count towards several classes of a
 * group, so a group needs at least its largest minimum. Groups are
 * disjoint, so their needs add up.
 */
inline void validate(const Configuration& config) {
  if (config.length <= 0) {
    throw ConfigurationError(std::format("password length must be positive, got {}", config.length));
  }

  std::vector<std::u32string> required;
  std::vector<int> minimums;
  for (const auto& character_class : config.character_classes) {
    if (character_class.minimum < 0) {
      throw ConfigurationError(std::format("character class '{}' has negative minimum {}",
                                           character_class.characters, character_class.minimum));
    }
    if (character_class.minimum == 0) {
      continue;
    }

    std::u32string chars = class_characters(character_class);
    if (chars.empty()) {
      throw ConfigurationError(std::format("character class with minimum {} has no characters", character_class.minimum));
    }
    required.push_back(std::move(chars));
    minimums.push_back(character_class.minimum);
  }

  if (required.empty()) {
    throw ConfigurationError("at least one character class must have a positive minimum");
  }

  // group[i] is the representative of the group of class i.
  std::vector<size_t> group(required.size());
  for (size_t i = 0; i < required.size(); ++i) {
    group[i] = i;
  }
  auto find = [&group](size_t i) {
    while (group[i] != i) {
      i = group[i];
    }
    return i;
  };
  for (size_t i = 0; i < required.size(); ++i) {
    for (size_t j = i + 1; j < required.size(); ++j) {
      std::u32string shared;
      std::set_intersection(required[i].begin(), required[i].end(), required[j].begin(), required[j].end(),
                            std::back_inserter(shared));
      if (!shared.empty()) {
        group[find(j)] = find(i);
      }
    }
  }

  std::vector<int> largest(required.size(), 0);
  for (size_t i = 0; i < required.size(); ++i) {
    size_t g = find(i);
    largest[g] = std::max(largest[g], minimums[i]);
  }
  long needed = 0;
  for (int minimum : largest) {
    needed += minimum;
  }

  if (static_cast<size_t>(needed) > config.max_length()) {
    throw ConfigurationError(std::format("character class minimums ({}) exceed the maximum password length ({})",
                                         needed, config.max_length()));
  }
}

} // namespace password
} // namespace canhaz

#endif // CANHAZ_PASSWORD_CONFIGURATION_HPP
