// Copyright (c) 2025 canhaz authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef CANHAZ_PASSWORD_GENERATOR_HPP
#define CANHAZ_PASSWORD_GENERATOR_HPP

#include "../rand/CryptoRandomSource.hpp"
#include "../rand/RandomSource.hpp"
#include "../rand/WeightedRandomSet.hpp"
#include "../util/log.hpp"
#include "../util/unicode.hpp"
#include "Configuration.hpp"
#include "Errors.hpp"
#include "Rule.hpp"

#include <algorithm>
#include <format>
#include <string>
#include <utility>
#include <vector>

namespace canhaz {
namespace password {

/*
 * Generates random passwords matching a rule.
 *
 * The character weights are derived from the rule's configuration once, at
 * construction. Length and composition targets are re-read from the rule on
 * every generate() call, so the configuration is expected to stay the same
 * for the lifetime of the generator.
 *
 * The rule is not owned and must outlive the generator. The random source
 * is owned.
 */
class Generator {
public:
  // Prevents ending up in an endless loop due to a bad rule.
  static constexpr int max_invalid_password_rejections = 10;

private:
  Rule& rule_;
  rand::WeightedRandomSet character_source_;

public:
  explicit Generator(Rule& rule, rand::RandomSource* source = new rand::CryptoRandomSource())
      : rule_(rule), character_source_(build_character_source(rule, source), source) { }

  Generator(const Generator& other) = delete;
  Generator& operator=(const Generator& other) = delete;
  Generator(Generator&& other) = delete;
  Generator& operator=(Generator&& other) = delete;
  ~Generator() = default;

  // Generates a new random password, UTF-8 encoded.
  std::string generate() {
    Configuration config = rule_.config();
    std::vector<CharacterClass> classes = compile(config);
    size_t max_length = config.max_length();

    std::u32string password;
    for (int rejections = 0; rejections < max_invalid_password_rejections; ) {
      if (complete(config, classes, password)) {
        CANHAZ_LOG_DEBUG("generated password of length {} after {} rejection(s)", password.size(), rejections);
        return util::utf8_encode(password);
      }

      password.push_back(character_source_.next());

      // Reject characters that the rule considers invalid.
      if (!rule_.valid(password)) {
        password.pop_back();
        rejections++;
        CANHAZ_LOG_DEBUG("rule rejected candidate character ({}/{})", rejections, max_invalid_password_rejections);
        continue;
      }

      // Past the maximum length start again from scratch. This bounds the
      // long tail of the length distribution. Rejections are kept.
      if (password.size() > max_length) {
        CANHAZ_LOG_TRACE("candidate exceeded {} characters, restarting", max_length);
        password.clear();
      }
    }

    CANHAZ_LOG_WARN("password rule rejected {} candidate characters, giving up", max_invalid_password_rejections);
    throw RuleRejectionError();
  }

  const rand::WeightedRandomSet& character_source() const noexcept { return character_source_; }

private:
  struct CharacterClass {
    std::u32string characters;
    int minimum;
  };

  std::vector<CharacterClass> compile(const Configuration& config) const {
    validate(config);

    std::vector<CharacterClass> classes;
    classes.reserve(config.character_classes.size());
    for (const auto& character_class : config.character_classes) {
      std::u32string chars = class_characters(character_class);
      if (character_class.minimum > 0
          && std::none_of(chars.begin(), chars.end(), [this](char32_t c) { return character_source_.contains(c); })) {
        throw ConfigurationError(std::format("character class '{}' cannot be produced by the weights of this generator",
                                             character_class.characters));
      }
      classes.push_back({std::move(chars), character_class.minimum});
    }
    return classes;
  }

  // Have the minimum length and all of the composition requirements been met?
  static bool complete(const Configuration& config, const std::vector<CharacterClass>& classes, const std::u32string& password) {
    if (password.size() < static_cast<size_t>(config.length)) {
      return false;
    }

    for (const auto& character_class : classes) {
      if (occurrences(password, character_class.characters) < character_class.minimum) {
        return false;
      }
    }
    return true;
  }

  // Number of characters of the password belonging to a (sorted) class.
  static int occurrences(const std::u32string& password, const std::u32string& characters) {
    return static_cast<int>(std::count_if(password.begin(), password.end(), [&characters](char32_t c) {
      return std::binary_search(characters.begin(), characters.end(), c);
    }));
  }

  // The character source returns characters in a distribution consistent
  // with the desired composition of the password: each class gets a share
  // of the probability proportional to its minimum, spread evenly over the
  // characters of the class.
  static std::vector<rand::WeightedRandomEntry> build_character_source(Rule& rule, rand::RandomSource* source) {
    std::vector<rand::WeightedRandomEntry> entries;
    try {
      Configuration config = rule.config();
      validate(config);

      int total_minimum = 0;
      for (const auto& character_class : config.character_classes) {
        total_minimum += character_class.minimum;
      }

      for (const auto& character_class : config.character_classes) {
        // Skip classes that can never be selected to avoid zero weights.
        if (character_class.minimum == 0) {
          continue;
        }

        double probability = static_cast<double>(character_class.minimum) / total_minimum;
        std::u32string chars = class_characters(character_class);
        for (char32_t c : chars) {
          entries.push_back({c, probability / chars.size()});
        }
      }
    } catch (...) {
      // The weighted set never took ownership of the source.
      delete source;
      throw;
    }
    return entries;
  }
};

} // namespace password
} // namespace canhaz

#endif // CANHAZ_PASSWORD_GENERATOR_HPP
