// Copyright (c) 2025 canhaz authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#include <canhaz/password.hpp>
#include <canhaz/rand.hpp>
#include <canhaz/tool/DemoRule.hpp>
#include <canhaz/util/unicode.hpp>

#include <catch2/catch.hpp>

#include <algorithm>
#include <cmath>
#include <map>
#include <string>
#include <vector>

#include "FailingRandomSource.hpp"
#include "ScriptedRandomSource.hpp"
#include "rules-cxx/AlwaysRejectRule.hpp"
#include "rules-cxx/FixedConfigRule.hpp"
#include "rules-cxx/NoDoubleDashRule.hpp"
#include "rules-cxx/ShiftingRule.hpp"

using namespace canhaz::password;
using canhaz::rand::EntropyError;
using canhaz::rand::SeededRandomSource;
using canhaz::util::utf8_decode;

namespace {

int occurrences(const std::u32string& password, const std::string& characters) {
  std::u32string chars = utf8_decode(characters);
  return static_cast<int>(std::count_if(password.begin(), password.end(), [&chars](char32_t c) {
    return chars.find(c) != std::u32string::npos;
  }));
}

void check_password(const Configuration& config, const std::string& password) {
  std::u32string decoded = utf8_decode(password);
  INFO("password '" << password << "'");
  CHECK(decoded.size() >= static_cast<size_t>(config.length));
  CHECK(decoded.size() <= config.max_length());
  for (const auto& character_class : config.character_classes) {
    CHECK(occurrences(decoded, character_class.characters) >= character_class.minimum);
  }
}

} // namespace

TEST_CASE("generated passwords follow the configured composition", "[generator]") {
  NoDoubleDashRule rule;
  Generator generator(rule);

  // Generate ten thousand short passwords.
  std::vector<std::string> passwords;
  for (int i = 0; i < 10'000; ++i) {
    passwords.push_back(generator.generate());
  }

  // The length is bounded and the average falls within the expected range.
  size_t min_length = 12;
  size_t max_length = 0;
  double mean_length = 0.0;
  for (const auto& password : passwords) {
    min_length = std::min(min_length, password.size());
    max_length = std::max(max_length, password.size());
    mean_length += password.size();
  }
  mean_length /= passwords.size();

  CHECK(min_length == 8);
  CHECK(max_length == 12);
  CHECK(mean_length > 9.0);
  CHECK(mean_length < 10.0);

  // Distribution of the characters over all passwords.
  int total = 0;
  std::map<char, double> counts;
  for (const auto& password : passwords) {
    for (char c : password) {
      counts[c] += 1.0;
      total++;
    }
  }
  for (auto& [c, count] : counts) {
    count /= total;
  }

  std::string letters = std::string(UppercaseCharacters) + std::string(LowercaseCharacters);
  // 3/8 of all characters are expected to be a letter of either case.
  double expected_letter = 3.0 / (8.0 * letters.size());
  for (char c : letters) {
    INFO("letter " << c);
    CHECK(std::abs(counts[c] - expected_letter) < 0.01);
  }

  // 3/8 of all characters are expected to be a digit.
  double expected_digit = 3.0 / (8.0 * DigitCharacters.size());
  for (char c : DigitCharacters) {
    INFO("digit " << c);
    CHECK(std::abs(counts[c] - expected_digit) < 0.01);
  }

  // 1/8 of all characters are expected to be a special character. The
  // margin is larger: the low prevalence combined with the minimum
  // requirement makes them somewhat overrepresented.
  double expected_special = 1.0 / (8.0 * URLSafeSpecialCharacters.size());
  for (char c : URLSafeSpecialCharacters) {
    INFO("special " << c);
    CHECK(std::abs(counts[c] - expected_special) < 0.025);
  }

  // No characters outside of the classes, no double dashes.
  std::string allowed = letters + std::string(DigitCharacters) + std::string(URLSafeSpecialCharacters);
  for (const auto& password : passwords) {
    INFO("password '" << password << "'");
    CHECK(password.find_first_not_of(allowed) == std::string::npos);
    CHECK(password.find("--") == std::string::npos);
    check_password(rule.config(), password);
  }
}

TEST_CASE("character weights follow the class minimums", "[generator]") {
  NoDoubleDashRule rule;
  Generator generator(rule);

  CHECK(generator.character_source().size() == 64);
  CHECK(generator.character_source().total_weight() == Approx(1.0));
  CHECK(generator.character_source().contains('x'));
  CHECK(generator.character_source().contains('7'));
  CHECK(generator.character_source().contains('_'));
  CHECK_FALSE(generator.character_source().contains('!'));
}

TEST_CASE("classes without a minimum are never drawn", "[generator]") {
  FixedConfigRule rule({4, {{"abc", 2}, {"xyz", 0}}});
  Generator generator(rule, new SeededRandomSource(11));

  CHECK(generator.character_source().size() == 3);
  CHECK_FALSE(generator.character_source().contains('x'));
  for (int i = 0; i < 200; ++i) {
    auto password = generator.generate();
    CHECK(password.find_first_of("xyz") == std::string::npos);
  }
}

TEST_CASE("a broken rule makes generation fail", "[generator]") {
  AlwaysRejectRule rule;
  Generator generator(rule);

  CHECK_THROWS_AS(generator.generate(), RuleRejectionError);
  CHECK(rule.valid_calls == Generator::max_invalid_password_rejections);
  CHECK_THROWS_WITH(generator.generate(), "password rule rejected too many passwords");
}

TEST_CASE("rejections accumulate across restarts", "[generator]") {
  // a: [0, 0.5), b: [0.5, 1); the maximum length is 3.
  int draws = 0;
  std::vector<double> script = {0.75, 0.25, 0.25, 0.25, 0.25};
  script.insert(script.end(), 9, 0.75);
  FixedConfigRule rule({2, {{"a", 1}, {"b", 1}}}, U"b");
  Generator generator(rule, new ScriptedRandomSource(script, &draws));

  // One rejection, four accepted characters overflowing into a restart,
  // then nine more rejections reach the limit.
  CHECK_THROWS_AS(generator.generate(), RuleRejectionError);
  CHECK(draws == 14);
  CHECK(rule.valid_calls == 14);
}

TEST_CASE("characters are kept in the order they were drawn", "[generator]") {
  // a: [0, 1/3), b: [1/3, 2/3), c: [2/3, 1)
  int draws = 0;
  FixedConfigRule rule({3, {{"abc", 3}}});
  Generator generator(rule, new ScriptedRandomSource({0.9, 0.1, 0.5}, &draws));

  CHECK(generator.generate() == "cab");
  // The candidate was complete after three characters; nothing more drawn.
  CHECK(draws == 3);
  // Once for the weights, once for the generation.
  CHECK(rule.config_calls == 2);
}

TEST_CASE("every password satisfies length and minimums", "[generator]") {
  for (int length = 2; length <= 24; ++length) {
    for (bool special : {true, false}) {
      canhaz::tool::DemoRule rule(length, special);
      Generator generator(rule, new SeededRandomSource(length));
      Configuration config = rule.config();
      for (int i = 0; i < 100; ++i) {
        check_password(config, generator.generate());
      }
    }
  }
}

TEST_CASE("non-ASCII character classes", "[generator]") {
  FixedConfigRule rule({4, {{"äöü€", 4}}});
  Generator generator(rule, new SeededRandomSource(3));

  for (int i = 0; i < 100; ++i) {
    std::u32string password = utf8_decode(generator.generate());
    CHECK(password.size() >= 4);
    CHECK(password.size() <= 6);
    CHECK(password.find_first_not_of(U"äöü€") == std::u32string::npos);
  }
}

TEST_CASE("seeded generators are reproducible", "[generator]") {
  std::string letters = std::string(LowercaseCharacters) + std::string(UppercaseCharacters);
  FixedConfigRule rule({16, {{letters, 8}, {std::string(DigitCharacters), 4}}});

  Generator a(rule, new SeededRandomSource(42));
  Generator b(rule, new SeededRandomSource(42));
  for (int i = 0; i < 10; ++i) {
    CHECK(a.generate() == b.generate());
  }

  // The secure source is not expected to repeat itself.
  Generator secure(rule);
  CHECK(secure.generate() != secure.generate());
}

TEST_CASE("invalid configurations fail at construction", "[generator]") {
  FixedConfigRule zero_length({0, {{"abc", 1}}});
  CHECK_THROWS_AS(Generator(zero_length), ConfigurationError);

  FixedConfigRule no_minimum({8, {{"abc", 0}}});
  CHECK_THROWS_AS(Generator(no_minimum), ConfigurationError);

  FixedConfigRule too_many({2, {{"abc", 4}}});
  CHECK_THROWS_AS(Generator(too_many, new SeededRandomSource(1)), ConfigurationError);

  bool destroyed = false;
  CHECK_THROWS_AS(Generator(zero_length, new FailingRandomSource(0, &destroyed)), ConfigurationError);
  CHECK(destroyed);
}

// The weights are taken from the first configuration while the length and
// the minimums come from the configuration current at generate().
TEST_CASE("weights are fixed when the generator is built", "[generator]") {
  std::string digits(DigitCharacters);

  SECTION("a longer length with the initial characters") {
    ShiftingRule rule({4, {{digits, 1}}}, {6, {{digits, 1}, {"abc", 0}}});
    Generator generator(rule, new SeededRandomSource(5));
    for (int i = 0; i < 100; ++i) {
      auto password = generator.generate();
      CHECK(password.size() >= 6);
      CHECK(password.size() <= 9);
      CHECK(password.find_first_not_of(digits) == std::string::npos);
    }
  }

  SECTION("a class the weights cannot produce") {
    ShiftingRule rule({4, {{digits, 1}}}, {4, {{digits, 1}, {"abc", 1}}});
    Generator generator(rule, new SeededRandomSource(5));
    CHECK_THROWS_AS(generator.generate(), ConfigurationError);
  }
}

TEST_CASE("overlapping classes share their characters", "[generator]") {
  std::string special(SpecialCharacters);
  std::string url_safe(URLSafeSpecialCharacters);
  FixedConfigRule rule({2, {{special, 2}, {url_safe, 2}}});
  Generator generator(rule, new SeededRandomSource(1));

  // Characters of both classes take weight from both.
  CHECK(generator.character_source().total_weight() == Approx(1.0));
  CHECK(generator.character_source().size() == special.size() + url_safe.size());
  CHECK(generator.character_source().contains('-'));
  for (int i = 0; i < 200; ++i) {
    auto password = generator.generate();
    INFO("password '" << password << "'");
    CHECK(password.size() >= 2);
    CHECK(password.size() <= 3);
    CHECK(occurrences(utf8_decode(password), url_safe) >= 2);
  }
}

TEST_CASE("entropy failures abort generation", "[generator]") {
  FixedConfigRule rule({8, {{"abc", 4}, {"xyz", 4}}});
  Generator generator(rule, new FailingRandomSource(3));

  std::string password = "unchanged";
  CHECK_THROWS_AS(password = generator.generate(), EntropyError);
  CHECK(password == "unchanged");
  // The characters drawn before the failure were checked, none after.
  CHECK(rule.valid_calls == 3);

  CHECK_THROWS_AS(generator.generate(), EntropyError);
  CHECK(rule.valid_calls == 3);
}
