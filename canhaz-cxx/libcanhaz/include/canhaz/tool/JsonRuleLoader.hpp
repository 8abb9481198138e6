// Copyright (c) 2025 canhaz authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef CANHAZ_TOOL_JSONRULELOADER_HPP
#define CANHAZ_TOOL_JSONRULELOADER_HPP

#include "../password/Characters.hpp"
#include "../password/Configuration.hpp"
#include "../util/print.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace canhaz {
namespace tool {

/*
 * Reads a rule description of the form
 *
 *   {
 *     "length": 12,
 *     "character_classes": [
 *       {"charset": "lowercase", "minimum": 3},
 *       {"characters": "0123456789", "minimum": 2}
 *     ],
 *     "forbidden": ["--"]
 *   }
 *
 * A class names either its "characters" or a predefined "charset".
 * Problems are reported on stderr and make load() return false.
 */
class JsonRuleLoader {
public:
  static const std::map<std::string, std::string_view>& charsets() {
    static const std::map<std::string, std::string_view> charsets = {
      {"digits", password::DigitCharacters},
      {"uppercase", password::UppercaseCharacters},
      {"lowercase", password::LowercaseCharacters},
      {"special", password::SpecialCharacters},
      {"url_safe_special", password::URLSafeSpecialCharacters},
    };
    return charsets;
  }

  JsonRuleLoader() = default;
  JsonRuleLoader(const JsonRuleLoader& other) = delete;
  JsonRuleLoader& operator=(const JsonRuleLoader& other) = delete;
  JsonRuleLoader(JsonRuleLoader&& other) = delete;
  JsonRuleLoader& operator=(JsonRuleLoader&& other) = delete;

  bool load(const std::string& fn, password::Configuration& config, std::vector<std::string>& forbidden) {
    std::ifstream rf(fn);
    if (!rf) {
      util::perrf("Failed to open the rule JSON file for reading: {}", fn);
      return false;
    }

    nlohmann::json data = nlohmann::json::parse(rf, nullptr, false);
    if (data.is_discarded()) {
      util::perrf("Invalid JSON in rule file: {}", fn);
      return false;
    }

    try {
      config.length = data.at("length").get<int>();
      config.character_classes.clear();
      for (const auto& cls : data.at("character_classes")) {
        password::CharacterClassConfiguration character_class{};
        if (cls.contains("charset")) {
          auto name = cls.at("charset").get<std::string>();
          auto it = charsets().find(name);
          if (it == charsets().end()) {
            util::perrf("Unknown charset '{}' in rule file: {}", name, fn);
            return false;
          }
          character_class.characters = std::string(it->second);
        } else {
          character_class.characters = cls.at("characters").get<std::string>();
        }
        character_class.minimum = cls.at("minimum").get<int>();
        config.character_classes.push_back(character_class);
      }

      forbidden.clear();
      if (data.contains("forbidden")) {
        forbidden = data.at("forbidden").get<std::vector<std::string>>();
      }
    } catch (const nlohmann::json::exception& e) {
      util::perrf("Invalid rule in file {}: {}", fn, e.what());
      return false;
    }
    return true;
  }
};

} // namespace tool
} // namespace canhaz

#endif // CANHAZ_TOOL_JSONRULELOADER_HPP
