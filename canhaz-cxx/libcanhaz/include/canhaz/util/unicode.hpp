// Copyright (c) 2025 canhaz authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef CANHAZ_UTIL_UNICODE_HPP
#define CANHAZ_UTIL_UNICODE_HPP

#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

namespace canhaz {
namespace util {

inline void utf8_append(std::string& out, char32_t codepoint) {
  if (codepoint < 0x80) {
    // U+0000 .. U+007F: 0xxxxxxx
    out += (char)codepoint;
  } else if (codepoint < 0x800) {
    // U+0080 .. U+07FF: 110xxxxx, 10xxxxxx
    out += (char)(((codepoint >> 6) & 0b00011111) | 0b11000000);
    out += (char)((codepoint & 0b00111111) | 0b10000000);
  } else if (codepoint < 0x10000) {
    // U+0800 .. U+FFFF: 1110xxxx, 10xxxxxx, 10xxxxxx
    out += (char)(((codepoint >> 12) & 0b00001111) | 0b11100000);
    out += (char)(((codepoint >> 6) & 0b00111111) | 0b10000000);
    out += (char)((codepoint & 0b00111111) | 0b10000000);
  } else if (codepoint < 0x110000) {
    // U+10000 .. U+10FFFF: 11110xxx, 10xxxxxx, 10xxxxxx, 10xxxxxx
    out += (char)(((codepoint >> 18) & 0b00000111) | 0b11110000);
    out += (char)(((codepoint >> 12) & 0b00111111) | 0b10000000);
    out += (char)(((codepoint >> 6) & 0b00111111) | 0b10000000);
    out += (char)((codepoint & 0b00111111) | 0b10000000);
  } else {
    throw std::invalid_argument(std::format("code point U+{:X} is out of range", static_cast<unsigned>(codepoint)));
  }
}

inline std::string utf8_encode(std::u32string_view codepoints) {
  std::string out;
  out.reserve(codepoints.size());
  for (char32_t codepoint : codepoints) {
    utf8_append(out, codepoint);
  }
  return out;
}

// Decodes a UTF-8 string into code points. Malformed input (stray
// continuation bytes, truncated or overlong sequences, surrogates) throws
// std::invalid_argument.
inline std::u32string utf8_decode(std::string_view src) {
  std::u32string out;
  out.reserve(src.size());
  size_t i = 0;
  while (i < src.size()) {
    unsigned char lead = static_cast<unsigned char>(src[i]);
    char32_t codepoint;
    size_t size;
    if (lead < 0x80) {
      codepoint = lead;
      size = 1;
    } else if ((lead & 0b11100000) == 0b11000000) {
      codepoint = lead & 0b00011111;
      size = 2;
    } else if ((lead & 0b11110000) == 0b11100000) {
      codepoint = lead & 0b00001111;
      size = 3;
    } else if ((lead & 0b11111000) == 0b11110000) {
      codepoint = lead & 0b00000111;
      size = 4;
    } else {
      throw std::invalid_argument(std::format("invalid UTF-8 lead byte at offset {}", i));
    }

    if (i + size > src.size()) {
      throw std::invalid_argument(std::format("truncated UTF-8 sequence at offset {}", i));
    }
    for (size_t j = 1; j < size; ++j) {
      unsigned char cont = static_cast<unsigned char>(src[i + j]);
      if ((cont & 0b11000000) != 0b10000000) {
        throw std::invalid_argument(std::format("invalid UTF-8 continuation byte at offset {}", i + j));
      }
      codepoint = (codepoint << 6) | (cont & 0b00111111);
    }

    static constexpr char32_t min_codepoint[] = {0, 0, 0x80, 0x800, 0x10000};
    if (codepoint < min_codepoint[size] || codepoint >= 0x110000 || (codepoint >= 0xD800 && codepoint < 0xE000)) {
      throw std::invalid_argument(std::format("invalid UTF-8 sequence at offset {}", i));
    }

    out.push_back(codepoint);
    i += size;
  }
  return out;
}

} // namespace util
} // namespace canhaz

#endif // CANHAZ_UTIL_UNICODE_HPP
