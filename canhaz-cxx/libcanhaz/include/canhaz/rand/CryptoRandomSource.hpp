// Copyright (c) 2025 canhaz authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef CANHAZ_RAND_CRYPTORANDOMSOURCE_HPP
#define CANHAZ_RAND_CRYPTORANDOMSOURCE_HPP

#include "../util/log.hpp"
#include "RandomSource.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace canhaz {
namespace rand {

// Raised when the operating system's secure random source cannot deliver
// bytes. There is no fallback: callers must abort the current operation.
class EntropyError : public std::runtime_error {
public:
  explicit EntropyError(const std::string& what) : std::runtime_error(what) {}
};

/*
 * Random source backed by OpenSSL's CSPRNG, which is seeded from the
 * operating system. Seeding is not exposed. The object holds no state, so
 * a single instance may be shared between threads.
 */
class CryptoRandomSource : public RandomSource {
public:
  CryptoRandomSource() = default;
  CryptoRandomSource(const CryptoRandomSource& other) = delete;
  CryptoRandomSource& operator=(const CryptoRandomSource& other) = delete;
  CryptoRandomSource(CryptoRandomSource&& other) = delete;
  CryptoRandomSource& operator=(CryptoRandomSource&& other) = delete;
  ~CryptoRandomSource() override = default;

  std::uint64_t next_u64() override {
    unsigned char buf[sizeof(std::uint64_t)];
    if (RAND_bytes(buf, sizeof(buf)) != 1) {
      char reason[256];
      ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
      std::string message = std::string("secure random source failed: ") + reason;
      CANHAZ_LOG_FATAL("{}", message);
      throw EntropyError(message);
    }

    std::uint64_t value = 0;
    for (unsigned char byte : buf) {
      value = (value << 8) | byte;
    }
    return value;
  }
};

} // namespace rand
} // namespace canhaz

#endif // CANHAZ_RAND_CRYPTORANDOMSOURCE_HPP
