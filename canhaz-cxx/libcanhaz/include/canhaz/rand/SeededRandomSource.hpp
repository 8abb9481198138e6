// Copyright (c) 2025 canhaz authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef CANHAZ_RAND_SEEDEDRANDOMSOURCE_HPP
#define CANHAZ_RAND_SEEDEDRANDOMSOURCE_HPP

#include "RandomSource.hpp"

#include <cstdint>
#include <random>

namespace canhaz {
namespace rand {

// Deterministic pseudo-random source for reproducible runs.
// NOTE: not suitable for real passwords, and not thread-safe.
class SeededRandomSource : public RandomSource {
private:
  std::mt19937_64 engine_;

public:
  explicit SeededRandomSource(std::uint64_t seed) : engine_(seed) {}
  SeededRandomSource(const SeededRandomSource& other) = delete;
  SeededRandomSource& operator=(const SeededRandomSource& other) = delete;
  SeededRandomSource(SeededRandomSource&& other) = delete;
  SeededRandomSource& operator=(SeededRandomSource&& other) = delete;
  ~SeededRandomSource() override = default;

  void seed(std::uint64_t seed) {
    engine_.seed(seed);
  }

  std::uint64_t next_u64() override {
    return engine_();
  }
};

} // namespace rand
} // namespace canhaz

#endif // CANHAZ_RAND_SEEDEDRANDOMSOURCE_HPP
