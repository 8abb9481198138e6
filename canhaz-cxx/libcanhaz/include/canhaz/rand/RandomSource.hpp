// Copyright (c) 2025 canhaz authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef CANHAZ_RAND_RANDOMSOURCE_HPP
#define CANHAZ_RAND_RANDOMSOURCE_HPP

#include <cstdint>

namespace canhaz {
namespace rand {

/*
 * Source of uniformly distributed random bits. Implementations provide
 * next_u64(); doubles in [0, 1) are derived from its top 53 bits so that
 * every representable result is equally likely and 1.0 is never produced.
 */
class RandomSource {
public:
  RandomSource() = default;
  RandomSource(const RandomSource& other) = delete;
  RandomSource& operator=(const RandomSource& other) = delete;
  RandomSource(RandomSource&& other) = delete;
  RandomSource& operator=(RandomSource&& other) = delete;
  virtual ~RandomSource() = default;

  virtual std::uint64_t next_u64() = 0;

  virtual double next_double() {
    return static_cast<double>(next_u64() >> 11) * 0x1.0p-53;
  }
};

} // namespace rand
} // namespace canhaz

#endif // CANHAZ_RAND_RANDOMSOURCE_HPP
