// Copyright (c) 2025 canhaz authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef CANHAZ_RAND_WEIGHTEDRANDOMSET_HPP
#define CANHAZ_RAND_WEIGHTEDRANDOMSET_HPP

#include "../util/log.hpp"
#include "CryptoRandomSource.hpp"
#include "IntervalIndex.hpp"
#include "RandomSource.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>
#include <vector>

namespace canhaz {
namespace rand {

struct WeightedRandomEntry {
  char32_t character;
  double weight;
};

/*
 * Weighted random set that selects characters in a non-uniformly
 * distributed fashion, typically weighted to match the desired composition
 * of a generated password.
 *
 * Every entry is given the interval [total, total + weight) of an interval
 * index, where total is the sum of the weights inserted before it. The
 * intervals are adjacent and cover [0, total_weight) without gaps, so a
 * uniform value in that range falls into exactly one of them, with
 * probability equal to the width of the interval over the total width.
 * Insertion order does not change the distribution.
 *
 * The set takes ownership of its random source. It is immutable after
 * construction; next() only consumes entropy.
 */
class WeightedRandomSet {
private:
  RandomSource* source_;
  IntervalIndex index_{};
  // The character associated with each interval of the index.
  std::vector<char32_t> characters_{};
  // Sorted characters with a non-zero probability of being selected.
  std::vector<char32_t> reachable_{};
  // Fallback for draws that land on or beyond total_weight.
  size_t last_{};

public:
  explicit WeightedRandomSet(const std::vector<WeightedRandomEntry>& entries, RandomSource* source = new CryptoRandomSource())
      : source_(source) {
    try {
      if (entries.empty()) {
        throw std::invalid_argument("weighted random set needs at least one entry");
      }

      index_.reserve(entries.size());
      characters_.reserve(entries.size());
      for (const auto& entry : entries) {
        if (!std::isfinite(entry.weight) || entry.weight < 0.0) {
          throw std::invalid_argument(std::format("invalid weight {} for character U+{:04X}", entry.weight, static_cast<unsigned>(entry.character)));
        }
        size_t idx = index_.append(entry.weight);
        characters_.push_back(entry.character);
        if (index_.width(idx) > 0.0) {
          last_ = idx;
          reachable_.push_back(entry.character);
        }
      }

      if (!(index_.total() > 0.0)) {
        throw std::invalid_argument("total weight of a weighted random set must be positive");
      }

      std::sort(reachable_.begin(), reachable_.end());
      reachable_.erase(std::unique(reachable_.begin(), reachable_.end()), reachable_.end());
    } catch (...) {
      // The destructor does not run for a partially constructed set.
      delete source_;
      throw;
    }
  }

  WeightedRandomSet(const WeightedRandomSet& other) = delete;
  WeightedRandomSet& operator=(const WeightedRandomSet& other) = delete;
  WeightedRandomSet(WeightedRandomSet&& other) = delete;
  WeightedRandomSet& operator=(WeightedRandomSet&& other) = delete;
  ~WeightedRandomSet() { delete source_; }

  // Returns the next character of the weighted random sequence.
  char32_t next() {
    // Scale a uniform [0, 1) value into 0 <= x < total_weight.
    double x = source_->next_double() * index_.total();

    auto idx = index_.including(x);
    if (!idx) {
      // Rounding of the product (or a source breaking the [0, 1) contract)
      // can put x on the upper edge of the axis.
      CANHAZ_LOG_TRACE("draw {} outside of [0, {}), using the last interval", x, index_.total());
      return characters_[last_];
    }
    return characters_[*idx];
  }

  double total_weight() const noexcept { return index_.total(); }
  size_t size() const noexcept { return characters_.size(); }

  bool contains(char32_t character) const {
    return std::binary_search(reachable_.begin(), reachable_.end(), character);
  }
};

} // namespace rand
} // namespace canhaz

#endif // CANHAZ_RAND_WEIGHTEDRANDOMSET_HPP
