// Copyright (c) 2025 canhaz authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef CANHAZ_RAND_INTERVALINDEX_HPP
#define CANHAZ_RAND_INTERVALINDEX_HPP

#include <algorithm>
#include <cstddef>
#include <optional>
#include <vector>

namespace canhaz {
namespace rand {

/*
 * Containment index over a sequence of immediately adjacent half-open
 * intervals [0, w0), [w0, w0 + w1), ... laid out along one axis.
 *
 * Only the cumulative upper bounds are stored. They are non-decreasing by
 * construction, so the interval containing a point is found with a binary
 * search for the first upper bound strictly greater than the point. This
 * gives the same O(log n) point query as an interval tree without any
 * node allocation.
 */
class IntervalIndex {
private:
  std::vector<double> uppers_{};

public:
  IntervalIndex() = default;

  // Appends an interval of the given width after the last one and returns
  // its index.
  size_t append(double width) {
    uppers_.push_back(total() + width);
    return uppers_.size() - 1;
  }

  void reserve(size_t n) { uppers_.reserve(n); }

  size_t size() const noexcept { return uppers_.size(); }
  bool empty() const noexcept { return uppers_.empty(); }
  double total() const noexcept { return uppers_.empty() ? 0.0 : uppers_.back(); }

  double lower(size_t idx) const { return idx == 0 ? 0.0 : uppers_[idx - 1]; }
  double upper(size_t idx) const { return uppers_[idx]; }
  double width(size_t idx) const { return upper(idx) - lower(idx); }

  // Index of the interval containing x, or nothing if x lies outside
  // [0, total()). Zero-width intervals never contain any point.
  std::optional<size_t> including(double x) const {
    if (!(x >= 0.0) || x >= total()) {
      return std::nullopt;
    }
    auto it = std::upper_bound(uppers_.begin(), uppers_.end(), x);
    return static_cast<size_t>(it - uppers_.begin());
  }
};

} // namespace rand
} // namespace canhaz

#endif // CANHAZ_RAND_INTERVALINDEX_HPP
