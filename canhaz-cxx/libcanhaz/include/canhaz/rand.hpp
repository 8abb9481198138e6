// Copyright (c) 2025 canhaz authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef CANHAZ_RAND_HPP
#define CANHAZ_RAND_HPP

#include "rand/CryptoRandomSource.hpp"
#include "rand/IntervalIndex.hpp"
#include "rand/RandomSource.hpp"
#include "rand/SeededRandomSource.hpp"
#include "rand/WeightedRandomSet.hpp"

#endif // CANHAZ_RAND_HPP
