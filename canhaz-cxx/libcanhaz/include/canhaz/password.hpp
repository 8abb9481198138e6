// Copyright (c) 2025 canhaz authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef CANHAZ_PASSWORD_HPP
#define CANHAZ_PASSWORD_HPP

#include "password/Characters.hpp"
#include "password/Configuration.hpp"
#include "password/Errors.hpp"
#include "password/Generator.hpp"
#include "password/Rule.hpp"

#endif // CANHAZ_PASSWORD_HPP
