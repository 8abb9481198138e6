// Copyright (c) 2025 canhaz authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef CANHAZ_TOOL_HPP
#define CANHAZ_TOOL_HPP

#include "tool/DemoRule.hpp"
#include "tool/GeneratorTool.hpp"
#include "tool/JsonRule.hpp"
#include "tool/JsonRuleLoader.hpp"

#endif // CANHAZ_TOOL_HPP
