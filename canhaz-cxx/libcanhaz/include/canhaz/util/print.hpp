// Copyright (c) 2025 canhaz authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef CANHAZ_UTIL_PRINT_HPP
#define CANHAZ_UTIL_PRINT_HPP

#include <format>
#include <iostream>
#include <ostream>
#include <string_view>
#include <utility>

namespace canhaz {
namespace util {

template<typename Arg>
void write(std::ostream& out, Arg&& arg) {
  out << arg << std::endl;
}

template<typename... Args>
void writef(std::ostream& out, std::string_view fmt, Args&&... args) {
  out << std::vformat(fmt, std::make_format_args(args...)) << std::endl;
}

template<typename Arg>
void pout(Arg&& arg) {
  write(std::cout, std::forward<Arg>(arg));
}

template<typename... Args>
void poutf(std::string_view fmt, Args&&... args) {
  writef(std::cout, fmt, args...);
}

template<typename Arg>
void perr(Arg&& arg) {
  write(std::cerr, std::forward<Arg>(arg));
}

template<typename... Args>
void perrf(std::string_view fmt, Args&&... args) {
  writef(std::cerr, fmt, args...);
}

} // namespace util
} // namespace canhaz

#endif  // CANHAZ_UTIL_PRINT_HPP
