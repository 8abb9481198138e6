// Copyright (c) 2025 canhaz authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

// Build-time settings of the command line tools.

#ifndef CANHAZ_VERSION
#define CANHAZ_VERSION 0.0 (unknown)
#endif

// Minimum length used when neither --length nor a rule file is given.
#ifndef CANHAZ_DEFAULT_LENGTH
#define CANHAZ_DEFAULT_LENGTH 8
#endif

#define CANHAZ_STRFY_INTERNAL(MACRO) #MACRO
#define CANHAZ_STRFY(MACRO) CANHAZ_STRFY_INTERNAL(MACRO)
