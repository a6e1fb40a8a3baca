/*!
 * \file error.hpp
 * \brief Error-reporting macros used throughout Estuary
 *
 * \author - Jacob Crabill
 *           Aerospace Computing Laboratory (ACL)
 *           Aero/Astro Department. Stanford University
 *
 * \version 1.0.0
 *
 * Estuary: Discontinuous Galerkin Flow Solver in C++
 * Copyright (C) 2015 Jacob Crabill
 *
 * Estuary is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * (at your option) any later version.
 *
 * Estuary is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License along
 * with Estuary; if not, write to the Free Software Foundation, Inc.,
 * 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */
#pragma once

#include <cstdlib>
#include <execinfo.h>
#include <stdio.h>
#include <iostream>
#include <unistd.h>

//! Prints the error message and exits
#define FatalError(s) {                                             \
  printf("Fatal error '%s' at %s:%d\n",s,__FILE__,__LINE__);        \
  exit(1); }

//! Prints the error message, the stack trace, and exits
#define FatalErrorST(s) {                                           \
  void* array[10];                                                  \
  size_t size;                                                      \
  size = backtrace(array,10);                                       \
  printf("Fatal error '%s' at %s:%d\n\n",s,__FILE__,__LINE__);      \
  backtrace_symbols_fd(array, size, STDERR_FILENO);                 \
  exit(1); }
