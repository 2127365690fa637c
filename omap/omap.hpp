/**
 * MIT License
 *
 * Copyright (c) 2022 Victor Moncada <vtr.moncada@gmail.com>
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#ifndef OMAP_OMAP_HPP
#define OMAP_OMAP_HPP


/** @file */



/** \mainpage omap library: insertion ordered hash containers with positional access


Purpose
-------

The *omap* library provides hash containers that remember the insertion order of their values and give
constant time access to them by position, in addition to the usual lookup by key.

Values are stored contiguously in a std::vector, in order. A separate open addressing hash table (robin hood
probing with backward shift deletion, switching to linear probing with tombstones on pathological inputs) maps each
key to the position of its value. Iteration is therefore as fast as iterating a vector, and the values can be
reordered (sorting, reversing, moving) without touching the keys.

The library is header only and has no dependency other than the standard library.


Content
-------

The library is divided in 4 small modules:
-	\ref bits "bits": low-level bits manipulation utilities and compiler related macros
-	\ref hash "hash": hash functions and hash mixing utilities
-	\ref containers "containers": omap::ordered_map, omap::ordered_set, their entries and slices
-	\ref serialize "serialize": conversion to and from sequences of values and textual streams

The \ref testing "testing" module provides the test macros and random container generation used by the tests.

A cmake project is provided for installation and compilation of tests.

*/


#include "omap_config.hpp"
#include "ordered_map.hpp"
#include "ordered_set.hpp"
#include "serialize.hpp"

#endif
