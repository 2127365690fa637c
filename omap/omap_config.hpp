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

#ifndef OMAP_CONFIG_HPP
#define OMAP_CONFIG_HPP

/** @file */

/// Default configuration of the omap library.
/// All tunables can be overridden by defining them before including any omap header.

#define OMAP_VERSION_MAJOR 1
#define OMAP_VERSION_MINOR 0
#define OMAP_VERSION_PATCH 0
#define OMAP_VERSION "1.0.0"

// Default maximum load factor of the position index
#ifndef OMAP_DEFAULT_LOAD_FACTOR
#define OMAP_DEFAULT_LOAD_FACTOR 0.6f
#endif

// Minimum number of buckets allocated by the position index
#ifndef OMAP_MIN_BUCKET_COUNT
#define OMAP_MIN_BUCKET_COUNT 64
#endif

// Maximum probe distance tolerated before growing the position index even if the load factor allows more insertions
#ifndef OMAP_GROW_DISTANCE
#define OMAP_GROW_DISTANCE 7
#endif

// Debug mode follows NDEBUG unless explicitly requested
#ifndef OMAP_DEBUG
#ifndef NDEBUG
#define OMAP_DEBUG
#endif
#endif

#endif
