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

#ifndef OMAP_BITS_HPP
#define OMAP_BITS_HPP

/** @file */

/**\defgroup bits Bits: portable compiler macros and low level bits manipulation.

The bits module provides the compiler abstraction macros used by the library and:
	-	omap::bit_scan_reverse_64: index of the highest set bit in a 64 bits word
	-	omap::next_power_of_2: smallest power of 2 greater or equal to a value
*/

/** \addtogroup bits
 *  @{
 */

#include <cstdint>
#include <cstddef>
#include <cassert>

#include "omap_config.hpp"

#ifdef _MSC_VER
#include <intrin.h>
#endif

// Find 32/64 bits
#if defined(__x86_64__) || defined(__ppc64__) || defined(_WIN64) || defined(__aarch64__)
#define OMAP_ARCH_64
#else
#define OMAP_ARCH_32
#endif

// likely/unlikely definition
#if !defined( _MSC_VER) || defined(__clang__)
#define OMAP_LIKELY(x)    __builtin_expect (!!(x), 1)
#define OMAP_UNLIKELY(x)  __builtin_expect (!!(x), 0)
#else
#define OMAP_LIKELY(x) x
#define OMAP_UNLIKELY(x) x
#endif

// Strongest available function inlining
#if (defined(__GNUC__) && (__GNUC__>=4)) || defined(__clang__)
#define OMAP_ALWAYS_INLINE __attribute__((always_inline)) inline
#elif (defined _MSC_VER) || (defined __INTEL_COMPILER)
#define OMAP_ALWAYS_INLINE __forceinline
#else
#define OMAP_ALWAYS_INLINE inline
#endif

// Debug assertion
#ifndef OMAP_DEBUG
#define OMAP_ASSERT_DEBUG(condition, msg) 
#else
#define OMAP_ASSERT_DEBUG(condition, ... )  assert((condition) && (__VA_ARGS__))
#endif

namespace omap
{
	/// @brief Returns the highest set bit index in \a bb.
	/// Developed by Kim Walisch, Mark Dickinson.
	/// Undefined if bb==0.
	OMAP_ALWAYS_INLINE auto bit_scan_reverse_64(std::uint64_t bb) noexcept -> unsigned {
#       if (defined(_MSC_VER) && defined(_WIN64) )
		unsigned long r = 0;
		_BitScanReverse64(&r, bb);
		return static_cast<unsigned>(r);
#       elif (defined(__clang__) || (defined(__GNUC__) && (__GNUC__>=3)))
		return  63 - __builtin_clzll(bb);
#       else
		unsigned r = 0;
		while (bb >>= 1)
			++r;
		return r;
#endif
	}

	/// @brief Returns the smallest power of 2 greater or equal to \a v (v must be > 0).
	OMAP_ALWAYS_INLINE auto next_power_of_2(std::uint64_t v) noexcept -> std::uint64_t {
		if ((v & (v - 1ULL)) == 0ULL)
			return v;
		return 1ULL << (1U + bit_scan_reverse_64(v));
	}
}

/** @}*/
//end bits

#endif
