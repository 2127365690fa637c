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

#ifndef OMAP_HASH_UTILS_HPP
#define OMAP_HASH_UTILS_HPP

 /** @file */

#include <utility>
#include "../hash.hpp"

namespace omap
{
	namespace detail
	{
		/// @brief Stores the hash function and the key comparison of a table as private bases.
		/// hash_key() mixes the result of non avalanching hash functions.
		template< class Hash, class Equal >
		struct HashEqual : private Hash, private Equal
		{
			HashEqual() = default;
			HashEqual(const Hash& h, const Equal& e) : Hash(h), Equal(e) {}

			void swap_hash_equal(HashEqual& other)
			{
				using std::swap;
				swap(static_cast<Hash&>(*this), static_cast<Hash&>(other));
				swap(static_cast<Equal&>(*this), static_cast<Equal&>(other));
			}

			auto hash_function() const noexcept -> const Hash& { return *this; }
			auto key_eq() const noexcept -> const Equal& { return *this; }

			template< class K >
			OMAP_ALWAYS_INLINE auto hash_key(const K& key) const -> size_t
			{
				return hash_value(hash_function(), key);
			}
			template< class K1, class K2 >
			OMAP_ALWAYS_INLINE bool equal_keys(const K1& k1, const K2& k2) const
			{
				return Equal::operator()(k1, k2);
			}
		};
	}
}

#endif
