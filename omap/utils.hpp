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

#ifndef OMAP_UTILS_HPP
#define OMAP_UTILS_HPP

/** @file */

/**\defgroup utils Utils: small utilities shared by omap containers

The utils module provides:
	-	omap::has_is_transparent: detect transparent hash and comparison functions
	-	omap::copy_allocator, omap::swap_allocator, omap::assign_allocator, omap::move_allocator: allocator propagation helpers
	-	omap::detail::ExtractKey: key/value extraction from stored objects
*/

/** \addtogroup utils
 *  @{
 */

#include <memory>
#include <type_traits>
#include <utility>

#include "bits.hpp"

namespace omap
{
	template<class T, class = void>
	struct has_is_transparent : std::false_type
	{
	};

	template<class T>
	struct has_is_transparent<T, std::void_t<typename T::is_transparent>> : std::true_type
	{
	};

	/// @brief Returns the allocator to be used by a copy constructed container
	template<class Allocator>
	auto copy_allocator(const Allocator& alloc) noexcept(std::is_nothrow_copy_constructible<Allocator>::value) -> Allocator
	{
		return std::allocator_traits<Allocator>::select_on_container_copy_construction(alloc);
	}

	/// @brief Swap allocators for container.swap member
	template<class Allocator>
	void swap_allocator(Allocator& left,
			    Allocator& right) noexcept(!std::allocator_traits<Allocator>::propagate_on_container_swap::value || std::allocator_traits<Allocator>::is_always_equal::value)
	{
		if constexpr (std::allocator_traits<Allocator>::propagate_on_container_swap::value) {
			std::swap(left, right);
		}
		else {
			OMAP_ASSERT_DEBUG(left == right, "containers incompatible for swap");
		}
	}

	/// @brief Assign allocator for container copy operator
	template<class Allocator>
	void assign_allocator(Allocator& left,
			      const Allocator& right) noexcept(!std::allocator_traits<Allocator>::propagate_on_container_copy_assignment::value || std::is_nothrow_copy_assignable<Allocator>::value)
	{
		if constexpr (std::allocator_traits<Allocator>::propagate_on_container_copy_assignment::value) {
			left = right;
		}
	}

	/// @brief Move allocator for container move assignment
	template<class Allocator>
	void move_allocator(Allocator& left,
			    Allocator& right) noexcept(!std::allocator_traits<Allocator>::propagate_on_container_move_assignment::value || std::is_nothrow_move_assignable<Allocator>::value)
	{
		// (maybe) propagate on container move assignment
		if constexpr (std::allocator_traits<Allocator>::propagate_on_container_move_assignment::value) {
			left = std::move(right);
		}
	}

	namespace detail
	{
		/// @brief Extract key and mapped value from a stored object of type std::pair<Key,T>
		template<class Key, class T>
		struct ExtractKey
		{
			using key_type = Key;
			using value_type = T;
			using mapped_type = typename T::second_type;
			static constexpr bool has_value = true;

			template<class U, class V>
			OMAP_ALWAYS_INLINE static auto key(const std::pair<U, V>& value) noexcept -> const U& { return value.first; }
			OMAP_ALWAYS_INLINE static auto mapped(value_type& value) noexcept -> mapped_type& { return value.second; }
			OMAP_ALWAYS_INLINE static auto mapped(const value_type& value) noexcept -> const mapped_type& { return value.second; }
		};

		/// @brief Key extraction for sets: the stored object is the key
		template<class T>
		struct ExtractKey<T, T>
		{
			using key_type = T;
			using value_type = T;
			using mapped_type = T;
			static constexpr bool has_value = false;

			OMAP_ALWAYS_INLINE static auto key(const T& value) noexcept -> const T& { return value; }
			OMAP_ALWAYS_INLINE static auto mapped(const T& value) noexcept -> const T& { return value; }
		};
	}
}

/** @}*/
//end utils

#endif
