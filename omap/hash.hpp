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

#ifndef OMAP_HASH_HPP
#define OMAP_HASH_HPP

/** @file */

/**\defgroup hash Hash: small collection of hash utilities

The hash module provides the hash-related functions used by omap containers:
	-	omap::hasher: default hash function of omap containers
	-	omap::hash_finalize: mix a hash value
	-	omap::hash_combine: combine 2 hash values
	-	omap::hash_value: hash a value, mixing the result of non avalanching hash functions
	-	omap::hash_sequence: order sensitive hash of a range of values
*/

/** \addtogroup hash
 *  @{
 */

#include "bits.hpp"
#include <string>
#include <type_traits>
#include <tuple>
#include <utility>
#include <memory>
#include <iterator>

namespace omap
{

	/// @brief Detect is_avalanching typedef 
	template <typename T>
	struct hash_is_avalanching {
	private:
		template <typename T1>
		static typename T1::is_avalanching test(int);
		template <typename>
		static void test(...);
	public:
		enum { value = !std::is_void<decltype(test<T>(0))>::value };
	};

	namespace detail
	{
		OMAP_ALWAYS_INLINE std::uint64_t Mixin64(std::uint64_t a) noexcept
		{
			a ^= a >> 23;
			a *= 0x2127599bf4325c37ULL;
			a ^= a >> 47;
			return a;
		}

		template<class Hash, bool avalanching = hash_is_avalanching<Hash>::value>
		struct HashVal
		{
			template<class T>
			static OMAP_ALWAYS_INLINE size_t hash(const Hash& h, const T& v) noexcept(noexcept(std::declval<Hash&>()(std::declval<T&>())))
			{
				return h(v);
			}
		};
		template<class Hash>
		struct HashVal<Hash,false>
		{
			template<class T>
			static OMAP_ALWAYS_INLINE size_t hash(const Hash& h, const T& v) noexcept(noexcept(std::declval<Hash&>()(std::declval<T&>())))
			{
				return static_cast<size_t>(Mixin64(h(v)));
			}
		};
	}

	/// @brief Mix input hash value for better avalanching
	OMAP_ALWAYS_INLINE size_t hash_finalize(size_t h) noexcept
	{
		return static_cast<size_t>(detail::Mixin64(h));
	}

	/// @brief Combine 2 hash values. Uses murmurhash2 mixin.
	/// @param seed first hash value, receives the combination
	/// @param h2 second hash value
	OMAP_ALWAYS_INLINE void hash_combine(size_t & seed, size_t h2) noexcept 
	{
#ifdef OMAP_ARCH_64
		static constexpr std::uint64_t m = 14313749767032793493ULL;
		static constexpr std::uint64_t r = 47ULL;

		h2 *= m;
		h2 ^= h2 >> r;
		h2 *= m;

		seed ^= h2;
		seed *= m;
#else
		seed ^= h2 + 0x9e3779b9 + (seed << 6) + (seed >> 2);
#endif
	}

	/// @brief Hash value v using provided hasher.
	/// Mix the result if Hasher does not provide the is_avalanching typedef.
	template<class Hasher, class T>
	OMAP_ALWAYS_INLINE size_t hash_value(const Hasher& h, const T& v)  noexcept(noexcept(std::declval<Hasher&>()(std::declval<T&>())))
	{
		return detail::HashVal<Hasher>::hash(h, v);
	}


	template<class T, class Enable = void>
	struct hasher : public std::hash<T>
	{
		OMAP_ALWAYS_INLINE size_t operator()(const T& v) const noexcept(noexcept(std::declval<std::hash<T>&>()(std::declval<T&>()))) {
			return (std::hash<T>::operator()(v));
		}
	};

#define _OMAP_INTEGRAL_HASH_FUNCTION(T) \
	template<> struct hasher <T> { \
		using is_avalanching = int;\
		OMAP_ALWAYS_INLINE size_t operator()(T v) const noexcept {return hash_finalize(static_cast<size_t>(v));} \
	}

	_OMAP_INTEGRAL_HASH_FUNCTION(bool);
	_OMAP_INTEGRAL_HASH_FUNCTION(char);
	_OMAP_INTEGRAL_HASH_FUNCTION(signed char);
	_OMAP_INTEGRAL_HASH_FUNCTION(unsigned char);
	_OMAP_INTEGRAL_HASH_FUNCTION(short);
	_OMAP_INTEGRAL_HASH_FUNCTION(unsigned short);
	_OMAP_INTEGRAL_HASH_FUNCTION(int);
	_OMAP_INTEGRAL_HASH_FUNCTION(unsigned int);
	_OMAP_INTEGRAL_HASH_FUNCTION(long);
	_OMAP_INTEGRAL_HASH_FUNCTION(unsigned long);
	_OMAP_INTEGRAL_HASH_FUNCTION(long long);
	_OMAP_INTEGRAL_HASH_FUNCTION(unsigned long long);
	_OMAP_INTEGRAL_HASH_FUNCTION(wchar_t);
	_OMAP_INTEGRAL_HASH_FUNCTION(char16_t);
	_OMAP_INTEGRAL_HASH_FUNCTION(char32_t);

#undef _OMAP_INTEGRAL_HASH_FUNCTION

	template <class T>
	struct hasher<T*> {
		using is_avalanching = int;
		OMAP_ALWAYS_INLINE size_t operator()(T* ptr) const noexcept {
			return hash_finalize(reinterpret_cast<std::uintptr_t>(ptr));
		}
	};

	template <typename Enum>
	struct hasher<Enum, typename std::enable_if<std::is_enum<Enum>::value,void>::type> {
		using is_avalanching = int;
		OMAP_ALWAYS_INLINE size_t operator()(Enum e) const noexcept {
			using Underlying = typename std::underlying_type<Enum>::type;
			return hasher<Underlying>{}(static_cast<Underlying>(e));
		}
	};

	template <class A, class B>
	struct hasher<std::pair<A,B>> {
		using is_avalanching = int;
		OMAP_ALWAYS_INLINE size_t operator()(const std::pair<A, B> & p) const noexcept {
			size_t s = hasher<A>{}(p.first);
			hash_combine(s  , hasher<B>{}(p.second));
			return s;
		}
	};

	/// @brief Order sensitive hash of the range [first, last).
	/// The number of elements seeds the result, so that a range and one of its prefixes hash differently.
	template<class Iter, class Hasher = hasher<typename std::iterator_traits<Iter>::value_type> >
	auto hash_sequence(Iter first, Iter last, const Hasher& h = Hasher()) -> size_t
	{
		size_t seed = hash_finalize(static_cast<size_t>(std::distance(first, last)));
		for (; first != last; ++first)
			hash_combine(seed, hash_value(h, *first));
		return seed;
	}
}

/** @}*/
//end hash

#endif
