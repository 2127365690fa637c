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

#ifndef OMAP_SERIALIZE_HPP
#define OMAP_SERIALIZE_HPP

/** @file */

/**\defgroup serialize Serialize: conversion of ordered containers to and from sequences

The serialize module provides:
	-	omap::to_sequence and omap::from_sequence: conversion to and from a std::vector of values, in order
	-	omap::write_sequence and omap::read_sequence: textual stream format

The stream format is the number of values followed by the values in order, separated by spaces. 
Map values are written as key then mapped value. Arithmetic values use the stream operators (floating point values 
with the precision needed to read them back exactly). Strings are written as their length, a ':' and their raw characters, 
so that they may contain any character.

Building a container from a sequence (from_sequence() or read_sequence()) rebuilds the index from scratch.
Duplicate keys are collapsed: the first occurrence gives the position and the last one gives the mapped value.
*/

/** \addtogroup serialize
 *  @{
 */

#include <algorithm>
#include <istream>
#include <limits>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "ordered_map.hpp"
#include "ordered_set.hpp"

namespace omap
{
	/// @brief Tells if given type can be streamed to a std::ostream object
	template<class T, class = void>
	struct is_ostreamable : std::false_type
	{
	};
	template<class T>
	struct is_ostreamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>> : std::true_type
	{
	};

	/// @brief Tells if given type can be read from a std::istream object
	template<class T, class = void>
	struct is_istreamable : std::false_type
	{
	};
	template<class T>
	struct is_istreamable<T, std::void_t<decltype(std::declval<std::istream&>() >> std::declval<T&>())>> : std::true_type
	{
	};

	namespace detail
	{
		template<class T>
		struct is_char_type : std::integral_constant<bool, 
			std::is_same<T, char>::value || std::is_same<T, signed char>::value || std::is_same<T, unsigned char>::value>
		{
		};

		// Write/read one value of the stream format
		template<class T, class = void>
		struct SequenceValue
		{
			static_assert(is_ostreamable<T>::value && is_istreamable<T>::value, "type is not streamable");

			static void write(std::ostream& oss, const T& v) { oss << v; }
			static auto read(std::istream& iss, T& v) -> bool { return static_cast<bool>(iss >> v); }
		};

		// Characters are written as integers, so that white spaces survive
		template<class T>
		struct SequenceValue<T, typename std::enable_if<is_char_type<T>::value>::type>
		{
			static void write(std::ostream& oss, const T& v) { oss << static_cast<int>(v); }
			static auto read(std::istream& iss, T& v) -> bool 
			{ 
				int tmp = 0;
				if (!(iss >> tmp) || tmp < static_cast<int>(std::numeric_limits<T>::min()) || tmp > static_cast<int>(std::numeric_limits<T>::max()))
					return false;
				v = static_cast<T>(tmp);
				return true;
			}
		};

		template<class T>
		struct SequenceValue<T, typename std::enable_if<std::is_floating_point<T>::value>::type>
		{
			static void write(std::ostream& oss, const T& v) 
			{ 
				const std::streamsize prec = oss.precision(std::numeric_limits<T>::max_digits10);
				oss << v;
				oss.precision(prec);
			}
			static auto read(std::istream& iss, T& v) -> bool { return static_cast<bool>(iss >> v); }
		};

		template<class Traits, class Al>
		struct SequenceValue<std::basic_string<char, Traits, Al>, void>
		{
			using string_type = std::basic_string<char, Traits, Al>;

			static void write(std::ostream& oss, const string_type& v) 
			{ 
				oss << v.size() << ':';
				oss.write(v.data(), static_cast<std::streamsize>(v.size()));
			}
			static auto read(std::istream& iss, string_type& v) -> bool
			{
				size_t size = 0;
				if (!(iss >> size) || iss.get() != ':')
					return false;
				// The length is not trusted: grow the string by bounded chunks while characters are available
				string_type tmp;
				char buf[4096];
				while (size) {
					const size_t chunk = std::min<size_t>(size, sizeof(buf));
					if (!iss.read(buf, static_cast<std::streamsize>(chunk)))
						return false;
					tmp.append(buf, chunk);
					size -= chunk;
				}
				v = std::move(tmp);
				return true;
			}
		};

		template<class A, class B>
		struct SequenceValue<std::pair<A, B>, void>
		{
			static void write(std::ostream& oss, const std::pair<A, B>& v) 
			{ 
				SequenceValue<A>::write(oss, v.first);
				oss << ' ';
				SequenceValue<B>::write(oss, v.second);
			}
			static auto read(std::istream& iss, std::pair<A, B>& v) -> bool
			{
				return SequenceValue<A>::read(iss, v.first) && SequenceValue<B>::read(iss, v.second);
			}
		};
	}

	/// @brief Returns the values of an ordered_map or ordered_set in order
	template<class Container>
	auto to_sequence(const Container& c) -> std::vector<typename Container::value_type>
	{
		return std::vector<typename Container::value_type>(c.begin(), c.end());
	}

	/// @brief Build an ordered_map or ordered_set from a sequence of values.
	/// Duplicate keys keep the position of their first occurrence and the mapped value of the last one.
	template<class Container, class Sequence>
	auto from_sequence(const Sequence& seq) -> Container
	{
		return Container(std::begin(seq), std::end(seq));
	}
	template<class Container, class Sequence>
	auto from_sequence(Sequence&& seq) -> typename std::enable_if<!std::is_lvalue_reference<Sequence>::value, Container>::type
	{
		return Container(std::make_move_iterator(std::begin(seq)), std::make_move_iterator(std::end(seq)));
	}

	/// @brief Write the values of an ordered_map or ordered_set to a stream, in order
	template<class Container>
	auto write_sequence(std::ostream& oss, const Container& c) -> std::ostream&
	{
		using value_type = typename Container::value_type;
		oss << c.size();
		for (const value_type& v : c) {
			oss << ' ';
			detail::SequenceValue<value_type>::write(oss, v);
		}
		oss << '\n';
		return oss;
	}

	/// @brief Read an ordered_map or ordered_set written by write_sequence().
	/// 
	/// The content of c is replaced on success. On malformed input, the failbit of iss is set and c is left unchanged.
	/// Duplicate keys are collapsed: the first occurrence gives the position and the last one gives the mapped value.
	template<class Container>
	auto read_sequence(std::istream& iss, Container& c) -> std::istream&
	{
		using value_type = typename Container::value_type;
		size_t count = 0;
		if (!(iss >> count))
			return iss;

		std::vector<value_type> values;
		// The count is not trusted for the allocation
		values.reserve(std::min<size_t>(count, 4096U));
		for (size_t i = 0; i < count; ++i) {
			value_type v{};
			if (!detail::SequenceValue<value_type>::read(iss, v)) {
				iss.setstate(std::ios::failbit);
				return iss;
			}
			values.push_back(std::move(v));
		}
		Container tmp(std::make_move_iterator(values.begin()), std::make_move_iterator(values.end()), c.hash_function(), c.key_eq(), c.get_allocator());
		c.swap(tmp);
		return iss;
	}
}

/** @}*/
//end serialize

#endif
