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

#ifndef OMAP_TESTING_HPP
#define OMAP_TESTING_HPP

/** @file */

/**\defgroup testing Testing: test macros and random instance generation

The testing module provides:
	-	OMAP_TEST, OMAP_TEST_THROW, OMAP_TEST_MODULE and OMAP_TEST_MODULE_RETURN: minimal test macros
	-	omap::debug_allocator: allocator counting the allocated bytes, used to detect leaks
	-	omap::random_shuffle, omap::generate_random_string: random inputs
	-	omap::random_ordered_map, omap::random_ordered_set: random container instances built from a seed
*/

/** \addtogroup testing
 *  @{
 */

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <iostream>
#include <memory>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "bits.hpp"
#include "ordered_map.hpp"
#include "ordered_set.hpp"

namespace omap
{
	/// @brief Exception thrown for failed tests
	class test_error : public std::runtime_error
	{
	public:
		test_error(const std::string & str)
			:std::runtime_error(str) {}
	};

	/// @brief Streambuf that stores the number of outputed characters
	class streambuf_size : public std::streambuf 
	{
		std::streambuf* sbuf{ nullptr };
		std::ostream* oss{ nullptr };
		size_t size{ 0 };

		virtual int overflow(int c) override {
			size++;
			return sbuf->sputc(static_cast<char>(c));
		}
		virtual int sync() override { return sbuf->pubsync(); }
	public:
		streambuf_size(std::ostream& o) : sbuf(o.rdbuf()), oss(&o) { oss->rdbuf(this); }
		virtual ~streambuf_size() noexcept override { oss->rdbuf(sbuf); }
		size_t get_size() const { return size; }
	};

	namespace detail
	{
		template<class T>
		std::string to_string(const T& value) {
			std::ostringstream ss;
			ss << value;
			return ss.str();
		}
	}
}


/// @brief Very basic testing macro that throws omap::test_error if condition is not met.
#define OMAP_TEST( ... ) \
	if(! (__VA_ARGS__) ) {throw omap::test_error("testing error at file " __FILE__ "(" + omap::detail::to_string(__LINE__) + "): "  #__VA_ARGS__); }

/// @brief Test if given statement throws a 'exception' object. If not, throws omap::test_error.
#define OMAP_TEST_THROW(exception, ...) \
	{bool has_thrown = false;  \
	try { __VA_ARGS__; } \
	catch(const exception &) {has_thrown = true;} \
	catch(...) {} \
	if(! has_thrown ) {std::string v =omap::detail::to_string(__LINE__);  \
		throw omap::test_error(("testing error at file " __FILE__ "(" + v + "): "  #__VA_ARGS__).c_str()); } \
	}

/// @brief Test module, prints SUCCESS or the failure reason
#define OMAP_TEST_MODULE(name, ... ) \
	{ omap::streambuf_size str(std::cout); size_t size = 0; bool ok = true; \
	try { std::cout << "TEST MODULE " << #name << "... " ; std::cout.flush(); size = str.get_size(); __VA_ARGS__; } \
	catch (const omap::test_error& e) {std::cout<< std::endl; ok = false; std::cerr << "TEST FAILURE IN MODULE " << #name << ": " << e.what() << std::endl; } \
	catch (const std::exception& e) { std::cout<< std::endl; ok = false; std::cerr << "UNEXPECTED ERROR IN MODULE " << #name << " (std::exception): " << e.what() << std::endl; } \
	catch (...) { std::cout<< std::endl; ok = false;  std::cerr << "UNEXPECTED ERROR IN MODULE " << #name << std::endl; }\
	if(ok) { if(str.get_size() != size) std::cout<<std::endl; std::cout<< "SUCCESS" << std::endl; } \
	}

/// @brief Test module returning ret_value from the enclosing function on failure
#define OMAP_TEST_MODULE_RETURN(name, ret_value, ... ) \
	{ omap::streambuf_size str(std::cout); size_t size = 0; bool ok = true; \
	try { std::cout << "TEST MODULE " << #name << "... " ; std::cout.flush(); size = str.get_size(); __VA_ARGS__; } \
	catch (const omap::test_error& e) {std::cout<< std::endl; ok = false; std::cerr << "TEST FAILURE IN MODULE " << #name << ": " << e.what() << std::endl; } \
	catch (const std::exception& e) { std::cout<< std::endl; ok = false; std::cerr << "UNEXPECTED ERROR IN MODULE " << #name << " (std::exception): " << e.what() << std::endl; } \
	catch (...) { std::cout<< std::endl; ok = false;  std::cerr << "UNEXPECTED ERROR IN MODULE " << #name << std::endl; }\
	if(ok) { if(str.get_size() != size) std::cout<<std::endl; std::cout<< "SUCCESS" << std::endl; } \
	else return ret_value;\
	}


namespace omap
{
	/// @brief Similar to C++11 (and deprecated) std::random_shuffle
	template<class Iter>
	void random_shuffle(Iter begin, Iter end, uint_fast32_t seed = 0)
	{
		std::random_device rd;
		std::mt19937 g(rd());
		if (seed)
			g.seed(seed);
		std::shuffle(begin, end, g);
	}

	/// @brief For tests only, generate a random string of given max size
	template<class String, class Engine>
	auto generate_random_string(Engine& eng, int max_size, bool fixed = false) -> String
	{
		using value_type = typename String::value_type;
		const size_t size = static_cast<size_t>(fixed ? max_size : static_cast<int>(eng() % static_cast<unsigned>(max_size)));
		String res(size, 0);
		for (size_t i = 0; i < size; ++i)
			res[i] = static_cast<value_type>((eng() & 63) + 33);
		return res;
	}

	namespace detail
	{
		// Random value of type T for randomized instances
		template<class T, class = void>
		struct RandomValue
		{
			template<class Engine>
			static auto generate(Engine& eng, size_t max_value) -> T { return static_cast<T>(eng() % (max_value + 1U)); }
		};
		template<class T>
		struct RandomValue<T, typename std::enable_if<std::is_floating_point<T>::value>::type>
		{
			template<class Engine>
			static auto generate(Engine& eng, size_t max_value) -> T 
			{ 
				return std::uniform_real_distribution<T>(static_cast<T>(0), static_cast<T>(max_value))(eng);
			}
		};
		template<class Char, class Traits, class Al>
		struct RandomValue<std::basic_string<Char, Traits, Al>, void>
		{
			template<class Engine>
			static auto generate(Engine& eng, size_t max_value) -> std::basic_string<Char, Traits, Al> 
			{ 
				return generate_random_string<std::basic_string<Char, Traits, Al> >(eng, static_cast<int>(std::max<size_t>(max_value, 1U) % 32U + 1U));
			}
		};
	}

	/// @brief For property tests only, build an arbitrary ordered_map from a seed.
	/// The map holds at most max_size values, keys are drawn in [0, key_range] (or are random strings), so that duplicates occur.
	template<class Map>
	auto random_ordered_map(std::uint64_t seed, size_t max_size, size_t key_range = 1000) -> Map
	{
		using key_type = typename Map::key_type;
		using mapped_type = typename Map::mapped_type;
		std::mt19937_64 eng(seed);
		const size_t count = max_size ? static_cast<size_t>(eng() % (max_size + 1U)) : 0U;
		Map res;
		for (size_t i = 0; i < count; ++i) {
			key_type k = detail::RandomValue<key_type>::generate(eng, key_range);
			mapped_type v = detail::RandomValue<mapped_type>::generate(eng, key_range);
			res.insert_or_assign(std::move(k), std::move(v));
		}
		return res;
	}

	/// @brief For property tests only, build an arbitrary ordered_set from a seed
	template<class Set>
	auto random_ordered_set(std::uint64_t seed, size_t max_size, size_t key_range = 1000) -> Set
	{
		using key_type = typename Set::key_type;
		std::mt19937_64 eng(seed);
		const size_t count = max_size ? static_cast<size_t>(eng() % (max_size + 1U)) : 0U;
		Set res;
		for (size_t i = 0; i < count; ++i)
			res.insert(detail::RandomValue<key_type>::generate(eng, key_range));
		return res;
	}


	/// @brief Allocator counting the bytes currently allocated through all its copies
	template<class T>
	struct debug_allocator
	{
		typedef T value_type;
		typedef T* pointer;
		typedef const T* const_pointer;
		typedef T& reference;
		typedef const T& const_reference;
		using size_type = size_t;
		using difference_type = ptrdiff_t;
		using is_always_equal = std::false_type;
		using propagate_on_container_swap = std::true_type;
		using propagate_on_container_copy_assignment = std::true_type;
		using propagate_on_container_move_assignment = std::true_type;

		template <class Other>
		struct rebind {
			using other = debug_allocator<Other>;
		};

		std::shared_ptr<std::atomic<std::int64_t> > d_count;

		debug_allocator() :d_count(new std::atomic<std::int64_t>(0)) {}
		debug_allocator(const debug_allocator& other)
			:d_count(other.d_count) {}
		template <class Other>
		debug_allocator(const debug_allocator<Other>& other)
			: d_count(other.d_count) {}
		~debug_allocator() {}
		debug_allocator& operator=(const debug_allocator& other) {
			d_count = other.d_count;
			return *this;
		}

		bool operator==(const debug_allocator& other) const { return d_count == other.d_count; }
		bool operator!=(const debug_allocator& other) const { return d_count != other.d_count; }

		void deallocate(T* p, const size_t count) {
			std::allocator<T>{}.deallocate(p, count);
			(*d_count) -= static_cast<std::int64_t>(count * sizeof(T));
			OMAP_ASSERT_DEBUG(*d_count >= 0, "");
		}
		T* allocate(const size_t count) {
			T* p = std::allocator<T>{}.allocate(count);
			(*d_count) += static_cast<std::int64_t>(count * sizeof(T));
			return p;
		}
		size_t max_size() const noexcept { return static_cast<size_t>(-1) / sizeof(T); }
	};

	template<class T>
	std::int64_t get_alloc_bytes(const debug_allocator<T>& al)
	{
		return *al.d_count;
	}
}

/** @}*/
//end testing

#endif
