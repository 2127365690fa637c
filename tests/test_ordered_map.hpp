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

#ifndef OMAP_TEST_ORDERED_MAP_HPP
#define OMAP_TEST_ORDERED_MAP_HPP

#include <algorithm>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "omap/testing.hpp"
#include "omap/ordered_map.hpp"
#include "tests.hpp"

namespace detail_map_test
{
	template<class Vec, class K>
	size_t ref_find(const Vec& ref, const K& k)
	{
		for (size_t i = 0; i < ref.size(); ++i)
			if (ref[i].first == k)
				return i;
		return static_cast<size_t>(-1);
	}

	template<class Vec>
	void ref_move(Vec& ref, size_t from, size_t to)
	{
		auto v = std::move(ref[from]);
		ref.erase(ref.begin() + static_cast<std::ptrdiff_t>(from));
		ref.insert(ref.begin() + static_cast<std::ptrdiff_t>(to), std::move(v));
	}

	template<class T>
	size_t as_size(const T& v) { return static_cast<size_t>(v); }
}


/// @brief Basic insertion, removal, reordering and comparison sequences
inline void test_ordered_map_scenarios()
{
	using namespace omap;
	using map_type = ordered_map<std::string, int>;
	using pair_type = std::pair<std::string, int>;
	{
		// insert, shift_remove, get_index, insert_before
		map_type m;
		OMAP_TEST(!m.insert_full("a", 1).second);
		OMAP_TEST(!m.insert_full("b", 2).second);
		OMAP_TEST(!m.insert_full("c", 3).second);
		OMAP_TEST(map_equals_sequence(m, std::vector<pair_type>{ {"a", 1}, { "b", 2 }, { "c", 3 } }));

		std::optional<int> removed = m.shift_remove("b");
		OMAP_TEST(removed && *removed == 2);
		OMAP_TEST(map_equals_sequence(m, std::vector<pair_type>{ {"a", 1}, { "c", 3 } }));
		OMAP_TEST(m.get_index(0)->first == "a" && m.get_index(0)->second == 1);
		OMAP_TEST(m.get_index(1)->first == "c" && m.get_index(1)->second == 3);
		OMAP_TEST(m.get_index(2) == nullptr);
		OMAP_TEST(!m.shift_remove("b"));

		auto inserted = m.insert_before(0, "d", 4);
		OMAP_TEST(inserted.first == 0 && !inserted.second);
		OMAP_TEST(map_equals_sequence(m, std::vector<pair_type>{ {"d", 4}, { "a", 1 }, { "c", 3 } }));
		OMAP_TEST(m.check_consistency());
	}
	{
		// swap_remove moves the last value
		map_type m;
		m.insert_full("x", 1);
		m.insert_full("y", 2);
		std::optional<int> removed = m.swap_remove("x");
		OMAP_TEST(removed && *removed == 1);
		OMAP_TEST(map_equals_sequence(m, std::vector<pair_type>{ {"y", 2} }));
		OMAP_TEST(m.get_index_of("y") == 0);
		OMAP_TEST(m.get_index_of("x") == map_type::npos);
		OMAP_TEST(m.check_consistency());
	}
	{
		// sort by key, lookups follow the new positions
		ordered_map<int, std::string> m{ {3, "c"}, { 1, "a" }, { 2, "b" } };
		m.sort_by_key([](int k, const std::string&) { return k; });
		OMAP_TEST(map_equals_sequence(m, std::vector<std::pair<int, std::string> >{ {1, "a"}, { 2, "b" }, { 3, "c" } }));
		OMAP_TEST(m.get_index_of(1) == 0);
		OMAP_TEST(m.get_index_of(2) == 1);
		OMAP_TEST(m.get_index_of(3) == 2);
		OMAP_TEST(m.at(2) == "b");
		OMAP_TEST(m.check_consistency());
	}
	{
		// inserting an existing key overwrites the value in place
		map_type m{ {"a", 1}, { "b", 2 }, { "c", 3 } };
		auto res = m.insert_full("b", 20);
		OMAP_TEST(res.first == 1 && res.second && *res.second == 2);
		OMAP_TEST(map_equals_sequence(m, std::vector<pair_type>{ {"a", 1}, { "b", 20 }, { "c", 3 } }));

		// std style insert does not overwrite, insert_or_assign does
		OMAP_TEST(!m.insert(pair_type("a", 100)).second);
		OMAP_TEST(m.at("a") == 1);
		OMAP_TEST(!m.insert_or_assign("a", 100).second);
		OMAP_TEST(m.at("a") == 100);
		OMAP_TEST(m.get_index_of("a") == 0);
	}
	{
		// construction from a sequence: first occurrence gives the position, last one gives the value
		std::vector<pair_type> v{ {"a", 1}, { "b", 2 }, { "a", 3 }, { "c", 4 }, { "b", 5 } };
		map_type m(v.begin(), v.end());
		OMAP_TEST(map_equals_sequence(m, std::vector<pair_type>{ {"a", 3}, { "b", 5 }, { "c", 4 } }));
		map_type m2{ {"a", 1}, { "a", 2 } };
		OMAP_TEST(m2.size() == 1 && m2.at("a") == 2);
		// std style range insertion keeps the existing values
		m2.insert(v.begin(), v.end());
		OMAP_TEST(map_equals_sequence(m2, std::vector<pair_type>{ {"a", 2}, { "b", 2 }, { "c", 4 } }));
		// extend is last writer wins
		m2.extend(v.begin(), v.end());
		OMAP_TEST(map_equals_sequence(m2, std::vector<pair_type>{ {"a", 3}, { "b", 5 }, { "c", 4 } }));
	}
	{
		// order sensitive equality, comparison and hashing
		map_type m1{ {"a", 1}, { "b", 2 } };
		map_type m2{ {"b", 2}, { "a", 1 } };
		OMAP_TEST(m1 != m2);
		OMAP_TEST(m2 < m1 || m1 < m2);
		m2.sort_keys();
		OMAP_TEST(m1 == m2);
		OMAP_TEST(std::hash<map_type>{}(m1) == std::hash<map_type>{}(m2));
		OMAP_TEST(!(m1 < m2) && m1 <= m2 && m1 >= m2);

		map_type m3{ {"a", 1} };
		map_type m4{ {"a", 2} };
		OMAP_TEST(m3 < m4);
		OMAP_TEST(m3 < m1);
		OMAP_TEST(m4 > m1);

		// usable as a key
		std::set<map_type> ordered{ m1, m2, m3, m4 };
		OMAP_TEST(ordered.size() == 3);
		OMAP_TEST(*ordered.begin() == m3);
		std::unordered_set<map_type> hashed{ m1, m2, m3, m4 };
		OMAP_TEST(hashed.size() == 3);
	}
}

/// @brief Moving an existing key with insert_before() and shift_insert()
inline void test_ordered_map_insert_before()
{
	using namespace omap;
	using map_type = ordered_map<std::string, int>;
	using pair_type = std::pair<std::string, int>;

	map_type m{ {"a", 0}, { "b", 1 }, { "c", 2 }, { "d", 3 }, { "e", 4 } };

	// existing key located before index ends at index - 1
	auto r = m.insert_before(3, "a", 10);
	OMAP_TEST(r.first == 2 && r.second && *r.second == 0);
	OMAP_TEST(map_equals_sequence(m, std::vector<pair_type>{ {"b", 1}, { "c", 2 }, { "a", 10 }, { "d", 3 }, { "e", 4 } }));

	// existing key located after index ends at index
	r = m.insert_before(0, "d", 20);
	OMAP_TEST(r.first == 0 && r.second && *r.second == 3);
	OMAP_TEST(map_equals_sequence(m, std::vector<pair_type>{ {"d", 20}, { "b", 1 }, { "c", 2 }, { "a", 10 }, { "e", 4 } }));

	// index == size() moves the key to the end
	r = m.insert_before(5, "b", 30);
	OMAP_TEST(r.first == 4 && r.second && *r.second == 1);
	OMAP_TEST(map_equals_sequence(m, std::vector<pair_type>{ {"d", 20}, { "c", 2 }, { "a", 10 }, { "e", 4 }, { "b", 30 } }));

	// inserting before the next value does not move the key
	r = m.insert_before(2, "c", 40);
	OMAP_TEST(r.first == 1 && r.second && *r.second == 2);
	OMAP_TEST(map_equals_sequence(m, std::vector<pair_type>{ {"d", 20}, { "c", 40 }, { "a", 10 }, { "e", 4 }, { "b", 30 } }));

	// inserting before itself does not move the key
	r = m.insert_before(2, "a", 50);
	OMAP_TEST(r.first == 2 && r.second && *r.second == 10);

	OMAP_TEST_THROW(std::out_of_range, m.insert_before(6, "z", 0));
	OMAP_TEST_THROW(std::out_of_range, m.insert_before(6, "a", 0));
	OMAP_TEST(m.size() == 5);
	OMAP_TEST(!m.contains("z"));

	r = m.insert_before(5, "z", 60);
	OMAP_TEST(r.first == 5 && !r.second);
	OMAP_TEST(map_equals_sequence(m, std::vector<pair_type>{ {"d", 20}, { "c", 40 }, { "a", 50 }, { "e", 4 }, { "b", 30 }, { "z", 60 } }));
	OMAP_TEST(m.check_consistency());

	// shift_insert moves an existing key exactly to index
	std::optional<int> old = m.shift_insert(0, "z", 70);
	OMAP_TEST(old && *old == 60);
	OMAP_TEST(map_equals_sequence(m, std::vector<pair_type>{ {"z", 70}, { "d", 20 }, { "c", 40 }, { "a", 50 }, { "e", 4 }, { "b", 30 } }));
	old = m.shift_insert(6, "q", 1);
	OMAP_TEST(!old);
	OMAP_TEST(m.get_index_of("q") == 6);
	old = m.shift_insert(2, "b", 80);
	OMAP_TEST(old && *old == 30);
	OMAP_TEST(m.get_index_of("b") == 2);
	OMAP_TEST_THROW(std::out_of_range, m.shift_insert(7, "z", 1));
	OMAP_TEST_THROW(std::out_of_range, m.shift_insert(8, "w", 1));
	OMAP_TEST(m.size() == 7);
	OMAP_TEST(m.check_consistency());

	// insert_sorted keeps a sorted map sorted
	ordered_map<int, int> sorted;
	std::vector<int> keys;
	for (int i = 0; i < 200; ++i)
		keys.push_back(i * 2);
	omap::random_shuffle(keys.begin(), keys.end(), 1);
	for (int k : keys) {
		auto res = sorted.insert_sorted(k, k);
		OMAP_TEST(!res.second);
		OMAP_TEST(sorted.at_index(res.first).first == k);
	}
	OMAP_TEST(hash_map_sorted(sorted));
	auto res = sorted.insert_sorted(100, -1);
	OMAP_TEST(res.first == 50 && res.second && *res.second == 100);
	OMAP_TEST(sorted.binary_search_keys(101) == std::make_pair(size_t(51), false));
	OMAP_TEST(sorted.binary_search_keys(102) == std::make_pair(size_t(51), true));
	OMAP_TEST(sorted.binary_search_by([](const std::pair<int, int>& v) { return v.first < 7 ? -1 : (v.first > 7 ? 1 : 0); }).first == 4);
	OMAP_TEST(sorted.partition_point([](const std::pair<int, int>& v) { return v.first < 300; }) == 150);
	// descending order
	ordered_map<int, int> desc;
	for (int k : keys)
		desc.insert_sorted(k, k, std::greater<>());
	OMAP_TEST(desc.first()->first == 398 && desc.last()->first == 0);
	OMAP_TEST(desc.check_consistency());

	// insert_sorted_by compares whole values, binary_search_by_key searches a derived key
	ordered_map<int, int> by_value;
	for (int k : keys)
		by_value.insert_sorted_by(k, -k, [](const std::pair<int, int>& a, const std::pair<int, int>& b) { return a.second < b.second; });
	OMAP_TEST(by_value.first()->first == 398 && by_value.last()->first == 0);
	auto prev = by_value.insert_sorted_by(10, 5, [](const std::pair<int, int>& a, const std::pair<int, int>& b) { return a.second < b.second; });
	OMAP_TEST(prev.first == 194 && prev.second && *prev.second == -10);
	OMAP_TEST(by_value.at(10) == 5 && by_value.get_index_of(10) == 194);
	OMAP_TEST(by_value.check_consistency());
	OMAP_TEST(sorted.binary_search_by_key(51, [](int k, int) { return k / 2; }) == std::make_pair(size_t(51), true));
	OMAP_TEST(sorted.binary_search_by_key(401, [](int k, int) { return k; }) == std::make_pair(size_t(200), false));
	OMAP_TEST(sorted.binary_search_by_key(-3, [](int k, int) { return k; }) == std::make_pair(size_t(0), false));
}

/// @brief Entry handles
inline void test_ordered_map_entry()
{
	using namespace omap;
	using map_type = ordered_map<std::string, int>;
	using pair_type = std::pair<std::string, int>;

	map_type m;
	OMAP_TEST(m.entry("a").or_insert(1) == 1);
	OMAP_TEST(m.entry("a").or_insert(2) == 1);
	OMAP_TEST(m.entry("a").and_modify([](int& v) { v += 10; }).or_insert(0) == 11);
	OMAP_TEST(m.entry("b").and_modify([](int& v) { v += 10; }).or_insert(5) == 5);
	OMAP_TEST(m.entry("c").or_insert_with([]() { return 7; }) == 7);
	OMAP_TEST(m.entry("dd").or_insert_with_key([](const std::string& k) { return static_cast<int>(k.size()); }) == 2);
	OMAP_TEST(m.entry("e").or_default() == 0);
	m.entry("e").or_default() = 6;
	OMAP_TEST(map_equals_sequence(m, std::vector<pair_type>{ {"a", 11}, { "b", 5 }, { "c", 7 }, { "dd", 2 }, { "e", 6 } }));

	{
		map_type::entry_type e = m.entry("a");
		OMAP_TEST(e.occupied() && !e.vacant());
		OMAP_TEST(e.index() == 0);
		OMAP_TEST(e.key() == "a");
		OMAP_TEST(e.get() == 11);
		OMAP_TEST(e.remove() == 11);
		OMAP_TEST(!e.occupied() && !e.vacant());
		OMAP_TEST_THROW(std::logic_error, e.get());
		OMAP_TEST_THROW(std::logic_error, e.or_insert(1));
	}
	OMAP_TEST(map_equals_sequence(m, std::vector<pair_type>{ {"b", 5}, { "c", 7 }, { "dd", 2 }, { "e", 6 } }));
	{
		map_type::entry_type e = m.entry("x");
		OMAP_TEST(e.vacant());
		OMAP_TEST(e.index() == 4);
		OMAP_TEST(e.key() == "x");
		OMAP_TEST_THROW(std::logic_error, e.get());
		OMAP_TEST_THROW(std::logic_error, e.remove());
		OMAP_TEST_THROW(std::logic_error, e.move_index(0));
		OMAP_TEST(e.insert(9) == 9);
		OMAP_TEST(e.occupied() && e.index() == 4 && e.get() == 9);
		e.get() = 10;
		OMAP_TEST(m.at("x") == 10);
	}
	// insert on an occupied entry assigns the value in place
	OMAP_TEST(m.entry("b").insert(50) == 50);
	OMAP_TEST(m.get_index_of("b") == 0);
	// swap removal through the entry
	OMAP_TEST(m.entry("b").swap_remove() == 50);
	OMAP_TEST(map_equals_sequence(m, std::vector<pair_type>{ {"x", 10}, { "c", 7 }, { "dd", 2 }, { "e", 6 } }));
	// positional insertion of a vacant entry
	OMAP_TEST(m.entry("new").shift_insert(1, 3).index() == 1);
	OMAP_TEST_THROW(std::logic_error, m.entry("c").shift_insert(0, 1));
	OMAP_TEST_THROW(std::out_of_range, m.entry("w").shift_insert(10, 1));
	OMAP_TEST(map_equals_sequence(m, std::vector<pair_type>{ {"x", 10}, { "new", 3 }, { "c", 7 }, { "dd", 2 }, { "e", 6 } }));
	{
		map_type::entry_type e = m.entry("x");
		e.move_index(4);
		OMAP_TEST(e.index() == 4 && e.get() == 10);
		e.swap_indices(0);
		OMAP_TEST(e.index() == 0);
		OMAP_TEST(map_equals_sequence(m, std::vector<pair_type>{ {"x", 10}, { "c", 7 }, { "dd", 2 }, { "e", 6 }, { "new", 3 } }));
		pair_type p = e.remove_entry();
		OMAP_TEST(p.first == "x" && p.second == 10);
	}
	OMAP_TEST(map_equals_sequence(m, std::vector<pair_type>{ {"c", 7}, { "dd", 2 }, { "e", 6 }, { "new", 3 } }));
	OMAP_TEST(m.check_consistency());

	// sorted insertion through an entry
	ordered_map<int, int> sorted{ {0, 0}, { 2, 2 }, { 4, 4 } };
	OMAP_TEST(sorted.entry(3).insert_sorted(30).index() == 2);
	OMAP_TEST(sorted.entry(-1).insert_sorted(-10).index() == 0);
	OMAP_TEST(map_equals_sequence(sorted, std::vector<std::pair<int, int> >{ {-1, -10}, { 0, 0 }, { 2, 2 }, { 3, 30 }, { 4, 4 } }));
	ordered_map<int, int> desc{ {4, 4}, { 2, 2 }, { 0, 0 } };
	OMAP_TEST(desc.entry(3).insert_sorted_by(std::greater<>(), 30).index() == 1);
	OMAP_TEST(desc.entry(5).insert_sorted_by(std::greater<>(), 50).index() == 0);
	OMAP_TEST(desc.entry(-1).insert_sorted_by(std::greater<>(), -10).index() == 5);
	OMAP_TEST_THROW(std::logic_error, desc.entry(2).insert_sorted_by(std::greater<>(), 1));
	OMAP_TEST(map_equals_sequence(desc, std::vector<std::pair<int, int> >{ {5, 50}, { 4, 4 }, { 3, 30 }, { 2, 2 }, { 0, 0 }, { -1, -10 } }));
	OMAP_TEST(desc.check_consistency());

	// indexed entries
	{
		map_type::indexed_entry_type e = m.get_index_entry(3);
		OMAP_TEST(e.key() == "new" && e.index() == 3 && e.get() == 3);
		OMAP_TEST(e.insert(100) == 3);
		OMAP_TEST(m.at("new") == 100);
		e.move_index(0);
		OMAP_TEST(m.get_index_of("new") == 0 && e.index() == 0);
		e.swap_indices(3);
		OMAP_TEST(m.get_index_of("new") == 3);
		OMAP_TEST(map_equals_sequence(m, std::vector<pair_type>{ {"e", 6}, { "c", 7 }, { "dd", 2 }, { "new", 100 } }));
		OMAP_TEST(e.shift_remove() == 100);
		OMAP_TEST_THROW(std::logic_error, e.get());
	}
	OMAP_TEST_THROW(std::out_of_range, m.get_index_entry(3));
	OMAP_TEST(m.get_index_entry(0).swap_remove() == 6);
	OMAP_TEST(map_equals_sequence(m, std::vector<pair_type>{ {"dd", 2}, { "c", 7 } }));
	OMAP_TEST(m.check_consistency());
}

/// @brief Positional access and slices
inline void test_ordered_map_positional()
{
	using namespace omap;
	using map_type = ordered_map<int, int>;
	using pair_type = std::pair<int, int>;

	map_type m;
	OMAP_TEST(m.first() == nullptr && m.last() == nullptr);
	OMAP_TEST(!m.pop());
	OMAP_TEST_THROW(std::out_of_range, m.at_index(0));
	OMAP_TEST_THROW(std::out_of_range, m.at(0));
	OMAP_TEST(m.as_slice().empty());

	for (int i = 0; i < 10; ++i)
		m.insert_full(9 - i, i);
	// keys 9..0, values 0..9
	OMAP_TEST(m.first()->first == 9 && m.last()->first == 0);
	OMAP_TEST(m.at_index(3).first == 6);
	OMAP_TEST(m.nth(3)->first == 6);
	OMAP_TEST(m.index_of(m.find(6)) == 3);
	OMAP_TEST_THROW(std::out_of_range, m.at_index(10));
	m.at_index(3).second = 30;
	OMAP_TEST(m.at(6) == 30);

	// reverse iteration
	std::vector<int> rkeys;
	for (auto it = m.rbegin(); it != m.rend(); ++it)
		rkeys.push_back(it->first);
	OMAP_TEST(rkeys == std::vector<int>({ 0, 1, 2, 3, 4, 5, 6, 7, 8, 9 }));

	{
		map_type::slice_type s = m.get_range(2, 6);
		OMAP_TEST(s.size() == 4 && !s.empty());
		OMAP_TEST(s[0].first == 7 && s.at(3).first == 4);
		OMAP_TEST(s.key(1) == 6 && s.value(1) == 30);
		OMAP_TEST(s.first()->first == 7 && s.last()->first == 4);
		OMAP_TEST(s.get_index(4) == nullptr);
		OMAP_TEST_THROW(std::out_of_range, s.at(4));
		OMAP_TEST_THROW(std::out_of_range, s.get_range(3, 5));
		OMAP_TEST(s.get_range(1, 3).size() == 2 && s.get_range(1, 3)[0].first == 6);

		// mutation of the values through the slice
		s.value(0) = 70;
		OMAP_TEST(m.at(7) == 70);

		std::vector<int> keys;
		for (const pair_type& p : s)
			keys.push_back(p.first);
		OMAP_TEST(keys == std::vector<int>({ 7, 6, 5, 4 }));
		keys.clear();
		for (auto it = s.rbegin(); it != s.rend(); ++it)
			keys.push_back(it->first);
		OMAP_TEST(keys == std::vector<int>({ 4, 5, 6, 7 }));

		// sort a sub-range: only this range is reordered
		s.sort_keys();
		OMAP_TEST(map_equals_sequence(m, std::vector<pair_type>{ {9, 0}, { 8, 1 }, { 4, 5 }, { 5, 4 }, { 6, 30 }, { 7, 70 }, { 3, 6 }, { 2, 7 }, { 1, 8 }, { 0, 9 } }));
		OMAP_TEST(m.check_consistency());
		OMAP_TEST(s.binary_search_keys(6) == std::make_pair(size_t(2), true));
		OMAP_TEST(s.binary_search_keys(10) == std::make_pair(size_t(4), false));
		OMAP_TEST(s.partition_point([](const pair_type& p) { return p.first < 6; }) == 2);

		s.reverse();
		OMAP_TEST(m.get_index_of(7) == 2 && m.get_index_of(4) == 5);
		s.sort_by([](const pair_type& a, const pair_type& b) { return a.second < b.second; });
		OMAP_TEST(m.get_index_of(5) == 2 && m.get_index_of(7) == 5);
		s.sort_unstable_by([](const pair_type& a, const pair_type& b) { return a.first > b.first; });
		OMAP_TEST(m.get_index_of(7) == 2 && m.get_index_of(4) == 5);
		s.sort_by_key([](const pair_type& p) { return p.first; });
		OMAP_TEST(m.get_index_of(4) == 2 && m.get_index_of(7) == 5);
		OMAP_TEST(m.check_consistency());

		// const slices and comparison
		map_type::const_slice_type cs = s;
		OMAP_TEST(cs == s);
		OMAP_TEST(m.get_range(2, 4) < m.get_range(0, 2));
		OMAP_TEST(m.get_range(0, 2) != m.get_range(1, 3));
		const map_type& cm = m;
		OMAP_TEST(cm.as_slice().size() == 10);
		OMAP_TEST(cm.get_range(0, 1)[0].first == 9);
	}
	OMAP_TEST_THROW(std::out_of_range, m.get_range(3, 2));
	OMAP_TEST_THROW(std::out_of_range, m.get_range(0, 11));

	// whole map reordering
	m.reverse();
	OMAP_TEST(m.first()->first == 0 && m.last()->first == 9);
	m.move_index(0, 9);
	OMAP_TEST(m.last()->first == 0 && m.first()->first == 1);
	m.move_index(9, 0);
	OMAP_TEST(m.first()->first == 0);
	m.swap_indices(0, 9);
	OMAP_TEST(m.first()->first == 9 && m.last()->first == 0);
	OMAP_TEST_THROW(std::out_of_range, m.move_index(0, 10));
	OMAP_TEST_THROW(std::out_of_range, m.swap_indices(10, 0));
	OMAP_TEST(m.check_consistency());
	m.sort_unstable_keys();
	OMAP_TEST(hash_map_sorted(m));
	m.sort_by([](const pair_type& a, const pair_type& b) { return a.first > b.first; });
	OMAP_TEST(m.first()->first == 9);
	m.sort_by_cached_key([](int k, int) { return std::to_string(k); });
	OMAP_TEST(m.first()->first == 0 && m.last()->first == 9);
	m.sort_unstable_by([](const pair_type& a, const pair_type& b) { return a.first < b.first; });
	OMAP_TEST(hash_map_sorted(m));
	OMAP_TEST(m.check_consistency());

	// removals by position
	std::optional<pair_type> p = m.shift_remove_index(0);
	OMAP_TEST(p && p->first == 0);
	p = m.swap_remove_index(0);
	OMAP_TEST(p && p->first == 1);
	OMAP_TEST(m.first()->first == 9);
	OMAP_TEST(!m.shift_remove_index(8) && !m.swap_remove_index(8));
	p = m.pop();
	OMAP_TEST(p && p->first == 8);
	m.truncate(5);
	OMAP_TEST(m.size() == 5);
	m.truncate(10);
	OMAP_TEST(m.size() == 5);
	// 9, 2, 3, 4, 5
	auto drained = m.drain(1, 3);
	OMAP_TEST(drained.size() == 2 && drained[0].first == 2 && drained[1].first == 3);
	OMAP_TEST_THROW(std::out_of_range, m.drain(2, 4));
	map_type tail = m.split_off(1);
	OMAP_TEST(map_equals_sequence(tail, std::vector<pair_type>{ {4, 5}, { 5, 4 } }));
	OMAP_TEST(m.size() == 1 && m.first()->first == 9);
	OMAP_TEST_THROW(std::out_of_range, m.split_off(2));
	OMAP_TEST(m.check_consistency() && tail.check_consistency());

	// erase by iterator and range
	map_type e{ {1, 1}, { 2, 2 }, { 3, 3 }, { 4, 4 }, { 5, 5 } };
	auto it = e.erase(e.find(2));
	OMAP_TEST(it->first == 3);
	it = e.erase(e.begin() + 1, e.begin() + 3);
	OMAP_TEST(it->first == 5);
	OMAP_TEST(e.erase(5) == 1 && e.erase(5) == 0);
	OMAP_TEST(map_equals_sequence(e, std::vector<pair_type>{ {1, 1} }));
	OMAP_TEST(e.check_consistency());

	// lookup returning the position, the key and the value at once
	{
		ordered_map<std::string, int> f{ {"a", 1}, { "b", 2 } };
		auto full = f.get_full("b");
		OMAP_TEST(full.first == 1 && full.second && full.second->first == "b" && full.second->second == 2);
		full.second->second = 20;
		OMAP_TEST(f.at("b") == 20);
		OMAP_TEST(f.get_full("c") == std::make_pair(f.npos, static_cast<std::pair<std::string, int>*>(nullptr)));
		const ordered_map<std::string, int>& cf = f;
		auto kv = cf.get_key_value("a");
		OMAP_TEST(kv.first && *kv.first == "a" && kv.second && *kv.second == 1);
		OMAP_TEST(cf.get_key_value("c").first == nullptr && cf.get_key_value("c").second == nullptr);
		OMAP_TEST(cf.get_full("a").first == 0);
	}

	// splice replaces a range, existing keys outside of it are updated in place
	{
		using char_map = ordered_map<int, char>;
		using char_pair = std::pair<int, char>;
		char_map c{ {0, '_'}, { 1, 'a' }, { 2, 'b' }, { 3, 'c' }, { 4, 'd' } };
		std::vector<char_pair> replacement{ {5, 'E'}, { 4, 'D' }, { 3, 'C' }, { 2, 'B' }, { 1, 'A' } };
		auto out = c.splice(2, 4, replacement.begin(), replacement.end());
		OMAP_TEST(out == std::vector<char_pair>({ {2, 'b'}, { 3, 'c' } }));
		OMAP_TEST(map_equals_sequence(c, std::vector<char_pair>{ {0, '_'}, { 1, 'A' }, { 5, 'E' }, { 3, 'C' }, { 2, 'B' }, { 4, 'D' } }));
		OMAP_TEST(c.check_consistency());

		// duplicates in the new values: the last one wins
		out = c.splice(0, 1, { {7, 'x'}, { 8, 'y' }, { 7, 'z' } });
		OMAP_TEST(out.size() == 1 && out[0].first == 0);
		OMAP_TEST(map_equals_sequence(c, std::vector<char_pair>{ {7, 'z'}, { 8, 'y' }, { 1, 'A' }, { 5, 'E' }, { 3, 'C' }, { 2, 'B' }, { 4, 'D' } }));
		// empty range: pure insertion, empty replacement: pure removal
		out = c.splice(7, 7, { {9, '9'} });
		OMAP_TEST(out.empty() && c.last()->first == 9);
		out = c.splice(1, 3, {});
		OMAP_TEST(out.size() == 2 && out[0].first == 8 && out[1].first == 1);
		OMAP_TEST(map_equals_sequence(c, std::vector<char_pair>{ {7, 'z'}, { 5, 'E' }, { 3, 'C' }, { 2, 'B' }, { 4, 'D' }, { 9, '9' } }));
		OMAP_TEST_THROW(std::out_of_range, c.splice(4, 7, { {10, 'q'} }));
		OMAP_TEST(c.size() == 6 && !c.contains(10));
		OMAP_TEST(c.check_consistency());
	}
}

/// @brief retain, extract_if, erase_if and append
inline void test_ordered_map_bulk()
{
	using namespace omap;
	using map_type = ordered_map<int, int>;
	using pair_type = std::pair<int, int>;

	map_type m;
	for (int i = 0; i < 20; ++i)
		m.insert_full(i, i * 10);

	// retain can modify the kept values
	size_t removed = m.retain([](const int& k, int& v) { v += 1; return k % 2 == 0; });
	OMAP_TEST(removed == 10 && m.size() == 10);
	OMAP_TEST(m.at_index(1).first == 2 && m.at_index(1).second == 21);
	OMAP_TEST(m.check_consistency());

	// retain throwing: the values not yet visited are kept
	OMAP_TEST_THROW(std::runtime_error, m.retain([](const int& k, int&) {
		if (k == 10)
			throw std::runtime_error("stop");
		return k > 4;
	}));
	OMAP_TEST(map_equals_sequence(m, std::vector<pair_type>{ {6, 61}, { 8, 81 }, { 10, 101 }, { 12, 121 }, { 14, 141 }, { 16, 161 }, { 18, 181 } }));
	OMAP_TEST(m.check_consistency());

	// lazy extraction consumed entirely
	{
		std::vector<pair_type> out;
		for (pair_type& p : m.extract_if([](const int& k, int&) { return k % 4 == 0; }))
			out.push_back(std::move(p));
		OMAP_TEST(out == std::vector<pair_type>({ {8, 81}, { 12, 121 }, { 16, 161 } }));
	}
	OMAP_TEST(map_equals_sequence(m, std::vector<pair_type>{ {6, 61}, { 10, 101 }, { 14, 141 }, { 18, 181 } }));
	OMAP_TEST(m.check_consistency());

	// lazy extraction stopped early: the map is compacted and unvisited values are kept
	m.extend({ {20, 0}, { 22, 0 }, { 24, 0 } });
	{
		auto ex = m.extract_if([](const int& k, int&) { return k > 8; });
		auto it = ex.begin();
		OMAP_TEST(it != ex.end() && it->first == 10);
		++it;
		OMAP_TEST(it->first == 14);
		OMAP_TEST(ex.removed() == 2);
	}
	OMAP_TEST(map_equals_sequence(m, std::vector<pair_type>{ {6, 61}, { 18, 181 }, { 20, 0 }, { 22, 0 }, { 24, 0 } }));
	OMAP_TEST(m.check_consistency());

	// extraction never started
	{
		auto ex = m.extract_if([](const int&, int&) { return true; });
		(void)ex;
	}
	OMAP_TEST(m.size() == 5);

	// extraction restricted to a range
	{
		size_t count = 0;
		for (pair_type& p : m.extract_if(1, 3, [](const int&, int&) { return true; })) {
			(void)p;
			++count;
		}
		OMAP_TEST(count == 2);
	}
	OMAP_TEST(map_equals_sequence(m, std::vector<pair_type>{ {6, 61}, { 22, 0 }, { 24, 0 } }));
	OMAP_TEST_THROW(std::out_of_range, m.extract_if(2, 4, [](const int&, int&) { return true; }));
	OMAP_TEST(m.check_consistency());

	// dropping an extraction rebuilds the index in place, without allocation
	{
		using alloc_map = ordered_map<int, int, hasher<int>, std::equal_to<>, debug_allocator<pair_type> >;
		debug_allocator<pair_type> al;
		{
			alloc_map a(al);
			for (int i = 0; i < 1000; ++i)
				a.insert_full(i, i);
			const std::int64_t bytes = get_alloc_bytes(al);
			{
				auto ex = a.extract_if([](const int& k, int&) { return k % 3 != 0; });
				auto it = ex.begin();
				for (int i = 0; i < 10 && it != ex.end(); ++i)
					++it;
			}
			OMAP_TEST(get_alloc_bytes(al) == bytes);
			OMAP_TEST(a.check_consistency());
			a.retain([](const int& k, int&) { return k % 2 == 0; });
			OMAP_TEST(get_alloc_bytes(al) == bytes);
			OMAP_TEST(a.check_consistency());
		}
		OMAP_TEST(get_alloc_bytes(al) == 0);
	}

	// erase_if on the stored pairs
	OMAP_TEST(erase_if(m, [](const pair_type& p) { return p.second == 0; }) == 2);
	OMAP_TEST(map_equals_sequence(m, std::vector<pair_type>{ {6, 61} }));

	// append moves everything, other keeps its capacity
	map_type other;
	for (int i = 0; i < 100; ++i)
		other.insert_full(i, -i);
	const size_t capacity = other.capacity();
	m.append(other);
	OMAP_TEST(other.empty());
	OMAP_TEST(other.capacity() == capacity);
	OMAP_TEST(m.size() == 100);
	OMAP_TEST(m.first()->first == 6 && m.first()->second == -6);
	OMAP_TEST(m.at_index(1).first == 0 && m.last()->first == 99);
	OMAP_TEST(m.check_consistency());
	other.insert_full(1000, 1);
	OMAP_TEST(other.check_consistency());
	m.append(m);
	OMAP_TEST(m.size() == 100);

	// clear keeps the capacity
	const size_t cap = m.capacity();
	m.clear();
	OMAP_TEST(m.empty() && m.capacity() == cap);
	m.shrink_to_fit();
	OMAP_TEST(m.capacity() <= cap);
	m.insert_full(1, 1);
	OMAP_TEST(m.check_consistency());

	// sorting with a throwing comparison leaves the map untouched
	map_type s;
	for (int i = 0; i < 100; ++i)
		s.insert_full((i * 37) % 100, i);
	map_type copy = s;
	OMAP_TEST_THROW(std::runtime_error, s.sort_by(ThrowingLess(50)));
	OMAP_TEST(s == copy);
	OMAP_TEST(s.check_consistency());
}

/// @brief Comparison with std::unordered_map for the std like interface
template<class T>
inline void test_ordered_map_logic()
{
	using namespace omap;
	using map_type = ordered_map<T, T>;
	using umap_type = std::unordered_map<T, T>;
	{
		map_type m{ {1, 1}, { 9, 9 }, { 2, 2 }, { 8, 8 }, { 2, 2 } };
		umap_type u{ {1, 1}, { 9, 9 }, { 2, 2 }, { 8, 8 } };
		OMAP_TEST(hash_map_equals(m, u));
		OMAP_TEST(!m.empty());
		OMAP_TEST(m.max_size() > 0);
	}
	{
		std::vector<std::pair<T, T> > v;
		for (size_t i = 0; i < 10000; ++i)
			v.push_back(std::pair<T, T>(static_cast<T>(i), static_cast<T>(i)));
		omap::random_shuffle(v.begin(), v.end());

		map_type m;
		umap_type u;
		for (size_t i = 0; i < v.size() / 2; ++i) {
			u.insert(v[i]);
			switch (i % 4) {
			case 0: m.insert(v[i]); break;
			case 1: m.emplace(v[i].first, v[i].second); break;
			case 2: m.try_emplace(v[i].first, v[i].second); break;
			default: m.insert_or_assign(v[i].first, v[i].second); break;
			}
		}
		OMAP_TEST(hash_map_equals(m, u));
		OMAP_TEST(m.check_consistency());

		// existing keys
		OMAP_TEST(!m.emplace(v[0].first, v[0].second).second);
		OMAP_TEST(!m.try_emplace(v[0].first, v[0].second).second);
		OMAP_TEST(m.emplace_hint(m.begin(), v[0]) == m.find(v[0].first));
		OMAP_TEST(m.insert(m.begin(), v[0]) == m.find(v[0].first));
		OMAP_TEST(m.try_emplace(m.begin(), v[0].first, v[0].second) == m.find(v[0].first));
		OMAP_TEST(m.insert_or_assign(m.begin(), v[0].first, v[0].second) == m.find(v[0].first));

		OMAP_TEST(m.count(v[0].first) == 1);
		OMAP_TEST(m.count(v.back().first) == 0);
		OMAP_TEST(m.contains(v[0].first));
		OMAP_TEST(!m.contains(v.back().first));
		OMAP_TEST(m.get(v.back().first) == nullptr);
		OMAP_TEST(*m.get(v[0].first) == v[0].second);

		// positions follow insertion order
		for (size_t i = 0; i < v.size() / 2; ++i)
			OMAP_TEST(m.get_index_of(v[i].first) == i);

		// insert everything (half already in the map)
		m.insert(v.begin(), v.end());
		u.insert(v.begin(), v.end());
		OMAP_TEST(hash_map_equals(m, u));

		// operator[]
		for (size_t i = 0; i < v.size(); i += 3) {
			m[v[i].first] = static_cast<T>(i);
			u[v[i].first] = static_cast<T>(i);
		}
		OMAP_TEST(hash_map_equals(m, u));
		T missing = static_cast<T>(v.size() + 1);
		m[missing];
		u[missing];
		OMAP_TEST(hash_map_equals(m, u));

		// erase half, alternating removal flavours
		for (size_t i = 0; i < v.size(); i += 2) {
			switch (i % 6) {
			case 0: m.erase(v[i].first); break;
			case 2: m.shift_remove(v[i].first); break;
			default: m.swap_remove(v[i].first); break;
			}
			u.erase(v[i].first);
		}
		OMAP_TEST(hash_map_equals(m, u));
		OMAP_TEST(m.check_consistency());

		// copy, move, swap
		map_type copy = m;
		OMAP_TEST(copy == m);
		OMAP_TEST(copy.check_consistency());
		map_type moved = std::move(copy);
		OMAP_TEST(moved == m);
		OMAP_TEST(copy.empty());
		copy.insert_full(missing, missing);
		OMAP_TEST(copy.size() == 1 && copy.check_consistency());
		copy = m;
		OMAP_TEST(copy == m);
		copy.clear();
		swap(copy, moved);
		OMAP_TEST(moved.empty() && copy == m);
		moved = std::move(copy);
		OMAP_TEST(moved == m);

		m.sort_keys();
		OMAP_TEST(hash_map_equals(m, u));
		OMAP_TEST(hash_map_sorted(m));
		OMAP_TEST(m.check_consistency());

		// capacity management
		m.max_load_factor(0.9f);
		OMAP_TEST(m.max_load_factor() == 0.9f);
		m.rehash();
		OMAP_TEST(m.check_consistency());
		m.reserve(50000);
		OMAP_TEST(m.capacity() >= 50000);
		OMAP_TEST(m.check_consistency());
		m.shrink_to_fit();
		OMAP_TEST(m.capacity() >= m.size());
		OMAP_TEST(m.load_factor() <= 0.95f);
		OMAP_TEST(m.max_probe_distance() >= 0);
		OMAP_TEST(hash_map_equals(m, u));

		m.clear();
		u.clear();
		OMAP_TEST(hash_map_equals(m, u));
	}
	{
		map_type m(100);
		OMAP_TEST(m.empty() && m.capacity() >= 100);
		OMAP_TEST_THROW(std::out_of_range, m.at(static_cast<T>(1)));
		const map_type& cm = m;
		OMAP_TEST_THROW(std::out_of_range, cm.at(static_cast<T>(1)));
		OMAP_TEST(cm.find(static_cast<T>(1)) == cm.end());
	}
}

/// @brief Random operations compared with a vector of pairs, checking the index after each step
template<class Map>
inline void test_ordered_map_random(size_t ops, std::uint64_t seed, const typename Map::allocator_type& al = typename Map::allocator_type())
{
	using namespace detail_map_test;
	using key_type = typename Map::key_type;
	using mapped_type = typename Map::mapped_type;
	using value_type = std::pair<key_type, mapped_type>;
	const size_t npos = static_cast<size_t>(-1);

	std::mt19937_64 eng(seed);
	Map m(al);
	std::vector<value_type> ref;
	auto rand_key = [&]() { return static_cast<key_type>(static_cast<size_t>(eng() % 200U)); };
	auto rand_value = [&]() { return static_cast<mapped_type>(static_cast<size_t>(eng() % 1000U)); };

	for (size_t op = 0; op < ops; ++op) {
		const size_t n = ref.size();
		switch (eng() % 18U) {
		case 0: case 1: case 2: {
			key_type k = rand_key();
			mapped_type v = rand_value();
			const size_t pos = ref_find(ref, k);
			auto res = m.insert_full(k, v);
			if (pos != npos) {
				OMAP_TEST(res.first == pos && res.second && *res.second == ref[pos].second);
				ref[pos].second = v;
			}
			else {
				OMAP_TEST(res.first == n && !res.second);
				ref.push_back(value_type(k, v));
			}
			break;
		}
		case 3: {
			key_type k = rand_key();
			const size_t pos = ref_find(ref, k);
			auto res = m.shift_remove(k);
			OMAP_TEST(static_cast<bool>(res) == (pos != npos));
			if (pos != npos) {
				OMAP_TEST(*res == ref[pos].second);
				ref.erase(ref.begin() + static_cast<std::ptrdiff_t>(pos));
			}
			break;
		}
		case 4: {
			key_type k = rand_key();
			const size_t pos = ref_find(ref, k);
			auto res = m.swap_remove_entry(k);
			OMAP_TEST(static_cast<bool>(res) == (pos != npos));
			if (pos != npos) {
				OMAP_TEST(res->first == k && res->second == ref[pos].second);
				ref[pos] = ref.back();
				ref.pop_back();
			}
			break;
		}
		case 5: {
			key_type k = rand_key();
			mapped_type v = rand_value();
			const size_t index = static_cast<size_t>(eng() % (n + 1U));
			const size_t pos = ref_find(ref, k);
			auto res = m.insert_before(index, k, v);
			if (pos != npos) {
				const size_t to = pos < index ? index - 1U : index;
				OMAP_TEST(res.first == to && res.second && *res.second == ref[pos].second);
				ref[pos].second = v;
				ref_move(ref, pos, to);
			}
			else {
				OMAP_TEST(res.first == index && !res.second);
				ref.insert(ref.begin() + static_cast<std::ptrdiff_t>(index), value_type(k, v));
			}
			break;
		}
		case 6: {
			if (n == 0)
				break;
			const size_t from = static_cast<size_t>(eng() % n);
			const size_t to = static_cast<size_t>(eng() % n);
			m.move_index(from, to);
			ref_move(ref, from, to);
			break;
		}
		case 7: {
			if (n == 0)
				break;
			const size_t a = static_cast<size_t>(eng() % n);
			const size_t b = static_cast<size_t>(eng() % n);
			m.swap_indices(a, b);
			std::swap(ref[a], ref[b]);
			break;
		}
		case 8: {
			// retain, possibly interrupted by an exception
			const size_t limit = static_cast<size_t>(eng() % (2U * n + 1U));
			size_t calls = 0;
			bool thrown = false;
			try {
				m.retain([&](const key_type&, mapped_type& v) {
					if (calls++ == limit)
						throw std::runtime_error("stop");
					return as_size(v) % 2U == 0;
				});
			}
			catch (const std::runtime_error&) {
				thrown = true;
			}
			OMAP_TEST(thrown == (limit < n));
			std::vector<value_type> kept;
			for (size_t i = 0; i < n; ++i)
				if (i >= limit || as_size(ref[i].second) % 2U == 0)
					kept.push_back(ref[i]);
			ref.swap(kept);
			break;
		}
		case 9: {
			m.sort_unstable_keys();
			std::sort(ref.begin(), ref.end(), [](const value_type& a, const value_type& b) { return a.first < b.first; });
			break;
		}
		case 10: {
			m.reverse();
			std::reverse(ref.begin(), ref.end());
			break;
		}
		case 11: {
			// extraction of a range, stopped after a random number of values
			const size_t first = static_cast<size_t>(eng() % (n + 1U));
			const size_t last = first + static_cast<size_t>(eng() % (n - first + 1U));
			const size_t limit = static_cast<size_t>(eng() % 5U);
			std::vector<value_type> got;
			{
				auto ex = m.extract_if(first, last, [](const key_type& k, mapped_type&) { return as_size(k) % 3U == 0; });
				auto it = ex.begin();
				while (it != ex.end()) {
					got.push_back(*it);
					if (got.size() >= limit)
						break;
					++it;
				}
				OMAP_TEST(ex.removed() == got.size());
			}
			size_t found = 0;
			std::vector<value_type> kept;
			for (size_t i = 0; i < n; ++i) {
				if (i >= first && i < last && found < got.size() && as_size(ref[i].first) % 3U == 0) {
					OMAP_TEST(got[found] == ref[i]);
					++found;
				}
				else
					kept.push_back(ref[i]);
			}
			OMAP_TEST(found == got.size());
			ref.swap(kept);
			break;
		}
		case 12: {
			auto p = m.pop();
			OMAP_TEST(static_cast<bool>(p) == (n != 0));
			if (n) {
				OMAP_TEST(*p == ref.back());
				ref.pop_back();
			}
			break;
		}
		case 13: {
			const size_t first = static_cast<size_t>(eng() % (n + 1U));
			const size_t last = first + static_cast<size_t>(eng() % (std::min<size_t>(n - first, 10U) + 1U));
			auto drained = m.drain(first, last);
			OMAP_TEST(drained.size() == last - first);
			for (size_t i = 0; i < drained.size(); ++i)
				OMAP_TEST(drained[i] == ref[first + i]);
			ref.erase(ref.begin() + static_cast<std::ptrdiff_t>(first), ref.begin() + static_cast<std::ptrdiff_t>(last));
			break;
		}
		case 14: {
			Map other(al);
			const size_t count = static_cast<size_t>(eng() % 10U);
			for (size_t i = 0; i < count; ++i) {
				key_type k = rand_key();
				mapped_type v = rand_value();
				other.insert_full(k, v);
			}
			std::vector<value_type> other_ref(other.begin(), other.end());
			m.append(other);
			OMAP_TEST(other.empty());
			for (const value_type& p : other_ref) {
				const size_t pos = ref_find(ref, p.first);
				if (pos != npos)
					ref[pos].second = p.second;
				else
					ref.push_back(p);
			}
			break;
		}
		case 15: {
			const size_t at = static_cast<size_t>(eng() % (n + 1U));
			Map tail = m.split_off(at);
			OMAP_TEST(tail.check_consistency());
			OMAP_TEST(map_equals_sequence(tail, std::vector<value_type>(ref.begin() + static_cast<std::ptrdiff_t>(at), ref.end())));
			OMAP_TEST(m.size() == at);
			m.append(tail);
			break;
		}
		case 16: {
			const size_t removed = erase_if(m, [](const value_type& p) { return as_size(p.second) % 5U == 0; });
			const size_t before = ref.size();
			ref.erase(std::remove_if(ref.begin(), ref.end(), [](const value_type& p) { return as_size(p.second) % 5U == 0; }), ref.end());
			OMAP_TEST(removed == before - ref.size());
			break;
		}
		default: {
			// a throwing sort leaves the map untouched
			bool thrown = false;
			try {
				m.sort_by(ThrowingLess(static_cast<int>(eng() % (4U * n + 1U))));
			}
			catch (const std::runtime_error&) {
				thrown = true;
			}
			if (!thrown)
				std::stable_sort(ref.begin(), ref.end(), [](const value_type& a, const value_type& b) { return a < b; });
			break;
		}
		}

		OMAP_TEST(map_equals_sequence(m, ref));
		OMAP_TEST(m.check_consistency());
	}

	// every key resolves to its position
	for (size_t i = 0; i < ref.size(); ++i)
		OMAP_TEST(m.get_index_of(ref[i].first) == i);
}

#endif
