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

#ifndef OMAP_SLICE_HPP
#define OMAP_SLICE_HPP

/** @file */

#include <algorithm>
#include <functional>
#include <iterator>
#include <type_traits>

#include "internal/ordered_table.hpp"

namespace omap
{
	/// @brief View over the contiguous range [first, last) of an ordered_map or ordered_set.
	/// 
	/// A slice gives positional access only: keys cannot be looked up through it.
	/// All positions taken or returned by a slice are relative to its first value.
	/// A mutable slice (Const == false) of an ordered_map gives write access to the mapped values and
	/// can reorder its own range, in which case only the slots of that range are repaired.
	/// 
	/// A slice is invalidated by any insertion or removal on the underlying container.
	template<class Table, bool Const>
	class ordered_slice
	{
		template<class, bool>
		friend class ordered_slice;

		using extract_key = typename Table::extract_key;
		using table_pointer = typename std::conditional<Const, const Table*, Table*>::type;
		static constexpr bool is_mutable = !Const && extract_key::has_value;

		table_pointer	d_table;
		size_t			d_first;
		size_t			d_last;

		auto data() const noexcept -> typename Table::value_type* { return const_cast<typename Table::value_type*>(d_table->d_store.data()) + d_first; }

	public:
		using key_type = typename Table::key_type;
		using value_type = typename Table::value_type;
		using size_type = size_t;
		using difference_type = std::ptrdiff_t;
		using pointer = typename std::conditional<is_mutable, value_type*, const value_type*>::type;
		using const_pointer = const value_type*;
		using reference = typename std::conditional<is_mutable, value_type&, const value_type&>::type;
		using const_reference = const value_type&;
		using iterator = pointer;
		using const_iterator = const_pointer;
		using reverse_iterator = std::reverse_iterator<iterator>;
		using const_reverse_iterator = std::reverse_iterator<const_iterator>;
		using mapped_reference = typename std::conditional<is_mutable,
			decltype(extract_key::mapped(std::declval<value_type&>())),
			decltype(extract_key::mapped(std::declval<const value_type&>()))>::type;

		ordered_slice(table_pointer table, size_t first, size_t last)
			:d_table(table), d_first(first), d_last(last)
		{
			if (first > last || last > table->size())
				detail::throw_out_of_range("ordered container: invalid range");
		}
		/// @brief Conversion from a mutable slice to a const one
		template<bool C = Const, typename std::enable_if<C, int>::type = 0>
		ordered_slice(const ordered_slice<Table, false>& other) noexcept
			:d_table(other.d_table), d_first(other.d_first), d_last(other.d_last)
		{}

		auto size() const noexcept -> size_type { return d_last - d_first; }
		auto empty() const noexcept -> bool { return d_first == d_last; }

		auto begin() const noexcept -> iterator { return data(); }
		auto end() const noexcept -> iterator { return data() + size(); }
		auto cbegin() const noexcept -> const_iterator { return data(); }
		auto cend() const noexcept -> const_iterator { return data() + size(); }
		auto rbegin() const noexcept -> reverse_iterator { return reverse_iterator(end()); }
		auto rend() const noexcept -> reverse_iterator { return reverse_iterator(begin()); }

		/// @brief Unchecked access
		auto operator[](size_type i) const noexcept -> reference
		{
			OMAP_ASSERT_DEBUG(i < size(), "ordered_slice: position out of range");
			return data()[i];
		}
		/// @brief Checked access, throws std::out_of_range
		auto at(size_type i) const -> reference
		{
			if (OMAP_UNLIKELY(i >= size()))
				detail::throw_out_of_range("ordered container: position out of range");
			return data()[i];
		}
		/// @brief Returns a pointer to the value at position i, or nullptr if i is out of range
		auto get_index(size_type i) const noexcept -> pointer { return i < size() ? data() + i : nullptr; }
		auto first() const noexcept -> pointer { return get_index(0); }
		auto last() const noexcept -> pointer { return empty() ? nullptr : data() + (size() - 1U); }
		auto key(size_type i) const -> const key_type& { return extract_key::key(at(i)); }
		auto value(size_type i) const -> mapped_reference { return extract_key::mapped(at(i)); }

		/// @brief Returns the sub-slice [first, last), throws std::out_of_range for an invalid range
		auto get_range(size_type first, size_type last) const -> ordered_slice
		{
			if (first > last || last > size())
				detail::throw_out_of_range("ordered container: invalid range");
			return ordered_slice(d_table, d_first + first, d_first + last);
		}

		/// @brief Binary search of key in a slice sorted by key with less.
		/// Returns the matching position and true, or the insertion position and false.
		template<class K, class Less = std::less<> >
		auto binary_search_keys(const K& k, Less less = Less()) const -> std::pair<size_type, bool>
		{
			return binary_search_by([&](const value_type& v) {
				const key_type& vk = extract_key::key(v);
				return less(vk, k) ? -1 : (less(k, vk) ? 1 : 0);
			});
		}
		template<class Cmp>
		auto binary_search_by(Cmp cmp) const -> std::pair<size_type, bool>
		{
			std::pair<size_t, bool> res = d_table->binary_search_by(d_first, d_last, cmp);
			res.first -= d_first;
			return res;
		}
		template<class Pred>
		auto partition_point(Pred pred) const -> size_type
		{
			return d_table->partition_point(d_first, d_last, pred) - d_first;
		}

		/// @brief Stable sort of the slice with less(value, value)
		template<class Less, bool C = Const, typename std::enable_if<!C, int>::type = 0>
		void sort_by(Less less) const
		{
			d_table->sort_range(d_first, d_last, less, true);
		}
		template<class Less, bool C = Const, typename std::enable_if<!C, int>::type = 0>
		void sort_unstable_by(Less less) const
		{
			d_table->sort_range(d_first, d_last, less, false);
		}
		/// @brief Stable sort of the slice by fun(value)
		template<class KeyFun, bool C = Const, typename std::enable_if<!C, int>::type = 0>
		void sort_by_key(KeyFun fun) const
		{
			d_table->sort_range(d_first, d_last, [&](const value_type& a, const value_type& b) { return fun(a) < fun(b); }, true);
		}
		template<bool C = Const, typename std::enable_if<!C, int>::type = 0>
		void sort_keys() const
		{
			d_table->sort_range(d_first, d_last, [](const value_type& a, const value_type& b) { return extract_key::key(a) < extract_key::key(b); }, true);
		}
		template<bool C = Const, typename std::enable_if<!C, int>::type = 0>
		void sort_unstable_keys() const
		{
			d_table->sort_range(d_first, d_last, [](const value_type& a, const value_type& b) { return extract_key::key(a) < extract_key::key(b); }, false);
		}
		template<bool C = Const, typename std::enable_if<!C, int>::type = 0>
		void reverse() const
		{
			d_table->reverse_range(d_first, d_last);
		}
	};

	template<class Table, bool C1, bool C2>
	auto operator==(const ordered_slice<Table, C1>& a, const ordered_slice<Table, C2>& b) -> bool
	{
		return a.size() == b.size() && std::equal(a.cbegin(), a.cend(), b.cbegin());
	}
	template<class Table, bool C1, bool C2>
	auto operator!=(const ordered_slice<Table, C1>& a, const ordered_slice<Table, C2>& b) -> bool
	{
		return !(a == b);
	}
	template<class Table, bool C1, bool C2>
	auto operator<(const ordered_slice<Table, C1>& a, const ordered_slice<Table, C2>& b) -> bool
	{
		return std::lexicographical_compare(a.cbegin(), a.cend(), b.cbegin(), b.cend());
	}
}

#endif
