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

#ifndef OMAP_ENTRY_HPP
#define OMAP_ENTRY_HPP

/** @file */

#include <functional>
#include <stdexcept>

#include "internal/ordered_table.hpp"

namespace omap
{
	namespace detail
	{
		template<class Table>
		struct EntryTraits
		{
			using extract_key = typename Table::extract_key;
			using key_type = typename Table::key_type;
			using value_type = typename Table::value_type;
			using mapped_type = typename Table::mapped_type;
			// T& for maps, const Key& for sets
			using mapped_reference = decltype(extract_key::mapped(std::declval<value_type&>()));

			static auto take_mapped(value_type&& v) -> mapped_type
			{
				if constexpr (extract_key::has_value)
					return std::move(v.second);
				else
					return std::move(v);
			}
		};
	}

	/// @brief Handle on the slot of a key inside an ordered_map or ordered_set, obtained with entry().
	/// 
	/// The key is hashed and looked up once on construction. The entry is either occupied (the key exists and
	/// index() returns its position) or vacant (the key is absent). Inserting through a vacant entry reuses the
	/// computed hash value and turns the entry into an occupied one. Removing through an occupied entry consumes it:
	/// any further use throws std::logic_error.
	/// 
	/// An entry must not be used after the container was modified by other means.
	template<class Table>
	class ordered_entry
	{
		using traits = detail::EntryTraits<Table>;
		using extract_key = typename traits::extract_key;

	public:
		using key_type = typename traits::key_type;
		using value_type = typename traits::value_type;
		using mapped_type = typename traits::mapped_type;
		using mapped_reference = typename traits::mapped_reference;
		using size_type = size_t;
		static constexpr size_type npos = Table::npos;

	private:
		Table*		d_table;
		size_t		d_hash;
		size_t		d_pos;	// npos when vacant
		key_type	d_key;

		void check_valid() const
		{
			if (OMAP_UNLIKELY(!d_table))
				throw std::logic_error("ordered_entry: entry already consumed");
		}
		void check_occupied() const
		{
			check_valid();
			if (OMAP_UNLIKELY(d_pos == npos))
				throw std::logic_error("ordered_entry: entry is vacant");
		}
		void check_vacant() const
		{
			check_valid();
			if (OMAP_UNLIKELY(d_pos != npos))
				throw std::logic_error("ordered_entry: entry is occupied");
		}
		template<class... Args>
		void emplace_at(size_t pos, Args&&... args)
		{
			d_pos = d_table->emplace_key_at(pos, d_hash, std::move(d_key), std::forward<Args>(args)...);
		}
		auto consume_shift() -> value_type
		{
			check_occupied();
			Table* t = d_table;
			d_table = nullptr;
			return t->shift_take(d_pos);
		}
		auto consume_swap() -> value_type
		{
			check_occupied();
			Table* t = d_table;
			d_table = nullptr;
			return t->swap_take(d_pos);
		}

	public:
		template<class K>
		ordered_entry(Table* table, K&& key)
			:d_table(table), d_hash(table->hash_key(key)), d_pos(npos), d_key(std::forward<K>(key))
		{
			d_pos = table->find_hash(d_hash, d_key);
		}

		/// @brief Returns true if the key exists in the container
		auto occupied() const noexcept -> bool { return d_table && d_pos != npos; }
		/// @brief Returns true if the key is absent from the container
		auto vacant() const noexcept -> bool { return d_table && d_pos == npos; }

		/// @brief Returns the key. For an occupied entry, this is the key stored in the container.
		auto key() const -> const key_type&
		{
			check_valid();
			return d_pos != npos ? extract_key::key(d_table->d_store[d_pos]) : d_key;
		}
		/// @brief Returns the key position, or the position a new value would be appended at for a vacant entry
		auto index() const -> size_type
		{
			check_valid();
			return d_pos != npos ? d_pos : d_table->size();
		}
		/// @brief Returns the mapped value of an occupied entry, throws std::logic_error for a vacant one
		auto get() const -> mapped_reference
		{
			check_occupied();
			return extract_key::mapped(d_table->d_store[d_pos]);
		}

		/// @brief Append a value built from args if the entry is vacant. Returns the mapped value.
		template<class... Args>
		auto or_insert(Args&&... args) -> mapped_reference
		{
			check_valid();
			if (d_pos == npos)
				emplace_at(d_table->size(), std::forward<Args>(args)...);
			return extract_key::mapped(d_table->d_store[d_pos]);
		}
		/// @brief Append the result of fun() if the entry is vacant. Returns the mapped value.
		template<class F>
		auto or_insert_with(F&& fun) -> mapped_reference
		{
			check_valid();
			if (d_pos == npos)
				emplace_at(d_table->size(), fun());
			return extract_key::mapped(d_table->d_store[d_pos]);
		}
		/// @brief Append the result of fun(key()) if the entry is vacant. Returns the mapped value.
		template<class F>
		auto or_insert_with_key(F&& fun) -> mapped_reference
		{
			check_valid();
			if (d_pos == npos) {
				mapped_type value = fun(static_cast<const key_type&>(d_key));
				emplace_at(d_table->size(), std::move(value));
			}
			return extract_key::mapped(d_table->d_store[d_pos]);
		}
		auto or_default() -> mapped_reference
		{
			return or_insert();
		}

		/// @brief Call fun(get()) if the entry is occupied
		template<class F>
		auto and_modify(F&& fun) -> ordered_entry&
		{
			check_valid();
			if (d_pos != npos)
				fun(extract_key::mapped(d_table->d_store[d_pos]));
			return *this;
		}

		/// @brief Append a new value if vacant, or assign the mapped value of a map if occupied.
		/// Returns the entry, which is occupied afterward.
		template<class... Args>
		auto insert_entry(Args&&... args) -> ordered_entry&
		{
			check_valid();
			if (d_pos == npos)
				emplace_at(d_table->size(), std::forward<Args>(args)...);
			else if constexpr (extract_key::has_value)
				d_table->d_store[d_pos].second = mapped_type(std::forward<Args>(args)...);
			return *this;
		}
		/// @brief Same as insert_entry(), but returns the mapped value
		template<class... Args>
		auto insert(Args&&... args) -> mapped_reference
		{
			insert_entry(std::forward<Args>(args)...);
			return extract_key::mapped(d_table->d_store[d_pos]);
		}

		/// @brief Insert a vacant key at its sorted position (binary search with std::less<>).
		/// The container must be sorted by key for the result to be sorted.
		template<class... Args>
		auto insert_sorted(Args&&... args) -> ordered_entry&
		{
			return insert_sorted_by(std::less<>(), std::forward<Args>(args)...);
		}
		/// @brief Insert a vacant key at its sorted position according to less(const key_type&, const key_type&).
		/// The container must be sorted by key with less for the result to be sorted.
		template<class Less, class... Args>
		auto insert_sorted_by(Less less, Args&&... args) -> ordered_entry&
		{
			check_vacant();
			const size_t pos = d_table->partition_point(0, d_table->size(), [&](const value_type& v) { return less(extract_key::key(v), static_cast<const key_type&>(d_key)); });
			emplace_at(pos, std::forward<Args>(args)...);
			return *this;
		}
		/// @brief Insert a vacant key at given position (<= size()), shifting the following values.
		template<class... Args>
		auto shift_insert(size_type index, Args&&... args) -> ordered_entry&
		{
			check_vacant();
			d_table->check_position(index, d_table->size() + 1U);
			emplace_at(index, std::forward<Args>(args)...);
			return *this;
		}

		/// @brief Remove the value by shifting the following ones. Returns the mapped value (the key for sets) and consumes the entry.
		auto remove() -> mapped_type { return traits::take_mapped(consume_shift()); }
		auto shift_remove() -> mapped_type { return traits::take_mapped(consume_shift()); }
		/// @brief Remove the value by moving the last one at its position. Returns the mapped value (the key for sets) and consumes the entry.
		auto swap_remove() -> mapped_type { return traits::take_mapped(consume_swap()); }
		auto remove_entry() -> value_type { return consume_shift(); }
		auto swap_remove_entry() -> value_type { return consume_swap(); }

		/// @brief Move the value to position to, shifting the values in between
		void move_index(size_type to)
		{
			check_occupied();
			d_table->move_index(d_pos, to);
			d_pos = to;
		}
		/// @brief Swap the value position with the value at position other
		void swap_indices(size_type other)
		{
			check_occupied();
			d_table->swap_indices(d_pos, other);
			d_pos = other;
		}
	};


	/// @brief Handle on an existing value of an ordered_map or ordered_set, obtained with get_index_entry().
	template<class Table>
	class ordered_indexed_entry
	{
		using traits = detail::EntryTraits<Table>;
		using extract_key = typename traits::extract_key;

	public:
		using key_type = typename traits::key_type;
		using value_type = typename traits::value_type;
		using mapped_type = typename traits::mapped_type;
		using mapped_reference = typename traits::mapped_reference;
		using size_type = size_t;

	private:
		Table*	d_table;
		size_t	d_pos;

		void check_valid() const
		{
			if (OMAP_UNLIKELY(!d_table))
				throw std::logic_error("ordered_indexed_entry: entry already consumed");
		}

	public:
		ordered_indexed_entry(Table* table, size_t pos)
			:d_table(table), d_pos(pos)
		{
			table->check_position(pos, table->size());
		}

		auto key() const -> const key_type&
		{
			check_valid();
			return extract_key::key(d_table->d_store[d_pos]);
		}
		auto index() const -> size_type
		{
			check_valid();
			return d_pos;
		}
		auto get() const -> mapped_reference
		{
			check_valid();
			return extract_key::mapped(d_table->d_store[d_pos]);
		}
		/// @brief Replace the mapped value, returns the previous one (maps only)
		template<class M>
		auto insert(M&& obj) -> mapped_type
		{
			check_valid();
			mapped_type& v = d_table->d_store[d_pos].second;
			mapped_type old = std::move(v);
			v = std::forward<M>(obj);
			return old;
		}
		auto shift_remove() -> mapped_type 
		{ 
			check_valid();
			Table* t = d_table;
			d_table = nullptr;
			return traits::take_mapped(t->shift_take(d_pos));
		}
		auto swap_remove() -> mapped_type 
		{ 
			check_valid();
			Table* t = d_table;
			d_table = nullptr;
			return traits::take_mapped(t->swap_take(d_pos));
		}
		void move_index(size_type to)
		{
			check_valid();
			d_table->move_index(d_pos, to);
			d_pos = to;
		}
		void swap_indices(size_type other)
		{
			check_valid();
			d_table->swap_indices(d_pos, other);
			d_pos = other;
		}
	};
}

#endif
