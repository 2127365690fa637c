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

#ifndef OMAP_ORDERED_SET_HPP
#define OMAP_ORDERED_SET_HPP

/** @file */

/** \addtogroup containers
 *  @{
 */

#include <functional>
#include <initializer_list>
#include <optional>

#include "internal/ordered_table.hpp"
#include "entry.hpp"
#include "slice.hpp"
#include "hash.hpp"
#include "utils.hpp"

namespace omap
{
	/// @brief Associative container that contains unique keys in insertion order.
	/// @tparam Key Key type
	/// @tparam Hash Hash function
	/// @tparam KeyEqual Equality comparison function
	/// @tparam Allocator allocator object
	/// 
	/// omap::ordered_set shares its implementation with omap::ordered_map: keys are stored contiguously in a std::vector
	/// in insertion order, and an open addressing hash table maps each key to its position.
	/// 
	/// Inserting an existing key never replaces it (use replace() for that) and does not change the order.
	/// Keys are only accessible through const iterators and references.
	/// 
	/// In addition to the map interface, ordered_set provides set algebra members: is_subset(), is_superset(), is_disjoint(),
	/// set_union(), set_intersection(), set_difference() and set_symmetric_difference(). The resulting sets follow the order
	/// of the left operand first, then the order of the right one.
	template<
		class Key,
		class Hash = hasher<Key>,
		class KeyEqual = std::equal_to<>,
		class Allocator = std::allocator<Key>
	>
	class ordered_set : private detail::OrderedTable<Key, Key, Hash, KeyEqual, Allocator>
	{
		using base_type = detail::OrderedTable<Key, Key, Hash, KeyEqual, Allocator>;
		using this_type = ordered_set<Key, Hash, KeyEqual, Allocator>;

		template <typename U>
		using has_is_transparent = omap::has_is_transparent<U>;

		auto base() noexcept -> base_type* { return this; }
		auto base() const noexcept -> const base_type* { return this; }

	public:
		using iterator = typename base_type::const_iterator;
		using const_iterator = typename base_type::const_iterator;
		using reverse_iterator = std::reverse_iterator<const_iterator>;
		using const_reverse_iterator = std::reverse_iterator<const_iterator>;

		using key_type = Key;
		using value_type = Key;
		using allocator_type = Allocator;
		using size_type = size_t;
		using difference_type = std::ptrdiff_t;
		using hasher = Hash;
		using key_equal = KeyEqual;
		using reference = const value_type&;
		using const_reference = const value_type&;
		using pointer = typename std::allocator_traits<Allocator>::const_pointer;
		using const_pointer = typename std::allocator_traits<Allocator>::const_pointer;

		using entry_type = ordered_entry<base_type>;
		using indexed_entry_type = ordered_indexed_entry<base_type>;
		using slice_type = ordered_slice<base_type, false>;
		using const_slice_type = ordered_slice<base_type, true>;
		template<class Pred>
		using extract_if_type = detail::ExtractIf<base_type, Pred>;

		static constexpr size_type npos = base_type::npos;

		ordered_set(const Hash& hash = Hash(),
			const KeyEqual& equal = KeyEqual(),
			const Allocator& alloc = Allocator())
			:base_type(hash, equal, alloc)
		{}
		explicit ordered_set(const Allocator& alloc)
			:ordered_set(Hash(), KeyEqual(), alloc)
		{}
		explicit ordered_set(size_type capacity,
			const Hash& hash = Hash(),
			const KeyEqual& equal = KeyEqual(),
			const Allocator& alloc = Allocator())
			:base_type(hash, equal, alloc)
		{
			reserve(capacity);
		}
		/// @brief Construct from the range [first, last). Duplicate keys keep the position of their first occurrence.
		template< class InputIt, class = typename std::iterator_traits<InputIt>::iterator_category >
		ordered_set(InputIt first, InputIt last,
			const Hash& hash = Hash(),
			const key_equal& equal = key_equal(),
			const Allocator& alloc = Allocator())
			: base_type(hash, equal, alloc)
		{
			extend(first, last);
		}
		template< class InputIt, class = typename std::iterator_traits<InputIt>::iterator_category >
		ordered_set(InputIt first, InputIt last,
			const Allocator& alloc)
			: ordered_set(first, last, Hash(), key_equal(), alloc)
		{}
		ordered_set(const ordered_set& other, const Allocator& alloc)
			:base_type(other, alloc)
		{}
		ordered_set(const ordered_set& other)
			:base_type(other, copy_allocator(other.get_allocator()))
		{}
		ordered_set(ordered_set&& other) noexcept(std::is_nothrow_move_constructible<base_type>::value)
			:base_type(std::move(other))
		{}
		ordered_set(ordered_set&& other, const Allocator& alloc)
			:base_type(std::move(other), alloc)
		{}
		ordered_set(std::initializer_list<value_type> init,
			const Hash& hash = Hash(),
			const key_equal& equal = key_equal(),
			const Allocator& alloc = Allocator())
			:ordered_set(init.begin(), init.end(), hash, equal, alloc)
		{}
		ordered_set(std::initializer_list<value_type> init,
			const Allocator& alloc)
			:ordered_set(init.begin(), init.end(), alloc)
		{}

		auto operator=(const ordered_set& other) -> ordered_set&
		{
			base_type::operator=(other);
			return *this;
		}
		auto operator=(ordered_set&& other) -> ordered_set&
		{
			base_type::operator=(std::move(other));
			return *this;
		}
		auto operator=(std::initializer_list<value_type> init) -> ordered_set&
		{
			clear();
			extend(init.begin(), init.end());
			return *this;
		}

		auto size() const noexcept -> size_type { return this->d_store.size(); }
		auto max_size() const noexcept -> size_type { return this->d_store.max_size(); }
		auto empty() const noexcept -> bool { return this->d_store.empty(); }
		auto capacity() const noexcept -> size_type { return base_type::capacity(); }

		auto max_probe_distance() const noexcept -> int { return this->d_index.max_probe_distance(); }
		auto load_factor() const noexcept -> float { return this->d_index.load_factor(); }
		auto max_load_factor() const noexcept -> float { return this->d_index.max_load_factor(); }
		void max_load_factor(float f) noexcept { this->d_index.max_load_factor(f); }

		auto get_allocator() const noexcept -> allocator_type { return base_type::get_allocator(); }
		auto hash_function() const noexcept -> const hasher& { return this->base_type::hash_function(); }
		auto key_eq() const noexcept -> const key_equal& { return this->base_type::key_eq(); }

		auto end() const noexcept -> const_iterator { return this->d_store.end(); }
		auto cend() const noexcept -> const_iterator { return this->d_store.end(); }
		auto begin() const noexcept -> const_iterator { return this->d_store.begin(); }
		auto cbegin() const noexcept -> const_iterator { return this->d_store.begin(); }
		auto rbegin() const noexcept -> const_reverse_iterator { return const_reverse_iterator(end()); }
		auto crbegin() const noexcept -> const_reverse_iterator { return const_reverse_iterator(end()); }
		auto rend() const noexcept -> const_reverse_iterator { return const_reverse_iterator(begin()); }
		auto crend() const noexcept -> const_reverse_iterator { return const_reverse_iterator(begin()); }

		void clear() noexcept
		{
			this->base_type::clear();
		}
		void rehash()
		{
			this->base_type::rehash();
		}
		void reserve(size_type count)
		{
			this->base_type::reserve(count);
		}
		void shrink_to_fit()
		{
			this->base_type::shrink_to_fit();
		}
		void swap(ordered_set& other)
		{
			base_type::swap(other);
		}
		auto check_consistency() const -> bool
		{
			return this->base_type::check_consistency();
		}


		//
		// Key lookup
		//

		OMAP_ALWAYS_INLINE auto find(const Key& key) const -> const_iterator
		{
			const size_t pos = this->find_pos(key);
			return pos == npos ? end() : begin() + static_cast<difference_type>(pos);
		}
		template <class K, class KE = KeyEqual, class H = Hash,
			typename std::enable_if<has_is_transparent<KE>::value && has_is_transparent<H>::value>::type* = nullptr>
		OMAP_ALWAYS_INLINE auto find(const K& x) const -> const_iterator
		{
			const size_t pos = this->find_pos(x);
			return pos == npos ? end() : begin() + static_cast<difference_type>(pos);
		}
		OMAP_ALWAYS_INLINE auto get_index_of(const Key& key) const -> size_type
		{
			return this->find_pos(key);
		}
		template <class K, class KE = KeyEqual, class H = Hash,
			typename std::enable_if<has_is_transparent<KE>::value && has_is_transparent<H>::value>::type* = nullptr>
		OMAP_ALWAYS_INLINE auto get_index_of(const K& x) const -> size_type
		{
			return this->find_pos(x);
		}
		/// @brief Returns a pointer to the stored key equal to key, or nullptr
		OMAP_ALWAYS_INLINE auto get(const Key& key) const -> const Key*
		{
			const size_t pos = this->find_pos(key);
			return pos == npos ? nullptr : std::addressof(this->d_store[pos]);
		}
		/// @brief Returns the position of key and a pointer to the stored key, or (npos, nullptr) if not found
		auto get_full(const Key& key) const -> std::pair<size_type, const Key*>
		{
			const size_t pos = this->find_pos(key);
			return std::pair<size_type, const Key*>(pos, pos == npos ? nullptr : std::addressof(this->d_store[pos]));
		}
		OMAP_ALWAYS_INLINE auto count(const Key& key) const -> size_type
		{
			return this->find_pos(key) != npos;
		}
		template <class K, class KE = KeyEqual, class H = Hash,
			typename std::enable_if<has_is_transparent<KE>::value && has_is_transparent<H>::value>::type* = nullptr>
		OMAP_ALWAYS_INLINE auto count(const K& x) const -> size_type
		{
			return this->find_pos(x) != npos;
		}
		OMAP_ALWAYS_INLINE bool contains(const Key& key) const
		{
			return this->find_pos(key) != npos;
		}
		template <class K, class KE = KeyEqual, class H = Hash,
			typename std::enable_if<has_is_transparent<KE>::value && has_is_transparent<H>::value>::type* = nullptr>
		OMAP_ALWAYS_INLINE bool contains(const K& x) const
		{
			return this->find_pos(x) != npos;
		}

		auto entry(const Key& key) -> entry_type
		{
			return entry_type(base(), key);
		}
		auto entry(Key&& key) -> entry_type
		{
			return entry_type(base(), std::move(key));
		}


		//
		// Positional access
		//

		auto get_index(size_type pos) const noexcept -> const value_type*
		{
			return pos < size() ? this->d_store.data() + pos : nullptr;
		}
		auto at_index(size_type pos) const -> const value_type&
		{
			this->check_position(pos, size());
			return this->d_store[pos];
		}
		auto nth(size_type pos) const noexcept -> const_iterator
		{
			OMAP_ASSERT_DEBUG(pos <= size(), "ordered_set: position out of range");
			return begin() + static_cast<difference_type>(pos);
		}
		auto index_of(const_iterator it) const noexcept -> size_type
		{
			return static_cast<size_type>(it - begin());
		}
		auto first() const noexcept -> const value_type* { return get_index(0); }
		auto last() const noexcept -> const value_type* { return empty() ? nullptr : get_index(size() - 1U); }

		/// @brief Returns a view over positions [first, last), throws std::out_of_range for an invalid range.
		/// The view can reorder its range, but not modify the keys.
		auto get_range(size_type first, size_type last) -> slice_type
		{
			return slice_type(base(), first, last);
		}
		auto get_range(size_type first, size_type last) const -> const_slice_type
		{
			return const_slice_type(base(), first, last);
		}
		auto as_slice() -> slice_type { return slice_type(base(), 0, size()); }
		auto as_slice() const -> const_slice_type { return const_slice_type(base(), 0, size()); }
		/// @brief Returns a handle on the key at position pos, throws std::out_of_range if pos >= size()
		auto get_index_entry(size_type pos) -> indexed_entry_type
		{
			return indexed_entry_type(base(), pos);
		}


		//
		// Insertion
		//

		template< class... Args >
		OMAP_ALWAYS_INLINE auto emplace(Args&&... args) -> std::pair<const_iterator, bool>
		{
			auto res = this->base_type::emplace(std::forward<Args>(args)...);
			return std::pair<const_iterator, bool>(nth(res.first), res.second);
		}
		template <class... Args>
		OMAP_ALWAYS_INLINE auto emplace_hint(const_iterator hint, Args&&... args) -> const_iterator
		{
			(void)hint;
			return emplace(std::forward<Args>(args)...).first;
		}
		/// @brief Append key if absent. An existing key is left untouched.
		OMAP_ALWAYS_INLINE auto insert(const value_type& value) -> std::pair<const_iterator, bool>
		{
			auto res = this->base_type::try_emplace(value);
			return std::pair<const_iterator, bool>(nth(res.first), res.second);
		}
		OMAP_ALWAYS_INLINE auto insert(value_type&& value) -> std::pair<const_iterator, bool>
		{
			auto res = this->base_type::try_emplace(std::move(value));
			return std::pair<const_iterator, bool>(nth(res.first), res.second);
		}
		OMAP_ALWAYS_INLINE auto insert(const_iterator hint, const value_type& value) -> const_iterator
		{
			(void)hint;
			return insert(value).first;
		}
		OMAP_ALWAYS_INLINE auto insert(const_iterator hint, value_type&& value) -> const_iterator
		{
			(void)hint;
			return insert(std::move(value)).first;
		}
		template< class InputIt >
		void insert(InputIt first, InputIt last)
		{
			extend(first, last);
		}
		void insert(std::initializer_list<value_type> ilist)
		{
			extend(ilist.begin(), ilist.end());
		}

		/// @brief Append key if absent
		/// @return the key position and true if it was inserted
		auto insert_full(value_type value) -> std::pair<size_type, bool>
		{
			return this->base_type::try_emplace(std::move(value));
		}
		/// @brief Insert key, replacing an existing equal key in place
		/// @return the replaced key, if any
		auto replace(value_type value) -> std::optional<value_type>
		{
			const size_t hash = this->hash_key(value);
			const size_t pos = this->find_hash(hash, value);
			if (pos != npos) {
				std::optional<value_type> old(std::move(this->d_store[pos]));
				this->d_store[pos] = std::move(value);
				return old;
			}
			this->emplace_key_at(size(), hash, std::move(value));
			return std::nullopt;
		}
		/// @brief Insert a new key at its sorted position using less. An existing key is left untouched.
		/// The set must already be sorted with less for the result to be sorted.
		/// @return the key position and true if it was inserted
		template<class Less = std::less<> >
		auto insert_sorted(value_type value, Less less = Less()) -> std::pair<size_type, bool>
		{
			const size_t hash = this->hash_key(value);
			const size_t pos = this->find_hash(hash, value);
			if (pos != npos)
				return std::pair<size_type, bool>(pos, false);
			const size_t at = this->base_type::partition_point(0, size(), [&](const value_type& v) { return less(v, value); });
			return std::pair<size_type, bool>(this->emplace_key_at(at, hash, std::move(value)), true);
		}
		/// @brief Insert key before the value currently at position index (index <= size()).
		/// An existing key is moved: it ends at index - 1 if it was located before index, at index otherwise.
		/// Throws std::out_of_range if index > size().
		/// @return the final key position and true if the key was inserted
		auto insert_before(size_type index, value_type value) -> std::pair<size_type, bool>
		{
			this->check_position(index, size() + 1U);
			const size_t hash = this->hash_key(value);
			const size_t pos = this->find_hash(hash, value);
			if (pos != npos) {
				const size_t to = pos < index ? index - 1U : index;
				this->base_type::move_index(pos, to);
				return std::pair<size_type, bool>(to, false);
			}
			return std::pair<size_type, bool>(this->emplace_key_at(index, hash, std::move(value)), true);
		}
		/// @brief Insert key at position index, moving an existing key there (index < size()).
		/// A new key requires index <= size(). Throws std::out_of_range otherwise.
		/// @return true if the key was inserted
		auto shift_insert(size_type index, value_type value) -> bool
		{
			const size_t hash = this->hash_key(value);
			const size_t pos = this->find_hash(hash, value);
			if (pos != npos) {
				this->base_type::move_index(pos, index);
				return false;
			}
			this->check_position(index, size() + 1U);
			this->emplace_key_at(index, hash, std::move(value));
			return true;
		}
		template< class InputIt >
		void extend(InputIt first, InputIt last)
		{
			this->base_type::extend(first, last);
		}
		void extend(std::initializer_list<value_type> ilist)
		{
			extend(ilist.begin(), ilist.end());
		}
		/// @brief Move the keys of other absent from this set at the end, in order. other is left empty with its capacity.
		void append(ordered_set& other)
		{
			this->base_type::append(other);
		}


		//
		// Removal
		//

		auto erase(const_iterator pos) -> const_iterator
		{
			const size_type p = index_of(pos);
			this->base_type::shift_erase(p);
			return nth(p);
		}
		auto erase(const_iterator first, const_iterator last) -> const_iterator
		{
			const size_type f = index_of(first);
			this->base_type::erase_range(f, index_of(last));
			return nth(f);
		}
		auto erase(const Key& key) -> size_type
		{
			return shift_remove(key) ? 1 : 0;
		}
		template <class K, class KE = KeyEqual, class H = Hash,
			typename std::enable_if<has_is_transparent<KE>::value && has_is_transparent<H>::value>::type* = nullptr>
		auto erase(const K& x) -> size_type
		{
			const size_t pos = this->find_pos(x);
			if (pos == npos)
				return 0;
			this->base_type::shift_erase(pos);
			return 1;
		}

		/// @brief Remove key by shifting the following keys, returns true if the key was found
		auto shift_remove(const Key& key) -> bool
		{
			const size_t pos = this->find_pos(key);
			if (pos == npos)
				return false;
			this->base_type::shift_erase(pos);
			return true;
		}
		/// @brief Remove key by moving the last key at its position, returns true if the key was found
		auto swap_remove(const Key& key) -> bool
		{
			const size_t pos = this->find_pos(key);
			if (pos == npos)
				return false;
			this->base_type::swap_erase(pos);
			return true;
		}
		/// @brief Same as shift_remove(), but returns the removed key
		auto shift_take(const Key& key) -> std::optional<value_type>
		{
			const size_t pos = this->find_pos(key);
			if (pos == npos)
				return std::nullopt;
			return std::optional<value_type>(this->base_type::shift_take(pos));
		}
		/// @brief Same as swap_remove(), but returns the removed key
		auto swap_take(const Key& key) -> std::optional<value_type>
		{
			const size_t pos = this->find_pos(key);
			if (pos == npos)
				return std::nullopt;
			return std::optional<value_type>(this->base_type::swap_take(pos));
		}
		auto shift_remove_index(size_type pos) -> std::optional<value_type>
		{
			if (pos >= size())
				return std::nullopt;
			return std::optional<value_type>(this->base_type::shift_take(pos));
		}
		auto swap_remove_index(size_type pos) -> std::optional<value_type>
		{
			if (pos >= size())
				return std::nullopt;
			return std::optional<value_type>(this->base_type::swap_take(pos));
		}
		auto pop() -> std::optional<value_type>
		{
			if (empty())
				return std::nullopt;
			return std::optional<value_type>(this->base_type::swap_take(size() - 1U));
		}
		void truncate(size_type count)
		{
			this->base_type::truncate(count);
		}
		auto drain(size_type first, size_type last) -> std::vector<value_type, Allocator>
		{
			return this->base_type::drain(first, last);
		}
		/// @brief Replace positions [first, last) by the keys of [ifirst, ilast) and return the removed keys in order.
		/// Keys present elsewhere in the set are left untouched, the other ones are inserted in order at the place of the removed range.
		/// Throws std::out_of_range for an invalid range, leaving the set untouched.
		template< class InputIt >
		auto splice(size_type first, size_type last, InputIt ifirst, InputIt ilast) -> std::vector<value_type, Allocator>
		{
			std::vector<value_type, Allocator> removed = this->base_type::drain(first, last);
			size_t at = first;
			for (; ifirst != ilast; ++ifirst) {
				value_type v(*ifirst);
				const size_t hash = this->hash_key(v);
				if (this->find_hash(hash, v) == npos)
					this->emplace_key_at(at++, hash, std::move(v));
			}
			return removed;
		}
		auto splice(size_type first, size_type last, std::initializer_list<value_type> ilist) -> std::vector<value_type, Allocator>
		{
			return splice(first, last, ilist.begin(), ilist.end());
		}
		auto split_off(size_type at) -> ordered_set
		{
			ordered_set res(hash_function(), key_eq(), get_allocator());
			res.max_load_factor(max_load_factor());
			this->base_type::split_into(at, res);
			return res;
		}
		/// @brief Remove all keys for which pred(key) returns false, preserving the order of the others
		/// @return the number of removed keys
		template<class Pred>
		auto retain(Pred pred) -> size_type
		{
			return this->base_type::retain([&](const value_type& v) { return static_cast<bool>(pred(v)); });
		}
		/// @brief Lazy removal of the keys for which pred(key) returns true, see ordered_map::extract_if()
		template<class Pred>
		auto extract_if(Pred pred) -> extract_if_type<Pred>
		{
			return extract_if_type<Pred>(base(), std::move(pred), 0, size());
		}
		template<class Pred>
		auto extract_if(size_type first, size_type last, Pred pred) -> extract_if_type<Pred>
		{
			return extract_if_type<Pred>(base(), std::move(pred), first, last);
		}


		//
		// Reordering
		//

		template<class Less>
		void sort_by(Less less)
		{
			this->base_type::sort_range(0, size(), less, true);
		}
		template<class Less>
		void sort_unstable_by(Less less)
		{
			this->base_type::sort_range(0, size(), less, false);
		}
		template<class KeyFun>
		void sort_by_key(KeyFun fun)
		{
			this->base_type::sort_range(0, size(), [&](const value_type& a, const value_type& b) { return fun(a) < fun(b); }, true);
		}
		template<class KeyFun>
		void sort_by_cached_key(KeyFun fun)
		{
			this->base_type::sort_range_by_cached_key(0, size(), fun);
		}
		template<class Less = std::less<> >
		void sort(Less less = Less())
		{
			this->base_type::sort_range(0, size(), less, true);
		}
		template<class Less = std::less<> >
		void sort_unstable(Less less = Less())
		{
			this->base_type::sort_range(0, size(), less, false);
		}
		void reverse()
		{
			this->base_type::reverse_range(0, size());
		}
		void move_index(size_type from, size_type to)
		{
			this->base_type::move_index(from, to);
		}
		void swap_indices(size_type a, size_type b)
		{
			this->base_type::swap_indices(a, b);
		}


		//
		// Search in a sorted set
		//

		template<class K, class Less = std::less<> >
		auto binary_search(const K& key, Less less = Less()) const -> std::pair<size_type, bool>
		{
			return as_slice().binary_search_keys(key, less);
		}
		template<class Cmp>
		auto binary_search_by(Cmp cmp) const -> std::pair<size_type, bool>
		{
			return this->base_type::binary_search_by(0, size(), cmp);
		}
		/// @brief Binary search of b in a set sorted by fun(key) using operator<
		template<class B, class KeyFun>
		auto binary_search_by_key(const B& b, KeyFun fun) const -> std::pair<size_type, bool>
		{
			return binary_search_by([&](const value_type& v) {
				const auto k = fun(v);
				return k < b ? -1 : (b < k ? 1 : 0);
			});
		}
		template<class Pred>
		auto partition_point(Pred pred) const -> size_type
		{
			return this->base_type::partition_point(0, size(), pred);
		}


		//
		// Set algebra
		//

		/// @brief Returns true if all keys of this set belong to other
		auto is_subset(const ordered_set& other) const -> bool
		{
			if (size() > other.size())
				return false;
			for (const value_type& v : *this)
				if (!other.contains(v))
					return false;
			return true;
		}
		auto is_superset(const ordered_set& other) const -> bool
		{
			return other.is_subset(*this);
		}
		/// @brief Returns true if the sets have no key in common
		auto is_disjoint(const ordered_set& other) const -> bool
		{
			const ordered_set& small = size() <= other.size() ? *this : other;
			const ordered_set& large = size() <= other.size() ? other : *this;
			for (const value_type& v : small)
				if (large.contains(v))
					return false;
			return true;
		}
		/// @brief Keys of this set followed by the keys of other absent from this set
		auto set_union(const ordered_set& other) const -> ordered_set
		{
			ordered_set res(*this);
			res.extend(other.begin(), other.end());
			return res;
		}
		/// @brief Keys of this set also present in other, in the order of this set
		auto set_intersection(const ordered_set& other) const -> ordered_set
		{
			ordered_set res(hash_function(), key_eq(), get_allocator());
			for (const value_type& v : *this)
				if (other.contains(v))
					res.insert(v);
			return res;
		}
		/// @brief Keys of this set absent from other, in the order of this set
		auto set_difference(const ordered_set& other) const -> ordered_set
		{
			ordered_set res(hash_function(), key_eq(), get_allocator());
			for (const value_type& v : *this)
				if (!other.contains(v))
					res.insert(v);
			return res;
		}
		/// @brief Keys of this set absent from other, followed by the keys of other absent from this set
		auto set_symmetric_difference(const ordered_set& other) const -> ordered_set
		{
			ordered_set res = set_difference(other);
			for (const value_type& v : other)
				if (!contains(v))
					res.insert(v);
			return res;
		}

		/// @brief Remove all keys satisfying pred(key), preserving order. Returns the number of removed keys.
		template<class Pred>
		friend auto erase_if(ordered_set& s, Pred pred) -> size_type
		{
			return s.base()->retain([&](const value_type& v) { return !pred(v); });
		}
	};


	template<class K, class H, class E, class A>
	bool operator==(const ordered_set<K, H, E, A>& a, const ordered_set<K, H, E, A>& b)
	{
		return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin());
	}
	template<class K, class H, class E, class A>
	bool operator!=(const ordered_set<K, H, E, A>& a, const ordered_set<K, H, E, A>& b)
	{
		return !(a == b);
	}
	template<class K, class H, class E, class A>
	bool operator<(const ordered_set<K, H, E, A>& a, const ordered_set<K, H, E, A>& b)
	{
		return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end());
	}
	template<class K, class H, class E, class A>
	bool operator>(const ordered_set<K, H, E, A>& a, const ordered_set<K, H, E, A>& b)
	{
		return b < a;
	}
	template<class K, class H, class E, class A>
	bool operator<=(const ordered_set<K, H, E, A>& a, const ordered_set<K, H, E, A>& b)
	{
		return !(b < a);
	}
	template<class K, class H, class E, class A>
	bool operator>=(const ordered_set<K, H, E, A>& a, const ordered_set<K, H, E, A>& b)
	{
		return !(a < b);
	}

	template<class K, class H, class E, class A>
	void swap(ordered_set<K, H, E, A>& a, ordered_set<K, H, E, A>& b)
	{
		a.swap(b);
	}
}

namespace std
{
	/// @brief Order sensitive hash of an ordered_set
	template<class K, class H, class E, class A>
	struct hash<omap::ordered_set<K, H, E, A> >
	{
		auto operator()(const omap::ordered_set<K, H, E, A>& s) const -> size_t
		{
			return omap::hash_sequence(s.begin(), s.end(), omap::hasher<K>());
		}
	};
}

/** @}*/
//end containers

#endif
