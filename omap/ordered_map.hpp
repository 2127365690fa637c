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

#ifndef OMAP_ORDERED_MAP_HPP
#define OMAP_ORDERED_MAP_HPP

/** @file */

/**\defgroup containers Containers: ordered_map and ordered_set

The containers module provides:
	-	omap::ordered_map: hash map keeping its values in insertion order, with positional access
	-	omap::ordered_set: hash set keeping its values in insertion order, with positional access
	-	omap::ordered_entry and omap::ordered_indexed_entry: key and position handles
	-	omap::ordered_slice: views over a contiguous range of values
*/

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
	/// @brief Associative container that contains key-value pairs with unique keys, in insertion order.
	/// @tparam Key Key type
	/// @tparam T mapped type
	/// @tparam Hash Hash function
	/// @tparam KeyEqual Equality comparison function
	/// @tparam Allocator allocator object
	/// 
	/// omap::ordered_map stores its values of type std::pair<Key,T> contiguously in a std::vector, in insertion order.
	/// A separate open addressing hash table (robin hood probing with backward shift deletion) maps each key to
	/// the position of its value. Its main properties are:
	///		-	Average constant time lookup, insertion and swap removal.
	///		-	Constant time positional access with get_index(), at_index() and nth(). Iterators are random access.
	///		-	Inserting an existing key overwrites its mapped value in place, without changing the order.
	///		-	shift_remove() preserves the order of the remaining values in linear time, swap_remove() moves the last value
	///			to the removed position in constant time.
	///		-	Equality, comparison and hashing of whole maps depend on the order of the values.
	/// 
	/// Keys must not be modified through iterators or references.
	/// Iterators, references and positions are invalidated by insertions and removals, like std::vector ones.
	/// 
	/// Positional errors (at_index(), insert_before(), get_range()...) throw std::out_of_range.
	/// Key absence is reported by end(), nullptr, npos or an empty std::optional.
	template<
		class Key,
		class T,
		class Hash = hasher<Key>,
		class KeyEqual = std::equal_to<>,
		class Allocator = std::allocator< std::pair<Key, T> >
	>
	class ordered_map : private detail::OrderedTable<Key, std::pair<Key, T>, Hash, KeyEqual, Allocator>
	{
		using base_type = detail::OrderedTable<Key, std::pair<Key, T>, Hash, KeyEqual, Allocator>;
		using this_type = ordered_map<Key, T, Hash, KeyEqual, Allocator>;
		using extract_key = typename base_type::extract_key;

		template <typename U>
		using has_is_transparent = omap::has_is_transparent<U>;

		// Adapt a predicate on (key, value) to the stored pair
		template<class Pred>
		struct KeyValuePred
		{
			Pred p;
			auto operator()(std::pair<Key, T>& v) -> bool { return p(static_cast<const Key&>(v.first), v.second); }
		};
		template<class Less>
		struct KeyLess
		{
			Less l;
			auto operator()(const std::pair<Key, T>& a, const std::pair<Key, T>& b) const -> bool { return l(a.first, b.first); }
		};

		auto base() noexcept -> base_type* { return this; }
		auto base() const noexcept -> const base_type* { return this; }

		template<class Less>
		auto sorted_position(const Key& key, Less& less) const -> size_t
		{
			return this->base_type::partition_point(0, size(), [&](const std::pair<Key, T>& v) { return less(v.first, key); });
		}

	public:
		using iterator = typename base_type::iterator;
		using const_iterator = typename base_type::const_iterator;
		using reverse_iterator = std::reverse_iterator<iterator>;
		using const_reverse_iterator = std::reverse_iterator<const_iterator>;

		using key_type = Key;
		using mapped_type = T;
		using value_type = std::pair<Key, T>;
		using allocator_type = Allocator;
		using size_type = size_t;
		using difference_type = std::ptrdiff_t;
		using hasher = Hash;
		using key_equal = KeyEqual;
		using reference = value_type&;
		using const_reference = const value_type&;
		using pointer = typename std::allocator_traits<Allocator>::pointer;
		using const_pointer = typename std::allocator_traits<Allocator>::const_pointer;

		using entry_type = ordered_entry<base_type>;
		using indexed_entry_type = ordered_indexed_entry<base_type>;
		using slice_type = ordered_slice<base_type, false>;
		using const_slice_type = ordered_slice<base_type, true>;
		template<class Pred>
		using extract_if_type = detail::ExtractIf<base_type, KeyValuePred<Pred> >;

		/// @brief Value returned by position getters for absent keys
		static constexpr size_type npos = base_type::npos;

		ordered_map(const Hash& hash = Hash(),
			const KeyEqual& equal = KeyEqual(),
			const Allocator& alloc = Allocator())
			:base_type(hash, equal, alloc)
		{}
		explicit ordered_map(const Allocator& alloc)
			:ordered_map(Hash(), KeyEqual(), alloc)
		{}
		/// @brief Construct an empty map able to hold capacity values without reallocation
		explicit ordered_map(size_type capacity,
			const Hash& hash = Hash(),
			const KeyEqual& equal = KeyEqual(),
			const Allocator& alloc = Allocator())
			:base_type(hash, equal, alloc)
		{
			reserve(capacity);
		}
		/// @brief Construct from the range [first, last).
		/// Values are added in order. For duplicate keys, the first occurrence gives the position and the last one gives the mapped value.
		template< class InputIt, class = typename std::iterator_traits<InputIt>::iterator_category >
		ordered_map(InputIt first, InputIt last,
			const Hash& hash = Hash(),
			const key_equal& equal = key_equal(),
			const Allocator& alloc = Allocator())
			: base_type(hash, equal, alloc)
		{
			extend(first, last);
		}
		template< class InputIt, class = typename std::iterator_traits<InputIt>::iterator_category >
		ordered_map(InputIt first, InputIt last,
			const Allocator& alloc)
			: ordered_map(first, last, Hash(), key_equal(), alloc)
		{}
		ordered_map(const ordered_map& other, const Allocator& alloc)
			:base_type(other, alloc)
		{}
		ordered_map(const ordered_map& other)
			:base_type(other, copy_allocator(other.get_allocator()))
		{}
		ordered_map(ordered_map&& other) noexcept(std::is_nothrow_move_constructible<base_type>::value)
			:base_type(std::move(other))
		{}
		ordered_map(ordered_map&& other, const Allocator& alloc)
			:base_type(std::move(other), alloc)
		{}
		ordered_map(std::initializer_list<value_type> init,
			const Hash& hash = Hash(),
			const key_equal& equal = key_equal(),
			const Allocator& alloc = Allocator())
			:ordered_map(init.begin(), init.end(), hash, equal, alloc)
		{}
		ordered_map(std::initializer_list<value_type> init,
			const Allocator& alloc)
			:ordered_map(init.begin(), init.end(), alloc)
		{}

		auto operator=(const ordered_map& other) -> ordered_map&
		{
			base_type::operator=(other);
			return *this;
		}
		auto operator=(ordered_map&& other) -> ordered_map&
		{
			base_type::operator=(std::move(other));
			return *this;
		}
		auto operator=(std::initializer_list<value_type> init) -> ordered_map&
		{
			clear();
			extend(init.begin(), init.end());
			return *this;
		}

		auto size() const noexcept -> size_type { return this->d_store.size(); }
		auto max_size() const noexcept -> size_type { return this->d_store.max_size(); }
		auto empty() const noexcept -> bool { return this->d_store.empty(); }
		/// @brief Number of values the map can hold without reallocating the values or the index
		auto capacity() const noexcept -> size_type { return base_type::capacity(); }

		auto max_probe_distance() const noexcept -> int { return this->d_index.max_probe_distance(); }
		auto load_factor() const noexcept -> float { return this->d_index.load_factor(); }
		auto max_load_factor() const noexcept -> float { return this->d_index.max_load_factor(); }
		/// @brief Set the maximum load factor, clamped to [0.1, 0.95]. Applied on the next growth or rehash().
		void max_load_factor(float f) noexcept { this->d_index.max_load_factor(f); }

		auto get_allocator() const noexcept -> allocator_type { return base_type::get_allocator(); }
		auto hash_function() const noexcept -> const hasher& { return this->base_type::hash_function(); }
		auto key_eq() const noexcept -> const key_equal& { return this->base_type::key_eq(); }

		auto end() noexcept -> iterator { return this->d_store.end(); }
		auto end() const noexcept -> const_iterator { return this->d_store.end(); }
		auto cend() const noexcept -> const_iterator { return this->d_store.end(); }

		auto begin() noexcept -> iterator { return this->d_store.begin(); }
		auto begin() const noexcept -> const_iterator { return this->d_store.begin(); }
		auto cbegin() const noexcept -> const_iterator { return this->d_store.begin(); }

		auto rbegin() noexcept -> reverse_iterator { return reverse_iterator(end()); }
		auto rbegin() const noexcept -> const_reverse_iterator { return const_reverse_iterator(end()); }
		auto crbegin() const noexcept -> const_reverse_iterator { return const_reverse_iterator(end()); }

		auto rend() noexcept -> reverse_iterator { return reverse_iterator(begin()); }
		auto rend() const noexcept -> const_reverse_iterator { return const_reverse_iterator(begin()); }
		auto crend() const noexcept -> const_reverse_iterator { return const_reverse_iterator(begin()); }

		/// @brief Remove all values, keeping the memory of both the values and the index
		void clear() noexcept
		{
			this->base_type::clear();
		}
		/// @brief Rebuild the index from the values
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
		void swap(ordered_map& other)
		{
			base_type::swap(other);
		}
		/// @brief Check that every position is referenced by exactly one slot of the index, and that every key is found at its position
		auto check_consistency() const -> bool
		{
			return this->base_type::check_consistency();
		}


		//
		// Key lookup
		//

		/// @brief Finds an element with key equivalent to key
		/// @return iterator pointing to found key on success, end iterator on failure.
		OMAP_ALWAYS_INLINE auto find(const Key& key) -> iterator
		{
			const size_t pos = this->find_pos(key);
			return pos == npos ? end() : begin() + static_cast<difference_type>(pos);
		}
		OMAP_ALWAYS_INLINE auto find(const Key& key) const -> const_iterator
		{
			const size_t pos = this->find_pos(key);
			return pos == npos ? end() : begin() + static_cast<difference_type>(pos);
		}
		/// @brief Finds an element with key that compares equivalent to the value x. 
		/// This overload participates in overload resolution only if Hash::is_transparent and KeyEqual::is_transparent are valid and each denotes a type. 
		template <class K, class KE = KeyEqual, class H = Hash,
			typename std::enable_if<has_is_transparent<KE>::value && has_is_transparent<H>::value>::type* = nullptr>
		OMAP_ALWAYS_INLINE auto find(const K& x) -> iterator
		{
			const size_t pos = this->find_pos(x);
			return pos == npos ? end() : begin() + static_cast<difference_type>(pos);
		}
		template <class K, class KE = KeyEqual, class H = Hash,
			typename std::enable_if<has_is_transparent<KE>::value && has_is_transparent<H>::value>::type* = nullptr>
		OMAP_ALWAYS_INLINE auto find(const K& x) const -> const_iterator
		{
			const size_t pos = this->find_pos(x);
			return pos == npos ? end() : begin() + static_cast<difference_type>(pos);
		}

		/// @brief Returns the position of key, or npos if not found
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

		/// @brief Returns a pointer to the mapped value of key, or nullptr if not found
		OMAP_ALWAYS_INLINE auto get(const Key& key) -> T*
		{
			const size_t pos = this->find_pos(key);
			return pos == npos ? nullptr : std::addressof(this->d_store[pos].second);
		}
		OMAP_ALWAYS_INLINE auto get(const Key& key) const -> const T*
		{
			const size_t pos = this->find_pos(key);
			return pos == npos ? nullptr : std::addressof(this->d_store[pos].second);
		}
		template <class K, class KE = KeyEqual, class H = Hash,
			typename std::enable_if<has_is_transparent<KE>::value && has_is_transparent<H>::value>::type* = nullptr>
		OMAP_ALWAYS_INLINE auto get(const K& x) const -> const T*
		{
			const size_t pos = this->find_pos(x);
			return pos == npos ? nullptr : std::addressof(this->d_store[pos].second);
		}

		/// @brief Returns the position of key and a pointer to its stored value, or (npos, nullptr) if not found
		auto get_full(const Key& key) -> std::pair<size_type, value_type*>
		{
			const size_t pos = this->find_pos(key);
			return std::pair<size_type, value_type*>(pos, pos == npos ? nullptr : std::addressof(this->d_store[pos]));
		}
		auto get_full(const Key& key) const -> std::pair<size_type, const value_type*>
		{
			const size_t pos = this->find_pos(key);
			return std::pair<size_type, const value_type*>(pos, pos == npos ? nullptr : std::addressof(this->d_store[pos]));
		}
		/// @brief Returns pointers to the stored key and mapped value of key, or null pointers if not found
		auto get_key_value(const Key& key) -> std::pair<const Key*, T*>
		{
			const size_t pos = this->find_pos(key);
			if (pos == npos)
				return std::pair<const Key*, T*>(nullptr, nullptr);
			value_type& v = this->d_store[pos];
			return std::pair<const Key*, T*>(std::addressof(v.first), std::addressof(v.second));
		}
		auto get_key_value(const Key& key) const -> std::pair<const Key*, const T*>
		{
			const size_t pos = this->find_pos(key);
			if (pos == npos)
				return std::pair<const Key*, const T*>(nullptr, nullptr);
			const value_type& v = this->d_store[pos];
			return std::pair<const Key*, const T*>(std::addressof(v.first), std::addressof(v.second));
		}

		/// @brief Returns 1 of key exists, 0 otherwise
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

		/// @brief Returns true of key exists, false otherwise
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

		auto at(const Key& key) -> T&
		{
			const size_t pos = this->find_pos(key);
			if (pos == npos)
				throw std::out_of_range("ordered_map: key not found");
			return this->d_store[pos].second;
		}
		auto at(const Key& key) const -> const T&
		{
			const size_t pos = this->find_pos(key);
			if (pos == npos)
				throw std::out_of_range("ordered_map: key not found");
			return this->d_store[pos].second;
		}

		OMAP_ALWAYS_INLINE auto operator[](const Key& k) -> T&
		{
			return this->d_store[this->base_type::try_emplace(k).first].second;
		}
		OMAP_ALWAYS_INLINE auto operator[](Key&& k) -> T&
		{
			return this->d_store[this->base_type::try_emplace(std::move(k)).first].second;
		}

		/// @brief Returns a handle on the slot of key, hashing and probing only once
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

		/// @brief Returns a pointer to the value at position pos, or nullptr if pos >= size()
		auto get_index(size_type pos) noexcept -> value_type*
		{
			return pos < size() ? this->d_store.data() + pos : nullptr;
		}
		auto get_index(size_type pos) const noexcept -> const value_type*
		{
			return pos < size() ? this->d_store.data() + pos : nullptr;
		}
		/// @brief Checked positional access, throws std::out_of_range if pos >= size()
		auto at_index(size_type pos) -> value_type&
		{
			this->check_position(pos, size());
			return this->d_store[pos];
		}
		auto at_index(size_type pos) const -> const value_type&
		{
			this->check_position(pos, size());
			return this->d_store[pos];
		}
		/// @brief Returns an iterator to the value at position pos (unchecked)
		auto nth(size_type pos) noexcept -> iterator
		{
			OMAP_ASSERT_DEBUG(pos <= size(), "ordered_map: position out of range");
			return begin() + static_cast<difference_type>(pos);
		}
		auto nth(size_type pos) const noexcept -> const_iterator
		{
			OMAP_ASSERT_DEBUG(pos <= size(), "ordered_map: position out of range");
			return begin() + static_cast<difference_type>(pos);
		}
		auto index_of(const_iterator it) const noexcept -> size_type
		{
			return static_cast<size_type>(it - begin());
		}
		auto first() noexcept -> value_type* { return get_index(0); }
		auto first() const noexcept -> const value_type* { return get_index(0); }
		auto last() noexcept -> value_type* { return empty() ? nullptr : get_index(size() - 1U); }
		auto last() const noexcept -> const value_type* { return empty() ? nullptr : get_index(size() - 1U); }

		/// @brief Returns a view over positions [first, last), throws std::out_of_range for an invalid range
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

		/// @brief Returns a handle on the value at position pos, throws std::out_of_range if pos >= size()
		auto get_index_entry(size_type pos) -> indexed_entry_type
		{
			return indexed_entry_type(base(), pos);
		}


		//
		// Insertion
		//

		template< class... Args >
		OMAP_ALWAYS_INLINE auto emplace(Args&&... args) -> std::pair<iterator, bool>
		{
			auto res = this->base_type::emplace(std::forward<Args>(args)...);
			return std::pair<iterator, bool>(nth(res.first), res.second);
		}
		template <class... Args>
		OMAP_ALWAYS_INLINE auto emplace_hint(const_iterator hint, Args&&... args) -> iterator
		{
			(void)hint;
			return emplace(std::forward<Args>(args)...).first;
		}
		OMAP_ALWAYS_INLINE auto insert(const value_type& value) -> std::pair<iterator, bool>
		{
			return try_emplace(value.first, value.second);
		}
		OMAP_ALWAYS_INLINE auto insert(value_type&& value) -> std::pair<iterator, bool>
		{
			return try_emplace(std::move(value.first), std::move(value.second));
		}
		template< class P, typename std::enable_if<std::is_constructible<value_type, P>::value, int>::type = 0 >
		OMAP_ALWAYS_INLINE auto insert(P&& value) -> std::pair<iterator, bool>
		{
			return emplace(std::forward<P>(value));
		}
		OMAP_ALWAYS_INLINE auto insert(const_iterator hint, const value_type& value) -> iterator
		{
			(void)hint;
			return insert(value).first;
		}
		OMAP_ALWAYS_INLINE auto insert(const_iterator hint, value_type&& value) -> iterator
		{
			(void)hint;
			return insert(std::move(value)).first;
		}
		/// @brief Insert the values of [first, last) whose key is absent. Existing keys are left untouched.
		template< class InputIt >
		void insert(InputIt first, InputIt last)
		{
			for (; first != last; ++first)
				emplace(*first);
		}
		void insert(std::initializer_list<value_type> ilist)
		{
			insert(ilist.begin(), ilist.end());
		}

		template< class... Args >
		OMAP_ALWAYS_INLINE auto try_emplace(const Key& k, Args&&... args) -> std::pair<iterator, bool>
		{
			auto res = this->base_type::try_emplace(k, std::forward<Args>(args)...);
			return std::pair<iterator, bool>(nth(res.first), res.second);
		}
		template< class... Args >
		OMAP_ALWAYS_INLINE auto try_emplace(Key&& k, Args&&... args) -> std::pair<iterator, bool>
		{
			auto res = this->base_type::try_emplace(std::move(k), std::forward<Args>(args)...);
			return std::pair<iterator, bool>(nth(res.first), res.second);
		}
		template< class... Args >
		OMAP_ALWAYS_INLINE auto try_emplace(const_iterator hint, const Key& k, Args&&... args) -> iterator
		{
			(void)hint;
			return try_emplace(k, std::forward<Args>(args)...).first;
		}
		template< class... Args >
		OMAP_ALWAYS_INLINE auto try_emplace(const_iterator hint, Key&& k, Args&&... args) -> iterator
		{
			(void)hint;
			return try_emplace(std::move(k), std::forward<Args>(args)...).first;
		}

		template <class M>
		OMAP_ALWAYS_INLINE auto insert_or_assign(const Key& k, M&& obj) -> std::pair<iterator, bool>
		{
			auto inserted = try_emplace(k, std::forward<M>(obj));
			if (!inserted.second)
				inserted.first->second = std::forward<M>(obj);
			return inserted;
		}
		template <class M>
		OMAP_ALWAYS_INLINE auto insert_or_assign(Key&& k, M&& obj) -> std::pair<iterator, bool>
		{
			auto inserted = try_emplace(std::move(k), std::forward<M>(obj));
			if (!inserted.second)
				inserted.first->second = std::forward<M>(obj);
			return inserted;
		}
		template <class M>
		OMAP_ALWAYS_INLINE auto insert_or_assign(const_iterator hint, const Key& k, M&& obj) -> iterator
		{
			(void)hint;
			return insert_or_assign(k, std::forward<M>(obj)).first;
		}
		template <class M>
		OMAP_ALWAYS_INLINE auto insert_or_assign(const_iterator hint, Key&& k, M&& obj) -> iterator
		{
			(void)hint;
			return insert_or_assign(std::move(k), std::forward<M>(obj)).first;
		}

		/// @brief Insert or overwrite the mapped value of key.
		/// A new key is appended at the end, an existing key keeps its position.
		/// @return the key position and the previous mapped value, if any
		auto insert_full(key_type key, mapped_type value) -> std::pair<size_type, std::optional<T> >
		{
			const size_t hash = this->hash_key(key);
			const size_t pos = this->find_hash(hash, key);
			if (pos != npos) {
				std::optional<T> old(std::move(this->d_store[pos].second));
				this->d_store[pos].second = std::move(value);
				return std::pair<size_type, std::optional<T> >(pos, std::move(old));
			}
			return std::pair<size_type, std::optional<T> >(this->emplace_key_at(size(), hash, std::move(key), std::move(value)), std::nullopt);
		}

		/// @brief Insert a new key at its sorted position using less, or overwrite the mapped value of an existing key in place.
		/// The map must already be sorted by key with less for the result to be sorted.
		/// @return the key position and the previous mapped value, if any
		template<class Less = std::less<> >
		auto insert_sorted(key_type key, mapped_type value, Less less = Less()) -> std::pair<size_type, std::optional<T> >
		{
			const size_t hash = this->hash_key(key);
			const size_t pos = this->find_hash(hash, key);
			if (pos != npos) {
				std::optional<T> old(std::move(this->d_store[pos].second));
				this->d_store[pos].second = std::move(value);
				return std::pair<size_type, std::optional<T> >(pos, std::move(old));
			}
			const size_t at = sorted_position(key, less);
			return std::pair<size_type, std::optional<T> >(this->emplace_key_at(at, hash, std::move(key), std::move(value)), std::nullopt);
		}

		/// @brief Insert a new value at its sorted position using less(const value_type&, const value_type&),
		/// or overwrite the mapped value of an existing key in place.
		/// The map must already be sorted with less for the result to be sorted.
		/// @return the key position and the previous mapped value, if any
		template<class Less>
		auto insert_sorted_by(key_type key, mapped_type value, Less less) -> std::pair<size_type, std::optional<T> >
		{
			const size_t hash = this->hash_key(key);
			const size_t pos = this->find_hash(hash, key);
			if (pos != npos) {
				std::optional<T> old(std::move(this->d_store[pos].second));
				this->d_store[pos].second = std::move(value);
				return std::pair<size_type, std::optional<T> >(pos, std::move(old));
			}
			value_type v(std::move(key), std::move(value));
			const size_t at = this->base_type::partition_point(0, size(), [&](const value_type& o) { return less(o, static_cast<const value_type&>(v)); });
			return std::pair<size_type, std::optional<T> >(this->emplace_key_at(at, hash, std::move(v.first), std::move(v.second)), std::nullopt);
		}

		/// @brief Insert key before the value currently at position index (index <= size()).
		/// 
		/// A new key is inserted at index. An existing key gets the new mapped value and is moved,
		/// preserving the order of the other values: it ends at index - 1 if it was located before index,
		/// at index otherwise. Throws std::out_of_range if index > size().
		/// @return the final key position and the previous mapped value, if any
		auto insert_before(size_type index, key_type key, mapped_type value) -> std::pair<size_type, std::optional<T> >
		{
			this->check_position(index, size() + 1U);
			const size_t hash = this->hash_key(key);
			const size_t pos = this->find_hash(hash, key);
			if (pos != npos) {
				std::optional<T> old(std::move(this->d_store[pos].second));
				this->d_store[pos].second = std::move(value);
				const size_t to = pos < index ? index - 1U : index;
				this->base_type::move_index(pos, to);
				return std::pair<size_type, std::optional<T> >(to, std::move(old));
			}
			return std::pair<size_type, std::optional<T> >(this->emplace_key_at(index, hash, std::move(key), std::move(value)), std::nullopt);
		}

		/// @brief Insert key at position index, shifting the following values.
		/// An existing key gets the new mapped value and is moved to index (index < size()),
		/// a new key requires index <= size(). Throws std::out_of_range otherwise.
		/// @return the previous mapped value, if any
		auto shift_insert(size_type index, key_type key, mapped_type value) -> std::optional<T>
		{
			const size_t hash = this->hash_key(key);
			const size_t pos = this->find_hash(hash, key);
			if (pos != npos) {
				this->check_position(index, size());
				std::optional<T> old(std::move(this->d_store[pos].second));
				this->d_store[pos].second = std::move(value);
				this->base_type::move_index(pos, index);
				return old;
			}
			this->check_position(index, size() + 1U);
			this->emplace_key_at(index, hash, std::move(key), std::move(value));
			return std::nullopt;
		}

		/// @brief Insert or overwrite all values of [first, last) in order. The last value wins for duplicate keys.
		template< class InputIt >
		void extend(InputIt first, InputIt last)
		{
			this->base_type::extend(first, last);
		}
		void extend(std::initializer_list<value_type> ilist)
		{
			extend(ilist.begin(), ilist.end());
		}

		/// @brief Move all values of other at the end of this map, in order. 
		/// Keys already present get the mapped value of other without changing position.
		/// other is left empty with its capacity.
		void append(ordered_map& other)
		{
			this->base_type::append(other);
		}


		//
		// Removal
		//

		/// @brief Remove the value at pos, preserving the order of the others
		/// @return iterator following the removed value
		auto erase(const_iterator pos) -> iterator
		{
			const size_type p = index_of(pos);
			this->base_type::shift_erase(p);
			return nth(p);
		}
		auto erase(iterator pos) -> iterator
		{
			return erase(const_iterator(pos));
		}
		auto erase(const_iterator first, const_iterator last) -> iterator
		{
			const size_type f = index_of(first);
			this->base_type::erase_range(f, index_of(last));
			return nth(f);
		}
		/// @brief Remove key, preserving the order of the other values. Returns the number of removed values.
		auto erase(const Key& key) -> size_type
		{
			const size_t pos = this->find_pos(key);
			if (pos == npos)
				return 0;
			this->base_type::shift_erase(pos);
			return 1;
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

		/// @brief Remove key by shifting all following values one position down (linear time)
		/// @return the removed mapped value, if any
		auto shift_remove(const Key& key) -> std::optional<T>
		{
			const size_t pos = this->find_pos(key);
			if (pos == npos)
				return std::nullopt;
			return std::optional<T>(this->base_type::shift_take(pos).second);
		}
		auto shift_remove_entry(const Key& key) -> std::optional<value_type>
		{
			const size_t pos = this->find_pos(key);
			if (pos == npos)
				return std::nullopt;
			return std::optional<value_type>(this->base_type::shift_take(pos));
		}
		/// @brief Remove key by moving the last value at its position (constant time)
		/// @return the removed mapped value, if any
		auto swap_remove(const Key& key) -> std::optional<T>
		{
			const size_t pos = this->find_pos(key);
			if (pos == npos)
				return std::nullopt;
			return std::optional<T>(this->base_type::swap_take(pos).second);
		}
		auto swap_remove_entry(const Key& key) -> std::optional<value_type>
		{
			const size_t pos = this->find_pos(key);
			if (pos == npos)
				return std::nullopt;
			return std::optional<value_type>(this->base_type::swap_take(pos));
		}
		/// @brief Remove the value at position pos, preserving order. Returns an empty optional if pos >= size().
		auto shift_remove_index(size_type pos) -> std::optional<value_type>
		{
			if (pos >= size())
				return std::nullopt;
			return std::optional<value_type>(this->base_type::shift_take(pos));
		}
		/// @brief Remove the value at position pos, moving the last one in its place. Returns an empty optional if pos >= size().
		auto swap_remove_index(size_type pos) -> std::optional<value_type>
		{
			if (pos >= size())
				return std::nullopt;
			return std::optional<value_type>(this->base_type::swap_take(pos));
		}
		/// @brief Remove and return the last value
		auto pop() -> std::optional<value_type>
		{
			if (empty())
				return std::nullopt;
			return std::optional<value_type>(this->base_type::swap_take(size() - 1U));
		}
		/// @brief Keep the first count values
		void truncate(size_type count)
		{
			this->base_type::truncate(count);
		}
		/// @brief Remove and return the values of positions [first, last) in order
		auto drain(size_type first, size_type last) -> std::vector<value_type, Allocator>
		{
			return this->base_type::drain(first, last);
		}
		/// @brief Replace positions [first, last) by the values of [ifirst, ilast) and return the removed values in order.
		/// 
		/// The range is removed first (std::out_of_range is thrown for an invalid range, leaving the map untouched).
		/// Then each new value whose key is present elsewhere in the map overwrites the mapped value in place,
		/// and the other ones are inserted in order at the place of the removed range. The last value wins for duplicate keys.
		template< class InputIt >
		auto splice(size_type first, size_type last, InputIt ifirst, InputIt ilast) -> std::vector<value_type, Allocator>
		{
			std::vector<value_type, Allocator> removed = this->base_type::drain(first, last);
			size_t at = first;
			for (; ifirst != ilast; ++ifirst) {
				value_type v(*ifirst);
				const size_t hash = this->hash_key(v.first);
				const size_t pos = this->find_hash(hash, v.first);
				if (pos != npos)
					this->d_store[pos].second = std::move(v.second);
				else
					this->emplace_key_at(at++, hash, std::move(v.first), std::move(v.second));
			}
			return removed;
		}
		auto splice(size_type first, size_type last, std::initializer_list<value_type> ilist) -> std::vector<value_type, Allocator>
		{
			return splice(first, last, ilist.begin(), ilist.end());
		}

		/// @brief Move the values of positions [at, size()) to a new map, throws std::out_of_range if at > size()
		auto split_off(size_type at) -> ordered_map
		{
			ordered_map res(hash_function(), key_eq(), get_allocator());
			res.max_load_factor(max_load_factor());
			this->base_type::split_into(at, res);
			return res;
		}

		/// @brief Remove all values for which pred(key, value) returns false, preserving the order of the others.
		/// pred can modify the mapped value.
		/// @return the number of removed values
		template<class Pred>
		auto retain(Pred pred) -> size_type
		{
			return this->base_type::retain(KeyValuePred<Pred>{ pred });
		}

		/// @brief Lazy removal of the values for which pred(key, value) returns true.
		/// 
		/// Returns a single pass range over the removed values, in order. Each value is removed when the range reaches it
		/// and stays valid (and movable) until the range advances. The map is compacted and its index rebuilt when the returned object is destroyed:
		/// values not visited at that point are kept. The map must not be used while the returned object is alive.
		template<class Pred>
		auto extract_if(Pred pred) -> extract_if_type<Pred>
		{
			return extract_if_type<Pred>(base(), KeyValuePred<Pred>{ std::move(pred) }, 0, size());
		}
		/// @brief Same as extract_if(pred), restricted to positions [first, last)
		template<class Pred>
		auto extract_if(size_type first, size_type last, Pred pred) -> extract_if_type<Pred>
		{
			return extract_if_type<Pred>(base(), KeyValuePred<Pred>{ std::move(pred) }, first, last);
		}


		//
		// Reordering
		//

		/// @brief Stable sort of the values with less(const value_type&, const value_type&)
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
		/// @brief Stable sort of the values by fun(key, value)
		template<class KeyFun>
		void sort_by_key(KeyFun fun)
		{
			this->base_type::sort_range(0, size(), [&](const value_type& a, const value_type& b) { return fun(a.first, a.second) < fun(b.first, b.second); }, true);
		}
		/// @brief Stable sort of the values by fun(key, value), calling fun once per value
		template<class KeyFun>
		void sort_by_cached_key(KeyFun fun)
		{
			this->base_type::sort_range_by_cached_key(0, size(), [&](const value_type& v) { return fun(v.first, v.second); });
		}
		/// @brief Stable sort of the values by key
		template<class Less = std::less<> >
		void sort_keys(Less less = Less())
		{
			this->base_type::sort_range(0, size(), KeyLess<Less>{ less }, true);
		}
		template<class Less = std::less<> >
		void sort_unstable_keys(Less less = Less())
		{
			this->base_type::sort_range(0, size(), KeyLess<Less>{ less }, false);
		}
		void reverse()
		{
			this->base_type::reverse_range(0, size());
		}
		/// @brief Move the value at position from to position to, shifting the values in between.
		/// Throws std::out_of_range if a position is >= size().
		void move_index(size_type from, size_type to)
		{
			this->base_type::move_index(from, to);
		}
		/// @brief Swap the values at positions a and b. Throws std::out_of_range if a position is >= size().
		void swap_indices(size_type a, size_type b)
		{
			this->base_type::swap_indices(a, b);
		}


		//
		// Search in a sorted map
		//

		/// @brief Binary search of key in a map sorted by key with less.
		/// Returns the matching position and true, or the insertion position and false.
		template<class K, class Less = std::less<> >
		auto binary_search_keys(const K& key, Less less = Less()) const -> std::pair<size_type, bool>
		{
			return as_slice().binary_search_keys(key, less);
		}
		/// @brief Binary search with cmp(const value_type&) returning a negative value, 0 or a positive value 
		template<class Cmp>
		auto binary_search_by(Cmp cmp) const -> std::pair<size_type, bool>
		{
			return this->base_type::binary_search_by(0, size(), cmp);
		}
		/// @brief Binary search of b in a map sorted by fun(key, value) using operator<
		template<class B, class KeyFun>
		auto binary_search_by_key(const B& b, KeyFun fun) const -> std::pair<size_type, bool>
		{
			return binary_search_by([&](const value_type& v) {
				const auto k = fun(v.first, v.second);
				return k < b ? -1 : (b < k ? 1 : 0);
			});
		}
		/// @brief Returns the first position for which pred(const value_type&) is false, the map being partitioned by pred
		template<class Pred>
		auto partition_point(Pred pred) const -> size_type
		{
			return this->base_type::partition_point(0, size(), pred);
		}

		/// @brief Remove all values satisfying pred(const value_type&), preserving order. Returns the number of removed values.
		template<class Pred>
		friend auto erase_if(ordered_map& m, Pred pred) -> size_type
		{
			return m.base()->retain([&](value_type& v) { return !pred(static_cast<const value_type&>(v)); });
		}
	};


	template<class K, class T, class H, class E, class A>
	bool operator==(const ordered_map<K, T, H, E, A>& a, const ordered_map<K, T, H, E, A>& b)
	{
		return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin());
	}
	template<class K, class T, class H, class E, class A>
	bool operator!=(const ordered_map<K, T, H, E, A>& a, const ordered_map<K, T, H, E, A>& b)
	{
		return !(a == b);
	}
	/// @brief Lexicographical comparison of the values in order
	template<class K, class T, class H, class E, class A>
	bool operator<(const ordered_map<K, T, H, E, A>& a, const ordered_map<K, T, H, E, A>& b)
	{
		return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end());
	}
	template<class K, class T, class H, class E, class A>
	bool operator>(const ordered_map<K, T, H, E, A>& a, const ordered_map<K, T, H, E, A>& b)
	{
		return b < a;
	}
	template<class K, class T, class H, class E, class A>
	bool operator<=(const ordered_map<K, T, H, E, A>& a, const ordered_map<K, T, H, E, A>& b)
	{
		return !(b < a);
	}
	template<class K, class T, class H, class E, class A>
	bool operator>=(const ordered_map<K, T, H, E, A>& a, const ordered_map<K, T, H, E, A>& b)
	{
		return !(a < b);
	}

	template<class K, class T, class H, class E, class A>
	void swap(ordered_map<K, T, H, E, A>& a, ordered_map<K, T, H, E, A>& b)
	{
		a.swap(b);
	}
}

namespace std
{
	/// @brief Order sensitive hash of an ordered_map
	template<class K, class T, class H, class E, class A>
	struct hash<omap::ordered_map<K, T, H, E, A> >
	{
		auto operator()(const omap::ordered_map<K, T, H, E, A>& m) const -> size_t
		{
			return omap::hash_sequence(m.begin(), m.end(), omap::hasher<std::pair<K, T> >());
		}
	};
}

/** @}*/
//end containers

#endif
