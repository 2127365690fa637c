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

#ifndef OMAP_ORDERED_TABLE_HPP
#define OMAP_ORDERED_TABLE_HPP

/** @file */

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <tuple>
#include <vector>

#include "hash_utils.hpp"
#include "index_table.hpp"
#include "../utils.hpp"

namespace omap
{
	namespace detail
	{
		// Construct a value from a key and the mapped value arguments at the back of the dense storage
		template<bool HasValue>
		struct EmplaceKey
		{
			template<class Store, class K, class... Args >
			static OMAP_ALWAYS_INLINE void emplace_back(Store& s, K&& key, Args&&... args)
			{
				s.emplace_back(std::piecewise_construct,
					std::forward_as_tuple(std::forward<K>(key)),
					std::forward_as_tuple(std::forward<Args>(args)...));
			}
		};
		template<>
		struct EmplaceKey<false>
		{
			template<class Store, class K >
			static OMAP_ALWAYS_INLINE void emplace_back(Store& s, K&& key)
			{
				s.emplace_back(std::forward<K>(key));
			}
		};

		inline void throw_out_of_range(const char* what)
		{
			throw std::out_of_range(what);
		}


		/// @brief Base class of ordered_map and ordered_set.
		/// Values are stored in a std::vector in insertion order, and an IndexTable maps key hashes to positions within that vector.
		/// Every member keeps the index consistent with the vector before returning.
		template< class Key, class Value, class Hash, class Equal, class Allocator>
		struct OrderedTable : public HashEqual<Hash, Equal>
		{
			using base_type = HashEqual<Hash, Equal>;
			using extract_key = ExtractKey<Key, Value>;
			using value_type = Value;
			using key_type = Key;
			using mapped_type = typename extract_key::mapped_type;
			using allocator_type = Allocator;
			using store_type = std::vector<Value, Allocator>;
			using index_type = IndexTable<Allocator>;
			using node_type = typename index_type::node_type;
			using iterator = typename store_type::iterator;
			using const_iterator = typename store_type::const_iterator;
			static constexpr size_t npos = static_cast<size_t>(-1);

			store_type	d_store;	// values in iteration order
			index_type	d_index;	// key hash -> position in d_store

			// Returns the hash value of the key stored at given position
			struct HashAt
			{
				const OrderedTable* table;
				OMAP_ALWAYS_INLINE auto operator()(size_t pos) const -> size_t
				{
					return table->hash_key(extract_key::key(table->d_store[pos]));
				}
			};
			OMAP_ALWAYS_INLINE auto hash_at() const noexcept -> HashAt { return HashAt{ this }; }

			OrderedTable(const Hash& hash, const Equal& equal, const Allocator& alloc)
				:base_type(hash, equal), d_store(alloc), d_index(alloc)
			{}
			OrderedTable(const OrderedTable& other, const Allocator& alloc)
				:base_type(other), d_store(other.d_store, alloc), d_index(other.d_index, alloc)
			{}
			OrderedTable(OrderedTable&& other) noexcept(std::is_nothrow_copy_constructible<base_type>::value)
				:base_type(other), d_store(std::move(other.d_store)), d_index(std::move(other.d_index))
			{}
			OrderedTable(OrderedTable&& other, const Allocator& alloc)
				:base_type(other), d_store(std::move(other.d_store), alloc), d_index(std::move(other.d_index), alloc)
			{
				other.clear();
			}

			auto operator=(const OrderedTable& other) -> OrderedTable&
			{
				if (this != std::addressof(other)) {
					try {
						d_store = other.d_store;
						d_index.copy_from(other.d_index);
					}
					catch (...) {
						d_store.clear();
						d_index.release();
						throw;
					}
					static_cast<base_type&>(*this) = static_cast<const base_type&>(other);
				}
				return *this;
			}
			auto operator=(OrderedTable&& other) -> OrderedTable&
			{
				if (this != std::addressof(other)) {
					try {
						d_store = std::move(other.d_store);
						d_index.move_from(other.d_index);
					}
					catch (...) {
						d_store.clear();
						d_index.release();
						throw;
					}
					static_cast<base_type&>(*this) = static_cast<const base_type&>(other);
					other.clear();
				}
				return *this;
			}

			void swap(OrderedTable& other)
			{
				if (this != std::addressof(other)) {
					d_store.swap(other.d_store);
					d_index.swap(other.d_index);
					this->swap_hash_equal(other);
				}
			}

			OMAP_ALWAYS_INLINE auto size() const noexcept -> size_t { return d_store.size(); }
			OMAP_ALWAYS_INLINE auto empty() const noexcept -> bool { return d_store.empty(); }
			auto get_allocator() const noexcept -> Allocator { return d_store.get_allocator(); }
			auto capacity() const noexcept -> size_t { return std::min(d_store.capacity(), d_index.capacity()); }

			void reserve(size_t count)
			{
				d_store.reserve(count);
				d_index.reserve(count, hash_at());
			}
			void shrink_to_fit()
			{
				d_store.shrink_to_fit();
				d_index.shrink_to_fit(hash_at());
			}
			void rehash()
			{
				d_index.rebuild(size(), hash_at());
			}
			void clear() noexcept
			{
				d_store.clear();
				d_index.clear();
			}

			void check_position(size_t pos, size_t bound) const
			{
				if (OMAP_UNLIKELY(pos >= bound))
					throw_out_of_range("ordered container: position out of range");
			}

			/// @brief Key lookup, returns the key position or npos
			template< class K>
			OMAP_ALWAYS_INLINE auto find_hash(size_t hash, const K& key) const -> size_t
			{
				const node_type* n = d_index.find(hash, [&](size_t pos) { return this->equal_keys(extract_key::key(d_store[pos]), key); });
				return n ? n->pos() : npos;
			}
			template< class K>
			OMAP_ALWAYS_INLINE auto find_pos(const K& key) const -> size_t
			{
				return find_hash(this->hash_key(key), key);
			}

			void move_back_to(size_t pos, size_t hash)
			{
				// The last value is not indexed yet: shift positions [pos, last) and rotate it to pos
				const size_t last = d_store.size() - 1U;
				if (pos != last) {
					d_index.shift_positions(pos, last, 1, hash_at());
					std::rotate(d_store.begin() + static_cast<std::ptrdiff_t>(pos), d_store.begin() + static_cast<std::ptrdiff_t>(last), d_store.end());
				}
				d_index.insert_node(hash, pos);
			}

			/// @brief Insert a value built from args at position pos. The key must be absent.
			template<class... Args>
			auto emplace_value_at(size_t pos, size_t hash, Args&&... args) -> size_t
			{
				d_index.grow_for_insert(hash_at());
				d_store.emplace_back(std::forward<Args>(args)...);
				move_back_to(pos, hash);
				return pos;
			}
			/// @brief Insert a value built from key and mapped value args at position pos. The key must be absent.
			template<class K, class... Args>
			auto emplace_key_at(size_t pos, size_t hash, K&& key, Args&&... args) -> size_t
			{
				d_index.grow_for_insert(hash_at());
				EmplaceKey<extract_key::has_value>::emplace_back(d_store, std::forward<K>(key), std::forward<Args>(args)...);
				move_back_to(pos, hash);
				return pos;
			}

			template<class K, class... Args>
			auto try_emplace(K&& key, Args&&... args) -> std::pair<size_t, bool>
			{
				const size_t hash = this->hash_key(key);
				const size_t pos = find_hash(hash, key);
				if (pos != npos)
					return std::pair<size_t, bool>(pos, false);
				return std::pair<size_t, bool>(emplace_key_at(size(), hash, std::forward<K>(key), std::forward<Args>(args)...), true);
			}

			template<class... Args>
			auto emplace(Args&&... args) -> std::pair<size_t, bool>
			{
				// Build the value in place, then check for an existing key
				d_store.emplace_back(std::forward<Args>(args)...);
				const size_t pos = d_store.size() - 1U;
				try {
					const key_type& key = extract_key::key(d_store.back());
					const size_t hash = this->hash_key(key);
					const size_t found = find_hash(hash, key);
					if (found != npos) {
						d_store.pop_back();
						return std::pair<size_t, bool>(found, false);
					}
					d_index.grow_for_insert(hash_at());
					d_index.insert_node(hash, pos);
				}
				catch (...) {
					d_store.pop_back();
					throw;
				}
				return std::pair<size_t, bool>(pos, true);
			}

			/// @brief Append value if its key is absent, otherwise overwrite the mapped value (maps only).
			template<class V>
			auto assign_or_append(V&& value) -> std::pair<size_t, bool>
			{
				const size_t hash = this->hash_key(extract_key::key(value));
				const size_t pos = find_hash(hash, extract_key::key(value));
				if (pos != npos) {
					if constexpr (extract_key::has_value)
						d_store[pos].second = std::forward<V>(value).second;
					return std::pair<size_t, bool>(pos, false);
				}
				return std::pair<size_t, bool>(emplace_value_at(size(), hash, std::forward<V>(value)), true);
			}

			template<class Iter>
			void extend(Iter first, Iter last)
			{
				if constexpr (std::is_base_of<std::forward_iterator_tag, typename std::iterator_traits<Iter>::iterator_category>::value)
					reserve(size() + static_cast<size_t>(std::distance(first, last)));
				for (; first != last; ++first)
					assign_or_append(*first);
			}

			/// @brief Move all values of other at the end of this table, other is left empty
			void append(OrderedTable& other)
			{
				if (this == std::addressof(other))
					return;
				reserve(size() + other.size());
				for (value_type& v : other.d_store)
					assign_or_append(std::move(v));
				other.clear();
			}

			void unlink_shift(size_t pos)
			{
				// Remove the node of pos and shift the following positions
				d_index.erase_node(d_index.find_node(hash_at()(pos), pos));
				d_index.shift_positions(pos + 1U, size(), -1, hash_at());
			}
			void unlink_swap(size_t pos)
			{
				// Remove the node of pos and give its position to the last value
				const size_t last = size() - 1U;
				d_index.erase_node(d_index.find_node(hash_at()(pos), pos));
				if (pos != last)
					d_index.find_node(hash_at()(last), last)->set_pos(pos);
			}
			auto unlink_range(size_t first, size_t last) -> bool
			{
				// Remove the nodes of [first, last) and shift the following positions.
				// Returns false if the index must be rebuilt once the values are removed.
				const size_t len = size();
				if (last - first > len / 2U)
					return false;
				for (size_t p = first; p < last; ++p)
					d_index.erase_node(d_index.find_node(hash_at()(p), p));
				d_index.shift_positions(last, len, -static_cast<std::ptrdiff_t>(last - first), hash_at());
				return true;
			}

			void shift_erase(size_t pos)
			{
				unlink_shift(pos);
				d_store.erase(d_store.begin() + static_cast<std::ptrdiff_t>(pos));
			}
			auto shift_take(size_t pos) -> value_type
			{
				unlink_shift(pos);
				value_type res(std::move(d_store[pos]));
				d_store.erase(d_store.begin() + static_cast<std::ptrdiff_t>(pos));
				return res;
			}
			void swap_erase(size_t pos)
			{
				unlink_swap(pos);
				if (pos != size() - 1U)
					d_store[pos] = std::move(d_store.back());
				d_store.pop_back();
			}
			auto swap_take(size_t pos) -> value_type
			{
				unlink_swap(pos);
				value_type res(std::move(d_store[pos]));
				if (pos != size() - 1U)
					d_store[pos] = std::move(d_store.back());
				d_store.pop_back();
				return res;
			}

			void erase_range(size_t first, size_t last)
			{
				if (first > last || last > size())
					throw_out_of_range("ordered container: invalid range");
				if (first == last)
					return;
				const bool linked = unlink_range(first, last);
				d_store.erase(d_store.begin() + static_cast<std::ptrdiff_t>(first), d_store.begin() + static_cast<std::ptrdiff_t>(last));
				if (!linked)
					d_index.rebuild(size(), hash_at());
			}
			auto drain(size_t first, size_t last) -> store_type
			{
				if (first > last || last > size())
					throw_out_of_range("ordered container: invalid range");
				store_type res(d_store.get_allocator());
				if (first == last)
					return res;
				res.reserve(last - first);
				const bool linked = unlink_range(first, last);
				std::move(d_store.begin() + static_cast<std::ptrdiff_t>(first), d_store.begin() + static_cast<std::ptrdiff_t>(last), std::back_inserter(res));
				d_store.erase(d_store.begin() + static_cast<std::ptrdiff_t>(first), d_store.begin() + static_cast<std::ptrdiff_t>(last));
				if (!linked)
					d_index.rebuild(size(), hash_at());
				return res;
			}
			void truncate(size_t count)
			{
				if (count < size())
					erase_range(count, size());
			}
			/// @brief Move values [at, size()) to out, which must be empty
			void split_into(size_t at, OrderedTable& out)
			{
				if (at > size())
					throw_out_of_range("ordered container: split position out of range");
				out.d_store.reserve(size() - at);
				const bool linked = unlink_range(at, size());
				std::move(d_store.begin() + static_cast<std::ptrdiff_t>(at), d_store.end(), std::back_inserter(out.d_store));
				d_store.erase(d_store.begin() + static_cast<std::ptrdiff_t>(at), d_store.end());
				if (!linked)
					d_index.rebuild(size(), hash_at());
				out.d_index.rebuild(out.size(), out.hash_at());
			}

			void compact(size_t count)
			{
				// Keep the first count values, used after an in place compaction.
				// Never allocates: called from ExtractIf destructor.
				if (count != size()) {
					d_store.erase(d_store.begin() + static_cast<std::ptrdiff_t>(count), d_store.end());
					d_index.rebuild_in_place(count, hash_at());
				}
			}

			/// @brief Remove values for which keep(value) returns false, preserving the order of the others.
			/// If keep throws, the values not yet visited are kept and the table stays consistent.
			template<class Pred>
			auto retain(Pred keep) -> size_t
			{
				const size_t len = size();
				size_t w = 0;
				size_t r = 0;
				try {
					for (; r < len; ++r) {
						if (keep(d_store[r])) {
							if (w != r)
								d_store[w] = std::move(d_store[r]);
							++w;
						}
					}
				}
				catch (...) {
					for (; r < len; ++r, ++w)
						if (w != r)
							d_store[w] = std::move(d_store[r]);
					compact(w);
					throw;
				}
				compact(w);
				return len - w;
			}

			/// @brief Reorder [first, first + order.size()): position first + i receives the value previously at order[i]
			void permute_range(size_t first, const std::vector<size_t>& order)
			{
				const size_t count = order.size();
				const bool whole = count > size() / 2U;
				std::vector<node_type*> nodes;
				if (!whole) {
					nodes.resize(count);
					for (size_t i = 0; i < count; ++i)
						nodes[i] = d_index.find_node(hash_at()(first + i), first + i);
				}
				store_type tmp(d_store.get_allocator());
				tmp.reserve(count);
				for (size_t i = 0; i < count; ++i)
					tmp.push_back(std::move(d_store[order[i]]));
				for (size_t i = 0; i < count; ++i)
					d_store[first + i] = std::move(tmp[i]);

				if (whole)
					d_index.rebuild(size(), hash_at());
				else {
					for (size_t i = 0; i < count; ++i)
						nodes[order[i] - first]->set_pos(first + i);
				}
			}

			/// @brief Sort [first, last) with less(value, value). 
			/// A permutation is sorted first, so the table is unchanged if less throws.
			template<class Less>
			void sort_range(size_t first, size_t last, Less less, bool stable)
			{
				if (last - first < 2U)
					return;
				std::vector<size_t> order(last - first);
				for (size_t i = 0; i < order.size(); ++i)
					order[i] = first + i;
				auto cmp = [&](size_t a, size_t b) { return less(d_store[a], d_store[b]); };
				if (stable)
					std::stable_sort(order.begin(), order.end(), cmp);
				else
					std::sort(order.begin(), order.end(), cmp);
				permute_range(first, order);
			}

			/// @brief Stable sort of [first, last) by key(value), calling key once per value
			template<class KeyFun>
			void sort_range_by_cached_key(size_t first, size_t last, KeyFun key)
			{
				using cached_type = typename std::decay<decltype(key(std::declval<const value_type&>()))>::type;
				if (last - first < 2U)
					return;
				std::vector<std::pair<cached_type, size_t> > keys;
				keys.reserve(last - first);
				for (size_t p = first; p < last; ++p)
					keys.emplace_back(key(static_cast<const value_type&>(d_store[p])), p);
				std::stable_sort(keys.begin(), keys.end(), [](const std::pair<cached_type, size_t>& a, const std::pair<cached_type, size_t>& b) { return a.first < b.first; });
				std::vector<size_t> order(keys.size());
				for (size_t i = 0; i < keys.size(); ++i)
					order[i] = keys[i].second;
				permute_range(first, order);
			}

			void reverse_range(size_t first, size_t last)
			{
				if (last - first < 2U)
					return;
				if (first == 0 && last == size()) {
					std::reverse(d_store.begin(), d_store.end());
					d_index.reverse_positions(size());
					return;
				}
				std::vector<size_t> order(last - first);
				for (size_t i = 0; i < order.size(); ++i)
					order[i] = last - 1U - i;
				permute_range(first, order);
			}

			/// @brief Move the value at from to position to, shifting the values in between
			void move_index(size_t from, size_t to)
			{
				check_position(from, size());
				check_position(to, size());
				if (from == to)
					return;
				node_type* n = d_index.find_node(hash_at()(from), from);
				n->set_pos(node_type::moving_pos);
				if (from < to) {
					d_index.shift_positions(from + 1U, to + 1U, -1, hash_at());
					std::rotate(d_store.begin() + static_cast<std::ptrdiff_t>(from), d_store.begin() + static_cast<std::ptrdiff_t>(from + 1U), d_store.begin() + static_cast<std::ptrdiff_t>(to + 1U));
				}
				else {
					d_index.shift_positions(to, from, 1, hash_at());
					std::rotate(d_store.begin() + static_cast<std::ptrdiff_t>(to), d_store.begin() + static_cast<std::ptrdiff_t>(from), d_store.begin() + static_cast<std::ptrdiff_t>(from + 1U));
				}
				n->set_pos(to);
			}

			void swap_indices(size_t a, size_t b)
			{
				check_position(a, size());
				check_position(b, size());
				if (a == b)
					return;
				node_type* na = d_index.find_node(hash_at()(a), a);
				node_type* nb = d_index.find_node(hash_at()(b), b);
				na->set_pos(b);
				nb->set_pos(a);
				using std::swap;
				swap(d_store[a], d_store[b]);
			}

			/// @brief Binary search in [first, last). cmp(value) returns a negative value if value is ordered before the target,
			/// a positive value if ordered after, 0 on match.
			/// Returns the matching position and true, or the insertion position and false.
			template<class Cmp>
			auto binary_search_by(size_t first, size_t last, Cmp cmp) const -> std::pair<size_t, bool>
			{
				size_t lo = first;
				size_t hi = last;
				while (lo < hi) {
					const size_t mid = lo + (hi - lo) / 2U;
					const int c = cmp(d_store[mid]);
					if (c < 0)
						lo = mid + 1U;
					else if (c > 0)
						hi = mid;
					else
						return std::pair<size_t, bool>(mid, true);
				}
				return std::pair<size_t, bool>(lo, false);
			}
			/// @brief Returns the first position in [first, last) for which pred(value) is false
			template<class Pred>
			auto partition_point(size_t first, size_t last, Pred pred) const -> size_t
			{
				auto it = std::partition_point(d_store.begin() + static_cast<std::ptrdiff_t>(first), d_store.begin() + static_cast<std::ptrdiff_t>(last), pred);
				return static_cast<size_t>(it - d_store.begin());
			}

			/// @brief Check the bijection between index nodes and positions
			auto check_consistency() const -> bool
			{
				if (d_index.size() != size())
					return false;
				std::vector<char> seen(size(), 0);
				bool ok = true;
				d_index.for_each_node([&](const node_type& n, size_t) {
					const size_t p = n.pos();
					if (p >= size() || seen[p]) {
						ok = false;
						return;
					}
					seen[p] = 1;
					if (n.hash() != node_type::small_hash(hash_at()(p)))
						ok = false;
				});
				if (!ok)
					return false;
				for (size_t p = 0; p < size(); ++p)
					if (find_pos(extract_key::key(d_store[p])) != p)
						return false;
				return true;
			}
		};


		/// @brief Lazy removal of the values matching a predicate within a position range.
		/// Values are compacted while the sequence is consumed, the index is rebuilt once on destruction.
		/// The rebuild reuses the current buckets and does not allocate. It only calls the hash function,
		/// which must not throw for the destructor to be safe.
		/// The table must not be accessed by other means while the object is alive.
		template<class Table, class Pred>
		class ExtractIf
		{
		public:
			using value_type = typename Table::value_type;

		private:
			Table*	d_table;
			Pred	d_pred;
			size_t	d_read;		// next position to visit
			size_t	d_write;	// next position receiving a kept value
			size_t	d_end;		// end of the visited range
			size_t	d_removed;

			auto next() -> value_type*
			{
				while (d_read < d_end) {
					value_type& v = d_table->d_store[d_read];
					if (d_pred(v)) {
						++d_read;
						++d_removed;
						return &v;
					}
					if (d_write != d_read)
						d_table->d_store[d_write] = std::move(v);
					++d_write;
					++d_read;
				}
				return nullptr;
			}

		public:
			class iterator
			{
			public:
				using iterator_category = std::input_iterator_tag;
				using value_type = typename ExtractIf::value_type;
				using difference_type = std::ptrdiff_t;
				using pointer = value_type*;
				using reference = value_type&;

			private:
				ExtractIf* d_owner;
				value_type* d_value;

			public:

				iterator(ExtractIf* owner = nullptr, value_type* value = nullptr) noexcept : d_owner(owner), d_value(value) {}
				auto operator*() const noexcept -> reference { return *d_value; }
				auto operator->() const noexcept -> pointer { return d_value; }
				auto operator++() -> iterator& {
					d_value = d_owner->next();
					return *this;
				}
				bool operator==(const iterator& other) const noexcept { return d_value == other.d_value; }
				bool operator!=(const iterator& other) const noexcept { return d_value != other.d_value; }
			};

			ExtractIf(Table* table, Pred pred, size_t first, size_t last)
				:d_table(table), d_pred(std::move(pred)), d_read(first), d_write(first), d_end(last), d_removed(0)
			{
				if (first > last || last > table->size())
					throw_out_of_range("ordered container: invalid range");
			}
			ExtractIf(ExtractIf&& other) noexcept(std::is_nothrow_move_constructible<Pred>::value)
				:d_table(other.d_table), d_pred(std::move(other.d_pred)), d_read(other.d_read), d_write(other.d_write), d_end(other.d_end), d_removed(other.d_removed)
			{
				other.d_table = nullptr;
			}
			ExtractIf(const ExtractIf&) = delete;
			auto operator=(const ExtractIf&) -> ExtractIf& = delete;
			auto operator=(ExtractIf&&) -> ExtractIf& = delete;
			~ExtractIf()
			{
				finish();
			}

			/// @brief Single pass: each call resumes after the last extracted value
			auto begin() -> iterator { return iterator(this, next()); }
			auto end() noexcept -> iterator { return iterator(this, nullptr); }

			/// @brief Number of values extracted so far
			auto removed() const noexcept -> size_t { return d_removed; }

			/// @brief Close the gaps left by extracted values and repair the index. Unvisited values are kept.
			void finish()
			{
				if (!d_table)
					return;
				Table* t = d_table;
				d_table = nullptr;
				if (d_write == d_read)
					return;
				const size_t len = t->size();
				for (size_t r = d_read; r < len; ++r, ++d_write)
					t->d_store[d_write] = std::move(t->d_store[r]);
				t->compact(d_write);
			}
		};
	}
}

#endif
