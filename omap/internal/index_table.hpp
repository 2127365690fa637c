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

#ifndef OMAP_INDEX_TABLE_HPP
#define OMAP_INDEX_TABLE_HPP

/** @file */

#include <algorithm>
#include <cstring>
#include <memory>
#include <type_traits>

#include "../bits.hpp"
#include "../utils.hpp"

namespace omap
{
	namespace detail
	{

		/// @brief Node type used by IndexTable. 
		/// Stores a position within the dense entry storage (48 bits), the distance to the node's ideal location (for robin-hood probing)
		/// and the 8 most significant bits of the key hash value.
		struct IndexNode
		{
			using tiny_hash = std::uint8_t;
			using dist_type = std::int16_t;

			static constexpr unsigned pos_bits = 48;
			static constexpr std::uint64_t mask_pos = (1ULL << pos_bits) - 1ULL;
			static constexpr std::uint64_t mask_dist = 0xFFULL << pos_bits;
			// Position stored in empty nodes and tombstones, never equal to a valid position
			static constexpr size_t invalid_pos = static_cast<size_t>(mask_pos);
			// Position temporarily given to a node while the positions around it are being shifted
			static constexpr size_t moving_pos = static_cast<size_t>(mask_pos - 1ULL);
			static constexpr dist_type max_distance = 126;
			static constexpr dist_type tombstone = 127;
			static constexpr dist_type empty_dist = -1;

			std::uint64_t val;

			// Extract part of hash value
			static OMAP_ALWAYS_INLINE auto small_hash(size_t h) noexcept -> tiny_hash {
				tiny_hash res = static_cast<tiny_hash>(h >> (sizeof(h) * 8U - 8U));
				return res == 0 ? 1 : res;
			}
			static OMAP_ALWAYS_INLINE auto encode_dist(dist_type dist) noexcept -> std::uint64_t {
				return static_cast<std::uint64_t>(static_cast<std::uint8_t>(static_cast<std::int8_t>(dist))) << pos_bits;
			}
			static OMAP_ALWAYS_INLINE auto make(tiny_hash h, dist_type dist, std::uint64_t pos) noexcept -> std::uint64_t {
				return (pos & mask_pos) | encode_dist(dist) | (static_cast<std::uint64_t>(h) << 56U);
			}

			OMAP_ALWAYS_INLINE IndexNode() noexcept : val(make(0, empty_dist, invalid_pos)) {}
			OMAP_ALWAYS_INLINE IndexNode(tiny_hash h, dist_type dist, size_t pos) noexcept : val(make(h, dist, pos)) {}

			OMAP_ALWAYS_INLINE auto pos() const noexcept -> size_t { return static_cast<size_t>(val & mask_pos); }
			OMAP_ALWAYS_INLINE auto hash() const noexcept -> tiny_hash { return static_cast<tiny_hash>(val >> 56U); }
			OMAP_ALWAYS_INLINE auto distance() const noexcept -> dist_type { 
				return static_cast<std::int8_t>(static_cast<std::uint8_t>(val >> pos_bits)); 
			}
			// Check if node is a tombstone (only for pure linear hashing)
			OMAP_ALWAYS_INLINE bool is_tombstone() const noexcept { return distance() == tombstone; }
			OMAP_ALWAYS_INLINE bool null() const noexcept { return distance() == empty_dist; }
			OMAP_ALWAYS_INLINE bool live() const noexcept { return !null() && !is_tombstone(); }
			OMAP_ALWAYS_INLINE bool is_same(size_t p) const noexcept { return (val & mask_pos) == static_cast<std::uint64_t>(p); }
			OMAP_ALWAYS_INLINE void empty() noexcept { val = make(0, empty_dist, invalid_pos); }
			OMAP_ALWAYS_INLINE void empty_tombstone() noexcept { val = make(0, tombstone, invalid_pos); }
			OMAP_ALWAYS_INLINE void set_distance(dist_type dist) noexcept { val = (val & ~mask_dist) | encode_dist(dist); }
			OMAP_ALWAYS_INLINE void set_pos(size_t p) noexcept { val = (val & ~mask_pos) | (static_cast<std::uint64_t>(p) & mask_pos); }
		};


		/// @brief Hash table of positions within a dense entry storage.
		/// 
		/// The table does not know the keys: lookups receive the key hash and an equality predicate taking a position,
		/// rehashing receives a functor returning the hash value of the key stored at a given position.
		/// 
		/// It uses robin-hood probing with backward shift deletion. When a probe distance exceeds node_type::max_distance,
		/// the table switches to pure linear probing with tombstones until the next rehash.
		template<class Allocator>
		class IndexTable
		{
		public:
			using node_type = IndexNode;
			using dist_type = node_type::dist_type;
			using tiny_hash = node_type::tiny_hash;
			using node_allocator = typename std::allocator_traits<Allocator>::template rebind_alloc<node_type>;
			using alloc_traits = std::allocator_traits<node_allocator>;

		private:
			node_allocator	d_alloc;
			node_type*		d_buckets;		// hash table with robin-hood probing
			size_t			d_hash_mask;	// hash mask
			size_t			d_size;			// number of live nodes
			size_t			d_tombstones;	// number of tombstones (linear probing only)
			size_t			d_next_target;	// size before rehash when the probe distance is high
			size_t			d_max_fill;		// maximum number of used nodes (live and tombstones)
			int				d_max_dist;		// current maximum distance of a node to its theoric best location
			float			d_load_factor;	// maximum load factor

			static auto null_node() noexcept -> node_type* {
				// Null node used to initialize d_buckets (avoid a check on lookup)
				static node_type null;
				return &null;
			}

			static auto make_buckets(node_allocator& al, size_t size) -> node_type*
			{
				node_type* res = alloc_traits::allocate(al, size);
				for (size_t i = 0; i < size; ++i)
					new (res + i) node_type();
				return res;
			}
			void free_buckets() noexcept
			{
				if (d_buckets != null_node())
					alloc_traits::deallocate(d_alloc, d_buckets, bucket_size());
				d_buckets = null_node();
				d_hash_mask = 0;
			}
			void update_targets() noexcept
			{
				if (is_null()) {
					d_next_target = d_max_fill = 0;
					return;
				}
				d_next_target = static_cast<size_t>(static_cast<double>(bucket_size()) * static_cast<double>(d_load_factor));
				d_max_fill = static_cast<size_t>(static_cast<double>(bucket_size()) * 0.95);
			}
			void reset_counters() noexcept
			{
				d_size = d_tombstones = 0;
				d_max_dist = 1;
			}
			void copy_nodes(const IndexTable& other)
			{
				// Copy other's nodes using our own allocator, assume the table is null
				if (!other.is_null()) {
					d_buckets = make_buckets(d_alloc, other.bucket_size());
					std::copy(other.d_buckets, other.d_buckets + other.bucket_size(), d_buckets);
					d_hash_mask = other.d_hash_mask;
				}
				d_size = other.d_size;
				d_tombstones = other.d_tombstones;
				d_max_dist = other.d_max_dist;
				d_load_factor = other.d_load_factor;
				update_targets();
			}
			void steal(IndexTable& other) noexcept
			{
				d_buckets = other.d_buckets;
				d_hash_mask = other.d_hash_mask;
				d_size = other.d_size;
				d_tombstones = other.d_tombstones;
				d_max_dist = other.d_max_dist;
				d_load_factor = other.d_load_factor;
				update_targets();
				other.d_buckets = null_node();
				other.d_hash_mask = 0;
				other.reset_counters();
				other.update_targets();
			}

			OMAP_ALWAYS_INLINE auto next(size_t index) const noexcept -> size_t
			{
				return (index + 1U) & d_hash_mask;
			}

			void start_insert(size_t index, node_type node) noexcept
			{
				// Move displaced nodes forward based on distance (robin hood hashing)
				dist_type od;
				dist_type dist = node.distance();
				while (dist != -1) {
					do {
						++dist;
						index = next(index);
						od = d_buckets[index].distance();
					} while (od >= dist);
					if (OMAP_UNLIKELY(dist > d_max_dist))
						d_max_dist = dist = dist > node_type::max_distance ? node_type::max_distance : dist;

					node.set_distance(dist);
					std::swap(d_buckets[index], node);
					dist = od;
				}
			}

			template<class HashAt>
			void reinsert(size_t count, HashAt& hash_at)
			{
				// Insert positions [0, count), all nodes must be empty
				reset_counters();
				update_targets();
				for (size_t pos = 0; pos < count; ++pos)
					insert_node(hash_at(pos), pos);
			}

			template<class HashAt>
			void rehash_buckets(size_t bucket_count, size_t count, HashAt& hash_at)
			{
				// Allocate the new table first: on failure the table is left untouched.
				node_type* buckets = make_buckets(d_alloc, bucket_count);
				free_buckets();
				d_buckets = buckets;
				d_hash_mask = bucket_count - 1U;
				reinsert(count, hash_at);
			}

			auto bucket_count_for(size_t count) const noexcept -> size_t
			{
				// Smallest power of 2 bucket count able to hold count positions
				size_t target = static_cast<size_t>(static_cast<double>(count) / static_cast<double>(d_load_factor)) + 1U;
				if (target < OMAP_MIN_BUCKET_COUNT)
					target = OMAP_MIN_BUCKET_COUNT;
				return static_cast<size_t>(next_power_of_2(target));
			}

		public:
			explicit IndexTable(const Allocator& alloc = Allocator())
				:d_alloc(alloc), d_buckets(null_node()), d_hash_mask(0), d_size(0), d_tombstones(0), 
				d_next_target(0), d_max_fill(0), d_max_dist(1), d_load_factor(OMAP_DEFAULT_LOAD_FACTOR)
			{}
			IndexTable(const IndexTable& other, const Allocator& alloc)
				:IndexTable(alloc)
			{
				copy_nodes(other);
			}
			IndexTable(IndexTable&& other) noexcept
				:d_alloc(std::move(other.d_alloc)), d_buckets(null_node()), d_hash_mask(0), d_size(0), d_tombstones(0), 
				d_next_target(0), d_max_fill(0), d_max_dist(1), d_load_factor(OMAP_DEFAULT_LOAD_FACTOR)
			{
				steal(other);
			}
			IndexTable(IndexTable&& other, const Allocator& alloc)
				:IndexTable(alloc)
			{
				if (d_alloc == other.d_alloc)
					steal(other);
				else
					copy_nodes(other);
			}
			~IndexTable()
			{
				free_buckets();
			}

			void copy_from(const IndexTable& other)
			{
				if (this == std::addressof(other))
					return;
				node_allocator al = d_alloc;
				assign_allocator(al, other.d_alloc);
				node_type* buckets = null_node();
				if (!other.is_null()) {
					buckets = make_buckets(al, other.bucket_size());
					std::copy(other.d_buckets, other.d_buckets + other.bucket_size(), buckets);
				}
				free_buckets();
				assign_allocator(d_alloc, other.d_alloc);
				d_buckets = buckets;
				d_hash_mask = other.d_hash_mask;
				d_size = other.d_size;
				d_tombstones = other.d_tombstones;
				d_max_dist = other.d_max_dist;
				d_load_factor = other.d_load_factor;
				update_targets();
			}
			void move_from(IndexTable& other)
			{
				if (this == std::addressof(other))
					return;
				if (alloc_traits::propagate_on_container_move_assignment::value || d_alloc == other.d_alloc) {
					free_buckets();
					move_allocator(d_alloc, other.d_alloc);
					steal(other);
				}
				else
					copy_from(other);
			}
			void swap(IndexTable& other) noexcept
			{
				if (this != std::addressof(other)) {
					swap_allocator(d_alloc, other.d_alloc);
					std::swap(d_buckets, other.d_buckets);
					std::swap(d_hash_mask, other.d_hash_mask);
					std::swap(d_size, other.d_size);
					std::swap(d_tombstones, other.d_tombstones);
					std::swap(d_next_target, other.d_next_target);
					std::swap(d_max_fill, other.d_max_fill);
					std::swap(d_max_dist, other.d_max_dist);
					std::swap(d_load_factor, other.d_load_factor);
				}
			}

			auto is_null() const noexcept -> bool { return d_buckets == null_node(); }
			auto size() const noexcept -> size_t { return d_size; }
			auto bucket_size() const noexcept -> size_t { return d_hash_mask + 1U; }
			auto capacity() const noexcept -> size_t { return d_next_target; }
			auto tombstones() const noexcept -> size_t { return d_tombstones; }
			auto max_probe_distance() const noexcept -> int { return d_max_dist; }
			auto linear_probing() const noexcept -> bool { return d_max_dist == node_type::max_distance; }
			auto load_factor() const noexcept -> float 
			{ 
				return is_null() ? 0.f : static_cast<float>(d_size) / static_cast<float>(bucket_size()); 
			}
			auto max_load_factor() const noexcept -> float { return d_load_factor; }
			void max_load_factor(float f) noexcept
			{
				// Load factor must be between 0.1 and 0.95
				d_load_factor = f;
				if (d_load_factor > 0.95f) d_load_factor = 0.95f;
				else if (d_load_factor < 0.1f) d_load_factor = 0.1f;
				update_targets();
			}

			/// @brief Key lookup. Returns the node whose position satisfies eq(position), or nullptr.
			template<class Equal>
			OMAP_ALWAYS_INLINE auto find(size_t hash, Equal&& eq) const -> const node_type*
			{
				const bool robin_hood = d_max_dist < node_type::max_distance;
				const tiny_hash h = node_type::small_hash(hash);
				const node_type* it = d_buckets + (hash & d_hash_mask);
				const node_type* end = d_buckets + d_hash_mask;
				dist_type dist = 0;

				// Combination of linear and robin-hood probing in the same loop. 
				// An empty node has a distance of -1 and break the probe chain.
				// A tombstone has a distance of 127 and never break the probe chain (dist is never incremented in linear mode).
				// A tombstone is never checked as its tiny hash is 0.
				while (!(dist > it->distance()))
				{
					if (h == it->hash() && eq(it->pos()))
						return it;
					it = it == end ? d_buckets : it + 1;
					if (OMAP_LIKELY(robin_hood))
						++dist;
				}
				return nullptr;
			}

			/// @brief Returns the node referencing position pos, which must exist
			OMAP_ALWAYS_INLINE auto find_node(size_t hash, size_t pos) noexcept -> node_type*
			{
				size_t index = hash & d_hash_mask;
				while (!d_buckets[index].is_same(pos))
					index = next(index);
				return d_buckets + index;
			}

			/// @brief Make sure that one more node can be inserted with insert_node().
			/// hash_at(p) must return the hash value of the key at position p, for p in [0, size()).
			template<class HashAt>
			void grow_for_insert(HashAt hash_at)
			{
				// Avoid rehashing on load factor alone if the maximum distance is small.
				if (OMAP_UNLIKELY(d_size + d_tombstones >= d_max_fill || (d_max_dist > OMAP_GROW_DISTANCE && d_size >= d_next_target)))
					rehash_buckets(bucket_count_for(d_size + 1U), d_size, hash_at);
			}

			/// @brief Insert a node for a position whose key is known to be absent, without growing the table
			void insert_node(size_t hash, size_t pos) noexcept
			{
				const tiny_hash h = node_type::small_hash(hash);
				const size_t start = hash & d_hash_mask;
				size_t index = start;
				++d_size;

				if (OMAP_UNLIKELY(linear_probing())) {
					// Pure linear hashing, reuse the first tombstone
					while (d_buckets[index].live())
						index = next(index);
					if (d_buckets[index].is_tombstone())
						--d_tombstones;
					d_buckets[index] = node_type(h, index == start ? 0 : node_type::max_distance, pos);
					return;
				}

				dist_type dist = 0;
				while (dist <= d_buckets[index].distance()) {
					index = next(index);
					++dist;
				}
				if (dist > node_type::max_distance)
					dist = node_type::max_distance;
				d_max_dist = dist > d_max_dist ? dist : d_max_dist;

				node_type n = d_buckets[index];
				d_buckets[index] = node_type(h, dist, pos);
				if (!n.null())
					start_insert(index, n);
			}

			/// @brief Remove a node returned by find() or find_node()
			void erase_node(const node_type* node) noexcept
			{
				node_type* prev = d_buckets + (node - d_buckets);
				--d_size;

				if (OMAP_UNLIKELY(linear_probing())) {
					// Pure linear hash table: use tombstone
					prev->empty_tombstone();
					++d_tombstones;
					return;
				}

				// Robin hood backward shift deletion
				size_t index = next(static_cast<size_t>(prev - d_buckets));
				dist_type dist = d_buckets[index].distance();
				while (dist > 0) {
					*prev = d_buckets[index];
					prev->set_distance(dist - 1);
					prev = d_buckets + index;
					index = next(index);
					dist = d_buckets[index].distance();
				}
				prev->empty();
			}

			/// @brief Add offset to all positions in [first, last).
			/// hash_at(p) must return the hash value of the key currently referenced by position p.
			template<class HashAt>
			void shift_positions(size_t first, size_t last, std::ptrdiff_t offset, HashAt hash_at)
			{
				if (first >= last || offset == 0)
					return;
				if (last - first > bucket_size() / 2U) {
					// Cheaper to walk the whole table
					for (size_t i = 0; i < bucket_size(); ++i) {
						node_type& n = d_buckets[i];
						if (n.live() && n.pos() >= first && n.pos() < last)
							n.set_pos(static_cast<size_t>(static_cast<std::ptrdiff_t>(n.pos()) + offset));
					}
				}
				else if (offset < 0) {
					// Walk upward so that a new position never matches a position not yet processed
					for (size_t p = first; p < last; ++p)
						find_node(hash_at(p), p)->set_pos(static_cast<size_t>(static_cast<std::ptrdiff_t>(p) + offset));
				}
				else {
					for (size_t p = last; p-- > first; )
						find_node(hash_at(p), p)->set_pos(p + static_cast<size_t>(offset));
				}
			}

			/// @brief Reverse all positions in [0, count)
			void reverse_positions(size_t count) noexcept
			{
				for (size_t i = 0; i < bucket_size(); ++i) {
					node_type& n = d_buckets[i];
					if (n.live() && n.pos() < count)
						n.set_pos(count - 1U - n.pos());
				}
			}

			/// @brief Rebuild the table for positions [0, count), reusing the current buckets if large enough
			template<class HashAt>
			void rebuild(size_t count, HashAt hash_at)
			{
				const size_t required = bucket_count_for(count);
				if (count && required > bucket_size())
					rehash_buckets(required, count, hash_at);
				else {
					clear();
					reinsert(count, hash_at);
				}
			}

			/// @brief Rebuild the table for positions [0, count) in the current buckets.
			/// count must not exceed size(): the buckets already held that many nodes, so nothing is allocated.
			template<class HashAt>
			void rebuild_in_place(size_t count, HashAt hash_at)
			{
				OMAP_ASSERT_DEBUG(count <= d_size, "rebuild_in_place: count exceeds the current size");
				clear();
				reinsert(count, hash_at);
			}

			/// @brief Make room for count positions without rehash
			template<class HashAt>
			void reserve(size_t count, HashAt hash_at)
			{
				const size_t required = bucket_count_for(count);
				if (count && required > bucket_size())
					rehash_buckets(required, d_size, hash_at);
			}

			/// @brief Reduce the table to the minimum size able to hold size() positions
			template<class HashAt>
			void shrink_to_fit(HashAt hash_at)
			{
				if (d_size == 0) {
					free_buckets();
					reset_counters();
					update_targets();
					return;
				}
				const size_t required = bucket_count_for(d_size);
				if (required != bucket_size() || d_tombstones)
					rehash_buckets(required, d_size, hash_at);
			}

			/// @brief Remove all nodes, keep the buckets
			void clear() noexcept
			{
				if (!is_null()) {
					for (size_t i = 0; i < bucket_size(); ++i)
						d_buckets[i].empty();
				}
				reset_counters();
				update_targets();
			}

			/// @brief Remove all nodes and deallocate the buckets
			void release() noexcept
			{
				free_buckets();
				reset_counters();
				update_targets();
			}

			/// @brief Apply fun to all live nodes
			template<class Fun>
			void for_each_node(Fun&& fun) const
			{
				for (size_t i = 0; i < bucket_size(); ++i)
					if (d_buckets[i].live())
						fun(d_buckets[i], i);
			}

			/// @brief Returns the ideal bucket of a hash value
			auto home_bucket(size_t hash) const noexcept -> size_t { return hash & d_hash_mask; }
		};

	}
}

#endif
