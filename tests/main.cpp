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

#include <cstdint>
#include <iostream>
#include <utility>

#include "test_index_table.hpp"
#include "test_ordered_map.hpp"
#include "test_ordered_set.hpp"
#include "test_serialize.hpp"


using namespace omap;

using size_pair = std::pair<size_t, size_t>;
using destroy_type = TestDestroy<size_t>;
using debug_map = ordered_map<size_t, size_t, hasher<size_t>, std::equal_to<>, debug_allocator<size_pair> >;


auto  main  (int  /*unused*/, char**  /*unused*/) -> int
{
	OMAP_TEST_MODULE_RETURN(index_table, 1, test_index_table(2000));

	OMAP_TEST_MODULE_RETURN(ordered_map scenarios, 1, test_ordered_map_scenarios());
	OMAP_TEST_MODULE_RETURN(ordered_map insert_before, 1, test_ordered_map_insert_before());
	OMAP_TEST_MODULE_RETURN(ordered_map entry, 1, test_ordered_map_entry());
	OMAP_TEST_MODULE_RETURN(ordered_map positional, 1, test_ordered_map_positional());
	OMAP_TEST_MODULE_RETURN(ordered_map bulk, 1, test_ordered_map_bulk());
	OMAP_TEST_MODULE_RETURN(ordered_map<size_t>, 1, test_ordered_map_logic<size_t>());
	OMAP_TEST_MODULE_RETURN(ordered_map<TestDestroy>, 1, test_ordered_map_logic<destroy_type>());
	OMAP_TEST_MODULE_RETURN(ordered_map random, 1, test_ordered_map_random<ordered_map<size_t, size_t> >(3000, 1));
	OMAP_TEST_MODULE_RETURN(ordered_map random collisions, 1, test_ordered_map_random<ordered_map<size_t, size_t, DummyHash> >(3000, 2));
	OMAP_TEST_MODULE_RETURN(ordered_map random TestDestroy, 1, test_ordered_map_random<ordered_map<destroy_type, destroy_type, DummyHash> >(2000, 3));
	OMAP_TEST_MODULE_RETURN(ordered_map random constant hash, 1, test_ordered_map_random<ordered_map<size_t, size_t, ConstantHash> >(1500, 4));
	OMAP_TEST_MODULE_RETURN(ordered_map leaks, 1,
		OMAP_TEST(destroy_type::count() == 0);
		debug_allocator<size_pair> al;
		test_ordered_map_random<debug_map>(2000, 5, al);
		OMAP_TEST(get_alloc_bytes(al) == 0);
	);

	OMAP_TEST_MODULE_RETURN(ordered_set scenarios, 1, test_ordered_set_scenarios());
	OMAP_TEST_MODULE_RETURN(ordered_set algebra, 1, test_ordered_set_algebra());
	OMAP_TEST_MODULE_RETURN(ordered_set bulk, 1, test_ordered_set_bulk());
	OMAP_TEST_MODULE_RETURN(ordered_set<size_t>, 1, test_ordered_set_logic<size_t>(20000));
	OMAP_TEST_MODULE_RETURN(ordered_set collisions, 1, test_ordered_set_logic<size_t, DummyHash>(3000));

	OMAP_TEST_MODULE_RETURN(serialize, 1, test_serialize());

	std::cout << "FINISHED TESTS SUCCESSFULLY" << std::endl;
	return 0;
}
