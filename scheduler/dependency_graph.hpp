/* Copyright (c) 2017-2024 Hans-Kristian Arntzen
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to
 * the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.
 * IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY
 * CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT,
 * TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE
 * SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once

#include "key.hpp"
#include <vector>

namespace Cadence
{
// Orders items by their before/after constraints.
// Items are added in registration order. bake() produces a topological order where items
// with no ordering relationship keep registration order.
// Constraints naming keys which are not part of the graph are ignored, and reported
// through get_unresolved_references().
class DependencyGraph
{
public:
	explicit DependencyGraph(const char *kind);

	void reset();

	// The graph keeps pointers to the key lists, they must outlive bake().
	void add_node(const Key &key, const KeyList &after, const KeyList &before);

	// Throws CyclicDependencyError, leaving the previous order untouched.
	void bake();

	// Indices into the add_node() sequence.
	const std::vector<unsigned> &get_order() const
	{
		return order;
	}

	const KeyList &get_unresolved_references() const
	{
		return unresolved_references;
	}

	size_t get_node_count() const
	{
		return nodes.size();
	}

private:
	struct Node
	{
		const Key *key;
		const KeyList *after;
		const KeyList *before;
	};

	const char *kind;
	std::vector<Node> nodes;
	std::vector<unsigned> order;
	KeyList unresolved_references;

	KeyList find_cycle(const std::vector<std::vector<unsigned>> &edges,
	                   const std::vector<unsigned> &in_degree) const;
};
}
