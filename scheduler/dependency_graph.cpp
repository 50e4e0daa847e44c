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

#include "dependency_graph.hpp"
#include "scheduler_errors.hpp"
#include <algorithm>
#include <functional>
#include <queue>

using namespace std;

namespace Cadence
{
DependencyGraph::DependencyGraph(const char *kind_)
	: kind(kind_)
{
}

void DependencyGraph::reset()
{
	nodes.clear();
	order.clear();
	unresolved_references.clear();
}

void DependencyGraph::add_node(const Key &key, const KeyList &after, const KeyList &before)
{
	nodes.push_back({ &key, &after, &before });
}

void DependencyGraph::bake()
{
	const unsigned count = unsigned(nodes.size());

	KeyMap<unsigned> key_to_index;
	key_to_index.reserve(count);
	for (unsigned i = 0; i < count; i++)
		if (!key_to_index.emplace(*nodes[i].key, i).second)
			throw DuplicateKeyError(kind, *nodes[i].key);

	KeyList unresolved;
	const auto lookup = [&](const Key &key, unsigned &index) -> bool {
		auto itr = key_to_index.find(key);
		if (itr == end(key_to_index))
		{
			if (find(begin(unresolved), end(unresolved), key) == end(unresolved))
				unresolved.push_back(key);
			return false;
		}
		index = itr->second;
		return true;
	};

	// Edge A -> B means A has to run before B.
	vector<vector<unsigned>> edges(count);
	vector<unsigned> in_degree(count);
	const auto add_edge = [&](unsigned from, unsigned to) {
		edges[from].push_back(to);
		in_degree[to]++;
	};

	for (unsigned i = 0; i < count; i++)
	{
		unsigned index;
		for (auto &dep : *nodes[i].after)
			if (lookup(dep, index))
				add_edge(index, i);
		for (auto &dep : *nodes[i].before)
			if (lookup(dep, index))
				add_edge(i, index);
	}

	// Always pick the earliest registered item among the ready ones.
	priority_queue<unsigned, vector<unsigned>, greater<unsigned>> ready;
	for (unsigned i = 0; i < count; i++)
		if (in_degree[i] == 0)
			ready.push(i);

	vector<unsigned> new_order;
	new_order.reserve(count);

	while (!ready.empty())
	{
		unsigned index = ready.top();
		ready.pop();
		new_order.push_back(index);

		for (auto &to : edges[index])
			if (--in_degree[to] == 0)
				ready.push(to);
	}

	if (new_order.size() != count)
		throw CyclicDependencyError(kind, find_cycle(edges, in_degree));

	order = move(new_order);
	unresolved_references = move(unresolved);
}

KeyList DependencyGraph::find_cycle(const vector<vector<unsigned>> &edges,
                                    const vector<unsigned> &in_degree) const
{
	// Every node left with a non-zero in-degree has at least one predecessor which is also left,
	// so walking predecessors from any of them must eventually revisit a node.
	const unsigned count = unsigned(nodes.size());
	const unsigned invalid = ~0u;
	vector<unsigned> predecessor(count, invalid);

	for (unsigned from = 0; from < count; from++)
	{
		if (in_degree[from] == 0)
			continue;
		for (auto &to : edges[from])
			if (in_degree[to] != 0 && predecessor[to] == invalid)
				predecessor[to] = from;
	}

	unsigned start = invalid;
	for (unsigned i = 0; i < count && start == invalid; i++)
		if (in_degree[i] != 0)
			start = i;

	if (start == invalid)
		return {};

	vector<unsigned> visit_index(count, invalid);
	vector<unsigned> walk;
	unsigned node = start;
	while (node != invalid && visit_index[node] == invalid)
	{
		visit_index[node] = unsigned(walk.size());
		walk.push_back(node);
		node = predecessor[node];
	}

	if (node == invalid)
		return {};

	// The walk follows edges backwards, reverse it to get dependency order.
	KeyList cycle;
	for (auto itr = walk.rbegin(); itr != walk.rend(); ++itr)
	{
		cycle.push_back(*nodes[*itr].key);
		if (*itr == node)
			break;
	}

	return cycle;
}
}
