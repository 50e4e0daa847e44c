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

#include "hash.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace Cadence
{
// Identifies a task within its stage, or a stage within its scheduler.
// Named keys compare by name. Unique keys only compare equal to copies of themselves,
// which lets shared default stages be referenced without reserving a name.
class Key
{
public:
	Key();
	Key(const char *name);
	Key(const std::string &name);
	Key(std::string &&name);

	static Key unique(const char *debug_name);

	const std::string &get_name() const
	{
		return name;
	}

	bool is_unique() const
	{
		return token != 0;
	}

	Util::Hash get_hash() const
	{
		return hash;
	}

	// Printable form for logs, unique keys get their token appended.
	std::string to_string() const;

	bool operator==(const Key &other) const
	{
		return hash == other.hash && token == other.token && (token != 0 || name == other.name);
	}

	bool operator!=(const Key &other) const
	{
		return !(*this == other);
	}

private:
	Key(std::string name, uint64_t token);
	void rehash();

	std::string name;
	uint64_t token = 0;
	Util::Hash hash = 0;
};

struct KeyHasher
{
	size_t operator()(const Key &key) const
	{
		return size_t(key.get_hash());
	}
};

template <typename T>
using KeyMap = std::unordered_map<Key, T, KeyHasher>;
using KeyList = std::vector<Key>;

std::string format_keys(const KeyList &keys, const char *separator = ", ");
}
