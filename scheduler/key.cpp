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

#include "key.hpp"
#include <atomic>

using namespace std;

namespace Cadence
{
static atomic<uint64_t> unique_key_counter;

Key::Key()
{
	rehash();
}

Key::Key(const char *name_)
	: name(name_)
{
	rehash();
}

Key::Key(const string &name_)
	: name(name_)
{
	rehash();
}

Key::Key(string &&name_)
	: name(move(name_))
{
	rehash();
}

Key::Key(string name_, uint64_t token_)
	: name(move(name_)), token(token_)
{
	rehash();
}

Key Key::unique(const char *debug_name)
{
	return Key(debug_name, ++unique_key_counter);
}

void Key::rehash()
{
	Util::Hasher h;
	if (token)
	{
		h.u32(1);
		h.u64(token);
	}
	else
	{
		h.u32(0);
		h.string(name);
	}
	hash = h.get();
}

string Key::to_string() const
{
	if (token)
		return name + "#" + std::to_string(token);
	else
		return name;
}

string format_keys(const KeyList &keys, const char *separator)
{
	string ret;
	for (auto &key : keys)
	{
		if (!ret.empty())
			ret += separator;
		ret += key.to_string();
	}
	return ret;
}
}
