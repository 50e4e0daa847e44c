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
#include <stdexcept>

namespace Cadence
{
// Registering a task or stage under a key which is already taken in its owning collection.
class DuplicateKeyError : public std::logic_error
{
public:
	DuplicateKeyError(const char *kind, const Key &key);

	const Key &get_key() const
	{
		return key;
	}

private:
	Key key;
};

// Thrown when before/after constraints form a cycle.
// get_cycle() holds one cycle in execution order: every key must run before the next one,
// and the last one before the first.
class CyclicDependencyError : public std::logic_error
{
public:
	CyclicDependencyError(const char *kind, KeyList cycle);

	const KeyList &get_cycle() const
	{
		return cycle;
	}

private:
	KeyList cycle;
};
}
