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

#include "intrusive.hpp"
#include "key.hpp"
#include <functional>

namespace Cadence
{
class Stage;

using TaskCallback = std::function<void (double delta_time)>;

struct TaskOptions
{
	// Keys of tasks in the same stage which must run before this one.
	KeyList after;
	// Keys of tasks in the same stage which must run after this one.
	KeyList before;
	bool enabled = true;
};

class Task : public Util::IntrusivePtrEnabled<Task>
{
public:
	const Key &get_key() const
	{
		return key;
	}

	// A stopped task keeps its place in the order, it is just not invoked.
	void start()
	{
		enabled = true;
	}

	void stop()
	{
		enabled = false;
	}

	bool is_enabled() const
	{
		return enabled;
	}

	bool is_registered() const
	{
		return stage != nullptr;
	}

	// Returns false if the task was already removed.
	bool remove();

	void set_dependencies(KeyList after, KeyList before);

	const KeyList &get_after() const
	{
		return after;
	}

	const KeyList &get_before() const
	{
		return before;
	}

	Stage *get_stage()
	{
		return stage;
	}

private:
	friend class Stage;
	Task(Stage *stage, Key key, TaskCallback callback, TaskOptions options, uint64_t serial);

	Stage *stage;
	Key key;
	TaskCallback callback;
	KeyList after;
	KeyList before;
	bool enabled;
	uint64_t serial;
};

using TaskHandle = Util::IntrusivePtr<Task>;
}
