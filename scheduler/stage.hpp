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
#include "task.hpp"
#include <functional>
#include <vector>

namespace Cadence
{
class Scheduler;

// Handed to a stage gate. run() executes the enabled tasks of the stage in resolved order.
// Only valid for the duration of the gate call.
class Runnable
{
public:
	virtual ~Runnable() = default;
	virtual void run() = 0;
};

// A gate decides whether, and how many times, the tasks of its stage run this frame.
using StageGate = std::function<void (double delta_time, Runnable &run_tasks)>;

struct StageOptions
{
	// Keys of stages which must run before this one.
	KeyList after;
	// Keys of stages which must run after this one.
	KeyList before;
	StageGate gate;
};

class Stage : public Util::IntrusivePtrEnabled<Stage>
{
public:
	~Stage();

	const Key &get_key() const
	{
		return key;
	}

	// Throws DuplicateKeyError.
	TaskHandle create_task(Key key, TaskCallback callback, TaskOptions options = {});
	bool remove_task(const Key &key);
	TaskHandle find_task(const Key &key) const;

	size_t get_task_count() const
	{
		return tasks.size();
	}

	// Resolves the task order if needed. Throws CyclicDependencyError.
	KeyList get_task_order();

	// Task constraints which named keys not registered in this stage at the last resolve.
	const KeyList &get_unresolved_references() const
	{
		return unresolved_references;
	}

	void set_dependencies(KeyList after, KeyList before);

	const KeyList &get_after() const
	{
		return after;
	}

	const KeyList &get_before() const
	{
		return before;
	}

	void set_gate(StageGate gate);

	bool has_gate() const
	{
		return bool(gate);
	}

	// Runs the stage for one frame.
	// Returns false if the tasks could not be ordered, in which case nothing ran.
	bool run(double delta_time);

	bool is_registered() const
	{
		return scheduler != nullptr;
	}

	// Returns false if the stage was already removed from its scheduler.
	bool remove();

	Scheduler *get_scheduler()
	{
		return scheduler;
	}

private:
	friend class Scheduler;
	friend class Task;
	class TaskRunner;

	Stage(Scheduler *scheduler, Key key, StageOptions options, uint64_t serial);

	Scheduler *scheduler;
	Key key;
	KeyList after;
	KeyList before;
	StageGate gate;
	uint64_t serial;

	KeyMap<TaskHandle> tasks;
	std::vector<TaskHandle> task_order;
	KeyList unresolved_references;
	uint64_t task_serial = 0;
	bool order_dirty = true;

	void mark_dirty()
	{
		order_dirty = true;
	}

	void bake_task_order();
	void run_tasks(const std::vector<TaskHandle> &snapshot, double delta_time);
};

using StageHandle = Util::IntrusivePtr<Stage>;
}
