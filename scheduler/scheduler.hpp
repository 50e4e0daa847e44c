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
#include "stage.hpp"
#include "task.hpp"
#include <stdint.h>
#include <vector>

namespace Cadence
{
class EventManager;

struct ScheduleEntry
{
	Key stage;
	KeyList tasks;
};

// Owns the stages of one application and drives them once per frame.
// Everything here runs on the frame thread. Stages and tasks may be added or removed
// from inside task callbacks, changes apply from the next pass.
class Scheduler
{
public:
	Scheduler() = default;
	~Scheduler();

	Scheduler(const Scheduler &) = delete;
	void operator=(const Scheduler &) = delete;

	// Throws DuplicateKeyError.
	StageHandle create_stage(Key key, StageOptions options = {});
	bool remove_stage(const Key &key);
	StageHandle find_stage(const Key &key) const;

	size_t get_stage_count() const
	{
		return stages.size();
	}

	// Resolves the stage order if needed. Throws CyclicDependencyError.
	KeyList get_stage_order();

	// Stage order with the task order of every stage.
	// Throws CyclicDependencyError if any of them cannot be resolved.
	std::vector<ScheduleEntry> get_schedule();

	const KeyList &get_unresolved_references() const
	{
		return unresolved_references;
	}

	// Runs every stage in order.
	// A cycle between stages throws CyclicDependencyError before anything runs.
	void run_frame(double delta_time);

	// Receives TaskFailedEvent and StageOrderFailedEvent.
	void set_event_manager(EventManager *manager)
	{
		event_manager = manager;
	}

	EventManager *get_event_manager() const
	{
		return event_manager;
	}

	uint64_t get_frame_count() const
	{
		return frame_count;
	}

	uint64_t get_task_failure_count() const
	{
		return task_failure_count;
	}

private:
	friend class Stage;

	KeyMap<StageHandle> stages;
	std::vector<StageHandle> stage_order;
	KeyList unresolved_references;
	uint64_t stage_serial = 0;
	bool order_dirty = true;

	EventManager *event_manager = nullptr;
	uint64_t frame_count = 0;
	uint64_t task_failure_count = 0;

	void mark_dirty()
	{
		order_dirty = true;
	}

	void bake_stage_order();
	void report_task_failure(const Stage &stage, const Task &task, const char *what);
	void report_stage_order_failure(const Stage &stage, const KeyList &cycle);
};
}
