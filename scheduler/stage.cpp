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

#include "stage.hpp"
#include "scheduler.hpp"
#include "scheduler_errors.hpp"
#include "dependency_graph.hpp"
#include "logging.hpp"
#include <algorithm>

using namespace std;

namespace Cadence
{
class Stage::TaskRunner : public Runnable
{
public:
	TaskRunner(Stage &stage_, const vector<TaskHandle> &snapshot_, double delta_time_)
		: stage(stage_), snapshot(snapshot_), delta_time(delta_time_)
	{
	}

	void run() override
	{
		stage.run_tasks(snapshot, delta_time);
	}

private:
	Stage &stage;
	const vector<TaskHandle> &snapshot;
	double delta_time;
};

Stage::Stage(Scheduler *scheduler_, Key key_, StageOptions options, uint64_t serial_)
	: scheduler(scheduler_), key(move(key_)),
	  after(move(options.after)), before(move(options.before)),
	  gate(move(options.gate)), serial(serial_)
{
}

Stage::~Stage()
{
	// Outstanding task handles must not point back at a dead stage.
	for (auto &task : tasks)
		task.second->stage = nullptr;
}

TaskHandle Stage::create_task(Key task_key, TaskCallback callback, TaskOptions options)
{
	if (!callback)
		throw logic_error("Task \"" + task_key.to_string() + "\" needs a callback.");
	if (tasks.count(task_key))
		throw DuplicateKeyError("task", task_key);

	TaskHandle task(new Task(this, task_key, move(callback), move(options), task_serial++));
	tasks.emplace(move(task_key), task);
	mark_dirty();
	return task;
}

bool Stage::remove_task(const Key &task_key)
{
	auto itr = tasks.find(task_key);
	if (itr == end(tasks))
	{
		LOGW("Task \"%s\" is not registered in stage \"%s\".\n",
		     task_key.to_string().c_str(), key.to_string().c_str());
		return false;
	}

	// task_key might be owned by the task itself.
	auto task = itr->second;
	task->stage = nullptr;
	tasks.erase(itr);
	mark_dirty();
	return true;
}

TaskHandle Stage::find_task(const Key &task_key) const
{
	auto itr = tasks.find(task_key);
	if (itr == end(tasks))
		return {};
	return itr->second;
}

void Stage::bake_task_order()
{
	vector<TaskHandle> registered;
	registered.reserve(tasks.size());
	for (auto &task : tasks)
		registered.push_back(task.second);

	sort(begin(registered), end(registered), [](const TaskHandle &a, const TaskHandle &b) {
		return a->serial < b->serial;
	});

	DependencyGraph graph("task");
	for (auto &task : registered)
		graph.add_node(task->key, task->after, task->before);
	graph.bake();

	vector<TaskHandle> new_order;
	new_order.reserve(registered.size());
	for (auto index : graph.get_order())
		new_order.push_back(registered[index]);

	task_order = move(new_order);
	unresolved_references = graph.get_unresolved_references();
	order_dirty = false;
}

KeyList Stage::get_task_order()
{
	if (order_dirty)
		bake_task_order();

	KeyList keys;
	keys.reserve(task_order.size());
	for (auto &task : task_order)
		keys.push_back(task->key);
	return keys;
}

void Stage::set_dependencies(KeyList after_, KeyList before_)
{
	after = move(after_);
	before = move(before_);
	if (scheduler)
		scheduler->mark_dirty();
}

void Stage::set_gate(StageGate gate_)
{
	gate = move(gate_);
}

bool Stage::remove()
{
	if (!scheduler)
	{
		LOGW("Stage \"%s\" was already removed.\n", key.to_string().c_str());
		return false;
	}

	return scheduler->remove_stage(key);
}

bool Stage::run(double delta_time)
{
	if (order_dirty)
	{
		try
		{
			bake_task_order();
		}
		catch (const CyclicDependencyError &e)
		{
			// The last good order is kept around, but running it would ignore the new constraints.
			LOGE("Skipping stage \"%s\": %s\n", key.to_string().c_str(), e.what());
			if (scheduler)
				scheduler->report_stage_order_failure(*this, e.get_cycle());
			return false;
		}
	}

	// Tasks which are added, removed or toggled while this stage runs take effect on the next pass.
	vector<TaskHandle> snapshot;
	snapshot.reserve(task_order.size());
	for (auto &task : task_order)
		if (task->enabled)
			snapshot.push_back(task);

	if (gate)
	{
		TaskRunner runner(*this, snapshot, delta_time);
		gate(delta_time, runner);
	}
	else
		run_tasks(snapshot, delta_time);

	return true;
}

void Stage::run_tasks(const vector<TaskHandle> &snapshot, double delta_time)
{
	for (auto &task : snapshot)
	{
		try
		{
			task->callback(delta_time);
		}
		catch (const exception &e)
		{
			LOGE("Task \"%s\" in stage \"%s\" failed: %s\n",
			     task->key.to_string().c_str(), key.to_string().c_str(), e.what());
			if (scheduler)
				scheduler->report_task_failure(*this, *task, e.what());
		}
		catch (...)
		{
			LOGE("Task \"%s\" in stage \"%s\" failed with an unknown exception.\n",
			     task->key.to_string().c_str(), key.to_string().c_str());
			if (scheduler)
				scheduler->report_task_failure(*this, *task, "unknown exception");
		}
	}
}
}
