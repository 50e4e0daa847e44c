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

#include "scheduler.hpp"
#include "scheduler_errors.hpp"
#include "scheduler_events.hpp"
#include "dependency_graph.hpp"
#include "event.hpp"
#include "logging.hpp"
#include <algorithm>

using namespace std;

namespace Cadence
{
Scheduler::~Scheduler()
{
	for (auto &stage : stages)
		stage.second->scheduler = nullptr;
}

StageHandle Scheduler::create_stage(Key key, StageOptions options)
{
	if (stages.count(key))
		throw DuplicateKeyError("stage", key);

	StageHandle stage(new Stage(this, key, move(options), stage_serial++));
	stages.emplace(move(key), stage);
	mark_dirty();
	return stage;
}

bool Scheduler::remove_stage(const Key &key)
{
	auto itr = stages.find(key);
	if (itr == end(stages))
	{
		LOGW("Stage \"%s\" is not registered.\n", key.to_string().c_str());
		return false;
	}

	// key might be owned by the stage itself.
	auto stage = itr->second;
	stage->scheduler = nullptr;
	stages.erase(itr);
	mark_dirty();
	return true;
}

StageHandle Scheduler::find_stage(const Key &key) const
{
	auto itr = stages.find(key);
	if (itr == end(stages))
		return {};
	return itr->second;
}

void Scheduler::bake_stage_order()
{
	vector<StageHandle> registered;
	registered.reserve(stages.size());
	for (auto &stage : stages)
		registered.push_back(stage.second);

	sort(begin(registered), end(registered), [](const StageHandle &a, const StageHandle &b) {
		return a->serial < b->serial;
	});

	DependencyGraph graph("stage");
	for (auto &stage : registered)
		graph.add_node(stage->key, stage->after, stage->before);
	graph.bake();

	vector<StageHandle> new_order;
	new_order.reserve(registered.size());
	for (auto index : graph.get_order())
		new_order.push_back(registered[index]);

	stage_order = move(new_order);
	unresolved_references = graph.get_unresolved_references();
	order_dirty = false;
}

KeyList Scheduler::get_stage_order()
{
	if (order_dirty)
		bake_stage_order();

	KeyList keys;
	keys.reserve(stage_order.size());
	for (auto &stage : stage_order)
		keys.push_back(stage->key);
	return keys;
}

vector<ScheduleEntry> Scheduler::get_schedule()
{
	if (order_dirty)
		bake_stage_order();

	vector<ScheduleEntry> schedule;
	schedule.reserve(stage_order.size());
	for (auto &stage : stage_order)
		schedule.push_back({ stage->key, stage->get_task_order() });
	return schedule;
}

void Scheduler::run_frame(double delta_time)
{
	if (order_dirty)
		bake_stage_order();

	// Stages added or removed by tasks during this frame apply from the next frame.
	auto snapshot = stage_order;
	for (auto &stage : snapshot)
		stage->run(delta_time);

	frame_count++;
}

void Scheduler::report_task_failure(const Stage &stage, const Task &task, const char *what)
{
	task_failure_count++;
	if (event_manager)
		event_manager->dispatch_inline(TaskFailedEvent(stage.get_key(), task.get_key(), what));
}

void Scheduler::report_stage_order_failure(const Stage &stage, const KeyList &cycle)
{
	if (event_manager)
		event_manager->dispatch_inline(StageOrderFailedEvent(stage.get_key(), cycle));
}
}
