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

#include "frame_context.hpp"
#include "logging.hpp"
#include <algorithm>
#include <string.h>

using namespace std;

namespace Cadence
{
const char *render_mode_to_string(RenderMode mode)
{
	switch (mode)
	{
	case RenderMode::Always:
		return "always";
	case RenderMode::OnDemand:
		return "on-demand";
	case RenderMode::Manual:
		return "manual";
	}
	return "unknown";
}

bool parse_render_mode(const char *str, RenderMode &mode)
{
	if (strcmp(str, "always") == 0)
		mode = RenderMode::Always;
	else if (strcmp(str, "on-demand") == 0)
		mode = RenderMode::OnDemand;
	else if (strcmp(str, "manual") == 0)
		mode = RenderMode::Manual;
	else
		return false;
	return true;
}

FrameContext::FrameContext(Scheduler &scheduler_, EventManager &event_manager_, FrameContextOptions options)
	: scheduler(scheduler_), event_manager(event_manager_),
	  main_stage(move(options.main_stage)), render_stage(move(options.render_stage)),
	  render_callback(move(options.render)),
	  render_mode(options.render_mode), auto_render(options.auto_render)
{
	if (!main_stage)
	{
		main_stage = scheduler.create_stage(Key::unique("main"));
		owns_main_stage = true;
	}

	if (!render_stage)
	{
		StageOptions render_options;
		render_options.after = { main_stage->get_key() };
		render_options.gate = [this](double delta_time, Runnable &run_tasks) {
			render_gate(delta_time, run_tasks);
		};
		render_stage = scheduler.create_stage(Key::unique("render"), move(render_options));
		owns_render_stage = true;
	}

	TaskOptions auto_render_options;
	auto_render_options.enabled = auto_render;
	auto_render_task = render_stage->create_task(Key::unique("auto-render"), [this](double delta_time) {
		if (render_callback)
			render_callback(delta_time);
	}, move(auto_render_options));

	// Holds acquired before the context existed are replayed here.
	event_manager.register_latch_handler<FrameContext, InvalidationHoldEvent,
	                                     &FrameContext::on_hold_acquired,
	                                     &FrameContext::on_hold_released>(this);
}

FrameContext::~FrameContext()
{
	event_manager.unregister_latch_handler(this);

	if (auto_render_task->is_registered())
		auto_render_task->remove();

	for (auto &task : auto_invalidating_tasks)
		if (task->is_registered())
			task->remove();

	// The gate points back at this context.
	if (owns_render_stage)
	{
		render_stage->set_gate({});
		if (render_stage->is_registered())
			render_stage->remove();
	}

	if (owns_main_stage && main_stage->is_registered())
		main_stage->remove();
}

void FrameContext::set_render_mode(RenderMode mode)
{
	render_mode = mode;
}

void FrameContext::set_auto_render(bool enable)
{
	auto_render = enable;
	if (enable)
		auto_render_task->start();
	else
		auto_render_task->stop();
}

void FrameContext::set_render_callback(TaskCallback render)
{
	render_callback = move(render);
}

unsigned FrameContext::get_invalidation_hold_count() const
{
	unsigned count = latched_holds;
	for (auto &task : auto_invalidating_tasks)
		if (task->is_registered() && task->is_enabled())
			count++;
	return count;
}

bool FrameContext::should_render() const
{
	switch (render_mode)
	{
	case RenderMode::Always:
		return true;
	case RenderMode::OnDemand:
		return frame_invalidated || get_invalidation_hold_count() != 0;
	case RenderMode::Manual:
		return advance_requested;
	}
	return false;
}

void FrameContext::reset_frame_invalidation()
{
	frame_invalidated = false;
	advance_requested = false;

	// Removed tasks can never hold the frame again.
	auto_invalidating_tasks.erase(remove_if(begin(auto_invalidating_tasks), end(auto_invalidating_tasks),
	                                        [](const TaskHandle &task) { return !task->is_registered(); }),
	                              end(auto_invalidating_tasks));
}

uint64_t FrameContext::acquire_invalidation_hold(const char *tag)
{
	return event_manager.enqueue_latched<InvalidationHoldEvent>(tag);
}

bool FrameContext::release_invalidation_hold(uint64_t cookie)
{
	if (!event_manager.dequeue_latched(cookie))
	{
		LOGW("Invalidation hold %llu is not active.\n", static_cast<unsigned long long>(cookie));
		return false;
	}
	return true;
}

TaskHandle FrameContext::create_task(Key key, TaskCallback callback, ContextTaskOptions options)
{
	auto &stage = options.stage ? options.stage : main_stage;

	TaskOptions task_options;
	task_options.after = move(options.after);
	task_options.before = move(options.before);
	task_options.enabled = options.enabled;

	auto task = stage->create_task(move(key), move(callback), move(task_options));
	if (options.auto_invalidate)
		auto_invalidating_tasks.push_back(task);
	return task;
}

void FrameContext::on_hold_acquired(const InvalidationHoldEvent &)
{
	latched_holds++;
}

void FrameContext::on_hold_released(const InvalidationHoldEvent &)
{
	if (latched_holds == 0)
	{
		LOGE("Invalidation hold released more times than acquired.\n");
		return;
	}
	latched_holds--;
}

void FrameContext::render_gate(double, Runnable &run_tasks)
{
	if (should_render())
		run_tasks.run();
}
}
