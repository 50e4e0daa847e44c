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

#include "event.hpp"
#include "scheduler.hpp"
#include <string>
#include <vector>

namespace Cadence
{
enum class RenderMode
{
	// Render every frame.
	Always,
	// Render when the frame was invalidated, or while invalidation holds are active.
	OnDemand,
	// Render only when advance() was called for this frame.
	Manual
};

const char *render_mode_to_string(RenderMode mode);
bool parse_render_mode(const char *str, RenderMode &mode);

// Latched while something needs every frame rendered, e.g. a running animation.
class InvalidationHoldEvent : public Event
{
public:
	CADENCE_EVENT_TYPE_DECL(InvalidationHoldEvent)

	explicit InvalidationHoldEvent(std::string tag_)
		: tag(std::move(tag_))
	{
	}

	const std::string &get_tag() const
	{
		return tag;
	}

private:
	std::string tag;
};

struct FrameContextOptions
{
	RenderMode render_mode = RenderMode::OnDemand;
	bool auto_render = true;

	// Called by the auto render task. This is where the render backend draws the scene.
	TaskCallback render;

	// Stages of an outer context sharing the same scheduler.
	// If left empty, the context creates and owns its own.
	StageHandle main_stage;
	StageHandle render_stage;
};

struct ContextTaskOptions
{
	// Defaults to the main stage.
	StageHandle stage;
	KeyList after;
	KeyList before;
	bool enabled = true;
	// While the task is registered and started, the frame counts as invalidated.
	bool auto_invalidate = false;
};

// Per-frame render state for one scheduler.
// The render stage runs after the main stage, and its gate only lets the render tasks through
// when should_render() holds. The frame driver calls reset_frame_invalidation() after each frame,
// so the decision is stable for the whole frame.
class FrameContext : public EventHandler
{
public:
	FrameContext(Scheduler &scheduler, EventManager &event_manager, FrameContextOptions options = {});
	~FrameContext();

	Scheduler &get_scheduler()
	{
		return scheduler;
	}

	const StageHandle &get_main_stage() const
	{
		return main_stage;
	}

	const StageHandle &get_render_stage() const
	{
		return render_stage;
	}

	const TaskHandle &get_auto_render_task() const
	{
		return auto_render_task;
	}

	void set_render_mode(RenderMode mode);

	RenderMode get_render_mode() const
	{
		return render_mode;
	}

	void set_auto_render(bool enable);

	bool get_auto_render() const
	{
		return auto_render;
	}

	void set_render_callback(TaskCallback render);

	// Requests a render this frame in on-demand mode.
	void invalidate()
	{
		frame_invalidated = true;
	}

	// Requests a render this frame in manual mode.
	void advance()
	{
		advance_requested = true;
	}

	bool should_render() const;
	void reset_frame_invalidation();

	bool is_frame_invalidated() const
	{
		return frame_invalidated;
	}

	bool is_advance_requested() const
	{
		return advance_requested;
	}

	// Latched holds plus started auto-invalidating tasks.
	unsigned get_invalidation_hold_count() const;

	uint64_t acquire_invalidation_hold(const char *tag);
	bool release_invalidation_hold(uint64_t cookie);

	// Throws DuplicateKeyError.
	TaskHandle create_task(Key key, TaskCallback callback, ContextTaskOptions options = {});

private:
	Scheduler &scheduler;
	EventManager &event_manager;
	StageHandle main_stage;
	StageHandle render_stage;
	TaskHandle auto_render_task;
	TaskCallback render_callback;
	std::vector<TaskHandle> auto_invalidating_tasks;

	RenderMode render_mode;
	bool auto_render;
	bool owns_main_stage = false;
	bool owns_render_stage = false;

	bool frame_invalidated = true;
	bool advance_requested = false;
	unsigned latched_holds = 0;

	void on_hold_acquired(const InvalidationHoldEvent &e);
	void on_hold_released(const InvalidationHoldEvent &e);
	void render_gate(double delta_time, Runnable &run_tasks);
};
}
