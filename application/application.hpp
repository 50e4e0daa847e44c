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
#include "frame_context.hpp"
#include "application_glue.hpp"
#include <string>

namespace Cadence
{
class Application
{
public:
	explicit Application(FrameContextOptions options = {});
	virtual ~Application() = default;

	// Called after every completed frame.
	// Can do "garbage collection" or similar batched cleanup.
	virtual void post_frame();

	virtual std::string get_name()
	{
		return "cadence";
	}

	EventManager &get_event_manager()
	{
		return event_manager;
	}

	Scheduler &get_scheduler()
	{
		return scheduler;
	}

	FrameContext &get_frame_context()
	{
		return frame_context;
	}

	uint64_t get_skipped_frame_count() const
	{
		return skipped_frames;
	}

	bool poll();

	// Returns false if the stages could not be ordered and the frame was skipped.
	bool run_frame(double frame_time);

protected:
	void request_shutdown()
	{
		requested_shutdown = true;
	}

private:
	EventManager event_manager;
	Scheduler scheduler;
	FrameContext frame_context;
	bool requested_shutdown = false;
	uint64_t skipped_frames = 0;
};
}
