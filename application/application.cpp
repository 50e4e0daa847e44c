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

#include "application.hpp"
#include "scheduler_errors.hpp"
#include "logging.hpp"

using namespace std;

namespace Cadence
{
Application::Application(FrameContextOptions options)
	: frame_context(scheduler, event_manager, move(options))
{
	scheduler.set_event_manager(&event_manager);
}

void Application::post_frame()
{
}

bool Application::poll()
{
	if (requested_shutdown)
		return false;

	event_manager.dispatch();
	return true;
}

bool Application::run_frame(double frame_time)
{
	try
	{
		scheduler.run_frame(frame_time);
	}
	catch (const CyclicDependencyError &e)
	{
		// Invalidation stays pending, the frame never rendered.
		LOGE("Skipping frame: %s\n", e.what());
		skipped_frames++;
		return false;
	}

	frame_context.reset_frame_invalidation();
	post_frame();
	return true;
}
}
