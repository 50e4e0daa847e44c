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
#include "scheduler_events.hpp"
#include "cli_parser.hpp"
#include "logging.hpp"
#include <stdexcept>

using namespace Cadence;

// Drops a ball and renders on demand until it comes to rest.
class SandboxApplication : public Application, public EventHandler
{
public:
	SandboxApplication(FrameContextOptions options, unsigned fail_at_frame_)
		: Application(std::move(options)), fail_at_frame(fail_at_frame_)
	{
		get_event_manager().register_handler<SandboxApplication, TaskFailedEvent,
		                                     &SandboxApplication::on_task_failed>(this);

		auto &context = get_frame_context();
		context.set_render_callback([this](double) { render(); });

		context.create_task("input", [this](double) { frame++; });

		ContextTaskOptions physics_options;
		physics_options.after = { "input" };
		physics_options.auto_invalidate = true;
		physics = context.create_task("physics", [this](double dt) { step_physics(dt); }, physics_options);

		if (fail_at_frame)
		{
			ContextTaskOptions diagnostics_options;
			diagnostics_options.before = { "input" };
			context.create_task("diagnostics", [this](double) {
				if (frame + 1 == fail_at_frame)
					throw std::runtime_error("diagnostics failed on purpose");
			}, diagnostics_options);
		}

		for (auto &entry : get_scheduler().get_schedule())
			LOGI("Stage %s: [%s]\n", entry.stage.to_string().c_str(), format_keys(entry.tasks).c_str());
	}

	~SandboxApplication()
	{
		get_event_manager().unregister_handler(this);
	}

	std::string get_name() override
	{
		return "scheduler-sandbox";
	}

	void post_frame() override
	{
		if (!physics->is_enabled() && ++idle_frames == 60)
		{
			LOGI("Ball has been resting for 60 frames, shutting down.\n");
			request_shutdown();
		}
	}

private:
	TaskHandle physics;
	unsigned fail_at_frame;
	unsigned frame = 0;
	unsigned rendered_frames = 0;
	unsigned idle_frames = 0;
	double height = 2.0;
	double velocity = 0.0;

	void step_physics(double dt)
	{
		velocity -= 9.81 * dt;
		height += velocity * dt;

		if (height <= 0.0)
		{
			height = 0.0;
			velocity = -0.5 * velocity;

			// Too slow to leave the ground within one step.
			if (velocity < 9.81 * dt)
			{
				velocity = 0.0;
				LOGI("Ball came to rest on frame %u.\n", frame);
				// Nothing moves anymore, stop invalidating the frame.
				physics->stop();
			}
		}
	}

	void render()
	{
		rendered_frames++;
		if ((rendered_frames % 30) == 0 || !physics->is_enabled())
			LOGI("Render %u (frame %u): height %.3f m.\n", rendered_frames, frame, height);
	}

	bool on_task_failed(const TaskFailedEvent &e)
	{
		LOGW("Task %s in stage %s failed on frame %u: %s\n",
		     e.get_task().to_string().c_str(), e.get_stage().to_string().c_str(),
		     frame, e.get_message().c_str());
		return true;
	}
};

namespace Cadence
{
Application *application_create(int argc, char **argv)
{
	FrameContextOptions options;
	unsigned fail_at_frame = 0;

	Util::CLICallbacks cbs;
	cbs.add("--fail-at-frame", [&](Util::CLIParser &parser) { fail_at_frame = parser.next_uint(); });
	cbs.add("--no-auto-render", [&](Util::CLIParser &) { options.auto_render = false; });
	cbs.error_handler = [] { LOGE("Usage: [--fail-at-frame <frame>] [--no-auto-render]\n"); };

	Util::CLIParser parser(std::move(cbs), argc - 1, argv + 1);
	if (!parser.parse())
		return nullptr;

	try
	{
		auto *app = new SandboxApplication(std::move(options), fail_at_frame);
		return app;
	}
	catch (const std::exception &e)
	{
		LOGE("application_create() threw exception: %s\n", e.what());
		return nullptr;
	}
}
}
