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
#include "cli_parser.hpp"
#include "environment.hpp"
#include "timer.hpp"
#include "logging.hpp"
#include "rapidjson/document.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include <limits.h>
#include <stdio.h>
#include <memory>
#include <string>

using namespace rapidjson;
using namespace Util;

static void print_help()
{
	LOGI("[--frames <frames>] [--time-step <step>] [--realtime]\n"
	     "[--render-mode <always|on-demand|manual>] [--stat <output.json>].\n"
	     "CADENCE_FRAMES and CADENCE_RENDER_MODE provide defaults for --frames and --render-mode.\n");
}

namespace Cadence
{
static bool write_string_to_file(const std::string &path, const char *str)
{
	FILE *file = fopen(path.c_str(), "w");
	if (!file)
		return false;

	bool ret = fputs(str, file) >= 0;
	if (fclose(file) != 0)
		ret = false;
	return ret;
}

static void write_stat_report(const std::string &path, Application &app, double usec, unsigned frames)
{
	Document doc;
	doc.SetObject();
	auto &allocator = doc.GetAllocator();

	doc.AddMember("averageFrameTimeUs", usec, allocator);
	doc.AddMember("frames", frames, allocator);
	doc.AddMember("skippedFrames", uint64_t(app.get_skipped_frame_count()), allocator);
	doc.AddMember("taskFailures", uint64_t(app.get_scheduler().get_task_failure_count()), allocator);
	doc.AddMember("renderMode", StringRef(render_mode_to_string(app.get_frame_context().get_render_mode())), allocator);

	try
	{
		Value schedule(kArrayType);
		for (auto &entry : app.get_scheduler().get_schedule())
		{
			Value stage(kObjectType);
			stage.AddMember("stage", Value(entry.stage.to_string().c_str(), allocator), allocator);

			Value tasks(kArrayType);
			for (auto &task : entry.tasks)
				tasks.PushBack(Value(task.to_string().c_str(), allocator), allocator);
			stage.AddMember("tasks", tasks, allocator);

			schedule.PushBack(stage, allocator);
		}
		doc.AddMember("schedule", schedule, allocator);
	}
	catch (const CyclicDependencyError &e)
	{
		LOGE("Schedule left out of stat report: %s\n", e.what());
	}

	StringBuffer buffer;
	PrettyWriter<StringBuffer> writer(buffer);
	doc.Accept(writer);

	if (!write_string_to_file(path, buffer.GetString()))
		LOGE("Failed to write stat file to disk.\n");
}

int application_main_headless(
		Application *(*create_application)(int, char **),
		int argc, char *argv[])
{
	if (argc < 1)
		return 1;

	struct Args
	{
		std::string stat;
		std::string render_mode;
		unsigned max_frames = UINT_MAX;
		double time_step = 0.01;
		bool realtime = false;
	} args;

	args.max_frames = get_environment_uint("CADENCE_FRAMES", args.max_frames);
	args.render_mode = get_environment_string("CADENCE_RENDER_MODE", "");

	CLICallbacks cbs;
	cbs.add("--frames", [&](CLIParser &parser) { args.max_frames = parser.next_uint(); });
	cbs.add("--time-step", [&](CLIParser &parser) { args.time_step = parser.next_double(); });
	cbs.add_flag("--realtime", args.realtime);
	cbs.add("--render-mode", [&](CLIParser &parser) { args.render_mode = parser.next_string(); });
	cbs.add("--stat", [&](CLIParser &parser) { args.stat = parser.next_string(); });
	cbs.add("--help", [](CLIParser &parser)
	{
		print_help();
		parser.end();
	});
	cbs.error_handler = [&]() { print_help(); };
	int exit_code;

	if (!parse_cli_filtered(std::move(cbs), argc, argv, exit_code))
		return exit_code;

	if (args.time_step <= 0.0)
	{
		LOGE("Time step must be positive, got %f.\n", args.time_step);
		return 1;
	}

	RenderMode render_mode = RenderMode::OnDemand;
	if (!args.render_mode.empty() && !parse_render_mode(args.render_mode.c_str(), render_mode))
	{
		LOGE("Unknown render mode \"%s\".\n", args.render_mode.c_str());
		print_help();
		return 1;
	}

	auto app = std::unique_ptr<Application>(create_application(argc, argv));
	if (!app)
		return 1;

	if (!args.render_mode.empty())
		app->get_frame_context().set_render_mode(render_mode);

	LOGI("=== Begin run: %s, render mode %s ===\n", app->get_name().c_str(),
	     render_mode_to_string(app->get_frame_context().get_render_mode()));

	FrameTimer timer;
	timer.reset();
	auto start_time = get_current_time_nsecs();
	unsigned frames = 0;

	while (frames < args.max_frames && app->poll())
	{
		double frame_time = args.realtime ? timer.frame() : timer.frame(args.time_step);
		app->run_frame(frame_time);
		frames++;
	}

	auto end_time = get_current_time_nsecs();
	LOGI("=== End run ===\n");

	if (frames)
	{
		double usec = 1e-3 * double(end_time - start_time) / frames;
		LOGI("Average frame time: %.3f usec over %u frames (%.3f s simulated).\n",
		     usec, frames, timer.get_elapsed());

		if (app->get_skipped_frame_count())
			LOGW("%llu frames were skipped.\n", static_cast<unsigned long long>(app->get_skipped_frame_count()));

		if (!args.stat.empty())
			write_stat_report(args.stat, *app, usec, frames);
	}

	return 0;
}
}
