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
#include "event.hpp"
#include "logging.hpp"
#include <stdexcept>
#include <stdlib.h>
#include <string.h>
#include <string>
#include <vector>

using namespace Cadence;

static std::vector<std::string> invoked;

static TaskCallback record(const char *name)
{
	return [name](double) { invoked.push_back(name); };
}

static bool expect_invoked(const char *what, const std::vector<std::string> &expected)
{
	if (invoked != expected)
	{
		std::string got;
		for (auto &name : invoked)
			got += name + " ";
		LOGE("%s: unexpected invocations: [ %s].\n", what, got.c_str());
		return false;
	}
	invoked.clear();
	return true;
}

struct ErrorCapture : Util::LoggingInterface
{
	bool log(const char *tag, const char *fmt, va_list va) override
	{
		if (strcmp(tag, "[ERROR]: ") != 0)
			return false;

		char buffer[1024];
		vsnprintf(buffer, sizeof(buffer), fmt, va);
		errors.emplace_back(buffer);
		return true;
	}

	std::vector<std::string> errors;
};

struct FailureListener : EventHandler
{
	bool on_task_failed(const TaskFailedEvent &e)
	{
		task_failures.push_back(e);
		return true;
	}

	bool on_stage_order_failed(const StageOrderFailedEvent &e)
	{
		order_failures.push_back(e);
		return true;
	}

	std::vector<TaskFailedEvent> task_failures;
	std::vector<StageOrderFailedEvent> order_failures;
};

static bool test_stage_order()
{
	Scheduler scheduler;
	StageOptions after_input;
	after_input.after = { "input" };
	StageOptions after_update;
	after_update.after = { "update" };

	auto update = scheduler.create_stage("update", after_input);
	auto render = scheduler.create_stage("render", after_update);
	auto input = scheduler.create_stage("input");

	render->create_task("draw", record("draw"));
	update->create_task("physics", record("physics"));
	input->create_task("poll", record("poll"));

	if (scheduler.get_stage_order() != KeyList{ "input", "update", "render" })
	{
		LOGE("Unexpected stage order [%s].\n", format_keys(scheduler.get_stage_order()).c_str());
		return false;
	}

	scheduler.run_frame(0.016);
	if (!expect_invoked("frame", { "poll", "physics", "draw" }))
		return false;

	auto schedule = scheduler.get_schedule();
	if (schedule.size() != 3 || schedule[1].stage != Key("update") || schedule[1].tasks != KeyList{ "physics" })
	{
		LOGE("Unexpected schedule.\n");
		return false;
	}

	try
	{
		scheduler.create_stage("input");
		LOGE("Duplicate stage key was accepted.\n");
		return false;
	}
	catch (const DuplicateKeyError &)
	{
	}

	if (scheduler.remove_stage("missing"))
		return false;

	return scheduler.get_frame_count() == 1;
}

static bool test_stage_cycle()
{
	Scheduler scheduler;
	auto a = scheduler.create_stage("a");
	auto b = scheduler.create_stage("b");
	a->create_task("a", record("a"));
	b->create_task("b", record("b"));

	scheduler.run_frame(0.0);
	if (!expect_invoked("before cycle", { "a", "b" }))
		return false;

	a->set_dependencies({ "b" }, {});
	b->set_dependencies({ "a" }, {});

	try
	{
		scheduler.run_frame(0.0);
		LOGE("Stage cycle did not throw.\n");
		return false;
	}
	catch (const CyclicDependencyError &e)
	{
		LOGI("Expected: %s\n", e.what());
	}

	if (!expect_invoked("cycle", {}) || scheduler.get_frame_count() != 1)
		return false;

	b->set_dependencies({}, {});
	scheduler.run_frame(0.0);
	return expect_invoked("cycle broken", { "b", "a" }) && scheduler.get_frame_count() == 2;
}

static bool test_task_failure()
{
	EventManager manager;
	FailureListener listener;
	manager.register_handler<FailureListener, TaskFailedEvent, &FailureListener::on_task_failed>(&listener);

	Scheduler scheduler;
	scheduler.set_event_manager(&manager);
	auto stage = scheduler.create_stage("update");

	unsigned frame = 0;
	unsigned first_runs = 0;
	unsigned last_runs = 0;
	stage->create_task("first", [&](double) { first_runs++; });
	stage->create_task("flaky", [&](double) {
		if (frame == 3)
			throw std::runtime_error("flaky failed");
	});
	stage->create_task("odd", [&](double) {
		if (frame == 6)
			throw 42;
	});
	stage->create_task("last", [&](double) { last_runs++; });

	ErrorCapture capture;
	{
		Util::ScopedLoggingInterface scoped_logging(&capture);
		for (frame = 1; frame <= 10; frame++)
			scheduler.run_frame(0.016);
	}

	if (first_runs != 10 || last_runs != 10)
	{
		LOGE("Failure stopped other tasks: %u, %u.\n", first_runs, last_runs);
		return false;
	}

	if (scheduler.get_task_failure_count() != 2 || scheduler.get_frame_count() != 10)
		return false;

	if (listener.task_failures.size() != 2)
	{
		LOGE("Expected two failure events, got %u.\n", unsigned(listener.task_failures.size()));
		return false;
	}

	auto &failure = listener.task_failures[0];
	if (failure.get_stage() != Key("update") || failure.get_task() != Key("flaky") ||
	    failure.get_message() != "flaky failed")
	{
		LOGE("Unexpected failure event.\n");
		return false;
	}

	// Values which are not std::exception are still isolated to their task.
	auto &unknown = listener.task_failures[1];
	if (unknown.get_task() != Key("odd") || unknown.get_message() != "unknown exception")
	{
		LOGE("Unexpected failure event for a non-exception throw.\n");
		return false;
	}

	if (capture.errors.size() != 2 || capture.errors[0].find("flaky") == std::string::npos ||
	    capture.errors[1].find("odd") == std::string::npos)
	{
		LOGE("Failure was not logged.\n");
		return false;
	}

	return true;
}

static bool test_task_cycle_skips_one_stage()
{
	EventManager manager;
	FailureListener listener;
	manager.register_handler<FailureListener, StageOrderFailedEvent, &FailureListener::on_stage_order_failed>(&listener);

	Scheduler scheduler;
	scheduler.set_event_manager(&manager);
	auto broken = scheduler.create_stage("broken");
	auto healthy = scheduler.create_stage("healthy");

	TaskOptions after_y;
	after_y.after = { "y" };
	TaskOptions after_x;
	after_x.after = { "x" };
	broken->create_task("x", record("x"), after_y);
	broken->create_task("y", record("y"), after_x);
	healthy->create_task("z", record("z"));

	ErrorCapture capture;
	{
		Util::ScopedLoggingInterface scoped_logging(&capture);
		scheduler.run_frame(0.0);
	}

	if (!expect_invoked("task cycle", { "z" }))
		return false;

	if (listener.order_failures.size() != 1 || listener.order_failures[0].get_stage() != Key("broken") ||
	    listener.order_failures[0].get_cycle().size() != 2)
	{
		LOGE("Missing stage order failure event.\n");
		return false;
	}

	return capture.errors.size() == 1;
}

static bool test_stage_mutation_during_frame()
{
	Scheduler scheduler;
	auto first = scheduler.create_stage("first");
	auto second = scheduler.create_stage("second");
	second->create_task("second", record("second"));

	bool mutated = false;
	first->create_task("mutate", [&](double) {
		invoked.push_back("mutate");
		if (mutated)
			return;
		mutated = true;
		scheduler.remove_stage("second");
		scheduler.create_stage("third")->create_task("third", record("third"));
	});

	scheduler.run_frame(0.0);
	if (!expect_invoked("first frame", { "mutate", "second" }))
		return false;

	scheduler.run_frame(0.0);
	if (!expect_invoked("second frame", { "mutate", "third" }))
		return false;

	return !second->is_registered() && scheduler.get_stage_count() == 2;
}

static bool test_detached_handles()
{
	StageHandle stage;
	TaskHandle task;

	{
		Scheduler scheduler;
		stage = scheduler.create_stage("stage");
		task = stage->create_task("task", record("task"));
	}

	if (stage->is_registered() || stage->remove())
		return false;

	stage.reset();
	return !task->is_registered() && !task->remove();
}

int main()
{
	if (!test_stage_order())
		return EXIT_FAILURE;
	if (!test_stage_cycle())
		return EXIT_FAILURE;
	if (!test_task_failure())
		return EXIT_FAILURE;
	if (!test_task_cycle_skips_one_stage())
		return EXIT_FAILURE;
	if (!test_stage_mutation_during_frame())
		return EXIT_FAILURE;
	if (!test_detached_handles())
		return EXIT_FAILURE;
	LOGI("All scheduler tests passed.\n");
}
