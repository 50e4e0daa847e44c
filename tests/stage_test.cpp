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
#include "logging.hpp"
#include <stdlib.h>
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

static bool expect_order(const char *what, Stage &stage, const KeyList &expected)
{
	auto order = stage.get_task_order();
	if (order != expected)
	{
		LOGE("%s: got [%s], expected [%s].\n", what,
		     format_keys(order).c_str(), format_keys(expected).c_str());
		return false;
	}
	return true;
}

static bool test_constraint_in_either_registration_order()
{
	Scheduler scheduler;
	auto stage = scheduler.create_stage("stage");

	TaskOptions after_first;
	after_first.after = { "first" };
	stage->create_task("second", record("second"), after_first);
	stage->create_task("first", record("first"));
	if (!expect_order("second registered first", *stage, { "first", "second" }))
		return false;

	auto other = scheduler.create_stage("other");
	TaskOptions before_second;
	before_second.before = { "second" };
	other->create_task("first", record("first"), before_second);
	other->create_task("second", record("second"));
	if (!expect_order("first registered first", *other, { "first", "second" }))
		return false;

	stage->run(0.016);
	return expect_invoked("run", { "first", "second" });
}

static bool test_reregistration_goes_last()
{
	Scheduler scheduler;
	auto stage = scheduler.create_stage("stage");
	stage->create_task("a", record("a"));
	stage->create_task("b", record("b"));
	stage->create_task("c", record("c"));
	if (!expect_order("initial", *stage, { "a", "b", "c" }))
		return false;

	if (!stage->remove_task("b"))
		return false;
	stage->create_task("b", record("b"));
	return expect_order("re-added", *stage, { "a", "c", "b" });
}

static bool test_duplicate_and_stale()
{
	Scheduler scheduler;
	auto stage = scheduler.create_stage("stage");
	auto task = stage->create_task("a", record("a"));

	try
	{
		stage->create_task("a", record("other a"));
		LOGE("Duplicate task key was accepted.\n");
		return false;
	}
	catch (const DuplicateKeyError &e)
	{
		LOGI("Expected: %s\n", e.what());
	}

	try
	{
		stage->create_task("empty", TaskCallback());
		LOGE("Task without callback was accepted.\n");
		return false;
	}
	catch (const std::logic_error &)
	{
	}

	stage->run(0.0);
	if (!expect_invoked("duplicate", { "a" }))
		return false;

	if (!task->remove() || task->is_registered())
		return false;

	if (task->remove())
	{
		LOGE("Removing twice succeeded.\n");
		return false;
	}

	if (stage->remove_task("a") || stage->remove_task("never"))
	{
		LOGE("Removing unknown key succeeded.\n");
		return false;
	}

	// Updating a detached task only changes its own lists.
	task->set_dependencies({ "x" }, {});
	if (task->get_after() != KeyList{ "x" })
		return false;

	stage->run(0.0);
	return expect_invoked("after removal", {}) && stage->get_task_count() == 0 && !stage->find_task("a");
}

static bool test_disabled_tasks()
{
	Scheduler scheduler;
	auto stage = scheduler.create_stage("stage");

	TaskOptions disabled;
	disabled.enabled = false;
	disabled.before = { "a" };

	stage->create_task("a", record("a"));
	auto b = stage->create_task("b", record("b"), disabled);
	stage->create_task("c", record("c"));

	// Disabled tasks still constrain their neighbours.
	if (!expect_order("disabled", *stage, { "b", "a", "c" }))
		return false;

	stage->run(0.0);
	if (!expect_invoked("disabled", { "a", "c" }))
		return false;

	b->start();
	stage->run(0.0);
	if (!expect_invoked("started", { "b", "a", "c" }))
		return false;

	b->stop();
	stage->run(0.0);
	return expect_invoked("stopped", { "a", "c" });
}

static bool test_unknown_reference()
{
	Scheduler scheduler;
	auto stage = scheduler.create_stage("stage");

	TaskOptions after_x;
	after_x.after = { "x" };
	stage->create_task("a", record("a"), after_x);

	stage->run(0.0);
	if (!expect_invoked("unknown", { "a" }))
		return false;

	if (stage->get_unresolved_references() != KeyList{ "x" })
	{
		LOGE("Unresolved reference not reported.\n");
		return false;
	}

	stage->create_task("x", record("x"));
	stage->run(0.0);
	if (!expect_invoked("registered later", { "x", "a" }))
		return false;

	if (!stage->get_unresolved_references().empty())
		return false;

	// Removing x leaves the constraint dormant, re-adding it brings it back.
	stage->remove_task("x");
	stage->create_task("x", record("x"));
	return expect_order("re-registered", *stage, { "x", "a" });
}

static bool test_task_cycle()
{
	Scheduler scheduler;
	auto stage = scheduler.create_stage("stage");
	auto a = stage->create_task("a", record("a"));
	stage->create_task("b", record("b"));

	stage->run(0.0);
	if (!expect_invoked("before cycle", { "a", "b" }))
		return false;

	TaskOptions options;
	options.after = { "a" };
	stage->create_task("c", record("c"), options);
	a->set_dependencies({ "c" }, {});

	if (stage->run(0.0))
	{
		LOGE("Stage with a cycle ran.\n");
		return false;
	}

	if (!expect_invoked("cycle", {}))
		return false;

	try
	{
		stage->get_task_order();
		LOGE("Cycle was not reported by get_task_order().\n");
		return false;
	}
	catch (const CyclicDependencyError &e)
	{
		if (e.get_cycle().size() != 2)
		{
			LOGE("Unexpected cycle [%s].\n", format_keys(e.get_cycle()).c_str());
			return false;
		}
	}

	a->set_dependencies({}, {});
	if (!stage->run(0.0))
		return false;
	return expect_invoked("cycle broken", { "a", "b", "c" });
}

static bool test_mutation_during_pass()
{
	Scheduler scheduler;
	auto stage = scheduler.create_stage("stage");
	Stage *s = stage.get();
	bool mutated = false;

	stage->create_task("a", [&](double) {
		invoked.push_back("a");
		if (!mutated)
		{
			mutated = true;
			s->create_task("late", record("late"));
			s->remove_task("b");
			s->find_task("c")->stop();
		}
	});
	stage->create_task("b", record("b"));
	stage->create_task("c", record("c"));

	stage->run(0.0);
	if (!expect_invoked("first pass", { "a", "b", "c" }))
		return false;

	stage->run(0.0);
	return expect_invoked("second pass", { "a", "late" });
}

static bool test_gate()
{
	Scheduler scheduler;
	unsigned repeat = 0;
	double gate_time = 0.0;

	StageOptions options;
	options.gate = [&](double delta_time, Runnable &run_tasks) {
		gate_time = delta_time;
		for (unsigned i = 0; i < repeat; i++)
			run_tasks.run();
	};
	auto stage = scheduler.create_stage("gated", options);
	stage->create_task("a", record("a"));
	stage->create_task("b", record("b"));

	stage->run(0.5);
	if (gate_time != 0.5 || !expect_invoked("closed gate", {}))
		return false;

	repeat = 2;
	stage->run(0.25);
	if (gate_time != 0.25 || !expect_invoked("gate twice", { "a", "b", "a", "b" }))
		return false;

	stage->set_gate({});
	if (stage->has_gate())
		return false;
	stage->run(0.0);
	return expect_invoked("no gate", { "a", "b" });
}

static bool test_idempotent_order()
{
	Scheduler scheduler;
	auto stage = scheduler.create_stage("stage");
	TaskOptions options;
	options.before = { "a" };
	stage->create_task("a", record("a"));
	stage->create_task("b", record("b"));
	stage->create_task("c", record("c"), options);

	auto first = stage->get_task_order();
	auto second = stage->get_task_order();
	if (first != second || first != KeyList{ "b", "c", "a" })
	{
		LOGE("Order changed between queries.\n");
		return false;
	}
	return true;
}

int main()
{
	if (!test_constraint_in_either_registration_order())
		return EXIT_FAILURE;
	if (!test_reregistration_goes_last())
		return EXIT_FAILURE;
	if (!test_duplicate_and_stale())
		return EXIT_FAILURE;
	if (!test_disabled_tasks())
		return EXIT_FAILURE;
	if (!test_unknown_reference())
		return EXIT_FAILURE;
	if (!test_task_cycle())
		return EXIT_FAILURE;
	if (!test_mutation_during_pass())
		return EXIT_FAILURE;
	if (!test_gate())
		return EXIT_FAILURE;
	if (!test_idempotent_order())
		return EXIT_FAILURE;
	LOGI("All stage tests passed.\n");
}
