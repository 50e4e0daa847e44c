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
#include "key.hpp"
#include <string>

namespace Cadence
{
// Dispatched inline when a task callback throws. The frame carries on with the next task.
class TaskFailedEvent : public Event
{
public:
	CADENCE_EVENT_TYPE_DECL(TaskFailedEvent)

	TaskFailedEvent(Key stage_, Key task_, std::string message_)
		: stage(std::move(stage_)), task(std::move(task_)), message(std::move(message_))
	{
	}

	const Key &get_stage() const
	{
		return stage;
	}

	const Key &get_task() const
	{
		return task;
	}

	const std::string &get_message() const
	{
		return message;
	}

private:
	Key stage;
	Key task;
	std::string message;
};

// Dispatched inline when a stage skips a frame because its tasks form a cycle.
class StageOrderFailedEvent : public Event
{
public:
	CADENCE_EVENT_TYPE_DECL(StageOrderFailedEvent)

	StageOrderFailedEvent(Key stage_, KeyList cycle_)
		: stage(std::move(stage_)), cycle(std::move(cycle_))
	{
	}

	const Key &get_stage() const
	{
		return stage;
	}

	const KeyList &get_cycle() const
	{
		return cycle;
	}

private:
	Key stage;
	KeyList cycle;
};
}
