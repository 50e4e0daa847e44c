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

#include "task.hpp"
#include "stage.hpp"
#include "logging.hpp"

using namespace std;

namespace Cadence
{
Task::Task(Stage *stage_, Key key_, TaskCallback callback_, TaskOptions options, uint64_t serial_)
	: stage(stage_), key(move(key_)), callback(move(callback_)),
	  after(move(options.after)), before(move(options.before)),
	  enabled(options.enabled), serial(serial_)
{
}

bool Task::remove()
{
	if (!stage)
	{
		LOGW("Task \"%s\" was already removed.\n", key.to_string().c_str());
		return false;
	}

	return stage->remove_task(key);
}

void Task::set_dependencies(KeyList after_, KeyList before_)
{
	after = move(after_);
	before = move(before_);
	if (stage)
		stage->mark_dirty();
}
}
