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

#include <functional>
#include <string>
#include <unordered_map>
#include <utility>

namespace Util
{
class CLIParser;
using CLIHandler = std::function<void (CLIParser &)>;

// Option name to handler. Handlers pull their values with the next_*() accessors.
struct CLICallbacks
{
	void add(const char *cli, CLIHandler func)
	{
		callbacks[cli] = std::move(func);
	}

	// Option without a value, sets value to true when present.
	void add_flag(const char *cli, bool &value)
	{
		callbacks[cli] = [&value](CLIParser &) { value = true; };
	}

	std::unordered_map<std::string, CLIHandler> callbacks;
	// Called after a parse error has been logged.
	std::function<void ()> error_handler;
	// Receives positional arguments, and unknown options if ignore_unknown_arguments() is set.
	std::function<void (const char *)> default_handler;
};

class CLIParser
{
public:
	// argc and argv exclude the program name.
	CLIParser(CLICallbacks cbs_, int argc_, char *argv_[]);

	// Returns false on a parse error, after logging it and calling error_handler.
	bool parse();

	// Stops parsing after the current option, e.g. for --help.
	void end();

	bool is_ended_state() const
	{
		return ended_state;
	}

	// These throw on missing or malformed values, parse() reports the error.
	unsigned next_uint();
	double next_double();
	const char *next_string();

	void ignore_unknown_arguments()
	{
		unknown_argument_is_default = true;
	}

private:
	CLICallbacks cbs;
	int argc;
	char **argv;
	const char *current_option = "";
	bool ended_state = false;
	bool unknown_argument_is_default = false;

	const char *take(const char *what);
};

// Parses the options in cbs and leaves every other argument in argc/argv for the application.
// argv[0] is the program name. Returns false when the program should exit with exit_code,
// either after an error or because an option such as --help ended parsing.
bool parse_cli_filtered(CLICallbacks cbs, int &argc, char *argv[], int &exit_code);
}
