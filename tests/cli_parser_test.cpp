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
#include "cli_parser.hpp"
#include "logging.hpp"
#include <stdlib.h>
#include <string.h>
#include <string>
#include <vector>

using namespace Util;

struct Arguments
{
	explicit Arguments(std::vector<std::string> args_)
		: args(std::move(args_))
	{
		for (auto &arg : args)
			argv.push_back(&arg[0]);
		argv.push_back(nullptr);
	}

	int argc() const
	{
		return int(args.size());
	}

	std::vector<std::string> args;
	std::vector<char *> argv;
};

static bool test_filtered()
{
	Arguments arguments({ "driver", "--frames", "12", "--fail-at-frame", "3", "--realtime", "extra" });
	unsigned frames = 0;
	bool realtime = false;

	CLICallbacks cbs;
	cbs.add("--frames", [&](CLIParser &parser) { frames = parser.next_uint(); });
	cbs.add_flag("--realtime", realtime);

	int argc = arguments.argc();
	int exit_code = -1;
	if (!parse_cli_filtered(std::move(cbs), argc, arguments.argv.data(), exit_code))
	{
		LOGE("Filtered parse failed with exit code %d.\n", exit_code);
		return false;
	}

	if (frames != 12 || !realtime || exit_code != 0)
		return false;

	// Unknown options and their values are left for the application.
	const char *expected[] = { "driver", "--fail-at-frame", "3", "extra" };
	if (argc != 4)
	{
		LOGE("Expected 4 remaining arguments, got %d.\n", argc);
		return false;
	}

	for (int i = 0; i < argc; i++)
		if (strcmp(arguments.argv[i], expected[i]) != 0)
			return false;
	return arguments.argv[argc] == nullptr;
}

static bool test_errors()
{
	bool error_reported = false;

	{
		Arguments arguments({ "--frames", "many" });
		CLICallbacks cbs;
		cbs.add("--frames", [](CLIParser &parser) { parser.next_uint(); });
		cbs.error_handler = [&]() { error_reported = true; };
		CLIParser parser(std::move(cbs), arguments.argc(), arguments.argv.data());
		if (parser.parse() || !error_reported)
			return false;
	}

	error_reported = false;

	{
		Arguments arguments({ "--time-step" });
		CLICallbacks cbs;
		cbs.add("--time-step", [](CLIParser &parser) { parser.next_double(); });
		cbs.error_handler = [&]() { error_reported = true; };
		CLIParser parser(std::move(cbs), arguments.argc(), arguments.argv.data());
		if (parser.parse() || !error_reported)
			return false;
	}

	Arguments arguments({ "driver", "--unknown" });
	CLICallbacks cbs;
	int argc = arguments.argc();
	int exit_code = 0;
	// The filtered parser hands unknown options on to the application.
	return parse_cli_filtered(std::move(cbs), argc, arguments.argv.data(), exit_code) && argc == 2;
}

static bool test_help_ends_parsing()
{
	Arguments arguments({ "driver", "--help", "--frames", "1" });
	bool frames_parsed = false;

	CLICallbacks cbs;
	cbs.add("--help", [](CLIParser &parser) { parser.end(); });
	cbs.add("--frames", [&](CLIParser &parser) {
		parser.next_uint();
		frames_parsed = true;
	});

	int argc = arguments.argc();
	int exit_code = -1;
	if (parse_cli_filtered(std::move(cbs), argc, arguments.argv.data(), exit_code))
		return false;
	return exit_code == 0 && !frames_parsed;
}

int main()
{
	if (!test_filtered())
		return EXIT_FAILURE;
	if (!test_errors())
		return EXIT_FAILURE;
	if (!test_help_ends_parsing())
		return EXIT_FAILURE;
	LOGI("All CLI parser tests passed.\n");
}
