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
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <vector>

namespace Util
{
CLIParser::CLIParser(CLICallbacks cbs_, int argc_, char *argv_[])
	: cbs(std::move(cbs_)), argc(argc_), argv(argv_)
{
}

bool CLIParser::parse()
{
	try
	{
		while (argc && !ended_state)
		{
			const char *next = *argv++;
			argc--;

			if (*next != '-' && cbs.default_handler)
			{
				cbs.default_handler(next);
				continue;
			}

			auto itr = cbs.callbacks.find(next);
			if (itr == std::end(cbs.callbacks))
			{
				if (unknown_argument_is_default && cbs.default_handler)
					cbs.default_handler(next);
				else
					throw std::invalid_argument(std::string("Invalid argument ") + next);
			}
			else
			{
				current_option = next;
				itr->second(*this);
			}
		}

		return true;
	}
	catch (const std::exception &e)
	{
		LOGE("Failed to parse arguments: %s\n", e.what());
		if (cbs.error_handler)
			cbs.error_handler();
		return false;
	}
}

void CLIParser::end()
{
	ended_state = true;
}

const char *CLIParser::take(const char *what)
{
	if (!argc)
		throw std::invalid_argument(std::string(current_option) + " expects " + what + ", but nothing left in arguments");

	const char *ret = *argv;
	argc--;
	argv++;
	return ret;
}

unsigned CLIParser::next_uint()
{
	const char *arg = take("an unsigned integer");
	auto val = std::stoul(arg);
	if (val > std::numeric_limits<unsigned>::max())
		throw std::invalid_argument(std::string(current_option) + " is out of range");
	return unsigned(val);
}

double CLIParser::next_double()
{
	return std::stod(take("a number"));
}

const char *CLIParser::next_string()
{
	return take("a string");
}

bool parse_cli_filtered(CLICallbacks cbs, int &argc, char *argv[], int &exit_code)
{
	if (argc == 0)
	{
		exit_code = 1;
		return false;
	}

	exit_code = 0;
	std::vector<char *> filtered;
	filtered.reserve(argc + 1);
	filtered.push_back(argv[0]);

	cbs.default_handler = [&](const char *arg) { filtered.push_back(const_cast<char *>(arg)); };

	CLIParser parser(std::move(cbs), argc - 1, argv + 1);
	parser.ignore_unknown_arguments();

	if (!parser.parse())
	{
		exit_code = 1;
		return false;
	}
	else if (parser.is_ended_state())
	{
		exit_code = 0;
		return false;
	}

	argc = int(filtered.size());
	std::copy(filtered.begin(), filtered.end(), argv);
	argv[argc] = nullptr;
	return true;
}
}
