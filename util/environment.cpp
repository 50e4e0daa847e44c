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

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#endif

#include "environment.hpp"
#include "logging.hpp"
#include <stdexcept>
#include <stdlib.h>

namespace Util
{
bool get_environment(const char *env, std::string &str)
{
#ifdef _WIN32
	char buf[4096];
	DWORD count = GetEnvironmentVariableA(env, buf, sizeof(buf));
	if (count && count < sizeof(buf))
	{
		str = { buf, buf + count };
		return true;
	}
	else
		return false;
#else
	if (const char *v = getenv(env))
	{
		str = v;
		return true;
	}
	else
		return false;
#endif
}

std::string get_environment_string(const char *env, const char *default_value)
{
	std::string v;
	if (!get_environment(env, v) || v.empty())
		v = default_value;
	return v;
}

unsigned get_environment_uint(const char *env, unsigned default_value)
{
	std::string v;
	if (!get_environment(env, v) || v.empty())
		return default_value;

	try
	{
		return unsigned(std::stoul(v));
	}
	catch (const std::exception &)
	{
		LOGW("Environment variable %s=\"%s\" is not an unsigned integer, using %u.\n",
		     env, v.c_str(), default_value);
		return default_value;
	}
}
}
