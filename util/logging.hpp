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

#include <stdio.h>
#include <stdarg.h>

namespace Util
{
class LoggingInterface
{
public:
	virtual ~LoggingInterface() = default;
	// Return false to let the message fall through to stderr.
	virtual bool log(const char *tag, const char *fmt, va_list va) = 0;
};

bool interface_log(const char *tag, const char *fmt, ...);
void set_thread_logging_interface(LoggingInterface *iface);
LoggingInterface *get_thread_logging_interface();

// Routes this thread's log messages through iface for the lifetime of the scope,
// then restores whatever was installed before.
class ScopedLoggingInterface
{
public:
	explicit ScopedLoggingInterface(LoggingInterface *iface)
		: previous(get_thread_logging_interface())
	{
		set_thread_logging_interface(iface);
	}

	~ScopedLoggingInterface()
	{
		set_thread_logging_interface(previous);
	}

	ScopedLoggingInterface(const ScopedLoggingInterface &) = delete;
	void operator=(const ScopedLoggingInterface &) = delete;

private:
	LoggingInterface *previous;
};
}

#define LOG_STDERR(tag, ...)                 \
	do                                       \
	{                                        \
		fprintf(stderr, tag __VA_ARGS__);    \
		fflush(stderr);                      \
	} while (false)

#define LOGE(...)                                           \
	do                                                      \
	{                                                       \
		if (!::Util::interface_log("[ERROR]: ", __VA_ARGS__)) \
			LOG_STDERR("[ERROR]: ", __VA_ARGS__);           \
	} while (false)

#define LOGW(...)                                          \
	do                                                     \
	{                                                      \
		if (!::Util::interface_log("[WARN]: ", __VA_ARGS__)) \
			LOG_STDERR("[WARN]: ", __VA_ARGS__);           \
	} while (false)

#define LOGI(...)                                          \
	do                                                     \
	{                                                      \
		if (!::Util::interface_log("[INFO]: ", __VA_ARGS__)) \
			LOG_STDERR("[INFO]: ", __VA_ARGS__);           \
	} while (false)
