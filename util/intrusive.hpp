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

#include <stddef.h>
#include <utility>

namespace Util
{
// Base for scheduler objects handed out as IntrusivePtr handles.
// Counts are not atomic, handles must not leave the frame thread.
template <typename T>
class IntrusivePtrEnabled
{
public:
	IntrusivePtrEnabled() = default;
	IntrusivePtrEnabled(const IntrusivePtrEnabled &) = delete;
	void operator=(const IntrusivePtrEnabled &) = delete;

	void add_reference()
	{
		reference_count++;
	}

	void release_reference()
	{
		if (--reference_count == 0)
			delete static_cast<T *>(this);
	}

private:
	size_t reference_count = 1;
};

// Adopts the initial reference of a freshly allocated object.
template <typename T>
class IntrusivePtr
{
public:
	IntrusivePtr() = default;

	explicit IntrusivePtr(T *handle)
		: data(handle)
	{
	}

	IntrusivePtr(const IntrusivePtr &other)
		: data(other.data)
	{
		if (data)
			base(data)->add_reference();
	}

	IntrusivePtr(IntrusivePtr &&other) noexcept
		: data(other.data)
	{
		other.data = nullptr;
	}

	~IntrusivePtr()
	{
		reset();
	}

	IntrusivePtr &operator=(const IntrusivePtr &other)
	{
		// Take the new reference first so self assignment is harmless.
		if (other.data)
			base(other.data)->add_reference();
		reset();
		data = other.data;
		return *this;
	}

	IntrusivePtr &operator=(IntrusivePtr &&other) noexcept
	{
		if (this != &other)
		{
			reset();
			data = other.data;
			other.data = nullptr;
		}
		return *this;
	}

	void reset()
	{
		if (data)
			base(data)->release_reference();
		data = nullptr;
	}

	T *operator->() const
	{
		return data;
	}

	T &operator*() const
	{
		return *data;
	}

	T *get() const
	{
		return data;
	}

	explicit operator bool() const
	{
		return data != nullptr;
	}

	bool operator==(const IntrusivePtr &other) const
	{
		return data == other.data;
	}

	bool operator!=(const IntrusivePtr &other) const
	{
		return data != other.data;
	}

private:
	T *data = nullptr;

	static IntrusivePtrEnabled<T> *base(T *ptr)
	{
		return static_cast<IntrusivePtrEnabled<T> *>(ptr);
	}
};
}
