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

#include "event.hpp"
#include <algorithm>

namespace Cadence
{
EventManager::~EventManager()
{
	dispatch();

	for (auto &event_type : events)
	{
		event_type.second.flush_recursive_handlers();
		for (auto &handler : event_type.second.handlers)
			handler.unregister_key->release_manager_reference();
		event_type.second.handlers.clear();
	}

	for (auto &event_type : latched_events)
	{
		event_type.second.flush_recursive_handlers();
		for (auto &handler : event_type.second.handlers)
		{
			dispatch_down_events(event_type.second.queued_events, handler);
			// Before the event manager dies, make sure no stale EventHandler objects try to unregister themselves.
			handler.unregister_key->release_manager_reference();
		}
		event_type.second.handlers.clear();
	}
}

void EventManager::dispatch()
{
	for (auto &event_type : events)
	{
		auto &data = event_type.second;
		// Handlers may enqueue more events, those are delivered on the next dispatch.
		auto queued_events = std::move(data.queued_events);
		data.queued_events.clear();
		for (auto &event : queued_events)
			dispatch_event(data, *event);
	}
}

void EventManager::dispatch_event(EventTypeData &event_type, const Event &e)
{
	auto &handlers = event_type.handlers;
	event_type.dispatching = true;
	auto itr = std::remove_if(std::begin(handlers), std::end(handlers), [&](const Handler &handler) -> bool {
		bool to_remove = !handler.mem_fn(handler.handler, e);
		if (to_remove)
			handler.unregister_key->release_manager_reference();
		return to_remove;
	});

	handlers.erase(itr, std::end(handlers));
	event_type.flush_recursive_handlers();
	event_type.dispatching = false;
}

void EventManager::dispatch_up_events(std::vector<std::unique_ptr<Event>> &up_events, const LatchHandler &handler)
{
	for (auto &event : up_events)
		handler.up_fn(handler.handler, *event);
}

void EventManager::dispatch_down_events(std::vector<std::unique_ptr<Event>> &down_events, const LatchHandler &handler)
{
	for (auto &event : down_events)
		handler.down_fn(handler.handler, *event);
}

void EventManager::LatchEventTypeData::flush_recursive_handlers()
{
	handlers.insert(std::end(handlers), std::begin(recursive_handlers), std::end(recursive_handlers));
	recursive_handlers.clear();
}

void EventManager::EventTypeData::flush_recursive_handlers()
{
	handlers.insert(std::end(handlers), std::begin(recursive_handlers), std::end(recursive_handlers));
	recursive_handlers.clear();
}

void EventManager::dispatch_up_event(LatchEventTypeData &event_type, const Event &event)
{
	event_type.dispatching = true;
	for (auto &handler : event_type.handlers)
		handler.up_fn(handler.handler, event);
	event_type.flush_recursive_handlers();
	event_type.dispatching = false;
}

void EventManager::dispatch_down_event(LatchEventTypeData &event_type, const Event &event)
{
	event_type.dispatching = true;
	for (auto &handler : event_type.handlers)
		handler.down_fn(handler.handler, event);
	event_type.flush_recursive_handlers();
	event_type.dispatching = false;
}

void EventManager::unregister_handler(EventHandler *handler)
{
	for (auto &event_type : events)
	{
		auto &data = event_type.second;
		auto itr = std::remove_if(std::begin(data.handlers), std::end(data.handlers), [&](const Handler &h) -> bool {
			return h.unregister_key == handler;
		});

		if (itr != std::end(data.handlers) && data.dispatching)
			throw std::logic_error("Unregistering handlers while dispatching events.");

		for (auto i = itr; i != std::end(data.handlers); ++i)
			i->unregister_key->release_manager_reference();
		data.handlers.erase(itr, std::end(data.handlers));
	}
}

void EventManager::unregister_latch_handler(EventHandler *handler)
{
	for (auto &event_type : latched_events)
	{
		auto &data = event_type.second;
		auto itr = std::remove_if(std::begin(data.handlers), std::end(data.handlers), [&](const LatchHandler &h) -> bool {
			return h.unregister_key == handler;
		});

		if (itr != std::end(data.handlers) && data.dispatching)
			throw std::logic_error("Unregistering latch handlers while dispatching events.");

		for (auto i = itr; i != std::end(data.handlers); ++i)
			i->unregister_key->release_manager_reference();
		data.handlers.erase(itr, std::end(data.handlers));
	}
}

bool EventManager::dequeue_latched(uint64_t cookie)
{
	bool found = false;
	for (auto &event_type : latched_events)
	{
		auto &data = event_type.second;
		auto &queued_events = data.queued_events;
		if (data.enqueueing)
			throw std::logic_error("Dequeueing latched while queueing events.");
		data.enqueueing = true;

		auto itr = std::remove_if(std::begin(queued_events), std::end(queued_events), [&](const std::unique_ptr<Event> &event) {
			bool signal = event->get_cookie() == cookie;
			if (signal)
				dispatch_down_event(data, *event);
			return signal;
		});

		if (itr != std::end(queued_events))
			found = true;

		data.enqueueing = false;
		queued_events.erase(itr, std::end(queued_events));
	}

	return found;
}

void EventManager::dequeue_all_latched(EventType type)
{
	auto &data = latched_events[type];
	if (data.enqueueing)
		throw std::logic_error("Dequeueing latched while queueing events.");

	data.enqueueing = true;
	for (auto &event : data.queued_events)
		dispatch_down_event(data, *event);
	data.queued_events.clear();
	data.enqueueing = false;
}

void EventHandler::release_manager_reference()
{
	assert(event_manager_ref_count > 0);
	assert(event_manager);
	if (--event_manager_ref_count == 0)
		event_manager = nullptr;
}

void EventHandler::add_manager_reference(EventManager *manager)
{
	if (event_manager_ref_count && manager != event_manager)
		throw std::logic_error("EventHandler cannot be registered with more than one EventManager.");
	event_manager = manager;
	event_manager_ref_count++;
}

EventHandler::~EventHandler()
{
	if (event_manager)
		event_manager->unregister_handler(this);
	// Splitting the branch is significant since event manager can release its last reference in between.
	if (event_manager)
		event_manager->unregister_latch_handler(this);
	assert(event_manager_ref_count == 0 && !event_manager);
}
}
