#pragma once

#include "wordsmith/IRoomEventSink.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace wordsmith::gtest {

//! Event sink that keeps everything it receives and lets tests wait for it.
class RecordingSink : public app::IRoomEventSink {
public:
	void onRoomEvents(const RoomId& roomId, const std::vector<RoomEvent>& events) override {
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			for (const auto& event: events) {
				m_events.push_back({roomId, event});
			}
		}
		m_changed.notify_all();
	}

	void onRoomRemoved(const RoomId& roomId) override {
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			m_removed.push_back(roomId);
		}
		m_changed.notify_all();
	}

	//! Wait for the first event of the given type matching the predicate.
	template <class Event>
	std::optional<Event> waitFor(std::function<bool(const Event&)> match, Duration timeout = Duration{5000}) {
		std::optional<Event> found;
		std::unique_lock<std::mutex> lock(m_mutex);
		m_changed.wait_for(lock, timeout, [&] {
			for (const auto& [roomId, event]: m_events) {
				const auto* e = std::get_if<Event>(&event);
				if (e && match(*e)) {
					found = *e;
					return true;
				}
			}
			return false;
		});
		return found;
	}

	bool waitForRemoval(const RoomId& roomId, Duration timeout = Duration{5000}) {
		std::unique_lock<std::mutex> lock(m_mutex);
		return m_changed.wait_for(lock, timeout, [&] { return std::find(m_removed.begin(), m_removed.end(), roomId) != m_removed.end(); });
	}

	template <class Event>
	std::size_t count(const RoomId& roomId) const {
		std::lock_guard<std::mutex> lock(m_mutex);
		return std::count_if(m_events.begin(), m_events.end(),
		                     [&](const auto& entry) { return entry.first == roomId && std::holds_alternative<Event>(entry.second); });
	}

private:
	mutable std::mutex m_mutex;
	std::condition_variable m_changed;
	std::vector<std::pair<RoomId, RoomEvent>> m_events;
	std::vector<RoomId> m_removed;
};

} // namespace wordsmith::gtest
