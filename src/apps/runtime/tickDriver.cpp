#include "wordsmith/tickDriver.hpp"

#include "logging.hpp"

#include <algorithm>
#include <format>

namespace wordsmith::app {

TickDriver::TickDriver(asio::io_context& ioContext, Duration interval, UpdateHandler onUpdate)
    : m_ioContext(ioContext), m_interval(std::max(interval, Duration{1})), m_onUpdate(std::move(onUpdate)) {
}

void TickDriver::watch(const std::shared_ptr<GameRoom>& room) {
	// One millisecond past the expiry, so the tick observes a zero counter.
	auto delay = m_interval;
	if (const auto left = room->timeUntilExpiry()) {
		delay = std::min(delay, *left + Duration{1});
	}

	std::shared_ptr<Entry> entry;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		auto& slot = m_entries[room->id()];
		if (!slot) {
			slot = std::make_shared<Entry>(m_ioContext);
		}
		entry = slot;
	}

	asio::post(entry->strand, [this, entry, delay, weak = std::weak_ptr<GameRoom>(room)] {
		// Re-arming cancels the pending wait.
		entry->timer.expires_after(delay);
		entry->timer.async_wait(asio::bind_executor(entry->strand, [this, weak](asio::error_code ec) {
			if (ec) {
				return;
			}
			onTimer(weak);
		}));
	});
}

void TickDriver::unwatch(const RoomId& roomId) {
	std::shared_ptr<Entry> entry;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		const auto it = m_entries.find(roomId);
		if (it == m_entries.end()) {
			return;
		}
		entry = it->second;
		m_entries.erase(it);
	}

	asio::post(entry->strand, [entry] { entry->timer.cancel(); });
}

void TickDriver::stop() {
	std::unordered_map<RoomId, std::shared_ptr<Entry>> entries;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		entries.swap(m_entries);
	}
	for (auto& [id, entry]: entries) {
		asio::post(entry->strand, [entry] { entry->timer.cancel(); });
	}
}

std::size_t TickDriver::watched() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_entries.size();
}

void TickDriver::onTimer(const std::weak_ptr<GameRoom>& weak) {
	const auto room = weak.lock();
	if (!room) {
		return;
	}

	const auto update = room->tick();
	if (!update.ok()) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[TickDriver] Tick of room '{}' rejected: {}", room->id(), toString(update.error->code)));
	}
	m_onUpdate(room, update);
}

} // namespace wordsmith::app
