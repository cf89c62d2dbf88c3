#pragma once

#include "core/gameRoom.hpp"

#include <asio.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace wordsmith::app {

using UpdateHandler = std::function<void(const std::shared_ptr<GameRoom>&, const RoomUpdate&)>;

//! Ticks every running room on its own steady timer.
//! Fires at the configured cadence, or right after the side to move would run out when that is sooner.
class TickDriver {
public:
	TickDriver(asio::io_context& ioContext, Duration interval, UpdateHandler onUpdate);

	void watch(const std::shared_ptr<GameRoom>& room); //!< (Re)arm the timer of a running room.
	void unwatch(const RoomId& roomId);                //!< Cancel the timer of a room.
	void stop();                                       //!< Cancel every timer.

	std::size_t watched() const;

private:
	struct Entry {
		explicit Entry(asio::io_context& ioContext) : strand(asio::make_strand(ioContext)), timer(strand) {
		}

		asio::strand<asio::io_context::executor_type> strand;
		asio::steady_timer timer;
	};

	void onTimer(const std::weak_ptr<GameRoom>& room);

private:
	asio::io_context& m_ioContext;
	const Duration m_interval;
	UpdateHandler m_onUpdate;

	mutable std::mutex m_mutex;
	std::unordered_map<RoomId, std::shared_ptr<Entry>> m_entries;
};

} // namespace wordsmith::app
