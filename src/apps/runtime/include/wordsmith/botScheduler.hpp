#pragma once

#include "core/botPlayer.hpp"
#include "core/gameRoom.hpp"
#include "core/wordOracle.hpp"
#include "wordsmith/tickDriver.hpp"

#include <asio.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <unordered_map>

namespace wordsmith::app {

//! Plays the bot seats of all rooms.
//! The move is computed on a search pool of its own, without the room lock, so searches never delay room timers.
//! It is submitted after the bot's think time with the epoch it was computed for. A stale epoch turns the submission into a no-op.
class BotScheduler {
public:
	BotScheduler(asio::io_context& ioContext, WordOracle& oracle, UpdateHandler onUpdate, unsigned searchThreads,
	             Duration searchBudget = DEFAULT_BOT_SEARCH_BUDGET, std::optional<unsigned> seed = std::nullopt);
	~BotScheduler(); //!< Waits for running searches.

	BotScheduler(const BotScheduler&)            = delete;
	BotScheduler& operator=(const BotScheduler&) = delete;

	//! Start a bot turn if a bot is to move and none is pending for this epoch.
	void schedule(const std::shared_ptr<GameRoom>& room);
	void cancel(const RoomId& roomId); //!< Drop the pending bot turn of a room.
	void stop();                       //!< Drop every pending bot turn.

	std::size_t pending() const;

private:
	struct Pending {
		Pending(asio::io_context& ioContext, RoomId roomId, Epoch epoch)
		    : strand(asio::make_strand(ioContext)), timer(strand), roomId(std::move(roomId)), epoch(epoch) {
		}

		asio::strand<asio::io_context::executor_type> strand;
		asio::steady_timer timer;
		const RoomId roomId;
		const Epoch epoch; //!< Room epoch the move is computed for.
	};

	void compute(const std::weak_ptr<GameRoom>& room, const std::shared_ptr<Pending>& pending, const BotTurn& turn);
	void submit(const std::weak_ptr<GameRoom>& room, const std::shared_ptr<Pending>& pending, const BotTurn& turn, const Move& move);
	bool isCurrent(const std::shared_ptr<Pending>& pending) const;
	unsigned nextSeed();

private:
	asio::io_context& m_ioContext;
	WordOracle& m_oracle;
	UpdateHandler m_onUpdate;
	const Duration m_searchBudget;

	mutable std::mutex m_mutex;
	std::unordered_map<RoomId, std::shared_ptr<Pending>> m_pending;
	std::mt19937 m_rng;

	asio::thread_pool m_searchPool;
};

} // namespace wordsmith::app
