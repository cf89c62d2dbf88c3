#pragma once

#include "core/roomRegistry.hpp"
#include "core/wordOracle.hpp"
#include "data/persistence.hpp"
#include "wordsmith/IRoomEventSink.hpp"
#include "wordsmith/botScheduler.hpp"
#include "wordsmith/config.hpp"
#include "wordsmith/tickDriver.hpp"

#include <asio.hpp>

#include <atomic>
#include <memory>
#include <optional>
#include <string_view>
#include <thread>
#include <vector>

namespace wordsmith::app {

//! Entry point for every inbound request.
//! Owns the rooms, the shared worker pool and the timers. Room events go to the sink,
//! errors are returned to the caller only.
class GameService {
public:
	GameService(ServerConfig config, std::shared_ptr<IPersistence> persistence, IRoomEventSink& sink);
	~GameService();

	GameService(const GameService&)            = delete;
	GameService& operator=(const GameService&) = delete;

	void start(); //!< Start the worker pool.
	void stop();  //!< Cancel timers and join the worker pool.

	JoinOutcome join(const PlayerRef& player, const std::optional<RoomId>& roomId = std::nullopt);
	RoomUpdate startGame(const RoomId& roomId);
	RoomUpdate attachBot(const RoomId& roomId, std::string_view botId);
	RoomUpdate submitMove(const RoomId& roomId, const PlayerId& playerId, const Move& move);
	RoomUpdate resign(const RoomId& roomId, const PlayerId& playerId);
	RoomUpdate disconnect(const RoomId& roomId, const PlayerId& playerId);
	RoomUpdate heartbeat(const RoomId& roomId, const PlayerId& playerId);
	RoomUpdate pause(const RoomId& roomId);
	RoomUpdate resume(const RoomId& roomId);

	std::optional<RoomSnapshot> snapshot(const RoomId& roomId) const;
	std::size_t pendingBotTurns() const; //!< Bot turns computing or waiting for their think time.

	RoomRegistry& registry();
	WordOracle& oracle();
	const ServerConfig& config() const;

private:
	template <class Fn>
	RoomUpdate withRoom(const RoomId& roomId, Fn&& operation);

	void publish(const std::shared_ptr<GameRoom>& room, const RoomUpdate& update); //!< Forward events and re-arm timers and bots.
	void armPurge();
	void purge();

private:
	const ServerConfig m_config;
	IRoomEventSink& m_sink;

	std::shared_ptr<WordOracle> m_oracle;
	RoomRegistry m_registry;

	asio::io_context m_ioContext;
	std::optional<asio::executor_work_guard<asio::io_context::executor_type>> m_workGuard;
	asio::steady_timer m_purgeTimer;
	TickDriver m_ticks;
	BotScheduler m_bots;

	std::atomic<bool> m_running{false};
	std::vector<std::thread> m_workers;
};

} // namespace wordsmith::app
