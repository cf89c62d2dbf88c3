#include "wordsmith/gameService.hpp"

#include "logging.hpp"

#include <algorithm>
#include <format>

namespace wordsmith::app {

static constexpr Duration MAX_PURGE_INTERVAL{60000};

GameService::GameService(ServerConfig config, std::shared_ptr<IPersistence> persistence, IRoomEventSink& sink)
    : m_config(std::move(config)), m_sink(sink),
      m_oracle(std::make_shared<WordOracle>(persistence, m_config.oracleCacheCapacity, m_config.oracleTimeout)),
      m_registry(persistence, m_oracle, m_config.roomSettings()), m_ioContext(), m_purgeTimer(m_ioContext),
      m_ticks(m_ioContext, m_config.tickInterval, [this](const auto& room, const auto& update) { publish(room, update); }),
      m_bots(m_ioContext, *m_oracle, [this](const auto& room, const auto& update) { publish(room, update); }, m_config.botThreads) {
}

GameService::~GameService() {
	stop();
}

void GameService::start() {
	if (m_running.exchange(true)) {
		return;
	}

	m_ioContext.restart();
	m_workGuard.emplace(asio::make_work_guard(m_ioContext));
	for (unsigned i = 0; i < std::max(1u, m_config.workerThreads); ++i) {
		m_workers.emplace_back([this] { m_ioContext.run(); });
	}
	armPurge();

	Logger().Log(Logging::LogLevel::Info, std::format("[GameService] Started with {} worker threads.", m_workers.size()));
}

void GameService::stop() {
	if (!m_running.exchange(false)) {
		return;
	}

	m_bots.stop();
	m_ticks.stop();

	if (m_workGuard) {
		m_workGuard->reset();
		m_workGuard.reset();
	}
	m_ioContext.stop();
	for (auto& worker: m_workers) {
		if (worker.joinable()) {
			worker.join();
		}
	}
	m_workers.clear();

	Logger().Log(Logging::LogLevel::Info, "[GameService] Stopped.");
}

JoinOutcome GameService::join(const PlayerRef& player, const std::optional<RoomId>& roomId) {
	auto outcome = m_registry.join(player, roomId);
	if (!outcome.update.ok()) {
		Logger().Log(Logging::LogLevel::Info, std::format("[GameService] Join of '{}' rejected: {}", player.id, toString(outcome.update.error->code)));
	} else {
		Logger().Log(Logging::LogLevel::Info, std::format("[GameService] '{}' joined room '{}'.", player.id, outcome.room->id()));
	}

	if (outcome.room) {
		publish(outcome.room, outcome.update);
	}
	return outcome;
}

RoomUpdate GameService::startGame(const RoomId& roomId) {
	return withRoom(roomId, [](GameRoom& room) { return room.start(); });
}

RoomUpdate GameService::attachBot(const RoomId& roomId, std::string_view botId) {
	auto outcome = m_registry.attachBot(roomId, botId);
	if (!outcome.update.ok()) {
		Logger().Log(Logging::LogLevel::Info,
		             std::format("[GameService] Attaching '{}' to room '{}' rejected: {}", botId, roomId, toString(outcome.update.error->code)));
	} else {
		Logger().Log(Logging::LogLevel::Info, std::format("[GameService] Bot '{}' attached to room '{}'.", botId, roomId));
	}

	if (outcome.room) {
		publish(outcome.room, outcome.update);
	}
	return outcome.update;
}

RoomUpdate GameService::submitMove(const RoomId& roomId, const PlayerId& playerId, const Move& move) {
	auto update = withRoom(roomId, [&](GameRoom& room) { return room.submitMove(playerId, move); });
	if (!update.ok()) {
		Logger().Log(Logging::LogLevel::Debug,
		             std::format("[GameService] Move of '{}' in room '{}' rejected: {} {}", playerId, roomId, toString(update.error->code), update.error->word));
	}
	return update;
}

RoomUpdate GameService::resign(const RoomId& roomId, const PlayerId& playerId) {
	return withRoom(roomId, [&](GameRoom& room) { return room.resign(playerId); });
}

RoomUpdate GameService::disconnect(const RoomId& roomId, const PlayerId& playerId) {
	return withRoom(roomId, [&](GameRoom& room) { return room.disconnect(playerId); });
}

RoomUpdate GameService::heartbeat(const RoomId& roomId, const PlayerId& playerId) {
	return withRoom(roomId, [&](GameRoom& room) { return room.reconnect(playerId); });
}

RoomUpdate GameService::pause(const RoomId& roomId) {
	return withRoom(roomId, [](GameRoom& room) { return room.pause(); });
}

RoomUpdate GameService::resume(const RoomId& roomId) {
	return withRoom(roomId, [](GameRoom& room) { return room.resume(); });
}

std::optional<RoomSnapshot> GameService::snapshot(const RoomId& roomId) const {
	const auto room = m_registry.find(roomId);
	if (!room) {
		return std::nullopt;
	}
	return room->snapshot();
}

std::size_t GameService::pendingBotTurns() const {
	return m_bots.pending();
}

RoomRegistry& GameService::registry() {
	return m_registry;
}

WordOracle& GameService::oracle() {
	return *m_oracle;
}

const ServerConfig& GameService::config() const {
	return m_config;
}

template <class Fn>
RoomUpdate GameService::withRoom(const RoomId& roomId, Fn&& operation) {
	const auto room = m_registry.find(roomId);
	if (!room) {
		return RoomUpdate{.error = MoveError{MoveErrorCode::RoomNotFound}};
	}

	auto update = operation(*room);
	publish(room, update);
	return update;
}

void GameService::publish(const std::shared_ptr<GameRoom>& room, const RoomUpdate& update) {
	for (const auto& event: update.events) {
		if (const auto* completed = std::get_if<GameCompletedEvent>(&event)) {
			const auto level = completed->reason == EndReason::Aborted ? Logging::LogLevel::Error : Logging::LogLevel::Info;
			Logger().Log(level, std::format("[GameService] Room '{}' finished, winner '{}'. {}", room->id(), completed->winnerId, completed->detail));
		}
	}
	if (!update.events.empty()) {
		m_sink.onRoomEvents(room->id(), update.events);
	}

	switch (room->status()) {
	case RoomStatus::Active:
		m_ticks.watch(room);
		m_bots.schedule(room);
		break;
	case RoomStatus::Paused:
		m_ticks.watch(room);
		m_bots.cancel(room->id());
		break;
	case RoomStatus::Waiting:
		break;
	case RoomStatus::Completed:
	case RoomStatus::Abandoned:
		m_ticks.unwatch(room->id());
		m_bots.cancel(room->id());
		break;
	}
}

void GameService::armPurge() {
	const auto interval = std::clamp(m_config.finishedRoomGrace, Duration{1}, MAX_PURGE_INTERVAL);
	m_purgeTimer.expires_after(interval);
	m_purgeTimer.async_wait([this](asio::error_code ec) {
		if (ec || !m_running) {
			return;
		}
		purge();
		armPurge();
	});
}

void GameService::purge() {
	for (const auto& roomId: m_registry.purgeFinished(m_config.finishedRoomGrace)) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[GameService] Room '{}' purged.", roomId));
		m_sink.onRoomRemoved(roomId);
	}
}

} // namespace wordsmith::app
