#include "wordsmith/gameServer.hpp"

#include "logging.hpp"

#include <format>
#include <utility>
#include <vector>

namespace wordsmith::app {

static constexpr char LOG_REC_MOVE[] = "[GameServer] Received move from '{}' in room '{}'.";

GameServer::GameServer(ServerConfig config, std::shared_ptr<IPersistence> persistence)
    : m_service(config, std::move(persistence), *this), m_network(config.port) {
	network::TcpServer::Callbacks callbacks;
	callbacks.onConnect    = [this](network::ConnectionId connectionId) { onClientConnected(connectionId); };
	callbacks.onMessage    = [this](network::ConnectionId connectionId, const network::Message& payload) { onClientMessage(connectionId, payload); };
	callbacks.onDisconnect = [this](network::ConnectionId connectionId) { onClientDisconnected(connectionId); };
	m_network.connect(callbacks);
}

GameServer::~GameServer() {
	stop();
}

void GameServer::start() {
	m_service.start();
	m_network.start();
	Logger().Log(Logging::LogLevel::Info, std::format("[GameServer] Listening on port {}.", m_network.port()));
}

void GameServer::stop() {
	m_network.stop();
	m_service.stop();

	std::lock_guard<std::mutex> lock(m_sessionsMutex);
	m_sessions.clear();
	m_members.clear();
}

std::uint16_t GameServer::port() const {
	return m_network.port();
}

GameService& GameServer::service() {
	return m_service;
}

void GameServer::onRoomEvents(const RoomId& roomId, const std::vector<RoomEvent>& events) {
	std::vector<std::pair<network::ConnectionId, PlayerId>> recipients;
	{
		std::lock_guard<std::mutex> lock(m_sessionsMutex);
		const auto it = m_members.find(roomId);
		if (it == m_members.end()) {
			return;
		}
		for (const auto connectionId: it->second) {
			recipients.emplace_back(connectionId, m_sessions.at(connectionId).player);
		}
	}

	for (const auto& event: events) {
		// Only snapshots differ per viewer.
		if (std::holds_alternative<StateSnapshotEvent>(event)) {
			for (const auto& [connectionId, player]: recipients) {
				m_network.send(connectionId, toMessage(event, player));
			}
			continue;
		}

		const auto message = toMessage(event);
		for (const auto& [connectionId, player]: recipients) {
			m_network.send(connectionId, message);
		}
	}
}

void GameServer::onRoomRemoved(const RoomId& roomId) {
	std::lock_guard<std::mutex> lock(m_sessionsMutex);
	const auto it = m_members.find(roomId);
	if (it == m_members.end()) {
		return;
	}
	for (const auto connectionId: it->second) {
		m_sessions.erase(connectionId);
	}
	m_members.erase(it);
}

void GameServer::onClientConnected(network::ConnectionId connectionId) {
	Logger().Log(Logging::LogLevel::Info, std::format("[GameServer] Client '{}' connected.", connectionId));
}

void GameServer::onClientMessage(network::ConnectionId connectionId, const network::Message& payload) {
	const auto event = fromClientMessage(payload);
	if (!event) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[GameServer] Malformed message from client '{}'.", connectionId));
		m_network.send(connectionId, toMessage(ServerEvent{ServerError{}}));
		return;
	}

	std::visit([&](const auto& e) { handleNetworkEvent(connectionId, e); }, *event);
}

void GameServer::onClientDisconnected(network::ConnectionId connectionId) {
	Logger().Log(Logging::LogLevel::Info, std::format("[GameServer] Client '{}' disconnected.", connectionId));

	const auto session = unbind(connectionId);
	if (session) {
		m_service.disconnect(session->room, session->player);
	}
}

void GameServer::handleNetworkEvent(network::ConnectionId connectionId, const ClientJoin& event) {
	// A connection plays in one room at a time. Joining elsewhere leaves the previous room.
	if (const auto previous = unbind(connectionId)) {
		m_service.disconnect(previous->room, previous->player);
	}

	const auto player  = PlayerRef{.kind = PlayerRef::Kind::Human, .id = event.userId, .name = event.userId};
	const auto outcome = m_service.join(player, event.roomId);
	if (!outcome.update.ok()) {
		reply(connectionId, outcome.update);
		return;
	}

	const auto& room = outcome.room;
	bind(connectionId, Session{.player = event.userId, .room = room->id()});

	const auto snapshot = room->snapshot();
	for (std::size_t i = 0; i < snapshot.players.size(); ++i) {
		if (snapshot.players[i] && snapshot.players[i]->ref.id == event.userId) {
			m_network.send(connectionId, toMessage(ServerEvent{ServerJoined{.roomId = room->id(), .side = static_cast<Side>(i)}}));
		}
	}

	// The turn was broadcast by the join itself, before this connection was bound.
	const auto& toMove = snapshot.players[index(snapshot.current)];
	if (snapshot.status == RoomStatus::Active && toMove) {
		m_network.send(connectionId, toMessage(RoomEvent{TurnChangedEvent{snapshot.current, toMove->ref.id}}));
	}
	m_network.send(connectionId, toMessage(RoomEvent{StateSnapshotEvent{snapshot}}, event.userId));
}

void GameServer::handleNetworkEvent(network::ConnectionId connectionId, const ClientStart&) {
	const auto current = session(connectionId);
	if (!current) {
		reply(connectionId, RoomUpdate{.error = MoveError{MoveErrorCode::RoomNotFound}});
		return;
	}
	reply(connectionId, m_service.startGame(current->room));
}

void GameServer::handleNetworkEvent(network::ConnectionId connectionId, const ClientPlay& event) {
	submit(connectionId, Move::play(event.placements));
}

void GameServer::handleNetworkEvent(network::ConnectionId connectionId, const ClientExchange& event) {
	submit(connectionId, Move::exchange(event.letters));
}

void GameServer::handleNetworkEvent(network::ConnectionId connectionId, const ClientPass&) {
	submit(connectionId, Move::pass());
}

void GameServer::handleNetworkEvent(network::ConnectionId connectionId, const ClientChallenge&) {
	submit(connectionId, Move::challenge());
}

void GameServer::handleNetworkEvent(network::ConnectionId connectionId, const ClientResign&) {
	const auto current = session(connectionId);
	if (!current) {
		reply(connectionId, RoomUpdate{.error = MoveError{MoveErrorCode::RoomNotFound}});
		return;
	}
	Logger().Log(Logging::LogLevel::Info, std::format("[GameServer] '{}' resigns in room '{}'.", current->player, current->room));
	reply(connectionId, m_service.resign(current->room, current->player));
}

void GameServer::handleNetworkEvent(network::ConnectionId connectionId, const ClientBot& event) {
	const auto current = session(connectionId);
	if (!current) {
		reply(connectionId, RoomUpdate{.error = MoveError{MoveErrorCode::RoomNotFound}});
		return;
	}
	reply(connectionId, m_service.attachBot(current->room, event.botId));
}

void GameServer::handleNetworkEvent(network::ConnectionId connectionId, const ClientPing&) {
	if (const auto current = session(connectionId)) {
		const auto update = m_service.heartbeat(current->room, current->player);
		if (!update.ok()) {
			Logger().Log(Logging::LogLevel::Debug, std::format("[GameServer] Heartbeat of '{}' ignored: {}", current->player, toString(update.error->code)));
		}
	}
	m_network.send(connectionId, toMessage(ServerEvent{ServerPong{}}));
}

void GameServer::submit(network::ConnectionId connectionId, const Move& move) {
	const auto current = session(connectionId);
	if (!current) {
		reply(connectionId, RoomUpdate{.error = MoveError{MoveErrorCode::RoomNotFound}});
		return;
	}

	Logger().Log(Logging::LogLevel::Debug, std::format(LOG_REC_MOVE, current->player, current->room));
	reply(connectionId, m_service.submitMove(current->room, current->player, move));
}

void GameServer::reply(network::ConnectionId connectionId, const RoomUpdate& update) {
	if (update.ok()) {
		return;
	}
	m_network.send(connectionId, toMessage(ServerEvent{ServerError{.error = update.error}}));
}

std::optional<GameServer::Session> GameServer::session(network::ConnectionId connectionId) const {
	std::lock_guard<std::mutex> lock(m_sessionsMutex);
	const auto it = m_sessions.find(connectionId);
	if (it == m_sessions.end()) {
		return std::nullopt;
	}
	return it->second;
}

void GameServer::bind(network::ConnectionId connectionId, Session session) {
	std::lock_guard<std::mutex> lock(m_sessionsMutex);
	m_members[session.room].insert(connectionId);
	m_sessions.insert_or_assign(connectionId, std::move(session));
}

std::optional<GameServer::Session> GameServer::unbind(network::ConnectionId connectionId) {
	std::lock_guard<std::mutex> lock(m_sessionsMutex);
	const auto it = m_sessions.find(connectionId);
	if (it == m_sessions.end()) {
		return std::nullopt;
	}

	auto session = std::move(it->second);
	m_sessions.erase(it);

	if (const auto members = m_members.find(session.room); members != m_members.end()) {
		members->second.erase(connectionId);
		if (members->second.empty()) {
			m_members.erase(members);
		}
	}
	return session;
}

} // namespace wordsmith::app
