#pragma once

#include "data/persistence.hpp"
#include "network/tcpServer.hpp"
#include "wordsmith/IRoomEventSink.hpp"
#include "wordsmith/config.hpp"
#include "wordsmith/gameService.hpp"
#include "wordsmith/nwEvents.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace wordsmith::app {

//! Binds the game service to TCP clients.
//! A connection becomes a room member with its first successful join. Room events are broadcast to all members,
//! errors only go to the connection that caused them.
class GameServer : public IRoomEventSink {
public:
	GameServer(ServerConfig config, std::shared_ptr<IPersistence> persistence);
	~GameServer();

	void start(); //!< Boot the game service and the network listener.
	void stop();  //!< Stop the network listener, then the game service.

	std::uint16_t port() const; //!< Port the listener is bound to.
	GameService& service();

	// IRoomEventSink overrides
	void onRoomEvents(const RoomId& roomId, const std::vector<RoomEvent>& events) override;
	void onRoomRemoved(const RoomId& roomId) override;

private:
	// Network callbacks. Run on the network thread.
	void onClientConnected(network::ConnectionId connectionId);
	void onClientMessage(network::ConnectionId connectionId, const network::Message& payload);
	void onClientDisconnected(network::ConnectionId connectionId);

	struct Session {
		PlayerId player;
		RoomId room;
	};

	// Processing of the parsed client messages.
	void handleNetworkEvent(network::ConnectionId connectionId, const ClientJoin& event);
	void handleNetworkEvent(network::ConnectionId connectionId, const ClientStart& event);
	void handleNetworkEvent(network::ConnectionId connectionId, const ClientPlay& event);
	void handleNetworkEvent(network::ConnectionId connectionId, const ClientExchange& event);
	void handleNetworkEvent(network::ConnectionId connectionId, const ClientPass& event);
	void handleNetworkEvent(network::ConnectionId connectionId, const ClientChallenge& event);
	void handleNetworkEvent(network::ConnectionId connectionId, const ClientResign& event);
	void handleNetworkEvent(network::ConnectionId connectionId, const ClientBot& event);
	void handleNetworkEvent(network::ConnectionId connectionId, const ClientPing& event);

	void submit(network::ConnectionId connectionId, const Move& move);
	void reply(network::ConnectionId connectionId, const RoomUpdate& update); //!< Send the error of a rejected request to its sender.

	std::optional<Session> session(network::ConnectionId connectionId) const;
	void bind(network::ConnectionId connectionId, Session session);
	std::optional<Session> unbind(network::ConnectionId connectionId);

private:
	GameService m_service;
	network::TcpServer m_network;

	mutable std::mutex m_sessionsMutex;
	std::unordered_map<network::ConnectionId, Session> m_sessions;                     //!< Joined connections.
	std::unordered_map<RoomId, std::unordered_set<network::ConnectionId>> m_members; //!< Connections per room.
};

} // namespace wordsmith::app
