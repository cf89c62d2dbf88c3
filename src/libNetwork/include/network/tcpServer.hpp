#pragma once

#include "network/connection.hpp"
#include "network/protocol.hpp"

#include <asio.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>

namespace wordsmith::network {

//! Connection manager that runs an async accept loop on a dedicated IO thread.
class TcpServer {
public:
	struct Callbacks {
		std::function<void(ConnectionId)> onConnect;
		std::function<void(ConnectionId, const Message&)> onMessage;
		std::function<void(ConnectionId)> onDisconnect;
	};

	//! Binds the listening socket. Port 0 picks a free port.
	//! \note Throws asio::system_error when the port cannot be bound.
	explicit TcpServer(std::uint16_t port = DEFAULT_PORT);
	~TcpServer();

	void connect(Callbacks callbacks); //!< Connect callback functions to get event signalling. Call before start.
	void start();                      //!< Start accepting clients.
	void stop();                       //!< Disconnect clients and stop the server.

	bool send(ConnectionId connectionId, const Message& msg); //!< Send message to the client with given connectionId.
	void reject(ConnectionId connectionId);                   //!< Drop the client with given connectionId.

	std::uint16_t port() const; //!< Port the server listens on.
	std::size_t connectionCount() const;

private:
	void doAccept();                                                             //!< Start async accept loop.
	void addConnection(asio::ip::tcp::socket socket, ConnectionId connectionId); //!< Create, register and start a new connection.

private:
	asio::io_context m_ioContext;
	asio::ip::tcp::acceptor m_acceptor;
	std::optional<asio::executor_work_guard<asio::io_context::executor_type>> m_workGuard;

	std::thread m_ioThread;             //!< IO context thread.
	std::atomic<bool> m_running{false}; //!< TCP Server running.

	Callbacks m_callbacks; //!< Callback functions to signal events.

	std::unordered_map<ConnectionId, std::shared_ptr<Connection>> m_connections; //!< Active connections.
	mutable std::mutex m_connectionsMutex;                                        //!< Handle concurrency.
	ConnectionId m_nextConnectionId{1u};
};

} // namespace wordsmith::network
