#pragma once

#include "network/protocol.hpp"

#include <asio.hpp>

#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace wordsmith::network {

//! Transportation primitive. Handles framed reads and writes of a single client socket.
//! Runs on the io_context of the owning server; every handler holds a reference to the connection.
class Connection : public std::enable_shared_from_this<Connection> {
public:
	struct Callbacks {
		std::function<void(Connection&, const Message&)> onMessage;
		std::function<void(Connection&)> onDisconnect; //!< Peer closed, IO failed or an oversized frame arrived.
	};

	Connection(asio::ip::tcp::socket socket, ConnectionId connectionId, Callbacks callbacks);

	void start();                  //!< Start reading.
	void stop();                   //!< Close the socket without signalling a disconnect.
	void send(const Message& msg); //!< Queue a message for the client.

	ConnectionId connectionId() const;
	std::string remoteAddress() const; //!< Peer address for logging. Empty once closed.

private:
	void startRead();    //!< Prime async read and dispatch messages.
	void startWrite();   //!< Prime async write for queued messages.
	void doDisconnect(); //!< Internal cleanup after an IO failure.

private:
	asio::ip::tcp::socket m_socket;               //!< Client socket.
	asio::strand<asio::any_io_executor> m_strand; //!< Serialises handlers of this connection.
	const ConnectionId m_connectionId;
	Callbacks m_callbacks; //!< Used to signal to the parent.

	std::atomic<bool> m_running{false};
	std::deque<Message> m_writeQueue; //!< Only touched on the strand.
	bool m_writeInProgress{false};
};

} // namespace wordsmith::network
