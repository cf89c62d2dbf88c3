#include "network/tcpServer.hpp"

#include "Logging.hpp"

#include <asio/ip/tcp.hpp>

#include <format>
#include <utility>

namespace wordsmith::network {

TcpServer::TcpServer(std::uint16_t port) : m_ioContext(), m_acceptor(m_ioContext, asio::ip::tcp::endpoint(asio::ip::tcp::v4(), port)) {
}

TcpServer::~TcpServer() {
	stop();
}

void TcpServer::connect(Callbacks callbacks) {
	m_callbacks = std::move(callbacks);
}

void TcpServer::start() {
	if (m_running.exchange(true)) {
		return;
	}

	m_ioContext.restart();
	m_workGuard.emplace(asio::make_work_guard(m_ioContext));
	doAccept();
	m_ioThread = std::thread([this]() { m_ioContext.run(); });

	Logger().Log(Logging::LogLevel::Info, std::format("[TcpServer] Listening on port {}.", port()));
}

void TcpServer::stop() {
	if (!m_running.exchange(false)) {
		return;
	}

	asio::error_code ec;
	m_acceptor.cancel(ec);
	m_acceptor.close(ec);

	std::unordered_map<ConnectionId, std::shared_ptr<Connection>> connections;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		connections.swap(m_connections);
	}
	for (auto& [id, conn]: connections) {
		conn->stop();
	}

	if (m_workGuard) {
		m_workGuard->reset();
		m_workGuard.reset();
	}
	m_ioContext.stop();

	if (m_ioThread.joinable()) {
		m_ioThread.join();
	}
	Logger().Log(Logging::LogLevel::Info, "[TcpServer] Stopped.");
}

bool TcpServer::send(ConnectionId connectionId, const Message& msg) {
	std::lock_guard<std::mutex> lock(m_connectionsMutex);

	const auto it = m_connections.find(connectionId);
	if (it == m_connections.end()) {
		return false;
	}
	it->second->send(msg);
	return true;
}

void TcpServer::reject(ConnectionId connectionId) {
	std::lock_guard<std::mutex> lock(m_connectionsMutex);

	const auto it = m_connections.find(connectionId);
	if (it != m_connections.end()) {
		it->second->stop();
		m_connections.erase(it);
	}
}

std::uint16_t TcpServer::port() const {
	asio::error_code ec;
	const auto endpoint = m_acceptor.local_endpoint(ec);
	return ec ? 0u : endpoint.port();
}

std::size_t TcpServer::connectionCount() const {
	std::lock_guard<std::mutex> lock(m_connectionsMutex);
	return m_connections.size();
}

void TcpServer::doAccept() {
	m_acceptor.async_accept([this](asio::error_code ec, asio::ip::tcp::socket socket) {
		if (!m_running) {
			return;
		}
		if (!ec) {
			addConnection(std::move(socket), m_nextConnectionId++);
		} else {
			Logger().Log(Logging::LogLevel::Warning, std::format("[TcpServer] Accept failed: {}", ec.message()));
		}

		if (m_running) {
			doAccept();
		}
	});
}

void TcpServer::addConnection(asio::ip::tcp::socket socket, ConnectionId connectionId) {
	Connection::Callbacks callbacks;
	callbacks.onMessage = [this](Connection& connection, const Message& message) {
		if (m_callbacks.onMessage) {
			m_callbacks.onMessage(connection.connectionId(), message);
		}
	};
	callbacks.onDisconnect = [this](Connection& connection) {
		const auto id = connection.connectionId();
		asio::post(m_ioContext, [this, id] {
			std::lock_guard<std::mutex> lock(m_connectionsMutex);
			m_connections.erase(id);
		});

		Logger().Log(Logging::LogLevel::Info, std::format("[TcpServer] Connection {} closed.", id));
		if (m_callbacks.onDisconnect) {
			m_callbacks.onDisconnect(id);
		}
	};

	auto connection = std::make_shared<Connection>(std::move(socket), connectionId, std::move(callbacks));
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		m_connections.emplace(connectionId, connection);
	}
	Logger().Log(Logging::LogLevel::Info, std::format("[TcpServer] Connection {} accepted from {}.", connectionId, connection->remoteAddress()));

	// Register the client before its first message can arrive.
	if (m_callbacks.onConnect) {
		m_callbacks.onConnect(connectionId);
	}
	connection->start();
}

} // namespace wordsmith::network
