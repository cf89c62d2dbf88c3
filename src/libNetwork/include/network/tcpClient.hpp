#pragma once

#include "network/protocol.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace wordsmith::network {

//! Minimal synchronous TCP client speaking the framed protocol.
class TcpClient {
public:
	TcpClient();
	~TcpClient();

	bool connect(const std::string& host, std::uint16_t port = DEFAULT_PORT);
	void disconnect();

	bool send(const Message& message);
	std::optional<Message> read(); //!< Blocks for the next frame. Empty once the connection is gone.

	bool isConnected() const;

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl;
};

} // namespace wordsmith::network
