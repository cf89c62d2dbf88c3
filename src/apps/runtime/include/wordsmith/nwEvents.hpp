#pragma once

#include "core/errors.hpp"
#include "core/roomEvent.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace wordsmith::app {

// Client Network Events (client -> server)
struct ClientJoin {
	PlayerId userId;
	std::optional<RoomId> roomId; //!< Empty for matchmaking.
};
struct ClientStart {};
struct ClientPlay {
	std::vector<Placement> placements;
};
struct ClientExchange {
	std::vector<char> letters; //!< Blanks as BLANK_LETTER.
};
struct ClientPass {};
struct ClientChallenge {};
struct ClientResign {};
struct ClientBot {
	std::string botId;
};
struct ClientPing {};

// Server Events (server -> client) not carried by a room event.
struct ServerJoined {
	RoomId roomId;
	Side side;
};
struct ServerError {
	std::optional<MoveError> error; //!< Empty for a message that could not be parsed.
};
struct ServerPong {};

using ClientEvent = std::variant<ClientJoin, ClientStart, ClientPlay, ClientExchange, ClientPass, ClientChallenge, ClientResign, ClientBot, ClientPing>;
using ServerEvent = std::variant<ServerJoined, ServerError, ServerPong>;

// Serialize typed events to text messages.
std::string toMessage(ClientEvent event);
std::string toMessage(ServerEvent event);

//! Room events as sent to one connection. Snapshots only reveal the rack of the viewer.
std::string toMessage(const RoomEvent& event, const std::optional<PlayerId>& viewer = std::nullopt);

// Parse text messages into typed events. Returns empty on invalid input.
std::optional<ClientEvent> fromClientMessage(const std::string& message);

} // namespace wordsmith::app
