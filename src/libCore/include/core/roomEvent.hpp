#pragma once

#include "core/errors.hpp"
#include "core/types.hpp"

#include <array>
#include <optional>
#include <variant>
#include <vector>

namespace wordsmith {

//! Public view of one player slot.
struct PlayerView {
	PlayerRef ref;
	int score;
	Duration timeRemaining;
	bool isCurrentTurn;
	bool connected;
	std::vector<Tile> rack; //!< Stripped by the transport for everybody but the owner.
};

//! Full read-only view of a room.
struct RoomSnapshot {
	RoomId id;
	RoomStatus status;
	CellGrid board;
	std::array<std::optional<PlayerView>, 2> players;
	Side current;
	unsigned consecutivePasses;
	unsigned moveNumber;
	std::size_t bagCount;
	Epoch epoch;
	EndReason endReason;
	std::optional<Side> winner;
	WallTime createdAt;
};

struct StateSnapshotEvent {
	RoomSnapshot snapshot;
};
struct MoveCommittedEvent {
	CommittedMove move;
};
struct TurnChangedEvent {
	Side side;
	PlayerId player;
};
struct TimerSyncEvent {
	Duration first;
	Duration second;
	Side running;
	bool paused;
};
struct TimerExpiredEvent {
	Side side;
	PlayerId player;
};
struct GameCompletedEvent {
	RoomStatus status;
	EndReason reason;
	std::optional<Side> winner; //!< Empty for a draw.
	PlayerId winnerId;
	std::array<int, 2> scores;
	std::string detail; //!< Abort reason. Only set for aborted rooms.
};
struct ChallengeResolvedEvent {
	Side challenger;
	bool upheld;
	unsigned challengedMove;
	std::string invalidWord;
	int scoreRemoved;
};

//! Outbound notifications of a room, broadcast to every member in order.
using RoomEvent = std::variant<StateSnapshotEvent, MoveCommittedEvent, TurnChangedEvent, TimerSyncEvent, TimerExpiredEvent,
                               GameCompletedEvent, ChallengeResolvedEvent>;

//! Outcome of a room operation. A rejected request may still carry events observed on the way, e.g. a clock expiry.
struct RoomUpdate {
	std::optional<MoveError> error{};
	std::vector<RoomEvent> events{};

	bool ok() const {
		return !error.has_value();
	}
};

} // namespace wordsmith
