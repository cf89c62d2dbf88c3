#pragma once

#include "data/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace wordsmith {

using RoomId   = std::string;
using PlayerId = std::string; //!< User id for humans, bot id for bots.
using Epoch    = std::uint64_t;

using Duration  = std::chrono::milliseconds;
using TimePoint = std::chrono::steady_clock::time_point;
using WallTime  = std::chrono::system_clock::time_point;

//! Player slot inside a room. Slot 0 is the first to join.
enum class Side : std::uint8_t { First = 0, Second = 1 };

//! Returns the other slot.
inline constexpr Side opponent(Side side) {
	return side == Side::First ? Side::Second : Side::First;
}

inline constexpr std::size_t index(Side side) {
	return static_cast<std::size_t>(side);
}

inline constexpr std::size_t RACK_SIZE = 7u; //!< Tiles held per player and tiles needed in the bag to exchange.

enum class RoomStatus : std::uint8_t {
	Waiting,   //!< Less than two players or waiting for the start request.
	Active,    //!< Game running.
	Paused,    //!< Game running but clocks halted and moves rejected.
	Completed, //!< Terminal: regular game end.
	Abandoned  //!< Terminal: forfeit by disconnect or aborted session.
};

inline constexpr bool isTerminal(RoomStatus status) {
	return status == RoomStatus::Completed || status == RoomStatus::Abandoned;
}

enum class EndReason : std::uint8_t {
	None,
	PassLimit,   //!< Consecutive scoreless turns reached the limit.
	OutOfTiles,  //!< Bag empty and one player emptied the rack.
	Timeout,     //!< A clock reached zero.
	Resignation, //!< A player resigned.
	Disconnect,  //!< A player stayed away longer than the grace period.
	Aborted      //!< Internal invariant violated.
};

enum class MoveType : std::uint8_t { Play, Exchange, Pass, Challenge };

//! Identity of a room member. Exactly one of human or bot.
struct PlayerRef {
	enum class Kind : std::uint8_t { Human, Bot };

	Kind kind{Kind::Human};
	PlayerId id;
	std::string name;

	bool isBot() const {
		return kind == Kind::Bot;
	}
};

//! A tile put on the board by a play.
struct Placement {
	Coord position;
	char letter;         //!< Upper case letter shown on the board.
	bool isBlank{false}; //!< Tile taken from a rack blank.

	bool operator==(const Placement&) const = default;
};

//! Candidate move as submitted by a player or bot.
struct Move {
	MoveType type{MoveType::Pass};
	std::vector<Placement> placements{}; //!< Play only.
	std::vector<char> exchanged{};       //!< Exchange only. Blanks as BLANK_LETTER.

	static Move pass() {
		return Move{.type = MoveType::Pass};
	}
	static Move challenge() {
		return Move{.type = MoveType::Challenge};
	}
	static Move play(std::vector<Placement> placements) {
		return Move{.type = MoveType::Play, .placements = std::move(placements)};
	}
	static Move exchange(std::vector<char> letters) {
		return Move{.type = MoveType::Exchange, .exchanged = std::move(letters)};
	}
};

//! Append-only history record of a move that changed the room.
struct CommittedMove {
	unsigned moveNumber;
	MoveType type;
	Side side;
	PlayerId player;
	std::vector<Placement> placements;
	std::size_t exchangedCount;
	std::vector<std::string> words; //!< Words formed by a play, or re-checked words of a challenge.
	int score;                      //!< Score gained by the mover.
	WallTime timestamp;
};

} // namespace wordsmith
