#pragma once

#include "core/board.hpp"
#include "core/tileBag.hpp"
#include "core/types.hpp"

#include <array>
#include <optional>
#include <vector>

namespace wordsmith {

//! One occupied player slot.
struct PlayerState {
	PlayerRef ref;
	std::vector<Tile> rack{};
	int score{0};
	bool connected{true};
	std::optional<TimePoint> disconnectedAt{};
};

//! Board, bag, racks and history of a room. Owned and serialised by the room.
//! Turn order and status live in the TurnStateMachine.
struct GameState {
	Board board;
	TileBag bag;
	std::array<std::optional<PlayerState>, 2> players{};

	std::vector<CommittedMove> history{};
	std::optional<std::size_t> challengeable{}; //!< History index of the play that may still be challenged.
	std::vector<Tile> lastDraw{};               //!< Tiles drawn after the challengeable play.

	bool isFirstPlay() const {
		return board.isEmpty();
	}
	const PlayerState& player(Side side) const {
		return players[index(side)].value();
	}
	PlayerState& player(Side side) {
		return players[index(side)].value();
	}
};

//! Sum of the face values of the rack.
int rackValue(const std::vector<Tile>& rack);

} // namespace wordsmith
