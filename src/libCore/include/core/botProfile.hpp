#pragma once

#include "core/board.hpp"
#include "core/types.hpp"
#include "data/persistence.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace wordsmith {

inline constexpr Duration MIN_BOT_THINK_TIME{500};   //!< Lower bound of every bot delay.
inline constexpr Duration MAX_BOT_THINK_TIME{30000}; //!< Upper bound of every bot delay.

enum class Difficulty : std::uint8_t { Beginner, Easy, Medium, Hard, Expert, Master };

//! Weights used to rank candidate plays.
struct StrategyWeights {
	double score;         //!< Points of the play.
	double rackLeave;     //!< Quality of the tiles kept.
	double boardPosition; //!< Premium squares used versus opened for the opponent.
	double blocking;      //!< Penalty for opening triple word lanes.
	double bingoSetup;    //!< Keeping a balanced rack that may bingo next turn.
	double endgame;       //!< Emptying the rack when the bag runs low.
};

//! Automated opponent as listed in the catalogue.
struct BotProfile {
	PlayerId id;
	std::string name;
	Difficulty difficulty;

	Duration minThink; //!< Delay bounds. Always inside [MIN_BOT_THINK_TIME, MAX_BOT_THINK_TIME].
	Duration maxThink;
	double mistakeProbability; //!< Chance to pick a weaker candidate.
	StrategyWeights weights;

	PlayerRef ref() const {
		return PlayerRef{.kind = PlayerRef::Kind::Bot, .id = id, .name = name};
	}
};

//! Everything a bot may look at when choosing a move. Copied out of the room.
struct BotView {
	Board board;
	std::vector<Tile> rack;
	std::size_t bagCount;
	std::size_t opponentRackCount;
	int ownScore;
	int opponentScore;
	DictionaryId dictionaryId;
};

//! Bots available for attaching, easiest first.
const std::vector<BotProfile>& botCatalog();

//! Catalogue entry with the given id.
std::optional<BotProfile> findBot(std::string_view botId);

//! Clamp a delay into the allowed bot range.
Duration clampThinkTime(Duration delay);

} // namespace wordsmith
