#pragma once

#include "core/errors.hpp"
#include "core/gameState.hpp"
#include "core/wordOracle.hpp"

#include <string>
#include <vector>

namespace wordsmith {

inline constexpr int BINGO_BONUS = 50; //!< Bonus for placing all rack tiles in one play.

//! A move that passed every check, with everything needed to apply it.
struct ValidatedMove {
	MoveType type;
	Side side;

	std::vector<Placement> placements{}; //!< Play: normalised placements.
	std::vector<Tile> placedTiles{};     //!< Play: tiles as they go on the board, same order as placements.
	std::vector<Tile> exchangedTiles{};  //!< Exchange: rack tiles going back into the bag.
	std::vector<Tile> remainingRack{};   //!< Play and exchange: rack after removing the used tiles.

	std::vector<std::string> words{}; //!< Play: formed words. Challenge: words of the challenged play.
	int score{0};
	bool bingo{false};

	bool challengeUpheld{false};    //!< Challenge: at least one challenged word is no longer valid.
	std::string invalidWord{};      //!< Challenge: first word that failed.
};

//! Checks candidate moves against board geometry, rack contents and the dictionary.
//! Checks run in a fixed order and stop at the first failure.
class MoveValidator {
public:
	MoveValidator(WordOracle& oracle, DictionaryId dictionaryId);

	//! Validates the move of side while toMove has the turn.
	Result<ValidatedMove> validate(const GameState& state, Side toMove, Side side, const Move& move) const;

	//! Score of the words formed by placing the tiles. Premiums only count for newly covered cells.
	static int scorePlacement(const Board& board, const std::vector<Placement>& placements, const std::vector<Tile>& tiles,
	                          std::vector<std::string>* words = nullptr);

private:
	Result<ValidatedMove> validatePlay(const GameState& state, Side side, const Move& move) const;
	Result<ValidatedMove> validateExchange(const GameState& state, Side side, const Move& move) const;
	Result<ValidatedMove> validateChallenge(const GameState& state, Side side) const;

private:
	WordOracle& m_oracle;
	DictionaryId m_dictionaryId;
};

} // namespace wordsmith
