#include "core/moveValidator.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <optional>

namespace wordsmith {

namespace {

enum class Direction { Horizontal, Vertical };

Direction perpendicular(Direction dir) {
	return dir == Direction::Horizontal ? Direction::Vertical : Direction::Horizontal;
}

//! Neighbouring coordinate along dir, or nothing when it leaves the board.
std::optional<Coord> offset(const Board& board, Coord c, Direction dir, int delta) {
	const auto row = static_cast<long long>(c.row) + (dir == Direction::Vertical ? delta : 0);
	const auto col = static_cast<long long>(c.col) + (dir == Direction::Horizontal ? delta : 0);
	if (row < 0 || col < 0) {
		return std::nullopt;
	}

	const Coord next{static_cast<Id>(row), static_cast<Id>(col)};
	if (!board.inBounds(next)) {
		return std::nullopt;
	}
	return next;
}

struct WordCell {
	Tile tile;
	Premium premium;
	bool isNew;
};

//! Board as it would look with the candidate tiles placed.
class Overlay {
public:
	Overlay(const Board& board, const std::vector<Placement>& placements, const std::vector<Tile>& tiles)
	    : m_board(board), m_placements(placements), m_tiles(tiles) {
	}

	std::optional<WordCell> at(Coord c) const {
		for (std::size_t i = 0; i < m_placements.size(); ++i) {
			if (m_placements[i].position == c) {
				return WordCell{m_tiles[i], m_board.premiumAt(c), true};
			}
		}
		if (const auto& tile = m_board.getAt(c)) {
			return WordCell{*tile, m_board.premiumAt(c), false};
		}
		return std::nullopt;
	}

	//! Maximal run of tiles through start along dir.
	std::vector<WordCell> wordThrough(Coord start, Direction dir) const {
		auto first = start;
		while (const auto prev = offset(m_board, first, dir, -1)) {
			if (!at(*prev)) {
				break;
			}
			first = *prev;
		}

		std::vector<WordCell> word;
		std::optional<Coord> cursor = first;
		while (cursor) {
			const auto cell = at(*cursor);
			if (!cell) {
				break;
			}
			word.push_back(*cell);
			cursor = offset(m_board, *cursor, dir, 1);
		}
		return word;
	}

private:
	const Board& m_board;
	const std::vector<Placement>& m_placements;
	const std::vector<Tile>& m_tiles;
};

unsigned letterMultiplier(Premium premium) {
	switch (premium) {
	case Premium::DoubleLetter:
		return 2u;
	case Premium::TripleLetter:
		return 3u;
	default:
		return 1u;
	}
}

unsigned wordMultiplier(Premium premium) {
	switch (premium) {
	case Premium::DoubleWord:
	case Premium::Star:
		return 2u;
	case Premium::TripleWord:
		return 3u;
	default:
		return 1u;
	}
}

int scoreWord(const std::vector<WordCell>& word) {
	int letters         = 0;
	unsigned multiplier = 1u;
	for (const auto& cell: word) {
		const auto points = cell.tile.isBlank ? 0u : cell.tile.points;
		if (cell.isNew) {
			letters += static_cast<int>(points * letterMultiplier(cell.premium));
			multiplier *= wordMultiplier(cell.premium);
		} else {
			letters += static_cast<int>(points);
		}
	}
	return letters * static_cast<int>(multiplier);
}

std::string spell(const std::vector<WordCell>& word) {
	std::string text;
	text.reserve(word.size());
	for (const auto& cell: word) {
		text.push_back(cell.tile.letter);
	}
	return text;
}

//! Takes the rack tile matching the letter. Blanks match BLANK_LETTER or an explicit blank request.
std::optional<Tile> takeFromRack(std::vector<Tile>& rack, char letter, bool blank) {
	const auto it = std::find_if(rack.begin(), rack.end(), [&](const Tile& t) { return blank ? t.isBlank : (!t.isBlank && t.letter == letter); });
	if (it == rack.end()) {
		return std::nullopt;
	}
	const auto tile = *it;
	rack.erase(it);
	return tile;
}

} // namespace

MoveValidator::MoveValidator(WordOracle& oracle, DictionaryId dictionaryId) : m_oracle(oracle), m_dictionaryId(dictionaryId) {
}

Result<ValidatedMove> MoveValidator::validate(const GameState& state, Side toMove, Side side, const Move& move) const {
	if (side != toMove) {
		return MoveErrorCode::NotYourTurn;
	}

	switch (move.type) {
	case MoveType::Play:
		return validatePlay(state, side, move);
	case MoveType::Exchange:
		return validateExchange(state, side, move);
	case MoveType::Challenge:
		return validateChallenge(state, side);
	case MoveType::Pass:
		break;
	}
	return ValidatedMove{.type = MoveType::Pass, .side = side};
}

int MoveValidator::scorePlacement(const Board& board, const std::vector<Placement>& placements, const std::vector<Tile>& tiles,
                                  std::vector<std::string>* words) {
	if (placements.empty()) {
		return 0;
	}

	const bool sameRow  = std::all_of(placements.begin(), placements.end(), [&](const Placement& p) { return p.position.row == placements.front().position.row; });
	const Direction dir = (placements.size() == 1u || sameRow) ? Direction::Horizontal : Direction::Vertical;

	const Overlay overlay(board, placements, tiles);
	int total = 0;

	const auto addWord = [&](const std::vector<WordCell>& word) {
		if (word.size() < 2u) {
			return;
		}
		total += scoreWord(word);
		if (words) {
			words->push_back(spell(word));
		}
	};

	addWord(overlay.wordThrough(placements.front().position, dir));
	for (const auto& placement: placements) {
		addWord(overlay.wordThrough(placement.position, perpendicular(dir)));
	}

	if (placements.size() == RACK_SIZE) {
		total += BINGO_BONUS;
	}
	return std::max(total, 0);
}

Result<ValidatedMove> MoveValidator::validatePlay(const GameState& state, Side side, const Move& move) const {
	const auto& board = state.board;
	if (move.placements.empty() || move.placements.size() > RACK_SIZE) {
		return MoveErrorCode::InvalidPlacement;
	}

	// Bounds, letters, occupancy and duplicates.
	std::vector<Placement> placements;
	placements.reserve(move.placements.size());
	for (const auto& p: move.placements) {
		const auto letter = static_cast<unsigned char>(p.letter);
		if (!std::isalpha(letter) || !board.isFree(p.position)) {
			return MoveErrorCode::InvalidPlacement;
		}
		const bool duplicate = std::any_of(placements.begin(), placements.end(), [&](const Placement& q) { return q.position == p.position; });
		if (duplicate) {
			return MoveErrorCode::InvalidPlacement;
		}
		placements.push_back(Placement{p.position, static_cast<char>(std::toupper(letter)), p.isBlank});
	}

	// Single line without holes.
	const auto& front  = placements.front().position;
	const bool sameRow = std::all_of(placements.begin(), placements.end(), [&](const Placement& p) { return p.position.row == front.row; });
	const bool sameCol = std::all_of(placements.begin(), placements.end(), [&](const Placement& p) { return p.position.col == front.col; });
	if (!sameRow && !sameCol) {
		return MoveErrorCode::InvalidPlacement;
	}

	const auto [minIt, maxIt] = std::minmax_element(placements.begin(), placements.end(), [&](const Placement& a, const Placement& b) {
		return sameRow ? a.position.col < b.position.col : a.position.row < b.position.row;
	});
	const auto from = sameRow ? minIt->position.col : minIt->position.row;
	const auto to   = sameRow ? maxIt->position.col : maxIt->position.row;
	for (Id i = from; i <= to; ++i) {
		const Coord c         = sameRow ? Coord{front.row, i} : Coord{i, front.col};
		const bool placedHere = std::any_of(placements.begin(), placements.end(), [&](const Placement& p) { return p.position == c; });
		if (!placedHere && !board.isOccupied(c)) {
			return MoveErrorCode::InvalidPlacement;
		}
	}

	// Anchoring: the first play covers the centre, later plays touch an existing tile.
	if (state.isFirstPlay()) {
		const auto center = board.center();
		if (std::none_of(placements.begin(), placements.end(), [&](const Placement& p) { return p.position == center; })) {
			return MoveErrorCode::InvalidPlacement;
		}
	} else {
		const bool connected = std::any_of(placements.begin(), placements.end(), [&](const Placement& p) {
			for (const auto dir: {Direction::Horizontal, Direction::Vertical}) {
				for (const int delta: {-1, 1}) {
					const auto neighbour = offset(board, p.position, dir, delta);
					if (neighbour && board.isOccupied(*neighbour)) {
						return true;
					}
				}
			}
			return false;
		});
		if (!connected) {
			return MoveErrorCode::InvalidPlacement;
		}
	}

	// Rack contents.
	auto rack = state.player(side).rack;
	std::vector<Tile> tiles;
	tiles.reserve(placements.size());
	for (const auto& p: placements) {
		const auto tile = takeFromRack(rack, p.letter, p.isBlank);
		if (!tile) {
			return MoveErrorCode::RackMismatch;
		}
		tiles.push_back(p.isBlank ? Tile{.letter = p.letter, .points = 0u, .isBlank = true} : *tile);
	}

	// Words and score.
	std::vector<std::string> words;
	const auto score = scorePlacement(board, placements, tiles, &words);
	if (words.empty()) {
		return MoveErrorCode::InvalidPlacement;
	}

	try {
		for (const auto& word: words) {
			if (!m_oracle.isValid(word, m_dictionaryId)) {
				return MoveError{MoveErrorCode::InvalidWord, word};
			}
		}
	} catch (const DictionaryUnavailable&) {
		return MoveErrorCode::DictionaryUnavailable;
	}

	return ValidatedMove{
	        .type          = MoveType::Play,
	        .side          = side,
	        .placements    = std::move(placements),
	        .placedTiles   = std::move(tiles),
	        .remainingRack = std::move(rack),
	        .words         = std::move(words),
	        .score         = score,
	        .bingo         = move.placements.size() == RACK_SIZE,
	};
}

Result<ValidatedMove> MoveValidator::validateExchange(const GameState& state, Side side, const Move& move) const {
	if (state.bag.size() < RACK_SIZE || move.exchanged.empty() || move.exchanged.size() > RACK_SIZE) {
		return MoveErrorCode::ExchangeNotAllowed;
	}

	auto rack = state.player(side).rack;
	std::vector<Tile> exchanged;
	for (const auto letter: move.exchanged) {
		const auto upper = static_cast<char>(std::toupper(static_cast<unsigned char>(letter)));
		const auto tile  = takeFromRack(rack, upper, upper == BLANK_LETTER);
		if (!tile) {
			return MoveErrorCode::RackMismatch;
		}
		exchanged.push_back(*tile);
	}

	return ValidatedMove{
	        .type           = MoveType::Exchange,
	        .side           = side,
	        .exchangedTiles = std::move(exchanged),
	        .remainingRack  = std::move(rack),
	};
}

Result<ValidatedMove> MoveValidator::validateChallenge(const GameState& state, Side side) const {
	if (!state.challengeable || *state.challengeable >= state.history.size()) {
		return MoveErrorCode::ChallengeNotAllowed;
	}

	const auto& challenged = state.history[*state.challengeable];
	if (challenged.type != MoveType::Play || challenged.side == side) {
		return MoveErrorCode::ChallengeNotAllowed;
	}

	ValidatedMove result{.type = MoveType::Challenge, .side = side, .words = challenged.words};
	try {
		for (const auto& word: challenged.words) {
			if (!m_oracle.isValid(word, m_dictionaryId)) {
				result.challengeUpheld = true;
				result.invalidWord     = word;
				break;
			}
		}
	} catch (const DictionaryUnavailable&) {
		return MoveErrorCode::DictionaryUnavailable;
	}
	return result;
}

} // namespace wordsmith
