#include "core/botPlayer.hpp"

#include "core/moveValidator.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <initializer_list>
#include <map>
#include <set>
#include <string_view>

namespace wordsmith {

namespace {

struct SearchLimits {
	std::size_t maxTiles;
	unsigned maxCandidates;
};

SearchLimits limitsFor(Difficulty difficulty) {
	switch (difficulty) {
	case Difficulty::Beginner:
		return {4u, 300u};
	case Difficulty::Easy:
		return {5u, 800u};
	case Difficulty::Medium:
		return {6u, 2000u};
	case Difficulty::Hard:
		return {7u, 4000u};
	case Difficulty::Expert:
		return {7u, 6000u};
	case Difficulty::Master:
		return {7u, 8000u};
	}
	return {4u, 300u};
}

bool isVowel(char letter) {
	return std::string_view("AEIOU").find(letter) != std::string_view::npos;
}

//! Free cells walking away from the anchor, jumping over placed tiles. The anchor itself is excluded.
std::vector<Coord> freeCells(const Board& board, Coord anchor, bool horizontal, int step, std::size_t limit) {
	std::vector<Coord> cells;
	auto row = static_cast<long long>(anchor.row);
	auto col = static_cast<long long>(anchor.col);
	const auto size = static_cast<long long>(board.size());
	while (cells.size() < limit) {
		(horizontal ? col : row) += step;
		if (row < 0 || col < 0 || row >= size || col >= size) {
			break;
		}
		const Coord c{static_cast<Id>(row), static_cast<Id>(col)};
		if (board.isFree(c)) {
			cells.push_back(c);
		}
	}
	return cells;
}

std::vector<Coord> anchors(const Board& board) {
	if (board.isEmpty()) {
		return {board.center()};
	}

	std::vector<Coord> result;
	for (Id row = 0; row < board.size(); ++row) {
		for (Id col = 0; col < board.size(); ++col) {
			const Coord c{row, col};
			if (!board.isFree(c)) {
				continue;
			}
			const bool touches = (row > 0 && board.isOccupied({row - 1, col})) || board.isOccupied({row + 1, col}) ||
			                     (col > 0 && board.isOccupied({row, col - 1})) || board.isOccupied({row, col + 1});
			if (touches) {
				result.push_back(c);
			}
		}
	}
	return result;
}

//! Higher is better. Rewards a balanced leave without duplicates.
double leaveValue(const std::vector<Tile>& leave) {
	if (leave.empty()) {
		return 0.0;
	}

	std::map<char, unsigned> counts;
	unsigned vowels = 0u;
	for (const auto& tile: leave) {
		++counts[tile.letter];
		vowels += isVowel(tile.letter) ? 1u : 0u;
	}

	double value = -2.0 * std::abs(static_cast<double>(vowels) - 0.4 * static_cast<double>(leave.size()));
	for (const auto& [letter, count]: counts) {
		value -= 1.5 * static_cast<double>(count - 1u);
	}
	if (counts.contains('Q') && !counts.contains('U')) {
		value -= 5.0;
	}
	if (counts.contains('S') || counts.contains(BLANK_LETTER)) {
		value += 2.0;
	}
	return value;
}

} // namespace

BotPlayer::BotPlayer(BotProfile profile, WordOracle& oracle, unsigned seed) : m_profile(std::move(profile)), m_oracle(oracle), m_rng(seed) {
}

Move BotPlayer::chooseMove(const BotView& view, Duration budget) {
	const auto limits = limitsFor(m_profile.difficulty);
	Search search{
	        .maxTiles      = std::min(limits.maxTiles, view.rack.size()),
	        .maxCandidates = limits.maxCandidates,
	        .deadline      = std::chrono::steady_clock::now() + budget,
	};
	m_evaluated = 0u;

	for (const auto& anchor: anchors(view.board)) {
		for (const bool horizontal: {true, false}) {
			searchAnchor(search, view, anchor, horizontal);
			if (search.stopped) {
				break;
			}
		}
		if (search.stopped) {
			break;
		}
	}

	if (search.candidates.empty()) {
		return fallbackMove(view);
	}

	auto& candidates = search.candidates;
	std::stable_sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) { return a.value > b.value; });

	std::size_t pick = 0u;
	if (candidates.size() > 1u && std::bernoulli_distribution(m_profile.mistakeProbability)(m_rng)) {
		const auto worst = std::min<std::size_t>(candidates.size(), 5u) - 1u;
		pick             = std::uniform_int_distribution<std::size_t>(1u, worst)(m_rng);
	}
	return Move::play(candidates[pick].placements);
}

Duration BotPlayer::thinkTime() {
	std::uniform_int_distribution<Duration::rep> delay(m_profile.minThink.count(), m_profile.maxThink.count());
	return clampThinkTime(Duration{delay(m_rng)});
}

const BotProfile& BotPlayer::profile() const {
	return m_profile;
}

unsigned BotPlayer::evaluated() const {
	return m_evaluated;
}

Move BotPlayer::fallbackMove(const BotView& view) {
	if (view.bagCount < RACK_SIZE || view.rack.empty()) {
		return Move::pass();
	}

	// Keep blanks and S, throw back everything else.
	std::vector<char> letters;
	for (const auto& tile: view.rack) {
		if (!tile.isBlank && tile.letter != 'S') {
			letters.push_back(tile.letter);
		}
	}
	if (letters.empty()) {
		for (const auto& tile: view.rack) {
			letters.push_back(tile.isBlank ? BLANK_LETTER : tile.letter);
		}
	}
	return Move::exchange(std::move(letters));
}

void BotPlayer::searchAnchor(Search& search, const BotView& view, Coord anchor, bool horizontal) {
	if (search.maxTiles == 0u) {
		return;
	}

	// before[0] is the anchor, later entries walk towards the board edge.
	auto before = freeCells(view.board, anchor, horizontal, -1, search.maxTiles - 1u);
	before.insert(before.begin(), anchor);
	const auto after = freeCells(view.board, anchor, horizontal, 1, search.maxTiles - 1u);

	std::vector<bool> used(view.rack.size(), false);
	std::vector<Placement> placements;
	std::vector<Tile> tiles;
	for (std::size_t count = 1u; count <= search.maxTiles; ++count) {
		for (std::size_t lead = 0u; lead < std::min(count, before.size()); ++lead) {
			const auto trail = count - 1u - lead;
			if (trail > after.size()) {
				continue;
			}

			std::vector<Coord> cells(before.rend() - static_cast<std::ptrdiff_t>(lead) - 1, before.rend());
			cells.insert(cells.end(), after.begin(), after.begin() + static_cast<std::ptrdiff_t>(trail));
			permute(search, view, cells, used, placements, tiles);
			if (search.stopped) {
				return;
			}
		}
	}
}

void BotPlayer::permute(Search& search, const BotView& view, const std::vector<Coord>& cells, std::vector<bool>& used,
                        std::vector<Placement>& placements, std::vector<Tile>& tiles) {
	if (placements.size() == cells.size()) {
		consider(search, view, placements, tiles, used);
		return;
	}

	std::string tried;
	for (std::size_t i = 0u; i < view.rack.size(); ++i) {
		const auto& tile = view.rack[i];
		if (used[i] || tile.isBlank || tried.find(tile.letter) != std::string::npos) {
			continue;
		}
		tried.push_back(tile.letter);

		used[i] = true;
		placements.push_back(Placement{cells[placements.size()], tile.letter, false});
		tiles.push_back(tile);
		permute(search, view, cells, used, placements, tiles);
		tiles.pop_back();
		placements.pop_back();
		used[i] = false;

		if (search.stopped) {
			return;
		}
	}
}

void BotPlayer::consider(Search& search, const BotView& view, const std::vector<Placement>& placements, const std::vector<Tile>& tiles,
                         const std::vector<bool>& used) {
	std::string key;
	for (const auto& p: placements) {
		key += std::format("{},{},{};", p.position.row, p.position.col, p.letter);
	}
	if (!search.seen.insert(key).second) {
		return;
	}

	if (m_evaluated >= search.maxCandidates || std::chrono::steady_clock::now() > search.deadline) {
		search.stopped = true;
		return;
	}
	++m_evaluated;

	std::vector<std::string> words;
	const auto score = MoveValidator::scorePlacement(view.board, placements, tiles, &words);
	if (words.empty() || !allValid(words, view.dictionaryId)) {
		return;
	}

	Candidate candidate{.placements = placements, .leave = {}, .score = score, .value = 0.0};
	for (std::size_t i = 0u; i < view.rack.size(); ++i) {
		if (!used[i]) {
			candidate.leave.push_back(view.rack[i]);
		}
	}
	candidate.value = evaluate(view, candidate);
	search.candidates.push_back(std::move(candidate));
}

bool BotPlayer::allValid(const std::vector<std::string>& words, DictionaryId dictionaryId) {
	for (const auto& word: words) {
		const auto key = std::format("{}:{}", dictionaryId, word);
		auto it        = m_words.find(key);
		if (it == m_words.end()) {
			it = m_words.emplace(key, m_oracle.isValid(word, dictionaryId)).first;
		}
		if (!it->second) {
			return false;
		}
	}
	return true;
}

double BotPlayer::evaluate(const BotView& view, const Candidate& candidate) const {
	const auto& weights = m_profile.weights;
	const auto& board   = view.board;

	// Premiums taken count for the play, premium word cells left open next to it count against it.
	double position = 0.0;
	double blocking = 0.0;
	std::set<std::pair<Id, Id>> opened;
	std::set<std::pair<Id, Id>> lanes;
	for (const auto& p: candidate.placements) {
		switch (board.premiumAt(p.position)) {
		case Premium::DoubleLetter:
		case Premium::TripleLetter:
			position += 1.0;
			break;
		case Premium::DoubleWord:
		case Premium::TripleWord:
		case Premium::Star:
			position += 2.0;
			break;
		case Premium::None:
			break;
		}

		for (int dr = -2; dr <= 2; ++dr) {
			for (int dc = -2; dc <= 2; ++dc) {
				const auto row = static_cast<long long>(p.position.row) + dr;
				const auto col = static_cast<long long>(p.position.col) + dc;
				if (row < 0 || col < 0) {
					continue;
				}
				const Coord c{static_cast<Id>(row), static_cast<Id>(col)};
				if (!board.isFree(c)) {
					continue;
				}
				const auto premium  = board.premiumAt(c);
				const bool adjacent = std::abs(dr) + std::abs(dc) == 1;
				if (adjacent && (premium == Premium::DoubleWord || premium == Premium::TripleWord)) {
					opened.insert({c.row, c.col});
				}
				if (premium == Premium::TripleWord) {
					lanes.insert({c.row, c.col});
				}
			}
		}
	}
	position -= static_cast<double>(opened.size());
	blocking -= static_cast<double>(lanes.size());

	// Balanced leaves built from the most common bingo letters.
	double bingo = 0.0;
	if (!candidate.leave.empty()) {
		std::set<char> distinct;
		for (const auto& tile: candidate.leave) {
			if (std::string_view("AEINRST").find(tile.letter) != std::string_view::npos) {
				distinct.insert(tile.letter);
			}
		}
		bingo = static_cast<double>(distinct.size());
	}

	double endgame = 0.0;
	if (view.bagCount < RACK_SIZE) {
		endgame = 2.0 * static_cast<double>(candidate.placements.size());
		if (view.bagCount == 0u && candidate.leave.empty()) {
			endgame += 10.0;
		}
	}

	return weights.score * candidate.score + weights.rackLeave * leaveValue(candidate.leave) + weights.boardPosition * position +
	       weights.blocking * blocking + weights.bingoSetup * bingo + weights.endgame * endgame;
}

} // namespace wordsmith
