#pragma once

#include "core/botProfile.hpp"
#include "core/wordOracle.hpp"

#include <random>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace wordsmith {

inline constexpr Duration DEFAULT_BOT_SEARCH_BUDGET{1500}; //!< Wall time a bot may spend on a single search.

//! Chooses moves for a catalogue bot.
//! Enumerates plays through anchor cells, ranks them with the profile's strategy weights and
//! occasionally picks a weaker candidate according to the mistake probability.
//! Blanks stay in the rack; bots never designate them.
class BotPlayer {
public:
	BotPlayer(BotProfile profile, WordOracle& oracle, unsigned seed);

	//! Best move found within the budget. Falls back to exchange or pass when no play is found.
	//! \note Throws DictionaryUnavailable when the word oracle fails during the search.
	Move chooseMove(const BotView& view, Duration budget = DEFAULT_BOT_SEARCH_BUDGET);

	//! Delay before the move is submitted, uniform in the profile's bounds.
	Duration thinkTime();

	const BotProfile& profile() const;
	unsigned evaluated() const; //!< Candidates scored by the last search.

	//! Exchange when the bag allows it, else pass.
	static Move fallbackMove(const BotView& view);

private:
	struct Candidate {
		std::vector<Placement> placements;
		std::vector<Tile> leave;
		int score;
		double value;
	};

	struct Search {
		std::size_t maxTiles;
		unsigned maxCandidates;
		TimePoint deadline;
		bool stopped{false};
		std::unordered_set<std::string> seen{};
		std::vector<Candidate> candidates{};
	};

	void searchAnchor(Search& search, const BotView& view, Coord anchor, bool horizontal);
	void permute(Search& search, const BotView& view, const std::vector<Coord>& cells, std::vector<bool>& used,
	             std::vector<Placement>& placements, std::vector<Tile>& tiles);
	void consider(Search& search, const BotView& view, const std::vector<Placement>& placements, const std::vector<Tile>& tiles,
	              const std::vector<bool>& used);

	bool allValid(const std::vector<std::string>& words, DictionaryId dictionaryId);
	double evaluate(const BotView& view, const Candidate& candidate) const;

private:
	BotProfile m_profile;
	WordOracle& m_oracle;
	std::mt19937 m_rng;

	std::unordered_map<std::string, bool> m_words; //!< Words already asked for during this bot's lifetime.
	unsigned m_evaluated{0u};
};

} // namespace wordsmith
