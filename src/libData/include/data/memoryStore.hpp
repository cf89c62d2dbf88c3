#pragma once

#include "data/persistence.hpp"

#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace wordsmith {

inline constexpr DictionaryId DEFAULT_DICTIONARY_ID = 1u;
inline constexpr BoardConfigId STANDARD_BOARD_ID    = 1u;
inline constexpr char DEFAULT_LANGUAGE[]            = "en";

//! Builds a board config from text rows.
//! Symbols: '.' none, 'd' double letter, 't' triple letter, 'D' double word, 'T' triple word, '*' star.
//! \note Throws std::invalid_argument for an empty or non-square layout or an unknown symbol.
CellGrid makeBoardConfig(const std::vector<std::string>& rows);

//! The standard 15x15 premium layout.
CellGrid standardBoardConfig();

//! The standard English distribution: 100 tiles including 2 blanks.
TileDistribution englishTileDistribution();

//! Thread safe in-memory persistence collaborator.
//! Ships the standard board, the English distribution and a small default word list.
class MemoryStore : public IPersistence {
public:
	MemoryStore();

	bool loadDictionaryEntry(DictionaryId dictionaryId, const std::string& word) override;
	CellGrid loadBoardConfig(BoardConfigId configId) override;
	TileDistribution loadTileDistribution(const std::string& langId) override;

	void addWord(DictionaryId dictionaryId, const std::string& word);
	void addWords(DictionaryId dictionaryId, const std::vector<std::string>& words);
	void addBoardConfig(BoardConfigId configId, CellGrid grid);
	void addTileDistribution(const std::string& langId, TileDistribution distribution);

	std::size_t wordCount(DictionaryId dictionaryId) const;

private:
	mutable std::mutex m_mutex;
	std::unordered_map<DictionaryId, std::unordered_set<std::string>> m_dictionaries;
	std::unordered_map<BoardConfigId, CellGrid> m_boards;
	std::unordered_map<std::string, TileDistribution> m_distributions;
};

} // namespace wordsmith
