#include "data/memoryStore.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <stdexcept>

namespace wordsmith {

static const std::vector<std::string> STANDARD_LAYOUT{
        "T..d...T...d..T", //
        ".D...t...t...D.", //
        "..D...d.d...D..", //
        "d..D...d...D..d", //
        "....D.....D....", //
        ".t...t...t...t.", //
        "..d...d.d...d..", //
        "T..d...*...d..T", //
        "..d...d.d...d..", //
        ".t...t...t...t.", //
        "....D.....D....", //
        "d..D...d...D..d", //
        "..D...d.d...D..", //
        ".D...t...t...D.", //
        "T..d...T...d..T", //
};

static const std::vector<std::string> DEFAULT_WORDS{
        // Two letter words
        "AA", "AB", "AD", "AE", "AG", "AH", "AI", "AL", "AM", "AN", "AR", "AS", "AT", "AW", "AX", "AY", "BA", "BE", "BI", "BO", "BY", "DO", "ED",
        "EF", "EH", "EL", "EM", "EN", "ER", "ES", "ET", "EX", "FA", "GO", "HA", "HE", "HI", "HM", "HO", "ID", "IF", "IN", "IS", "IT", "JO", "KA",
        "KI", "LA", "LI", "LO", "MA", "ME", "MI", "MM", "MO", "MU", "MY", "NA", "NE", "NO", "NU", "OD", "OE", "OF", "OH", "OI", "OM", "ON", "OP",
        "OR", "OS", "OW", "OX", "OY", "PA", "PE", "PI", "QI", "RE", "SH", "SI", "SO", "TA", "TI", "TO", "UH", "UM", "UN", "UP", "US", "UT", "WE",
        "WO", "XI", "XU", "YA", "YE", "YO",
        // Longer words
        "HELLO", "WORLD", "SCRABBLE", "TILE", "BOARD", "WORD", "PLAY", "GAME", "POINT", "QUIZ", "JAZZ", "FUZZ", "PUZZLE", "BLANK", "CAT", "DOG",
        "FISH", "BIRD", "HOUSE", "MOUSE", "TABLE", "CHAIR", "ZOO", "ECHO", "RHYTHM"};

static Premium toPremium(char symbol) {
	switch (symbol) {
	case '.':
		return Premium::None;
	case 'd':
		return Premium::DoubleLetter;
	case 't':
		return Premium::TripleLetter;
	case 'D':
		return Premium::DoubleWord;
	case 'T':
		return Premium::TripleWord;
	case '*':
		return Premium::Star;
	default:
		throw std::invalid_argument(std::format("Unknown premium symbol '{}'.", symbol));
	}
}

static std::string toUpper(std::string word) {
	std::transform(word.begin(), word.end(), word.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
	return word;
}

CellGrid makeBoardConfig(const std::vector<std::string>& rows) {
	if (rows.empty()) {
		throw std::invalid_argument("Board layout is empty.");
	}

	CellGrid grid;
	grid.reserve(rows.size());
	for (Id r = 0; r < rows.size(); ++r) {
		if (rows[r].size() != rows.size()) {
			throw std::invalid_argument(std::format("Board layout row {} has {} cells, expected {}.", r, rows[r].size(), rows.size()));
		}

		auto& row = grid.emplace_back();
		row.reserve(rows.size());
		for (Id c = 0; c < rows[r].size(); ++c) {
			row.push_back(Cell{.position = {r, c}, .premium = toPremium(rows[r][c]), .tile = std::nullopt});
		}
	}
	return grid;
}

CellGrid standardBoardConfig() {
	return makeBoardConfig(STANDARD_LAYOUT);
}

TileDistribution englishTileDistribution() {
	return {
	        {'A', 9, 1},  {'B', 2, 3}, {'C', 2, 3}, {'D', 4, 2}, {'E', 12, 1}, {'F', 2, 4}, {'G', 3, 2}, {'H', 2, 4}, {'I', 9, 1}, {'J', 1, 8},
	        {'K', 1, 5},  {'L', 4, 1}, {'M', 2, 3}, {'N', 6, 1}, {'O', 8, 1},  {'P', 2, 3}, {'Q', 1, 10}, {'R', 6, 1}, {'S', 4, 1}, {'T', 6, 1},
	        {'U', 4, 1},  {'V', 2, 4}, {'W', 2, 4}, {'X', 1, 8}, {'Y', 2, 4},  {'Z', 1, 10}, {BLANK_LETTER, 2, 0},
	};
}

MemoryStore::MemoryStore() {
	addWords(DEFAULT_DICTIONARY_ID, DEFAULT_WORDS);
	m_boards.emplace(STANDARD_BOARD_ID, standardBoardConfig());
	m_distributions.emplace(DEFAULT_LANGUAGE, englishTileDistribution());
}

bool MemoryStore::loadDictionaryEntry(DictionaryId dictionaryId, const std::string& word) {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_dictionaries.find(dictionaryId);
	return it != m_dictionaries.end() && it->second.contains(toUpper(word));
}

CellGrid MemoryStore::loadBoardConfig(BoardConfigId configId) {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_boards.find(configId);
	if (it == m_boards.end()) {
		throw std::runtime_error(std::format("Unknown board configuration {}.", configId));
	}
	return it->second;
}

TileDistribution MemoryStore::loadTileDistribution(const std::string& langId) {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_distributions.find(langId);
	if (it == m_distributions.end()) {
		throw std::runtime_error(std::format("Unknown tile distribution '{}'.", langId));
	}
	return it->second;
}

void MemoryStore::addWord(DictionaryId dictionaryId, const std::string& word) {
	std::lock_guard<std::mutex> lock(m_mutex);
	m_dictionaries[dictionaryId].insert(toUpper(word));
}

void MemoryStore::addWords(DictionaryId dictionaryId, const std::vector<std::string>& words) {
	std::lock_guard<std::mutex> lock(m_mutex);

	auto& dictionary = m_dictionaries[dictionaryId];
	for (const auto& word: words) {
		dictionary.insert(toUpper(word));
	}
}

void MemoryStore::addBoardConfig(BoardConfigId configId, CellGrid grid) {
	std::lock_guard<std::mutex> lock(m_mutex);
	m_boards.insert_or_assign(configId, std::move(grid));
}

void MemoryStore::addTileDistribution(const std::string& langId, TileDistribution distribution) {
	std::lock_guard<std::mutex> lock(m_mutex);
	m_distributions.insert_or_assign(langId, std::move(distribution));
}

std::size_t MemoryStore::wordCount(DictionaryId dictionaryId) const {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_dictionaries.find(dictionaryId);
	return it == m_dictionaries.end() ? 0u : it->second.size();
}

} // namespace wordsmith
