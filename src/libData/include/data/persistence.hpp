#pragma once

#include "data/types.hpp"

#include <string>

namespace wordsmith {

using DictionaryId = unsigned;
using BoardConfigId = unsigned;

//! Read access to the external persistence collaborator.
//! Implementations may block and may throw when the backing store is unreachable.
class IPersistence {
public:
	virtual ~IPersistence() = default;

	//! True if the upper case word is listed in the given dictionary.
	virtual bool loadDictionaryEntry(DictionaryId dictionaryId, const std::string& word) = 0;

	//! Square grid with premium tags and empty occupants. Throws std::runtime_error for unknown ids.
	virtual CellGrid loadBoardConfig(BoardConfigId configId) = 0;

	//! Letter kinds of the language's tile set. Throws std::runtime_error for unknown languages.
	virtual TileDistribution loadTileDistribution(const std::string& langId) = 0;
};

} // namespace wordsmith
