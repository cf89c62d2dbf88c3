#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wordsmith {

using Id = unsigned; //!< Board index used by the data and core libraries.

//! Board position. Origin is the top left cell, both indices start at 0.
struct Coord {
	Id row, col;

	bool operator==(const Coord&) const = default;
};

inline constexpr char BLANK_LETTER = '_'; //!< Letter of an undesignated blank tile in a rack or bag.

//! A single letter tile.
struct Tile {
	char letter{BLANK_LETTER}; //!< Upper case letter. Blanks carry their chosen letter once placed.
	unsigned points{0u};       //!< Face value. Always 0 for blanks.
	bool isBlank{false};

	bool operator==(const Tile&) const = default;
};

//! Premium tag of a board cell.
enum class Premium : std::uint8_t {
	None,
	DoubleLetter,
	TripleLetter,
	DoubleWord,
	TripleWord,
	Star //!< Centre cell. Scores as a double word.
};

//! A board cell with its premium tag and occupant.
struct Cell {
	Coord position{};
	Premium premium{Premium::None};
	std::optional<Tile> tile{};
};

using CellGrid = std::vector<std::vector<Cell>>;

//! One letter kind of a tile distribution.
struct TileKind {
	char letter;
	unsigned count;
	unsigned points;
};

using TileDistribution = std::vector<TileKind>;

} // namespace wordsmith
