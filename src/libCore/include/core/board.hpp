#pragma once

#include "data/types.hpp"

#include <optional>

namespace wordsmith {

//! Square word game board. Premium tags are fixed at construction; only occupants change.
class Board {
public:
	//! \note Throws std::invalid_argument for an empty or non-square grid.
	explicit Board(CellGrid config);

	std::size_t size() const;
	Coord center() const;            //!< Cell the first play has to cover.
	bool inBounds(Coord c) const;    //!< True for c.row, c.col in [0, size-1].
	bool isFree(Coord c) const;      //!< True if in bounds and unoccupied.
	bool isOccupied(Coord c) const;  //!< True if in bounds and occupied.
	bool isEmpty() const;            //!< True if no tile has been placed yet.
	std::size_t tileCount() const;   //!< Number of placed tiles.

	const std::optional<Tile>& getAt(Coord c) const; //!< Occupant at an in-bounds coordinate.
	Premium premiumAt(Coord c) const;                //!< Premium tag at an in-bounds coordinate.

	void setAt(Coord c, Tile tile); //!< Occupy a free in-bounds cell.
	void clearAt(Coord c);          //!< Remove the occupant of an in-bounds cell.

	const CellGrid& cells() const;

private:
	CellGrid m_cells;
	std::size_t m_tileCount{0u};
};

} // namespace wordsmith
