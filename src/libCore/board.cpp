#include "core/board.hpp"

#include "core/errors.hpp"

#include <format>
#include <stdexcept>

namespace wordsmith {

Board::Board(CellGrid config) : m_cells(std::move(config)) {
	if (m_cells.empty()) {
		throw std::invalid_argument("Board configuration is empty.");
	}
	for (Id r = 0; r < m_cells.size(); ++r) {
		if (m_cells[r].size() != m_cells.size()) {
			throw std::invalid_argument(std::format("Board configuration is not square (row {}).", r));
		}
		for (Id c = 0; c < m_cells[r].size(); ++c) {
			auto& cell    = m_cells[r][c];
			cell.position = {r, c};
			if (cell.tile) {
				++m_tileCount;
			}
		}
	}
}

std::size_t Board::size() const {
	return m_cells.size();
}

Coord Board::center() const {
	const auto mid = static_cast<Id>(m_cells.size() / 2);
	return {mid, mid};
}

bool Board::inBounds(Coord c) const {
	return c.row < m_cells.size() && c.col < m_cells.size();
}

bool Board::isFree(Coord c) const {
	return inBounds(c) && !m_cells[c.row][c.col].tile;
}

bool Board::isOccupied(Coord c) const {
	return inBounds(c) && m_cells[c.row][c.col].tile.has_value();
}

bool Board::isEmpty() const {
	return m_tileCount == 0u;
}

std::size_t Board::tileCount() const {
	return m_tileCount;
}

const std::optional<Tile>& Board::getAt(Coord c) const {
	return m_cells.at(c.row).at(c.col).tile;
}

Premium Board::premiumAt(Coord c) const {
	return m_cells.at(c.row).at(c.col).premium;
}

void Board::setAt(Coord c, Tile tile) {
	auto& cell = m_cells.at(c.row).at(c.col);
	if (cell.tile) {
		throw RoomCorrupted(std::format("Cell ({}, {}) is already occupied.", c.row, c.col));
	}
	cell.tile = tile;
	++m_tileCount;
}

void Board::clearAt(Coord c) {
	auto& cell = m_cells.at(c.row).at(c.col);
	if (cell.tile) {
		cell.tile.reset();
		--m_tileCount;
	}
}

const CellGrid& Board::cells() const {
	return m_cells;
}

} // namespace wordsmith
