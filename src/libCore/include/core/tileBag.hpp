#pragma once

#include "data/types.hpp"

#include <random>
#include <vector>

namespace wordsmith {

//! Pool of undrawn tiles. Tiles are dealt from the back.
class TileBag {
public:
	//! Lays the kinds out in order and shuffles them when a generator is given.
	//! An unshuffled bag deals the last kind first, which keeps racks predictable for tests.
	//! \note Throws std::runtime_error for a distribution without tiles.
	TileBag(const TileDistribution& distribution, std::mt19937* rng);

	std::vector<Tile> draw(std::size_t count); //!< Deal up to count tiles.
	void exchange(std::vector<Tile> tiles);    //!< Return tiles; reshuffled when the bag shuffles.
	void restore(std::vector<Tile> tiles);     //!< Undo a draw: the tiles become the next ones dealt, in their original order.

	std::size_t size() const;
	bool empty() const;

private:
	std::vector<Tile> m_tiles;
	std::mt19937* m_rng; //!< Owned by the room. Null for an unshuffled bag.
};

//! Face value of a letter tile built from the distribution.
Tile makeTile(char letter, unsigned points);

} // namespace wordsmith
