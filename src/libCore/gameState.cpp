#include "core/gameState.hpp"

namespace wordsmith {

int rackValue(const std::vector<Tile>& rack) {
	int value = 0;
	for (const auto& tile: rack) {
		value += tile.isBlank ? 0 : static_cast<int>(tile.points);
	}
	return value;
}

} // namespace wordsmith
