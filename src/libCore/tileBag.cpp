#include "core/tileBag.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace wordsmith {

Tile makeTile(char letter, unsigned points) {
	if (letter == BLANK_LETTER) {
		return Tile{.letter = BLANK_LETTER, .points = 0u, .isBlank = true};
	}
	return Tile{.letter = static_cast<char>(std::toupper(static_cast<unsigned char>(letter))), .points = points, .isBlank = false};
}

TileBag::TileBag(const TileDistribution& distribution, std::mt19937* rng) : m_rng(rng) {
	for (const auto& kind: distribution) {
		for (unsigned i = 0; i < kind.count; ++i) {
			m_tiles.push_back(makeTile(kind.letter, kind.points));
		}
	}
	if (m_tiles.empty()) {
		throw std::runtime_error("Tile distribution contains no tiles.");
	}

	if (m_rng) {
		std::shuffle(m_tiles.begin(), m_tiles.end(), *m_rng);
	}
}

std::vector<Tile> TileBag::draw(std::size_t count) {
	std::vector<Tile> drawn;
	while (drawn.size() < count && !m_tiles.empty()) {
		drawn.push_back(m_tiles.back());
		m_tiles.pop_back();
	}
	return drawn;
}

void TileBag::exchange(std::vector<Tile> tiles) {
	// Returned tiles go to the front so they are dealt last when unshuffled.
	m_tiles.insert(m_tiles.begin(), tiles.begin(), tiles.end());
	if (m_rng) {
		std::shuffle(m_tiles.begin(), m_tiles.end(), *m_rng);
	}
}

void TileBag::restore(std::vector<Tile> tiles) {
	for (auto it = tiles.rbegin(); it != tiles.rend(); ++it) {
		m_tiles.push_back(*it);
	}
}

std::size_t TileBag::size() const {
	return m_tiles.size();
}

bool TileBag::empty() const {
	return m_tiles.empty();
}

} // namespace wordsmith
