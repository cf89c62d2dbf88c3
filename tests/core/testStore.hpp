#pragma once

#include "core/roomSettings.hpp"
#include "core/types.hpp"
#include "data/memoryStore.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <unordered_set>

namespace wordsmith::gtest {

inline constexpr char STACKED_LANGUAGE[] = "stacked";

//! Builds a distribution that an unshuffled bag deals in exactly the given order.
//! The first seven letters form the rack of the first joiner, the next seven the second rack.
inline TileDistribution stackedDistribution(const std::string& dealOrder) {
	std::map<char, unsigned> points;
	for (const auto& kind: englishTileDistribution()) {
		points[kind.letter] = kind.points;
	}

	TileDistribution distribution;
	for (auto it = dealOrder.rbegin(); it != dealOrder.rend(); ++it) {
		distribution.push_back(TileKind{*it, 1u, points[*it]});
	}
	return distribution;
}

//! Memory store whose dictionary entries can be withdrawn while a game runs.
class TestStore : public MemoryStore {
public:
	explicit TestStore(const std::string& dealOrder = "") {
		if (!dealOrder.empty()) {
			addTileDistribution(STACKED_LANGUAGE, stackedDistribution(dealOrder));
		}
	}

	bool loadDictionaryEntry(DictionaryId dictionaryId, const std::string& word) override {
		++m_lookups;
		{
			std::lock_guard<std::mutex> lock(m_bannedMutex);
			if (m_banned.contains(word)) {
				return false;
			}
		}
		return MemoryStore::loadDictionaryEntry(dictionaryId, word);
	}

	void ban(const std::string& word) {
		std::lock_guard<std::mutex> lock(m_bannedMutex);
		m_banned.insert(word);
	}

	unsigned lookups() const {
		return m_lookups;
	}

private:
	std::mutex m_bannedMutex;
	std::unordered_set<std::string> m_banned;
	std::atomic<unsigned> m_lookups{0u};
};

//! Test store whose dictionary lookups block until the gate is opened.
class GatedStore : public TestStore {
public:
	using TestStore::TestStore;

	bool loadDictionaryEntry(DictionaryId dictionaryId, const std::string& word) override {
		{
			std::unique_lock<std::mutex> lock(m_gateMutex);
			++m_waiting;
			m_changed.notify_all();
			m_changed.wait(lock, [this] { return m_open; });
			--m_waiting;
		}
		return TestStore::loadDictionaryEntry(dictionaryId, word);
	}

	void open() {
		{
			std::lock_guard<std::mutex> lock(m_gateMutex);
			m_open = true;
		}
		m_changed.notify_all();
	}

	//! Wait until a lookup is held at the gate.
	bool waitForLookup(Duration timeout = Duration{5000}) {
		std::unique_lock<std::mutex> lock(m_gateMutex);
		return m_changed.wait_for(lock, timeout, [this] { return m_waiting > 0u; });
	}

	unsigned waiting() const {
		std::lock_guard<std::mutex> lock(m_gateMutex);
		return m_waiting;
	}

private:
	mutable std::mutex m_gateMutex;
	std::condition_variable m_changed;
	bool m_open{false};
	unsigned m_waiting{0u};
};

//! Manually advanced time source.
class FakeTime {
public:
	TimeSource source() {
		return [this] { return m_now; };
	}
	void advance(Duration delta) {
		m_now += delta;
	}
	TimePoint now() const {
		return m_now;
	}

private:
	TimePoint m_now{std::chrono::hours(1)};
};

//! Room settings with a stacked bag, the first joiner to move and a fake clock.
inline RoomSettings stackedSettings(FakeTime& time) {
	RoomSettings settings;
	settings.language     = STACKED_LANGUAGE;
	settings.shuffleBag   = false;
	settings.seed         = 7u;
	settings.startingSide = Side::First;
	settings.now          = time.source();
	return settings;
}

} // namespace wordsmith::gtest
