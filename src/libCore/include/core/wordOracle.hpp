#pragma once

#include "core/types.hpp"
#include "data/persistence.hpp"

#include <asio/thread_pool.hpp>

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace wordsmith {

inline constexpr std::size_t DEFAULT_ORACLE_CACHE_CAPACITY = 4096u;
inline constexpr Duration DEFAULT_ORACLE_TIMEOUT{1000};
inline constexpr std::size_t ORACLE_LOOKUP_THREADS        = 4u;  //!< Threads asking the collaborator.
inline constexpr std::size_t ORACLE_MAX_LOOKUPS_IN_FLIGHT = 32u; //!< Queued or running lookups before new ones are refused.

//! Word validation contract shared by all rooms.
//! Wraps the dictionary collaborator with a bounded recency cache. Clearing the cache never changes results.
//! Lookups run on a fixed pool. A collaborator that hangs holds at most the in-flight limit of lookups.
class WordOracle {
public:
	explicit WordOracle(std::shared_ptr<IPersistence> dictionary, std::size_t cacheCapacity = DEFAULT_ORACLE_CACHE_CAPACITY,
	                    Duration lookupTimeout = DEFAULT_ORACLE_TIMEOUT, std::size_t maxInFlight = ORACLE_MAX_LOOKUPS_IN_FLIGHT);
	~WordOracle(); //!< Waits for running lookups.

	WordOracle(const WordOracle&)            = delete;
	WordOracle& operator=(const WordOracle&) = delete;

	//! True if the word is listed in the dictionary. Case insensitive.
	//! \note Throws DictionaryUnavailable when the collaborator fails or does not answer within the timeout.
	bool isValid(const std::string& word, DictionaryId dictionaryId);

	void clear();                      //!< Drop all cached results.
	std::size_t cachedEntries() const; //!< Number of cached results.
	std::size_t lookupsInFlight() const;

private:
	bool lookup(const std::string& word, DictionaryId dictionaryId); //!< Ask the collaborator, bounded by the timeout.

	struct Entry {
		std::string key;
		bool valid;
	};

private:
	std::shared_ptr<IPersistence> m_dictionary;
	const std::size_t m_capacity;
	const Duration m_timeout;
	const std::size_t m_maxInFlight;

	mutable std::mutex m_cacheMutex;
	std::list<Entry> m_recent; //!< Most recently used first.
	std::unordered_map<std::string, std::list<Entry>::iterator> m_index;

	std::atomic<std::size_t> m_inFlight{0u};
	asio::thread_pool m_pool{ORACLE_LOOKUP_THREADS}; //!< Declared last: joined before the members its jobs use.
};

} // namespace wordsmith
