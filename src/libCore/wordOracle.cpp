#include "core/wordOracle.hpp"

#include "core/errors.hpp"

#include <asio/post.hpp>

#include <algorithm>
#include <cctype>
#include <exception>
#include <format>
#include <future>

namespace wordsmith {

static std::string cacheKey(DictionaryId dictionaryId, const std::string& word) {
	return std::format("{}:{}", dictionaryId, word);
}

WordOracle::WordOracle(std::shared_ptr<IPersistence> dictionary, std::size_t cacheCapacity, Duration lookupTimeout, std::size_t maxInFlight)
    : m_dictionary(std::move(dictionary)), m_capacity(cacheCapacity), m_timeout(lookupTimeout), m_maxInFlight(maxInFlight) {
}

WordOracle::~WordOracle() {
	m_pool.join();
}

bool WordOracle::isValid(const std::string& word, DictionaryId dictionaryId) {
	if (word.empty()) {
		return false;
	}

	std::string normalized;
	normalized.reserve(word.size());
	for (const unsigned char c: word) {
		if (!std::isalpha(c)) {
			return false;
		}
		normalized.push_back(static_cast<char>(std::toupper(c)));
	}

	const auto key = cacheKey(dictionaryId, normalized);
	{
		std::lock_guard<std::mutex> lock(m_cacheMutex);
		if (const auto it = m_index.find(key); it != m_index.end()) {
			m_recent.splice(m_recent.begin(), m_recent, it->second);
			return it->second->valid;
		}
	}

	// The cache lock is not held while the collaborator is busy.
	const bool valid = lookup(normalized, dictionaryId);

	std::lock_guard<std::mutex> lock(m_cacheMutex);
	if (m_capacity == 0u || m_index.contains(key)) {
		return valid;
	}
	m_recent.push_front(Entry{key, valid});
	m_index.emplace(key, m_recent.begin());
	if (m_recent.size() > m_capacity) {
		m_index.erase(m_recent.back().key);
		m_recent.pop_back();
	}
	return valid;
}

void WordOracle::clear() {
	std::lock_guard<std::mutex> lock(m_cacheMutex);
	m_index.clear();
	m_recent.clear();
}

std::size_t WordOracle::cachedEntries() const {
	std::lock_guard<std::mutex> lock(m_cacheMutex);
	return m_recent.size();
}

std::size_t WordOracle::lookupsInFlight() const {
	return m_inFlight;
}

bool WordOracle::lookup(const std::string& word, DictionaryId dictionaryId) {
	if (!m_dictionary) {
		throw DictionaryUnavailable("No dictionary collaborator configured.");
	}

	if (++m_inFlight > m_maxInFlight) {
		--m_inFlight;
		throw DictionaryUnavailable(std::format("Lookup of '{}' refused: {} lookups already pending.", word, m_maxInFlight));
	}

	// The job keeps the promise alive if it outlives the timeout.
	auto promise = std::make_shared<std::promise<bool>>();
	auto result  = promise->get_future();
	asio::post(m_pool, [this, promise, word, dictionaryId] {
		try {
			promise->set_value(m_dictionary->loadDictionaryEntry(dictionaryId, word));
		} catch (...) {
			promise->set_exception(std::current_exception());
		}
		--m_inFlight;
	});

	if (result.wait_for(m_timeout) != std::future_status::ready) {
		throw DictionaryUnavailable(std::format("Lookup of '{}' in dictionary {} timed out after {} ms.", word, dictionaryId, m_timeout.count()));
	}

	try {
		return result.get();
	} catch (const std::exception& e) {
		throw DictionaryUnavailable(std::format("Lookup of '{}' in dictionary {} failed: {}", word, dictionaryId, e.what()));
	}
}

} // namespace wordsmith
