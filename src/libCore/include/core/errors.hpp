#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace wordsmith {

//! Rejection reasons returned to the submitting player.
enum class MoveErrorCode {
	NotYourTurn,
	GameNotActive,
	InvalidPlacement,
	RackMismatch,
	InvalidWord,
	ExchangeNotAllowed,
	DictionaryUnavailable,
	RoomNotFound,
	RoomFull,
	ChallengeNotAllowed,
	UnknownBot
};

struct MoveError {
	MoveErrorCode code;
	std::string word{}; //!< Offending word. Only set for InvalidWord.

	bool operator==(const MoveError&) const = default;
};

//! Stable upper snake case name used in logs and on the wire.
std::string_view toString(MoveErrorCode code);

//! Either a value or the reason it could not be produced.
template <class T>
class Result {
public:
	Result(T value) : m_data(std::in_place_index<0>, std::move(value)) {
	}
	Result(MoveError error) : m_data(std::in_place_index<1>, std::move(error)) {
	}
	Result(MoveErrorCode code) : m_data(std::in_place_index<1>, MoveError{code}) {
	}

	bool ok() const {
		return m_data.index() == 0;
	}
	explicit operator bool() const {
		return ok();
	}

	const T& value() const& {
		return std::get<0>(m_data);
	}
	T& value() & {
		return std::get<0>(m_data);
	}
	T&& value() && {
		return std::get<0>(std::move(m_data));
	}

	const MoveError& error() const {
		return std::get<1>(m_data);
	}

private:
	std::variant<T, MoveError> m_data;
};

//! Thrown by the word oracle when the dictionary collaborator fails or times out.
class DictionaryUnavailable : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

//! Thrown when a room invariant no longer holds. Fatal for that room's session.
class RoomCorrupted : public std::logic_error {
public:
	using std::logic_error::logic_error;
};

} // namespace wordsmith
