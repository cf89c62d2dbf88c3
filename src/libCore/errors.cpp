#include "core/errors.hpp"

namespace wordsmith {

std::string_view toString(MoveErrorCode code) {
	switch (code) {
	case MoveErrorCode::NotYourTurn:
		return "NOT_YOUR_TURN";
	case MoveErrorCode::GameNotActive:
		return "GAME_NOT_ACTIVE";
	case MoveErrorCode::InvalidPlacement:
		return "INVALID_PLACEMENT";
	case MoveErrorCode::RackMismatch:
		return "RACK_MISMATCH";
	case MoveErrorCode::InvalidWord:
		return "INVALID_WORD";
	case MoveErrorCode::ExchangeNotAllowed:
		return "EXCHANGE_NOT_ALLOWED";
	case MoveErrorCode::DictionaryUnavailable:
		return "DICTIONARY_UNAVAILABLE";
	case MoveErrorCode::RoomNotFound:
		return "ROOM_NOT_FOUND";
	case MoveErrorCode::RoomFull:
		return "ROOM_FULL";
	case MoveErrorCode::ChallengeNotAllowed:
		return "CHALLENGE_NOT_ALLOWED";
	case MoveErrorCode::UnknownBot:
		return "UNKNOWN_BOT";
	}
	return "UNKNOWN";
}

} // namespace wordsmith
