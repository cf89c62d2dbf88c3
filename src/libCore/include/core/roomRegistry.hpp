#pragma once

#include "core/gameRoom.hpp"
#include "core/roomSettings.hpp"
#include "core/wordOracle.hpp"
#include "data/persistence.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace wordsmith {

//! Room a join ended up in, with the outcome of the join itself.
struct JoinOutcome {
	std::shared_ptr<GameRoom> room; //!< Empty when no room was found.
	RoomUpdate update;
};

//! Owns every room. The only place rooms are created or destroyed.
//! The registry lock only guards the map. It is never held while a room operation runs.
class RoomRegistry {
public:
	RoomRegistry(std::shared_ptr<IPersistence> persistence, std::shared_ptr<WordOracle> oracle, RoomSettings defaults = {});

	//! Create an empty waiting room. Generates an id when none is given.
	//! \note Throws std::invalid_argument for a taken id and std::runtime_error for a broken room setup.
	std::shared_ptr<GameRoom> create(std::optional<RoomId> roomId = std::nullopt);

	//! Join a named room, or matchmake: the room the player already sits in, then any joinable room, then a new one.
	//! A seat is only taken over by a player of the same kind.
	JoinOutcome join(const PlayerRef& player, const std::optional<RoomId>& roomId = std::nullopt);

	//! Attach a catalogue bot to a room.
	JoinOutcome attachBot(const RoomId& roomId, std::string_view botId);

	std::shared_ptr<GameRoom> find(const RoomId& roomId) const;
	std::shared_ptr<GameRoom> findByPlayer(const PlayerId& playerId) const; //!< Unfinished room the player sits in.
	bool remove(const RoomId& roomId);

	//! Drop rooms that finished at least grace ago.
	std::vector<RoomId> purgeFinished(Duration grace);

	std::vector<std::shared_ptr<GameRoom>> rooms() const;
	std::size_t size() const;

private:
	std::shared_ptr<GameRoom> createLocked(std::optional<RoomId> roomId);

private:
	std::shared_ptr<IPersistence> m_persistence;
	std::shared_ptr<WordOracle> m_oracle;
	const RoomSettings m_defaults;

	mutable std::mutex m_mutex;
	std::map<RoomId, std::shared_ptr<GameRoom>> m_rooms;
	unsigned m_nextId{1u};
};

} // namespace wordsmith
