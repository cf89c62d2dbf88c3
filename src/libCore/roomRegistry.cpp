#include "core/roomRegistry.hpp"

#include "core/botProfile.hpp"

#include <format>
#include <stdexcept>

namespace wordsmith {

RoomRegistry::RoomRegistry(std::shared_ptr<IPersistence> persistence, std::shared_ptr<WordOracle> oracle, RoomSettings defaults)
    : m_persistence(std::move(persistence)), m_oracle(std::move(oracle)), m_defaults(std::move(defaults)) {
}

std::shared_ptr<GameRoom> RoomRegistry::create(std::optional<RoomId> roomId) {
	std::lock_guard<std::mutex> lock(m_mutex);
	return createLocked(std::move(roomId));
}

JoinOutcome RoomRegistry::join(const PlayerRef& player, const std::optional<RoomId>& roomId) {
	// Rooms are only called with the registry lock released: a busy room never blocks the lookup of another one.
	if (roomId) {
		const auto room = find(*roomId);
		if (!room) {
			return {nullptr, RoomUpdate{.error = MoveError{MoveErrorCode::RoomNotFound}}};
		}
		return {room, room->join(player)};
	}

	const auto candidates = rooms();
	for (const auto& room: candidates) {
		if (room->hasPlayer(player) && !isTerminal(room->status())) {
			return {room, room->join(player)};
		}
	}

	// Another matchmaker may fill a room between the check and the join.
	for (const auto& room: candidates) {
		if (!room->isJoinable()) {
			continue;
		}
		auto update = room->join(player);
		if (update.ok() || (update.error->code != MoveErrorCode::RoomFull && update.error->code != MoveErrorCode::GameNotActive)) {
			return {room, std::move(update)};
		}
	}

	const auto room = create(std::nullopt);
	return {room, room->join(player)};
}

JoinOutcome RoomRegistry::attachBot(const RoomId& roomId, std::string_view botId) {
	const auto room = find(roomId);
	if (!room) {
		return {nullptr, RoomUpdate{.error = MoveError{MoveErrorCode::RoomNotFound}}};
	}

	const auto profile = findBot(botId);
	if (!profile) {
		return {room, RoomUpdate{.error = MoveError{MoveErrorCode::UnknownBot}}};
	}
	return {room, room->attachBot(*profile)};
}

std::shared_ptr<GameRoom> RoomRegistry::find(const RoomId& roomId) const {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_rooms.find(roomId);
	return it == m_rooms.end() ? nullptr : it->second;
}

std::shared_ptr<GameRoom> RoomRegistry::findByPlayer(const PlayerId& playerId) const {
	for (const auto& room: rooms()) {
		if (room->hasPlayer(playerId) && !isTerminal(room->status())) {
			return room;
		}
	}
	return nullptr;
}

bool RoomRegistry::remove(const RoomId& roomId) {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_rooms.erase(roomId) > 0u;
}

std::vector<RoomId> RoomRegistry::purgeFinished(Duration grace) {
	const auto now = m_defaults.now();
	std::vector<std::shared_ptr<GameRoom>> expired;
	for (const auto& room: rooms()) {
		const auto endedAt = room->endedAt();
		if (endedAt && now - *endedAt >= grace) {
			expired.push_back(room);
		}
	}

	// A finished room stays finished. Only erase the entry if it still holds the same room.
	std::lock_guard<std::mutex> lock(m_mutex);
	std::vector<RoomId> purged;
	for (const auto& room: expired) {
		const auto it = m_rooms.find(room->id());
		if (it != m_rooms.end() && it->second == room) {
			purged.push_back(it->first);
			m_rooms.erase(it);
		}
	}
	return purged;
}

std::vector<std::shared_ptr<GameRoom>> RoomRegistry::rooms() const {
	std::lock_guard<std::mutex> lock(m_mutex);

	std::vector<std::shared_ptr<GameRoom>> result;
	result.reserve(m_rooms.size());
	for (const auto& [id, room]: m_rooms) {
		result.push_back(room);
	}
	return result;
}

std::size_t RoomRegistry::size() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_rooms.size();
}

std::shared_ptr<GameRoom> RoomRegistry::createLocked(std::optional<RoomId> roomId) {
	RoomId id;
	if (roomId) {
		if (m_rooms.contains(*roomId)) {
			throw std::invalid_argument(std::format("Room '{}' already exists.", *roomId));
		}
		id = std::move(*roomId);
	} else {
		do {
			id = std::format("room-{}", m_nextId++);
		} while (m_rooms.contains(id));
	}

	auto room = std::make_shared<GameRoom>(id, *m_persistence, *m_oracle, m_defaults);
	m_rooms.emplace(id, room);
	return room;
}

} // namespace wordsmith
