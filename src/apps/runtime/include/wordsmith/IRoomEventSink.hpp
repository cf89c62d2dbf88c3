#pragma once

#include "core/roomEvent.hpp"
#include "core/types.hpp"

#include <vector>

namespace wordsmith::app {

//! Receives the outbound events of every room, in the order each room produced them.
class IRoomEventSink {
public:
	virtual ~IRoomEventSink()                                                             = default;
	virtual void onRoomEvents(const RoomId& roomId, const std::vector<RoomEvent>& events) = 0;
	virtual void onRoomRemoved(const RoomId& roomId)                                      = 0;
};

} // namespace wordsmith::app
