#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <string>

namespace wordsmith::network {

using ConnectionId = std::uint64_t; //!< Server side handle of an accepted socket.
using Message      = std::string;   //!< Payload of one frame.

inline constexpr std::uint16_t DEFAULT_PORT = 12345;

//! Largest payload accepted in either direction. Bigger frames drop the connection.
inline constexpr std::uint32_t MAX_PAYLOAD_BYTES = 4 * 1024;

//! Every frame is prefixed with the payload size in network byte order.
struct BasicMessageHeader {
	std::uint32_t payload_size{};
};

constexpr std::uint32_t byteswap_u32(std::uint32_t value) {
	return ((value & 0x000000FFu) << 24) | ((value & 0x0000FF00u) << 8) | ((value & 0x00FF0000u) >> 8) | ((value & 0xFF000000u) >> 24);
}

constexpr std::uint32_t to_network_u32(std::uint32_t value) {
	if constexpr (std::endian::native == std::endian::big) {
		return value;
	}
	return byteswap_u32(value);
}

constexpr std::uint32_t from_network_u32(std::uint32_t value) {
	return to_network_u32(value);
}

} // namespace wordsmith::network
