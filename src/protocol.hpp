#pragma once

#include "errors.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace craftgate {

// Game protocol handshake (packet id 0x00 of the handshaking state).
struct Handshake {
    std::int32_t protocol_version = 0;
    std::string server_address;
    std::uint16_t server_port = 0;
    std::int32_t next_state = 0;

    bool operator==(const Handshake& other) const = default;
};

inline constexpr std::size_t kMaxVarIntBytes = 5;
inline constexpr std::int32_t kMaxHandshakeLength = 255;

// Decodes one varint starting at data[offset] and advances offset past it.
// Throws ProtocolError when the input ends early or the value exceeds 5 bytes.
std::int32_t decode_varint(std::string_view data, std::size_t& offset);
void encode_varint(std::int32_t value, std::string& out);
std::size_t varint_size(std::int32_t value);

// Total size (length prefix + payload) of the frame at the start of `buffered`,
// or nullopt while the length prefix itself is incomplete. Throws ProtocolError
// when the prefix is malformed or outside [1, 255].
std::optional<std::size_t> handshake_frame_size(std::string_view buffered);

// `frame` must hold one complete frame including its length prefix.
Handshake decode_handshake(std::string_view frame);
std::string encode_handshake(const Handshake& packet);

// Hostname used for routing: the address up to the first NUL byte.
std::string_view handshake_hostname(std::string_view server_address);

// Address sent to the backend. Segments after the first NUL (the legacy
// compatibility marker) are kept verbatim; the host segment becomes `replacement`.
std::string rewrite_server_address(std::string_view server_address, std::string_view replacement);

} // namespace craftgate
