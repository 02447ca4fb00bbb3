#include "protocol.hpp"

namespace craftgate {

namespace {

constexpr std::uint8_t kSegmentBits = 0x7F;
constexpr std::uint8_t kContinueBit = 0x80;
constexpr std::int32_t kHandshakePacketId = 0x00;

std::uint8_t byte_at(std::string_view data, std::size_t index) {
    return static_cast<std::uint8_t>(data[index]);
}

} // namespace

std::int32_t decode_varint(std::string_view data, std::size_t& offset) {
    std::uint32_t value = 0;
    for (std::size_t i = 0; i < kMaxVarIntBytes; ++i) {
        if (offset >= data.size()) {
            throw ProtocolError("truncated varint");
        }
        const auto byte = byte_at(data, offset++);
        value |= static_cast<std::uint32_t>(byte & kSegmentBits) << (7 * i);
        if ((byte & kContinueBit) == 0) {
            return static_cast<std::int32_t>(value);
        }
    }
    throw ProtocolError("varint is too big");
}

void encode_varint(std::int32_t value, std::string& out) {
    auto bits = static_cast<std::uint32_t>(value);
    while ((bits & ~static_cast<std::uint32_t>(kSegmentBits)) != 0) {
        out.push_back(static_cast<char>((bits & kSegmentBits) | kContinueBit));
        bits >>= 7;
    }
    out.push_back(static_cast<char>(bits));
}

std::size_t varint_size(std::int32_t value) {
    auto bits = static_cast<std::uint32_t>(value);
    std::size_t size = 1;
    while ((bits & ~static_cast<std::uint32_t>(kSegmentBits)) != 0) {
        bits >>= 7;
        ++size;
    }
    return size;
}

std::optional<std::size_t> handshake_frame_size(std::string_view buffered) {
    bool prefix_complete = false;
    for (std::size_t i = 0; i < buffered.size() && i < kMaxVarIntBytes; ++i) {
        if ((byte_at(buffered, i) & kContinueBit) == 0) {
            prefix_complete = true;
            break;
        }
    }
    if (!prefix_complete) {
        if (buffered.size() < kMaxVarIntBytes) return std::nullopt;
        throw ProtocolError("varint is too big");
    }

    std::size_t offset = 0;
    const auto length = decode_varint(buffered, offset);
    if (length < 1 || length > kMaxHandshakeLength) {
        throw ProtocolError("invalid packet length: " + std::to_string(length));
    }
    return offset + static_cast<std::size_t>(length);
}

Handshake decode_handshake(std::string_view frame) {
    std::size_t offset = 0;
    const auto length = decode_varint(frame, offset);
    if (length < 1 || length > kMaxHandshakeLength) {
        throw ProtocolError("invalid packet length: " + std::to_string(length));
    }
    if (frame.size() - offset < static_cast<std::size_t>(length)) {
        throw ProtocolError("truncated packet: got " + std::to_string(frame.size() - offset) +
                            "/" + std::to_string(length) + " bytes");
    }

    const auto payload = frame.substr(offset, static_cast<std::size_t>(length));
    std::size_t pos = 0;

    const auto packet_id = decode_varint(payload, pos);
    if (packet_id != kHandshakePacketId) {
        throw ProtocolError("expected handshake packet (0x00), got " + std::to_string(packet_id));
    }

    Handshake packet;
    packet.protocol_version = decode_varint(payload, pos);

    const auto address_length = decode_varint(payload, pos);
    if (address_length < 0 || static_cast<std::size_t>(address_length) > payload.size() - pos) {
        throw ProtocolError("invalid address length: " + std::to_string(address_length));
    }
    packet.server_address.assign(payload.substr(pos, static_cast<std::size_t>(address_length)));
    pos += static_cast<std::size_t>(address_length);

    if (payload.size() - pos < 2) {
        throw ProtocolError("truncated server port");
    }
    packet.server_port = static_cast<std::uint16_t>((byte_at(payload, pos) << 8) | byte_at(payload, pos + 1));
    pos += 2;

    packet.next_state = decode_varint(payload, pos);
    return packet;
}

std::string encode_handshake(const Handshake& packet) {
    std::string body;
    body.reserve(16 + packet.server_address.size());
    encode_varint(kHandshakePacketId, body);
    encode_varint(packet.protocol_version, body);
    encode_varint(static_cast<std::int32_t>(packet.server_address.size()), body);
    body.append(packet.server_address);
    body.push_back(static_cast<char>(packet.server_port >> 8));
    body.push_back(static_cast<char>(packet.server_port & 0xFF));
    encode_varint(packet.next_state, body);

    std::string frame;
    frame.reserve(body.size() + kMaxVarIntBytes);
    encode_varint(static_cast<std::int32_t>(body.size()), frame);
    frame.append(body);
    return frame;
}

std::string_view handshake_hostname(std::string_view server_address) {
    return server_address.substr(0, server_address.find('\0'));
}

std::string rewrite_server_address(std::string_view server_address, std::string_view replacement) {
    const auto marker = server_address.find('\0');
    std::string rewritten(replacement);
    if (marker != std::string_view::npos) {
        rewritten.append(server_address.substr(marker));
    }
    return rewritten;
}

} // namespace craftgate
