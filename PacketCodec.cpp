#include "PacketCodec.hpp"
#include "Log.hpp"

namespace {
    uint16_t read_be16(const Bytes& data, size_t offset) {
        return static_cast<uint16_t>((static_cast<uint16_t>(data[offset]) << 8) | data[offset + 1]);
    }
}

namespace PacketCodec {

Bytes encode(uint16_t command, const std::vector<Bytes>& fields) {
    size_t length = HEADER_LEN;
    for (const auto& f : fields) length += f.size();
    if (length > MAX_FRAME) {
        Log::error("PacketCodec", "frame of " + std::to_string(length) + " bytes exceeds length field");
        return Bytes();
    }

    Bytes out;
    out.reserve(length);
    out.push_back(MAGIC_0);
    out.push_back(MAGIC_1);
    out.push_back(static_cast<uint8_t>(length >> 8));
    out.push_back(static_cast<uint8_t>(length & 0xFF));
    out.push_back(static_cast<uint8_t>(command >> 8));
    out.push_back(static_cast<uint8_t>(command & 0xFF));
    for (const auto& f : fields) out.insert(out.end(), f.begin(), f.end());
    return out;
}

std::optional<Frame> decode(const Bytes& data) {
    if (data.size() < HEADER_LEN) return std::nullopt;
    Frame frame;
    frame.length = read_be16(data, 2);
    frame.command = read_be16(data, 4);
    frame.payload.assign(data.begin() + HEADER_LEN, data.end());
    return frame;
}

std::optional<uint16_t> command_of(const Bytes& data) {
    if (data.size() < HEADER_LEN) return std::nullopt;
    return read_be16(data, 4);
}

std::optional<uint16_t> length_of(const Bytes& data) {
    if (data.size() < 4) return std::nullopt;
    return read_be16(data, 2);
}

Bytes command_bytes(uint16_t command) {
    return Bytes{static_cast<uint8_t>(command >> 8), static_cast<uint8_t>(command & 0xFF)};
}

std::string command_name(uint16_t command) {
    switch (command) {
        case CMD_DISCOVER: return "discover";
        case CMD_SUBSCRIBE: return "subscribe";
        case CMD_CONTROL: return "control";
        case CMD_SOCKET_EVENT: return "socket_event";
        case CMD_LEARN: return "learn";
        case CMD_BLAST: return "blast";
        default: return "unknown";
    }
}

} // namespace PacketCodec
