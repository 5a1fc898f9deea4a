#ifndef PACKET_CODEC_HPP
#define PACKET_CODEC_HPP

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

using Bytes = std::vector<uint8_t>;

// Orvibo datagram framing:
//   [magic 68 64][length, BE u16][command, 2 bytes][payload...]
// length counts the whole datagram, magic and length included.
namespace PacketCodec {
    constexpr uint16_t PORT = 10000;
    constexpr size_t MAGIC_LEN = 2;
    constexpr size_t HEADER_LEN = 6;
    constexpr size_t MAX_DATAGRAM = 1024;
    constexpr size_t MAX_FRAME = 0xFFFF;

    constexpr uint8_t MAGIC_0 = 0x68;
    constexpr uint8_t MAGIC_1 = 0x64;

    // command codes; replies reuse the request code
    constexpr uint16_t CMD_DISCOVER = 0x7161;
    constexpr uint16_t CMD_SUBSCRIBE = 0x636c;
    constexpr uint16_t CMD_CONTROL = 0x6463;
    constexpr uint16_t CMD_SOCKET_EVENT = 0x7366;  // unsolicited, state changed on the device
    constexpr uint16_t CMD_LEARN = 0x6c73;         // IR and RF433
    constexpr uint16_t CMD_BLAST = 0x6963;         // IR and RF433, reply code varies

    constexpr uint8_t STATE_OFF = 0x00;
    constexpr uint8_t STATE_ON = 0x01;

    inline const Bytes MAGIC{MAGIC_0, MAGIC_1};
    inline const Bytes SPACES_6(6, 0x20);
    inline const Bytes ZEROS_4(4, 0x00);

    struct Frame {
        uint16_t length{};
        uint16_t command{};
        Bytes payload;  // everything after the command field
    };

    // Concatenates fields after the command and prefixes magic and length.
    // Returns an empty buffer if the datagram would not fit the length field.
    Bytes encode(uint16_t command, const std::vector<Bytes>& fields = {});

    // Magic is not checked. Buffers shorter than the header yield no frame.
    std::optional<Frame> decode(const Bytes& data);

    std::optional<uint16_t> command_of(const Bytes& data);
    std::optional<uint16_t> length_of(const Bytes& data);

    Bytes command_bytes(uint16_t command);
    std::string command_name(uint16_t command);
}

#endif // PACKET_CODEC_HPP
