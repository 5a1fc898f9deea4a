#ifndef FRAME_DUMP_HPP
#define FRAME_DUMP_HPP

#include <string>
#include <vector>
#include "PacketCodec.hpp"

// Hex dump of a datagram where known byte sequences are replaced by their
// label, e.g. "+ MAGIC + 001a + SUBSCRIBE + accf23...". Used for debug logs.
namespace FrameDump {
    struct Label {
        std::string name;
        Bytes bytes;
    };

    // magic, spacer/zero runs and every command code
    const std::vector<Label>& default_labels();

    std::string hex(const Bytes& data);
    std::string format(const Bytes& data, const std::vector<Label>& labels);
    inline std::string format(const Bytes& data) { return format(data, default_labels()); }
}

#endif // FRAME_DUMP_HPP
