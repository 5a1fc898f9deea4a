#include "FrameDump.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace FrameDump {

const std::vector<Label>& default_labels() {
    using namespace PacketCodec;
    static const std::vector<Label> labels = {
        {"MAGIC", MAGIC},
        {"SPACES_6", SPACES_6},
        {"ZEROS_4", ZEROS_4},
        {"DISCOVER", command_bytes(CMD_DISCOVER)},
        {"SUBSCRIBE", command_bytes(CMD_SUBSCRIBE)},
        {"CONTROL", command_bytes(CMD_CONTROL)},
        {"SOCKET_EVENT", command_bytes(CMD_SOCKET_EVENT)},
        {"LEARN", command_bytes(CMD_LEARN)},
        {"BLAST", command_bytes(CMD_BLAST)},
    };
    return labels;
}

std::string hex(const Bytes& data) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t b : data) oss << std::setw(2) << static_cast<int>(b);
    return oss.str();
}

std::string format(const Bytes& data, const std::vector<Label>& labels) {
    // longest label first so that e.g. ZEROS_4 is not split by a shorter match
    std::vector<const Label*> ordered;
    for (const auto& l : labels) {
        if (!l.bytes.empty()) ordered.push_back(&l);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const Label* a, const Label* b) {
        return a->bytes.size() > b->bytes.size();
    });

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    size_t i = 0;
    while (i < data.size()) {
        const Label* hit = nullptr;
        for (const Label* l : ordered) {
            if (i + l->bytes.size() <= data.size() &&
                std::equal(l->bytes.begin(), l->bytes.end(), data.begin() + i)) {
                hit = l;
                break;
            }
        }
        if (hit) {
            oss << " + " << hit->name << " + ";
            i += hit->bytes.size();
        } else {
            oss << std::setw(2) << static_cast<int>(data[i]);
            ++i;
        }
    }
    return oss.str();
}

} // namespace FrameDump
