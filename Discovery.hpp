#ifndef DISCOVERY_HPP
#define DISCOVERY_HPP

#include <map>
#include <optional>
#include <string>
#include "DeviceIdentity.hpp"
#include "Status.hpp"
#include "Transport.hpp"

// keyed by device IP
using DeviceMap = std::map<std::string, DeviceIdentity>;

struct DiscoverResult {
    Status status = Status::DeviceNotFound;
    std::optional<DeviceIdentity> device;
};

// Broadcasts a discover frame and collects the replies. A reply repeated by
// the same address replaces the earlier one.
class Discovery {
public:
    static constexpr int DEFAULT_SCAN_WINDOW_S = 5;
    static constexpr size_t MAX_REPLIES = 512;

    // if_name selects the interface whose directed broadcast address is
    // used; empty means the limited broadcast 255.255.255.255
    explicit Discovery(int scan_window_s = DEFAULT_SCAN_WINDOW_S, uint16_t port = PacketCodec::PORT,
                       const std::string& if_name = "");

    // Scan on a caller-owned transport.
    DeviceMap discover_all(Transport& transport) const;
    DiscoverResult discover_one(Transport& transport, const std::string& ip) const;

    // Scan on a broadcast socket that lives for the duration of the call.
    DeviceMap discover_all() const;
    DiscoverResult discover_one(const std::string& ip) const;

    // Ghost replies (no room for a hardware id) yield nothing.
    static std::optional<DeviceIdentity> parse_reply(const Endpoint& from, const Bytes& reply);

    int scan_window() const { return scan_window_s_; }
    std::string broadcast_address() const;

private:
    int scan_window_s_;
    uint16_t port_;
    std::string if_name_;
};

#endif // DISCOVERY_HPP
