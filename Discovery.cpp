#include "Discovery.hpp"
#include "Log.hpp"
#include "UdpSocket.hpp"
#include <algorithm>
#include <chrono>

namespace {
    const char* TAG = "Discovery";
    const std::string LIMITED_BROADCAST = "255.255.255.255";

    // magic + length + command + one 0x00
    constexpr size_t HARDWARE_ID_OFFSET = PacketCodec::HEADER_LEN + 1;

    bool contains(const Bytes& data, const std::string& needle) {
        return std::search(data.begin(), data.end(), needle.begin(), needle.end()) != data.end();
    }
}

Discovery::Discovery(int scan_window_s, uint16_t port, const std::string& if_name)
    : scan_window_s_(scan_window_s), port_(port), if_name_(if_name) {}

std::string Discovery::broadcast_address() const {
    if (if_name_.empty()) return LIMITED_BROADCAST;
    auto bcast = UdpSocket::interface_broadcast(if_name_);
    if (!bcast) {
        Log::warn(TAG, "falling back to " + LIMITED_BROADCAST);
        return LIMITED_BROADCAST;
    }
    return *bcast;
}

std::optional<DeviceIdentity> Discovery::parse_reply(const Endpoint& from, const Bytes& reply) {
    if (reply.size() < HARDWARE_ID_OFFSET + 6) return std::nullopt;

    DeviceIdentity device;
    device.address = from;
    std::copy(reply.begin() + HARDWARE_ID_OFFSET, reply.begin() + HARDWARE_ID_OFFSET + 6,
              device.hardware_id.begin());

    if (contains(reply, "SOC")) device.device_class = DeviceClass::Socket;
    else if (contains(reply, "IRD")) device.device_class = DeviceClass::InfraredBlaster;
    else device.device_class = DeviceClass::Unknown;
    return device;
}

DeviceMap Discovery::discover_all(Transport& transport) const {
    DeviceMap devices;
    Log::debug(TAG, "discovering Orvibo devices");

    Endpoint target{broadcast_address(), port_};
    Status sent = transport.send_to(target, PacketCodec::encode(PacketCodec::CMD_DISCOVER));
    if (sent != Status::Ok) {
        Log::warn(TAG, "discover broadcast failed: " + status_name(sent));
        return devices;
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(scan_window_s_);
    for (size_t n = 0; n < MAX_REPLIES; ++n) {
        if (std::chrono::steady_clock::now() >= deadline) break;
        Received r = transport.receive_matching(PacketCodec::CMD_DISCOVER, 1);
        if (r.status != Status::Ok) break;

        auto device = parse_reply(r.datagram->from, r.datagram->data);
        if (!device) {
            Log::debug(TAG, "ghost reply from " + r.datagram->from.ip);
            continue;
        }
        // replies always come from the protocol port, key by IP only
        device->address.port = port_;
        devices[device->address.ip] = *device;
    }

    Log::debug(TAG, "found " + std::to_string(devices.size()) + " device(s)");
    return devices;
}

DiscoverResult Discovery::discover_one(Transport& transport, const std::string& ip) const {
    DiscoverResult result;
    DeviceMap devices = discover_all(transport);
    auto it = devices.find(ip);
    if (it == devices.end()) {
        Log::warn(TAG, "device ip=" + ip + " not found");
        result.status = Status::DeviceNotFound;
        return result;
    }
    result.status = Status::Ok;
    result.device = it->second;
    return result;
}

DeviceMap Discovery::discover_all() const {
    auto sock = UdpSocket::open_broadcast(port_);
    if (!sock) {
        Log::error(TAG, "cannot open broadcast socket on port " + std::to_string(port_));
        return DeviceMap();
    }
    Transport transport(std::move(sock));
    return discover_all(transport);
}

DiscoverResult Discovery::discover_one(const std::string& ip) const {
    auto sock = UdpSocket::open_broadcast(port_);
    if (!sock) {
        Log::error(TAG, "cannot open broadcast socket on port " + std::to_string(port_));
        DiscoverResult result;
        result.status = Status::TransportError;
        return result;
    }
    Transport transport(std::move(sock));
    return discover_one(transport, ip);
}
