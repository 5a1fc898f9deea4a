#ifndef DEVICE_IDENTITY_HPP
#define DEVICE_IDENTITY_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include "PacketCodec.hpp"

using HardwareId = std::array<uint8_t, 6>;

enum class DeviceClass { Socket, InfraredBlaster, Unknown };

struct Endpoint {
    std::string ip;
    uint16_t port = PacketCodec::PORT;

    bool operator==(const Endpoint& other) const { return ip == other.ip && port == other.port; }
    bool operator!=(const Endpoint& other) const { return !(*this == other); }
};

// What discovery learned about a device. Replaced as a whole on re-discovery.
struct DeviceIdentity {
    Endpoint address;
    HardwareId hardware_id{};
    DeviceClass device_class = DeviceClass::Unknown;
};

std::string device_class_name(DeviceClass cls);
// "socket"/"soc" and "irda"/"ird"/"allone"
std::optional<DeviceClass> parse_device_class(const std::string& text);

Bytes to_bytes(const HardwareId& id);
Bytes reversed(const HardwareId& id);
// lower case hex without separators, e.g. "accf23a1b2c3"
std::string format_hardware_id(const HardwareId& id);
// accepts 12 hex digits, optionally separated by ':' or '-'
std::optional<HardwareId> parse_hardware_id(const std::string& text);

// "Orvibo[type=socket, ip=192.168.1.10, mac=accf23a1b2c3]"
std::string describe(const DeviceIdentity& device);

#endif // DEVICE_IDENTITY_HPP
