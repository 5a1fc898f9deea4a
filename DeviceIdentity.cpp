#include "DeviceIdentity.hpp"
#include "FrameDump.hpp"
#include <algorithm>
#include <cctype>

std::string device_class_name(DeviceClass cls) {
    switch (cls) {
        case DeviceClass::Socket: return "socket";
        case DeviceClass::InfraredBlaster: return "irda";
        case DeviceClass::Unknown: return "unknown";
    }
    return "unknown";
}

std::optional<DeviceClass> parse_device_class(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "socket" || lower == "soc") return DeviceClass::Socket;
    if (lower == "irda" || lower == "ird" || lower == "allone") return DeviceClass::InfraredBlaster;
    return std::nullopt;
}

Bytes to_bytes(const HardwareId& id) {
    return Bytes(id.begin(), id.end());
}

Bytes reversed(const HardwareId& id) {
    return Bytes(id.rbegin(), id.rend());
}

std::string format_hardware_id(const HardwareId& id) {
    return FrameDump::hex(to_bytes(id));
}

std::optional<HardwareId> parse_hardware_id(const std::string& text) {
    std::string digits;
    for (char c : text) {
        if (c == ':' || c == '-') continue;
        if (!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
        digits.push_back(c);
    }
    if (digits.size() != 12) return std::nullopt;

    HardwareId id{};
    for (size_t i = 0; i < id.size(); ++i) {
        id[i] = static_cast<uint8_t>(std::stoul(digits.substr(i * 2, 2), nullptr, 16));
    }
    return id;
}

std::string describe(const DeviceIdentity& device) {
    return "Orvibo[type=" + device_class_name(device.device_class) +
           ", ip=" + device.address.ip +
           ", mac=" + format_hardware_id(device.hardware_id) + "]";
}
