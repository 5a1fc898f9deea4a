#ifndef DEVICE_ACTIONS_HPP
#define DEVICE_ACTIONS_HPP

#include <string>
#include "DeviceIdentity.hpp"
#include "LearnedSignal.hpp"
#include "Status.hpp"

// One-shot operations for the front ends: each opens a session on its own
// socket, runs a single command and closes the socket again.
namespace DeviceActions {
    struct Outcome {
        Status status = Status::Ok;
        std::string message;  // one line for the user
    };

    Outcome query_power(const DeviceIdentity& device, bool connected = false);
    Outcome switch_power(const DeviceIdentity& device, bool on, bool connected = false);
    Outcome learn_to_file(const DeviceIdentity& device, const std::string& path, SignalKind kind,
                          int timeout_s, bool connected = false);
    Outcome emit_from_file(const DeviceIdentity& device, const std::string& path, SignalKind kind,
                           bool connected = false);
}

#endif // DEVICE_ACTIONS_HPP
