#ifndef DEVICE_SESSION_HPP
#define DEVICE_SESSION_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include "DeviceIdentity.hpp"
#include "LearnedSignal.hpp"
#include "Status.hpp"
#include "Transport.hpp"

struct LearnResult {
    Status status = Status::NoResponse;
    std::optional<LearnedSignal> signal;  // set iff status == Ok
};

// One device, one socket. Every stateful command subscribes again first, so
// the power state it acts on is never older than the command itself.
class DeviceSession {
public:
    // devices drop subscriptions that arrive faster than this
    static constexpr std::chrono::milliseconds SUBSCRIBE_INTERVAL{100};
    static constexpr int DEFAULT_LEARN_TIMEOUT_S = 15;
    static constexpr int EMIT_ACK_TIMEOUT_S = 2;
    // length field of the learn acknowledgement, which carries no signal
    static constexpr uint16_t EMPTY_CAPTURE_LENGTH = 0x0018;
    // captured bytes start this far past the hardware id + spacer marker
    static constexpr size_t SIGNAL_OFFSET = 6;

    DeviceSession(DeviceIdentity identity, std::unique_ptr<Transport> transport);
    ~DeviceSession();

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    // Session over a fresh UDP socket. nullptr if the socket cannot be opened.
    static std::unique_ptr<DeviceSession> open(const DeviceIdentity& identity, bool connected = false);

    const DeviceIdentity& identity() const { return identity_; }

    // how long subscribe and control wait for their reply
    void set_reply_timeout(int timeout_s) { reply_timeout_s_ = timeout_s; }
    int reply_timeout() const { return reply_timeout_s_; }

    // Power state byte reported by the device, nullopt if it did not answer.
    std::optional<uint8_t> subscribe();
    bool subscribed() const { return power_state_.has_value(); }
    std::optional<uint8_t> last_power_state() const { return power_state_; }

    // Socket only. AlreadyInState when no control frame was needed.
    Status set_power(bool on);
    // Socket only; nullopt when the class is wrong or the device is silent.
    std::optional<bool> power_state();

    // IR blaster only.
    LearnResult learn_signal(SignalKind kind = SignalKind::Infrared, int timeout_s = DEFAULT_LEARN_TIMEOUT_S);
    Status emit_signal(const LearnedSignal& signal);

    void close();
    bool is_open() const;

    // Bytes following hw id + SPACES_6 + SIGNAL_OFFSET in a learn frame.
    static std::optional<Bytes> extract_signal(const HardwareId& id, const Bytes& frame);

private:
    DeviceIdentity identity_;
    std::unique_ptr<Transport> transport_;
    // nullopt: unsubscribed; otherwise subscribed with this power state
    std::optional<uint8_t> power_state_;
    std::chrono::steady_clock::time_point last_subscribe_;
    int reply_timeout_s_;
    std::string tag_;
    std::mt19937 rng_;

    bool require_class(DeviceClass cls, const char* operation) const;
    Status send(const Bytes& frame);
};

#endif // DEVICE_SESSION_HPP
