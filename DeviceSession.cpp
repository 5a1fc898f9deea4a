#include "DeviceSession.hpp"
#include "FrameDump.hpp"
#include "Log.hpp"
#include "UdpSocket.hpp"
#include <algorithm>
#include <thread>

using namespace PacketCodec;

namespace {
    const Bytes LEARN_MODE{0x01, 0x00};
    const Bytes BLAST_MARKER{0x65, 0x00, 0x00, 0x00};

    const char* on_off(bool on) { return on ? "on" : "off"; }
}

DeviceSession::DeviceSession(DeviceIdentity identity, std::unique_ptr<Transport> transport)
    : identity_(std::move(identity)),
      transport_(std::move(transport)),
      last_subscribe_(std::chrono::steady_clock::now() - std::chrono::seconds(1)),
      reply_timeout_s_(Transport::DEFAULT_TIMEOUT_S),
      tag_("Session@" + identity_.address.ip),
      rng_(std::random_device{}()) {}

DeviceSession::~DeviceSession() {
    close();
}

std::unique_ptr<DeviceSession> DeviceSession::open(const DeviceIdentity& identity, bool connected) {
    auto sock = UdpSocket::open_device(identity.address, connected);
    if (!sock) {
        Log::error("Session@" + identity.address.ip, "cannot open device socket");
        return nullptr;
    }
    return std::make_unique<DeviceSession>(identity, std::make_unique<Transport>(std::move(sock)));
}

void DeviceSession::close() {
    if (transport_) {
        transport_->close();
        transport_.reset();
    }
    power_state_.reset();
}

bool DeviceSession::is_open() const {
    return transport_ && transport_->is_open();
}

bool DeviceSession::require_class(DeviceClass cls, const char* operation) const {
    if (identity_.device_class == cls) return true;
    Log::warn(tag_, std::string("attempt to ") + operation + " on a device of type " +
                        device_class_name(identity_.device_class));
    return false;
}

Status DeviceSession::send(const Bytes& frame) {
    if (!transport_) return Status::TransportError;
    return transport_->send_to(identity_.address, frame);
}

std::optional<uint8_t> DeviceSession::subscribe() {
    if (!transport_) {
        Log::warn(tag_, "subscribe on a closed session");
        return std::nullopt;
    }

    auto since = std::chrono::steady_clock::now() - last_subscribe_;
    if (since < SUBSCRIBE_INTERVAL) {
        std::this_thread::sleep_for(SUBSCRIBE_INTERVAL - since);
    }

    Bytes frame = encode(CMD_SUBSCRIBE, {to_bytes(identity_.hardware_id), SPACES_6,
                                         reversed(identity_.hardware_id), SPACES_6});
    Status sent = send(frame);
    last_subscribe_ = std::chrono::steady_clock::now();
    if (sent != Status::Ok) {
        Log::warn(tag_, "subscribe not sent: " + status_name(sent));
        power_state_.reset();
        return std::nullopt;
    }

    Received r = transport_->receive_matching(CMD_SUBSCRIBE, reply_timeout_s_);
    if (r.status != Status::Ok || r.datagram->data.size() <= HEADER_LEN) {
        Log::debug(tag_, "no subscribe response");
        power_state_.reset();
        return std::nullopt;
    }

    power_state_ = r.datagram->data.back();
    Log::debug(tag_, "subscribed, state=" + std::to_string(*power_state_));
    return power_state_;
}

Status DeviceSession::set_power(bool on) {
    if (!require_class(DeviceClass::Socket, "switch power")) return Status::WrongDeviceClass;
    if (!transport_) return Status::TransportError;

    auto current = subscribe();
    if (!current) {
        Log::warn(tag_, "subscription failed while controlling socket");
        return Status::NoResponse;
    }

    uint8_t state = on ? STATE_ON : STATE_OFF;
    if (*current == state) {
        Log::info(tag_, std::string("socket is already switched ") + on_off(on));
        return Status::AlreadyInState;
    }

    Log::debug(tag_, std::string("switching socket ") + on_off(on));
    Status sent = send(encode(CMD_CONTROL, {to_bytes(identity_.hardware_id), SPACES_6, ZEROS_4, Bytes{state}}));
    if (sent != Status::Ok) return sent;

    Received r = transport_->receive_matching(CMD_CONTROL, reply_timeout_s_);
    if (r.status != Status::Ok) {
        Log::warn(tag_, std::string("switching socket ") + on_off(on) + " failed: " + status_name(r.status));
        return r.status;
    }
    power_state_ = state;
    Log::info(tag_, std::string("socket switched ") + on_off(on));
    return Status::Ok;
}

std::optional<bool> DeviceSession::power_state() {
    if (!require_class(DeviceClass::Socket, "read power state")) return std::nullopt;
    auto state = subscribe();
    if (!state) return std::nullopt;
    return *state == STATE_ON;
}

std::optional<Bytes> DeviceSession::extract_signal(const HardwareId& id, const Bytes& frame) {
    Bytes marker = to_bytes(id);
    marker.insert(marker.end(), SPACES_6.begin(), SPACES_6.end());

    auto it = std::search(frame.begin(), frame.end(), marker.begin(), marker.end());
    if (it == frame.end()) return std::nullopt;

    size_t start = static_cast<size_t>(it - frame.begin()) + marker.size() + SIGNAL_OFFSET;
    if (start >= frame.size()) return std::nullopt;
    return Bytes(frame.begin() + start, frame.end());
}

LearnResult DeviceSession::learn_signal(SignalKind kind, int timeout_s) {
    LearnResult result;
    if (!require_class(DeviceClass::InfraredBlaster, "learn a signal")) {
        result.status = Status::WrongDeviceClass;
        return result;
    }
    if (!transport_) {
        result.status = Status::TransportError;
        return result;
    }
    if (!subscribe()) {
        Log::warn(tag_, "subscription failed while entering learning mode");
        result.status = Status::NoResponse;
        return result;
    }

    Log::debug(tag_, "entering learning mode (" + signal_kind_name(kind) + ")");
    Status sent = send(encode(CMD_LEARN, {to_bytes(identity_.hardware_id), SPACES_6, LEARN_MODE, ZEROS_4}));
    if (sent != Status::Ok) {
        result.status = sent;
        return result;
    }

    Log::info(tag_, "waiting for signal...");
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::seconds(timeout_s);
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        if (remaining.count() <= 0) break;
        int wait_s = static_cast<int>((remaining.count() + 999) / 1000);

        Received r = transport_->receive_matching(CMD_LEARN, wait_s);
        if (r.status == Status::NoResponse) break;
        if (r.status != Status::Ok) {
            result.status = r.status;
            return result;
        }

        const Bytes& data = r.datagram->data;
        if (length_of(data) == EMPTY_CAPTURE_LENGTH) {
            Log::debug(tag_, "learn acknowledgement, still waiting");
            continue;
        }
        auto captured = extract_signal(identity_.hardware_id, data);
        if (!captured) {
            Log::debug(tag_, "learn frame without signal: " + FrameDump::format(data));
            continue;
        }

        Log::info(tag_, "signal captured, " + std::to_string(captured->size()) + " bytes");
        result.status = Status::Ok;
        result.signal = LearnedSignal{std::move(*captured), kind};
        return result;
    }

    Log::warn(tag_, "nothing captured during " + std::to_string(timeout_s) + "s");
    result.status = Status::NoResponse;
    return result;
}

Status DeviceSession::emit_signal(const LearnedSignal& signal) {
    if (!require_class(DeviceClass::InfraredBlaster, "emit a signal")) return Status::WrongDeviceClass;
    if (!transport_) return Status::TransportError;
    if (!subscribe()) {
        Log::warn(tag_, "subscription failed while emitting signal");
        return Status::NoResponse;
    }

    std::uniform_int_distribution<int> byte_dist(0, 255);
    Bytes nonce{static_cast<uint8_t>(byte_dist(rng_)), static_cast<uint8_t>(byte_dist(rng_))};

    Status sent = send(encode(CMD_BLAST, {to_bytes(identity_.hardware_id), SPACES_6, BLAST_MARKER, nonce,
                                          signal.bytes}));
    if (sent != Status::Ok) return sent;

    Received r = transport_->receive_any(EMIT_ACK_TIMEOUT_S);
    if (r.status != Status::Ok) {
        Log::warn(tag_, "signal emit not acknowledged: " + status_name(r.status));
        return r.status;
    }
    Log::info(tag_, "signal emitted (" + signal_kind_name(signal.kind) + ")");
    return Status::Ok;
}
