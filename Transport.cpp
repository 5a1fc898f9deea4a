#include "Transport.hpp"
#include "FrameDump.hpp"
#include "Log.hpp"
#include <algorithm>

namespace {
    constexpr int POLL_SLICE_MS = 1000;
}

Transport::Transport(std::unique_ptr<DatagramSocket> socket) : socket_(std::move(socket)) {}

Transport::~Transport() {
    close();
}

bool Transport::is_open() const {
    return socket_ && socket_->is_open();
}

void Transport::close() {
    if (socket_) {
        socket_->close();
        socket_.reset();
    }
}

Status Transport::send_to(const Endpoint& to, const Bytes& data, int timeout_s) {
    if (!is_open()) return Status::TransportError;
    if (data.empty()) {
        Log::warn("Transport", "refusing to send an empty datagram");
        return Status::TransportError;
    }

    int attempts = std::max(timeout_s, 1);
    for (int i = 0; i < attempts; ++i) {
        PollResult r = socket_->wait_writable(POLL_SLICE_MS);
        if (r == PollResult::Timeout) continue;
        if (r == PollResult::Error) {
            Log::warn("Transport", "socket error while sending to " + to.ip);
            return Status::TransportError;
        }
        if (Log::enabled(Log::Level::Debug)) {
            Log::debug("Transport", "to " + to.ip + ": " + FrameDump::format(data));
        }
        return socket_->send_to(to, data) ? Status::Ok : Status::TransportError;
    }
    Log::warn("Transport", "socket not writable within " + std::to_string(attempts) + "s");
    return Status::SendTimeout;
}

Received Transport::receive_matching(uint16_t expected, int timeout_s) {
    return receive(expected, std::chrono::seconds(std::max(timeout_s, 0)));
}

Received Transport::receive_any(int timeout_s) {
    return receive(std::nullopt, std::chrono::seconds(std::max(timeout_s, 0)));
}

Received Transport::receive(std::optional<uint16_t> expected, std::chrono::milliseconds timeout) {
    Received result;
    if (!is_open()) {
        result.status = Status::ReceiveError;
        return result;
    }

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + timeout;
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        if (remaining.count() <= 0) break;

        int slice = static_cast<int>(std::min<long long>(remaining.count(), POLL_SLICE_MS));
        PollResult r = socket_->wait_readable(slice);
        if (r == PollResult::Timeout) continue;
        if (r == PollResult::Error) {
            Log::warn("Transport", "socket error while waiting for a reply");
            result.status = Status::ReceiveError;
            return result;
        }

        Datagram dg;
        if (!socket_->recv_from(dg.from, dg.data)) {
            result.status = Status::ReceiveError;
            return result;
        }
        if (Log::enabled(Log::Level::Debug)) {
            Log::debug("Transport", "from " + dg.from.ip + ": " + FrameDump::format(dg.data));
        }

        if (expected) {
            auto cmd = PacketCodec::command_of(dg.data);
            if (!cmd || *cmd != *expected) continue;
        }
        result.status = Status::Ok;
        result.datagram = std::move(dg);
        return result;
    }

    result.status = Status::NoResponse;
    return result;
}
