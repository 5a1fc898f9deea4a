// FakeSocket.hpp - in-memory DatagramSocket implementations for unit tests
//
// ScriptedSocket: replays queued inbound datagrams and records everything
//                 sent, with the time of each send.
// FakeDevice:     answers subscribe/control/learn/blast like an Orvibo
//                 socket or AllOne would.

#ifndef FAKE_SOCKET_HPP
#define FAKE_SOCKET_HPP

#include <chrono>
#include <deque>
#include <optional>
#include <thread>
#include <vector>

#include "DatagramSocket.hpp"
#include "DeviceIdentity.hpp"
#include "PacketCodec.hpp"

struct SentDatagram {
    Endpoint to;
    Bytes data;
    std::chrono::steady_clock::time_point at;
};

class ScriptedSocket : public DatagramSocket {
public:
    PollResult wait_writable(int) override {
        if (!open_ || fail_writes_) return PollResult::Error;
        return writable_ ? PollResult::Ready : PollResult::Timeout;
    }

    PollResult wait_readable(int timeout_ms) override {
        if (!open_) return PollResult::Error;
        if (fail_reads_) return PollResult::Error;
        if (!inbound_.empty() || flood_) return PollResult::Ready;
        // behave like poll(2) on a quiet socket
        std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
        return PollResult::Timeout;
    }

    bool send_to(const Endpoint& to, const Bytes& data) override {
        if (!open_) return false;
        sent_.push_back(SentDatagram{to, data, std::chrono::steady_clock::now()});
        on_sent(to, data);
        return true;
    }

    bool recv_from(Endpoint& from, Bytes& data) override {
        if (read_delay_ms_ > 0) std::this_thread::sleep_for(std::chrono::milliseconds(read_delay_ms_));
        ++reads_;
        if (!inbound_.empty()) {
            from = inbound_.front().to;
            data = inbound_.front().data;
            inbound_.pop_front();
            return true;
        }
        if (flood_) {
            from = flood_->to;
            data = flood_->data;
            return true;
        }
        return false;
    }

    void close() override { open_ = false; }
    bool is_open() const override { return open_; }

    // `from` is stored in SentDatagram::to for inbound entries
    void push_inbound(const Endpoint& from, const Bytes& data) {
        inbound_.push_back(SentDatagram{from, data, std::chrono::steady_clock::now()});
    }
    // delivered again and again once the queue is empty
    void set_flood(const Endpoint& from, const Bytes& data) {
        flood_ = SentDatagram{from, data, std::chrono::steady_clock::now()};
    }
    void set_writable(bool writable) { writable_ = writable; }
    void set_fail_reads(bool fail) { fail_reads_ = fail; }
    // poll reports POLLERR on the next writability wait
    void set_fail_writes(bool fail) { fail_writes_ = fail; }
    void set_read_delay(int ms) { read_delay_ms_ = ms; }

    size_t reads() const { return reads_; }

    const std::vector<SentDatagram>& sent() const { return sent_; }

    size_t sent_count(uint16_t command) const {
        size_t n = 0;
        for (const auto& s : sent_) {
            if (PacketCodec::command_of(s.data) == command) ++n;
        }
        return n;
    }

protected:
    virtual void on_sent(const Endpoint&, const Bytes&) {}

private:
    bool open_ = true;
    bool writable_ = true;
    bool fail_reads_ = false;
    bool fail_writes_ = false;
    int read_delay_ms_ = 0;
    size_t reads_ = 0;
    std::deque<SentDatagram> inbound_;
    std::optional<SentDatagram> flood_;
    std::vector<SentDatagram> sent_;
};

class FakeDevice : public ScriptedSocket {
public:
    FakeDevice(const HardwareId& id, DeviceClass cls, const Endpoint& address)
        : id_(id), cls_(cls), address_(address) {}

    uint8_t power = PacketCodec::STATE_OFF;
    bool answer_subscribe = true;
    bool answer_control = true;
    bool answer_blast = true;
    Bytes captured_signal;           // handed back after a learn request
    bool send_learn_ack = true;      // 0x0018 frame before the signal
    std::vector<Bytes> blasted;      // signal bytes of every blast frame

    // mac + spaces + 6 header bytes + the signal, as the AllOne reports it
    Bytes learn_frame(const Bytes& signal) const {
        using namespace PacketCodec;
        return encode(CMD_LEARN, {to_bytes(id_), SPACES_6, Bytes{0x01, 0x00, 0x00, 0x00, 0x00, 0x00}, signal});
    }

    Bytes learn_ack() const {
        using namespace PacketCodec;
        return encode(CMD_LEARN, {to_bytes(id_), SPACES_6, Bytes{0x01, 0x00}, ZEROS_4});
    }

protected:
    void on_sent(const Endpoint&, const Bytes& data) override {
        using namespace PacketCodec;
        auto cmd = command_of(data);
        if (!cmd) return;

        if (*cmd == CMD_SUBSCRIBE && answer_subscribe) {
            push_inbound(address_, encode(CMD_SUBSCRIBE, {to_bytes(id_), SPACES_6, reversed(id_), SPACES_6,
                                                          Bytes{0x00, 0x00, 0x00, 0x00, 0x00}, Bytes{power}}));
        } else if (*cmd == CMD_CONTROL && answer_control) {
            power = data.back();
            push_inbound(address_, encode(CMD_CONTROL, {to_bytes(id_), SPACES_6, ZEROS_4, Bytes{power}}));
        } else if (*cmd == CMD_LEARN && cls_ == DeviceClass::InfraredBlaster) {
            if (send_learn_ack) push_inbound(address_, learn_ack());
            if (!captured_signal.empty()) push_inbound(address_, learn_frame(captured_signal));
        } else if (*cmd == CMD_BLAST) {
            // hw(6) + spaces(6) + 65 00 00 00 + nonce(2)
            const size_t signal_start = HEADER_LEN + 6 + 6 + 4 + 2;
            if (data.size() >= signal_start) blasted.emplace_back(data.begin() + signal_start, data.end());
            if (answer_blast) push_inbound(address_, encode(CMD_BLAST, {to_bytes(id_), SPACES_6}));
        }
    }

private:
    HardwareId id_;
    DeviceClass cls_;
    Endpoint address_;
};

#endif // FAKE_SOCKET_HPP
