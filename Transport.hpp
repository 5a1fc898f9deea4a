#ifndef TRANSPORT_HPP
#define TRANSPORT_HPP

#include <chrono>
#include <memory>
#include <optional>
#include "DatagramSocket.hpp"
#include "Status.hpp"

struct Datagram {
    Endpoint from;
    Bytes data;
};

struct Received {
    Status status = Status::NoResponse;
    std::optional<Datagram> datagram;  // set iff status == Ok
};

// Bounded send/receive over one datagram socket. Every wait is sliced into
// polls of at most one second; nothing blocks past the given timeout.
class Transport {
public:
    static constexpr int DEFAULT_TIMEOUT_S = 10;

    explicit Transport(std::unique_ptr<DatagramSocket> socket);
    ~Transport();

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    // Ok, SendTimeout if the socket never became writable, TransportError
    // on a socket error or a closed transport.
    Status send_to(const Endpoint& to, const Bytes& data, int timeout_s = DEFAULT_TIMEOUT_S);

    // First datagram carrying command `expected`; others are dropped.
    Received receive_matching(uint16_t expected, int timeout_s = DEFAULT_TIMEOUT_S);
    // First datagram of any kind.
    Received receive_any(int timeout_s = DEFAULT_TIMEOUT_S);

    void close();
    bool is_open() const;

private:
    std::unique_ptr<DatagramSocket> socket_;

    Received receive(std::optional<uint16_t> expected, std::chrono::milliseconds timeout);
};

#endif // TRANSPORT_HPP
