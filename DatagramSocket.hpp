#ifndef DATAGRAM_SOCKET_HPP
#define DATAGRAM_SOCKET_HPP

#include "DeviceIdentity.hpp"
#include "PacketCodec.hpp"

enum class PollResult { Ready, Timeout, Error };

// Raw datagram endpoint under a Transport. UdpSocket is the real one,
// tests plug in scripted fakes.
class DatagramSocket {
public:
    virtual ~DatagramSocket() = default;

    virtual PollResult wait_writable(int timeout_ms) = 0;
    virtual PollResult wait_readable(int timeout_ms) = 0;

    // true if the whole datagram was handed to the kernel
    virtual bool send_to(const Endpoint& to, const Bytes& data) = 0;
    // one datagram, at most PacketCodec::MAX_DATAGRAM bytes
    virtual bool recv_from(Endpoint& from, Bytes& data) = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

#endif // DATAGRAM_SOCKET_HPP
