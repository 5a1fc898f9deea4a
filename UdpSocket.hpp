#ifndef UDP_SOCKET_HPP
#define UDP_SOCKET_HPP

#include <memory>
#include <optional>
#include <string>
#include <netinet/in.h>
#include "DatagramSocket.hpp"

class UdpSocket : public DatagramSocket {
public:
    UdpSocket();
    ~UdpSocket() override;

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    // SO_REUSEADDR + bind to 0.0.0.0:port, SO_BROADCAST when asked.
    // Falls back to an ephemeral port if allow_ephemeral and port is taken.
    bool open(uint16_t port, bool broadcast, bool allow_ephemeral = false);
    // restrict the socket to one peer
    bool connect_peer(const Endpoint& peer);

    PollResult wait_writable(int timeout_ms) override;
    PollResult wait_readable(int timeout_ms) override;
    bool send_to(const Endpoint& to, const Bytes& data) override;
    bool recv_from(Endpoint& from, Bytes& data) override;
    void close() override;
    bool is_open() const override { return sockfd_ >= 0; }

    uint16_t local_port() const { return local_port_; }

    // discovery socket on the well-known port
    static std::unique_ptr<UdpSocket> open_broadcast(uint16_t port = PacketCodec::PORT);
    // per-device socket, optionally connected to the device
    static std::unique_ptr<UdpSocket> open_device(const Endpoint& peer, bool connected = false);

    // Directed broadcast address of an IPv4 interface. Empty if_name picks
    // the first non-loopback interface that is up.
    static std::optional<std::string> interface_broadcast(const std::string& if_name);

private:
    int sockfd_;
    uint16_t local_port_;

    PollResult wait(short events, int timeout_ms);
};

#endif // UDP_SOCKET_HPP
