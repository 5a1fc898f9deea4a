#include "UdpSocket.hpp"
#include "Log.hpp"
#include <cerrno>
#include <cstdio>
#include <unistd.h>
#include <poll.h>
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <sys/socket.h>

namespace {
    const char* TAG = "UdpSocket";

    bool to_sockaddr(const Endpoint& ep, sockaddr_in& out) {
        out = sockaddr_in{};
        out.sin_family = AF_INET;
        out.sin_port = htons(ep.port);
        if (inet_pton(AF_INET, ep.ip.c_str(), &out.sin_addr) != 1) {
            Log::error(TAG, "not an IPv4 address: " + ep.ip);
            return false;
        }
        return true;
    }

    Endpoint to_endpoint(const sockaddr_in& in) {
        char text[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &in.sin_addr, text, sizeof(text));
        return Endpoint{text, ntohs(in.sin_port)};
    }

    bool bind_any(int fd, uint16_t port) {
        sockaddr_in local{};
        local.sin_family = AF_INET;
        local.sin_addr.s_addr = htonl(INADDR_ANY);
        local.sin_port = htons(port);
        return ::bind(fd, reinterpret_cast<sockaddr*>(&local), sizeof(local)) == 0;
    }
}

UdpSocket::UdpSocket() : sockfd_(-1), local_port_(0) {}

UdpSocket::~UdpSocket() {
    close();
}

bool UdpSocket::open(uint16_t port, bool broadcast, bool allow_ephemeral) {
    close();
    sockfd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (sockfd_ < 0) {
        perror("UdpSocket: socket");
        return false;
    }

    int on = 1;
    if (broadcast && setsockopt(sockfd_, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on)) < 0) {
        perror("UdpSocket: setsockopt SO_BROADCAST");
        close();
        return false;
    }
    if (setsockopt(sockfd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) < 0) {
        perror("UdpSocket: setsockopt SO_REUSEADDR");
    }

    if (!bind_any(sockfd_, port)) {
        if (!allow_ephemeral) {
            perror("UdpSocket: bind");
            close();
            return false;
        }
        // devices answer to whatever source port the request came from
        Log::debug(TAG, "port " + std::to_string(port) + " busy, binding an ephemeral port");
        if (!bind_any(sockfd_, 0)) {
            perror("UdpSocket: bind (ephemeral)");
            close();
            return false;
        }
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(sockfd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        local_port_ = to_endpoint(bound).port;
    }
    return true;
}

bool UdpSocket::connect_peer(const Endpoint& peer) {
    sockaddr_in addr;
    if (!is_open() || !to_sockaddr(peer, addr)) return false;
    if (::connect(sockfd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        perror("UdpSocket: connect");
        return false;
    }
    return true;
}

PollResult UdpSocket::wait(short events, int timeout_ms) {
    if (!is_open()) return PollResult::Error;
    struct pollfd pfd{};
    pfd.fd = sockfd_;
    pfd.events = events;
    int r = ::poll(&pfd, 1, timeout_ms);
    if (r < 0) {
        if (errno == EINTR) return PollResult::Timeout;
        perror("UdpSocket: poll");
        return PollResult::Error;
    }
    if (r == 0) return PollResult::Timeout;
    if (pfd.revents & (POLLERR | POLLNVAL)) return PollResult::Error;
    if (pfd.revents & events) return PollResult::Ready;
    return PollResult::Timeout;
}

PollResult UdpSocket::wait_writable(int timeout_ms) {
    return wait(POLLOUT, timeout_ms);
}

PollResult UdpSocket::wait_readable(int timeout_ms) {
    return wait(POLLIN, timeout_ms);
}

bool UdpSocket::send_to(const Endpoint& to, const Bytes& data) {
    sockaddr_in dest;
    if (!is_open() || !to_sockaddr(to, dest)) return false;
    ssize_t r = ::sendto(sockfd_, data.data(), data.size(), 0,
                         reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
    if (r < 0) {
        perror("UdpSocket: sendto");
        return false;
    }
    return r == static_cast<ssize_t>(data.size());
}

bool UdpSocket::recv_from(Endpoint& from, Bytes& data) {
    if (!is_open()) return false;
    data.resize(PacketCodec::MAX_DATAGRAM);
    sockaddr_in peer{};
    socklen_t peer_len = sizeof(peer);
    ssize_t n = ::recvfrom(sockfd_, data.data(), data.size(), 0,
                           reinterpret_cast<sockaddr*>(&peer), &peer_len);
    if (n < 0) {
        perror("UdpSocket: recvfrom");
        data.clear();
        return false;
    }
    data.resize(static_cast<size_t>(n));
    from = to_endpoint(peer);
    return true;
}

void UdpSocket::close() {
    if (is_open()) ::close(sockfd_);
    sockfd_ = -1;
    local_port_ = 0;
}

std::unique_ptr<UdpSocket> UdpSocket::open_broadcast(uint16_t port) {
    auto sock = std::make_unique<UdpSocket>();
    if (!sock->open(port, true)) return nullptr;
    return sock;
}

std::unique_ptr<UdpSocket> UdpSocket::open_device(const Endpoint& peer, bool connected) {
    auto sock = std::make_unique<UdpSocket>();
    if (!sock->open(peer.port, false, true)) return nullptr;
    if (connected && !sock->connect_peer(peer)) return nullptr;
    return sock;
}

std::optional<std::string> UdpSocket::interface_broadcast(const std::string& if_name) {
    ifaddrs* list = nullptr;
    if (::getifaddrs(&list) < 0) {
        perror("UdpSocket: getifaddrs");
        return std::nullopt;
    }
    std::unique_ptr<ifaddrs, void (*)(ifaddrs*)> guard(list, ::freeifaddrs);

    for (const ifaddrs* it = list; it; it = it->ifa_next) {
        bool usable = it->ifa_addr && it->ifa_netmask && it->ifa_addr->sa_family == AF_INET &&
                      (it->ifa_flags & IFF_UP) && !(it->ifa_flags & IFF_LOOPBACK);
        if (!usable || (!if_name.empty() && if_name != it->ifa_name)) continue;

        sockaddr_in bcast = *reinterpret_cast<const sockaddr_in*>(it->ifa_addr);
        in_addr_t mask = reinterpret_cast<const sockaddr_in*>(it->ifa_netmask)->sin_addr.s_addr;
        bcast.sin_addr.s_addr |= ~mask;
        Log::debug(TAG, std::string(it->ifa_name) + " broadcasts to " + to_endpoint(bcast).ip);
        return to_endpoint(bcast).ip;
    }

    Log::error(TAG, if_name.empty() ? std::string("no IPv4 interface is up")
                                    : "interface " + if_name + " not found or has no IPv4 broadcast");
    return std::nullopt;
}
