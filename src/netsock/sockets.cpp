#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>
#include <poll.h>
#include <unistd.h>
#include <arpa/inet.h>
#include <sys/socket.h>
#include "netsock/sockets.hpp"

namespace MiniTftp::NetSock {
    static constexpr auto dud_socket_fd = -1;
    static constexpr auto poll_timed_out = 0;

    Endpoint Endpoint::fromSockaddr(const sockaddr_in& addr) noexcept {
        return {
            ntohl(addr.sin_addr.s_addr),
            ntohs(addr.sin_port)
        };
    }

    sockaddr_in Endpoint::toSockaddr() const noexcept {
        sockaddr_in temp;
        std::memset(&temp, 0, sizeof(temp));
        temp.sin_family = AF_INET;
        temp.sin_addr.s_addr = htonl(address);
        temp.sin_port = htons(port);

        return temp;
    }

    std::string Endpoint::toString() const {
        const auto addr = toSockaddr();
        char text[INET_ADDRSTRLEN] = {};

        if (inet_ntop(AF_INET, &addr.sin_addr, text, INET_ADDRSTRLEN) == nullptr) {
            return "?:" + std::to_string(port);
        }

        return std::string {text} + ":" + std::to_string(port);
    }

    std::string describeIO(const IOResult& result) {
        switch (result.status) {
            case IOStatus::ok:
                return "ok";
            case IOStatus::invalid_args:
                return "invalid socket arguments";
            case IOStatus::timed_out:
                return "timed out";
            case IOStatus::pipe_closed:
                break;
        }

        if (result.error_code != 0) {
            return std::string {"socket failure: "} + std::strerror(result.error_code);
        }

        return "socket closed";
    }

    UDPSocket::UDPSocket() noexcept
    : m_fd {dud_socket_fd}, m_ready {false}, m_closed {true} {}

    UDPSocket::UDPSocket(int fd) noexcept
    : m_fd {fd}, m_ready {fd != dud_socket_fd}, m_closed {not m_ready} {}

    UDPSocket::~UDPSocket() {
        if (not m_ready or m_closed) {
            return;
        }

        close(m_fd);
        m_closed = true;
    }

    UDPSocket::UDPSocket(UDPSocket&& other) noexcept
    : m_fd {std::exchange(other.m_fd, dud_socket_fd)},
    m_ready {std::exchange(other.m_ready, false)},
    m_closed {std::exchange(other.m_closed, true)} {}

    UDPSocket& UDPSocket::operator=(UDPSocket&& other) noexcept {
        if (&other == this) {
            return *this;
        }

        if (m_fd != dud_socket_fd and not m_closed) {
            close(m_fd);
        }

        m_fd = std::exchange(other.m_fd, dud_socket_fd);
        m_ready = std::exchange(other.m_ready, false);
        m_closed = std::exchange(other.m_closed, true);

        return *this;
    }

    bool UDPSocket::isUsable() const noexcept {
        return not m_closed and m_ready;
    }

    std::optional<Endpoint> UDPSocket::getLocalEndpoint() const noexcept {
        if (not isUsable()) {
            return {};
        }

        sockaddr_in local;
        std::memset(&local, 0, sizeof(local));
        socklen_t sa_size = sizeof(sockaddr_in);

        if (getsockname(m_fd, reinterpret_cast<sockaddr*>(&local), &sa_size) == dud_socket_fd) {
            return {};
        }

        return Endpoint::fromSockaddr(local);
    }

    IOResult UDPSocket::receiveFrom(Datagram& buffer, std::optional<std::chrono::milliseconds> timeout) {
        if (not isUsable()) {
            return { {}, IOStatus::pipe_closed };
        }

        buffer.reset();

        if (timeout.has_value()) {
            pollfd watch {m_fd, POLLIN, 0};
            const auto wait_ms = static_cast<int>(std::max(timeout->count(), std::chrono::milliseconds::rep {0}));
            int ready = 0;

            do {
                ready = poll(&watch, 1, wait_ms);
            } while (ready < 0 and errno == EINTR);

            if (ready == poll_timed_out) {
                return { {}, IOStatus::timed_out };
            }

            if (ready < 0) {
                return { {}, IOStatus::pipe_closed, errno };
            }
        }

        sockaddr_in sender;
        std::memset(&sender, 0, sizeof(sender));
        socklen_t sa_size = sizeof(sockaddr_in);
        ssize_t count = 0;

        do {
            count = recvfrom(m_fd, buffer.viewPtr(), buffer.getSize(), 0, reinterpret_cast<sockaddr*>(&sender), &sa_size);
        } while (count < 0 and errno == EINTR);

        if (count < 0) {
            return { {}, IOStatus::pipe_closed, errno };
        }

        buffer.markLength(static_cast<std::size_t>(count));

        return { Endpoint::fromSockaddr(sender), IOStatus::ok };
    }

    IOResult UDPSocket::sendTo(const Datagram& buffer, const Endpoint& peer) {
        if (not isUsable()) {
            return { peer, IOStatus::pipe_closed };
        }

        if (buffer.isEmpty() or peer.port == 0) {
            return { peer, IOStatus::invalid_args };
        }

        const auto target = peer.toSockaddr();
        const auto n = buffer.getLength();
        const auto count = sendto(m_fd, buffer.viewPtr(), n, 0, reinterpret_cast<const sockaddr*>(&target), sizeof(sockaddr_in));

        if (count < 0) {
            return { peer, IOStatus::pipe_closed, errno };
        }

        if (static_cast<std::size_t>(count) != n) {
            return { peer, IOStatus::pipe_closed };
        }

        return { peer, IOStatus::ok };
    }
}
