#include <cstring>
#include <stdexcept>
#include <unistd.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <arpa/inet.h>
#include "meta/helpers.hpp"
#include "netsock/netconfig.hpp"

namespace MiniTftp::NetSock {
    static constexpr auto getaddrinfo_ok = 0;
    static constexpr auto socket_fd_dud = -1;
    static constexpr auto max_port_n = 65535U;

    [[nodiscard]] static addrinfo makeUdpHints(bool passive) noexcept {
        addrinfo udp_config;
        std::memset(&udp_config, 0, sizeof(udp_config));
        udp_config.ai_family = AF_INET;
        udp_config.ai_socktype = SOCK_DGRAM;
        udp_config.ai_protocol = IPPROTO_UDP;
        udp_config.ai_flags = passive ? AI_PASSIVE : 0;

        return udp_config;
    }

    std::optional<AddressParts> splitAddress(std::string_view address) {
        const auto colon_pos = address.rfind(':');

        if (colon_pos == std::string_view::npos or colon_pos == 0 or colon_pos + 1 >= address.length()) {
            return {};
        }

        const auto host = address.substr(0, colon_pos);
        const auto port = address.substr(colon_pos + 1);

        if (const auto port_n = Meta::parseUnsigned<unsigned int>(port); not port_n.has_value() or *port_n > max_port_n) {
            return {};
        }

        return AddressParts {
            std::string {host},
            std::string {port}
        };
    }

    std::optional<Endpoint> resolveEndpoint(std::string_view address) {
        const auto parts = splitAddress(address);

        if (not parts.has_value()) {
            return {};
        }

        const auto hints = makeUdpHints(false);
        addrinfo* results = nullptr;

        if (getaddrinfo(parts->host.c_str(), parts->port.c_str(), &hints, &results) != getaddrinfo_ok) {
            return {};
        }

        std::optional<Endpoint> resolved;

        if (results != nullptr and results->ai_addr != nullptr and results->ai_family == AF_INET) {
            resolved = Endpoint::fromSockaddr(*reinterpret_cast<const sockaddr_in*>(results->ai_addr));
        }

        freeaddrinfo(results);

        return resolved;
    }

    SocketGenerator::SocketGenerator(const char* host_cstr, const char* port_cstr)
    : m_head {nullptr}, m_cursor {nullptr} {
        const auto udp_config = makeUdpHints(true);

        if (const auto result = getaddrinfo(host_cstr, port_cstr, &udp_config, &m_head); result != getaddrinfo_ok) {
            throw std::runtime_error {gai_strerror(result)};
        }

        m_cursor = m_head;
    }

    SocketGenerator::~SocketGenerator() {
        if (m_head != nullptr) {
            freeaddrinfo(m_head);
            m_head = nullptr;
        }
    }

    SocketGenerator::operator bool() const noexcept {
        return m_cursor != nullptr;
    }

    std::optional<int> SocketGenerator::operator()() {
        if (m_cursor == nullptr) {
            return {};
        }

        const auto* candidate = m_cursor;
        m_cursor = m_cursor->ai_next;

        const auto socket_fd = socket(candidate->ai_family, candidate->ai_socktype, candidate->ai_protocol);

        if (socket_fd == socket_fd_dud) {
            return {};
        }

        if (bind(socket_fd, candidate->ai_addr, candidate->ai_addrlen) == socket_fd_dud) {
            close(socket_fd);
            return {};
        }

        return {socket_fd};
    }

    UDPSocket bindUdpSocket(std::string_view address) {
        const auto parts = splitAddress(address);

        if (not parts.has_value()) {
            throw std::runtime_error {"malformed address, expected host:port: " + std::string {address}};
        }

        SocketGenerator generator {parts->host.c_str(), parts->port.c_str()};

        while (generator) {
            auto fd_opt = generator();

            if (fd_opt.has_value()) {
                return UDPSocket {fd_opt.value()};
            }
        }

        return {};
    }
}
