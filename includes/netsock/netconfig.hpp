#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <netdb.h>
#include "netsock/sockets.hpp"

namespace MiniTftp::NetSock {
    struct AddressParts {
        std::string host;
        std::string port;
    };

    /// @brief Splits `host:port` at the last colon. Both halves must be non-empty and the port numeric within 0..65535.
    [[nodiscard]] std::optional<AddressParts> splitAddress(std::string_view address);

    /// @brief Resolves an IPv4 `host:port` for use as a send target.
    [[nodiscard]] std::optional<Endpoint> resolveEndpoint(std::string_view address);

    /**
     * @brief Walks the passive IPv4 UDP candidates getaddrinfo yields for a host and port, producing one bound socket fd per call.
     * @note Throws std::runtime_error when the lookup itself fails.
     */
    class SocketGenerator {
    public:
        SocketGenerator() = delete;
        SocketGenerator(const char* host_cstr, const char* port_cstr);
        ~SocketGenerator();

        SocketGenerator(const SocketGenerator& other) = delete;
        SocketGenerator& operator=(const SocketGenerator& other) = delete;

        explicit operator bool() const noexcept;
        [[nodiscard]] std::optional<int> operator()();

    private:
        addrinfo* m_head;
        addrinfo* m_cursor;
    };

    /**
     * @brief Binds a UDP socket on `host:port` (port 0 picks an ephemeral one).
     * @note Returns an unusable socket when no candidate could be bound, throws std::runtime_error for a malformed or unresolvable address.
     */
    [[nodiscard]] UDPSocket bindUdpSocket(std::string_view address);
}
