#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <netinet/in.h>
#include "netsock/buffers.hpp"

namespace MiniTftp::NetSock {
    /// @brief IPv4 address and port, both in host byte order.
    struct Endpoint {
        std::uint32_t address {0};
        std::uint16_t port {0};

        [[nodiscard]] static Endpoint fromSockaddr(const sockaddr_in& addr) noexcept;
        [[nodiscard]] sockaddr_in toSockaddr() const noexcept;
        [[nodiscard]] std::string toString() const;

        auto operator<=>(const Endpoint& other) const noexcept = default;
    };

    enum class IOStatus {
        ok,
        invalid_args,
        timed_out,
        pipe_closed
    };

    struct IOResult {
        Endpoint peer;
        IOStatus status;
        int error_code {0};
    };

    [[nodiscard]] std::string describeIO(const IOResult& result);

    /**
     * @brief Datagram send / bounded-wait receive. `sendTo` may be called from several threads while one thread sits in `receiveFrom`.
     */
    class DatagramTransport {
    public:
        virtual ~DatagramTransport() = default;

        [[nodiscard]] virtual IOResult receiveFrom(Datagram& buffer, std::optional<std::chrono::milliseconds> timeout) = 0;
        [[nodiscard]] virtual IOResult sendTo(const Datagram& buffer, const Endpoint& peer) = 0;
    };

    class UDPSocket final : public DatagramTransport {
    private:
        int m_fd;
        bool m_ready;
        bool m_closed;

    public:
        UDPSocket() noexcept;
        explicit UDPSocket(int fd) noexcept;
        ~UDPSocket() override;

        UDPSocket(const UDPSocket& other) = delete;
        UDPSocket& operator=(const UDPSocket& other) = delete;

        UDPSocket(UDPSocket&& other) noexcept;
        UDPSocket& operator=(UDPSocket&& other) noexcept;

        [[nodiscard]] bool isUsable() const noexcept;
        [[nodiscard]] std::optional<Endpoint> getLocalEndpoint() const noexcept;

        /// @note An empty timeout blocks until a datagram arrives.
        [[nodiscard]] IOResult receiveFrom(Datagram& buffer, std::optional<std::chrono::milliseconds> timeout) override;
        [[nodiscard]] IOResult sendTo(const Datagram& buffer, const Endpoint& peer) override;
    };
}
