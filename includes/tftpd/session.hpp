#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include "tftp/types.hpp"

namespace MiniTftp::Tftpd {
    namespace Constants {
        inline constexpr Tftp::tftp_u16 no_block_sent = 0;
        inline constexpr unsigned int default_retries = 10U;
    }

    enum class SessionState : unsigned char {
        awaiting_first_send,
        awaiting_ack,
        completed,
        /// NOTE: the short final block went out but its Ack never came back; the peer may well have everything.
        unconfirmed,
        failed
    };

    [[nodiscard]] std::string_view toStateName(SessionState state) noexcept;

    /**
     * @brief Server half of one read transfer, driven by decoded packets and timer expiries. Does no I/O.
     * @note The payload view must outlive the session. Only the session's own cursor and counters ever change.
     */
    class ServerSession {
    private:
        std::u8string_view m_payload;
        std::size_t m_cursor;
        std::size_t m_in_flight_length;
        unsigned int m_retries;
        unsigned int m_retries_left;
        Tftp::tftp_u16 m_block;
        SessionState m_state;
        std::string m_failure;

        [[nodiscard]] SessionState transition(SessionState next) noexcept;
        [[nodiscard]] Tftp::DataPayload prepareData() const;

        [[nodiscard]] std::optional<Tftp::Packet> handleRequest();
        [[nodiscard]] std::optional<Tftp::Packet> handleAck(const Tftp::AckPayload& ack);
        void handlePeerError(const Tftp::ErrorPayload& err);

    public:
        ServerSession() = delete;
        ServerSession(std::u8string_view payload, unsigned int retries) noexcept;

        /// @brief Consumes one decoded packet from the peer and returns the Data packet to send in reply, if any.
        [[nodiscard]] std::optional<Tftp::Packet> onPacket(const Tftp::Packet& packet);

        /// @brief Called when no matching Ack arrived in time: returns the in-flight Data again. Once the retries are spent the session fails, or ends unconfirmed if the block in flight was the last one.
        [[nodiscard]] std::optional<Tftp::Packet> onTimeout();

        [[nodiscard]] SessionState getState() const noexcept;
        [[nodiscard]] Tftp::tftp_u16 getBlock() const noexcept;
        [[nodiscard]] std::size_t getBytesAcked() const noexcept;
        [[nodiscard]] bool isDone() const noexcept;
        [[nodiscard]] const std::string& getFailure() const noexcept;
    };
}
