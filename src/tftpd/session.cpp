#include <algorithm>
#include <array>
#include <variant>
#include "tftp/messaging.hpp"
#include "tftpd/session.hpp"

namespace MiniTftp::Tftpd {
    static constexpr std::array<std::string_view, 5> state_names = {
        "awaiting-first-send",
        "awaiting-ack",
        "completed",
        "unconfirmed",
        "failed"
    };

    std::string_view toStateName(SessionState state) noexcept {
        return state_names[static_cast<std::size_t>(state)];
    }

    /// @note Only use for unconditional state transitions.
    SessionState ServerSession::transition(SessionState next) noexcept {
        return next;
    }

    Tftp::DataPayload ServerSession::prepareData() const {
        const auto remaining = m_payload.length() - m_cursor;
        const auto chunk_length = std::min(remaining, Tftp::block_size_limit);

        return {
            m_block,
            std::u8string {m_payload.substr(m_cursor, chunk_length)}
        };
    }

    std::optional<Tftp::Packet> ServerSession::handleRequest() {
        if (m_state != SessionState::awaiting_first_send) {
            return {};
        }

        m_block = Tftp::advanceBlock(m_block);

        auto reply = prepareData();
        m_in_flight_length = reply.data.length();
        m_state = transition(SessionState::awaiting_ack);

        return reply;
    }

    std::optional<Tftp::Packet> ServerSession::handleAck(const Tftp::AckPayload& ack) {
        /// NOTE: stale or duplicated Acks match nothing and change nothing, not even the retry budget.
        if (m_state != SessionState::awaiting_ack or ack.block != m_block) {
            return {};
        }

        m_cursor += m_in_flight_length;

        if (Tftp::isShortBlock(m_in_flight_length)) {
            m_in_flight_length = 0;
            m_state = transition(SessionState::completed);
            return {};
        }

        m_block = Tftp::advanceBlock(m_block);
        m_retries_left = m_retries;

        auto reply = prepareData();
        m_in_flight_length = reply.data.length();

        return reply;
    }

    void ServerSession::handlePeerError(const Tftp::ErrorPayload& err) {
        m_failure = "peer error (";
        m_failure += Tftp::toErrorMsg(err.code);
        m_failure += "): ";
        m_failure += err.message;
        m_state = transition(SessionState::failed);
    }

    ServerSession::ServerSession(std::u8string_view payload, unsigned int retries) noexcept
    : m_payload {payload}, m_cursor {0UL}, m_in_flight_length {0UL}, m_retries {retries}, m_retries_left {retries}, m_block {Constants::no_block_sent}, m_state {SessionState::awaiting_first_send}, m_failure {} {}

    std::optional<Tftp::Packet> ServerSession::onPacket(const Tftp::Packet& packet) {
        if (isDone()) {
            return {};
        }

        if (std::holds_alternative<Tftp::RrqPayload>(packet)) {
            return handleRequest();
        } else if (const auto* ack = std::get_if<Tftp::AckPayload>(&packet); ack != nullptr) {
            return handleAck(*ack);
        } else if (const auto* err = std::get_if<Tftp::ErrorPayload>(&packet); err != nullptr) {
            handlePeerError(*err);
        }

        return {};
    }

    std::optional<Tftp::Packet> ServerSession::onTimeout() {
        if (m_state != SessionState::awaiting_ack) {
            return {};
        }

        if (m_retries_left == 0U and Tftp::isShortBlock(m_in_flight_length)) {
            m_state = transition(SessionState::unconfirmed);
            return {};
        }

        if (m_retries_left == 0U) {
            m_failure = "exhausted retries: block " + std::to_string(m_block) + " was never acknowledged";
            m_state = transition(SessionState::failed);
            return {};
        }

        --m_retries_left;

        return prepareData();
    }

    SessionState ServerSession::getState() const noexcept {
        return m_state;
    }

    Tftp::tftp_u16 ServerSession::getBlock() const noexcept {
        return m_block;
    }

    std::size_t ServerSession::getBytesAcked() const noexcept {
        return m_cursor;
    }

    bool ServerSession::isDone() const noexcept {
        return m_state == SessionState::completed or m_state == SessionState::unconfirmed or m_state == SessionState::failed;
    }

    const std::string& ServerSession::getFailure() const noexcept {
        return m_failure;
    }
}
