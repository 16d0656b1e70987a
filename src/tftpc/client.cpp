#include <array>
#include <utility>
#include <variant>
#include "tftp/messaging.hpp"
#include "tftpc/client.hpp"

namespace MiniTftp::Tftpc {
    static constexpr unsigned int default_retries = 10U;
    static constexpr std::chrono::milliseconds default_timeout {6000};

    static constexpr std::array<std::string_view, static_cast<std::size_t>(TransferStatus::last) + 1> status_names = {
        "ok",
        "invalid request",
        "transport error",
        "retries exhausted",
        "peer error",
        "sink error"
    };

    std::string_view toStatusName(TransferStatus status) noexcept {
        return status_names[static_cast<std::size_t>(status)];
    }

    [[nodiscard]] static ClientConfig normalizeConfig(ClientConfig config) noexcept {
        if (config.retries == 0U) {
            config.retries = default_retries;
        }

        if (config.timeout <= std::chrono::milliseconds::zero()) {
            config.timeout = default_timeout;
        }

        return config;
    }

    /// @note Only use for unconditional state transitions.
    ClientState MyClient::transition(ClientState next) noexcept {
        return next;
    }

    ClientState MyClient::fail(TransferStatus status, std::string detail) {
        m_result.status = status;
        m_result.detail = std::move(detail);

        return ClientState::failed;
    }

    ClientState MyClient::spendAttempt(std::string_view reason) {
        if (m_attempts_left > 0U) {
            --m_attempts_left;
        }

        if (m_attempts_left == 0U) {
            return fail(TransferStatus::retries_exhausted, "exhausted retries: " + std::string {reason} + " (" + std::to_string(m_config.retries) + " attempts of " + std::to_string(m_config.timeout.count()) + " ms)");
        }

        m_logger.logMessage<Meta::LogLevel::debug>(reason, ", ", m_attempts_left, " attempts left");

        return ClientState::awaiting_data;
    }

    bool MyClient::sendPacket(const Tftp::Packet& packet) {
        const auto op_name = Tftp::toOpcodeName(Tftp::opcodeOf(packet));

        if (const auto encode_status = Tftp::serializePacket(m_out_buffer, packet); encode_status != Tftp::EncodeStatus::ok) {
            m_state = fail(TransferStatus::invalid_request, "cannot encode " + std::string {op_name} + ": " + std::string {Tftp::toEncodeMsg(encode_status)});
            return false;
        }

        const auto target = m_peer.value_or(m_server);

        if (const auto io_info = m_transport->sendTo(m_out_buffer, target); io_info.status != NetSock::IOStatus::ok) {
            m_state = fail(TransferStatus::transport_error, "cannot send " + std::string {op_name} + " to " + target.toString() + ": " + NetSock::describeIO(io_info));
            return false;
        }

        return true;
    }

    void MyClient::repeatAck() {
        if (sendPacket(Tftp::AckPayload {m_block})) {
            m_logger.logMessage<Meta::LogLevel::debug>("repeated ack ", m_block, " to ", m_peer.value_or(m_server).toString());
        }
    }

    void MyClient::notifyPeer(const Tftp::ErrorPayload& err) {
        if (Tftp::serializePacket(m_out_buffer, err) != Tftp::EncodeStatus::ok) {
            return;
        }

        const auto target = m_peer.value_or(m_server);

        if (const auto io_info = m_transport->sendTo(m_out_buffer, target); io_info.status != NetSock::IOStatus::ok) {
            m_logger.logMessage<Meta::LogLevel::warning>("could not tell ", target.toString(), " about the failure: ", NetSock::describeIO(io_info));
        }
    }

    void MyClient::stateSendRequest(const std::string& filename) {
        m_logger.logMessage<Meta::LogLevel::info>("requesting '", filename, "' from ", m_server.toString());

        /// NOTE: the request goes out once; later timeouts only widen the wait or repeat the last Ack.
        if (not sendPacket(Tftp::RrqPayload {filename, Tftp::octet_mode_name})) {
            return;
        }

        m_state = transition(ClientState::awaiting_data);
    }

    void MyClient::stateAwaitData(std::ostream& sink) {
        const auto io_info = m_transport->receiveFrom(m_in_buffer, m_config.timeout);

        if (io_info.status == NetSock::IOStatus::timed_out) {
            m_state = spendAttempt("timed out waiting for block " + std::to_string(Tftp::advanceBlock(m_block)));

            /// NOTE: the last Ack may have been lost while the server still waits on it.
            if (m_state == ClientState::awaiting_data and m_result.blocks != 0UL) {
                repeatAck();
            }

            return;
        }

        if (io_info.status != NetSock::IOStatus::ok) {
            m_state = fail(TransferStatus::transport_error, "receive failed: " + NetSock::describeIO(io_info));
            return;
        }

        if (m_peer.has_value() and io_info.peer != *m_peer) {
            m_state = spendAttempt("datagram from unexpected source " + io_info.peer.toString());
            return;
        }

        auto [packet, status] = Tftp::parsePacket(m_in_buffer);

        if (status != Tftp::DecodeStatus::ok) {
            m_logger.logMessage<Meta::LogLevel::warning>("undecodable reply from ", io_info.peer.toString(), ": ", Tftp::toDecodeMsg(status));
            m_state = spendAttempt("undecodable reply");
            return;
        }

        if (const auto* err = std::get_if<Tftp::ErrorPayload>(&packet); err != nullptr) {
            m_state = fail(TransferStatus::peer_error, "server error (" + std::string {Tftp::toErrorMsg(err->code)} + "): " + err->message);
            return;
        }

        if (const auto* data = std::get_if<Tftp::DataPayload>(&packet); data != nullptr) {
            if (data->block == Tftp::advanceBlock(m_block)) {
                if (not m_peer.has_value()) {
                    m_peer = io_info.peer;
                }

                acceptData(*data, sink);
                return;
            }

            if (m_result.blocks != 0UL and data->block == m_block) {
                m_state = spendAttempt("duplicate block " + std::to_string(m_block));

                if (m_state == ClientState::awaiting_data) {
                    repeatAck();
                }

                return;
            }
        }

        m_state = spendAttempt("unexpected " + std::string {Tftp::toOpcodeName(Tftp::opcodeOf(packet))} + " while waiting for block " + std::to_string(Tftp::advanceBlock(m_block)));
    }

    void MyClient::acceptData(const Tftp::DataPayload& data, std::ostream& sink) {
        const auto data_length = data.data.length();

        sink.write(reinterpret_cast<const char*>(data.data.data()), static_cast<std::streamsize>(data_length));

        if (not sink) {
            notifyPeer({Tftp::ErrorCode::disk_full, "client could not store block " + std::to_string(data.block)});
            m_state = fail(TransferStatus::sink_error, "output sink rejected block " + std::to_string(data.block));
            return;
        }

        m_block = data.block;
        m_attempts_left = m_config.retries;
        m_last_block_seen = Tftp::isShortBlock(data_length);
        m_result.bytes_written += data_length;
        ++m_result.blocks;

        m_state = transition(ClientState::sending_ack);
    }

    void MyClient::stateSendAck() {
        if (not sendPacket(Tftp::AckPayload {m_block})) {
            return;
        }

        /// NOTE: a short block ends the transfer right after its Ack, nothing more is awaited.
        m_state = transition(m_last_block_seen ? ClientState::completed : ClientState::awaiting_data);
    }

    MyClient::MyClient(std::unique_ptr<NetSock::DatagramTransport> transport, const NetSock::Endpoint& server, ClientConfig config, Meta::Logger logger)
    : m_transport {std::move(transport)}, m_server {server}, m_config {normalizeConfig(std::move(config))}, m_logger {logger}, m_in_buffer {}, m_out_buffer {}, m_state {ClientState::sending_request}, m_peer {}, m_block {0}, m_attempts_left {0U}, m_last_block_seen {false}, m_result {TransferStatus::ok, {}, 0UL, 0UL} {}

    TransferResult MyClient::send(const std::string& filename, std::ostream& sink) {
        m_state = transition(ClientState::sending_request);
        m_peer.reset();
        m_block = 0;
        m_attempts_left = m_config.retries;
        m_last_block_seen = false;
        m_result = {TransferStatus::ok, {}, 0UL, 0UL};

        if (m_transport == nullptr) {
            return {TransferStatus::transport_error, "no transport to send on", 0UL, 0UL};
        }

        while (m_state != ClientState::completed and m_state != ClientState::failed) {
            if (m_state == ClientState::sending_request) {
                stateSendRequest(filename);
            } else if (m_state == ClientState::awaiting_data) {
                stateAwaitData(sink);
            } else if (m_state == ClientState::sending_ack) {
                stateSendAck();
            }
        }

        if (m_state == ClientState::completed) {
            m_logger.logMessage<Meta::LogLevel::info>("received ", m_result.bytes_written, " bytes in ", m_result.blocks, " blocks from ", m_peer.value_or(m_server).toString());
        } else {
            m_logger.logMessage<Meta::LogLevel::error>("transfer of '", filename, "' failed (", toStatusName(m_result.status), "): ", m_result.detail);
        }

        return m_result;
    }
}
