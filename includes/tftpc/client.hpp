#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include "meta/logging.hpp"
#include "netsock/buffers.hpp"
#include "netsock/sockets.hpp"
#include "tftp/types.hpp"

namespace MiniTftp::Tftpc {
    struct ClientConfig {
        std::string local_address {"127.0.0.1:0"};
        unsigned int retries {10U};
        std::chrono::milliseconds timeout {6000};
    };

    enum class ClientState {
        sending_request,
        awaiting_data,
        sending_ack,
        completed,
        failed
    };

    enum class TransferStatus {
        ok,
        invalid_request,
        transport_error,
        retries_exhausted,
        peer_error,
        sink_error,
        last = sink_error
    };

    [[nodiscard]] std::string_view toStatusName(TransferStatus status) noexcept;

    struct TransferResult {
        TransferStatus status;
        std::string detail;
        std::size_t bytes_written;
        std::size_t blocks;
    };

    /**
     * @brief Client half of a read transfer: one RRQ, then Data/Ack lockstep into the sink until a short block arrives.
     * @note Each failed receive attempt (timeout, undecodable or unexpected datagram) spends one retry; a new in-order block refills the budget.
     */
    class MyClient {
    private:
        std::unique_ptr<NetSock::DatagramTransport> m_transport;
        NetSock::Endpoint m_server;
        ClientConfig m_config;
        Meta::Logger m_logger;
        NetSock::Datagram m_in_buffer;
        NetSock::Datagram m_out_buffer;

        /// NOTE: per-transfer state, reset by every `send`.
        ClientState m_state;
        std::optional<NetSock::Endpoint> m_peer;
        Tftp::tftp_u16 m_block;
        unsigned int m_attempts_left;
        bool m_last_block_seen;
        TransferResult m_result;

        [[nodiscard]] ClientState transition(ClientState next) noexcept;
        [[nodiscard]] ClientState fail(TransferStatus status, std::string detail);
        [[nodiscard]] ClientState spendAttempt(std::string_view reason);
        [[nodiscard]] bool sendPacket(const Tftp::Packet& packet);

        void stateSendRequest(const std::string& filename);
        void stateAwaitData(std::ostream& sink);
        void stateSendAck();
        void repeatAck();

        void acceptData(const Tftp::DataPayload& data, std::ostream& sink);
        void notifyPeer(const Tftp::ErrorPayload& err);

    public:
        MyClient() = delete;
        MyClient(std::unique_ptr<NetSock::DatagramTransport> transport, const NetSock::Endpoint& server, ClientConfig config, Meta::Logger logger = {});

        /// @brief Fetches `filename` from the server into `sink`. Never throws for protocol or network failures, those land in the result.
        [[nodiscard]] TransferResult send(const std::string& filename, std::ostream& sink);
    };
}
