#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "meta/logging.hpp"
#include "netsock/buffers.hpp"
#include "netsock/sockets.hpp"
#include "tftp/types.hpp"
#include "tftpd/session.hpp"

namespace MiniTftp::Tftpd {
    struct ServerConfig {
        std::string listen_address {"127.0.0.1:69"};
        unsigned int retries {Constants::default_retries};
        std::chrono::milliseconds timeout {6000};
        /// NOTE: upper bound on how long a stop request can go unnoticed by the dispatch loop.
        std::chrono::milliseconds poll_interval {200};
    };

    enum class ServeStatus {
        stopped,
        setup_failed,
        transport_failed
    };

    /**
     * @brief Runs one ServerSession on its own thread. The dispatch loop posts packets in; replies go straight out through the shared transport.
     */
    class SessionWorker {
    private:
        NetSock::DatagramTransport& m_transport;
        NetSock::Endpoint m_peer;
        ServerSession m_session;
        std::chrono::milliseconds m_timeout;
        Meta::Logger m_logger;
        NetSock::Datagram m_out_buffer;

        std::mutex m_inbox_mtx;
        std::condition_variable m_inbox_cv;
        std::deque<Tftp::Packet> m_inbox;
        bool m_stop_requested;
        /// NOTE: set in the same critical section that ends the session, so `post` never queues into an inbox nobody reads.
        bool m_closed;
        std::atomic<bool> m_finished;

        /// NOTE: declared last so every member above exists before the thread starts using them.
        std::thread m_thread;

        [[nodiscard]] bool sendReply(const Tftp::Packet& reply);
        void reportOutcome();
        void run(Tftp::Packet request);

    public:
        SessionWorker() = delete;
        SessionWorker(NetSock::DatagramTransport& transport, const NetSock::Endpoint& peer, std::u8string_view payload, const ServerConfig& config, Meta::Logger logger, Tftp::Packet request);
        ~SessionWorker();

        SessionWorker(const SessionWorker& other) = delete;
        SessionWorker& operator=(const SessionWorker& other) = delete;

        /// @brief Queues a packet for the session. Returns false once the session has ended and takes no more input.
        [[nodiscard]] bool post(const Tftp::Packet& packet);

        /// @brief Hands back packets that were queued but never consumed. Only meaningful once `post` has refused or the worker finished.
        [[nodiscard]] std::deque<Tftp::Packet> takeUnread();

        void requestStop();
        [[nodiscard]] bool isFinished() const noexcept;
    };

    class MyServer {
    private:
        using SessionMap = std::map<NetSock::Endpoint, std::unique_ptr<SessionWorker>>;

        std::unique_ptr<NetSock::DatagramTransport> m_transport;
        const std::u8string m_payload;
        ServerConfig m_config;
        Meta::Logger m_logger;
        NetSock::Datagram m_in_buffer;
        SessionMap m_sessions;
        std::atomic_flag m_halt;

        void reapFinished();
        void stopAll();
        SessionMap::iterator retire(SessionMap::iterator session_it);
        void route(const NetSock::Endpoint& peer, Tftp::Packet packet);
        void dispatch(const NetSock::Endpoint& peer);

    public:
        MyServer() = delete;
        MyServer(std::unique_ptr<NetSock::DatagramTransport> transport, std::u8string payload, ServerConfig config, Meta::Logger logger = {});
        ~MyServer();

        MyServer(const MyServer& other) = delete;
        MyServer& operator=(const MyServer& other) = delete;

        /// @brief Serves read requests until `requestStop` is called or the socket fails. Every session thread is joined before returning.
        [[nodiscard]] ServeStatus runService();

        /// @note Only sets a lock-free flag, so it is safe from a signal handler.
        void requestStop() noexcept;
    };
}
