#include <optional>
#include <utility>
#include <variant>
#include "tftp/messaging.hpp"
#include "tftpd/driver.hpp"

namespace MiniTftp::Tftpd {
    static constexpr std::chrono::milliseconds default_timeout {6000};

    /// NOTE: zero means "unset" for both knobs, matching what an empty command line leaves behind.
    [[nodiscard]] static ServerConfig normalizeConfig(ServerConfig config) noexcept {
        if (config.retries == 0U) {
            config.retries = Constants::default_retries;
        }

        if (config.timeout <= std::chrono::milliseconds::zero()) {
            config.timeout = default_timeout;
        }

        return config;
    }

    SessionWorker::SessionWorker(NetSock::DatagramTransport& transport, const NetSock::Endpoint& peer, std::u8string_view payload, const ServerConfig& config, Meta::Logger logger, Tftp::Packet request)
    : m_transport {transport}, m_peer {peer}, m_session {payload, config.retries}, m_timeout {config.timeout}, m_logger {logger}, m_out_buffer {}, m_inbox_mtx {}, m_inbox_cv {}, m_inbox {}, m_stop_requested {false}, m_closed {false}, m_finished {false}, m_thread {&SessionWorker::run, this, std::move(request)} {}

    SessionWorker::~SessionWorker() {
        requestStop();

        if (m_thread.joinable()) {
            m_thread.join();
        }
    }

    bool SessionWorker::post(const Tftp::Packet& packet) {
        {
            std::lock_guard lock {m_inbox_mtx};

            if (m_closed) {
                return false;
            }

            m_inbox.push_back(packet);
        }

        m_inbox_cv.notify_one();

        return true;
    }

    std::deque<Tftp::Packet> SessionWorker::takeUnread() {
        std::lock_guard lock {m_inbox_mtx};
        return std::exchange(m_inbox, {});
    }

    void SessionWorker::requestStop() {
        {
            std::lock_guard lock {m_inbox_mtx};
            m_stop_requested = true;
        }

        m_inbox_cv.notify_one();
    }

    bool SessionWorker::isFinished() const noexcept {
        return m_finished.load();
    }

    bool SessionWorker::sendReply(const Tftp::Packet& reply) {
        if (const auto encode_status = Tftp::serializePacket(m_out_buffer, reply); encode_status != Tftp::EncodeStatus::ok) {
            m_logger.logMessage<Meta::LogLevel::error>("cannot encode reply for ", m_peer.toString(), ": ", Tftp::toEncodeMsg(encode_status));
            return false;
        }

        if (const auto io_info = m_transport.sendTo(m_out_buffer, m_peer); io_info.status != NetSock::IOStatus::ok) {
            m_logger.logMessage<Meta::LogLevel::error>("cannot send to ", m_peer.toString(), ": ", NetSock::describeIO(io_info));
            return false;
        }

        return true;
    }

    void SessionWorker::reportOutcome() {
        const auto state = m_session.getState();

        if (state == SessionState::completed) {
            m_logger.logMessage<Meta::LogLevel::info>("transfer to ", m_peer.toString(), " complete: ", m_session.getBytesAcked(), " bytes, last block ", m_session.getBlock());
        } else if (state == SessionState::unconfirmed) {
            m_logger.logMessage<Meta::LogLevel::info>("transfer to ", m_peer.toString(), " sent in full, final block ", m_session.getBlock(), " was never acknowledged");
        } else if (state == SessionState::failed) {
            m_logger.logMessage<Meta::LogLevel::error>("transfer to ", m_peer.toString(), " failed: ", m_session.getFailure());
        } else {
            m_logger.logMessage<Meta::LogLevel::info>("transfer to ", m_peer.toString(), " abandoned in state ", toStateName(state), " at block ", m_session.getBlock());
        }
    }

    void SessionWorker::run(Tftp::Packet request) {
        using Clock = std::chrono::steady_clock;

        std::optional<Tftp::Packet> first_reply;

        {
            std::lock_guard lock {m_inbox_mtx};
            first_reply = m_session.onPacket(request);
        }

        auto transport_ok = not first_reply.has_value() or sendReply(*first_reply);
        auto deadline = Clock::now() + m_timeout;

        while (transport_ok) {
            std::unique_lock lock {m_inbox_mtx};

            const auto has_work = m_inbox_cv.wait_until(lock, deadline, [this] {
                return m_stop_requested or not m_inbox.empty();
            });

            if (m_stop_requested) {
                break;
            }

            std::optional<Tftp::Packet> reply;
            auto ignored_op = Tftp::Opcode::none;

            if (has_work) {
                auto packet = std::move(m_inbox.front());
                m_inbox.pop_front();

                reply = m_session.onPacket(packet);

                if (not reply.has_value()) {
                    ignored_op = Tftp::opcodeOf(packet);
                }
            } else {
                reply = m_session.onTimeout();
            }

            const auto session_done = m_session.isDone();
            m_closed = session_done;
            lock.unlock();

            if (not has_work and reply.has_value()) {
                m_logger.logMessage<Meta::LogLevel::debug>("no ack from ", m_peer.toString(), ", resending block ", m_session.getBlock());
            } else if (ignored_op != Tftp::Opcode::none and not session_done) {
                m_logger.logMessage<Meta::LogLevel::debug>("ignoring ", Tftp::toOpcodeName(ignored_op), " from ", m_peer.toString(), " while expecting ack ", m_session.getBlock());
            }

            if (reply.has_value()) {
                transport_ok = sendReply(*reply);
                deadline = Clock::now() + m_timeout;
            }

            if (session_done) {
                break;
            }
        }

        {
            std::lock_guard lock {m_inbox_mtx};
            m_closed = true;
        }

        reportOutcome();
        m_finished.store(true);
    }

    MyServer::MyServer(std::unique_ptr<NetSock::DatagramTransport> transport, std::u8string payload, ServerConfig config, Meta::Logger logger)
    : m_transport {std::move(transport)}, m_payload {std::move(payload)}, m_config {normalizeConfig(std::move(config))}, m_logger {logger}, m_in_buffer {}, m_sessions {}, m_halt {} {}

    MyServer::~MyServer() {
        stopAll();
    }

    void MyServer::reapFinished() {
        for (auto session_it = m_sessions.begin(); session_it != m_sessions.end();) {
            if (session_it->second->isFinished()) {
                session_it = retire(session_it);
            } else {
                ++session_it;
            }
        }
    }

    void MyServer::stopAll() {
        for (auto& [peer, worker] : m_sessions) {
            worker->requestStop();
        }

        m_sessions.clear();
    }

    MyServer::SessionMap::iterator MyServer::retire(SessionMap::iterator session_it) {
        const auto peer = session_it->first;
        auto unread = session_it->second->takeUnread();
        auto next_it = m_sessions.erase(session_it);

        /// NOTE: a client reusing its port can queue a fresh RRQ right behind its final Ack, before the old session closed.
        for (auto& packet : unread) {
            route(peer, std::move(packet));
        }

        return next_it;
    }

    void MyServer::route(const NetSock::Endpoint& peer, Tftp::Packet packet) {
        if (auto session_it = m_sessions.find(peer); session_it != m_sessions.end()) {
            if (session_it->second->post(packet)) {
                return;
            }

            retire(session_it);
            route(peer, std::move(packet));
            return;
        }

        if (const auto* rrq = std::get_if<Tftp::RrqPayload>(&packet); rrq != nullptr) {
            /// NOTE: the filename only gets logged, every request is answered with the one loaded payload.
            m_logger.logMessage<Meta::LogLevel::info>("read request for '", rrq->filename, "' from ", peer.toString());

            m_sessions.emplace(peer, std::make_unique<SessionWorker>(*m_transport, peer, m_payload, m_config, m_logger, std::move(packet)));
            return;
        }

        m_logger.logMessage<Meta::LogLevel::debug>("ignoring ", Tftp::toOpcodeName(Tftp::opcodeOf(packet)), " from ", peer.toString(), " with no transfer in progress");
    }

    void MyServer::dispatch(const NetSock::Endpoint& peer) {
        auto [packet, status] = Tftp::parsePacket(m_in_buffer);

        if (status != Tftp::DecodeStatus::ok) {
            if (Tftp::isValidationFailure(status)) {
                m_logger.logMessage<Meta::LogLevel::warning>("rejected request from ", peer.toString(), ": ", Tftp::toDecodeMsg(status));
            } else {
                m_logger.logMessage<Meta::LogLevel::warning>("bad packet from ", peer.toString(), ": ", Tftp::toDecodeMsg(status));
            }

            return;
        }

        route(peer, std::move(packet));
    }

    ServeStatus MyServer::runService() {
        if (m_transport == nullptr) {
            m_logger.logMessage<Meta::LogLevel::error>("no transport to serve on");
            return ServeStatus::setup_failed;
        }

        m_logger.logMessage<Meta::LogLevel::info>("serving ", m_payload.length(), " bytes on ", m_config.listen_address, " (retries ", m_config.retries, ", timeout ", m_config.timeout.count(), " ms)");

        while (not m_halt.test()) {
            reapFinished();

            const auto io_info = m_transport->receiveFrom(m_in_buffer, m_config.poll_interval);

            if (io_info.status == NetSock::IOStatus::timed_out) {
                continue;
            }

            if (io_info.status != NetSock::IOStatus::ok) {
                m_logger.logMessage<Meta::LogLevel::error>("socket read failed: ", NetSock::describeIO(io_info));
                stopAll();
                return ServeStatus::transport_failed;
            }

            dispatch(io_info.peer);
        }

        stopAll();
        m_logger.logMessage<Meta::LogLevel::info>("server stopped");

        return ServeStatus::stopped;
    }

    void MyServer::requestStop() noexcept {
        m_halt.test_and_set();
    }
}
