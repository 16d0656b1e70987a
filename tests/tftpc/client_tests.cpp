#include <chrono>
#include <deque>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "netsock/buffers.hpp"
#include "netsock/sockets.hpp"
#include "tftp/messaging.hpp"
#include "tftpc/client.hpp"
#include "tftpd/session.hpp"

namespace {
    using namespace MiniTftp;

    bool Expect(bool condition, const char* message) {
        if (not condition) {
            std::cerr << "[FAIL] " << message << '\n';
            return false;
        }

        return true;
    }

    constexpr NetSock::Endpoint server_endpoint {0x7f000001U, 6969};
    constexpr NetSock::Endpoint stranger_endpoint {0x7f000001U, 7070};

    /**
     * @brief In-memory transport: records every packet the client sends and hands back queued datagrams, timing out when none are left.
     */
    class FakeTransport final : public NetSock::DatagramTransport {
    public:
        using SendHook = std::function<void(FakeTransport&, const Tftp::Packet&)>;

        std::deque<std::pair<NetSock::Endpoint, NetSock::Datagram>> m_inbound;
        std::vector<Tftp::Packet> m_sent;
        std::vector<Tftp::Packet> m_delivered;
        std::vector<NetSock::Endpoint> m_targets;
        SendHook m_on_send;

        void queue(const NetSock::Endpoint& from, const Tftp::Packet& packet) {
            NetSock::Datagram temp;

            if (Tftp::serializePacket(temp, packet) == Tftp::EncodeStatus::ok) {
                m_inbound.emplace_back(from, temp);
            }
        }

        void queueRaw(const NetSock::Endpoint& from, std::initializer_list<unsigned char> octets) {
            NetSock::Datagram temp;
            const std::vector<unsigned char> bytes {octets};

            static_cast<void>(temp.assign(std::span<const unsigned char> {bytes}));
            m_inbound.emplace_back(from, temp);
        }

        [[nodiscard]] NetSock::IOResult receiveFrom(NetSock::Datagram& buffer, [[maybe_unused]] std::optional<std::chrono::milliseconds> timeout) override {
            if (m_inbound.empty()) {
                return {{}, NetSock::IOStatus::timed_out};
            }

            auto [from, datagram] = std::move(m_inbound.front());
            m_inbound.pop_front();

            if (const auto [packet, status] = Tftp::parsePacket(datagram); status == Tftp::DecodeStatus::ok) {
                m_delivered.push_back(packet);
            }

            buffer = datagram;

            return {from, NetSock::IOStatus::ok};
        }

        [[nodiscard]] NetSock::IOResult sendTo(const NetSock::Datagram& buffer, const NetSock::Endpoint& peer) override {
            auto [packet, status] = Tftp::parsePacket(buffer);

            if (status != Tftp::DecodeStatus::ok) {
                return {peer, NetSock::IOStatus::invalid_args};
            }

            m_sent.push_back(packet);
            m_targets.push_back(peer);

            if (m_on_send) {
                m_on_send(*this, packet);
            }

            return {peer, NetSock::IOStatus::ok};
        }
    };

    /// @brief Answers client packets with a real server session, optionally losing some of the client's packets first.
    FakeTransport::SendHook serveWith(Tftpd::ServerSession& session, std::function<bool(const Tftp::Packet&)> lose = {}) {
        return [&session, lose = std::move(lose)](FakeTransport& transport, const Tftp::Packet& packet) {
            if (lose and lose(packet)) {
                return;
            }

            if (const auto reply = session.onPacket(packet); reply.has_value()) {
                transport.queue(server_endpoint, *reply);
            }
        };
    }

    Tftpc::ClientConfig quickConfig(unsigned int retries) {
        return {"127.0.0.1:0", retries, std::chrono::milliseconds {5}};
    }

    std::u8string asOctets(const std::string& text) {
        return {text.begin(), text.end()};
    }

    bool isAck(const Tftp::Packet& packet, Tftp::tftp_u16 block) {
        return packet == Tftp::Packet {Tftp::AckPayload {block}};
    }

    bool isRrq(const Tftp::Packet& packet, const std::string& filename) {
        const auto* rrq = std::get_if<Tftp::RrqPayload>(&packet);
        return rrq != nullptr and rrq->filename == filename and rrq->mode == Tftp::octet_mode_name;
    }

    bool testTwoBlockTrace() {
        bool passed = true;
        const std::u8string payload(1000, u8'A');
        Tftpd::ServerSession session {payload, 3};

        auto transport = std::make_unique<FakeTransport>();
        auto* fake = transport.get();
        fake->m_on_send = serveWith(session);

        Tftpc::MyClient client {std::move(transport), server_endpoint, quickConfig(3)};
        std::ostringstream sink;
        const auto result = client.send("a.bin", sink);

        passed &= Expect(result.status == Tftpc::TransferStatus::ok, "A 1000 byte transfer should succeed.");
        passed &= Expect(result.bytes_written == 1000UL and result.blocks == 2UL, "The result should count 1000 bytes in 2 blocks.");
        passed &= Expect(asOctets(sink.str()) == payload, "The sink should receive the payload exactly.");
        passed &= Expect(fake->m_sent.size() == 3UL, "The client should send RRQ, Ack 1 and Ack 2 only.");
        passed &= Expect(fake->m_sent.size() == 3UL and isRrq(fake->m_sent[0], "a.bin") and isAck(fake->m_sent[1], 1) and isAck(fake->m_sent[2], 2), "The client trace should be RRQ, Ack 1, Ack 2.");
        passed &= Expect(fake->m_delivered.size() == 2UL, "The server should send exactly two Data packets.");
        passed &= Expect(session.getState() == Tftpd::SessionState::completed, "The server side should complete too.");

        return passed;
    }

    bool testExactMultipleTrace() {
        bool passed = true;
        const std::u8string payload(512, u8'B');
        Tftpd::ServerSession session {payload, 3};

        auto transport = std::make_unique<FakeTransport>();
        auto* fake = transport.get();
        fake->m_on_send = serveWith(session);

        Tftpc::MyClient client {std::move(transport), server_endpoint, quickConfig(3)};
        std::ostringstream sink;
        const auto result = client.send("b.bin", sink);

        passed &= Expect(result.status == Tftpc::TransferStatus::ok, "A 512 byte transfer should succeed.");
        passed &= Expect(result.blocks == 2UL and result.bytes_written == 512UL, "A 512 byte transfer should end with an empty second block.");
        passed &= Expect(fake->m_sent.size() == 3UL and isAck(fake->m_sent[2], 2), "The empty block should be acknowledged.");
        passed &= Expect(fake->m_delivered.size() == 2UL and fake->m_delivered[1] == Tftp::Packet {Tftp::DataPayload {2, u8""}}, "The second Data should be empty.");

        return passed;
    }

    bool testSilentServerExhaustsRetries() {
        bool passed = true;
        auto transport = std::make_unique<FakeTransport>();
        auto* fake = transport.get();

        Tftpc::MyClient client {std::move(transport), server_endpoint, quickConfig(4)};
        std::ostringstream sink;
        const auto result = client.send("c.bin", sink);

        passed &= Expect(result.status == Tftpc::TransferStatus::retries_exhausted, "A silent server should exhaust the retries.");
        passed &= Expect(result.detail.find("exhausted retries") != std::string::npos, "The detail should name the retry exhaustion.");
        passed &= Expect(fake->m_sent.size() == 1UL, "The request should be sent once and never repeated.");
        passed &= Expect(sink.str().empty(), "Nothing should reach the sink.");

        return passed;
    }

    bool testPeerErrorSurfaces() {
        bool passed = true;
        auto transport = std::make_unique<FakeTransport>();
        auto* fake = transport.get();

        fake->m_on_send = [](FakeTransport& self, const Tftp::Packet& packet) {
            if (std::holds_alternative<Tftp::RrqPayload>(packet)) {
                self.queue(server_endpoint, Tftp::ErrorPayload {Tftp::ErrorCode::not_found, "no such file"});
            }
        };

        Tftpc::MyClient client {std::move(transport), server_endpoint, quickConfig(3)};
        std::ostringstream sink;
        const auto result = client.send("d.bin", sink);

        passed &= Expect(result.status == Tftpc::TransferStatus::peer_error, "A server Err should end the transfer as a peer error.");
        passed &= Expect(result.detail.find("no such file") != std::string::npos, "The detail should carry the server's message.");
        passed &= Expect(result.detail.find("File not found") != std::string::npos, "The detail should carry the error code's text.");

        return passed;
    }

    bool testGarbageSpendsAttempts() {
        bool passed = true;

        {
            const std::u8string payload(10, u8'G');
            Tftpd::ServerSession session {payload, 3};
            auto transport = std::make_unique<FakeTransport>();
            auto* fake = transport.get();

            fake->m_on_send = [&session](FakeTransport& self, const Tftp::Packet& packet) {
                if (std::holds_alternative<Tftp::RrqPayload>(packet)) {
                    self.queueRaw(server_endpoint, {0x00, 0x09, 0x00, 0x00});
                    self.queueRaw(server_endpoint, {0x00});
                }

                if (const auto reply = session.onPacket(packet); reply.has_value()) {
                    self.queue(server_endpoint, *reply);
                }
            };

            Tftpc::MyClient client {std::move(transport), server_endpoint, quickConfig(3)};
            std::ostringstream sink;
            const auto result = client.send("g.bin", sink);

            passed &= Expect(result.status == Tftpc::TransferStatus::ok, "Garbage within the attempt budget should not stop the transfer.");
            passed &= Expect(asOctets(sink.str()) == payload, "The payload should arrive intact after garbage.");
        }

        {
            auto transport = std::make_unique<FakeTransport>();
            auto* fake = transport.get();

            fake->m_on_send = [](FakeTransport& self, const Tftp::Packet& packet) {
                if (std::holds_alternative<Tftp::RrqPayload>(packet)) {
                    self.queueRaw(server_endpoint, {0x00, 0x09, 0x00, 0x00});
                    self.queueRaw(server_endpoint, {0x00, 0x04, 0x00, 0x01});
                    self.queue(server_endpoint, Tftp::DataPayload {1, u8"late"});
                }
            };

            Tftpc::MyClient client {std::move(transport), server_endpoint, quickConfig(2)};
            std::ostringstream sink;
            const auto result = client.send("h.bin", sink);

            passed &= Expect(result.status == Tftpc::TransferStatus::retries_exhausted, "Garbage beyond the attempt budget should exhaust the retries.");
            passed &= Expect(sink.str().empty(), "Data behind the exhausted budget should never be written.");
        }

        return passed;
    }

    bool testDuplicateDataIsReacknowledged() {
        bool passed = true;
        auto transport = std::make_unique<FakeTransport>();
        auto* fake = transport.get();

        const std::u8string first_block(512, u8'D');

        fake->m_on_send = [&first_block](FakeTransport& self, const Tftp::Packet& packet) {
            if (std::holds_alternative<Tftp::RrqPayload>(packet)) {
                self.queue(server_endpoint, Tftp::DataPayload {1, first_block});
                self.queue(server_endpoint, Tftp::DataPayload {1, first_block});
                self.queue(server_endpoint, Tftp::DataPayload {2, u8"end"});
            }
        };

        Tftpc::MyClient client {std::move(transport), server_endpoint, quickConfig(3)};
        std::ostringstream sink;
        const auto result = client.send("dup.bin", sink);

        passed &= Expect(result.status == Tftpc::TransferStatus::ok, "A duplicated block should not break the transfer.");
        passed &= Expect(result.bytes_written == 515UL, "A duplicated block should be written once.");
        passed &= Expect(fake->m_sent.size() == 4UL and isAck(fake->m_sent[1], 1) and isAck(fake->m_sent[2], 1) and isAck(fake->m_sent[3], 2), "The duplicate should be acknowledged again.");

        return passed;
    }

    bool testLostAckIsRepeatedOnTimeout() {
        bool passed = true;
        const std::u8string payload(700, u8'L');
        Tftpd::ServerSession session {payload, 3};
        auto transport = std::make_unique<FakeTransport>();
        auto* fake = transport.get();

        bool lost_once = false;
        fake->m_on_send = serveWith(session, [&lost_once](const Tftp::Packet& packet) {
            if (not lost_once and isAck(packet, 1)) {
                lost_once = true;
                return true;
            }

            return false;
        });

        Tftpc::MyClient client {std::move(transport), server_endpoint, quickConfig(3)};
        std::ostringstream sink;
        const auto result = client.send("lost.bin", sink);

        passed &= Expect(result.status == Tftpc::TransferStatus::ok, "A lost ack should be recovered.");
        passed &= Expect(asOctets(sink.str()) == payload, "The payload should arrive intact after a lost ack.");
        passed &= Expect(fake->m_sent.size() == 4UL and isAck(fake->m_sent[1], 1) and isAck(fake->m_sent[2], 1) and isAck(fake->m_sent[3], 2), "The timed out ack should be sent again.");

        return passed;
    }

    bool testPeerLocksToFirstDataSource() {
        bool passed = true;
        auto transport = std::make_unique<FakeTransport>();
        auto* fake = transport.get();

        fake->m_on_send = [](FakeTransport& self, const Tftp::Packet& packet) {
            if (std::holds_alternative<Tftp::RrqPayload>(packet)) {
                self.queue(stranger_endpoint, Tftp::DataPayload {1, std::u8string(512, u8'T')});
            } else if (isAck(packet, 1)) {
                self.queue(server_endpoint, Tftp::DataPayload {2, u8"bogus"});
                self.queue(stranger_endpoint, Tftp::DataPayload {2, u8"ok"});
            }
        };

        Tftpc::MyClient client {std::move(transport), server_endpoint, quickConfig(3)};
        std::ostringstream sink;
        const auto result = client.send("tid.bin", sink);

        passed &= Expect(result.status == Tftpc::TransferStatus::ok, "A transfer from a new server port should succeed.");
        passed &= Expect(result.bytes_written == 514UL, "Data from anywhere but the locked peer should be dropped.");
        passed &= Expect(fake->m_targets.size() == 3UL and fake->m_targets[0] == server_endpoint and fake->m_targets[2] == stranger_endpoint, "Acks should go to the peer that sent the first block.");

        return passed;
    }

    bool testSinkFailureNotifiesServer() {
        bool passed = true;
        const std::u8string payload(100, u8'S');
        Tftpd::ServerSession session {payload, 3};
        auto transport = std::make_unique<FakeTransport>();
        auto* fake = transport.get();
        fake->m_on_send = serveWith(session);

        Tftpc::MyClient client {std::move(transport), server_endpoint, quickConfig(3)};
        std::ostringstream sink;
        sink.setstate(std::ios::badbit);

        const auto result = client.send("s.bin", sink);
        const auto* last_sent = fake->m_sent.empty() ? nullptr : std::get_if<Tftp::ErrorPayload>(&fake->m_sent.back());

        passed &= Expect(result.status == Tftpc::TransferStatus::sink_error, "A broken sink should fail the transfer.");
        passed &= Expect(last_sent != nullptr and last_sent->code == Tftp::ErrorCode::disk_full, "The server should be told the client cannot store data.");
        passed &= Expect(session.getState() == Tftpd::SessionState::failed, "The server session should fail on the client's error.");

        return passed;
    }

    bool testInvalidRequests() {
        bool passed = true;

        {
            auto transport = std::make_unique<FakeTransport>();
            auto* fake = transport.get();

            Tftpc::MyClient client {std::move(transport), server_endpoint, quickConfig(3)};
            std::ostringstream sink;
            const auto result = client.send("", sink);

            passed &= Expect(result.status == Tftpc::TransferStatus::invalid_request, "An empty filename should not be requested.");
            passed &= Expect(fake->m_sent.empty(), "Nothing should be sent for an invalid request.");
        }

        {
            Tftpc::MyClient client {nullptr, server_endpoint, quickConfig(3)};
            std::ostringstream sink;

            passed &= Expect(client.send("x", sink).status == Tftpc::TransferStatus::transport_error, "A client without a transport should report a transport error.");
        }

        return passed;
    }

    bool testClientIsReusable() {
        bool passed = true;
        const std::u8string payload(30, u8'R');
        std::optional<Tftpd::ServerSession> session;

        auto transport = std::make_unique<FakeTransport>();
        auto* fake = transport.get();
        fake->m_on_send = [&session, &payload](FakeTransport& self, const Tftp::Packet& packet) {
            if (std::holds_alternative<Tftp::RrqPayload>(packet)) {
                session.emplace(payload, 3);
            }

            if (const auto reply = session->onPacket(packet); reply.has_value()) {
                self.queue(server_endpoint, *reply);
            }
        };

        Tftpc::MyClient client {std::move(transport), server_endpoint, quickConfig(3)};
        std::ostringstream first_sink;
        std::ostringstream second_sink;

        passed &= Expect(client.send("one", first_sink).status == Tftpc::TransferStatus::ok, "The first transfer should succeed.");
        passed &= Expect(client.send("two", second_sink).status == Tftpc::TransferStatus::ok, "A second transfer on the same client should succeed.");
        passed &= Expect(asOctets(second_sink.str()) == payload, "The second transfer should start from block 1 again.");

        return passed;
    }
}

int main() {
    bool passed = true;

    passed &= testTwoBlockTrace();
    passed &= testExactMultipleTrace();
    passed &= testSilentServerExhaustsRetries();
    passed &= testPeerErrorSurfaces();
    passed &= testGarbageSpendsAttempts();
    passed &= testDuplicateDataIsReacknowledged();
    passed &= testLostAckIsRepeatedOnTimeout();
    passed &= testPeerLocksToFirstDataSource();
    passed &= testSinkFailureNotifiesServer();
    passed &= testInvalidRequests();
    passed &= testClientIsReusable();

    if (not passed) {
        return 1;
    }

    std::cout << "[PASS] tftpc_client_tests\n";
    return 0;
}
