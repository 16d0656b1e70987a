/**
 * @file main.cpp
 * @brief Implements driver logic for the read-only TFTP server.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include "meta/helpers.hpp"
#include "meta/logging.hpp"
#include "netsock/netconfig.hpp"
#include "tftpd/driver.hpp"
#include "tftpd/payload.hpp"

namespace {
    using namespace MiniTftp;

    constexpr auto usage_text = "usage: ./tftpd --filepath <file> [--address <host:port>] [--retries <n>] [--timeout-ms <ms>] [--verbose]\n";

    struct ServerOptions {
        std::filesystem::path file_path;
        Tftpd::ServerConfig config;
        bool verbose {false};
    };

    /// NOTE: shared with the signal handler.
    std::atomic<Tftpd::MyServer*> g_server {nullptr};
    static_assert(std::atomic<Tftpd::MyServer*>::is_always_lock_free);

    void onStopSignal([[maybe_unused]] int signal_code) {
        if (auto* server = g_server.load(); server != nullptr) {
            server->requestStop();
        }
    }

    [[nodiscard]] std::optional<ServerOptions> parseArguments(int argc, char* argv[], std::string& out_error) {
        ServerOptions options;

        for (int arg_index = 1; arg_index < argc; ++arg_index) {
            const std::string_view arg = argv[arg_index];

            if (arg == "--verbose") {
                options.verbose = true;
                continue;
            }

            if (arg_index + 1 >= argc) {
                out_error = "missing value for option: " + std::string {arg};
                return {};
            }

            const std::string_view value = argv[++arg_index];

            if (arg == "--filepath") {
                options.file_path = value;
            } else if (arg == "--address") {
                options.config.listen_address = value;
            } else if (arg == "--retries") {
                const auto retries = Meta::parseUnsigned<unsigned int>(value);

                if (not retries.has_value()) {
                    out_error = "invalid --retries value: " + std::string {value};
                    return {};
                }

                options.config.retries = *retries;
            } else if (arg == "--timeout-ms") {
                const auto timeout_ms = Meta::parseUnsigned<unsigned int>(value);

                if (not timeout_ms.has_value()) {
                    out_error = "invalid --timeout-ms value: " + std::string {value};
                    return {};
                }

                options.config.timeout = std::chrono::milliseconds {*timeout_ms};
            } else {
                out_error = "unknown option: " + std::string {arg};
                return {};
            }
        }

        if (options.file_path.empty()) {
            out_error = "--filepath is required";
            return {};
        }

        return options;
    }
}

int main(int argc, char* argv[]) {
    std::string arg_error;
    auto options = parseArguments(argc, argv, arg_error);

    if (not options.has_value()) {
        std::cerr << arg_error << '\n' << usage_text;
        return 1;
    }

    auto payload = Tftpd::FileUtils::loadPayload(options->file_path);

    if (not payload.has_value()) {
        std::cerr << "Setup failed: cannot read " << options->file_path << '\n';
        return 1;
    }

    Meta::ConsoleSink console {"tftpd", options->verbose ? Meta::LogLevel::debug : Meta::LogLevel::info};

    try {
        auto socket = std::make_unique<NetSock::UDPSocket>(NetSock::bindUdpSocket(options->config.listen_address));

        if (not socket->isUsable()) {
            std::cerr << "Setup failed: cannot bind " << options->config.listen_address << '\n';
            return 1;
        }

        Tftpd::MyServer app {std::move(socket), std::move(*payload), options->config, Meta::Logger {console}};

        g_server.store(&app);
        std::signal(SIGINT, onStopSignal);
        std::signal(SIGTERM, onStopSignal);

        const auto serve_status = app.runService();

        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        g_server.store(nullptr);

        if (serve_status != Tftpd::ServeStatus::stopped) {
            std::cerr << "Server stopped after a socket failure.\n";
            return 1;
        }
    } catch (const std::exception& setup_error) {
        std::cerr << "Setup failed: " << setup_error.what() << '\n';
        return 1;
    }
}
