/**
 * @file main.cpp
 * @brief Implements driver logic for the TFTP read client.
 */

#include <chrono>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include "meta/helpers.hpp"
#include "meta/logging.hpp"
#include "netsock/netconfig.hpp"
#include "tftpc/client.hpp"

namespace {
    using namespace MiniTftp;

    constexpr auto usage_text = "usage: ./tftpc --filename <name> [--address <host:port>] [--client-address <host:port>] [--retries <n>] [--timeout-ms <ms>] [--output <path>] [--verbose]\n";

    struct ClientOptions {
        std::string filename;
        std::string server_address {"127.0.0.1:69"};
        std::string output_path;
        Tftpc::ClientConfig config;
        bool verbose {false};
    };

    [[nodiscard]] std::optional<ClientOptions> parseArguments(int argc, char* argv[], std::string& out_error) {
        ClientOptions options;

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

            if (arg == "--filename") {
                options.filename = value;
            } else if (arg == "--address") {
                options.server_address = value;
            } else if (arg == "--client-address") {
                options.config.local_address = value;
            } else if (arg == "--output") {
                options.output_path = value;
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

        if (options.filename.empty()) {
            out_error = "--filename is required";
            return {};
        }

        return options;
    }
}

int main(int argc, char* argv[]) {
    std::string arg_error;
    const auto options = parseArguments(argc, argv, arg_error);

    if (not options.has_value()) {
        std::cerr << arg_error << '\n' << usage_text;
        return 1;
    }

    const auto server = NetSock::resolveEndpoint(options->server_address);

    if (not server.has_value()) {
        std::cerr << "Setup failed: cannot resolve server address " << options->server_address << '\n';
        return 1;
    }

    std::ofstream output_file;

    if (not options->output_path.empty()) {
        output_file.open(options->output_path, std::ios::out | std::ios::binary | std::ios::trunc);

        if (not output_file.is_open()) {
            std::cerr << "Setup failed: cannot open " << options->output_path << " for writing\n";
            return 1;
        }
    }

    std::ostream& sink = options->output_path.empty() ? std::cout : output_file;
    Meta::ConsoleSink console {"tftpc", options->verbose ? Meta::LogLevel::debug : Meta::LogLevel::warning};

    try {
        auto socket = std::make_unique<NetSock::UDPSocket>(NetSock::bindUdpSocket(options->config.local_address));

        if (not socket->isUsable()) {
            std::cerr << "Setup failed: cannot bind " << options->config.local_address << '\n';
            return 1;
        }

        Tftpc::MyClient client {std::move(socket), *server, options->config, Meta::Logger {console}};
        const auto result = client.send(options->filename, sink);

        sink.flush();

        if (result.status != Tftpc::TransferStatus::ok) {
            std::cerr << "Transfer failed (" << Tftpc::toStatusName(result.status) << "): " << result.detail << '\n';
            return 1;
        }
    } catch (const std::exception& setup_error) {
        std::cerr << "Setup failed: " << setup_error.what() << '\n';
        return 1;
    }
}
