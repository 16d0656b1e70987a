#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace MiniTftp::Tftp {
    using tftp_u8 = unsigned char;
    using tftp_u16 = std::uint16_t;

    enum class Opcode : tftp_u16 {
        none,
        rrq,
        wrq,
        data,
        ack,
        err,
        last = err
    };

    enum class ErrorCode : tftp_u16 {
        unknown,
        not_found,
        access_violation,
        disk_full,
        illegal_operation,
        unknown_transfer_id,
        file_already_exists,
        no_such_user,
        last = no_such_user
    };

    inline constexpr std::size_t opcode_size = 2UL;
    inline constexpr std::size_t block_field_size = 2UL;
    inline constexpr std::size_t header_size = opcode_size + block_field_size;
    inline constexpr std::size_t block_size_limit = 512UL;
    inline constexpr std::size_t datagram_size = header_size + block_size_limit;

    inline constexpr auto octet_mode_name = "octet";

    struct DudPayload {
        [[nodiscard]] bool operator==(const DudPayload& other) const noexcept = default;
    };

    struct RrqPayload {
        std::string filename;
        std::string mode;

        [[nodiscard]] bool operator==(const RrqPayload& other) const = default;
    };

    struct DataPayload {
        tftp_u16 block;
        std::u8string data;

        [[nodiscard]] bool operator==(const DataPayload& other) const = default;
    };

    struct AckPayload {
        tftp_u16 block;

        [[nodiscard]] bool operator==(const AckPayload& other) const noexcept = default;
    };

    struct ErrorPayload {
        ErrorCode code;
        std::string message;

        [[nodiscard]] bool operator==(const ErrorPayload& other) const = default;
    };

    /// NOTE: `DudPayload` is what a failed decode carries, so a rejected buffer never produces a half-filled packet.
    using Packet = std::variant<DudPayload, RrqPayload, DataPayload, AckPayload, ErrorPayload>;

    [[nodiscard]] Opcode opcodeOf(const Packet& packet) noexcept;

    /// @brief The block a sender moves to before building its next Data packet. Wraps 65535 -> 0 with plain unsigned arithmetic.
    [[nodiscard]] constexpr tftp_u16 advanceBlock(tftp_u16 last_block) noexcept {
        return static_cast<tftp_u16>(last_block + 1U);
    }

    [[nodiscard]] constexpr bool isShortBlock(std::size_t data_length) noexcept {
        return data_length < block_size_limit;
    }
}
