#include <array>
#include "tftp/messaging.hpp"

namespace MiniTftp::Tftp {
    static constexpr std::array<std::string_view, static_cast<std::size_t>(DecodeStatus::last) + 1> decode_msgs = {
        "ok",
        "unrecognized operation",
        "datagram exceeds 516 bytes",
        "unterminated string field",
        "empty filename",
        "unsupported mode"
    };

    static constexpr std::array<std::string_view, static_cast<std::size_t>(EncodeStatus::last) + 1> encode_msgs = {
        "ok",
        "nothing to encode",
        "empty string field",
        "string field contains a zero byte",
        "packet exceeds 516 bytes"
    };

    static constexpr std::array<std::string_view, static_cast<std::size_t>(ErrorCode::last) + 1> errcode_msgs = {
        "Not defined",
        "File not found",
        "Access violation",
        "Disk full or allocation exceeded",
        "Illegal TFTP operation",
        "Unknown transfer ID",
        "File already exists",
        "No such user"
    };

    static constexpr std::array<std::string_view, static_cast<std::size_t>(Opcode::last) + 1> opcode_names = {
        "NONE",
        "RRQ",
        "WRQ",
        "DATA",
        "ACK",
        "ERROR"
    };

    std::string_view toDecodeMsg(DecodeStatus status) noexcept {
        return decode_msgs[static_cast<std::size_t>(status)];
    }

    std::string_view toEncodeMsg(EncodeStatus status) noexcept {
        return encode_msgs[static_cast<std::size_t>(status)];
    }

    /// @note Peers may send codes outside RFC 1350's table, those read as "Not defined".
    std::string_view toErrorMsg(ErrorCode code) noexcept {
        const auto code_n = static_cast<std::size_t>(code);

        if (code_n >= errcode_msgs.size()) {
            return errcode_msgs[0];
        }

        return errcode_msgs[code_n];
    }

    std::string_view toOpcodeName(Opcode op) noexcept {
        const auto op_n = static_cast<std::size_t>(op);

        if (op_n >= opcode_names.size()) {
            return opcode_names[0];
        }

        return opcode_names[op_n];
    }

    bool isValidationFailure(DecodeStatus status) noexcept {
        return status == DecodeStatus::empty_filename or status == DecodeStatus::unsupported_mode;
    }

    bool isOctetMode(std::string_view mode) noexcept {
        return Meta::equalsIgnoreCase(mode, octet_mode_name);
    }

    Opcode opcodeOf(const Packet& packet) noexcept {
        if (std::holds_alternative<RrqPayload>(packet)) {
            return Opcode::rrq;
        } else if (std::holds_alternative<DataPayload>(packet)) {
            return Opcode::data;
        } else if (std::holds_alternative<AckPayload>(packet)) {
            return Opcode::ack;
        } else if (std::holds_alternative<ErrorPayload>(packet)) {
            return Opcode::err;
        }

        return Opcode::none;
    }
}
