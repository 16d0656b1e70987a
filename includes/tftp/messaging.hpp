#pragma once

#include <algorithm>
#include <cstring>
#include <iterator>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <arpa/inet.h>
#include "meta/helpers.hpp"
#include "netsock/buffers.hpp"
#include "tftp/types.hpp"

namespace MiniTftp::Tftp {
    struct RrqOpt {};
    struct DataOpt {};
    struct AckOpt {};
    struct ErrOpt {};

    enum class DecodeStatus : unsigned char {
        ok,
        unrecognized_operation,
        oversized,
        unterminated_string,
        empty_filename,
        unsupported_mode,
        last = unsupported_mode
    };

    enum class EncodeStatus : unsigned char {
        ok,
        dud_packet,
        empty_field,
        embedded_nul,
        oversized,
        last = oversized
    };

    struct ParseResult {
        Packet packet;
        DecodeStatus status;
    };

    [[nodiscard]] std::string_view toDecodeMsg(DecodeStatus status) noexcept;
    [[nodiscard]] std::string_view toEncodeMsg(EncodeStatus status) noexcept;
    [[nodiscard]] std::string_view toErrorMsg(ErrorCode code) noexcept;
    [[nodiscard]] std::string_view toOpcodeName(Opcode op) noexcept;

    /// @brief True for rejections of a well-formed request (empty filename, non-octet mode) rather than of malformed bytes.
    [[nodiscard]] bool isValidationFailure(DecodeStatus status) noexcept;

    [[nodiscard]] bool isOctetMode(std::string_view mode) noexcept;

    inline constexpr auto dud_position = std::numeric_limits<std::size_t>::max();

    template <typename DataType>
    struct HelperResult {
        DataType data;
        std::size_t current_pos;
    };

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] constexpr std::size_t writeLimit([[maybe_unused]] const NetSock::FixedBuffer<T, N>& target) noexcept {
        return std::min(N, datagram_size);
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<tftp_u16> readU16(const NetSock::FixedBuffer<T, N>& source, std::size_t begin) {
        tftp_u16 temp = 0;

        if (source.getLength() < block_field_size or begin > source.getLength() - block_field_size) {
            return {0, dud_position};
        }

        std::memcpy(&temp, source.viewPtr() + begin, block_field_size);

        return {ntohs(temp), begin + block_field_size};
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<std::string> readText(const NetSock::FixedBuffer<T, N>& source, std::size_t begin) {
        const auto source_len = source.getLength();

        if (begin >= source_len) {
            return {{}, dud_position};
        }

        const auto* read_ptr = source.viewPtr();
        const auto* text_end = std::find(read_ptr + begin, read_ptr + source_len, T {});

        if (text_end == read_ptr + source_len) {
            return {{}, dud_position};
        }

        std::string temp;
        temp.reserve(static_cast<std::size_t>(text_end - (read_ptr + begin)));

        std::transform(read_ptr + begin, text_end, std::back_inserter(temp), [](T octet) {
            return static_cast<char>(octet);
        });

        /// NOTE: +1 skips the zero delimiter so the next field starts right after it.
        const auto next_pos = static_cast<std::size_t>(text_end - read_ptr) + 1UL;

        return {std::move(temp), next_pos};
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<std::u8string> readBlob(const NetSock::FixedBuffer<T, N>& source, std::size_t begin) {
        const auto source_len = source.getLength();

        if (begin > source_len) {
            return {{}, dud_position};
        }

        std::u8string temp;
        temp.reserve(source_len - begin);

        const auto* read_ptr = source.viewPtr();

        std::transform(read_ptr + begin, read_ptr + source_len, std::back_inserter(temp), [](T octet) {
            return static_cast<char8_t>(octet);
        });

        return {std::move(temp), source_len};
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<bool> writeU16(NetSock::FixedBuffer<T, N>& target, std::size_t begin, tftp_u16 value) {
        const auto network_ord_value = htons(value);

        if (begin + block_field_size > writeLimit(target)) {
            return {false, dud_position};
        }

        std::memcpy(target.viewPtr() + begin, &network_ord_value, block_field_size);

        return {true, begin + block_field_size};
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<bool> writeText(NetSock::FixedBuffer<T, N>& target, std::size_t begin, std::string_view value) {
        /// NOTE: the zero delimiter needs one more slot after the text.
        if (begin + value.length() + 1UL > writeLimit(target)) {
            return {false, dud_position};
        }

        auto* write_ptr = target.viewPtr() + begin;

        write_ptr = std::transform(value.begin(), value.end(), write_ptr, [](char c) {
            return static_cast<T>(c);
        });
        *write_ptr = T {};

        return {true, begin + value.length() + 1UL};
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<bool> writeBlob(NetSock::FixedBuffer<T, N>& target, std::size_t begin, std::u8string_view value) {
        if (begin + value.length() > writeLimit(target)) {
            return {false, dud_position};
        }

        std::transform(value.begin(), value.end(), target.viewPtr() + begin, [](char8_t octet) {
            return static_cast<T>(octet);
        });

        return {true, begin + value.length()};
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] ParseResult parsePayload(const NetSock::FixedBuffer<T, N>& source, [[maybe_unused]] RrqOpt opt) {
        auto [filename, pos_1] = readText(source, opcode_size);

        if (pos_1 == dud_position) {
            return {DudPayload {}, DecodeStatus::unterminated_string};
        }

        if (filename.empty()) {
            return {DudPayload {}, DecodeStatus::empty_filename};
        }

        auto [mode, pos_2] = readText(source, pos_1);

        if (pos_2 == dud_position) {
            return {DudPayload {}, DecodeStatus::unterminated_string};
        }

        if (not isOctetMode(mode)) {
            return {DudPayload {}, DecodeStatus::unsupported_mode};
        }

        /// NOTE: anything after the mode terminator would be RFC 2347 options, which are never negotiated here.
        return {
            RrqPayload {std::move(filename), std::move(mode)},
            DecodeStatus::ok
        };
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] ParseResult parsePayload(const NetSock::FixedBuffer<T, N>& source, [[maybe_unused]] DataOpt opt) {
        const auto [block_n, pos_1] = readU16(source, opcode_size);

        if (pos_1 == dud_position) {
            return {DudPayload {}, DecodeStatus::unrecognized_operation};
        }

        auto [data_blob, pos_2] = readBlob(source, pos_1);

        if (pos_2 == dud_position) {
            return {DudPayload {}, DecodeStatus::unrecognized_operation};
        }

        return {
            DataPayload {block_n, std::move(data_blob)},
            DecodeStatus::ok
        };
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] ParseResult parsePayload(const NetSock::FixedBuffer<T, N>& source, [[maybe_unused]] AckOpt opt) {
        const auto [block_n, pos_1] = readU16(source, opcode_size);

        if (pos_1 == dud_position) {
            return {DudPayload {}, DecodeStatus::unrecognized_operation};
        }

        return {AckPayload {block_n}, DecodeStatus::ok};
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] ParseResult parsePayload(const NetSock::FixedBuffer<T, N>& source, [[maybe_unused]] ErrOpt opt) {
        const auto [raw_errcode, pos_1] = readU16(source, opcode_size);

        if (pos_1 == dud_position) {
            return {DudPayload {}, DecodeStatus::unrecognized_operation};
        }

        auto [raw_msg, pos_2] = readText(source, pos_1);

        if (pos_2 == dud_position) {
            return {DudPayload {}, DecodeStatus::unterminated_string};
        }

        return {
            ErrorPayload {static_cast<ErrorCode>(raw_errcode), std::move(raw_msg)},
            DecodeStatus::ok
        };
    }

    /**
     * @brief Decodes one datagram. The opcode is read once and only that variant's layout is tried.
     * @note Data, Ack and Err need the full 4-byte header; shorter buffers count as unrecognized.
     */
    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] ParseResult parsePacket(const NetSock::FixedBuffer<T, N>& source) {
        const auto source_len = source.getLength();

        if (source_len > datagram_size) {
            return {DudPayload {}, DecodeStatus::oversized};
        }

        const auto [opcode, pos] = readU16(source, 0UL);

        if (pos == dud_position) {
            return {DudPayload {}, DecodeStatus::unrecognized_operation};
        }

        const auto opcode_enum_v = static_cast<Opcode>(opcode);
        const auto has_header = source_len >= header_size;

        if (opcode_enum_v == Opcode::rrq) {
            return parsePayload(source, RrqOpt {});
        } else if (opcode_enum_v == Opcode::data and has_header) {
            return parsePayload(source, DataOpt {});
        } else if (opcode_enum_v == Opcode::ack and has_header) {
            return parsePayload(source, AckOpt {});
        } else if (opcode_enum_v == Opcode::err and has_header) {
            return parsePayload(source, ErrOpt {});
        }

        return {DudPayload {}, DecodeStatus::unrecognized_operation};
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<EncodeStatus> serializePayload([[maybe_unused]] NetSock::FixedBuffer<T, N>& target, [[maybe_unused]] const DudPayload& payload) {
        return {EncodeStatus::dud_packet, dud_position};
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<EncodeStatus> serializePayload(NetSock::FixedBuffer<T, N>& target, const RrqPayload& payload) {
        const auto& [filename, mode] = payload;

        if (filename.empty() or mode.empty()) {
            return {EncodeStatus::empty_field, dud_position};
        }

        if (filename.find('\0') != std::string::npos or mode.find('\0') != std::string::npos) {
            return {EncodeStatus::embedded_nul, dud_position};
        }

        const auto [field_1_ok, pos_1] = writeText(target, opcode_size, filename);

        if (not field_1_ok) {
            return {EncodeStatus::oversized, dud_position};
        }

        const auto [field_2_ok, pos_2] = writeText(target, pos_1, mode);

        if (not field_2_ok) {
            return {EncodeStatus::oversized, dud_position};
        }

        return {EncodeStatus::ok, pos_2};
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<EncodeStatus> serializePayload(NetSock::FixedBuffer<T, N>& target, const DataPayload& payload) {
        const auto& [block_n, data_blob] = payload;

        if (data_blob.length() > block_size_limit) {
            return {EncodeStatus::oversized, dud_position};
        }

        const auto [field_1_ok, pos_1] = writeU16(target, opcode_size, block_n);

        if (not field_1_ok) {
            return {EncodeStatus::oversized, dud_position};
        }

        const auto [field_2_ok, pos_2] = writeBlob(target, pos_1, data_blob);

        if (not field_2_ok) {
            return {EncodeStatus::oversized, dud_position};
        }

        return {EncodeStatus::ok, pos_2};
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<EncodeStatus> serializePayload(NetSock::FixedBuffer<T, N>& target, const AckPayload& payload) {
        const auto [field_1_ok, pos_1] = writeU16(target, opcode_size, payload.block);

        if (not field_1_ok) {
            return {EncodeStatus::oversized, dud_position};
        }

        return {EncodeStatus::ok, pos_1};
    }

    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] HelperResult<EncodeStatus> serializePayload(NetSock::FixedBuffer<T, N>& target, const ErrorPayload& payload) {
        const auto& [errcode, msg] = payload;

        if (msg.find('\0') != std::string::npos) {
            return {EncodeStatus::embedded_nul, dud_position};
        }

        const auto [field_1_ok, pos_1] = writeU16(target, opcode_size, static_cast<tftp_u16>(errcode));

        if (not field_1_ok) {
            return {EncodeStatus::oversized, dud_position};
        }

        const auto [field_2_ok, pos_2] = writeText(target, pos_1, msg);

        if (not field_2_ok) {
            return {EncodeStatus::oversized, dud_position};
        }

        return {EncodeStatus::ok, pos_2};
    }

    /**
     * @brief Encodes a packet into `target`. The packet is never modified; on failure `target` is left empty.
     */
    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] EncodeStatus serializePacket(NetSock::FixedBuffer<T, N>& target, const Packet& packet) {
        target.markLength(0);

        const auto opcode_n = static_cast<tftp_u16>(opcodeOf(packet));

        if (opcode_n == static_cast<tftp_u16>(Opcode::none)) {
            return EncodeStatus::dud_packet;
        }

        if (const auto [field_0_ok, pos_0] = writeU16(target, 0UL, opcode_n); not field_0_ok) {
            return EncodeStatus::oversized;
        }

        const auto [status, end_pos] = std::visit([&target](const auto& payload) {
            return serializePayload(target, payload);
        }, packet);

        if (status == EncodeStatus::ok) {
            target.markLength(end_pos);
        }

        return status;
    }
}
