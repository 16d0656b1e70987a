#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <span>
#include "meta/helpers.hpp"

namespace MiniTftp::NetSock {
    using Octet = unsigned char;

    /**
     * @brief Fixed-capacity octet storage with a separate "used" length, sized for one datagram.
     */
    template <Meta::OctetKind T, std::size_t N> requires (N > 0UL)
    class FixedBuffer {
    private:
        std::array<T, N> m_data;
        std::size_t m_length;

    public:
        constexpr FixedBuffer() noexcept
        : m_data {}, m_length {0UL} {}

        [[nodiscard]] T* viewPtr() noexcept {
            return m_data.data();
        }

        [[nodiscard]] const T* viewPtr() const noexcept {
            return m_data.data();
        }

        [[nodiscard]] constexpr std::size_t getLength() const noexcept {
            return m_length;
        }

        /// NOTE: Clamped to the capacity so a bad count from the OS can never expose bytes past the array.
        void markLength(std::size_t length) noexcept {
            m_length = std::min(length, N);
        }

        [[nodiscard]] constexpr std::size_t getSize() const noexcept {
            return N;
        }

        [[nodiscard]] constexpr bool isEmpty() const noexcept {
            return m_length == 0UL;
        }

        template <Meta::OctetKind U>
        [[nodiscard]] bool assign(std::span<const U> octets) noexcept {
            if (octets.size() > N) {
                return false;
            }

            std::transform(octets.begin(), octets.end(), m_data.begin(), [](U octet) {
                return static_cast<T>(octet);
            });
            m_length = octets.size();

            return true;
        }

        [[nodiscard]] std::span<const T> view() const noexcept {
            return {m_data.data(), m_length};
        }

        constexpr void reset() noexcept {
            std::fill(m_data.begin(), m_data.end(), T {});
            m_length = 0UL;
        }
    };

    /// NOTE: Larger than any valid TFTP datagram so oversized input shows up as an over-long length instead of being silently cut to size.
    inline constexpr std::size_t datagram_capacity = 1024UL;

    using Datagram = FixedBuffer<Octet, datagram_capacity>;
}
