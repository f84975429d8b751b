/*
 * File: checksum.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-14
 * License: MIT
 */

#pragma once

#include <array>
#include <cstdint>

#include "strata/core/bytes.hpp"

namespace strata::core {

    // CRC-32C (Castagnoli), reflected polynomial 0x82F63B78.
    class crc32c {
    public:
        using value_type = std::uint32_t;

        crc32c& update(byte_view data) noexcept {
            const auto& tbl = table();
            for (auto b : data) {
                state_ = tbl[(state_ ^ std::to_integer<std::uint32_t>(b)) & 0xFFu] ^ (state_ >> 8);
            }
            return *this;
        }

        value_type value() const noexcept {
            return state_ ^ 0xFFFFFFFFu;
        }

        static value_type of(byte_view data) noexcept {
            return crc32c{}.update(data).value();
        }

    private:

        static constexpr std::array<value_type, 256> make_table() {
            std::array<value_type, 256> tbl{};
            for (value_type i = 0; i < 256; ++i) {
                value_type c = i;
                for (int k = 0; k < 8; ++k) {
                    c = (c & 1u) ? (0x82F63B78u ^ (c >> 1)) : (c >> 1);
                }
                tbl[i] = c;
            }
            return tbl;
        }

        static const std::array<value_type, 256>& table() noexcept {
            static constexpr auto tbl = make_table();
            return tbl;
        }

        value_type state_ = 0xFFFFFFFFu;
    };

} // namespace strata::core
