/*
 * File: codec.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-16
 * License: MIT
 */

#pragma once

#include <bit>
#include <concepts>
#include <cstdint>
#include <string>
#include <type_traits>

#include "strata/core/bytes.hpp"
#include "strata/core/byteorder.hpp"
#include "strata/codec/serializer.hpp"

namespace strata::codec {

    // Value <-> bytes contract supplied per key/value type.
    // decode(encode(v)) == v must hold; decode throws decode_error on
    // malformed input.
    template <typename C, typename T>
    concept Codec = requires(const T & val, core::byte_view bytes) {
        { C::encode(val) } -> std::same_as<core::byte_buffer>;
        { C::decode(bytes) } -> std::same_as<T>;
    };

    template <typename T>
    struct default_codec;

    // Big endian with the sign bit flipped: byte order equals numeric order.
    template <std::integral T>
        requires (!std::same_as<T, bool>)
    struct default_codec<T> {
        using unsigned_type = std::make_unsigned_t<T>;
        constexpr static unsigned_type sign_flip = std::is_signed_v<T>
            ? static_cast<unsigned_type>(unsigned_type{ 1 } << (sizeof(T) * 8 - 1))
            : unsigned_type{ 0 };

        static core::byte_buffer encode(const T& val) {
            core::byte_buffer out(sizeof(T));
            const auto u = static_cast<unsigned_type>(static_cast<unsigned_type>(val) ^ sign_flip);
            if constexpr (sizeof(T) == 1) {
                out[0] = static_cast<core::byte>(u);
            }
            else {
                core::byteorder::native_to_be_unsigned<unsigned_type>(u, out.data());
            }
            return out;
        }

        static T decode(core::byte_view bytes) {
            if (bytes.size() != sizeof(T)) {
                throw decode_error("integer key has " + std::to_string(bytes.size())
                    + " bytes, expected " + std::to_string(sizeof(T)));
            }
            unsigned_type u;
            if constexpr (sizeof(T) == 1) {
                u = std::to_integer<unsigned_type>(bytes[0]);
            }
            else {
                u = core::byteorder::be_to_native_unsigned<unsigned_type>(bytes.data());
            }
            return static_cast<T>(static_cast<unsigned_type>(u ^ sign_flip));
        }
    };

    // Negative values have every bit flipped, positive only the sign bit.
    template <>
    struct default_codec<double> {
        static core::byte_buffer encode(const double& val) {
            auto bits = std::bit_cast<std::uint64_t>(val);
            bits = (bits & (std::uint64_t{ 1 } << 63)) ? ~bits : (bits ^ (std::uint64_t{ 1 } << 63));
            core::byte_buffer out(sizeof(bits));
            core::byteorder::native_to_be_unsigned<std::uint64_t>(bits, out.data());
            return out;
        }

        static double decode(core::byte_view bytes) {
            if (bytes.size() != sizeof(std::uint64_t)) {
                throw decode_error("double has " + std::to_string(bytes.size()) + " bytes, expected 8");
            }
            auto bits = core::byteorder::be_to_native_unsigned<std::uint64_t>(bytes.data());
            bits = (bits & (std::uint64_t{ 1 } << 63)) ? (bits ^ (std::uint64_t{ 1 } << 63)) : ~bits;
            return std::bit_cast<double>(bits);
        }
    };

    template <>
    struct default_codec<std::string> {
        static core::byte_buffer encode(const std::string& val) {
            return core::to_buffer(core::as_bytes(val));
        }

        static std::string decode(core::byte_view bytes) {
            return std::string(core::as_chars(bytes));
        }
    };

    template <>
    struct default_codec<core::byte_buffer> {
        static core::byte_buffer encode(const core::byte_buffer& val) {
            return val;
        }

        static core::byte_buffer decode(core::byte_view bytes) {
            return core::to_buffer(bytes);
        }
    };

    static_assert(Codec<default_codec<std::int64_t>, std::int64_t>);
    static_assert(Codec<default_codec<std::uint32_t>, std::uint32_t>);
    static_assert(Codec<default_codec<double>, double>);
    static_assert(Codec<default_codec<std::string>, std::string>);
    static_assert(Codec<default_codec<core::byte_buffer>, core::byte_buffer>);

} // namespace strata::codec
