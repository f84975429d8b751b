/*
 * File: byteorder.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-10-25
 * License: MIT
 */

#pragma once

#include <bit>
#include <cstring>
#include <limits>
#include <type_traits>

#include "strata/core/bytes.hpp"

namespace strata::core::byteorder {

	template <typename T>
	concept UnsignedWord = std::is_unsigned_v<T> &&
		((sizeof(T) == 2) || (sizeof(T) == 4) || (sizeof(T) == 8));

	template <typename T>
	concept Word = std::is_integral_v<T> &&
		((sizeof(T) == 2) || (sizeof(T) == 4) || (sizeof(T) == 8));

	template <UnsignedWord WordT>
	constexpr inline WordT le_to_native_unsigned(const core::byte* mem) {
		if constexpr (std::endian::native == std::endian::little) {
			WordT result;
			std::memcpy(&result, mem, sizeof(WordT));
			return result;
		}
		else {
			WordT result = 0;
			for (std::size_t i = 0; i < sizeof(WordT); ++i) {
				result |= static_cast<WordT>(std::to_integer<WordT>(mem[i]) << (i * 8));
			}
			return result;
		}
	}

	template <UnsignedWord WordT>
	constexpr inline void native_to_le_unsigned(WordT val, core::byte* mem) {
		if constexpr (std::endian::native == std::endian::little) {
			std::memcpy(mem, &val, sizeof(WordT));
		}
		else {
			for (std::size_t i = 0; i < sizeof(WordT); ++i) {
				mem[i] = static_cast<core::byte>((val >> (i * 8)) & 0xFF);
			}
		}
	}

	// Big endian is used for order-preserving key encodings: the byte-wise
	// comparison of two encoded words matches their numeric order.
	template <UnsignedWord WordT>
	constexpr inline WordT be_to_native_unsigned(const core::byte* mem) {
		WordT result = 0;
		for (std::size_t i = 0; i < sizeof(WordT); ++i) {
			result = static_cast<WordT>((result << 8) | std::to_integer<WordT>(mem[i]));
		}
		return result;
	}

	template <UnsignedWord WordT>
	constexpr inline void native_to_be_unsigned(WordT val, core::byte* mem) {
		for (std::size_t i = 0; i < sizeof(WordT); ++i) {
			mem[sizeof(WordT) - 1 - i] = static_cast<core::byte>((val >> (i * 8)) & 0xFF);
		}
	}

	template <Word WordT>
	constexpr inline WordT le_to_native(const core::byte* mem) {
		using unsigned_type = std::make_unsigned_t<WordT>;
		return std::bit_cast<WordT>(le_to_native_unsigned<unsigned_type>(mem));
	}

	template <Word WordT>
	constexpr inline void native_to_le(WordT val, core::byte* mem) {
		using unsigned_type = std::make_unsigned_t<WordT>;
		native_to_le_unsigned<unsigned_type>(std::bit_cast<unsigned_type>(val), mem);
	}

	template <typename WordT = std::uint32_t>
	class word_le {
	public:

		using word_type = WordT;

		word_le() = default;
		word_le(word_type val) {
			from_native(val);
		}
		word_le(const word_le&) = default;
		word_le& operator = (const word_le&) = default;

		operator word_type() const {
			return get();
		}

		word_le& operator = (word_type val) {
			from_native(val);
			return *this;
		}

		word_type get() const {
			return le_to_native<word_type>(bytes_);
		}

		constexpr static auto max() {
			return std::numeric_limits<word_type>::max();
		}

	private:

		void from_native(word_type val) {
			native_to_le<word_type>(val, bytes_);
		}

		core::byte bytes_[sizeof(word_type)] = {};
	};

} // namespace strata::core::byteorder
