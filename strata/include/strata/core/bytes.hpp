/*
 * File: bytes.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-10-25
 * License: MIT
 */
#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <vector>
#include <span>
#include <string>
#include <string_view>
#include <concepts>

namespace strata::core {
	
    using byte = std::byte;
	using byte_buffer = std::vector<byte>;
	using byte_view = std::span<const byte>;
	using byte_span = std::span<byte>;

	inline byte_view as_bytes(std::string_view s) noexcept {
		return { reinterpret_cast<const byte*>(s.data()), s.size() };
	}

	inline std::string_view as_chars(byte_view v) noexcept {
		return { reinterpret_cast<const char*>(v.data()), v.size() };
	}

	inline byte_buffer to_buffer(byte_view v) {
		return byte_buffer(v.begin(), v.end());
	}

	inline void append(byte_buffer& dst, byte_view src) {
		dst.insert(dst.end(), src.begin(), src.end());
	}

	// lexicographic, shorter prefix first
	inline int compare(byte_view a, byte_view b) noexcept {
		const auto n = std::min(a.size(), b.size());
		if (n > 0) {
			if (const int r = std::memcmp(a.data(), b.data(), n); r != 0) {
				return r < 0 ? -1 : 1;
			}
		}
		if (a.size() == b.size()) {
			return 0;
		}
		return a.size() < b.size() ? -1 : 1;
	}

} // namespace strata::core
