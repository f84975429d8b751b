/*
 * File: types.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-10-25
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <limits>

#include "strata/core/byteorder.hpp"

namespace strata::core {
	using word_u16 = byteorder::word_le<std::uint16_t>;
	using word_u32 = byteorder::word_le<std::uint32_t>;
	using word_u64 = byteorder::word_le<std::uint64_t>;

	// Immutable page identity. Never derived from the key range.
	using page_id = std::uint64_t;

	constexpr static const page_id manifest_page_id = 0;
	constexpr static const page_id first_data_page_id = 1;
	constexpr static const page_id invalid_page_id = std::numeric_limits<page_id>::max();

} // namespace strata::core
