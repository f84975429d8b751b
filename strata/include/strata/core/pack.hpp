/*
 * File: pack.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-10-25
 * License: MIT
 */

#pragma once

#if defined(_MSC_VER)
#	define STRATA_PACKED_STRUCT_BEGIN __pragma(pack(push, 1))
#	define STRATA_PACKED_STRUCT_END   __pragma(pack(pop))
#	define STRATA_PACKED
#elif defined(__GNUC__) || defined(__clang__)
#	define STRATA_PACKED_STRUCT_BEGIN
#	define STRATA_PACKED_STRUCT_END
#	define STRATA_PACKED __attribute__((packed))
#else
#	define STRATA_PACKED_STRUCT_BEGIN
#	define STRATA_PACKED_STRUCT_END
#	define STRATA_PACKED
#	warning "Packed structs may not be fully supported"
#endif
