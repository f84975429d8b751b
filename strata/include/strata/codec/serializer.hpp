/*
 * File: serializer.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-10-25
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <tuple>

#include "strata/core/bytes.hpp"
#include "strata/core/byteorder.hpp"

namespace strata::codec {

	namespace byteorder = core::byteorder;

	// Thrown by every decoding routine on truncated or malformed input.
	class decode_error : public std::runtime_error {
	public:
		using std::runtime_error::runtime_error;
	};

	template <typename T>
	struct serializer;

	// Fixed width little-endian words. load() is bounds checked.
	template <byteorder::Word WordT>
	struct integer_serializer {

		using value_type = WordT;

		static std::size_t store(value_type val, core::byte* where) {
			byteorder::native_to_le<value_type>(val, where);
			return sizeof(value_type);
		}

		static std::tuple<value_type, std::size_t> load(const core::byte* where, std::size_t avail) {
			if (avail < sizeof(value_type)) {
				throw decode_error("truncated integer");
			}
			return { byteorder::le_to_native<value_type>(where), sizeof(value_type) };
		}

		constexpr static std::size_t size(const value_type&) {
			return sizeof(value_type);
		}
	};

	template <>
	struct serializer<std::uint16_t> : public integer_serializer<std::uint16_t> {};
	template <>
	struct serializer<std::uint32_t> : public integer_serializer<std::uint32_t> {};
	template <>
	struct serializer<std::uint64_t> : public integer_serializer<std::uint64_t> {};
	template <>
	struct serializer<std::int64_t> : public integer_serializer<std::int64_t> {};

	// Length-prefixed blob: u32 length followed by the bytes.
	// The view returned by load() aliases the input buffer.
	template <>
	struct serializer<core::byte_view> {

		using value_type = core::byte_view;

		static std::size_t store(const value_type& val, core::byte* where) {
			const auto shift = serializer<std::uint32_t>::store(static_cast<std::uint32_t>(val.size()), where);
			if (!val.empty()) {
				std::memcpy(where + shift, val.data(), val.size());
			}
			return shift + val.size();
		}

		static std::tuple<value_type, std::size_t> load(const core::byte* where, std::size_t avail) {
			auto [len, shift] = serializer<std::uint32_t>::load(where, avail);
			if (avail - shift < len) {
				throw decode_error("truncated blob");
			}
			return { value_type(where + shift, len), shift + len };
		}

		static std::size_t size(const value_type& val) {
			return sizeof(std::uint32_t) + val.size();
		}
	};

	// Append-only buffer builder.
	class record_writer {
	public:

		template <typename T>
		record_writer& store(const T& val) {
			const auto old_size = buffer_.size();
			buffer_.resize(old_size + serializer<T>::size(val));
			serializer<T>::store(val, buffer_.data() + old_size);
			return *this;
		}

		record_writer& store_blob(core::byte_view val) {
			return store<core::byte_view>(val);
		}

		record_writer& append(core::byte_view data) {
			core::append(buffer_, data);
			return *this;
		}

		std::size_t size() const noexcept {
			return buffer_.size();
		}

		core::byte_span span() noexcept {
			return { buffer_.data(), buffer_.size() };
		}

		core::byte_view view() const noexcept {
			return { buffer_.data(), buffer_.size() };
		}

		core::byte_buffer release() noexcept {
			return std::move(buffer_);
		}

	private:
		core::byte_buffer buffer_;
	};

	// Sequential bounds-checked reader over a byte view.
	class record_reader {
	public:
		explicit record_reader(core::byte_view data) noexcept
			: data_(data)
		{}

		template <typename T>
		T load() {
			auto [val, used] = serializer<T>::load(data_.data() + pos_, remaining());
			pos_ += used;
			return val;
		}

		core::byte_view load_blob() {
			return load<core::byte_view>();
		}

		std::size_t remaining() const noexcept {
			return data_.size() - pos_;
		}

		bool at_end() const noexcept {
			return pos_ == data_.size();
		}

	private:
		core::byte_view data_;
		std::size_t pos_ = 0;
	};

} // namespace strata::codec
