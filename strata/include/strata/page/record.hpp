/*
 * File: record.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-19
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "strata/core/bytes.hpp"
#include "strata/core/checksum.hpp"
#include "strata/core/error.hpp"
#include "strata/core/pack.hpp"
#include "strata/core/types.hpp"
#include "strata/codec/codec.hpp"
#include "strata/codec/serializer.hpp"
#include "strata/page/page.hpp"

namespace strata::page {

    using core::word_u16;
    using core::word_u32;
    using core::word_u64;
    using core::byte;
    using core::byte_buffer;
    using core::byte_view;

    constexpr static const std::uint32_t page_record_magic = 0x50564B53;     // "SKVP"
    constexpr static const std::uint32_t manifest_record_magic = 0x4D564B53; // "SKVM"
    constexpr static const std::uint16_t record_version = 1;

    enum page_flags : std::uint16_t {
        has_first_key = 0x0001,
        has_next_first_key = 0x0002,
    };

    enum manifest_flags : std::uint16_t {
        clean_shutdown = 0x0001,
    };

    // Prefix of every durable page record. crc covers this header, with the
    // crc field zeroed, followed by the payload.
    STRATA_PACKED_STRUCT_BEGIN
    struct record_header {
        word_u32 magic{ 0 };
        word_u16 version{ 0 };
        word_u16 flags{ 0 };
        word_u64 self_id{ 0 };      // page id, or head id for the manifest
        word_u64 write_seq{ 0 };
        word_u64 aux{ 0 };          // manifest: next page id
        word_u32 entry_count{ 0 };
        word_u32 payload_size{ 0 };
        word_u32 crc{ 0 };
        word_u32 reserved{ 0 };

        static constexpr std::size_t header_size() noexcept {
            return sizeof(record_header);
        }

        byte* data() noexcept {
            return reinterpret_cast<byte*>(this);
        }

    } STRATA_PACKED;
    STRATA_PACKED_STRUCT_END

    static_assert(sizeof(record_header) == 48, "record_header must be 48 bytes (packed).");

    namespace detail {

        inline std::uint32_t checksum(record_header hdr, byte_view payload) noexcept {
            hdr.crc = 0;
            return core::crc32c{}
                .update(byte_view(hdr.data(), record_header::header_size()))
                .update(payload)
                .value();
        }

        inline byte_buffer seal(record_header hdr, const codec::record_writer& payload) {
            hdr.payload_size = static_cast<std::uint32_t>(payload.size());
            hdr.crc = checksum(hdr, payload.view());
            byte_buffer out(record_header::header_size());
            std::memcpy(out.data(), hdr.data(), record_header::header_size());
            core::append(out, payload.view());
            return out;
        }

        inline std::pair<record_header, byte_view> open(byte_view bytes, std::uint32_t magic, core::page_id pid) {
            if (bytes.size() < record_header::header_size()) {
                throw core::corruption_error("record of page " + std::to_string(pid) + " is truncated ("
                    + std::to_string(bytes.size()) + " bytes)", pid);
            }
            record_header hdr;
            std::memcpy(hdr.data(), bytes.data(), record_header::header_size());
            auto payload = bytes.subspan(record_header::header_size());
            if (checksum(hdr, payload) != hdr.crc.get()) {
                throw core::corruption_error("checksum mismatch in page " + std::to_string(pid), pid);
            }
            if (hdr.magic.get() != magic) {
                throw core::corruption_error("bad magic in record of page " + std::to_string(pid), pid);
            }
            if (hdr.version.get() != record_version) {
                throw core::corruption_error("unsupported record version " + std::to_string(hdr.version.get())
                    + " in page " + std::to_string(pid), pid);
            }
            if (payload.size() != hdr.payload_size.get()) {
                throw core::corruption_error("payload size mismatch in page " + std::to_string(pid), pid);
            }
            return { hdr, payload };
        }

        template <typename T, typename CodecT>
        T decode_with(CodecT, byte_view bytes, core::page_id pid, const char* what) {
            try {
                return CodecT::decode(bytes);
            }
            catch (const std::exception& e) {
                throw core::corruption_error(std::string("cannot decode ") + what + " in page "
                    + std::to_string(pid) + ": " + e.what(), pid);
            }
        }
    }

    // Page <-> bytes. Entries are written in key order so the decoded map
    // can be rebuilt with end hints.
    template <typename PageT, typename KeyCodecT, typename ValueCodecT>
        requires codec::Codec<KeyCodecT, typename PageT::key_type>
              && codec::Codec<ValueCodecT, typename PageT::value_type>
    struct page_codec {
        using page_type = PageT;
        using key_type = typename PageT::key_type;
        using value_type = typename PageT::value_type;
        using less_type = typename PageT::less_type;
        using entries_type = typename PageT::entries_type;

        static byte_buffer encode(const page_type& pg, std::uint64_t write_seq) {
            codec::record_writer payload;
            std::uint16_t flags = 0;
            if (pg.first_key()) {
                flags |= has_first_key;
                payload.store_blob(KeyCodecT::encode(*pg.first_key()));
            }
            if (pg.next_first_key()) {
                flags |= has_next_first_key;
                payload.store_blob(KeyCodecT::encode(*pg.next_first_key()));
            }
            for (const auto& [k, v] : pg.entries()) {
                payload.store_blob(KeyCodecT::encode(k));
                payload.store_blob(ValueCodecT::encode(v));
            }
            record_header hdr;
            hdr.magic = page_record_magic;
            hdr.version = record_version;
            hdr.flags = flags;
            hdr.self_id = pg.id();
            hdr.write_seq = write_seq;
            hdr.entry_count = static_cast<std::uint32_t>(pg.size());
            return detail::seal(hdr, payload);
        }

        // Throws corruption_error for anything that is not a well formed
        // record of page `pid`.
        static std::unique_ptr<page_type> decode(core::page_id pid, byte_view bytes) {
            auto [hdr, payload] = detail::open(bytes, page_record_magic, pid);
            if (hdr.self_id.get() != pid) {
                throw core::corruption_error("record of page " + std::to_string(pid)
                    + " claims id " + std::to_string(hdr.self_id.get()), pid);
            }
            try {
                codec::record_reader rd(payload);
                typename page_type::fence_type first;
                typename page_type::fence_type next;
                if (hdr.flags.get() & has_first_key) {
                    first = detail::decode_with<key_type>(KeyCodecT{}, rd.load_blob(), pid, "first key");
                }
                if (hdr.flags.get() & has_next_first_key) {
                    next = detail::decode_with<key_type>(KeyCodecT{}, rd.load_blob(), pid, "next first key");
                }
                entries_type entries;
                const less_type less{};
                const auto count = hdr.entry_count.get();
                for (std::uint32_t i = 0; i < count; ++i) {
                    auto k = detail::decode_with<key_type>(KeyCodecT{}, rd.load_blob(), pid, "key");
                    auto v = detail::decode_with<value_type>(ValueCodecT{}, rd.load_blob(), pid, "value");
                    if (!entries.empty() && !less(entries.rbegin()->first, k)) {
                        throw core::corruption_error("keys out of order in page " + std::to_string(pid), pid);
                    }
                    entries.emplace_hint(entries.end(), std::move(k), std::move(v));
                }
                if (!rd.at_end()) {
                    throw core::corruption_error("trailing bytes in page " + std::to_string(pid), pid);
                }
                auto pg = std::make_unique<page_type>(pid, std::move(first), std::move(next), std::move(entries));
                for (const auto& kv : pg->entries()) {
                    if (!pg->covers(kv.first)) {
                        throw core::corruption_error("key outside page fences in page " + std::to_string(pid), pid);
                    }
                }
                pg->set_write_seq(hdr.write_seq.get());
                pg->set_size_bytes(bytes.size());
                return pg;
            }
            catch (const codec::decode_error& e) {
                throw core::corruption_error("malformed page " + std::to_string(pid) + ": " + e.what(), pid);
            }
        }
    };

    // Durable root of a store: where the chain starts and, after a clean
    // shutdown, the full fence list so open() can skip the recovery walk.
    template <typename KeyT>
    struct manifest {
        bool clean = false;
        core::page_id head = core::invalid_page_id;
        core::page_id next_page_id = core::first_data_page_id;
        std::uint64_t write_seq = 0;
        std::uint64_t entries = 0;
        std::vector<std::pair<KeyT, core::page_id>> fences;
    };

    template <typename KeyT, typename KeyCodecT>
        requires codec::Codec<KeyCodecT, KeyT>
    struct manifest_codec {
        using manifest_type = manifest<KeyT>;

        static byte_buffer encode(const manifest_type& mf) {
            codec::record_writer payload;
            payload.store<std::uint64_t>(mf.entries);
            for (const auto& [k, pid] : mf.fences) {
                payload.store_blob(KeyCodecT::encode(k));
                payload.store<std::uint64_t>(pid);
            }
            record_header hdr;
            hdr.magic = manifest_record_magic;
            hdr.version = record_version;
            hdr.flags = static_cast<std::uint16_t>(mf.clean ? clean_shutdown : 0);
            hdr.self_id = mf.head;
            hdr.write_seq = mf.write_seq;
            hdr.aux = mf.next_page_id;
            hdr.entry_count = static_cast<std::uint32_t>(mf.fences.size());
            return detail::seal(hdr, payload);
        }

        static manifest_type decode(byte_view bytes) {
            constexpr auto pid = core::manifest_page_id;
            auto [hdr, payload] = detail::open(bytes, manifest_record_magic, pid);
            manifest_type mf;
            mf.clean = (hdr.flags.get() & clean_shutdown) != 0;
            mf.head = hdr.self_id.get();
            mf.write_seq = hdr.write_seq.get();
            mf.next_page_id = hdr.aux.get();
            try {
                codec::record_reader rd(payload);
                mf.entries = rd.load<std::uint64_t>();
                const auto count = hdr.entry_count.get();
                // each fence takes at least a blob length and an id
                if (count > rd.remaining() / (sizeof(std::uint32_t) + sizeof(std::uint64_t))) {
                    throw core::corruption_error("manifest claims " + std::to_string(count)
                        + " fences in " + std::to_string(payload.size()) + " bytes", pid);
                }
                mf.fences.reserve(count);
                for (std::uint32_t i = 0; i < count; ++i) {
                    auto k = detail::decode_with<KeyT>(KeyCodecT{}, rd.load_blob(), pid, "fence");
                    const auto id = rd.load<std::uint64_t>();
                    mf.fences.emplace_back(std::move(k), id);
                }
                if (!rd.at_end()) {
                    throw core::corruption_error("trailing bytes in manifest", pid);
                }
            }
            catch (const codec::decode_error& e) {
                throw core::corruption_error(std::string("malformed manifest: ") + e.what(), pid);
            }
            return mf;
        }
    };

} // namespace strata::page
