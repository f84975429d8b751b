// tests/test_recovery.cpp
#include "tests.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "strata/core/bytes.hpp"
#include "strata/core/error.hpp"
#include "strata/storage/file_store.hpp"
#include "strata/storage/memory_store.hpp"
#include "strata/model.hpp"
#include "strata/settings.hpp"
#include "strata/store.hpp"

using namespace strata;

namespace {
    using int_model = default_model<std::int64_t, std::string>;
    using int_store = store<int_model, storage::memory_store>;
    using disk_store = store<int_model, storage::file_store>;

    settings small_settings() {
        settings cfg;
        cfg.min_entries = 2;
        cfg.max_entries = 4;
        cfg.cache_pages = 8;
        cfg.scan_batch = 4;
        cfg.io_retry = storage::retry_policy{ 2, std::chrono::microseconds{ 1 } };
        return cfg;
    }

    std::string val(std::int64_t k) {
        return "v" + std::to_string(k);
    }

    int_store::manifest_type read_manifest(const storage::memory_store& st) {
        return int_store::manifest_codec_type::decode(st.raw(core::manifest_page_id));
    }

    template <typename StoreT>
    std::size_t count_scanned(StoreT& db) {
        std::size_t n = 0;
        for (const auto& kv : db.scan()) {
            static_cast<void>(kv);
            ++n;
        }
        return n;
    }

    // A well formed record the chain does not expect.
    void plant_page(storage::memory_store& st, page_id pid, std::optional<std::int64_t> first,
                    std::optional<std::int64_t> next, int_store::page_type::entries_type entries,
                    std::uint64_t write_seq) {
        int_store::page_type pg(pid, first, next, std::move(entries));
        st.put_raw(pid, int_store::page_codec_type::encode(pg, write_seq));
    }

    std::filesystem::path make_temp_dir(const char* stem) {
        auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
        return std::filesystem::temp_directory_path() / (std::string(stem) + "_" + std::to_string(now));
    }
}

TEST_SUITE("store/recovery") {

    TEST_CASE("empty medium initialises a head page and a manifest") {
        storage::memory_store st;
        int_store db(st, small_settings());
        db.open();
        CHECK(st.contains(core::manifest_page_id));
        CHECK(st.contains(core::first_data_page_id));
        const auto mf = read_manifest(st);
        CHECK_FALSE(mf.clean);
        CHECK(mf.head == core::first_data_page_id);

        db.close();
        CHECK(read_manifest(st).clean);
    }

    TEST_CASE("clean close reopens from the manifest alone") {
        storage::memory_store st;
        std::vector<page_id> ids_before;
        {
            int_store db(st, small_settings());
            db.open();
            for (std::int64_t k = 0; k < 50; ++k) {
                db.put(k, val(k));
            }
            db.remove(10);
            for (const auto& [fence, pid] : db.get_index().snapshot()) {
                ids_before.push_back(pid);
            }
        }
        REQUIRE(read_manifest(st).clean);
        CHECK(read_manifest(st).entries == 49);

        int_store db(st, small_settings());
        const auto reads = st.reads();
        db.open();
        CHECK(st.reads() == reads + 1);
        CHECK_FALSE(read_manifest(st).clean);
        CHECK(db.size() == 49);
        CHECK(count_scanned(db) == 49);
        CHECK_FALSE(db.get(10).has_value());
        CHECK(db.get(49) == std::optional<std::string>(val(49)));

        std::vector<page_id> ids_after;
        for (const auto& [fence, pid] : db.get_index().snapshot()) {
            ids_after.push_back(pid);
        }
        CHECK(ids_after == ids_before);
        CHECK(db.verify().ok());
    }

    TEST_CASE("page ids are never reused after reopen") {
        storage::memory_store st;
        page_id highest = 0;
        {
            int_store db(st, small_settings());
            db.open();
            for (std::int64_t k = 0; k < 20; ++k) {
                db.put(k, val(k));
            }
            for (const auto& [fence, pid] : db.get_index().snapshot()) {
                highest = std::max(highest, pid);
            }
        }
        int_store db(st, small_settings());
        db.open();
        for (std::int64_t k = 100; k < 110; ++k) {
            db.put(k, val(k));
        }
        std::size_t fresh = 0;
        for (const auto& [fence, pid] : db.get_index().snapshot()) {
            if (fence && *fence >= 100) {
                CHECK(pid > highest);
                ++fresh;
            }
        }
        CHECK(fresh > 0);
    }

    TEST_CASE("flushed state survives a crash") {
        storage::memory_store st;
        int_store db(st, small_settings());
        db.open();
        for (std::int64_t k = 0; k < 60; ++k) {
            db.put(k, val(k));
        }
        db.remove(30);
        db.flush_all();
        CHECK_FALSE(read_manifest(st).clean);
        db.abandon();
        CHECK_FALSE(db.is_open());

        db.open();
        CHECK(db.size() == 59);
        CHECK(count_scanned(db) == 59);
        CHECK_FALSE(db.get(30).has_value());
        for (std::int64_t k = 0; k < 60; ++k) {
            if (k != 30) {
                CHECK(db.get(k) == std::optional<std::string>(val(k)));
            }
        }
        CHECK(db.verify().ok());
    }

    TEST_CASE("unflushed writes may be lost but the chain stays consistent") {
        storage::memory_store st;
        {
            int_store db(st, small_settings());
            db.open();
            for (std::int64_t k = 0; k < 100; ++k) {
                db.put(k, val(k));
            }
            db.abandon();
        }
        int_store db(st, small_settings());
        db.open();
        CHECK(db.size() == count_scanned(db));
        for (const auto& [k, v] : db.scan()) {
            CHECK(v == val(k));
        }
        CHECK(db.page_count() > 1);
        CHECK(db.verify().ok());
    }

    TEST_CASE("orphaned records are removed") {
        storage::memory_store st;
        int_store db(st, small_settings());
        db.open();
        for (std::int64_t k = 1; k <= 5; ++k) {
            db.put(k, val(k));
        }
        db.flush_all();
        plant_page(st, 500, 1000, std::nullopt, { { 1000, "lost" } }, 1);
        db.abandon();

        db.open();
        CHECK_FALSE(st.contains(500));
        CHECK_FALSE(db.get(1000).has_value());
        CHECK(db.size() == 5);

        // ids above the orphan are still fresh
        for (std::int64_t k = 10; k < 20; ++k) {
            db.put(k, val(k));
        }
        for (const auto& [fence, pid] : db.get_index().snapshot()) {
            if (fence && *fence >= 10) {
                CHECK(pid > 500);
            }
        }
    }

    TEST_CASE("of two records with the same fence the newest wins") {
        storage::memory_store st;
        int_store db(st, small_settings());
        db.open();
        for (std::int64_t k = 1; k <= 5; ++k) {
            db.put(k, val(k));
        }
        db.flush_all();
        REQUIRE(db.page_count() == 2);
        const auto right_id = db.page_at(3).id();
        const auto seq = db.get_cache().write_seq();

        SUBCASE("newer copy replaces the live page") {
            plant_page(st, 900, 3, std::nullopt, { { 3, "newer" } }, seq + 10);
            db.abandon();
            db.open();
            CHECK(db.get(3) == std::optional<std::string>("newer"));
            CHECK_FALSE(db.get(4).has_value());
            CHECK(db.size() == 3);
            CHECK(db.page_at(3).id() == 900);
            CHECK_FALSE(st.contains(right_id));
        }
        SUBCASE("older copy is dropped") {
            plant_page(st, 900, 3, std::nullopt, { { 3, "older" } }, 0);
            db.abandon();
            db.open();
            CHECK(db.get(3) == std::optional<std::string>(val(3)));
            CHECK(db.size() == 5);
            CHECK(db.page_at(3).id() == right_id);
            CHECK_FALSE(st.contains(900));
        }
        CHECK(db.verify().ok());
    }

    TEST_CASE("unreadable manifest falls back to recovery") {
        storage::memory_store st;
        {
            int_store db(st, small_settings());
            db.open();
            for (std::int64_t k = 0; k < 30; ++k) {
                db.put(k, val(k));
            }
        }
        st.put_raw(core::manifest_page_id, core::to_buffer(core::as_bytes("garbage")));

        int_store db(st, small_settings());
        db.open();
        CHECK(db.size() == 30);
        CHECK(count_scanned(db) == 30);
        CHECK(db.verify().ok());
        CHECK_NOTHROW(read_manifest(st));
    }

    TEST_CASE("corrupted page in a clean store is quarantined on access") {
        storage::memory_store st;
        page_id right_id = core::invalid_page_id;
        {
            int_store db(st, small_settings());
            db.open();
            for (std::int64_t k = 1; k <= 5; ++k) {
                db.put(k, val(k));
            }
            right_id = db.page_at(4).id();
        }
        auto bytes = st.raw(right_id);
        REQUIRE_FALSE(bytes.empty());
        bytes.back() ^= core::byte{ 0x5a };
        st.put_raw(right_id, bytes);

        int_store db(st, small_settings());
        db.open();
        CHECK(db.get(1) == std::optional<std::string>(val(1)));
        CHECK_THROWS_AS(db.get(4), core::corruption_error);
        CHECK(db.get_cache().is_quarantined(right_id));
        CHECK_THROWS_AS(db.put(5, "x"), core::corruption_error);
        db.put(2, "still fine");
        CHECK_FALSE(db.verify().ok());
    }

    TEST_CASE("page whose fences disagree with the index fails instead of spinning") {
        storage::memory_store st;
        std::optional<std::int64_t> last_first;
        page_id last_id = core::invalid_page_id;
        {
            int_store db(st, small_settings());
            db.open();
            for (std::int64_t k = 0; k < 40; ++k) {
                db.put(k, val(k));
            }
            const auto last = db.page_at(39);
            last_id = last.id();
            last_first = last.first_key();
        }
        REQUIRE(last_first.has_value());
        REQUIRE(*last_first < 39);
        // checksum-valid record whose next fence cuts off the rest of the keyspace
        plant_page(st, last_id, *last_first, *last_first + 1, { { *last_first, val(*last_first) } },
            read_manifest(st).write_seq);

        int_store db(st, small_settings());
        db.open();
        CHECK(db.get(*last_first) == std::optional<std::string>(val(*last_first)));
        CHECK_THROWS_AS(db.get(39), core::corruption_error);
        CHECK_THROWS_AS(db.put(39, "x"), core::corruption_error);
        CHECK_THROWS_AS(count_scanned(db), core::corruption_error);
        CHECK(db.get(0) == std::optional<std::string>(val(0)));
        CHECK_FALSE(db.verify().ok());
    }

    TEST_CASE("manifest with a damaged header falls back to recovery") {
        storage::memory_store st;
        {
            int_store db(st, small_settings());
            db.open();
            for (std::int64_t k = 0; k < 30; ++k) {
                db.put(k, val(k));
            }
        }
        auto bytes = st.raw(core::manifest_page_id);
        REQUIRE(bytes.size() > 32);
        SUBCASE("next page id") {
            bytes[24] ^= core::byte{ 0x01 };
        }
        SUBCASE("fence count") {
            bytes[35] ^= core::byte{ 0x80 };
        }
        st.put_raw(core::manifest_page_id, bytes);

        int_store db(st, small_settings());
        db.open();
        CHECK(db.size() == 30);
        CHECK(count_scanned(db) == 30);
        CHECK(db.verify().ok());
        db.put(100, val(100));
        CHECK(db.verify().ok());
        CHECK(db.get(100) == std::optional<std::string>(val(100)));
    }

    TEST_CASE("recovery refuses a broken chain") {
        storage::memory_store st;
        int_store db(st, small_settings());
        db.open();
        for (std::int64_t k = 1; k <= 5; ++k) {
            db.put(k, val(k));
        }
        db.flush_all();
        const auto right_id = db.page_at(4).id();
        db.abandon();

        SUBCASE("missing link") {
            auto bytes = st.raw(right_id);
            bytes.back() ^= core::byte{ 0x01 };
            st.put_raw(right_id, bytes);
        }
        SUBCASE("missing head") {
            REQUIRE(st.delete_page(core::first_data_page_id) == storage::io_status::ok);
        }
        CHECK_THROWS_AS(db.open(), core::corruption_error);
        CHECK_FALSE(db.is_open());
    }

    TEST_CASE("failing medium on open leaves the store closed") {
        storage::memory_store st;
        {
            int_store db(st, small_settings());
            db.open();
            db.put(1, "one");
        }
        int_store db(st, small_settings());
        st.inject(storage::memory_store::op::read, storage::io_status::fatal, 1);
        CHECK_THROWS_AS(db.open(), core::fatal_io_error);
        CHECK_FALSE(db.is_open());
        db.open();
        CHECK(db.get(1) == std::optional<std::string>("one"));
    }
}

TEST_SUITE("store/recovery/file_store") {

    TEST_CASE("data survives close and a fresh process") {
        namespace fs = std::filesystem;
        const auto dir = make_temp_dir("strata_store_reopen");
        {
            storage::file_store dev(dir);
            disk_store db(dev, small_settings());
            db.open();
            for (std::int64_t k = 0; k < 200; ++k) {
                db.put(k, val(k));
            }
            for (std::int64_t k = 0; k < 200; k += 4) {
                db.remove(k);
            }
            db.close();
        }
        {
            storage::file_store dev(dir);
            disk_store db(dev, small_settings());
            db.open();
            CHECK(db.size() == 150);
            CHECK(count_scanned(db) == 150);
            CHECK_FALSE(db.get(8).has_value());
            CHECK(db.get(9) == std::optional<std::string>(val(9)));
            CHECK(db.verify().ok());
            db.put(1000, "after reopen");
            db.flush_all();
            db.abandon();
        }
        {
            storage::file_store dev(dir);
            disk_store db(dev, small_settings());
            db.open();
            CHECK(db.size() == 151);
            CHECK(db.get(1000) == std::optional<std::string>("after reopen"));
            CHECK(db.verify().ok());
        }
        fs::remove_all(dir);
    }
}
