// tests/test_store_concurrency.cpp
#include "tests.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "strata/storage/memory_store.hpp"
#include "strata/model.hpp"
#include "strata/settings.hpp"
#include "strata/store.hpp"

using namespace strata;
using namespace std::chrono_literals;

namespace {
    using int_store = store<default_model<std::int64_t, std::string>, storage::memory_store>;

    settings concurrent_settings(std::size_t cache_pages) {
        settings cfg;
        cfg.min_entries = 2;
        cfg.max_entries = 8;
        cfg.cache_pages = cache_pages;
        cfg.scan_batch = 5;
        cfg.capacity_wait = 5000ms;
        cfg.io_retry = storage::retry_policy{ 2, std::chrono::microseconds{ 1 } };
        return cfg;
    }

    // "<key>:<tag>" so a reader can tell which key a value was written for
    std::string tagged(std::int64_t k, std::uint64_t tag) {
        return std::to_string(k) + ":" + std::to_string(tag);
    }

    bool belongs_to(const std::string& v, std::int64_t k) {
        const auto prefix = std::to_string(k) + ":";
        return v.compare(0, prefix.size(), prefix) == 0;
    }
}

TEST_SUITE("store/concurrency") {

    TEST_CASE("reader sees the old or the new value, never a mix") {
        storage::memory_store st;
        int_store db(st, concurrent_settings(8));
        db.open();

        const std::string a(512, 'a');
        const std::string b(512, 'b');
        db.put(42, a);
        for (std::int64_t k = 0; k < 40; ++k) {
            db.put(k * 3 + 1, "filler");
        }

        std::atomic<bool> stop{ false };
        std::atomic<int> bad{ 0 };
        std::thread writer([&] {
            for (int i = 0; i < 3000; ++i) {
                db.put(42, (i % 2) ? a : b);
            }
            stop = true;
        });
        std::thread reader([&] {
            int reads = 0;
            while (!stop || reads < 1000) {
                const auto v = db.get(42);
                if (!v || (*v != a && *v != b)) {
                    ++bad;
                }
                ++reads;
            }
        });
        writer.join();
        reader.join();
        CHECK(bad.load() == 0);
    }

    TEST_CASE("disjoint writers build one consistent chain") {
        storage::memory_store st;
        int_store db(st, concurrent_settings(32));
        db.open();

        constexpr int threads = 4;
        constexpr std::int64_t per_thread = 500;
        std::vector<std::thread> pool;
        for (int t = 0; t < threads; ++t) {
            pool.emplace_back([&, t] {
                for (std::int64_t i = 0; i < per_thread; ++i) {
                    const std::int64_t k = i * threads + t;
                    db.put(k, tagged(k, 0));
                }
            });
        }
        for (auto& th : pool) {
            th.join();
        }

        CHECK(db.size() == threads * per_thread);
        std::int64_t expected = 0;
        for (const auto& [k, v] : db.scan()) {
            CHECK(k == expected);
            CHECK(v == tagged(k, 0));
            ++expected;
        }
        CHECK(expected == threads * per_thread);
        CHECK(db.verify().ok());
    }

    TEST_CASE("stable keys stay readable while neighbours split and merge") {
        storage::memory_store st;
        int_store db(st, concurrent_settings(32));
        db.open();
        for (std::int64_t k = 0; k < 2000; k += 10) {
            db.put(k, tagged(k, 0));
        }

        std::atomic<bool> stop{ false };
        std::atomic<int> missing{ 0 };
        std::vector<std::thread> writers;
        for (int t = 0; t < 3; ++t) {
            writers.emplace_back([&, t] {
                std::mt19937 rng(static_cast<unsigned>(100 + t));
                std::uniform_int_distribution<std::int64_t> dist(0, 666);
                for (int i = 0; i < 4000; ++i) {
                    const std::int64_t k = dist(rng) * 3 + t;
                    if (k % 10 == 0 || k >= 2000) {
                        continue;
                    }
                    if (rng() % 2) {
                        db.put(k, tagged(k, 1));
                    }
                    else {
                        db.remove(k);
                    }
                }
                // shrink back to the stable keys
                for (std::int64_t k = 0; k < 2000; ++k) {
                    if (k % 10 != 0 && k % 3 == t) {
                        db.remove(k);
                    }
                }
            });
        }
        std::vector<std::thread> readers;
        for (int t = 0; t < 2; ++t) {
            readers.emplace_back([&, t] {
                std::mt19937 rng(static_cast<unsigned>(200 + t));
                std::uniform_int_distribution<std::int64_t> dist(0, 199);
                while (!stop) {
                    const auto k = dist(rng) * 10;
                    const auto v = db.get(k);
                    if (!v || *v != tagged(k, 0)) {
                        ++missing;
                    }
                }
            });
        }
        for (auto& th : writers) {
            th.join();
        }
        stop = true;
        for (auto& th : readers) {
            th.join();
        }

        CHECK(missing.load() == 0);
        CHECK(db.size() == 200);
        CHECK(db.stats().splits > 0);
        CHECK(db.stats().merges > 0);
        for (std::int64_t k = 0; k < 2000; k += 10) {
            CHECK(db.get(k) == std::optional<std::string>(tagged(k, 0)));
        }
        CHECK(db.verify().ok());
    }

    TEST_CASE("scans stay ordered under concurrent puts and removes on a small cache") {
        storage::memory_store st;
        int_store db(st, concurrent_settings(24));
        db.open();

        constexpr int writers = 4;
        std::vector<std::map<std::int64_t, std::string>> owned(writers);
        std::atomic<bool> stop{ false };
        std::atomic<int> disorder{ 0 };
        std::atomic<int> foreign{ 0 };
        std::atomic<int> scans{ 0 };

        std::vector<std::thread> pool;
        for (int t = 0; t < writers; ++t) {
            pool.emplace_back([&, t] {
                std::mt19937 rng(static_cast<unsigned>(t + 7));
                std::uniform_int_distribution<std::int64_t> dist(0, 499);
                auto& mine = owned[static_cast<std::size_t>(t)];
                for (std::uint64_t i = 0; i < 3000; ++i) {
                    const std::int64_t k = dist(rng) * writers + t;
                    if (rng() % 3) {
                        const auto v = tagged(k, i);
                        db.put(k, v);
                        mine[k] = v;
                    }
                    else {
                        db.remove(k);
                        mine.erase(k);
                    }
                }
            });
        }
        std::vector<std::thread> scanners;
        for (int t = 0; t < 2; ++t) {
            scanners.emplace_back([&] {
                while (!stop) {
                    std::optional<std::int64_t> prev;
                    for (const auto& [k, v] : db.scan()) {
                        if (prev && *prev >= k) {
                            ++disorder;
                        }
                        if (!belongs_to(v, k)) {
                            ++foreign;
                        }
                        prev = k;
                    }
                    ++scans;
                }
            });
        }
        for (auto& th : pool) {
            th.join();
        }
        stop = true;
        for (auto& th : scanners) {
            th.join();
        }

        CHECK(disorder.load() == 0);
        CHECK(foreign.load() == 0);
        CHECK(scans.load() > 0);

        std::map<std::int64_t, std::string> expected;
        for (const auto& m : owned) {
            expected.insert(m.begin(), m.end());
        }
        std::map<std::int64_t, std::string> actual;
        for (const auto& kv : db.scan()) {
            actual.insert(kv);
        }
        CHECK(actual == expected);
        CHECK(db.size() == expected.size());
        CHECK(db.verify().ok());
        CHECK(db.stats().cache.evictions > 0);
    }

    TEST_CASE("evicted pages come back intact under contention") {
        storage::memory_store st;
        int_store db(st, concurrent_settings(6));
        db.open();
        for (std::int64_t k = 0; k < 600; ++k) {
            db.put(k, tagged(k, 0));
        }
        REQUIRE(db.page_count() > 20);

        std::vector<std::thread> pool;
        std::atomic<int> bad{ 0 };
        for (int t = 0; t < 3; ++t) {
            pool.emplace_back([&, t] {
                std::mt19937 rng(static_cast<unsigned>(t + 31));
                std::uniform_int_distribution<std::int64_t> dist(0, 599);
                for (int i = 0; i < 2000; ++i) {
                    const auto k = dist(rng);
                    if (k % 3 == t) {
                        db.put(k, tagged(k, 1));
                    }
                    const auto v = db.get(k);
                    if (!v || !belongs_to(*v, k)) {
                        ++bad;
                    }
                }
            });
        }
        for (auto& th : pool) {
            th.join();
        }
        CHECK(bad.load() == 0);
        CHECK(db.size() == 600);
        const auto s = db.stats();
        CHECK(s.cache.evictions > 0);
        CHECK(s.cache.writebacks_on_evict > 0);
        CHECK(s.cache.resident <= 6);
        CHECK(db.verify().ok());
    }
}
