/*
 * File: file_store.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-10-25
 * License: MIT
 */

#pragma once

#include <charconv>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include "strata/core/bytes.hpp"
#include "strata/storage/backing_store.hpp"

namespace strata::storage {

// File-per-page backing store. Page `id` lives in `<dir>/<id as 16 hex>.page`.
// A write goes to a temporary file that is renamed over the target, so a
// failed write never replaces the previous record.
class file_store {
public:

    file_store() = default;

    explicit file_store(std::filesystem::path dir)
        : dir_(std::move(dir))
    {
        std::error_code ec;
        std::filesystem::create_directories(dir_, ec);
        open_ = !ec && std::filesystem::is_directory(dir_, ec);
    }

    bool is_open() const noexcept {
        return open_;
    }

    const std::filesystem::path& directory() const noexcept {
        return dir_;
    }

    io_status read_page(page_id pid, core::byte_buffer& out) {
        if (!is_open()) {
            return io_status::fatal;
        }
        const auto path = page_path(pid);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return ec ? io_status::transient : io_status::not_found;
        }
        std::ifstream in(path, std::ios::in | std::ios::binary);
        if (!in.is_open()) {
            return io_status::transient;
        }
        in.seekg(0, std::ios::end);
        const std::streamoff size = in.tellg();
        if (size < 0) {
            return io_status::transient;
        }
        in.seekg(0, std::ios::beg);
        out.resize(static_cast<std::size_t>(size));
        in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(size));
        if (static_cast<std::streamoff>(in.gcount()) != size) {
            return io_status::transient;
        }
        return io_status::ok;
    }

    io_status write_page(page_id pid, core::byte_view data) {
        if (!is_open()) {
            return io_status::fatal;
        }
        const auto path = page_path(pid);
        auto tmp = path;
        tmp += ".tmp";
        {
            std::ofstream outf(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
            if (!outf.is_open()) {
                return io_status::transient;
            }
            outf.write(reinterpret_cast<const char*>(data.data()),
                       static_cast<std::streamsize>(data.size()));
            outf.flush();
            if (!outf) {
                return io_status::transient;
            }
        }
        std::error_code ec;
        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            std::filesystem::remove(tmp, ec);
            return io_status::transient;
        }
        return io_status::ok;
    }

    io_status delete_page(page_id pid) {
        if (!is_open()) {
            return io_status::fatal;
        }
        std::error_code ec;
        const bool removed = std::filesystem::remove(page_path(pid), ec);
        if (ec) {
            return io_status::transient;
        }
        return removed ? io_status::ok : io_status::not_found;
    }

    io_status list_pages(std::vector<page_id>& ids) {
        if (!is_open()) {
            return io_status::fatal;
        }
        ids.clear();
        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(dir_, ec)) {
            if (!entry.is_regular_file() || entry.path().extension() != ".page") {
                continue;
            }
            const auto stem = entry.path().stem().string();
            page_id pid = 0;
            const auto [ptr, err] = std::from_chars(stem.data(), stem.data() + stem.size(), pid, 16);
            if (err == std::errc{} && ptr == stem.data() + stem.size()) {
                ids.push_back(pid);
            }
        }
        return ec ? io_status::transient : io_status::ok;
    }

private:

    std::filesystem::path page_path(page_id pid) const {
        return dir_ / std::format("{:016x}.page", pid);
    }

    std::filesystem::path dir_{};
    bool open_ = false;
};

static_assert(BackingStore<file_store>);

} // namespace strata::storage
