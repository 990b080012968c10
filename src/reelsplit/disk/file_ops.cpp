// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reelsplit/disk/file_ops.hpp>
#include <reelsplit/core/config.hpp>
#include <reelsplit/core/log.hpp>
#include <cctype>
#include <unistd.h>

namespace reelsplit::disk {

namespace fs = std::filesystem;

std::expected<std::string, std::error_code> sanitize_file_name(std::string_view name) {
    std::string cleaned;
    cleaned.reserve(name.size());
    for (std::size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (c == '/' || c == '\\' || c == '\0') {
            continue;
        }
        if (c == '.' && i + 1 < name.size() && name[i + 1] == '.') {
            ++i;
            continue;
        }
        cleaned += c;
    }

    auto first = cleaned.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }
    auto last = cleaned.find_last_not_of(" \t\r\n");
    cleaned = cleaned.substr(first, last - first + 1);

    if (cleaned.front() == '.' || cleaned.size() > core::MAX_FILE_NAME_LENGTH) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }
    return cleaned;
}

std::expected<std::uint64_t, std::error_code> file_size(const fs::path& path) noexcept {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::unexpected(make_error_code(DiskErrc::file_not_found));
    }
    auto size = fs::file_size(path, ec);
    if (ec) {
        return std::unexpected(make_error_code(DiskErrc::not_readable));
    }
    return static_cast<std::uint64_t>(size);
}

std::error_code check_readable(const fs::path& path) noexcept {
    std::error_code ec;
    if (!fs::exists(path, ec) || !fs::is_regular_file(path, ec)) {
        return make_error_code(DiskErrc::file_not_found);
    }
    if (::access(path.c_str(), R_OK) != 0) {
        return make_error_code(DiskErrc::not_readable);
    }
    return {};
}

std::error_code ensure_writable_directory(const fs::path& dir) noexcept {
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        fs::create_directories(dir, ec);
        // Another job may have created it in between
        std::error_code dir_ec;
        if (ec && !fs::is_directory(dir, dir_ec)) {
            REELSPLIT_LOG_WARN("Cannot create directory {}: {}", dir.string(), ec.message());
            return make_error_code(DiskErrc::create_failed);
        }
    }
    if (!fs::is_directory(dir, ec)) {
        return make_error_code(DiskErrc::invalid_path);
    }
    if (::access(dir.c_str(), W_OK) != 0) {
        return make_error_code(DiskErrc::not_writable);
    }
    return {};
}

bool remove_file(const fs::path& path) noexcept {
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        REELSPLIT_LOG_WARN("Failed to delete {}: {}", path.string(), ec.message());
        return false;
    }
    return removed;
}

std::uintmax_t remove_tree(const fs::path& dir) noexcept {
    std::error_code ec;
    auto removed = fs::remove_all(dir, ec);
    if (ec) {
        REELSPLIT_LOG_WARN("Failed to delete directory {}: {}", dir.string(), ec.message());
        return 0;
    }
    return removed;
}

} // namespace reelsplit::disk
