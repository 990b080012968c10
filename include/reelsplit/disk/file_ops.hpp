// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reelsplit/disk/error.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace reelsplit::disk {

// Strips path separators, "..", NUL and surrounding whitespace. Rejects names
// that end up blank, hidden (leading '.') or longer than 255 bytes.
[[nodiscard]] std::expected<std::string, std::error_code> sanitize_file_name(std::string_view name);

[[nodiscard]] std::expected<std::uint64_t, std::error_code>
file_size(const std::filesystem::path& path) noexcept;

// file_not_found, not_readable or success
[[nodiscard]] std::error_code check_readable(const std::filesystem::path& path) noexcept;

// Creates the directory if needed and confirms it is writable
[[nodiscard]] std::error_code ensure_writable_directory(const std::filesystem::path& dir) noexcept;

// Removes a file, logging instead of failing. True when something was removed.
bool remove_file(const std::filesystem::path& path) noexcept;

// Removes a directory tree, logging instead of failing. Returns entries removed.
std::uintmax_t remove_tree(const std::filesystem::path& dir) noexcept;

} // namespace reelsplit::disk
