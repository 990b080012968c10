// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reelsplit/disk/error.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string_view>

namespace reelsplit::disk {

// Working directory that holds downloaded videos between runs
class WorkCache {
public:
    explicit WorkCache(std::filesystem::path root);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    [[nodiscard]] std::error_code ensure() const noexcept;

    // Sanitized path inside the cache; refuses anything that resolves outside it
    [[nodiscard]] std::expected<std::filesystem::path, std::error_code>
    path_for(std::string_view file_name) const;

    [[nodiscard]] bool contains(const std::filesystem::path& path) const;

    [[nodiscard]] std::uint64_t size_bytes() const noexcept;

    // Removes top-level entries last modified before now - age
    std::size_t delete_older_than(std::chrono::hours age) noexcept;

    std::size_t clear() noexcept;

private:
    std::filesystem::path root_;
};

} // namespace reelsplit::disk
