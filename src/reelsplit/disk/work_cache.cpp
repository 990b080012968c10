// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reelsplit/disk/work_cache.hpp>
#include <reelsplit/disk/file_ops.hpp>
#include <reelsplit/core/log.hpp>
#include <algorithm>
#include <vector>

namespace reelsplit::disk {

namespace fs = std::filesystem;

WorkCache::WorkCache(fs::path root)
    : root_(std::move(root)) {}

std::error_code WorkCache::ensure() const noexcept {
    return ensure_writable_directory(root_);
}

std::expected<fs::path, std::error_code> WorkCache::path_for(std::string_view file_name) const {
    auto sanitized = sanitize_file_name(file_name);
    if (!sanitized) {
        return std::unexpected(sanitized.error());
    }
    auto candidate = root_ / *sanitized;
    if (!contains(candidate)) {
        return std::unexpected(make_error_code(DiskErrc::outside_cache));
    }
    return candidate;
}

bool WorkCache::contains(const fs::path& path) const {
    std::error_code ec;
    auto root = fs::weakly_canonical(root_, ec);
    if (ec) return false;
    auto target = fs::weakly_canonical(path, ec);
    if (ec) return false;

    auto [root_end, target_it] = std::mismatch(root.begin(), root.end(), target.begin(), target.end());
    // Strictly below the root
    return root_end == root.end() && target_it != target.end();
}

std::uint64_t WorkCache::size_bytes() const noexcept {
    std::error_code ec;
    std::uint64_t total = 0;
    if (!fs::exists(root_, ec)) return 0;

    for (auto it = fs::recursive_directory_iterator(root_, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code size_ec;
        if (it->is_regular_file(size_ec)) {
            auto size = it->file_size(size_ec);
            if (!size_ec) total += size;
        }
    }
    return total;
}

std::size_t WorkCache::delete_older_than(std::chrono::hours age) noexcept {
    std::error_code ec;
    if (!fs::exists(root_, ec)) return 0;

    auto cutoff = fs::file_time_type::clock::now() - age;
    std::vector<fs::path> expired;
    for (auto it = fs::directory_iterator(root_, ec);
         !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code time_ec;
        auto modified = it->last_write_time(time_ec);
        if (!time_ec && modified < cutoff) {
            expired.push_back(it->path());
        }
    }

    std::size_t removed = 0;
    for (const auto& path : expired) {
        if (remove_tree(path) > 0) {
            ++removed;
        }
    }
    if (removed > 0) {
        REELSPLIT_LOG_INFO("Pruned {} entries older than {}h from {}", removed, age.count(), root_.string());
    }
    return removed;
}

std::size_t WorkCache::clear() noexcept {
    std::error_code ec;
    if (!fs::exists(root_, ec)) return 0;

    std::vector<fs::path> entries;
    for (auto it = fs::directory_iterator(root_, ec);
         !ec && it != fs::directory_iterator(); it.increment(ec)) {
        entries.push_back(it->path());
    }

    std::size_t removed = 0;
    for (const auto& path : entries) {
        if (remove_tree(path) > 0) {
            ++removed;
        }
    }
    return removed;
}

} // namespace reelsplit::disk
