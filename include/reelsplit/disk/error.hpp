// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>

namespace reelsplit::disk {

enum class DiskErrc {
    success = 0,
    file_not_found,
    access_denied,
    not_readable,
    not_writable,
    disk_full,
    invalid_path,
    create_failed,
    write_error,
    empty_file,
    outside_cache,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "reelsplit::disk";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:         return "Success";
            case DiskErrc::file_not_found:  return "File not found";
            case DiskErrc::access_denied:   return "Access denied";
            case DiskErrc::not_readable:    return "File is not readable";
            case DiskErrc::not_writable:    return "Directory is not writable";
            case DiskErrc::disk_full:       return "Disk full";
            case DiskErrc::invalid_path:    return "Invalid path";
            case DiskErrc::create_failed:   return "Could not create directory";
            case DiskErrc::write_error:     return "Write error";
            case DiskErrc::empty_file:      return "File is empty";
            case DiskErrc::outside_cache:   return "Path escapes the cache directory";
            default:                        return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DiskErrcCategory& disk_errc_category() noexcept {
    static detail::DiskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

} // namespace reelsplit::disk

namespace std {

template<>
struct is_error_code_enum<reelsplit::disk::DiskErrc> : true_type {};

} // namespace std
