// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reelsplit/store/segment_store.hpp>
#include <reelsplit/core/config.hpp>
#include <reelsplit/core/id.hpp>
#include <reelsplit/core/log.hpp>
#include <reelsplit/disk/file_ops.hpp>
#include <algorithm>
#include <spdlog/fmt/fmt.h>

namespace reelsplit::store {

using core::AppError;
using core::ErrorKind;

namespace {

AppError invalid(std::string message) {
    return core::make_error(ErrorKind::invalid_input, std::move(message), std::nullopt, false);
}

double to_seconds(std::int64_t ms) noexcept {
    return static_cast<double>(ms) / 1000.0;
}

} // namespace

//=============================================================================
// StoreSnapshot
//=============================================================================

std::optional<Segment> StoreSnapshot::find(const std::string& id) const {
    auto it = segments.find(id);
    if (it == segments.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Segment> StoreSnapshot::segments_for(const std::string& video_id) const {
    std::vector<Segment> result;
    auto it = by_video.find(video_id);
    if (it == by_video.end()) {
        return result;
    }
    result.reserve(it->second.size());
    for (const auto& id : it->second) {
        result.push_back(segments.at(id));
    }
    return result;
}

//=============================================================================
// SegmentStore
//=============================================================================

SegmentStore::SegmentStore()
    : snapshot_(std::make_shared<const StoreSnapshot>()) {}

std::expected<std::vector<Segment>, AppError>
SegmentStore::insert(const std::string& video_id, const std::vector<SplitPart>& parts) {
    if (video_id.empty()) {
        return std::unexpected(invalid("Video id must not be empty"));
    }
    if (parts.empty()) {
        return std::unexpected(invalid("A split result needs at least one part"));
    }

    const auto total = static_cast<std::uint32_t>(parts.size());
    std::vector<bool> seen(total + 1, false);
    for (const auto& part : parts) {
        if (part.total_parts != total || part.part_number < 1 || part.part_number > total ||
            seen[part.part_number]) {
            return std::unexpected(invalid(fmt::format(
                "Parts for video {} are not numbered 1..{}", video_id, total)));
        }
        if (part.end_ms < part.start_ms) {
            return std::unexpected(invalid("Part ends before it starts"));
        }
        seen[part.part_number] = true;
    }

    std::vector<Segment> created;
    created.reserve(parts.size());
    for (const auto& part : parts) {
        Segment seg;
        seg.id = core::generate_id();
        seg.video_id = video_id;
        seg.part_number = part.part_number;
        seg.total_parts = part.total_parts;
        seg.file_path = part.file_path;
        seg.start_offset_seconds = to_seconds(part.start_ms);
        seg.end_offset_seconds = to_seconds(part.end_ms);
        seg.duration_seconds = seg.end_offset_seconds - seg.start_offset_seconds;
        seg.size_bytes = part.size_bytes;
        created.push_back(std::move(seg));
    }
    std::sort(created.begin(), created.end(),
              [](const Segment& a, const Segment& b) { return a.part_number < b.part_number; });

    SnapshotPtr snap;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (index_.contains(video_id)) {
            return std::unexpected(invalid(fmt::format("Video {} already has segments", video_id)));
        }
        auto& ids = index_[video_id];
        for (const auto& seg : created) {
            segments_.emplace(seg.id, seg);
            ids.insert(seg.id);
        }
        snap = rebuild_locked();
    }

    REELSPLIT_LOG_DEBUG("Stored {} segments for video {}", created.size(), video_id);
    notify(snap);
    return created;
}

std::optional<Segment> SegmentStore::find(const std::string& id) const {
    return snapshot()->find(id);
}

std::vector<Segment> SegmentStore::segments_for(const std::string& video_id) const {
    return snapshot()->segments_for(video_id);
}

std::vector<std::string> SegmentStore::video_ids() const {
    auto snap = snapshot();
    std::vector<std::string> ids;
    ids.reserve(snap->by_video.size());
    for (const auto& [video_id, segment_ids] : snap->by_video) {
        ids.push_back(video_id);
    }
    return ids;
}

std::expected<Segment, AppError> SegmentStore::mark_shared(const std::string& id) {
    SnapshotPtr snap;
    Segment updated;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = segments_.find(id);
        if (it == segments_.end()) {
            return std::unexpected(core::make_error(
                ErrorKind::storage, "Segment not found: " + id, std::nullopt, false));
        }
        if (it->second.shared) {
            return it->second;
        }
        it->second.shared = true;
        updated = it->second;
        snap = rebuild_locked();
    }
    notify(snap);
    return updated;
}

std::vector<Segment> SegmentStore::remove_video(const std::string& video_id) {
    std::vector<Segment> removed;
    SnapshotPtr snap;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(video_id);
        if (it == index_.end()) {
            return removed;
        }
        removed.reserve(it->second.size());
        for (const auto& id : it->second) {
            auto seg = segments_.find(id);
            if (seg != segments_.end()) {
                removed.push_back(std::move(seg->second));
                segments_.erase(seg);
            }
        }
        index_.erase(it);
        snap = rebuild_locked();
    }
    std::sort(removed.begin(), removed.end(),
              [](const Segment& a, const Segment& b) { return a.part_number < b.part_number; });
    notify(snap);
    return removed;
}

std::vector<Segment> SegmentStore::delete_video(const std::string& video_id) {
    auto removed = remove_video(video_id);

    const auto dir_name = std::string(core::SEGMENT_DIR_PREFIX) + video_id;
    std::set<std::filesystem::path> dirs;
    for (const auto& seg : removed) {
        disk::remove_file(seg.file_path);
        auto parent = seg.file_path.parent_path();
        if (parent.filename() == dir_name) {
            dirs.insert(parent);
        }
    }
    for (const auto& dir : dirs) {
        disk::remove_tree(dir);
    }

    if (!removed.empty()) {
        REELSPLIT_LOG_INFO("Deleted video {} ({} segments)", video_id, removed.size());
    }
    return removed;
}

SnapshotPtr SegmentStore::snapshot() const noexcept {
    return snapshot_.load(std::memory_order_acquire);
}

core::SubscriptionToken SegmentStore::subscribe(Listener listener) {
    return feed_.subscribe(std::move(listener));
}

void SegmentStore::unsubscribe(core::SubscriptionToken token) {
    feed_.unsubscribe(token);
}

SnapshotPtr SegmentStore::rebuild_locked() {
    auto next = std::make_shared<StoreSnapshot>();
    next->version = ++version_;
    for (const auto& [id, seg] : segments_) {
        next->segments.emplace(id, seg);
    }
    for (const auto& [video_id, ids] : index_) {
        std::vector<std::string> ordered(ids.begin(), ids.end());
        std::sort(ordered.begin(), ordered.end(), [&](const std::string& a, const std::string& b) {
            return segments_.at(a).part_number < segments_.at(b).part_number;
        });
        next->by_video.emplace(video_id, std::move(ordered));
    }
    SnapshotPtr published = std::move(next);
    snapshot_.store(published, std::memory_order_release);
    return published;
}

void SegmentStore::notify(const SnapshotPtr& snap) {
    std::lock_guard<std::mutex> lock(notify_mutex_);
    // A slower writer may arrive after a newer snapshot went out
    if (snap->version <= notified_version_) {
        return;
    }
    notified_version_ = snap->version;
    feed_.publish(snap);
}

} // namespace reelsplit::store
