// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reelsplit/core/error.hpp>
#include <reelsplit/core/observable.hpp>
#include <reelsplit/store/segment.hpp>
#include <atomic>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace reelsplit::store {

// Immutable view published after every mutation
struct StoreSnapshot {
    std::uint64_t version{0};
    std::map<std::string, Segment> segments;                    // by id
    std::map<std::string, std::vector<std::string>> by_video;   // ids in part order

    [[nodiscard]] std::optional<Segment> find(const std::string& id) const;
    [[nodiscard]] std::vector<Segment> segments_for(const std::string& video_id) const;
};

using SnapshotPtr = std::shared_ptr<const StoreSnapshot>;

// In-memory segment repository shared by every job. Writers serialize on one
// lock that guards both the primary map and the video index; readers use the
// published snapshot and never block on writers. No file I/O happens under
// the lock.
class SegmentStore {
public:
    using Listener = std::function<void(const SnapshotPtr&)>;

    SegmentStore();

    SegmentStore(const SegmentStore&) = delete;
    SegmentStore& operator=(const SegmentStore&) = delete;

    // Gives each part an id and indexes the set under video_id. The parts
    // must number 1..N with matching totals and the video must be new.
    [[nodiscard]] std::expected<std::vector<Segment>, core::AppError>
    insert(const std::string& video_id, const std::vector<SplitPart>& parts);

    [[nodiscard]] std::optional<Segment> find(const std::string& id) const;

    // Ordered by part number
    [[nodiscard]] std::vector<Segment> segments_for(const std::string& video_id) const;

    [[nodiscard]] std::vector<std::string> video_ids() const;

    [[nodiscard]] std::expected<Segment, core::AppError> mark_shared(const std::string& id);

    // Unindexes the video's segments and returns them. Files are untouched.
    std::vector<Segment> remove_video(const std::string& video_id);

    // remove_video() plus deletion of the backing files and the video's
    // segments_<id> directory, done after the lock is released.
    std::vector<Segment> delete_video(const std::string& video_id);

    [[nodiscard]] SnapshotPtr snapshot() const noexcept;

    // Listeners run on the mutating thread and must not write to the store
    [[nodiscard]] core::SubscriptionToken subscribe(Listener listener);
    void unsubscribe(core::SubscriptionToken token);

private:
    SnapshotPtr rebuild_locked();
    void notify(const SnapshotPtr& snap);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Segment> segments_;
    std::unordered_map<std::string, std::set<std::string>> index_;
    std::uint64_t version_{0};

    std::atomic<SnapshotPtr> snapshot_;

    std::mutex notify_mutex_;
    std::uint64_t notified_version_{0};
    core::Observable<SnapshotPtr> feed_;
};

} // namespace reelsplit::store
