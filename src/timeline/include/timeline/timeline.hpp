#pragma once
// NOTE: Helper timeline_is_sorted is defined at end of this header; tests rely on it.
#include "catalog/track.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace tlc::timeline {

using SegmentId = uint64_t;

struct Segment {
    SegmentId id = 0;
    const catalog::Track* source = nullptr;   // null for synthesized gaps
    std::optional<std::size_t> origin;        // declaring track; lost by the tail of a split
    catalog::Medium medium = catalog::Medium::Video;
    bool gap = false;
    bool declared = false;                    // gap came from the job, not from gap filling

    double start_time = 0.0;   // timeline position (seconds)
    double duration = 0.0;     // length on the timeline (seconds)

    // Source trim window. source_duration empty means "as long as the timeline window".
    double source_start = 0.0;
    std::optional<double> source_duration;

    double end_time() const { return start_time + duration; }
    double trim_duration() const { return source_duration.value_or(duration); }
};

// Ordered segments of one (layer, medium) pair.
class Timeline {
public:
    Timeline(int layer, catalog::Medium medium);
    ~Timeline() = default;

    int layer() const { return layer_; }
    catalog::Medium medium() const { return medium_; }

    // Adds and re-sorts. Overlap is permitted (audio segments on one layer are mixed).
    SegmentId add_segment(Segment segment);
    const std::vector<Segment>& segments() const { return segments_; }
    const Segment* find_segment(SegmentId id) const;

    double total_duration() const;
    std::size_t gap_count() const;
    bool has_media() const;

    // Walks the sorted segments and closes every hole longer than `epsilon` seconds
    // with a synthesized gap. Shorter holes are snapped by moving the later segment back.
    // Visual timelines also lose their overlaps first (see resolve_overlaps).
    // Returns the number of inserted gaps.
    std::size_t fill_gaps(double epsilon);

    // Inserts a hole of `duration` at `at`. A segment spanning `at` is split in two;
    // every segment starting at or after `at` moves right by `duration`.
    [[nodiscard]] bool insert_gap(double at, double duration, double min_part);

    // Appends a trailing gap so the timeline ends at `total`.
    void pad_to(double total);

    // Drops leading gap segments. Returns the start of the first remaining segment.
    double strip_leading_gaps();

    bool is_non_overlapping() const;
    bool is_contiguous(double tolerance) const;

private:
    int layer_;
    catalog::Medium medium_;
    std::vector<Segment> segments_;  // Always sorted by start_time
    SegmentId next_segment_id_ = 1;

    void sort_segments();
    Segment make_gap(double start, double duration, bool declared);
    // Visual timelines are concatenated: clips are cut at the next clip's start and
    // gap segments are clipped to the stretches no clip covers.
    void resolve_overlaps(double epsilon);
    [[nodiscard]] bool split_segment(std::size_t index, double split_time, double min_part);
};

// Free helper (used by tests) to verify segments sorted by start time
inline bool timeline_is_sorted(const Timeline& tl) {
    const auto& segs = tl.segments();
    for (std::size_t i = 1; i < segs.size(); ++i) {
        if (segs[i - 1].start_time > segs[i].start_time) return false;
    }
    return true;
}

} // namespace tlc::timeline
