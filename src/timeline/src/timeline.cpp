#include "timeline/timeline.hpp"
#include "core/log_config.hpp"
#include "core/time.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace tlc::timeline {

namespace {
#ifdef TLC_TIMELINE_DEBUG
std::string dump(const std::vector<Segment>& segs) {
    std::string out;
    for (const auto& s : segs) {
        out += " (id=" + std::to_string(s.id) + (s.gap ? " gap" : "") +
               " st=" + format_seconds(s.start_time) + " end=" + format_seconds(s.end_time()) + ")";
    }
    return out;
}
#endif
} // namespace

Timeline::Timeline(int layer, catalog::Medium medium)
    : layer_(layer), medium_(medium) {
}

SegmentId Timeline::add_segment(Segment segment) {
    if (segment.id == 0) {
        segment.id = next_segment_id_++;
    } else if (segment.id >= next_segment_id_) {
        // Keep next_segment_id_ ahead of any explicitly provided IDs
        next_segment_id_ = segment.id + 1;
    }
    segment.medium = medium_;
    SegmentId id = segment.id;
    segments_.push_back(std::move(segment));
    sort_segments();
#ifdef TLC_TIMELINE_DEBUG
    TLC_TL_DEBUG("[Timeline::add_segment] layer=" + std::to_string(layer_) + dump(segments_));
#endif
    return id;
}

const Segment* Timeline::find_segment(SegmentId id) const {
    for (const auto& s : segments_) {
        if (s.id == id) return &s;
    }
    return nullptr;
}

double Timeline::total_duration() const {
    double total = 0.0;
    for (const auto& s : segments_) total = std::max(total, s.end_time());
    return total;
}

std::size_t Timeline::gap_count() const {
    return static_cast<std::size_t>(std::count_if(segments_.begin(), segments_.end(),
        [](const Segment& s) { return s.gap; }));
}

bool Timeline::has_media() const {
    return std::any_of(segments_.begin(), segments_.end(), [](const Segment& s) { return !s.gap; });
}

Segment Timeline::make_gap(double start, double duration, bool declared) {
    Segment g;
    g.id = next_segment_id_++;
    g.medium = medium_;
    g.gap = true;
    g.declared = declared;
    g.start_time = start;
    g.duration = duration;
    return g;
}

void Timeline::resolve_overlaps(double epsilon) {
    std::vector<Segment> media;
    std::vector<Segment> gaps;
    for (auto& s : segments_) (s.gap ? gaps : media).push_back(std::move(s));

    // A later clip cuts the one before it short
    std::vector<Segment> kept;
    kept.reserve(media.size());
    for (std::size_t i = 0; i < media.size(); ++i) {
        Segment& s = media[i];
        if (i + 1 < media.size() && s.end_time() > media[i + 1].start_time) {
            const double cut = media[i + 1].start_time - s.start_time;
            if (cut <= epsilon) {
                TLC_TL_DEBUG("[Timeline::resolve_overlaps] dropping segment id=" + std::to_string(s.id));
                continue;
            }
            s.source_duration = std::min(s.trim_duration(), cut);
            s.duration = cut;
        }
        kept.push_back(std::move(s));
    }

    // Gap markers only keep the stretches no clip covers
    std::vector<Segment> pieces;
    for (const auto& g : gaps) {
        double from = g.start_time;
        const double to = g.end_time();
        bool first = true;
        auto keep_piece = [&](double a, double b) {
            Segment piece = g;
            if (!first) piece.id = next_segment_id_++;
            first = false;
            piece.start_time = a;
            piece.duration = b - a;
            pieces.push_back(std::move(piece));
        };
        for (const Segment& m : kept) {
            if (m.end_time() <= from) continue;
            if (m.start_time >= to) break;
            if (m.start_time - from > epsilon) keep_piece(from, m.start_time);
            from = std::max(from, m.end_time());
        }
        if (to - from > epsilon) keep_piece(from, to);
    }
    for (auto& p : pieces) kept.push_back(std::move(p));
    segments_ = std::move(kept);
    sort_segments();
}

std::size_t Timeline::fill_gaps(double epsilon) {
    sort_segments();
    if (medium_ != catalog::Medium::Audio) resolve_overlaps(epsilon);
    std::vector<Segment> filled;
    filled.reserve(segments_.size() * 2);

    double current = 0.0;
    std::size_t inserted = 0;
    for (auto seg : segments_) {
        if (seg.gap && seg.start_time < current && medium_ != catalog::Medium::Audio) {
            // Overlapping gap markers: keep only what extends past the covered range
            const double end = seg.end_time();
            if (end - current <= epsilon) continue;
            seg.start_time = current;
            seg.duration = end - current;
        }
        const double hole = seg.start_time - current;
        if (hole > epsilon) {
            filled.push_back(make_gap(current, hole, false));
            ++inserted;
        } else if (hole > 0.0) {
            TLC_TL_DEBUG("[Timeline::fill_gaps] snapping " + format_seconds(hole) + "s hole");
            seg.start_time = current;
        }
        current = std::max(current, seg.end_time());
        filled.push_back(std::move(seg));
    }
    segments_ = std::move(filled);
#ifdef TLC_TIMELINE_DEBUG
    TLC_TL_DEBUG("[Timeline::fill_gaps] layer=" + std::to_string(layer_) + dump(segments_));
#endif
    return inserted;
}

bool Timeline::split_segment(std::size_t index, double split_time, double min_part) {
    if (index >= segments_.size()) {
        return false;
    }
    Segment original = segments_[index];
    if (split_time <= original.start_time || split_time >= original.end_time()) {
        return false;
    }

    const double offset = split_time - original.start_time;
    Segment head = original;
    head.duration = offset;
    if (!head.gap) head.source_duration = offset;

    Segment tail = original;
    tail.id = next_segment_id_++;
    tail.start_time = split_time;
    tail.duration = original.end_time() - split_time;
    if (!tail.gap) {
        tail.origin.reset();
        tail.source_start = original.source_start + offset;
        tail.source_duration = original.trim_duration() - offset;
    }

    segments_.erase(segments_.begin() + static_cast<std::ptrdiff_t>(index));
    if (head.duration >= min_part) segments_.push_back(head);
    if (tail.duration >= min_part) segments_.push_back(tail);
    sort_segments();
    return true;
}

bool Timeline::insert_gap(double at, double duration, double min_part) {
    if (duration <= 0.0 || at < 0.0) {
        return false;
    }
    at = std::min(at, total_duration());  // past the end appends
#ifdef TLC_TIMELINE_DEBUG
    TLC_TL_DEBUG("[Timeline::insert_gap] at=" + format_seconds(at) + " dur=" + format_seconds(duration) + dump(segments_));
#endif
    for (std::size_t i = 0; i < segments_.size(); ++i) {
        const auto& s = segments_[i];
        if (at > s.start_time && at < s.end_time()) {
            if (!split_segment(i, at, min_part)) return false;
            break;
        }
    }
    for (auto& s : segments_) {
        if (s.start_time >= at) s.start_time += duration;
    }
    segments_.push_back(make_gap(at, duration, true));
    sort_segments();
#ifdef TLC_TIMELINE_DEBUG
    TLC_TL_DEBUG("[Timeline::insert_gap] after:" + dump(segments_));
#endif
    return true;
}

void Timeline::pad_to(double total) {
    const double end = total_duration();
    if (total - end > 1e-9) {
        segments_.push_back(make_gap(end, total - end, false));
        sort_segments();
    }
}

double Timeline::strip_leading_gaps() {
    auto first_media = std::find_if(segments_.begin(), segments_.end(), [](const Segment& s) { return !s.gap; });
    segments_.erase(segments_.begin(), first_media);
    return segments_.empty() ? 0.0 : segments_.front().start_time;
}

void Timeline::sort_segments() {
    std::stable_sort(segments_.begin(), segments_.end(),
        [](const Segment& a, const Segment& b) { return a.start_time < b.start_time; });
}

bool Timeline::is_non_overlapping() const {
    for (std::size_t i = 1; i < segments_.size(); ++i) {
        if (segments_[i].start_time < segments_[i - 1].end_time() - 1e-9) return false;
    }
    return true;
}

bool Timeline::is_contiguous(double tolerance) const {
    double current = 0.0;
    for (const auto& s : segments_) {
        if (std::abs(s.start_time - current) > tolerance) return false;
        current = s.end_time();
    }
    return true;
}

} // namespace tlc::timeline
