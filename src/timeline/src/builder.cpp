#include "timeline/builder.hpp"
#include "core/log.hpp"
#include <algorithm>

namespace tlc::timeline {

TimelineMap build(const std::vector<catalog::Track>& tracks, const FrameRate& fps,
                  const core::Tunables& tunables) {
    TimelineMap out;
    for (const auto& t : tracks) {
        const auto medium = t.medium();
        if (!t.desc.visible && medium != catalog::Medium::Audio) {
            log::debug("Dropping invisible track " + std::to_string(t.index));
            continue;
        }

        const double start = frames_to_seconds(t.desc.timeline_start_frame, fps);
        const double duration = frames_to_seconds(t.desc.timeline_end_frame - t.desc.timeline_start_frame, fps);
        if (duration <= 0.0) {
            log::warn("Skipping " + std::string(catalog::kind_name(t.kind)) + " track " + std::to_string(t.index) +
                      " (" + t.desc.path + "): non-positive timeline duration");
            continue;
        }

        Segment seg;
        seg.source = t.is_gap() ? nullptr : &t;
        seg.origin = t.index;
        seg.gap = t.is_gap();
        seg.declared = t.is_gap();
        seg.start_time = start;
        seg.duration = duration;
        if (!seg.gap) {
            seg.source_start = std::max(0.0, t.desc.start_time.value_or(0.0));
            if (t.desc.duration && *t.desc.duration > 0.0) seg.source_duration = *t.desc.duration;
        }

        TimelineKey key{t.desc.layer, medium};
        auto it = out.find(key);
        if (it == out.end()) it = out.emplace(key, Timeline(key.layer, key.medium)).first;
        it->second.add_segment(std::move(seg));
    }

    const double epsilon = tunables.gap_epsilon_frames * frame_duration(fps);
    for (auto& [key, tl] : out) {
        // Stills and captions are positioned individually, not concatenated
        if (key.medium == catalog::Medium::Image || key.medium == catalog::Medium::Text) continue;
        std::size_t filled = tl.fill_gaps(epsilon);
        if (filled > 0) {
            log::debug("Layer " + std::to_string(key.layer) + " " + catalog::medium_name(key.medium) +
                       ": filled " + std::to_string(filled) + " gap(s)");
        }
    }
    return out;
}

core::VoidResult apply_declared_gaps(TimelineMap& timelines, const std::vector<catalog::DeclaredGap>& gaps,
                                     const FrameRate& fps, const core::Tunables& tunables) {
    // Apply right to left so earlier insertions do not move later anchors
    std::vector<catalog::DeclaredGap> ordered = gaps;
    std::stable_sort(ordered.begin(), ordered.end(), [](const catalog::DeclaredGap& a, const catalog::DeclaredGap& b) {
        return a.start_frame > b.start_frame;
    });

    for (const auto& g : ordered) {
        auto it = timelines.find(TimelineKey{g.layer, g.medium});
        if (it == timelines.end()) {
            return core::Error<bool>("declared gap targets missing timeline (layer " + std::to_string(g.layer) +
                                    ", " + catalog::medium_name(g.medium) + ")");
        }
        const double at = frames_to_seconds(g.start_frame, fps);
        const double length = frames_to_seconds(g.length_frames, fps);
        if (!it->second.insert_gap(at, length, tunables.min_split_duration)) {
            return core::Error<bool>("invalid declared gap at frame " + std::to_string(g.start_frame) +
                                    " length " + std::to_string(g.length_frames));
        }
    }
    return core::Ok();
}

std::vector<const Timeline*> timelines_of(const TimelineMap& timelines, catalog::Medium medium) {
    std::vector<const Timeline*> out;
    for (const auto& [key, tl] : timelines) {
        if (key.medium == medium) out.push_back(&tl);
    }
    return out;
}

double total_duration(const TimelineMap& timelines) {
    double visual = 0.0;
    double audio = 0.0;
    for (const auto& [key, tl] : timelines) {
        if (key.medium == catalog::Medium::Audio) audio = std::max(audio, tl.total_duration());
        else visual = std::max(visual, tl.total_duration());
    }
    return visual > 0.0 ? visual : audio;
}

} // namespace tlc::timeline
