#pragma once
#include "catalog/job.hpp"
#include "catalog/track.hpp"
#include "core/config.hpp"
#include "core/result.hpp"
#include "core/time.hpp"
#include "timeline/timeline.hpp"
#include <map>
#include <vector>

namespace tlc::timeline {

struct TimelineKey {
    int layer = 0;
    catalog::Medium medium = catalog::Medium::Video;

    bool operator<(const TimelineKey& o) const {
        if (layer != o.layer) return layer < o.layer;
        return static_cast<int>(medium) < static_cast<int>(o.medium);
    }
    bool operator==(const TimelineKey& o) const { return layer == o.layer && medium == o.medium; }
};

// Iteration order is ascending layer, which is also the compositing order.
using TimelineMap = std::map<TimelineKey, Timeline>;

// Groups tracks into per (layer, medium) timelines and fills coverage holes.
// `tracks` must outlive the returned map (segments point back into it).
TimelineMap build(const std::vector<catalog::Track>& tracks, const FrameRate& fps,
                  const core::Tunables& tunables = core::Tunables::defaults());

// Applies job level gaps after gap filling. Fails when a gap names a timeline that does not exist.
[[nodiscard]] core::VoidResult apply_declared_gaps(TimelineMap& timelines,
                                                   const std::vector<catalog::DeclaredGap>& gaps,
                                                   const FrameRate& fps,
                                                   const core::Tunables& tunables = core::Tunables::defaults());

// Timelines of one medium, ascending by layer.
std::vector<const Timeline*> timelines_of(const TimelineMap& timelines, catalog::Medium medium);

// Longest end across visual timelines (video, image, text); audio only when nothing visual exists.
double total_duration(const TimelineMap& timelines);

} // namespace tlc::timeline
