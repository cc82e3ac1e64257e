#pragma once
#include "catalog/job.hpp"
#include "core/geometry.hpp"
#include "timeline/builder.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace tlc::negotiate {

enum class CropPolicy {
    NoOp,           // ratios already compatible
    LetterboxOnly,  // orientation flip: final resize pads, nothing is cropped
    Crop,           // crop to the exact desired ratio, then resize
    Bypass          // primary track scales itself on its own background canvas
};

const char* policy_name(CropPolicy p) noexcept;

struct Negotiation {
    Canvas working;
    Canvas desired;
    CropPolicy policy = CropPolicy::NoOp;
    std::optional<CropRect> crop;
    // Track whose position transform was consumed as the crop pan. It is rendered untransformed.
    std::optional<std::size_t> pan_track;

    Canvas post_crop() const { return crop ? Canvas{crop->width, crop->height} : working; }
    bool needs_final_resize() const { return desired != post_crop(); }
};

// "16:9" -> 1.777..; malformed input logs a warning and yields 16/9.
double parse_aspect_ratio(const std::string& aspect);

Canvas working_canvas(const timeline::TimelineMap& timelines, const catalog::Job& job);
Canvas desired_canvas(const Canvas& working, const catalog::Job& job);

CropPolicy choose_policy(const Canvas& source, const Canvas& desired, double tolerance);

// Offset of a crop window inside `range` spare pixels. pan +1 -> 0 (left/top), -1 -> range.
int pan_offset(int range, double pan) noexcept;

// Largest window of exactly `desired_ratio` inside `source`, positioned by pan.
CropRect compute_crop(const Canvas& source, double desired_ratio, double pan_x = 0.0, double pan_y = 0.0);

Negotiation negotiate(const timeline::TimelineMap& timelines, const catalog::Job& job);

} // namespace tlc::negotiate
