#include "negotiate/negotiator.hpp"
#include "core/log.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace tlc::negotiate {

namespace {

constexpr double kFallbackRatio = 16.0 / 9.0;

bool parse_number(const std::string& s, double& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    out = std::strtod(s.c_str(), &end);
    return end == s.c_str() + s.size() && std::isfinite(out);
}

// First segment of the lowest video layer that carries media.
const timeline::Segment* primary_segment(const timeline::TimelineMap& timelines) {
    for (const auto* tl : timeline::timelines_of(timelines, catalog::Medium::Video)) {
        for (const auto& s : tl->segments()) {
            if (!s.gap && s.source) return &s;
        }
    }
    return nullptr;
}

} // namespace

const char* policy_name(CropPolicy p) noexcept {
    switch (p) {
        case CropPolicy::NoOp: return "no-op";
        case CropPolicy::LetterboxOnly: return "letterbox";
        case CropPolicy::Crop: return "crop";
        case CropPolicy::Bypass: return "bypass";
    }
    return "unknown";
}

double parse_aspect_ratio(const std::string& aspect) {
    auto colon = aspect.find(':');
    if (colon == std::string::npos || aspect.find(':', colon + 1) != std::string::npos) {
        log::warn("Invalid aspect ratio format: '" + aspect + "', using 16:9");
        return kFallbackRatio;
    }
    double w = 0.0, h = 0.0;
    if (!parse_number(aspect.substr(0, colon), w) || !parse_number(aspect.substr(colon + 1), h) || h == 0.0 || w <= 0.0) {
        log::warn("Invalid aspect ratio values: '" + aspect + "', using 16:9");
        return kFallbackRatio;
    }
    return w / h;
}

Canvas working_canvas(const timeline::TimelineMap& timelines, const catalog::Job& job) {
    if (job.export_size && job.export_size->valid()) {
        return *job.export_size;
    }
    // First declared video in declaration order, whatever layer it sits on
    const catalog::Track* first = nullptr;
    for (const auto* tl : timeline::timelines_of(timelines, catalog::Medium::Video)) {
        for (const auto& s : tl->segments()) {
            if (s.gap || !s.source || !s.source->desc.has_dimensions()) continue;
            if (!first || s.source->index < first->index) first = s.source;
        }
    }
    if (first) {
        return Canvas{*first->desc.width, *first->desc.height};
    }
    return job.tunables.default_canvas;
}

Canvas desired_canvas(const Canvas& working, const catalog::Job& job) {
    if (job.output_size && job.output_size->valid()) {
        return *job.output_size;
    }
    if (job.aspect && !job.aspect->empty()) {
        const double ratio = parse_aspect_ratio(*job.aspect);
        int width = static_cast<int>(std::lround(working.height * ratio));
        width -= width % 2;
        if (width > 0) return Canvas{width, working.height};
    }
    return working;
}

CropPolicy choose_policy(const Canvas& source, const Canvas& desired, double tolerance) {
    const double src = source.ratio();
    const double dst = desired.ratio();
    if (src <= 0.0 || dst <= 0.0) return CropPolicy::NoOp;
    if (std::abs(dst - src) / src <= tolerance) return CropPolicy::NoOp;
    const bool portrait_to_landscape = src < 1.0 && dst > 1.0;
    const bool landscape_to_portrait = src > 1.0 && dst < 1.0;
    if (portrait_to_landscape || landscape_to_portrait) return CropPolicy::LetterboxOnly;
    return CropPolicy::Crop;
}

int pan_offset(int range, double pan) noexcept {
    if (range <= 0) return 0;
    if (pan == 0.0) return static_cast<int>(std::lround(range / 2.0));
    const double normalized = (pan + 1.0) / 2.0;
    const int offset = static_cast<int>(std::lround(range * (1.0 - normalized)));
    return std::clamp(offset, 0, range);
}

CropRect compute_crop(const Canvas& source, double desired_ratio, double pan_x, double pan_y) {
    CropRect r;
    if (desired_ratio > source.ratio()) {
        // Wider target: keep the width, cut the height
        r.width = source.width;
        r.height = static_cast<int>(std::lround(r.width / desired_ratio));
        if (r.height > source.height) {
            r.height = source.height;
            r.width = static_cast<int>(std::lround(r.height * desired_ratio));
        }
        r.height = static_cast<int>(std::lround(r.width / desired_ratio));
    } else {
        r.height = source.height;
        r.width = static_cast<int>(std::lround(r.height * desired_ratio));
        if (r.width > source.width) {
            r.width = source.width;
            r.height = static_cast<int>(std::lround(r.width / desired_ratio));
        }
        r.width = static_cast<int>(std::lround(r.height * desired_ratio));
    }
    r.width = std::min(r.width, source.width);
    r.height = std::min(r.height, source.height);
    r.x = pan_offset(source.width - r.width, pan_x);
    r.y = pan_offset(source.height - r.height, pan_y);
    return r;
}

Negotiation negotiate(const timeline::TimelineMap& timelines, const catalog::Job& job) {
    Negotiation n;
    n.working = working_canvas(timelines, job);
    n.desired = desired_canvas(n.working, job);

    const timeline::Segment* primary = primary_segment(timelines);
    const catalog::Transform tf = (primary && primary->source->desc.transform)
                                      ? *primary->source->desc.transform : catalog::Transform{};

    if (primary && tf.scale != 1.0) {
        n.policy = CropPolicy::Bypass;
        log::debug("Primary track " + std::to_string(primary->source->index) +
                   " scales itself; skipping aspect negotiation");
        return n;
    }

    n.policy = choose_policy(n.working, n.desired, job.tunables.aspect_tolerance);
    if (n.policy == CropPolicy::Crop) {
        n.crop = compute_crop(n.working, n.desired.ratio(), tf.x, tf.y);
        if (primary && (tf.x != 0.0 || tf.y != 0.0)) n.pan_track = primary->source->index;
    } else if (primary && (tf.x != 0.0 || tf.y != 0.0)) {
        // Nothing to pan: the position is rendered by the transform path instead
        n.policy = CropPolicy::Bypass;
    }

    log::debug("Canvas: working " + n.working.to_string() + ", desired " + n.desired.to_string() +
               ", policy " + policy_name(n.policy) +
               (n.crop ? ", crop " + std::to_string(n.crop->width) + "x" + std::to_string(n.crop->height) +
                             "+" + std::to_string(n.crop->x) + "+" + std::to_string(n.crop->y)
                       : std::string()));
    return n;
}

} // namespace tlc::negotiate
