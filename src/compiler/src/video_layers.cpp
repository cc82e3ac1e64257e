#include "compile_context.hpp"
#include "core/log_config.hpp"
#include "core/time.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace tlc::compiler::detail {

namespace {

struct LayerStream {
    graph::Label label;
    double start = 0.0;
    double end = 0.0;
};

std::string canvas_size(const Canvas& c) {
    return std::to_string(c.width) + "x" + std::to_string(c.height);
}

std::string trim_chain(const timeline::Segment& s) {
    std::string chain = "trim=";
    if (s.source_start > 0.0) chain += "start=" + format_seconds(s.source_start) + ":";
    chain += "duration=" + format_seconds(s.trim_duration()) + ",setpts=PTS-STARTPTS";
    return chain;
}

std::string flat_color(const CompileContext& ctx, double duration, bool transparent) {
    std::string chain = "color=" + (transparent ? std::string("black@0.0") : ctx.tunables.fill_color) +
                        ":size=" + canvas_size(ctx.negotiation.working) +
                        ":duration=" + format_seconds(duration) + ":rate=" + ctx.rate;
    if (transparent) chain += ",format=yuva420p";
    return chain;
}

graph::Label gap_clip(CompileContext& ctx, double duration, bool transparent) {
    return ctx.graph.source(flat_color(ctx, duration, transparent) + ",setpts=PTS-STARTPTS,setsar=1", "gap");
}

// Video placed on its own canvas-sized background at the transform position.
graph::Label transform_path(CompileContext& ctx, const timeline::Segment& seg, graph::Label in,
                            const catalog::Transform& tf, bool native, bool base) {
    const Canvas& W = ctx.negotiation.working;
    graph::Label bg = ctx.graph.source(flat_color(ctx, seg.duration, !base) + ",setpts=PTS-STARTPTS,setsar=1", "bg");

    graph::Label l = in;
    if (!native) {
        hw::ScaleOptions opts;
        opts.pad_color = ctx.tunables.fill_color;
        l = ctx.variants.scale(ctx.graph, l, W, opts);
    }
    if (tf.scale != 1.0 && tf.scale > 0.0) {
        Canvas scaled{std::max(2, static_cast<int>(std::lround(W.width * tf.scale))),
                      std::max(2, static_cast<int>(std::lround(W.height * tf.scale)))};
        hw::ScaleOptions opts;
        opts.pad = false;
        l = ctx.variants.scale(ctx.graph, l, scaled, opts);
    }

    hw::OverlayPlacement at;
    at.x = position_expr(tf.x, "W", "w");
    at.y = position_expr(tf.y, "H", "h");
    TLC_GRAPH_DEBUG("Transform path for track " + std::to_string(seg.source->index) + " at " + at.x + ":" + at.y);
    return ctx.variants.overlay(ctx.graph, bg, l, at);
}

std::optional<graph::Label> normalize_media(CompileContext& ctx, const timeline::Segment& seg, bool base, bool pad_upper) {
    const catalog::Track& t = *seg.source;
    auto idx = ctx.inputs.resolve_video(seg.origin, t.desc.path);
    if (!idx) {
        log::warn("Skipping video segment at " + format_timecode(seg.start_time) + ": no input matches '" + t.desc.path + "'");
        ++ctx.skipped;
        return std::nullopt;
    }

    const Canvas& W = ctx.negotiation.working;
    graph::Label l = ctx.graph.append(ctx.graph.input(*idx, graph::StreamType::Video), trim_chain(seg), "trim");

    const bool native = t.desc.has_dimensions() && Canvas{*t.desc.width, *t.desc.height} == W;
    const catalog::Transform tf = t.desc.transform.value_or(catalog::Transform{});
    const bool transformed = tf.moves_or_scales() && ctx.negotiation.pan_track != t.index;

    if (transformed) {
        l = transform_path(ctx, seg, l, tf, native, base);
    } else if (!native) {
        hw::ScaleOptions opts;
        opts.pad = base || pad_upper;
        if (base) {
            opts.pad_color = ctx.tunables.fill_color;
        } else {
            // Upper layers must stay see-through outside their content
            opts.pad_color = "black@0.0";
            opts.pad_format = "yuva420p";
        }
        l = ctx.variants.scale(ctx.graph, l, W, opts);
    }
    // Concat rejects mixed SAR inputs
    return ctx.graph.append(l, "setsar=1", "sar");
}

std::optional<LayerStream> build_layer(CompileContext& ctx, const timeline::Timeline& tl, bool base) {
    timeline::Timeline work = tl;
    double lead = 0.0;
    if (base) {
        work.pad_to(ctx.total);
    } else {
        lead = work.strip_leading_gaps();
    }
    if (work.segments().empty()) {
        return std::nullopt;
    }

    const bool pad_upper = !base && work.segments().size() > 1;
    std::vector<graph::Label> parts;
    parts.reserve(work.segments().size());
    for (const auto& seg : work.segments()) {
        if (!seg.gap) {
            if (auto l = normalize_media(ctx, seg, base, pad_upper)) {
                parts.push_back(*l);
                continue;
            }
        }
        // Gaps and dropped clips keep their slot so later segments stay in place
        parts.push_back(gap_clip(ctx, seg.duration, !base));
    }

    graph::Label out = parts.front();
    if (parts.size() > 1) {
        out = ctx.graph.add(parts, "concat=n=" + std::to_string(parts.size()) + ":v=1:a=0", "concat");
    }
    if (ctx.job.normalize_frame_rate) {
        out = ctx.graph.append(out, "fps=" + ctx.rate + ":start_time=0", "fps");
    }
    log::debug("Layer " + std::to_string(tl.layer()) + (base ? " (base)" : "") + ": " +
               std::to_string(parts.size()) + " segment(s), " + format_timecode(lead) + " - " +
               format_timecode(work.total_duration()));
    return LayerStream{out, lead, work.total_duration()};
}

std::size_t first_declared(const timeline::Timeline& tl) {
    std::size_t order = std::numeric_limits<std::size_t>::max();
    for (const auto& s : tl.segments()) {
        if (s.source) order = std::min(order, s.source->index);
    }
    return order;
}

enum class ItemKind { VideoLayer, Image, Text };

struct OverlayItem {
    int layer = 0;
    std::size_t order = 0;
    ItemKind kind = ItemKind::VideoLayer;
    const timeline::Timeline* tl = nullptr;
    const timeline::Segment* seg = nullptr;
};

} // namespace

std::string position_expr(double v, const char* outer, const char* inner) {
    std::string expr = std::string("(") + outer + "-" + inner + ")/2";
    if (v > 0.0) expr += "+" + format_seconds(v) + "*" + outer + "/2";
    else if (v < 0.0) expr += "-" + format_seconds(-v) + "*" + outer + "/2";
    return expr;
}

graph::Label compile_video(CompileContext& ctx, const timeline::TimelineMap& timelines) {
    auto videos = timeline::timelines_of(timelines, catalog::Medium::Video);
    auto images = timeline::timelines_of(timelines, catalog::Medium::Image);
    auto texts = timeline::timelines_of(timelines, catalog::Medium::Text);

    videos.erase(std::remove_if(videos.begin(), videos.end(),
                                [](const timeline::Timeline* tl) { return tl->segments().empty(); }),
                 videos.end());

    std::optional<int> lowest_other;
    for (const auto* tl : images) {
        if (tl->has_media()) lowest_other = lowest_other ? std::min(*lowest_other, tl->layer()) : tl->layer();
    }
    for (const auto* tl : texts) {
        if (tl->has_media()) lowest_other = lowest_other ? std::min(*lowest_other, tl->layer()) : tl->layer();
    }
    const bool video_base = !videos.empty() && (!lowest_other || videos.front()->layer() <= *lowest_other);

    graph::Label composite;
    std::size_t first_overlay = 0;
    if (video_base) {
        auto base = build_layer(ctx, *videos.front(), true);
        if (base) {
            composite = base->label;
            first_overlay = 1;
        }
    }
    if (!composite.valid()) {
        if (videos.empty() && !lowest_other) {
            log::warn("No visual content; rendering a flat " + ctx.tunables.fill_color + " canvas");
        }
        composite = ctx.graph.source(flat_color(ctx, ctx.total, false) + ",setsar=1", "base");
    }

    std::vector<OverlayItem> items;
    for (std::size_t i = first_overlay; i < videos.size(); ++i) {
        items.push_back(OverlayItem{videos[i]->layer(), first_declared(*videos[i]), ItemKind::VideoLayer, videos[i], nullptr});
    }
    for (const auto* tl : images) {
        for (const auto& s : tl->segments()) {
            if (!s.gap && s.source) items.push_back(OverlayItem{tl->layer(), s.source->index, ItemKind::Image, tl, &s});
        }
    }
    for (const auto* tl : texts) {
        for (const auto& s : tl->segments()) {
            if (!s.gap && s.source) items.push_back(OverlayItem{tl->layer(), s.source->index, ItemKind::Text, tl, &s});
        }
    }
    // One chain, strictly by layer; declaration order breaks ties
    std::stable_sort(items.begin(), items.end(), [](const OverlayItem& a, const OverlayItem& b) {
        if (a.layer != b.layer) return a.layer < b.layer;
        return a.order < b.order;
    });

    for (const auto& item : items) {
        switch (item.kind) {
            case ItemKind::VideoLayer: {
                auto layer = build_layer(ctx, *item.tl, false);
                if (!layer) break;
                graph::Label top = layer->label;
                if (layer->start > 0.0) {
                    top = ctx.graph.append(top, "format=yuva420p,tpad=start_duration=" +
                                               format_seconds(round_to(layer->start, ctx.tunables.time_decimals),
                                                              ctx.tunables.time_decimals) +
                                               ":start_mode=add:color=black@0.0", "tpad");
                }
                hw::OverlayPlacement at;
                at.window = std::make_pair(layer->start, layer->end);
                at.time_decimals = ctx.tunables.time_decimals;
                composite = ctx.variants.overlay(ctx.graph, composite, top, at);
                break;
            }
            case ItemKind::Image:
                if (auto l = overlay_image(ctx, composite, *item.seg)) composite = *l;
                break;
            case ItemKind::Text:
                composite = overlay_text(ctx, composite, *item.seg);
                break;
        }
    }
    return composite;
}

} // namespace tlc::compiler::detail
