#include "compile_context.hpp"
#include "compiler/drawtext.hpp"
#include "core/log.hpp"
#include "core/time.hpp"
#include <algorithm>
#include <cmath>
#include <variant>

namespace tlc::compiler::detail {

namespace {

constexpr double kPi = 3.14159265358979323846;

} // namespace

std::optional<graph::Label> overlay_image(CompileContext& ctx, graph::Label composite, const timeline::Segment& seg) {
    const catalog::Track& t = *seg.source;
    auto idx = ctx.inputs.resolve_video(seg.origin, t.desc.path);
    if (!idx) {
        log::warn("Skipping image segment at " + format_timecode(seg.start_time) + ": no input matches '" + t.desc.path + "'");
        ++ctx.skipped;
        return std::nullopt;
    }

    const int decimals = ctx.tunables.time_decimals;
    std::string chain = "trim=duration=" + format_seconds(seg.duration) + ",setsar=1";
    if (seg.start_time > 0.0) {
        chain += ",format=yuva420p,tpad=start_duration=" + format_seconds(round_to(seg.start_time, decimals), decimals) +
                 ":start_mode=add:color=black@0.0";
    }
    graph::Label l = ctx.graph.append(ctx.graph.input(*idx, graph::StreamType::Video), chain, "img");

    const catalog::Transform tf = t.desc.transform.value_or(catalog::Transform{});
    std::optional<Canvas> size;
    if (t.desc.has_dimensions()) size = Canvas{*t.desc.width, *t.desc.height};

    if (tf.scale != 1.0 && tf.scale > 0.0) {
        if (size) {
            Canvas scaled{std::max(1, static_cast<int>(std::lround(size->width * tf.scale))),
                          std::max(1, static_cast<int>(std::lround(size->height * tf.scale)))};
            hw::ScaleOptions opts;
            opts.pad = false;
            l = ctx.variants.scale(ctx.graph, l, scaled, opts);
            size = scaled;
        } else {
            const std::string s = format_seconds(tf.scale);
            l = ctx.graph.append(l, "scale=iw*" + s + ":ih*" + s, "imgscale");
        }
    }

    if (tf.rotation != 0.0) {
        const double rad = tf.rotation * kPi / 180.0;
        const std::string a = format_fixed(rad, 6);
        std::string rotate = "format=yuva420p,rotate=" + a;
        if (size) {
            const double c = std::abs(std::cos(rad));
            const double s = std::abs(std::sin(rad));
            const int out_w = static_cast<int>(std::ceil(size->width * c + size->height * s));
            const int out_h = static_cast<int>(std::ceil(size->width * s + size->height * c));
            rotate += ":out_w=" + std::to_string(out_w) + ":out_h=" + std::to_string(out_h);
        } else {
            rotate += ":out_w='rotw(" + a + ")':out_h='roth(" + a + ")'";
        }
        rotate += ":fillcolor=none";
        l = ctx.graph.append(l, rotate, "rot");
    }

    hw::OverlayPlacement at;
    at.x = position_expr(tf.x, "W", "w");
    at.y = position_expr(tf.y, "H", "h");
    at.window = std::make_pair(seg.start_time, seg.end_time());
    at.time_decimals = decimals;
    return ctx.variants.overlay(ctx.graph, composite, l, at);
}

graph::Label overlay_text(CompileContext& ctx, graph::Label composite, const timeline::Segment& seg) {
    const catalog::Track& t = *seg.source;
    const auto* kind = std::get_if<catalog::TextKind>(&t.kind);
    catalog::TextKind fallback{t.desc.text, t.desc.text_style.value_or(catalog::TextStyle{})};
    const catalog::TextKind& text = kind ? *kind : fallback;
    const catalog::Transform tf = t.desc.transform.value_or(catalog::Transform{});
    return ctx.graph.append(composite,
                            build_drawtext(text, tf, seg.start_time, seg.end_time(), ctx.negotiation.working,
                                           ctx.tunables.time_decimals),
                            "text");
}

} // namespace tlc::compiler::detail
