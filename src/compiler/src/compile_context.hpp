#pragma once
#include "catalog/input_catalog.hpp"
#include "catalog/job.hpp"
#include "core/config.hpp"
#include "graph/filter_graph.hpp"
#include "hw/filter_variants.hpp"
#include "negotiate/negotiator.hpp"
#include "timeline/builder.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace tlc::compiler::detail {

// State shared by the stage builders of one compile() call.
struct CompileContext {
    const catalog::Job& job;
    const core::Tunables& tunables;
    const catalog::InputCatalog& inputs;
    const negotiate::Negotiation& negotiation;
    const hw::FilterVariants& variants;
    graph::FilterGraph& graph;
    double total = 0.0;
    std::string rate;
    std::size_t skipped = 0;
};

// "(W-w)/2+0.5*W/2" style placement for a normalized coordinate.
std::string position_expr(double v, const char* outer, const char* inner);

// Stages 1-3: normalize, concat and composite. Returns the composited frame.
graph::Label compile_video(CompileContext& ctx, const timeline::TimelineMap& timelines);

// Overlay items of the compositing chain.
std::optional<graph::Label> overlay_image(CompileContext& ctx, graph::Label composite, const timeline::Segment& seg);
graph::Label overlay_text(CompileContext& ctx, graph::Label composite, const timeline::Segment& seg);

// Parallel audio path. Empty when nothing carries audio.
std::optional<graph::Label> compile_audio(CompileContext& ctx, const timeline::TimelineMap& timelines, bool audio_bearing);

} // namespace tlc::compiler::detail
