#pragma once
#include "catalog/input_catalog.hpp"
#include "catalog/job.hpp"
#include "compiler/font_resolver.hpp"
#include "core/errors.hpp"
#include "core/expected.hpp"
#include "graph/filter_graph.hpp"
#include "hw/filter_variants.hpp"
#include "hw/profile.hpp"
#include "negotiate/negotiator.hpp"
#include "timeline/builder.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace tlc::compiler {

inline constexpr const char* kVideoOutput = "video";
inline constexpr const char* kVideoHwOutput = "video_hw";
inline constexpr const char* kAudioOutput = "audio";

struct CompiledGraph {
    graph::FilterGraph graph;
    std::string video_output = kVideoOutput;      // label to -map
    std::optional<std::string> audio_output;      // empty when nothing carries audio
    double total_duration = 0.0;
    negotiate::Negotiation negotiation;
    std::size_t skipped_segments = 0;

    std::string filter_complex() const { return graph.render_joined(); }
};

// Turns timelines into one filter graph. Stage order is fixed:
// normalize, concat, composite, crop, final resize, subtitles; audio runs beside it.
class FilterGraphCompiler {
public:
    FilterGraphCompiler(const catalog::Job& job, const hw::HardwareProfile& profile,
                        const FontResolver* fonts = nullptr);

    tlc::expected<CompiledGraph, core::BuildError> compile(const catalog::InputCatalog& inputs,
                                                           const timeline::TimelineMap& timelines,
                                                           const negotiate::Negotiation& negotiation) const;

    // Existence check of the subtitle file and font directories. Returns the fontsdir option text.
    tlc::expected<std::string, core::BuildError> check_assets() const;

private:
    const catalog::Job& job_;
    hw::HardwareProfile profile_;
    const FontResolver* fonts_;
    std::unique_ptr<hw::FilterVariants> variants_;
};

// True when some timeline carries video or audio (so an audio output is expected).
bool has_audio_bearing_layers(const timeline::TimelineMap& timelines);

} // namespace tlc::compiler
