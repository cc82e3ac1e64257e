#include "compiler/compiler.hpp"
#include "compile_context.hpp"
#include "core/log.hpp"
#include "core/time.hpp"
#include "graph/escaping.hpp"
#include <filesystem>
#include <system_error>

namespace tlc::compiler {

namespace fs = std::filesystem;

bool has_audio_bearing_layers(const timeline::TimelineMap& timelines) {
    for (const auto& [key, tl] : timelines) {
        if (key.medium == catalog::Medium::Video || key.medium == catalog::Medium::Audio) return true;
    }
    return false;
}

FilterGraphCompiler::FilterGraphCompiler(const catalog::Job& job, const hw::HardwareProfile& profile,
                                         const FontResolver* fonts)
    : job_(job), profile_(profile), fonts_(fonts), variants_(hw::make_filter_variants(profile.filter_variant)) {
}

tlc::expected<std::string, core::BuildError> FilterGraphCompiler::check_assets() const {
    if (!job_.subtitle_path || job_.subtitle_path->empty()) {
        return std::string();
    }
    std::error_code ec;
    if (!fs::is_regular_file(*job_.subtitle_path, ec)) {
        return tlc::make_unexpected(core::BuildError{core::ErrorKind::MissingAsset,
                                                     "subtitle file not found: " + *job_.subtitle_path});
    }
    if (job_.subtitle_font_families.empty()) {
        return std::string();
    }

    TableFontResolver table(job_.font_directories);
    const FontResolver& resolver = fonts_ ? *fonts_ : static_cast<const FontResolver&>(table);
    std::vector<std::string> dirs = resolver.directories_for(job_.subtitle_font_families);
    for (const auto& d : dirs) {
        if (!fs::is_directory(d, ec)) {
            return tlc::make_unexpected(core::BuildError{core::ErrorKind::MissingAsset,
                                                         "font directory not found: " + d});
        }
    }
    return graph::fontsdir_option(dirs);
}

tlc::expected<CompiledGraph, core::BuildError> FilterGraphCompiler::compile(const catalog::InputCatalog& inputs,
                                                                            const timeline::TimelineMap& timelines,
                                                                            const negotiate::Negotiation& negotiation) const {
    // Fail before building anything
    auto fontsdir = check_assets();
    if (!fontsdir) {
        return tlc::make_unexpected(fontsdir.error());
    }

    CompiledGraph out;
    out.negotiation = negotiation;
    out.total_duration = timeline::total_duration(timelines);
    if (out.total_duration <= 0.0) {
        log::warn("Timeline is empty; emitting a one second placeholder");
        out.total_duration = 1.0;
    }

    const FrameRate fps = job_.fps.num > 0 && job_.fps.den > 0 ? job_.fps : job_.tunables.default_fps;
    detail::CompileContext ctx{job_, job_.tunables, inputs, negotiation, *variants_, out.graph,
                               out.total_duration, format_rate(fps), 0};

    // Stages 1-3
    graph::Label video = detail::compile_video(ctx, timelines);

    // Stage 4
    if (negotiation.policy == negotiate::CropPolicy::Crop && negotiation.crop) {
        video = variants_->crop(out.graph, video, *negotiation.crop);
    }

    // Stage 5
    if (negotiation.needs_final_resize()) {
        hw::ScaleOptions opts;
        opts.pad_color = job_.tunables.fill_color;
        opts.reset_sar = true;
        video = variants_->scale(out.graph, video, negotiation.desired, opts);
    }

    // Stage 6: subtitle renderers may disturb SAR
    if (job_.subtitle_path && !job_.subtitle_path->empty()) {
        video = out.graph.append(video, "subtitles='" + graph::escape_filter_path(*job_.subtitle_path) + "'" +
                                            fontsdir.value() + ",setsar=1", "subs");
    }

    if (!out.graph.export_as(video, kVideoOutput)) {
        return tlc::make_unexpected(core::BuildError{core::ErrorKind::ContractViolation, "cannot name video output"});
    }
    if (profile_.type == hw::HardwareType::Vaapi) {
        graph::Label hw_video = out.graph.append(video, "format=nv12,hwupload=extra_hw_frames=64:derive_device=vaapi", "hw");
        if (!out.graph.export_as(hw_video, kVideoHwOutput)) {
            return tlc::make_unexpected(core::BuildError{core::ErrorKind::ContractViolation, "cannot name hardware output"});
        }
        out.video_output = kVideoHwOutput;
    }

    if (auto audio = detail::compile_audio(ctx, timelines, has_audio_bearing_layers(timelines))) {
        if (!out.graph.export_as(*audio, kAudioOutput)) {
            return tlc::make_unexpected(core::BuildError{core::ErrorKind::ContractViolation, "cannot name audio output"});
        }
        out.audio_output = kAudioOutput;
    }

    auto valid = out.graph.validate();
    if (!valid) {
        return tlc::make_unexpected(core::BuildError{core::ErrorKind::ContractViolation,
                                                     "invalid filter graph: " + valid.error()});
    }

    out.skipped_segments = ctx.skipped;
    log::debug("Filter graph: " + std::to_string(out.graph.size()) + " stages, total " +
               format_timecode(out.total_duration) + ", " + std::to_string(out.skipped_segments) + " skipped");
    return out;
}

} // namespace tlc::compiler
