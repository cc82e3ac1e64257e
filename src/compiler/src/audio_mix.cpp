#include "compile_context.hpp"
#include "core/log.hpp"
#include "core/time.hpp"
#include <cmath>
#include <vector>

namespace tlc::compiler::detail {

namespace {

std::string segment_chain(const CompileContext& ctx, const timeline::Segment& seg) {
    const auto& desc = seg.source->desc;
    const double dur = seg.trim_duration();

    std::string chain = "atrim=";
    if (seg.source_start > 0.0) chain += "start=" + format_seconds(seg.source_start) + ":";
    chain += "duration=" + format_seconds(dur) + ",asetpts=PTS-STARTPTS";

    std::optional<double> gain;
    if (desc.muted || (desc.volume_db && std::isinf(*desc.volume_db) && *desc.volume_db < 0.0)) {
        gain = ctx.tunables.mute_volume_db;
    } else if (desc.volume_db && *desc.volume_db != 0.0 && std::isfinite(*desc.volume_db)) {
        gain = *desc.volume_db;
    }
    if (gain) chain += ",volume=" + format_fixed(*gain, 2) + "dB";

    if (desc.fade_in > 0.0) {
        chain += ",afade=t=in:st=0:d=" + format_fixed(desc.fade_in, 2);
    }
    if (desc.fade_out > 0.0 && dur > desc.fade_out) {
        chain += ",afade=t=out:st=" + format_fixed(dur - desc.fade_out, 2) + ":d=" + format_fixed(desc.fade_out, 2);
    }

    // Cut what would run past the video before the delay moves it into place
    if (seg.end_time() > ctx.total + 1e-9) {
        chain += ",atrim=duration=" + format_fixed(ctx.total - seg.start_time, ctx.tunables.audio_trim_decimals);
    }

    const long long ms = std::llround(seg.start_time * 1000.0);
    if (ms > 0) {
        chain += ",adelay=" + std::to_string(ms) + "|" + std::to_string(ms);
    }
    return chain;
}

} // namespace

std::optional<graph::Label> compile_audio(CompileContext& ctx, const timeline::TimelineMap& timelines, bool audio_bearing) {
    const std::string total = format_fixed(ctx.total, ctx.tunables.audio_trim_decimals);

    std::vector<graph::Label> streams;
    for (const auto* tl : timeline::timelines_of(timelines, catalog::Medium::Audio)) {
        for (const auto& seg : tl->segments()) {
            if (seg.gap || !seg.source) continue;
            if (seg.start_time >= ctx.total) {
                log::debug("Audio segment at " + format_timecode(seg.start_time) + " starts after the video ends");
                continue;
            }
            const auto& desc = seg.source->desc;
            auto idx = ctx.inputs.resolve_audio(seg.origin, desc.path, desc.audio_path);
            if (!idx) {
                log::warn("Skipping audio segment at " + format_timecode(seg.start_time) + ": no input matches '" +
                          desc.path + "'");
                ++ctx.skipped;
                continue;
            }
            streams.push_back(ctx.graph.append(ctx.graph.input(*idx, graph::StreamType::Audio),
                                               segment_chain(ctx, seg), "aseg"));
        }
    }

    if (streams.empty()) {
        if (!audio_bearing) return std::nullopt;
        log::debug("No audio segment resolved; emitting silence");
        return ctx.graph.source("anullsrc=channel_layout=" + ctx.tunables.audio_channel_layout +
                                ":sample_rate=" + std::to_string(ctx.tunables.audio_sample_rate) +
                                ",atrim=duration=" + total + ",asetpts=PTS-STARTPTS", "silence");
    }

    graph::Label mixed = streams.front();
    if (streams.size() > 1) {
        mixed = ctx.graph.add(streams, "amix=inputs=" + std::to_string(streams.size()) +
                                       ":duration=longest:dropout_transition=0:normalize=0", "amix");
    }
    return ctx.graph.append(mixed, "apad=pad_dur=" + total + ",atrim=duration=" + total, "afinal");
}

} // namespace tlc::compiler::detail
