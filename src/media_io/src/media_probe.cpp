#include "media_io/media_probe.hpp"
#include "core/log.hpp"
#include <filesystem>
#include <map>
#include <system_error>

#if TLC_HAVE_FFMPEG
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
}
#endif

namespace tlc::media {

#if TLC_HAVE_FFMPEG
static double to_seconds(int64_t ts, AVRational tb) {
    if(ts == AV_NOPTS_VALUE) return 0.0;
    return static_cast<double>(ts) * av_q2d(tb);
}
#endif

const StreamInfo* ProbeResult::primary_video() const {
    for(const auto& s : streams) {
        if(s.type == "video" && s.width > 0 && s.height > 0) return &s;
    }
    return nullptr;
}

bool ProbeResult::has_audio() const {
    for(const auto& s : streams) if(s.type == "audio") return true;
    return false;
}

ProbeResult probe_file(const std::string& path) noexcept {
    ProbeResult res; res.filepath = path;
    std::error_code ec;
    if(!std::filesystem::exists(path, ec)) {
        res.error_message = "File not found";
        return res;
    }
#if TLC_HAVE_FFMPEG
    AVFormatContext* fmt = nullptr;
    if(avformat_open_input(&fmt, path.c_str(), nullptr, nullptr) < 0) {
        res.error_message = "Failed to open input";
        return res;
    }
    if(avformat_find_stream_info(fmt, nullptr) < 0) {
        res.error_message = "Failed to find stream info";
        avformat_close_input(&fmt);
        return res;
    }
    res.format = fmt->iformat ? fmt->iformat->name : "";
    if(fmt->duration > 0) {
        res.duration = to_seconds(fmt->duration, AVRational{1, AV_TIME_BASE});
    }
    for(unsigned i=0;i<fmt->nb_streams;++i) {
        AVStream* s = fmt->streams[i];
        StreamInfo si;
        if(s->codecpar) {
            si.width = s->codecpar->width;
            si.height = s->codecpar->height;
            if(const AVCodecDescriptor* desc = avcodec_descriptor_get(s->codecpar->codec_id)) si.codec = desc->name;
            if(s->codecpar->codec_type == AVMEDIA_TYPE_VIDEO) {
                si.type = "video";
                if(s->avg_frame_rate.num && s->avg_frame_rate.den) si.fps = av_q2d(s->avg_frame_rate);
            } else if(s->codecpar->codec_type == AVMEDIA_TYPE_AUDIO) {
                si.type = "audio";
                si.channels = s->codecpar->ch_layout.nb_channels;
                si.sample_rate = s->codecpar->sample_rate;
            } else {
                si.type = "other";
            }
        }
        if(s->duration > 0) si.duration = to_seconds(s->duration, s->time_base);
        res.streams.push_back(std::move(si));
    }
    res.success = true;
    avformat_close_input(&fmt);
    return res;
#else
    res.error_message = "FFmpeg not enabled";
    return res;
#endif
}

std::size_t fill_missing_dimensions(std::vector<catalog::TrackDescriptor>& tracks, ProbeFn probe) {
    std::map<std::string, ProbeResult> seen; // one probe per path
    std::size_t updated = 0;
    for(auto& d : tracks) {
        if(d.is_gap_marker() || d.has_dimensions() || d.path.empty()) continue;
        auto kind = catalog::classify(d);
        if(!kind) continue; // ingest reports it later
        auto medium = catalog::medium_of(*kind);
        if(medium != catalog::Medium::Video && medium != catalog::Medium::Image) continue;

        auto it = seen.find(d.path);
        if(it == seen.end()) it = seen.emplace(d.path, probe(d.path)).first;
        const ProbeResult& pr = it->second;
        if(!pr.success) {
            tlc::log::warn("probe failed for " + d.path + ": " + pr.error_message);
            continue;
        }
        const StreamInfo* v = pr.primary_video();
        if(!v) {
            tlc::log::warn("no video stream with dimensions in " + d.path);
            continue;
        }
        d.width = v->width;
        d.height = v->height;
        tlc::log::debug("probed " + d.path + " -> " + std::to_string(v->width) + "x" + std::to_string(v->height));
        ++updated;
    }
    return updated;
}

} // namespace tlc::media
