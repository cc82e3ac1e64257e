#pragma once
#include "catalog/track.hpp"
#include "core/config.hpp"
#include "core/geometry.hpp"
#include "core/time.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tlc::catalog {

// Hole inserted into one timeline after gap filling. Later segments shift right.
struct DeclaredGap {
    Medium medium = Medium::Video;
    int layer = 0;
    int64_t start_frame = 0;
    int64_t length_frames = 0;
};

struct HardwarePreference {
    bool enabled = true;
    std::string type = "auto";  // auto | none | nvenc | qsv | videotoolbox | amf | vaapi
};

// Everything about the render that is not a track.
struct Job {
    FrameRate fps{30, 1};
    bool normalize_frame_rate = false;

    std::optional<Canvas> export_size;   // working canvas override
    std::optional<Canvas> output_size;   // final output size
    std::optional<std::string> aspect;   // "W:H", used when output_size is absent

    std::optional<std::string> subtitle_path;
    std::string subtitle_format;         // "srt" | "ass" (informational)
    std::vector<std::string> subtitle_font_families;
    std::map<std::string, std::vector<std::string>> font_directories;

    std::vector<DeclaredGap> gaps;

    HardwarePreference hardware;
    bool prefer_hevc = false;
    std::optional<std::string> preset;   // software encoder preset
    int threads = 0;

    std::string output_path;
    bool overwrite = true;
    core::Tunables tunables;
};

// A loaded job file: descriptors in declaration order plus the job record.
struct JobDocument {
    std::vector<TrackDescriptor> tracks;
    Job job;
};

} // namespace tlc::catalog
