#pragma once
#include "catalog/track.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tlc::media {

struct StreamInfo {
    std::string codec;
    std::string type; // video/audio/other
    int32_t width = 0;
    int32_t height = 0;
    double fps = 0.0;
    double duration = 0.0; // seconds
    int channels = 0;
    int sample_rate = 0;
};

struct ProbeResult {
    std::string filepath;
    std::string format;
    double duration = 0.0; // seconds, container level
    std::vector<StreamInfo> streams;
    bool success = false;
    std::string error_message;

    // First video stream with usable dimensions.
    const StreamInfo* primary_video() const;
    bool has_audio() const;
};

// Open the file with libavformat and describe its streams. Reports failure
// when the build has no FFmpeg support.
ProbeResult probe_file(const std::string& path) noexcept;

// Probe seam so callers can substitute a table in tests.
using ProbeFn = ProbeResult (*)(const std::string&);

// Fill width/height of video and image descriptors that declare none.
// Gap markers, audio and text descriptors are left alone. Returns how many
// descriptors were updated; probe failures are logged and skipped.
std::size_t fill_missing_dimensions(std::vector<catalog::TrackDescriptor>& tracks, ProbeFn probe = &probe_file);

} // namespace tlc::media
