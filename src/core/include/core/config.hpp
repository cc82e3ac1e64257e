#pragma once
#include "core/geometry.hpp"
#include "core/time.hpp"
#include <string>

namespace tlc::core {

// Named constants that shape the generated graph. All of them can be overridden
// per job ("tunables" object in the job file).
struct Tunables {
    // A coverage hole shorter than this many frames is snapped away instead of filled.
    double gap_epsilon_frames = 0.5;
    // Relative aspect difference under which no crop/letterbox decision is made.
    double aspect_tolerance = 0.01;
    // Split parts shorter than this (seconds) are dropped.
    double min_split_duration = 0.001;
    // Volume applied to muted audio segments.
    double mute_volume_db = -60.0;

    Canvas default_canvas{1920, 1080};
    FrameRate default_fps{30, 1};

    int audio_sample_rate = 48000;
    std::string audio_channel_layout = "stereo";
    std::string fill_color = "black";

    int time_decimals = 3;        // enable windows, tpad offsets
    int audio_trim_decimals = 6;  // final audio trims

    static Tunables defaults() { return Tunables{}; }
};

} // namespace tlc::core
