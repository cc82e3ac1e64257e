#pragma once
#include "core/errors.hpp"
#include "core/expected.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tlc::catalog {

// Path value that marks a descriptor as a timeline hole rather than a file.
inline constexpr const char* kGapMarker = "__GAP__";

enum class Medium { Video, Audio, Image, Text };

const char* medium_name(Medium m) noexcept;
std::optional<Medium> parse_medium(const std::string& name) noexcept;

// Normalized placement: x,y in [-1,1] (0 = centered), scale factor, rotation in degrees.
struct Transform {
    double x = 0.0;
    double y = 0.0;
    double scale = 1.0;
    double rotation = 0.0;

    bool moves_or_scales() const { return x != 0.0 || y != 0.0 || scale != 1.0; }
};

struct TextStyle {
    std::string font_family;
    std::string font_file;
    int font_size = 40;
    std::string color = "#FFFFFF";
    std::string stroke_color;
    std::string background_color;
    bool shadow = false;
    std::string align = "center";   // left | center | right
    std::string text_transform;     // uppercase | lowercase | capitalize
};

// One track placement as supplied by the editor. Read-only for the compiler.
struct TrackDescriptor {
    std::string path;
    std::optional<std::string> audio_path;

    // Source trim window (seconds)
    std::optional<double> start_time;
    std::optional<double> duration;

    // Timeline placement (frames at the job frame rate)
    int64_t timeline_start_frame = 0;
    int64_t timeline_end_frame = 0;

    int layer = 0;
    std::optional<std::string> track_type;  // video | audio | image | text
    std::optional<std::string> gap_type;    // video | audio

    std::optional<Transform> transform;
    bool muted = false;
    bool visible = true;
    std::optional<double> volume_db;
    double fade_in = 0.0;
    double fade_out = 0.0;

    std::optional<int> width;
    std::optional<int> height;
    std::optional<std::string> aspect_ratio;

    std::string text;
    std::optional<TextStyle> text_style;

    bool is_gap_marker() const { return path == kGapMarker; }
    bool has_dimensions() const { return width && height && *width > 0 && *height > 0; }
};

// Closed set of track kinds, resolved once by ingest() and carried by every later stage.
struct GapKind { Medium medium = Medium::Video; };
struct VideoKind {};
struct AudioKind {};
struct ImageKind {};
struct TextKind {
    std::string text;
    TextStyle style;
};

using TrackKind = std::variant<GapKind, VideoKind, AudioKind, ImageKind, TextKind>;

Medium medium_of(const TrackKind& kind) noexcept;
const char* kind_name(const TrackKind& kind) noexcept;

struct Track {
    std::size_t index = 0;      // position in the declaration order
    TrackDescriptor desc;
    TrackKind kind;

    Medium medium() const { return medium_of(kind); }
    bool is_gap() const { return std::holds_alternative<GapKind>(kind); }
    bool is_video() const { return std::holds_alternative<VideoKind>(kind); }
    bool is_image() const { return std::holds_alternative<ImageKind>(kind); }
    bool is_audio() const { return std::holds_alternative<AudioKind>(kind); }
    bool is_text() const { return std::holds_alternative<TextKind>(kind); }
};

// Extension based fallback used only when a descriptor carries no explicit type.
std::optional<Medium> medium_from_extension(const std::string& path) noexcept;

// Resolve the kind of one descriptor. Explicit track_type/gap_type win over the path.
tlc::expected<TrackKind, core::BuildError> classify(const TrackDescriptor& desc);

// Classify every descriptor in order. Fails on the first descriptor that cannot be classified.
tlc::expected<std::vector<Track>, core::BuildError> ingest(const std::vector<TrackDescriptor>& descriptors);

} // namespace tlc::catalog
