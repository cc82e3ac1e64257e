#pragma once
#include "catalog/track.hpp"
#include "core/geometry.hpp"
#include <string>

namespace tlc::compiler {

// CSS colour (#RGB, #RRGGBB, rgb(), rgba()) -> 0xRRGGBB. Unknown input yields white.
std::string css_to_ffmpeg_color(const std::string& css);

// uppercase | lowercase | capitalize; anything else returns the text unchanged.
std::string apply_text_transform(const std::string& text, const std::string& transform);

// Complete drawtext filter for one caption visible in [start, end].
std::string build_drawtext(const catalog::TextKind& text, const catalog::Transform& placement,
                           double start, double end, const Canvas& canvas, int time_decimals = 3);

} // namespace tlc::compiler
