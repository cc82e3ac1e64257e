#include "compiler/drawtext.hpp"
#include "graph/escaping.hpp"
#include "hw/filter_variants.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <vector>

namespace tlc::compiler {

namespace {

std::string hex_byte(int v) {
    char buf[3];
    std::snprintf(buf, sizeof(buf), "%02X", std::clamp(v, 0, 255));
    return buf;
}

std::string first_family(const std::string& families) {
    std::string first = families.substr(0, families.find(','));
    std::string out;
    for (char c : first) {
        if (c != '\'' && c != '"') out += c;
    }
    auto b = out.find_first_not_of(' ');
    auto e = out.find_last_not_of(' ');
    return b == std::string::npos ? std::string() : out.substr(b, e - b + 1);
}

} // namespace

std::string css_to_ffmpeg_color(const std::string& css) {
    if (css.empty()) return "0xFFFFFF";
    if (css[0] == '#') {
        std::string hex = css.substr(1);
        if (hex.size() == 3) {
            std::string expanded;
            for (char c : hex) { expanded += c; expanded += c; }
            hex = expanded;
        }
        if (hex.size() >= 6) {
            std::string out = "0x";
            for (std::size_t i = 0; i < 6; ++i) out += static_cast<char>(std::toupper(static_cast<unsigned char>(hex[i])));
            return out;
        }
        return "0xFFFFFF";
    }
    if (css.rfind("rgb", 0) == 0) {
        auto open = css.find('(');
        if (open == std::string::npos) return "0xFFFFFF";
        std::vector<int> parts;
        const char* p = css.c_str() + open + 1;
        while (parts.size() < 3 && *p) {
            char* end = nullptr;
            long v = std::strtol(p, &end, 10);
            if (end == p) break;
            parts.push_back(static_cast<int>(v));
            p = end;
            while (*p == ',' || *p == ' ') ++p;
        }
        if (parts.size() == 3) return "0x" + hex_byte(parts[0]) + hex_byte(parts[1]) + hex_byte(parts[2]);
    }
    return "0xFFFFFF";
}

std::string apply_text_transform(const std::string& text, const std::string& transform) {
    std::string out = text;
    if (transform == "uppercase") {
        for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    } else if (transform == "lowercase") {
        for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    } else if (transform == "capitalize") {
        bool word_start = true;
        for (auto& c : out) {
            const bool word = std::isalnum(static_cast<unsigned char>(c)) || c == '_';
            if (word && word_start) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            word_start = !word;
        }
    }
    return out;
}

std::string build_drawtext(const catalog::TextKind& text, const catalog::Transform& placement,
                           double start, double end, const Canvas& canvas, int time_decimals) {
    const auto& style = text.style;
    std::vector<std::string> params;
    params.push_back("text='" + graph::escape_drawtext(apply_text_transform(text.text, style.text_transform)) + "'");

    if (!style.font_file.empty()) {
        params.push_back("fontfile='" + graph::escape_filter_path(style.font_file) + "'");
    } else {
        std::string family = first_family(style.font_family);
        params.push_back("font='" + graph::escape_drawtext(family.empty() ? "Sans" : family) + "'");
    }
    params.push_back("fontsize=" + std::to_string(style.font_size > 0 ? style.font_size : 40));
    params.push_back("fontcolor=" + css_to_ffmpeg_color(style.color));

    // Normalized [-1,1] position -> pixel offset from the anchor
    const double nx = (placement.x + 1.0) / 2.0;
    const double ny = (placement.y + 1.0) / 2.0;
    if (style.align == "right") {
        params.push_back("x=w-text_w-" + std::to_string(std::lround((1.0 - nx) * canvas.width)));
    } else if (style.align == "left") {
        params.push_back("x=" + std::to_string(std::lround(nx * canvas.width)));
    } else {
        const long dx = std::lround((nx - 0.5) * canvas.width);
        params.push_back(dx == 0 ? "x=(w-text_w)/2"
                                 : "x=(w-text_w)/2" + std::string(dx > 0 ? "+" : "") + std::to_string(dx));
    }
    const long dy = std::lround((ny - 0.5) * canvas.height);
    params.push_back(dy == 0 ? "y=(h-text_h)/2"
                             : "y=(h-text_h)/2" + std::string(dy > 0 ? "+" : "") + std::to_string(dy));

    if (!style.stroke_color.empty()) {
        params.push_back("borderw=2");
        params.push_back("bordercolor=" + css_to_ffmpeg_color(style.stroke_color));
    }
    if (style.shadow) {
        params.push_back("shadowx=2");
        params.push_back("shadowy=2");
        params.push_back("shadowcolor=0x000000");
    }
    if (!style.background_color.empty() && style.background_color != "transparent") {
        params.push_back("box=1");
        params.push_back("boxcolor=" + css_to_ffmpeg_color(style.background_color));
        params.push_back("boxborderw=5");
    }
    params.push_back(hw::enable_expression(start, end, time_decimals));

    std::string out = "drawtext=";
    for (std::size_t i = 0; i < params.size(); ++i) {
        if (i) out += ':';
        out += params[i];
    }
    return out;
}

} // namespace tlc::compiler
