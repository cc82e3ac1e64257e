#include <catch2/catch_test_macros.hpp>
#include "compiler/drawtext.hpp"

using namespace tlc;
using namespace tlc::compiler;

TEST_CASE("CSS colours convert to engine hex", "[drawtext]") {
    REQUIRE(css_to_ffmpeg_color("#ff8800") == "0xFF8800");
    REQUIRE(css_to_ffmpeg_color("#abc") == "0xAABBCC");
    REQUIRE(css_to_ffmpeg_color("rgb(255, 0, 16)") == "0xFF0010");
    REQUIRE(css_to_ffmpeg_color("rgba(300,0,0,0.5)") == "0xFF0000");
    REQUIRE(css_to_ffmpeg_color("") == "0xFFFFFF");
    REQUIRE(css_to_ffmpeg_color("tomato") == "0xFFFFFF");
}

TEST_CASE("Text transforms", "[drawtext]") {
    REQUIRE(apply_text_transform("Hello World", "uppercase") == "HELLO WORLD");
    REQUIRE(apply_text_transform("Hello World", "lowercase") == "hello world");
    REQUIRE(apply_text_transform("hello big world", "capitalize") == "Hello Big World");
    REQUIRE(apply_text_transform("as is", "none") == "as is");
}

TEST_CASE("Default caption is centered with the default font", "[drawtext]") {
    catalog::TextKind text{"Hello: it's", {}};
    auto f = build_drawtext(text, catalog::Transform{}, 1.0, 3.0, Canvas{1920, 1080});
    REQUIRE(f == "drawtext=text='Hello\\: it\\'s':font='Sans':fontsize=40:fontcolor=0xFFFFFF:"
                 "x=(w-text_w)/2:y=(h-text_h)/2:enable='between(t,1,3)'");
}

TEST_CASE("Styled caption carries stroke shadow and box", "[drawtext]") {
    catalog::TextKind text;
    text.text = "go";
    text.style.font_family = "'Inter', sans-serif";
    text.style.font_size = 64;
    text.style.color = "#000";
    text.style.stroke_color = "#fff";
    text.style.shadow = true;
    text.style.background_color = "rgb(0,0,255)";
    text.style.align = "left";
    text.style.text_transform = "uppercase";
    auto f = build_drawtext(text, catalog::Transform{-1.0, 0.5, 1.0, 0.0}, 0.0, 2.5, Canvas{1920, 1080});
    REQUIRE(f.rfind("drawtext=text='GO':font='Inter':fontsize=64:fontcolor=0x000000:", 0) == 0);
    REQUIRE(f.find(":x=0:") != std::string::npos);
    REQUIRE(f.find(":y=(h-text_h)/2+270:") != std::string::npos);
    REQUIRE(f.find(":borderw=2:bordercolor=0xFFFFFF") != std::string::npos);
    REQUIRE(f.find(":shadowx=2:shadowy=2:shadowcolor=0x000000") != std::string::npos);
    REQUIRE(f.find(":box=1:boxcolor=0x0000FF:boxborderw=5") != std::string::npos);
    REQUIRE(f.find("enable='between(t,0,2.5)'") != std::string::npos);
}

TEST_CASE("Font file takes precedence over the family", "[drawtext]") {
    catalog::TextKind text;
    text.text = "x";
    text.style.font_family = "Inter";
    text.style.font_file = "/fonts/Inter:Bold.ttf";
    text.style.align = "right";
    auto f = build_drawtext(text, catalog::Transform{}, 0.0, 1.0, Canvas{1000, 500});
    REQUIRE(f.find("fontfile='/fonts/Inter\\:Bold.ttf'") != std::string::npos);
    REQUIRE(f.find("font='") == std::string::npos);
    REQUIRE(f.find(":x=w-text_w-500:") != std::string::npos);
}
