#include <catch2/catch_test_macros.hpp>
#include "graph/escaping.hpp"

using namespace tlc::graph;

TEST_CASE("Subtitle paths escape backslash colon and quote", "[escaping]") {
    REQUIRE(escape_filter_path("C:\\subs\\it's.srt") == "C\\:\\\\subs\\\\it\\'s.srt");
    REQUIRE(escape_filter_path("/plain/path.srt") == "/plain/path.srt");
}

TEST_CASE("Font directories use forward slashes", "[escaping]") {
    REQUIRE(escape_font_dir("C:\\Windows\\Fonts") == "C\\:/Windows/Fonts");
    REQUIRE(escape_font_dir("/usr/share/fonts/o'brien") == "/usr/share/fonts/o\\'brien");
}

TEST_CASE("Font directory option joins with the platform separator", "[escaping]") {
    REQUIRE(join_font_dirs({"/a", "", "/b"}, ':') == "/a:/b");
    REQUIRE(join_font_dirs({"/a", "/b"}, ';') == "/a;/b");
    REQUIRE(fontsdir_option({"/fonts"}, ':') == ":fontsdir='/fonts'");
    REQUIRE(fontsdir_option({}).empty());
}

TEST_CASE("Drawtext payload escaping", "[escaping]") {
    REQUIRE(escape_drawtext("50% off: it's\r\nhere\\") == "50\\% off\\: it\\'s\\nhere\\\\");
}
