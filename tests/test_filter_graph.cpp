#include <catch2/catch_test_macros.hpp>
#include "graph/filter_graph.hpp"
#include "test_helpers.hpp"
#include <cctype>

using namespace tlc::graph;

TEST_CASE("Engine input pins are shared and rendered by index", "[graph]") {
    FilterGraph g;
    Label v0 = g.input(0, StreamType::Video);
    REQUIRE(g.input(0, StreamType::Video) == v0);
    REQUIRE(g.input(0, StreamType::Audio) != v0);
    REQUIRE(g.is_input(v0));
    REQUIRE(g.name_of(v0) == "0:v");
    REQUIRE(g.name_of(g.input(2, StreamType::Audio)) == "2:a");
}

TEST_CASE("Stages render as bracketed chains joined by semicolons", "[graph]") {
    FilterGraph g;
    Label in = g.input(0, StreamType::Video);
    Label trimmed = g.append(in, "trim=duration=1,setpts=PTS-STARTPTS", "trim");
    Label out = g.append(trimmed, "setsar=1", "sar");
    REQUIRE(g.export_as(out, "video"));

    auto stages = g.render();
    REQUIRE(stages.size() == 2);
    REQUIRE(stages[0] == "[0:v]trim=duration=1,setpts=PTS-STARTPTS[" + g.name_of(trimmed) + "]");
    REQUIRE(stages[1] == "[" + g.name_of(trimmed) + "]setsar=1[video]");
    REQUIRE(g.render_joined() == stages[0] + ";" + stages[1]);
    REQUIRE(g.producer(out) == &g.nodes().back());
    REQUIRE(g.producer(in) == nullptr);
    REQUIRE(g.validate().is_ok());
}

TEST_CASE("Generated labels never collide with exported names", "[graph]") {
    FilterGraph g;
    Label a = g.source("color=black", "gap");
    Label b = g.source("color=black", "gap");
    REQUIRE(g.name_of(a) != g.name_of(b));
    REQUIRE(std::isdigit(static_cast<unsigned char>(g.name_of(a).back())));
    REQUIRE_FALSE(g.export_as(a, "video2"));
    REQUIRE_FALSE(g.export_as(a, ""));
    REQUIRE(g.export_as(a, "video"));
    REQUIRE_FALSE(g.export_as(b, "video"));
}

TEST_CASE("Engine inputs cannot be exported", "[graph]") {
    FilterGraph g;
    REQUIRE_FALSE(g.export_as(g.input(0, StreamType::Video), "video"));
}

TEST_CASE("A label consumed twice fails validation", "[graph]") {
    FilterGraph g;
    Label a = g.source("color=black", "src");
    Label b = g.append(a, "null");
    Label c = g.append(a, "null");
    REQUIRE(g.export_as(b, "left"));
    REQUIRE(g.export_as(c, "right"));
    auto res = g.validate();
    REQUIRE(res.is_error());
    REQUIRE(res.error().find("consumed more than once") != std::string::npos);
}

TEST_CASE("Input pins may feed several stages", "[graph]") {
    FilterGraph g;
    Label in = g.input(0, StreamType::Video);
    Label a = g.append(in, "trim=duration=1");
    Label b = g.append(in, "trim=start=1:duration=1");
    Label both = g.add({a, b}, "concat=n=2:v=1:a=0", "concat");
    REQUIRE(g.export_as(both, "video"));
    REQUIRE(g.validate().is_ok());
}

TEST_CASE("A dangling label fails validation", "[graph]") {
    FilterGraph g;
    Label a = g.source("color=black");
    g.append(a, "null");
    auto res = g.validate();
    REQUIRE(res.is_error());
    REQUIRE(res.error().find("never consumed") != std::string::npos);
}

TEST_CASE("A label from another graph is unknown", "[graph]") {
    FilterGraph other;
    other.source("color=white");
    other.source("color=white");
    Label foreign = other.source("color=white");

    FilterGraph g;
    Label out = g.add({foreign}, "null");
    REQUIRE(g.export_as(out, "video"));
    auto res = g.validate();
    REQUIRE(res.is_error());
    REQUIRE(res.error().find("unknown label") != std::string::npos);
}

TEST_CASE("Empty chains fail validation", "[graph]") {
    FilterGraph g;
    Label a = g.source("");
    REQUIRE(g.export_as(a, "video"));
    REQUIRE(g.validate().is_error());
}
