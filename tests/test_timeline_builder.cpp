#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "timeline/builder.hpp"
#include "test_helpers.hpp"

using namespace tlc;
using namespace tlc::timeline;

static std::vector<catalog::Track> ingest_all(const std::vector<catalog::TrackDescriptor>& descs) {
    auto tracks = catalog::ingest(descs);
    REQUIRE(tracks);
    return std::move(tracks).value();
}

TEST_CASE("Tracks group into per layer and medium timelines", "[timeline_builder]") {
    auto tracks = ingest_all({
        test::video("a.mp4", 0, 150),
        test::video("b.mp4", 0, 60, 1),
        test::clip("music.mp3", 30, 90),
        test::clip("logo.png", 0, 30, 2),
    });
    auto map = build(tracks, {30, 1});
    REQUIRE(map.size() == 4);
    REQUIRE(map.count(TimelineKey{0, catalog::Medium::Video}) == 1);
    REQUIRE(map.count(TimelineKey{0, catalog::Medium::Audio}) == 1);
    REQUIRE(map.count(TimelineKey{1, catalog::Medium::Video}) == 1);
    REQUIRE(map.count(TimelineKey{2, catalog::Medium::Image}) == 1);

    auto videos = timelines_of(map, catalog::Medium::Video);
    REQUIRE(videos.size() == 2);
    REQUIRE(videos[0]->layer() == 0);
    REQUIRE(videos[1]->layer() == 1);
}

TEST_CASE("Two sequential clips need no gap", "[timeline_builder]") {
    auto tracks = ingest_all({test::video("a.mp4", 0, 150), test::video("b.mp4", 150, 300)});
    auto map = build(tracks, {30, 1});
    const auto& tl = map.at(TimelineKey{0, catalog::Medium::Video});
    REQUIRE(tl.segments().size() == 2);
    REQUIRE(tl.gap_count() == 0);
    REQUIRE(tl.is_contiguous(1e-9));
    REQUIRE(total_duration(map) == Catch::Approx(10.0));
}

TEST_CASE("Holes between clips are filled", "[timeline_builder]") {
    auto tracks = ingest_all({test::video("a.mp4", 30, 60), test::video("b.mp4", 90, 120)});
    auto map = build(tracks, {30, 1});
    const auto& tl = map.at(TimelineKey{0, catalog::Medium::Video});
    REQUIRE(tl.gap_count() == 2);
    REQUIRE(tl.is_contiguous(1e-9));
}

TEST_CASE("Timeline durations round-trip the frame window", "[timeline_builder]") {
    auto d = test::video("a.mp4", 45, 105);
    d.start_time = 2.5;
    d.duration = 4.0;
    auto tracks = ingest_all({d});
    auto map = build(tracks, {30, 1});
    const auto& segs = map.at(TimelineKey{0, catalog::Medium::Video}).segments();
    const auto& s = segs.back();
    REQUIRE(s.start_time == Catch::Approx(1.5));
    REQUIRE(s.duration == Catch::Approx(2.0));
    REQUIRE(s.source_start == Catch::Approx(2.5));
    REQUIRE(s.trim_duration() == Catch::Approx(4.0));
    REQUIRE(s.origin == std::size_t{0});
}

TEST_CASE("Invisible visual tracks leave a hole that gap fill covers", "[timeline_builder]") {
    auto hidden = test::video("b.mp4", 90, 180);
    hidden.visible = false;
    auto tracks = ingest_all({test::video("a.mp4", 0, 90), hidden, test::video("c.mp4", 180, 270)});
    auto map = build(tracks, {30, 1});
    const auto& tl = map.at(TimelineKey{0, catalog::Medium::Video});
    REQUIRE(tl.segments().size() == 3);
    REQUIRE(tl.segments()[1].gap);
    REQUIRE(tl.segments()[1].duration == Catch::Approx(3.0));
}

TEST_CASE("Non-positive timeline durations are skipped with a warning", "[timeline_builder]") {
    test::LogCapture logs;
    auto tracks = ingest_all({test::video("a.mp4", 60, 60), test::video("b.mp4", 0, 30)});
    auto map = build(tracks, {30, 1});
    REQUIRE(map.at(TimelineKey{0, catalog::Medium::Video}).segments().size() == 1);
    REQUIRE(logs.warned("non-positive timeline duration"));
}

TEST_CASE("Image and text timelines are not gap filled", "[timeline_builder]") {
    auto tracks = ingest_all({test::clip("logo.png", 60, 90, 1), test::caption("Hi", 30, 60, 2)});
    auto map = build(tracks, {30, 1});
    REQUIRE(map.at(TimelineKey{1, catalog::Medium::Image}).gap_count() == 0);
    REQUIRE(map.at(TimelineKey{2, catalog::Medium::Text}).gap_count() == 0);
    REQUIRE(total_duration(map) == Catch::Approx(3.0));
}

TEST_CASE("Audio defines the total only without visual content", "[timeline_builder]") {
    auto tracks = ingest_all({test::clip("music.mp3", 0, 300)});
    auto map = build(tracks, {30, 1});
    REQUIRE(total_duration(map) == Catch::Approx(10.0));

    auto mixed = ingest_all({test::clip("music.mp3", 0, 300), test::video("a.mp4", 0, 150)});
    auto map2 = build(mixed, {30, 1});
    REQUIRE(total_duration(map2) == Catch::Approx(5.0));
}

TEST_CASE("Declared gaps split and shift their timeline", "[timeline_builder]") {
    auto tracks = ingest_all({test::video("a.mp4", 0, 300)});
    auto map = build(tracks, {30, 1});
    std::vector<catalog::DeclaredGap> gaps{{catalog::Medium::Video, 0, 60, 30}, {catalog::Medium::Video, 0, 150, 30}};
    auto res = apply_declared_gaps(map, gaps, {30, 1});
    REQUIRE(res.is_ok());

    const auto& tl = map.at(TimelineKey{0, catalog::Medium::Video});
    REQUIRE(tl.total_duration() == Catch::Approx(12.0));
    REQUIRE(tl.gap_count() == 2);
    REQUIRE(tl.segments()[1].gap);
    REQUIRE(tl.segments()[1].start_time == Catch::Approx(2.0));
    // The later gap is applied first, then moves right with its content
    REQUIRE(tl.segments()[3].gap);
    REQUIRE(tl.segments()[3].start_time == Catch::Approx(6.0));
    REQUIRE(tl.is_contiguous(1e-9));
}

TEST_CASE("Declared gap on a missing timeline is an error", "[timeline_builder]") {
    auto tracks = ingest_all({test::video("a.mp4", 0, 300)});
    auto map = build(tracks, {30, 1});
    std::vector<catalog::DeclaredGap> gaps{{catalog::Medium::Audio, 3, 0, 30}};
    auto res = apply_declared_gaps(map, gaps, {30, 1});
    REQUIRE(res.is_error());
    REQUIRE(res.error().find("missing timeline") != std::string::npos);
}

TEST_CASE("Gap marker over a clip does not lengthen the layer", "[timeline_builder]") {
    auto tracks = ingest_all({test::video("a.mp4", 0, 150), test::gap(90, 180), test::video("b.mp4", 180, 300)});
    auto map = build(tracks, {30, 1});
    const auto& tl = map.at(TimelineKey{0, catalog::Medium::Video});
    REQUIRE(tl.is_non_overlapping());
    REQUIRE(tl.is_contiguous(1e-9));

    double concatenated = 0.0;
    for (const auto& seg : tl.segments()) concatenated += seg.duration;
    REQUIRE(concatenated == Catch::Approx(tl.total_duration()));
    REQUIRE(tl.total_duration() == Catch::Approx(10.0));
    REQUIRE(tl.segments()[2].start_time == Catch::Approx(6.0));
}
