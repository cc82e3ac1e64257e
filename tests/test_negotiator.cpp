#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "negotiate/negotiator.hpp"
#include "test_helpers.hpp"

using namespace tlc;
using namespace tlc::negotiate;

namespace {

struct Fixture {
    std::vector<catalog::Track> tracks;
    timeline::TimelineMap map;

    explicit Fixture(const std::vector<catalog::TrackDescriptor>& descs) {
        auto t = catalog::ingest(descs);
        REQUIRE(t);
        tracks = std::move(t).value();
        map = timeline::build(tracks, {30, 1});
    }
};

} // namespace

TEST_CASE("Aspect strings parse to ratios", "[negotiate]") {
    REQUIRE(parse_aspect_ratio("9:16") == Catch::Approx(0.5625));
    REQUIRE(parse_aspect_ratio("4:3") == Catch::Approx(4.0 / 3.0));
}

TEST_CASE("Malformed aspect strings fall back to 16:9 with a warning", "[negotiate]") {
    test::LogCapture logs;
    REQUIRE(parse_aspect_ratio("bogus") == Catch::Approx(16.0 / 9.0));
    REQUIRE(parse_aspect_ratio("16:0") == Catch::Approx(16.0 / 9.0));
    REQUIRE(parse_aspect_ratio("1:2:3") == Catch::Approx(16.0 / 9.0));
    REQUIRE(logs.count(log::Level::Warn) == 3);
}

TEST_CASE("Working canvas comes from the first declared video", "[negotiate]") {
    Fixture f({test::video("top.mp4", 0, 30, 1, 1280, 720), test::video("base.mp4", 0, 30, 0, 1920, 1080)});
    catalog::Job job;
    REQUIRE(working_canvas(f.map, job) == Canvas{1280, 720});

    job.export_size = Canvas{3840, 2160};
    REQUIRE(working_canvas(f.map, job) == Canvas{3840, 2160});
}

TEST_CASE("Working canvas defaults without declared sizes", "[negotiate]") {
    Fixture f({test::clip("a.mp4", 0, 30)});
    catalog::Job job;
    REQUIRE(working_canvas(f.map, job) == Canvas{1920, 1080});
}

TEST_CASE("Desired canvas from an aspect string keeps the height", "[negotiate]") {
    catalog::Job job;
    job.aspect = "9:16";
    auto desired = desired_canvas(Canvas{1920, 1080}, job);
    REQUIRE(desired == Canvas{608, 1080});

    job.output_size = Canvas{1080, 1920};
    REQUIRE(desired_canvas(Canvas{1920, 1080}, job) == Canvas{1080, 1920});
}

TEST_CASE("Policy selection", "[negotiate]") {
    REQUIRE(choose_policy({1920, 1080}, {1280, 720}, 0.01) == CropPolicy::NoOp);
    REQUIRE(choose_policy({1080, 1920}, {1920, 1080}, 0.01) == CropPolicy::LetterboxOnly);
    REQUIRE(choose_policy({1920, 1080}, {1080, 1920}, 0.01) == CropPolicy::LetterboxOnly);
    REQUIRE(choose_policy({1920, 1080}, {1440, 1080}, 0.01) == CropPolicy::Crop);
}

TEST_CASE("Crop window has the desired ratio and is centered", "[negotiate]") {
    auto r = compute_crop({1920, 1080}, 4.0 / 3.0);
    REQUIRE(r.width == 1440);
    REQUIRE(r.height == 1080);
    REQUIRE(r.x == 240);
    REQUIRE(r.y == 0);

    auto wide = compute_crop({1440, 1080}, 16.0 / 9.0);
    REQUIRE(wide.width == 1440);
    REQUIRE(wide.height == 810);
    REQUIRE(wide.y == 135);
}

TEST_CASE("Pan moves the crop window", "[negotiate]") {
    REQUIRE(pan_offset(480, 0.0) == 240);
    REQUIRE(pan_offset(480, 1.0) == 0);
    REQUIRE(pan_offset(480, -1.0) == 480);
    REQUIRE(pan_offset(480, 5.0) == 0);
    REQUIRE(pan_offset(0, 0.5) == 0);
}

TEST_CASE("Same ratio negotiates to no-op with a final resize", "[negotiate]") {
    Fixture f({test::video("a.mp4", 0, 30)});
    catalog::Job job;
    job.output_size = Canvas{1280, 720};
    auto n = negotiate::negotiate(f.map, job);
    REQUIRE(n.policy == CropPolicy::NoOp);
    REQUIRE_FALSE(n.crop.has_value());
    REQUIRE(n.needs_final_resize());
}

TEST_CASE("Orientation flip letterboxes instead of cropping", "[negotiate]") {
    Fixture f({test::video("a.mp4", 0, 30, 0, 1080, 1920)});
    catalog::Job job;
    job.output_size = Canvas{1920, 1080};
    auto n = negotiate::negotiate(f.map, job);
    REQUIRE(n.policy == CropPolicy::LetterboxOnly);
    REQUIRE_FALSE(n.crop.has_value());
    REQUIRE(n.post_crop() == Canvas{1080, 1920});
}

TEST_CASE("Position transform on the primary track pans the crop", "[negotiate]") {
    auto d = test::video("a.mp4", 0, 30);
    d.transform = catalog::Transform{1.0, 0.0, 1.0, 0.0};
    Fixture f({d});
    catalog::Job job;
    job.aspect = "4:3";
    auto n = negotiate::negotiate(f.map, job);
    REQUIRE(n.policy == CropPolicy::Crop);
    REQUIRE(n.crop.has_value());
    REQUIRE(n.crop->x == 0);
    REQUIRE(n.pan_track == std::size_t{0});
    REQUIRE_FALSE(n.needs_final_resize());
}

TEST_CASE("Scaling transform on the primary track bypasses negotiation", "[negotiate]") {
    auto d = test::video("a.mp4", 0, 30);
    d.transform = catalog::Transform{0.0, 0.0, 0.5, 0.0};
    Fixture f({d});
    catalog::Job job;
    job.aspect = "4:3";
    auto n = negotiate::negotiate(f.map, job);
    REQUIRE(n.policy == CropPolicy::Bypass);
    REQUIRE_FALSE(n.crop.has_value());
    REQUIRE(n.needs_final_resize());
}
