#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "compiler/compiler.hpp"
#include "graph/escaping.hpp"
#include "test_helpers.hpp"
#include <filesystem>
#include <fstream>

using namespace tlc;

namespace {

catalog::JobDocument doc_of(std::vector<catalog::TrackDescriptor> tracks) {
    catalog::JobDocument doc;
    doc.tracks = std::move(tracks);
    doc.job.output_path = "out.mp4";
    return doc;
}

compiler::CompiledGraph compile_ok(const catalog::JobDocument& doc) {
    auto built = test::build_software(doc);
    if (!built) FAIL(core::describe(built.error()));
    return std::move(built).value().compiled;
}

std::string write_temp(const std::string& name) {
    auto path = (std::filesystem::temp_directory_path() / name).string();
    std::ofstream ofs(path, std::ios::binary);
    ofs << "1\n00:00:00,000 --> 00:00:01,000\nhello\n";
    return path;
}

} // namespace

TEST_CASE("All-gap timeline renders a flat canvas and silence", "[compiler]") {
    auto out = compile_ok(doc_of({test::gap(0, 90)}));
    const std::string fc = out.filter_complex();
    REQUIRE(out.total_duration == Catch::Approx(3.0));
    REQUIRE(fc.find("color=black:size=1920x1080:duration=3:rate=30") != std::string::npos);
    REQUIRE(fc.find("anullsrc=channel_layout=stereo:sample_rate=48000,atrim=duration=3.000000") != std::string::npos);
    REQUIRE(out.audio_output == std::string("audio"));
    REQUIRE(out.graph.validate().is_ok());
}

TEST_CASE("Empty document compiles to a one second placeholder", "[compiler]") {
    test::LogCapture logs;
    auto out = compile_ok(doc_of({}));
    REQUIRE(out.total_duration == Catch::Approx(1.0));
    REQUIRE_FALSE(out.audio_output.has_value());
    REQUIRE(logs.warned("empty"));
    REQUIRE(logs.warned("No visual content"));
}

TEST_CASE("Two sequential clips concatenate once", "[compiler]") {
    auto out = compile_ok(doc_of({test::video("a.mp4", 0, 150), test::video("b.mp4", 150, 300)}));
    const std::string fc = out.filter_complex();
    REQUIRE(test::count_of(fc, "concat=") == 1);
    REQUIRE(fc.find("concat=n=2:v=1:a=0") != std::string::npos);
    REQUIRE(fc.find("[0:v]trim=duration=5,setpts=PTS-STARTPTS") != std::string::npos);
    REQUIRE(fc.find("[1:v]trim=duration=5,setpts=PTS-STARTPTS") != std::string::npos);
    REQUIRE(fc.find("scale=") == std::string::npos);
    REQUIRE(out.total_duration == Catch::Approx(10.0));
}

TEST_CASE("Gap marker overlapping a clip keeps video and audio the same length", "[compiler]") {
    auto out = compile_ok(doc_of({test::video("a.mp4", 0, 150), test::gap(90, 180), test::video("b.mp4", 180, 300)}));
    const std::string fc = out.filter_complex();
    REQUIRE(out.total_duration == Catch::Approx(10.0));
    REQUIRE(fc.find("[0:v]trim=duration=5,setpts=PTS-STARTPTS") != std::string::npos);
    REQUIRE(fc.find("color=black:size=1920x1080:duration=1:rate=30") != std::string::npos);
    REQUIRE(fc.find("duration=3:rate=30") == std::string::npos);
    REQUIRE(fc.find("[1:v]trim=duration=4,setpts=PTS-STARTPTS") != std::string::npos);
    REQUIRE(fc.find("concat=n=3:v=1:a=0") != std::string::npos);
    REQUIRE(fc.find("atrim=duration=10.000000") != std::string::npos);
}

TEST_CASE("Every concat input has a square sample aspect ratio", "[compiler]") {
    auto small = test::video("small.mp4", 150, 240, 0, 1280, 720);
    auto out = compile_ok(doc_of({test::video("a.mp4", 0, 150), small, test::gap(240, 300),
                                  test::video("b.mp4", 300, 330, 1), test::video("c.mp4", 360, 390, 1)}));
    std::size_t concats = 0;
    for (const auto& node : out.graph.nodes()) {
        if (node.chain.rfind("concat=", 0) != 0) continue;
        ++concats;
        for (const auto& in : node.inputs) {
            const graph::Node* p = out.graph.producer(in);
            REQUIRE(p != nullptr);
            REQUIRE(test::ends_with(p->chain, "setsar=1"));
        }
    }
    REQUIRE(concats == 2);
}

TEST_CASE("Frame rate normalization runs once per layer after its concat", "[compiler]") {
    auto doc = doc_of({test::video("a.mp4", 0, 60), test::video("b.mp4", 60, 120), test::video("c.mp4", 120, 180),
                       test::video("d.mp4", 30, 60, 1), test::video("e.mp4", 90, 150, 1)});
    doc.job.normalize_frame_rate = true;
    auto out = compile_ok(doc);
    const std::string fc = out.filter_complex();
    REQUIRE(test::count_of(fc, "fps=30:start_time=0") == 2);

    std::size_t fps_nodes = 0;
    for (const auto& node : out.graph.nodes()) {
        if (node.chain.find("fps=") == std::string::npos) continue;
        ++fps_nodes;
        REQUIRE(node.chain == "fps=30:start_time=0");
        REQUIRE(node.inputs.size() == 1);
        const graph::Node* p = out.graph.producer(node.inputs.front());
        REQUIRE(p != nullptr);
        REQUIRE(p->chain.rfind("concat=", 0) == 0);
    }
    REQUIRE(fps_nodes == 2);
}

TEST_CASE("Source trim window is honoured", "[compiler]") {
    auto d = test::video("a.mp4", 0, 90);
    d.start_time = 12.5;
    d.duration = 3.0;
    auto fc = compile_ok(doc_of({d})).filter_complex();
    REQUIRE(fc.find("trim=start=12.5:duration=3,setpts=PTS-STARTPTS") != std::string::npos);
}

TEST_CASE("Off-canvas clips are scaled and padded to the working canvas", "[compiler]") {
    auto fc = compile_ok(doc_of({test::video("a.mp4", 0, 30), test::video("b.mp4", 30, 60, 0, 1280, 720)})).filter_complex();
    REQUIRE(fc.find("scale=1920:1080:force_original_aspect_ratio=decrease:flags=fast_bilinear,"
                    "pad=1920:1080:(ow-iw)/2:(oh-ih)/2:black") != std::string::npos);
}

TEST_CASE("Upper layer starting late is delayed and windowed", "[compiler]") {
    auto fc = compile_ok(doc_of({test::video("a.mp4", 0, 300), test::video("b.mp4", 90, 150, 1)})).filter_complex();
    REQUIRE(fc.find("format=yuva420p,tpad=start_duration=3:start_mode=add:color=black@0.0") != std::string::npos);
    REQUIRE(fc.find("overlay=(W-w)/2:(H-h)/2:enable='between(t,3,5)'") != std::string::npos);
}

TEST_CASE("Overlay chain follows layer order", "[compiler]") {
    auto logo = test::clip("logo.png", 0, 60, 2);
    auto out = compile_ok(doc_of({test::video("a.mp4", 0, 90), logo, test::caption("Title", 0, 60, 1)}));
    const std::string fc = out.filter_complex();
    auto text_at = fc.find("drawtext=");
    auto image_at = fc.find("trim=duration=2,setsar=1");
    REQUIRE(text_at != std::string::npos);
    REQUIRE(image_at != std::string::npos);
    REQUIRE(text_at < image_at);
    REQUIRE(fc.find("overlay=(W-w)/2:(H-h)/2:enable='between(t,0,2)'") != std::string::npos);
}

TEST_CASE("Images are delayed, scaled and rotated", "[compiler]") {
    auto logo = test::clip("logo.png", 30, 90, 1);
    logo.width = 200;
    logo.height = 100;
    logo.transform = catalog::Transform{0.5, -0.5, 0.5, 90.0};
    auto fc = compile_ok(doc_of({test::video("a.mp4", 0, 90), logo})).filter_complex();
    REQUIRE(fc.find("trim=duration=2,setsar=1,format=yuva420p,tpad=start_duration=1:start_mode=add:color=black@0.0")
            != std::string::npos);
    REQUIRE(fc.find("scale=100:50:force_original_aspect_ratio=decrease:flags=fast_bilinear") != std::string::npos);
    auto rotate_at = fc.find("format=yuva420p,rotate=1.570796:out_w=");
    REQUIRE(rotate_at != std::string::npos);
    REQUIRE(fc.find(":fillcolor=none", rotate_at) != std::string::npos);
    REQUIRE(fc.find("overlay=(W-w)/2+0.5*W/2:(H-h)/2-0.5*H/2:enable='between(t,1,3)'") != std::string::npos);
}

TEST_CASE("Image only documents use a flat base and no audio", "[compiler]") {
    auto out = compile_ok(doc_of({test::clip("logo.png", 0, 60)}));
    REQUIRE_FALSE(out.audio_output.has_value());
    REQUIRE(out.filter_complex().find("color=black:size=1920x1080:duration=2:rate=30,setsar=1") != std::string::npos);
}

TEST_CASE("Position transform renders on its own background", "[compiler]") {
    auto top = test::video("b.mp4", 0, 60, 1);
    top.transform = catalog::Transform{0.5, 0.0, 0.5, 0.0};
    auto fc = compile_ok(doc_of({test::video("a.mp4", 0, 60), top})).filter_complex();
    REQUIRE(fc.find("color=black@0.0:size=1920x1080:duration=2:rate=30,format=yuva420p,setpts=PTS-STARTPTS,setsar=1")
            != std::string::npos);
    REQUIRE(fc.find("scale=960:540:force_original_aspect_ratio=decrease:flags=fast_bilinear") != std::string::npos);
    REQUIRE(fc.find("overlay=(W-w)/2+0.5*W/2:(H-h)/2") != std::string::npos);
}

TEST_CASE("Portrait source to landscape output letterboxes", "[compiler]") {
    auto doc = doc_of({test::video("a.mp4", 0, 90, 0, 1080, 1920)});
    doc.job.output_size = Canvas{1920, 1080};
    auto out = compile_ok(doc);
    const std::string fc = out.filter_complex();
    REQUIRE(out.negotiation.policy == negotiate::CropPolicy::LetterboxOnly);
    REQUIRE(fc.find("crop=") == std::string::npos);
    REQUIRE(fc.find("scale=1920:1080:force_original_aspect_ratio=decrease:flags=fast_bilinear,"
                    "pad=1920:1080:(ow-iw)/2:(oh-ih)/2:black,setsar=1[video]") != std::string::npos);
}

TEST_CASE("Ratio change within orientation crops before resizing", "[compiler]") {
    auto doc = doc_of({test::video("a.mp4", 0, 90)});
    doc.job.aspect = "4:3";
    auto fc = compile_ok(doc).filter_complex();
    REQUIRE(fc.find("crop=1440:1080:240:0,setsar=1[video]") != std::string::npos);
    REQUIRE(fc.find("scale=") == std::string::npos);
}

TEST_CASE("Single delayed audio clip needs no mix", "[compiler]") {
    auto out = compile_ok(doc_of({test::video("a.mp4", 0, 300), test::clip("music.mp3", 60, 210)}));
    const std::string fc = out.filter_complex();
    REQUIRE(fc.find("[1:a]atrim=duration=5,asetpts=PTS-STARTPTS,adelay=2000|2000") != std::string::npos);
    REQUIRE(fc.find("amix") == std::string::npos);
    REQUIRE(fc.find("apad=pad_dur=10.000000,atrim=duration=10.000000[audio]") != std::string::npos);
}

TEST_CASE("Overlapping audio is mixed and fitted to the video", "[compiler]") {
    auto out = compile_ok(doc_of({test::video("a.mp4", 0, 300), test::clip("music.mp3", 0, 300),
                                  test::clip("voice.wav", 90, 240, 1)}));
    const std::string fc = out.filter_complex();
    REQUIRE(fc.find("amix=inputs=2:duration=longest:dropout_transition=0:normalize=0") != std::string::npos);
    REQUIRE(fc.find("adelay=3000|3000") != std::string::npos);
    REQUIRE(fc.find("apad=pad_dur=10.000000,atrim=duration=10.000000") != std::string::npos);
}

TEST_CASE("Audio past the end is cut before it is delayed", "[compiler]") {
    auto fc = compile_ok(doc_of({test::video("a.mp4", 0, 300), test::clip("music.mp3", 240, 450)})).filter_complex();
    REQUIRE(fc.find("atrim=duration=7,asetpts=PTS-STARTPTS,atrim=duration=2.000000,adelay=8000|8000") != std::string::npos);
}

TEST_CASE("Audio starting after the video is dropped", "[compiler]") {
    auto fc = compile_ok(doc_of({test::video("a.mp4", 0, 150), test::clip("late.mp3", 180, 240)})).filter_complex();
    REQUIRE(fc.find("anullsrc") != std::string::npos);
    REQUIRE(fc.find("adelay") == std::string::npos);
}

TEST_CASE("Muted, attenuated and faded audio", "[compiler]") {
    auto muted = test::clip("a.mp3", 0, 90);
    muted.muted = true;
    auto quiet = test::clip("b.mp3", 0, 90, 1);
    quiet.volume_db = -6.0;
    quiet.fade_in = 0.5;
    quiet.fade_out = 1.0;
    auto fc = compile_ok(doc_of({test::video("v.mp4", 0, 90), muted, quiet})).filter_complex();
    REQUIRE(fc.find("volume=-60.00dB") != std::string::npos);
    REQUIRE(fc.find("volume=-6.00dB,afade=t=in:st=0:d=0.50,afade=t=out:st=2.00:d=1.00") != std::string::npos);
}

TEST_CASE("Missing subtitle file is a missing asset", "[compiler]") {
    auto doc = doc_of({test::video("a.mp4", 0, 90)});
    doc.job.subtitle_path = "/definitely/not/here/subs.srt";
    auto built = test::build_software(doc);
    REQUIRE_FALSE(built);
    REQUIRE(built.error().kind == core::ErrorKind::MissingAsset);
}

TEST_CASE("Subtitles are burned in with escaped path and fonts directory", "[compiler]") {
    const std::string subs = write_temp("tlc it's:subs.srt");
    const std::string fonts = std::filesystem::temp_directory_path().string();
    auto doc = doc_of({test::video("a.mp4", 0, 90)});
    doc.job.subtitle_path = subs;
    doc.job.subtitle_font_families = {"Inter"};
    doc.job.font_directories["Inter"] = {fonts};
    auto fc = compile_ok(doc).filter_complex();
    REQUIRE(fc.find("subtitles='" + graph::escape_filter_path(subs) + "'" + graph::fontsdir_option({fonts}) +
                    ",setsar=1[video]") != std::string::npos);
}

TEST_CASE("Missing font directory is a missing asset", "[compiler]") {
    auto doc = doc_of({test::video("a.mp4", 0, 90)});
    doc.job.subtitle_path = write_temp("tlc_fonts_subs.srt");
    doc.job.subtitle_font_families = {"Inter"};
    doc.job.font_directories["Inter"] = {"/definitely/not/a/font/dir"};
    auto built = test::build_software(doc);
    REQUIRE_FALSE(built);
    REQUIRE(built.error().kind == core::ErrorKind::MissingAsset);
    REQUIRE(built.error().message.find("font directory") != std::string::npos);
}

TEST_CASE("VAAPI profile maps the uploaded output", "[compiler]") {
    auto doc = doc_of({test::video("a.mp4", 0, 90)});
    doc.job.hardware.type = "vaapi";
    auto cache = test::fixed_cache(test::detected({hw::profile_for(hw::HardwareType::Vaapi)}));
    auto built = command::build_command(doc, cache);
    REQUIRE(built);
    const auto& out = built.value();
    REQUIRE(out.compiled.video_output == "video_hw");
    REQUIRE(out.compiled.filter_complex().find("[video]format=nv12,hwupload=extra_hw_frames=64:derive_device=vaapi[video_hw]")
            != std::string::npos);
    const auto& args = out.command.args;
    auto map = std::find(args.begin(), args.end(), "-map");
    REQUIRE(map != args.end());
    REQUIRE(*(map + 1) == "[video_hw]");
}

TEST_CASE("NVENC profile compiles with CUDA scaling", "[compiler]") {
    auto doc = doc_of({test::video("a.mp4", 0, 30), test::video("b.mp4", 30, 60, 0, 1280, 720)});
    doc.job.hardware.type = "nvenc";
    auto cache = test::fixed_cache(test::detected({hw::profile_for(hw::HardwareType::Nvenc)}));
    auto built = command::build_command(doc, cache);
    REQUIRE(built);
    const std::string fc = built.value().compiled.filter_complex();
    REQUIRE(fc.find("hwupload_cuda,scale_cuda=1920:1080:force_original_aspect_ratio=decrease,hwdownload,format=nv12")
            != std::string::npos);
}

TEST_CASE("Audio-bearing detection", "[compiler]") {
    auto tracks = catalog::ingest({test::clip("logo.png", 0, 30), test::caption("hi", 0, 30, 1)});
    REQUIRE(tracks);
    auto map = timeline::build(*tracks, {30, 1});
    REQUIRE_FALSE(compiler::has_audio_bearing_layers(map));

    auto with_gap = catalog::ingest({test::gap(0, 30, "audio")});
    REQUIRE(with_gap);
    auto map2 = timeline::build(*with_gap, {30, 1});
    REQUIRE(compiler::has_audio_bearing_layers(map2));
}
