#include "hw/capability_probe.hpp"
#include "core/log.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace tlc::hw {

namespace {

constexpr const char* kTestSource = "testsrc=duration=0.1:size=320x240:rate=1";

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

const HardwareProfile* DetectionResult::find(HardwareType type) const {
    for (const auto& p : all) {
        if (p.type == type) return &p;
    }
    return nullptr;
}

const std::vector<std::string>& vaapi_failure_patterns() {
    static const std::vector<std::string> patterns = {
        "no va display",
        "device creation failed",
        "failed to set value",
        "error parsing global options",
        "impossible to convert",
        "error reinitializing",
        "function not implemented",
        "invalid argument",
    };
    return patterns;
}

EngineCapabilityProbe::EngineCapabilityProbe(std::string engine_path, EngineRunner& runner, ProbeOptions options)
    : engine_path_(std::move(engine_path)), runner_(runner), options_(std::move(options)) {
}

bool EngineCapabilityProbe::render_node_exists() const {
    if (options_.path_exists) return options_.path_exists(options_.vaapi_render_node);
    std::error_code ec;
    return std::filesystem::exists(options_.vaapi_render_node, ec);
}

std::vector<std::string> EngineCapabilityProbe::smoke_test_args(HardwareType type, const std::string& codec) const {
    if (type == HardwareType::Vaapi) {
        return {engine_path_, "-hide_banner",
                "-init_hw_device", "vaapi=va:" + options_.vaapi_render_node,
                "-f", "lavfi", "-i", kTestSource,
                "-vf", "format=nv12,hwupload=derive_device=vaapi",
                "-c:v", codec, "-f", "null", "-"};
    }
    return {engine_path_, "-hide_banner", "-f", "lavfi", "-i", kTestSource, "-c:v", codec, "-f", "null", "-"};
}

bool EngineCapabilityProbe::smoke_test(HardwareType type, const std::string& codec) {
    if (type == HardwareType::Vaapi && !render_node_exists()) {
        log::info("VAAPI encoder listed but " + options_.vaapi_render_node + " does not exist");
        return false;
    }

    RunOutput r = runner_.run(smoke_test_args(type, codec), options_.smoke_timeout);
    if (r.timed_out) {
        log::info(std::string(type_name(type)) + " smoke encode timed out; demoting");
        return false;
    }
    if (!r.succeeded()) {
        log::info(std::string(type_name(type)) + " listed but test encode failed (exit " +
                  std::to_string(r.exit_code) + "); demoting");
        return false;
    }
    if (type == HardwareType::Vaapi) {
        const std::string text = lower(r.output);
        for (const auto& pattern : vaapi_failure_patterns()) {
            if (text.find(pattern) != std::string::npos) {
                log::info("VAAPI device initialization failed: found \"" + pattern + "\"; demoting");
                return false;
            }
        }
    }
    return true;
}

DetectionResult EngineCapabilityProbe::detect() {
    DetectionResult result;
    log::info("Detecting hardware encoders with " + engine_path_);

    RunOutput listing = runner_.run({engine_path_, "-hide_banner", "-encoders"}, options_.list_timeout);
    if (!listing.succeeded()) {
        log::warn("Could not list encoders of " + engine_path_ + "; using software encoding");
        return result;
    }

    for (HardwareType type : priority_order()) {
        const std::string h264 = h264_encoder_name(type);
        const std::string hevc = hevc_encoder_name(type);
        const bool has_h264 = listing.output.find(h264) != std::string::npos;
        const bool has_hevc = listing.output.find(hevc) != std::string::npos;
        if (!has_h264 && !has_hevc) continue;

        if (!smoke_test(type, has_h264 ? h264 : hevc)) continue;

        HardwareProfile p = profile_for(type, has_hevc);
        if (!has_h264) p.codec = hevc;
        log::info(std::string(type_name(type)) + " available (" + p.codec + ")");
        result.all.push_back(std::move(p));
    }

    if (!result.all.empty()) {
        result.primary = result.all.front();
    } else {
        log::info("No working hardware encoder; using software encoding");
    }
    return result;
}

} // namespace tlc::hw
