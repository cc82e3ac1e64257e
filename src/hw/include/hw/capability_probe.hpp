#pragma once
#include "hw/engine_runner.hpp"
#include "hw/profile.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tlc::hw {

struct DetectionResult {
    std::optional<HardwareProfile> primary;   // first surviving candidate in priority order
    std::vector<HardwareProfile> all;         // every candidate that passed its smoke encode
    HardwareProfile fallback = software_profile();

    const HardwareProfile* find(HardwareType type) const;
};

// Collaborator interface: anything that can say which encoders work.
class CapabilityProvider {
public:
    virtual ~CapabilityProvider() = default;
    virtual DetectionResult detect() = 0;
};

struct ProbeOptions {
    std::chrono::milliseconds list_timeout{10000};
    std::chrono::milliseconds smoke_timeout{5000};
    std::string vaapi_render_node = "/dev/dri/renderD128";
    // Replaced in tests so the render node check does not touch the file system
    std::function<bool(const std::string&)> path_exists;
};

// Lists the engine's encoders, then smoke-encodes a tiny test pattern with every listed
// hardware encoder. Candidates that fail are demoted, never reported as errors.
class EngineCapabilityProbe : public CapabilityProvider {
public:
    EngineCapabilityProbe(std::string engine_path, EngineRunner& runner, ProbeOptions options = {});
    DetectionResult detect() override;

    // Argument vector of the smoke encode for one candidate.
    std::vector<std::string> smoke_test_args(HardwareType type, const std::string& codec) const;

private:
    bool smoke_test(HardwareType type, const std::string& codec);
    bool render_node_exists() const;

    std::string engine_path_;
    EngineRunner& runner_;
    ProbeOptions options_;
};

// Output fragments that reveal a broken VAAPI stack even when the exit code is 0.
const std::vector<std::string>& vaapi_failure_patterns();

} // namespace tlc::hw
