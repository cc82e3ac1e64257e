#pragma once
#include "hw/capability_probe.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace tlc::hw {

// Memoizes one detection per engine path. Pass it explicitly to whoever needs hardware info.
class CapabilityCache {
public:
    using ProviderFactory = std::function<std::unique_ptr<CapabilityProvider>(const std::string& engine_path)>;

    explicit CapabilityCache(ProviderFactory factory);

    // Cached result for `engine_path`; probes on first use or after invalidate().
    DetectionResult get(const std::string& engine_path);

    // Forces the next get() to probe again (e.g. after a driver install).
    void invalidate();

    std::size_t probe_count() const;

private:
    ProviderFactory factory_;
    mutable std::mutex mutex_;
    std::string cached_path_;
    std::optional<DetectionResult> cached_;
    std::size_t probes_ = 0;
};

// Cache wired to real child processes.
CapabilityCache make_process_cache(EngineRunner& runner, ProbeOptions options = {});

} // namespace tlc::hw
