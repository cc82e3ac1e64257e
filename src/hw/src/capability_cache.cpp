#include "hw/capability_cache.hpp"
#include "core/log.hpp"

namespace tlc::hw {

CapabilityCache::CapabilityCache(ProviderFactory factory)
    : factory_(std::move(factory)) {
}

DetectionResult CapabilityCache::get(const std::string& engine_path) {
    std::scoped_lock lk(mutex_);
    if (cached_ && cached_path_ == engine_path) {
        return *cached_;
    }
    if (cached_) {
        log::debug("Engine path changed from " + cached_path_ + " to " + engine_path + "; re-probing");
    }

    DetectionResult result;
    if (auto provider = factory_ ? factory_(engine_path) : nullptr) {
        result = provider->detect();
    } else {
        log::warn("No capability provider for " + engine_path + "; using software encoding");
    }
    ++probes_;
    cached_path_ = engine_path;
    cached_ = result;
    return result;
}

void CapabilityCache::invalidate() {
    std::scoped_lock lk(mutex_);
    cached_.reset();
    cached_path_.clear();
}

std::size_t CapabilityCache::probe_count() const {
    std::scoped_lock lk(mutex_);
    return probes_;
}

CapabilityCache make_process_cache(EngineRunner& runner, ProbeOptions options) {
    return CapabilityCache([&runner, options](const std::string& engine_path) -> std::unique_ptr<CapabilityProvider> {
        return std::make_unique<EngineCapabilityProbe>(engine_path, runner, options);
    });
}

} // namespace tlc::hw
