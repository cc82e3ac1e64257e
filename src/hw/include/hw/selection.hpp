#pragma once
#include "catalog/job.hpp"
#include "hw/capability_cache.hpp"
#include "hw/profile.hpp"
#include <string>

namespace tlc::hw {

// Picks the active profile for a job. Never fails: anything unavailable falls back to software.
HardwareProfile select_profile(const catalog::HardwarePreference& pref, const DetectionResult& detection);

// Same, but only consults the cache when the preference could use hardware.
HardwareProfile resolve_profile(const catalog::HardwarePreference& pref, CapabilityCache& cache,
                                const std::string& engine_path);

} // namespace tlc::hw
