#include "hw/selection.hpp"
#include "core/log.hpp"

namespace tlc::hw {

namespace {

bool wants_hardware(const catalog::HardwarePreference& pref) {
    return pref.enabled && pref.type != "none" && pref.type != "software";
}

} // namespace

HardwareProfile select_profile(const catalog::HardwarePreference& pref, const DetectionResult& detection) {
    if (!wants_hardware(pref)) {
        return detection.fallback;
    }
    if (pref.type == "auto" || pref.type.empty()) {
        if (detection.primary) {
            log::info(std::string("Using hardware encoder: ") + type_name(detection.primary->type) +
                      " (" + detection.primary->codec + ")");
            return *detection.primary;
        }
        return detection.fallback;
    }

    auto type = parse_type(pref.type);
    if (!type) {
        log::warn("Unknown hardware type '" + pref.type + "'; using software encoding");
        return detection.fallback;
    }
    if (const HardwareProfile* p = detection.find(*type)) {
        return *p;
    }
    log::warn(std::string("Requested ") + type_name(*type) + " encoder is not available; using software encoding");
    return detection.fallback;
}

HardwareProfile resolve_profile(const catalog::HardwarePreference& pref, CapabilityCache& cache,
                                const std::string& engine_path) {
    if (!wants_hardware(pref)) {
        return software_profile();
    }
    return select_profile(pref, cache.get(engine_path));
}

} // namespace tlc::hw
