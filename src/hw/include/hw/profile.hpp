#pragma once
#include <optional>
#include <string>
#include <vector>

namespace tlc::hw {

enum class HardwareType { None, Nvenc, Qsv, VideoToolbox, Amf, Vaapi };

// Which primitive set the compiler gets for scale/overlay/crop.
enum class FilterVariant { Cpu, Cuda };

const char* type_name(HardwareType t) noexcept;
std::optional<HardwareType> parse_type(const std::string& name) noexcept;

struct HardwareProfile {
    HardwareType type = HardwareType::None;
    std::string codec = "libx264";
    std::optional<std::string> hevc_codec;
    std::vector<std::string> decoder_flags;
    std::vector<std::string> encoder_flags;
    FilterVariant filter_variant = FilterVariant::Cpu;
    std::string description;

    bool is_software() const { return type == HardwareType::None; }
    const std::string& video_codec(bool prefer_hevc) const {
        return (prefer_hevc && hevc_codec) ? *hevc_codec : codec;
    }
};

HardwareProfile software_profile();

// Static profile for a hardware type. `has_hevc` controls whether the HEVC codec is offered.
HardwareProfile profile_for(HardwareType type, bool has_hevc = true);

// Encoder names as they appear in "-encoders" output.
std::string h264_encoder_name(HardwareType type);
std::string hevc_encoder_name(HardwareType type);

// Detection priority: nvenc, qsv, videotoolbox, amf, vaapi.
const std::vector<HardwareType>& priority_order();

} // namespace tlc::hw
