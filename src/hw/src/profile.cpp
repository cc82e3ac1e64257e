#include "hw/profile.hpp"

namespace tlc::hw {

const char* type_name(HardwareType t) noexcept {
    switch (t) {
        case HardwareType::None: return "none";
        case HardwareType::Nvenc: return "nvenc";
        case HardwareType::Qsv: return "qsv";
        case HardwareType::VideoToolbox: return "videotoolbox";
        case HardwareType::Amf: return "amf";
        case HardwareType::Vaapi: return "vaapi";
    }
    return "unknown";
}

std::optional<HardwareType> parse_type(const std::string& name) noexcept {
    if (name == "none" || name == "software") return HardwareType::None;
    if (name == "nvenc") return HardwareType::Nvenc;
    if (name == "qsv") return HardwareType::Qsv;
    if (name == "videotoolbox") return HardwareType::VideoToolbox;
    if (name == "amf") return HardwareType::Amf;
    if (name == "vaapi") return HardwareType::Vaapi;
    return std::nullopt;
}

HardwareProfile software_profile() {
    HardwareProfile p;
    p.type = HardwareType::None;
    p.codec = "libx264";
    p.hevc_codec = "libx265";
    p.filter_variant = FilterVariant::Cpu;
    p.description = "Software encoding (libx264)";
    return p;
}

std::string h264_encoder_name(HardwareType type) {
    switch (type) {
        case HardwareType::Nvenc: return "h264_nvenc";
        case HardwareType::Qsv: return "h264_qsv";
        case HardwareType::VideoToolbox: return "h264_videotoolbox";
        case HardwareType::Amf: return "h264_amf";
        case HardwareType::Vaapi: return "h264_vaapi";
        case HardwareType::None: break;
    }
    return "libx264";
}

std::string hevc_encoder_name(HardwareType type) {
    switch (type) {
        case HardwareType::Nvenc: return "hevc_nvenc";
        case HardwareType::Qsv: return "hevc_qsv";
        case HardwareType::VideoToolbox: return "hevc_videotoolbox";
        case HardwareType::Amf: return "hevc_amf";
        case HardwareType::Vaapi: return "hevc_vaapi";
        case HardwareType::None: break;
    }
    return "libx265";
}

HardwareProfile profile_for(HardwareType type, bool has_hevc) {
    if (type == HardwareType::None) return software_profile();

    HardwareProfile p;
    p.type = type;
    p.codec = h264_encoder_name(type);
    if (has_hevc) p.hevc_codec = hevc_encoder_name(type);

    switch (type) {
        case HardwareType::Nvenc:
            p.decoder_flags = {"-hwaccel", "cuda"};
            p.encoder_flags = {"-preset", "p6", "-cq", "32", "-maxrate", "3M", "-bufsize", "6M"};
            p.filter_variant = FilterVariant::Cuda;
            p.description = "NVIDIA NVENC";
            break;
        case HardwareType::Qsv:
            p.decoder_flags = {"-hwaccel", "qsv"};
            p.encoder_flags = {"-preset", "medium", "-b:v", "2M"};
            p.description = "Intel Quick Sync Video";
            break;
        case HardwareType::VideoToolbox:
            p.decoder_flags = {"-hwaccel", "videotoolbox"};
            p.encoder_flags = {"-b:v", "5M"};
            p.description = "Apple VideoToolbox";
            break;
        case HardwareType::Amf:
            p.encoder_flags = {"-quality", "balanced", "-b:v", "2M"};
            p.description = "AMD AMF";
            break;
        case HardwareType::Vaapi:
            p.decoder_flags = {"-hwaccel", "vaapi", "-hwaccel_device", "/dev/dri/renderD128",
                               "-hwaccel_output_format", "vaapi"};
            p.encoder_flags = {"-compression_level", "2"};
            p.description = "VAAPI";
            break;
        case HardwareType::None:
            break;
    }
    return p;
}

const std::vector<HardwareType>& priority_order() {
    static const std::vector<HardwareType> order = {
        HardwareType::Nvenc, HardwareType::Qsv, HardwareType::VideoToolbox,
        HardwareType::Amf, HardwareType::Vaapi
    };
    return order;
}

} // namespace tlc::hw
