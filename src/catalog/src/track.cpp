#include "catalog/track.hpp"
#include "core/log.hpp"
#include <algorithm>
#include <cctype>

namespace tlc::catalog {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

bool has_extension(const std::string& ext, std::initializer_list<const char*> list) {
    for (const char* e : list) {
        if (ext == e) return true;
    }
    return false;
}

} // namespace

const char* medium_name(Medium m) noexcept {
    switch (m) {
        case Medium::Video: return "video";
        case Medium::Audio: return "audio";
        case Medium::Image: return "image";
        case Medium::Text: return "text";
    }
    return "unknown";
}

std::optional<Medium> parse_medium(const std::string& name) noexcept {
    if (name == "video") return Medium::Video;
    if (name == "audio") return Medium::Audio;
    if (name == "image") return Medium::Image;
    if (name == "text") return Medium::Text;
    return std::nullopt;
}

Medium medium_of(const TrackKind& kind) noexcept {
    struct Visitor {
        Medium operator()(const GapKind& g) const { return g.medium; }
        Medium operator()(const VideoKind&) const { return Medium::Video; }
        Medium operator()(const AudioKind&) const { return Medium::Audio; }
        Medium operator()(const ImageKind&) const { return Medium::Image; }
        Medium operator()(const TextKind&) const { return Medium::Text; }
    };
    return std::visit(Visitor{}, kind);
}

const char* kind_name(const TrackKind& kind) noexcept {
    switch (kind.index()) {
        case 0: return "gap";
        case 1: return "video";
        case 2: return "audio";
        case 3: return "image";
        case 4: return "text";
    }
    return "unknown";
}

std::optional<Medium> medium_from_extension(const std::string& path) noexcept {
    auto dot = path.find_last_of('.');
    auto slash = path.find_last_of("/\\");
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return std::nullopt;
    std::string ext = lower(path.substr(dot + 1));
    if (has_extension(ext, {"mp4", "mov", "mkv", "avi", "webm"})) return Medium::Video;
    if (has_extension(ext, {"mp3", "wav", "aac", "flac"})) return Medium::Audio;
    if (has_extension(ext, {"png", "jpg", "jpeg", "gif", "bmp", "tiff", "webp"})) return Medium::Image;
    return std::nullopt;
}

tlc::expected<TrackKind, core::BuildError> classify(const TrackDescriptor& desc) {
    using core::BuildError;
    using core::ErrorKind;

    if (desc.is_gap_marker()) {
        // Gaps only exist on the two streaming media
        std::optional<Medium> m;
        if (desc.gap_type) m = parse_medium(lower(*desc.gap_type));
        if (!m && desc.track_type) m = parse_medium(lower(*desc.track_type));
        if (!m) m = Medium::Video;
        if (*m != Medium::Video && *m != Medium::Audio) {
            return tlc::make_unexpected(BuildError{ErrorKind::ContractViolation,
                std::string("gap marker declares unsupported medium '") + medium_name(*m) + "'"});
        }
        return TrackKind{GapKind{*m}};
    }

    std::optional<Medium> m;
    if (desc.track_type) {
        m = parse_medium(lower(*desc.track_type));
        if (!m) {
            return tlc::make_unexpected(BuildError{ErrorKind::ContractViolation,
                "unknown track_type '" + *desc.track_type + "' for " + desc.path});
        }
    } else {
        m = medium_from_extension(desc.path);
    }

    if (!m) {
        if (!desc.text.empty()) m = Medium::Text;
        else {
            return tlc::make_unexpected(BuildError{ErrorKind::ContractViolation,
                "cannot classify track '" + desc.path + "': no track_type and unknown extension"});
        }
    }

    switch (*m) {
        case Medium::Video: return TrackKind{VideoKind{}};
        case Medium::Audio: return TrackKind{AudioKind{}};
        case Medium::Image: return TrackKind{ImageKind{}};
        case Medium::Text: return TrackKind{TextKind{desc.text, desc.text_style.value_or(TextStyle{})}};
    }
    return tlc::make_unexpected(BuildError{ErrorKind::ContractViolation, "unreachable medium"});
}

tlc::expected<std::vector<Track>, core::BuildError> ingest(const std::vector<TrackDescriptor>& descriptors) {
    std::vector<Track> tracks;
    tracks.reserve(descriptors.size());
    for (std::size_t i = 0; i < descriptors.size(); ++i) {
        auto kind = classify(descriptors[i]);
        if (!kind) {
            auto err = kind.error();
            err.message = "tracks[" + std::to_string(i) + "]: " + err.message;
            return tlc::make_unexpected(std::move(err));
        }
        Track t;
        t.index = i;
        t.desc = descriptors[i];
        t.kind = std::move(kind.value());
        tracks.push_back(std::move(t));
    }
    tlc::log::debug("Ingested " + std::to_string(tracks.size()) + " track descriptors");
    return tracks;
}

} // namespace tlc::catalog
