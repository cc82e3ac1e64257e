#include "catalog/input_catalog.hpp"
#include "core/log.hpp"

namespace tlc::catalog {

int InputCatalog::intern(const std::string& path, bool loop_still) {
    auto it = by_path_.find(path);
    if (it != by_path_.end()) {
        return it->second;
    }
    int index = static_cast<int>(entries_.size());
    entries_.push_back(InputEntry{index, path, loop_still});
    by_path_.emplace(path, index);
    return index;
}

InputCatalog InputCatalog::build(const std::vector<Track>& tracks) {
    InputCatalog c;
    for (const auto& t : tracks) {
        if (t.is_gap() || t.is_text()) continue;

        CatalogedInput in;
        in.track_index = t.index;
        in.path = t.desc.path;
        in.audio_path = t.desc.audio_path;
        in.file_index = c.intern(t.desc.path, t.is_image());
        if (t.desc.audio_path && !t.desc.audio_path->empty()) {
            in.audio_file_index = c.intern(*t.desc.audio_path, false);
        }

        if (t.is_audio()) c.audio_inputs_.push_back(std::move(in));
        else c.video_inputs_.push_back(std::move(in));
    }
    log::debug("Cataloged " + std::to_string(c.entries_.size()) + " unique inputs (" +
               std::to_string(c.video_inputs_.size()) + " visual, " +
               std::to_string(c.audio_inputs_.size()) + " audio)");
    return c;
}

std::optional<int> InputCatalog::index_of(const std::string& path) const {
    auto it = by_path_.find(path);
    if (it == by_path_.end()) return std::nullopt;
    return it->second;
}

const CatalogedInput* InputCatalog::find_by_track(const std::vector<CatalogedInput>& list, std::size_t track_index) {
    for (const auto& in : list) {
        if (in.track_index == track_index) return &in;
    }
    return nullptr;
}

std::optional<int> InputCatalog::resolve_video(std::optional<std::size_t> track_index, const std::string& path) const {
    if (track_index) {
        if (const auto* in = find_by_track(video_inputs_, *track_index)) return in->file_index;
    }
    return index_of(path);
}

std::optional<int> InputCatalog::resolve_audio(std::optional<std::size_t> track_index, const std::string& path,
                                               const std::optional<std::string>& audio_path) const {
    if (audio_path && !audio_path->empty()) {
        // The owning video track may have registered the audio file first
        if (track_index) {
            if (const auto* in = find_by_track(video_inputs_, *track_index); in && in->audio_file_index) {
                return in->audio_file_index;
            }
        }
        if (auto idx = index_of(*audio_path)) return idx;
    }
    if (track_index) {
        if (const auto* in = find_by_track(audio_inputs_, *track_index)) {
            return in->audio_file_index ? in->audio_file_index : std::optional<int>(in->file_index);
        }
    }
    return index_of(path);
}

} // namespace tlc::catalog
