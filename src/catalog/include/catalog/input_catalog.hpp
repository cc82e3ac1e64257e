#pragma once
#include "catalog/track.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tlc::catalog {

// One "-i" argument. Index equals the position in InputCatalog::entries().
struct InputEntry {
    int index = 0;
    std::string path;
    bool loop_still = false;   // images are looped so they last as long as their window
};

// Cataloged view of one non-gap, non-text track.
struct CatalogedInput {
    std::size_t track_index = 0;
    int file_index = -1;
    std::optional<int> audio_file_index;   // set when the track carries a separate audio file
    std::string path;
    std::optional<std::string> audio_path;
};

// Assigns engine input indices, one per unique file path, in first-seen order.
// Gaps and text tracks never consume an index.
class InputCatalog {
public:
    static InputCatalog build(const std::vector<Track>& tracks);

    const std::vector<InputEntry>& entries() const { return entries_; }
    const std::vector<CatalogedInput>& video_inputs() const { return video_inputs_; }
    const std::vector<CatalogedInput>& audio_inputs() const { return audio_inputs_; }
    int next_index() const { return static_cast<int>(entries_.size()); }

    std::optional<int> index_of(const std::string& path) const;

    // Video/image stream lookup: exact track index first, then path.
    std::optional<int> resolve_video(std::optional<std::size_t> track_index, const std::string& path) const;

    // Audio stream lookup. A separate audio file (found through the owning video track or by
    // its own path) wins, then exact track index, then path.
    std::optional<int> resolve_audio(std::optional<std::size_t> track_index, const std::string& path,
                                     const std::optional<std::string>& audio_path) const;

private:
    int intern(const std::string& path, bool loop_still);
    static const CatalogedInput* find_by_track(const std::vector<CatalogedInput>& list, std::size_t track_index);

    std::vector<InputEntry> entries_;
    std::map<std::string, int> by_path_;
    std::vector<CatalogedInput> video_inputs_;
    std::vector<CatalogedInput> audio_inputs_;
};

inline InputCatalog catalog(const std::vector<Track>& tracks) { return InputCatalog::build(tracks); }

} // namespace tlc::catalog
