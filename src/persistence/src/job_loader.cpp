#include "persistence/job_loader.hpp"
#include "persistence/json_reader.hpp"
#include "core/log.hpp"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace tlc::persistence {

using catalog::DeclaredGap;
using catalog::Job;
using catalog::JobDocument;
using catalog::TextStyle;
using catalog::TrackDescriptor;
using catalog::Transform;

namespace {

constexpr int kSupportedVersion = 1;

// Field readers: absent or null leaves the target untouched, a wrong type is an error.
class Reader {
public:
    explicit Reader(std::string where) : where_(std::move(where)) {}

    const std::string& error() const { return error_; }
    bool ok() const { return error_.empty(); }

    bool fail(const std::string& key, const std::string& msg) {
        if (error_.empty()) error_ = where_ + "." + key + ": " + msg;
        return false;
    }

    bool number(const JsonValue& obj, const char* key, double& out) {
        const JsonValue* v = obj.get(key);
        if (!v || v->is_null()) return true;
        if (!v->is_number()) return fail(key, "expected number");
        out = v->number;
        return true;
    }

    bool number(const JsonValue& obj, const char* key, std::optional<double>& out) {
        double tmp = 0.0;
        const JsonValue* v = obj.get(key);
        if (!v || v->is_null()) return true;
        if (!number(obj, key, tmp)) return false;
        out = tmp;
        return true;
    }

    template<typename Int>
    bool integer(const JsonValue& obj, const char* key, Int& out) {
        const JsonValue* v = obj.get(key);
        if (!v || v->is_null()) return true;
        if (!v->is_number() || std::floor(v->number) != v->number) return fail(key, "expected integer");
        // max() is not exact as a double; compare against 2^digits instead
        if (v->number < static_cast<double>(std::numeric_limits<Int>::min()) ||
            v->number >= std::ldexp(1.0, std::numeric_limits<Int>::digits)) return fail(key, "integer out of range");
        out = static_cast<Int>(v->number);
        return true;
    }

    bool integer(const JsonValue& obj, const char* key, std::optional<int>& out) {
        const JsonValue* v = obj.get(key);
        if (!v || v->is_null()) return true;
        int tmp = 0;
        if (!integer(obj, key, tmp)) return false;
        out = tmp;
        return true;
    }

    bool boolean(const JsonValue& obj, const char* key, bool& out) {
        const JsonValue* v = obj.get(key);
        if (!v || v->is_null()) return true;
        if (!v->is_bool()) return fail(key, "expected true/false");
        out = v->boolean;
        return true;
    }

    bool string(const JsonValue& obj, const char* key, std::string& out) {
        const JsonValue* v = obj.get(key);
        if (!v || v->is_null()) return true;
        if (!v->is_string()) return fail(key, "expected string");
        out = v->text;
        return true;
    }

    bool string(const JsonValue& obj, const char* key, std::optional<std::string>& out) {
        const JsonValue* v = obj.get(key);
        if (!v || v->is_null()) return true;
        if (!v->is_string()) return fail(key, "expected string");
        out = v->text;
        return true;
    }

    bool strings(const JsonValue& obj, const char* key, std::vector<std::string>& out) {
        const JsonValue* v = obj.get(key);
        if (!v || v->is_null()) return true;
        if (!v->is_array()) return fail(key, "expected array of strings");
        out.clear();
        for (const auto& item : v->items) {
            if (!item.is_string()) return fail(key, "expected array of strings");
            out.push_back(item.text);
        }
        return true;
    }

    bool canvas(const JsonValue& obj, const char* key, std::optional<Canvas>& out) {
        const JsonValue* v = obj.get(key);
        if (!v || v->is_null()) return true;
        if (!v->is_object()) return fail(key, "expected {\"width\":..,\"height\":..}");
        Canvas c{};
        Reader sub(where_ + "." + key);
        if (!sub.integer(*v, "width", c.width) || !sub.integer(*v, "height", c.height)) return adopt(sub);
        if (!c.valid()) return fail(key, "width and height must be positive");
        out = c;
        return true;
    }

    bool adopt(const Reader& sub) {
        if (error_.empty()) error_ = sub.error_;
        return false;
    }

private:
    std::string where_;
    std::string error_;
};

// "30", 29.97, "30000/1001" or {"num":30000,"den":1001}
bool read_frame_rate(const JsonValue& v, FrameRate& out, std::string& err) {
    if (v.is_number()) {
        if (!(v.number > 0.0)) { err = "fps must be positive"; return false; }
        out = frame_rate_from_double(v.number);
        return true;
    }
    if (v.is_string()) {
        auto slash = v.text.find('/');
        char* end = nullptr;
        if (slash == std::string::npos) {
            double fps = std::strtod(v.text.c_str(), &end);
            if (end == v.text.c_str() || *end != '\0' || !(fps > 0.0)) { err = "invalid fps '" + v.text + "'"; return false; }
            out = frame_rate_from_double(fps);
            return true;
        }
        std::string num_s = v.text.substr(0, slash), den_s = v.text.substr(slash + 1);
        long long num = std::strtoll(num_s.c_str(), &end, 10);
        if (num_s.empty() || *end != '\0') { err = "invalid fps '" + v.text + "'"; return false; }
        long long den = std::strtoll(den_s.c_str(), &end, 10);
        if (den_s.empty() || *end != '\0' || num <= 0 || den <= 0 || den > std::numeric_limits<int32_t>::max()) {
            err = "invalid fps '" + v.text + "'";
            return false;
        }
        out = normalize(make_time(num, static_cast<int32_t>(den)));
        return true;
    }
    if (v.is_object()) {
        Reader r("job.fps");
        int64_t num = 0;
        int32_t den = 1;
        if (!r.integer(v, "num", num) || !r.integer(v, "den", den)) { err = r.error(); return false; }
        if (num <= 0 || den <= 0) { err = "fps num/den must be positive"; return false; }
        out = normalize(make_time(num, den));
        return true;
    }
    err = "fps must be a number, \"num/den\" string or {num,den} object";
    return false;
}

bool read_transform(Reader& r, const JsonValue& v, std::optional<Transform>& out) {
    if (v.is_null()) return true;
    if (!v.is_object()) return r.fail("transform", "expected object");
    Transform t;
    if (!r.number(v, "x", t.x) || !r.number(v, "y", t.y) ||
        !r.number(v, "scale", t.scale) || !r.number(v, "rotation", t.rotation)) return false;
    out = t;
    return true;
}

bool read_text_style(Reader& r, const JsonValue& v, std::optional<TextStyle>& out) {
    if (v.is_null()) return true;
    if (!v.is_object()) return r.fail("text_style", "expected object");
    TextStyle s;
    bool ok = r.string(v, "font_family", s.font_family)
        && r.string(v, "font_file", s.font_file)
        && r.integer(v, "font_size", s.font_size)
        && r.string(v, "color", s.color)
        && r.string(v, "stroke_color", s.stroke_color)
        && r.string(v, "background_color", s.background_color)
        && r.boolean(v, "shadow", s.shadow)
        && r.string(v, "align", s.align)
        && r.string(v, "text_transform", s.text_transform);
    if (!ok) return false;
    out = s;
    return true;
}

// volume_db also accepts "-inf" since JSON has no infinity literal
bool read_volume(Reader& r, const JsonValue& obj, std::optional<double>& out) {
    const JsonValue* v = obj.get("volume_db");
    if (v && v->is_string()) {
        if (v->text == "-inf" || v->text == "-infinity") {
            out = -std::numeric_limits<double>::infinity();
            return true;
        }
        return r.fail("volume_db", "expected number or \"-inf\"");
    }
    return r.number(obj, "volume_db", out);
}

core::Result<TrackDescriptor> read_track(const JsonValue& v, size_t index) {
    std::string where = "tracks[" + std::to_string(index) + "]";
    if (!v.is_object()) return core::Error<TrackDescriptor>(where + ": expected object");
    Reader r(where);
    TrackDescriptor d;
    const JsonValue* path = v.get("path");
    if (!path || !path->is_string()) return core::Error<TrackDescriptor>(where + ".path: required string");
    d.path = path->text;
    bool ok = r.string(v, "audio_path", d.audio_path)
        && r.number(v, "start_time", d.start_time)
        && r.number(v, "duration", d.duration)
        && r.integer(v, "timeline_start_frame", d.timeline_start_frame)
        && r.integer(v, "timeline_end_frame", d.timeline_end_frame)
        && r.integer(v, "layer", d.layer)
        && r.string(v, "track_type", d.track_type)
        && r.string(v, "gap_type", d.gap_type)
        && r.boolean(v, "muted", d.muted)
        && r.boolean(v, "visible", d.visible)
        && read_volume(r, v, d.volume_db)
        && r.number(v, "fade_in", d.fade_in)
        && r.number(v, "fade_out", d.fade_out)
        && r.integer(v, "width", d.width)
        && r.integer(v, "height", d.height)
        && r.string(v, "aspect_ratio", d.aspect_ratio)
        && r.string(v, "text", d.text);
    if (ok) {
        if (const JsonValue* t = v.get("transform")) ok = read_transform(r, *t, d.transform);
    }
    if (ok) {
        if (const JsonValue* s = v.get("text_style")) ok = read_text_style(r, *s, d.text_style);
    }
    if (!ok) return core::Error<TrackDescriptor>(r.error());
    return core::Ok(std::move(d));
}

core::VoidResult read_gaps(const JsonValue& arr, std::vector<DeclaredGap>& out) {
    if (!arr.is_array()) return core::Error<bool>("job.gaps: expected array");
    for (size_t i = 0; i < arr.items.size(); ++i) {
        const JsonValue& g = arr.items[i];
        std::string where = "job.gaps[" + std::to_string(i) + "]";
        if (!g.is_object()) return core::Error<bool>(where + ": expected object");
        Reader r(where);
        DeclaredGap gap;
        std::string medium = "video";
        if (!r.string(g, "medium", medium) || !r.integer(g, "layer", gap.layer) ||
            !r.integer(g, "start_frame", gap.start_frame) || !r.integer(g, "length_frames", gap.length_frames)) {
            return core::Error<bool>(r.error());
        }
        auto m = catalog::parse_medium(medium);
        if (!m || (*m != catalog::Medium::Video && *m != catalog::Medium::Audio)) {
            return core::Error<bool>(where + ".medium: must be video or audio");
        }
        if (gap.length_frames <= 0) return core::Error<bool>(where + ".length_frames: must be positive");
        if (gap.start_frame < 0) return core::Error<bool>(where + ".start_frame: must not be negative");
        gap.medium = *m;
        out.push_back(gap);
    }
    return core::Ok();
}

core::VoidResult read_font_directories(const JsonValue& obj, std::map<std::string, std::vector<std::string>>& out) {
    if (!obj.is_object()) return core::Error<bool>("job.font_directories: expected object");
    for (size_t i = 0; i < obj.keys.size(); ++i) {
        const JsonValue& dirs = obj.items[i];
        std::vector<std::string> list;
        if (dirs.is_string()) {
            list.push_back(dirs.text);
        } else if (dirs.is_array()) {
            for (const auto& d : dirs.items) {
                if (!d.is_string()) return core::Error<bool>("job.font_directories." + obj.keys[i] + ": expected strings");
                list.push_back(d.text);
            }
        } else {
            return core::Error<bool>("job.font_directories." + obj.keys[i] + ": expected string or array");
        }
        out[obj.keys[i]] = std::move(list);
    }
    return core::Ok();
}

core::VoidResult read_tunables(const JsonValue& obj, core::Tunables& t) {
    if (!obj.is_object()) return core::Error<bool>("job.tunables: expected object");
    Reader r("job.tunables");
    std::optional<Canvas> canvas;
    bool ok = r.number(obj, "gap_epsilon_frames", t.gap_epsilon_frames)
        && r.number(obj, "aspect_tolerance", t.aspect_tolerance)
        && r.number(obj, "min_split_duration", t.min_split_duration)
        && r.number(obj, "mute_volume_db", t.mute_volume_db)
        && r.canvas(obj, "default_canvas", canvas)
        && r.integer(obj, "audio_sample_rate", t.audio_sample_rate)
        && r.string(obj, "audio_channel_layout", t.audio_channel_layout)
        && r.string(obj, "fill_color", t.fill_color)
        && r.integer(obj, "time_decimals", t.time_decimals)
        && r.integer(obj, "audio_trim_decimals", t.audio_trim_decimals);
    if (!ok) return core::Error<bool>(r.error());
    if (canvas) t.default_canvas = *canvas;
    if (const JsonValue* fps = obj.get("default_fps"); fps && !fps->is_null()) {
        std::string err;
        if (!read_frame_rate(*fps, t.default_fps, err)) return core::Error<bool>("job.tunables.default_fps: " + err);
    }
    if (t.audio_sample_rate <= 0) return core::Error<bool>("job.tunables.audio_sample_rate: must be positive");
    if (t.time_decimals < 0 || t.audio_trim_decimals < 0) return core::Error<bool>("job.tunables: decimals must not be negative");
    return core::Ok();
}

core::Result<Job> read_job(const JsonValue& v) {
    Job job;
    if (v.is_null()) return core::Ok(std::move(job));
    if (!v.is_object()) return core::Error<Job>("job: expected object");

    // Tunables first so the default frame rate applies when "fps" is absent.
    if (const JsonValue* t = v.get("tunables"); t && !t->is_null()) {
        auto res = read_tunables(*t, job.tunables);
        if (!res) return core::Error<Job>(res.error());
    }
    job.fps = job.tunables.default_fps;
    if (const JsonValue* fps = v.get("fps"); fps && !fps->is_null()) {
        std::string err;
        if (!read_frame_rate(*fps, job.fps, err)) return core::Error<Job>("job.fps: " + err);
    }

    Reader r("job");
    bool ok = r.boolean(v, "normalize_frame_rate", job.normalize_frame_rate)
        && r.canvas(v, "export_size", job.export_size)
        && r.canvas(v, "output_size", job.output_size)
        && r.string(v, "aspect", job.aspect)
        && r.boolean(v, "prefer_hevc", job.prefer_hevc)
        && r.string(v, "preset", job.preset)
        && r.integer(v, "threads", job.threads)
        && r.string(v, "output", job.output_path)
        && r.boolean(v, "overwrite", job.overwrite);
    if (!ok) return core::Error<Job>(r.error());
    if (job.threads < 0) return core::Error<Job>("job.threads: must not be negative");

    if (const JsonValue* subs = v.get("subtitles"); subs && !subs->is_null()) {
        if (!subs->is_object()) return core::Error<Job>("job.subtitles: expected object");
        Reader sr("job.subtitles");
        if (!sr.string(*subs, "path", job.subtitle_path) ||
            !sr.string(*subs, "format", job.subtitle_format) ||
            !sr.strings(*subs, "font_families", job.subtitle_font_families)) {
            return core::Error<Job>(sr.error());
        }
    }
    if (const JsonValue* fonts = v.get("font_directories"); fonts && !fonts->is_null()) {
        auto res = read_font_directories(*fonts, job.font_directories);
        if (!res) return core::Error<Job>(res.error());
    }
    if (const JsonValue* gaps = v.get("gaps"); gaps && !gaps->is_null()) {
        auto res = read_gaps(*gaps, job.gaps);
        if (!res) return core::Error<Job>(res.error());
    }
    if (const JsonValue* hw = v.get("hardware"); hw && !hw->is_null()) {
        if (hw->is_bool()) {
            job.hardware.enabled = hw->boolean;
        } else if (hw->is_string()) {
            job.hardware.type = hw->text;
        } else if (hw->is_object()) {
            Reader hr("job.hardware");
            if (!hr.boolean(*hw, "enabled", job.hardware.enabled) || !hr.string(*hw, "type", job.hardware.type)) {
                return core::Error<Job>(hr.error());
            }
        } else {
            return core::Error<Job>("job.hardware: expected object, string or bool");
        }
    }
    return core::Ok(std::move(job));
}

} // namespace

core::Result<JobDocument> parse_job_json(const std::string& text) noexcept {
    try {
        auto parsed = parse_json(text);
        if (!parsed) return core::Error<JobDocument>("invalid JSON: " + parsed.error());
        const JsonValue& root = parsed.value();
        if (!root.is_object()) return core::Error<JobDocument>("job document must be a JSON object");

        if (const JsonValue* ver = root.get("version"); ver && !ver->is_null()) {
            if (!ver->is_number() || ver->number != static_cast<double>(kSupportedVersion)) {
                return core::Error<JobDocument>("unsupported job version");
            }
        }

        JobDocument doc;
        const JsonValue* tracks = root.get("tracks");
        if (tracks && !tracks->is_null()) {
            if (!tracks->is_array()) return core::Error<JobDocument>("tracks: expected array");
            doc.tracks.reserve(tracks->items.size());
            for (size_t i = 0; i < tracks->items.size(); ++i) {
                auto track = read_track(tracks->items[i], i);
                if (!track) return core::Error<JobDocument>(track.error());
                doc.tracks.push_back(std::move(track.value()));
            }
        }

        const JsonValue* job = root.get("job");
        auto parsed_job = read_job(job ? *job : JsonValue{});
        if (!parsed_job) return core::Error<JobDocument>(parsed_job.error());
        doc.job = std::move(parsed_job.value());
        return core::Ok(std::move(doc));
    } catch (const std::exception& e) {
        return core::Error<JobDocument>(std::string("job parse failed: ") + e.what());
    }
}

core::Result<JobDocument> load_job_json(const std::string& path) noexcept {
    try {
        std::ifstream ifs(path, std::ios::binary);
        if (!ifs) return core::Error<JobDocument>("cannot open " + path);
        std::stringstream ss;
        ss << ifs.rdbuf();
        auto res = parse_job_json(ss.str());
        if (!res) return core::Error<JobDocument>(path + ": " + res.error());
        tlc::log::debug("loaded job " + path + " (" + std::to_string(res.value().tracks.size()) + " tracks)");
        return res;
    } catch (const std::exception& e) {
        return core::Error<JobDocument>(std::string("job load failed: ") + e.what());
    }
}

} // namespace tlc::persistence
