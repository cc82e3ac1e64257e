#include "command/assembler.hpp"
#include "core/time.hpp"

namespace tlc::command {

namespace {

bool needs_quotes(const std::string& a) {
    if (a.empty()) return true;
    for (char c : a) {
        if (c == ' ' || c == '\'' || c == '"' || c == ';' || c == '[' || c == '|' || c == '\\') return true;
    }
    return false;
}

} // namespace

std::string CommandLine::to_display_string(const std::string& engine) const {
    std::string out = engine;
    for (const auto& a : args) {
        out += ' ';
        if (needs_quotes(a)) {
            out += '"';
            for (char c : a) {
                if (c == '"' || c == '\\') out += '\\';
                out += c;
            }
            out += '"';
        } else {
            out += a;
        }
    }
    return out;
}

CommandLine assemble(const catalog::InputCatalog& inputs, const compiler::CompiledGraph& compiled,
                     const catalog::Job& job, const hw::HardwareProfile& profile) {
    CommandLine cmd;
    auto& a = cmd.args;
    cmd.filter_complex = compiled.filter_complex();
    cmd.video_codec = profile.video_codec(job.prefer_hevc);
    cmd.hardware = profile.type;

    if (job.overwrite) a.push_back("-y");

    a.insert(a.end(), profile.decoder_flags.begin(), profile.decoder_flags.end());

    for (const auto& in : inputs.entries()) {
        if (in.loop_still) {
            a.push_back("-loop");
            a.push_back("1");
        }
        a.push_back("-i");
        a.push_back(in.path);
    }

    a.push_back("-filter_complex");
    a.push_back(cmd.filter_complex);

    a.push_back("-map");
    a.push_back("[" + compiled.video_output + "]");
    if (compiled.audio_output) {
        a.push_back("-map");
        a.push_back("[" + *compiled.audio_output + "]");
    }

    a.push_back("-c:v");
    a.push_back(cmd.video_codec);
    a.push_back("-c:a");
    a.push_back("aac");

    if (profile.is_software()) {
        if (job.preset && !job.preset->empty()) {
            a.insert(a.end(), {"-preset", *job.preset, "-crf", "28", "-b:a", "96k"});
        }
    } else {
        a.insert(a.end(), profile.encoder_flags.begin(), profile.encoder_flags.end());
    }

    if (job.threads > 0) {
        a.push_back("-threads");
        a.push_back(std::to_string(job.threads));
    }

    const FrameRate fps = job.fps.num > 0 && job.fps.den > 0 ? job.fps : job.tunables.default_fps;
    a.push_back("-r");
    a.push_back(format_rate(fps));

    a.push_back(job.output_path);
    return cmd;
}

} // namespace tlc::command
