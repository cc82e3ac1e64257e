#include "command/pipeline.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include "hw/capability_cache.hpp"
#include "hw/engine_runner.hpp"
#include "media_io/media_probe.hpp"
#include "persistence/job_loader.hpp"
#include <iostream>
#include <sstream>
#include <string>

namespace {

void print_usage() {
    std::cout << "Usage: tlc_compile [--json] [--ffmpeg <path>] [--no-hw] [--probe-media] [--log-json] <job.json>\n";
}

std::string json_quote(const std::string& s) {
    std::ostringstream oss;
    oss << '"';
    for(char c : s) {
        switch(c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default: oss << c; break;
        }
    }
    oss << '"';
    return oss.str();
}

} // namespace

int main(int argc, char** argv) {
    bool json = false;
    bool no_hw = false;
    bool probe_media = false;
    std::string engine = "ffmpeg";
    std::string path;
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a == "--json") { json = true; continue; }
        if(a == "--no-hw") { no_hw = true; continue; }
        if(a == "--probe-media") { probe_media = true; continue; }
        if(a == "--log-json") { tlc::log::set_json_mode(true); continue; }
        if(a == "--ffmpeg") {
            if(i + 1 >= argc) { print_usage(); return 1; }
            engine = argv[++i];
            continue;
        }
        if(a == "-h" || a == "--help") { print_usage(); return 0; }
        if(!a.empty() && a[0] == '-') { std::cerr << "Unknown option " << a << "\n"; print_usage(); return 1; }
        path = a; // last non-flag wins
    }
    if(path.empty()) { print_usage(); return 1; }

    auto loaded = tlc::persistence::load_job_json(path);
    if(!loaded) {
        tlc::log::error("Job load failed: " + loaded.error());
        return 2;
    }
    tlc::catalog::JobDocument doc = std::move(loaded.value());
    if(no_hw) doc.job.hardware.enabled = false;
    if(probe_media) {
        auto n = tlc::media::fill_missing_dimensions(doc.tracks);
        tlc::log::info("Probed dimensions for " + std::to_string(n) + " track(s)");
    }

    tlc::hw::ProcessEngineRunner runner;
    auto cache = tlc::hw::make_process_cache(runner);
    tlc::command::BuildOptions options;
    options.engine_path = engine;

    auto built = tlc::command::build_command(doc, cache, options);
    if(!built) {
        tlc::log::error("Build failed: " + tlc::core::describe(built.error()));
        return 3;
    }

    const auto& args = built.value().command.args;
    if(json) {
        std::ostringstream oss;
        oss << '[' << json_quote(engine);
        for(const auto& a : args) oss << ',' << json_quote(a);
        oss << ']';
        std::cout << oss.str() << std::endl;
    } else {
        std::cout << engine << "\n";
        for(const auto& a : args) std::cout << a << "\n";
    }
    return 0;
}
