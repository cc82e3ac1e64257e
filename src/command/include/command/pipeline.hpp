#pragma once
#include "catalog/job.hpp"
#include "command/assembler.hpp"
#include "compiler/compiler.hpp"
#include "compiler/font_resolver.hpp"
#include "core/errors.hpp"
#include "core/expected.hpp"
#include "hw/capability_cache.hpp"
#include "hw/profile.hpp"
#include <string>

namespace tlc::command {

struct BuildOptions {
    std::string engine_path = "ffmpeg";
    const compiler::FontResolver* fonts = nullptr;   // job's font table when null
};

struct BuildOutput {
    CommandLine command;
    compiler::CompiledGraph compiled;
    hw::HardwareProfile profile;
};

// Whole chain: ingest, catalog, timelines, negotiation, hardware selection, compile, assemble.
// Hardware detection goes through `cache` and only when the job asks for hardware.
tlc::expected<BuildOutput, core::BuildError> build_command(const catalog::JobDocument& doc, hw::CapabilityCache& cache,
                                                           const BuildOptions& options = {});

} // namespace tlc::command
