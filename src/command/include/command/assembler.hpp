#pragma once
#include "catalog/input_catalog.hpp"
#include "catalog/job.hpp"
#include "compiler/compiler.hpp"
#include "hw/profile.hpp"
#include <string>
#include <vector>

namespace tlc::command {

struct CommandLine {
    std::vector<std::string> args;   // without the engine executable
    std::string filter_complex;
    std::string video_codec;
    hw::HardwareType hardware = hw::HardwareType::None;

    // Engine path followed by every argument, quoted where needed. For logs only.
    std::string to_display_string(const std::string& engine) const;
};

// Serializes the compiled graph and job flags. Arguments are literal strings: nothing is
// shell escaped and input/output paths are never filter escaped.
CommandLine assemble(const catalog::InputCatalog& inputs, const compiler::CompiledGraph& compiled,
                     const catalog::Job& job, const hw::HardwareProfile& profile);

} // namespace tlc::command
