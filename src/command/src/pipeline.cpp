#include "command/pipeline.hpp"
#include "catalog/input_catalog.hpp"
#include "core/log.hpp"
#include "core/time.hpp"
#include "hw/selection.hpp"
#include "negotiate/negotiator.hpp"
#include "timeline/builder.hpp"

namespace tlc::command {

tlc::expected<BuildOutput, core::BuildError> build_command(const catalog::JobDocument& doc, hw::CapabilityCache& cache,
                                                           const BuildOptions& options) {
    const catalog::Job& job = doc.job;

    auto tracks = catalog::ingest(doc.tracks);
    if (!tracks) {
        return tlc::make_unexpected(tracks.error());
    }

    const catalog::InputCatalog inputs = catalog::catalog(*tracks);

    timeline::TimelineMap timelines = timeline::build(*tracks, job.fps, job.tunables);
    auto gaps = timeline::apply_declared_gaps(timelines, job.gaps, job.fps, job.tunables);
    if (!gaps) {
        return tlc::make_unexpected(core::BuildError{core::ErrorKind::ContractViolation, gaps.error()});
    }
    for (const auto& [key, tl] : timelines) {
        log::debug("Timeline layer " + std::to_string(key.layer) + " " + catalog::medium_name(key.medium) + ": " +
                   std::to_string(tl.segments().size()) + " segment(s), " + std::to_string(tl.gap_count()) +
                   " gap(s), ends " + format_timecode(tl.total_duration()));
    }

    const negotiate::Negotiation negotiation = negotiate::negotiate(timelines, job);
    hw::HardwareProfile profile = hw::resolve_profile(job.hardware, cache, options.engine_path);

    compiler::FilterGraphCompiler compiler(job, profile, options.fonts);
    auto compiled = compiler.compile(inputs, timelines, negotiation);
    if (!compiled) {
        return tlc::make_unexpected(compiled.error());
    }

    CommandLine command = assemble(inputs, *compiled, job, profile);
    log::info("Command: " + command.to_display_string(options.engine_path));

    return BuildOutput{std::move(command), std::move(compiled).value(), std::move(profile)};
}

} // namespace tlc::command
