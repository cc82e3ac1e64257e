#pragma once
#include "catalog/job.hpp"
#include "core/result.hpp"
#include <string>

namespace tlc::persistence {

// Job file layout (all keys optional unless noted, unknown keys are skipped):
// {
//   "version": 1,
//   "tracks": [ { "path": "...", "timeline_start_frame": 0, "timeline_end_frame": 150, ... } ],
//   "job": { "fps": 30 | "30000/1001" | {"num":..,"den":..}, "output": "out.mp4", ... }
// }
core::Result<catalog::JobDocument> parse_job_json(const std::string& text) noexcept;
core::Result<catalog::JobDocument> load_job_json(const std::string& path) noexcept;

} // namespace tlc::persistence
