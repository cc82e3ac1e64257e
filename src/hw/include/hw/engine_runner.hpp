#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace tlc::hw {

struct RunOutput {
    int exit_code = -1;
    std::string output;     // stdout and stderr, interleaved
    bool timed_out = false;
    bool launched = false;  // false when the executable could not be started

    bool succeeded() const { return launched && !timed_out && exit_code == 0; }
};

// Runs the transcoding engine. argv[0] is the executable. Implementations must not throw.
class EngineRunner {
public:
    virtual ~EngineRunner() = default;
    virtual RunOutput run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) = 0;
};

// Spawns a real child process without a shell.
class ProcessEngineRunner : public EngineRunner {
public:
    RunOutput run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) override;
};

} // namespace tlc::hw
