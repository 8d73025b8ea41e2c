#pragma once

#include "cancellation.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace PakForge {

struct CommandSpec {
    std::string executable;
    std::vector<std::string> args;
    std::string workingDir;                        // empty = inherit
    std::chrono::milliseconds timeout{std::chrono::minutes(5)};
};

enum class CommandStatus {
    Exited,         // ran to completion; see exitCode
    TimedOut,       // killed after the timeout elapsed
    Cancelled,      // killed because the caller's token fired
    LaunchFailed    // could not be started at all
};

struct CommandResult {
    CommandStatus status = CommandStatus::LaunchFailed;
    int exitCode = -1;
    std::string output;
    std::string errorOutput;
    std::string launchError;

    bool succeeded() const { return status == CommandStatus::Exited && exitCode == 0; }
};

// Narrow seam for running external tools
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual CommandResult run(const CommandSpec& spec, const CancellationToken& token) = 0;
};

// fork/exec implementation. The child leads its own process group, and on
// timeout or cancellation the whole group is killed, since the packing
// tools do not reliably honour a polite shutdown.
class PosixCommandRunner : public CommandRunner {
public:
    CommandResult run(const CommandSpec& spec, const CancellationToken& token) override;
};

std::string describeCommand(const CommandSpec& spec);

} // namespace PakForge
