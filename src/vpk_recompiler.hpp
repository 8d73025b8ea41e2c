#pragma once

#include "cancellation.hpp"
#include "errors.hpp"
#include "process_runner.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace PakForge {

namespace fs = std::filesystem;

struct RecompilerOptions {
    std::string packerPath;
    std::vector<std::string> requiredLibraries;   // expected beside the packer
    std::chrono::milliseconds timeout{std::chrono::minutes(5)};
    fs::path tempRoot;                              // searched last for output

    std::chrono::milliseconds postProcessDelay{500};
    int searchRetries = 15;
    std::chrono::milliseconds searchInterval{300};
    int readyAttempts = 20;
    std::chrono::milliseconds readyInterval{200};
    std::chrono::seconds staleTolerance{2};
};

// Runs the external VPK packer over a prepared directory and locates the
// archive it writes. The packer decides where its output lands, so several
// directories are searched and anything older than the run is ignored.
class ArchiveRecompiler {
public:
    ArchiveRecompiler(CommandRunner& runner, RecompilerOptions options);

    Result<fs::path> recompile(const fs::path& sourceDir, const fs::path& buildDir,
                               const CancellationToken& token = {});

    Status checkPreconditions(const fs::path& sourceDir, const fs::path& buildDir) const;

    // buildDir, sourceDir, parent of sourceDir, then the temp root
    std::vector<fs::path> candidateDirectories(const fs::path& sourceDir, const fs::path& buildDir) const;

    // File names the packer may write: pak01_dir.vpk or <source dir name>.vpk.
    // Other archives in the searched directories are content, not output.
    static std::vector<std::string> outputNames(const fs::path& sourceDir);

private:
    fs::path findNewArchive(const std::vector<fs::path>& dirs, const std::vector<std::string>& names,
                            fs::file_time_type notBefore) const;

    CommandRunner& m_runner;
    RecompilerOptions m_options;
};

} // namespace PakForge
