#pragma once

#include "cancellation.hpp"
#include "errors.hpp"
#include "process_runner.hpp"
#include <chrono>
#include <filesystem>
#include <string>

namespace PakForge {

namespace fs = std::filesystem;

struct ExtractorOptions {
    std::string toolPath;                  // HLExtract-compatible unpacker
    std::string sevenZip;                  // empty = get7zCommand()
    std::chrono::milliseconds timeout{std::chrono::minutes(10)};
    std::string markerFile = "scripts/items/items_game.txt";
    std::string wrapperDir = "root";
};

// Bundled 7zzs next to the executable, then in the working directory, then
// whatever `7z` resolves to on PATH
std::string get7zCommand();

class ArchiveExtractor {
public:
    ArchiveExtractor(CommandRunner& runner, ExtractorOptions options);

    // Unpack a VPK into targetDir. The tool's exit code is not trusted:
    // success also requires the marker file. On failure targetDir is removed.
    Status extract(const fs::path& archivePath, const fs::path& targetDir,
                   const CancellationToken& token = {});

    // Unpack the downloaded zip that carries the base VPK
    Status extractZip(const fs::path& zipPath, const fs::path& targetDir,
                      const CancellationToken& token = {});

    bool hasMarker(const fs::path& dir) const;
    const ExtractorOptions& options() const { return m_options; }

    // pak01_dir.vpk anywhere below dir, else the first *.vpk; empty if none
    static fs::path findArchive(const fs::path& dir);

private:
    void flattenWrapper(const fs::path& targetDir) const;

    CommandRunner& m_runner;
    ExtractorOptions m_options;
};

} // namespace PakForge
