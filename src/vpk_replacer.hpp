#pragma once

#include "cancellation.hpp"
#include "errors.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <system_error>

namespace PakForge {

namespace fs = std::filesystem;

struct ReplacerOptions {
    std::string modDirName = "_pakforge";
    std::string archiveName = "pak01_dir.vpk";
    int readyAttempts = 30;
    std::chrono::milliseconds readyInterval{500};
    // Copies the new archive into the staging file; replaceable in tests
    std::function<bool(const fs::path& from, const fs::path& to, std::error_code& ec)> copier;
};

// Installs a rebuilt archive into <target>/game/<modDirName>/<archiveName>.
// The new archive is copied into a staging file beside the live one, its
// size verified, then renamed over the live archive. The source is never
// moved, and any failure leaves the previous live archive as it was.
class AtomicReplacer {
public:
    explicit AtomicReplacer(ReplacerOptions options = {});

    Result<fs::path> replace(const fs::path& targetDir, const fs::path& newArchive,
                             const CancellationToken& token = {});

    fs::path liveArchivePath(const fs::path& targetDir) const;

private:
    ReplacerOptions m_options;
};

} // namespace PakForge
