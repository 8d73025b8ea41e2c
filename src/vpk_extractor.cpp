#include "vpk_extractor.hpp"
#include "console.h"
#include "file_utils.hpp"
#include <algorithm>

namespace PakForge {

std::string get7zCommand() {
    const std::string exeName = "7zzs";

    fs::path bundledPath = getExecutableDir() / exeName;
    std::error_code ec;
    if (fs::exists(bundledPath, ec)) {
        // Ensure it's executable
        fs::permissions(bundledPath, fs::perms::owner_exec, fs::perm_options::add, ec);
        return bundledPath.string();
    }

    if (fs::exists(exeName, ec)) {
        fs::permissions(exeName, fs::perms::owner_exec, fs::perm_options::add, ec);
        return (fs::current_path() / exeName).string();
    }

    return "7z";
}

// Last few lines of a tool's output for an error message
static std::string tail(const std::string& text, size_t maxChars = 400) {
    std::string trimmed = trim(text);
    if (trimmed.size() <= maxChars) return trimmed;
    return "..." + trimmed.substr(trimmed.size() - maxChars);
}

// Recursively move src into dst, merging directories and overwriting files
static void moveMerge(const fs::path& src, const fs::path& dst) {
    if (!fs::exists(dst)) {
        fs::rename(src, dst);
        return;
    }
    if (fs::is_directory(src) && fs::is_directory(dst)) {
        for (const auto& entry : fs::directory_iterator(src)) {
            moveMerge(entry.path(), dst / entry.path().filename());
        }
        fs::remove(src);
        return;
    }
    fs::remove_all(dst);
    fs::rename(src, dst);
}

ArchiveExtractor::ArchiveExtractor(CommandRunner& runner, ExtractorOptions options)
    : m_runner(runner), m_options(std::move(options)) {}

bool ArchiveExtractor::hasMarker(const fs::path& dir) const {
    std::error_code ec;
    return fs::is_regular_file(dir / m_options.markerFile, ec);
}

void ArchiveExtractor::flattenWrapper(const fs::path& targetDir) const {
    fs::path wrapper = targetDir / m_options.wrapperDir;
    if (!fs::is_directory(wrapper)) return;

    Console::debug("Flattening ", m_options.wrapperDir, "/ into ", targetDir.string());
    // Step aside first: the wrapper may hold a child with its own name
    fs::path staged = targetDir / (m_options.wrapperDir + ".flatten");
    for (int n = 1; fs::exists(staged); ++n) {
        staged = targetDir / (m_options.wrapperDir + ".flatten" + std::to_string(n));
    }
    fs::rename(wrapper, staged);

    std::vector<fs::path> children;
    for (const auto& entry : fs::directory_iterator(staged)) {
        children.push_back(entry.path());
    }
    for (const auto& child : children) {
        moveMerge(child, targetDir / child.filename());
    }
    fs::remove_all(staged);
}

Status ArchiveExtractor::extract(const fs::path& archivePath, const fs::path& targetDir,
                                 const CancellationToken& token) {
    std::error_code ec;
    if (m_options.toolPath.empty() || !fs::exists(m_options.toolPath, ec)) {
        return Status::failure(ErrorKind::ToolMissing,
                               "VPK extractor not found: " +
                                   (m_options.toolPath.empty() ? std::string("(not configured)") : m_options.toolPath));
    }
    if (!fs::is_regular_file(archivePath, ec)) {
        return Status::failure(ErrorKind::ArtifactNotFound, "VPK archive not found: " + archivePath.string());
    }

    fs::remove_all(targetDir, ec);
    fs::create_directories(targetDir, ec);
    if (ec) {
        return Status::failure(ErrorKind::ToolFailed, "cannot create " + targetDir.string() + ": " + ec.message());
    }

    CommandSpec spec;
    spec.executable = m_options.toolPath;
    spec.args = {"-p", archivePath.string(), "-d", targetDir.string(), "-e", m_options.wrapperDir};
    spec.timeout = m_options.timeout;

    Console::log("Extracting ", archivePath.filename().string(), "...");
    CommandResult run = m_runner.run(spec, token);

    auto failWith = [&](ErrorKind kind, const std::string& message) {
        removeTreeQuietly(targetDir);
        return Status::failure(kind, message);
    };

    switch (run.status) {
        case CommandStatus::LaunchFailed:
            return failWith(ErrorKind::ToolMissing, "cannot start VPK extractor: " + run.launchError);
        case CommandStatus::Cancelled:
            return failWith(ErrorKind::Cancelled, "extraction cancelled");
        case CommandStatus::TimedOut:
            return failWith(ErrorKind::ToolFailed,
                            "VPK extractor timed out after " +
                                std::to_string(std::chrono::duration_cast<std::chrono::seconds>(spec.timeout).count()) +
                                "s");
        case CommandStatus::Exited:
            break;
    }
    if (run.exitCode != 0) {
        std::string detail = tail(run.errorOutput.empty() ? run.output : run.errorOutput);
        return failWith(ErrorKind::ToolFailed, "VPK extractor exited with code " + std::to_string(run.exitCode) +
                                                   (detail.empty() ? "" : ": " + detail));
    }

    try {
        flattenWrapper(targetDir);
    } catch (const fs::filesystem_error& e) {
        return failWith(ErrorKind::ToolFailed, std::string("cannot flatten extracted files: ") + e.what());
    }

    if (!hasMarker(targetDir)) {
        return failWith(ErrorKind::CorruptArtifact,
                        "invalid archive: " + m_options.markerFile + " missing after extraction");
    }

    Console::log("Extracted ", archivePath.filename().string(), " to ", targetDir.string());
    return Status::success();
}

Status ArchiveExtractor::extractZip(const fs::path& zipPath, const fs::path& targetDir,
                                    const CancellationToken& token) {
    std::error_code ec;
    if (!fs::is_regular_file(zipPath, ec)) {
        return Status::failure(ErrorKind::ArtifactNotFound, "archive not found: " + zipPath.string());
    }
    fs::remove_all(targetDir, ec);
    fs::create_directories(targetDir, ec);
    if (ec) {
        return Status::failure(ErrorKind::ToolFailed, "cannot create " + targetDir.string() + ": " + ec.message());
    }

    CommandSpec spec;
    spec.executable = m_options.sevenZip.empty() ? get7zCommand() : m_options.sevenZip;
    spec.args = {"x", "-y", "-o" + targetDir.string(), zipPath.string()};
    spec.timeout = m_options.timeout;

    CommandResult run = m_runner.run(spec, token);
    if (run.status == CommandStatus::LaunchFailed) {
        removeTreeQuietly(targetDir);
        return Status::failure(ErrorKind::ToolMissing, "7-Zip not available: " + run.launchError);
    }
    if (run.status == CommandStatus::Cancelled) {
        removeTreeQuietly(targetDir);
        return Status::failure(ErrorKind::Cancelled, "extraction cancelled");
    }
    if (!run.succeeded()) {
        removeTreeQuietly(targetDir);
        std::string reason = run.status == CommandStatus::TimedOut
            ? std::string("timed out")
            : "exited with code " + std::to_string(run.exitCode) + ": " + tail(run.output + run.errorOutput);
        return Status::failure(ErrorKind::ToolFailed, "7-Zip " + reason);
    }
    return Status::success();
}

fs::path ArchiveExtractor::findArchive(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return fs::path();

    std::vector<fs::path> vpks;
    for (auto it = fs::recursive_directory_iterator(dir, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        const fs::path& p = it->path();
        if (iequals(p.filename().string(), "pak01_dir.vpk")) return p;
        if (iequals(p.extension().string(), ".vpk")) vpks.push_back(p);
    }
    if (vpks.empty()) return fs::path();
    std::sort(vpks.begin(), vpks.end());
    return vpks.front();
}

} // namespace PakForge
