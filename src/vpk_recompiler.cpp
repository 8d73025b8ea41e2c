#include "vpk_recompiler.hpp"
#include "console.h"
#include "file_utils.hpp"
#include <algorithm>
#include <sstream>

namespace PakForge {

ArchiveRecompiler::ArchiveRecompiler(CommandRunner& runner, RecompilerOptions options)
    : m_runner(runner), m_options(std::move(options)) {}

Status ArchiveRecompiler::checkPreconditions(const fs::path& sourceDir, const fs::path& buildDir) const {
    std::error_code ec;
    if (m_options.packerPath.empty() || !fs::is_regular_file(m_options.packerPath, ec)) {
        return Status::failure(ErrorKind::ToolMissing,
                               "VPK packer not found: " +
                                   (m_options.packerPath.empty() ? std::string("(not configured)") : m_options.packerPath));
    }

    fs::path toolDir = fs::path(m_options.packerPath).parent_path();
    std::vector<std::string> missing;
    for (const auto& lib : m_options.requiredLibraries) {
        if (!fs::exists(toolDir / lib, ec)) missing.push_back(lib);
    }
    if (!missing.empty()) {
        std::string list;
        for (const auto& m : missing) list += (list.empty() ? "" : ", ") + m;
        return Status::failure(ErrorKind::ToolMissing, "VPK packer is missing libraries: " + list);
    }

    if (!fs::is_directory(sourceDir, ec)) {
        return Status::failure(ErrorKind::InvalidInput, "source directory not found: " + sourceDir.string());
    }
    bool hasFiles = false;
    for (auto it = fs::recursive_directory_iterator(sourceDir, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            hasFiles = true;
            break;
        }
    }
    if (!hasFiles) {
        return Status::failure(ErrorKind::InvalidInput, "source directory is empty: " + sourceDir.string());
    }

    fs::create_directories(buildDir, ec);
    if (ec || !fs::is_directory(buildDir)) {
        return Status::failure(ErrorKind::InvalidInput,
                               "cannot create build directory " + buildDir.string() + ": " + ec.message());
    }
    return Status::success();
}

std::vector<fs::path> ArchiveRecompiler::candidateDirectories(const fs::path& sourceDir,
                                                              const fs::path& buildDir) const {
    std::vector<fs::path> dirs = {buildDir, sourceDir, sourceDir.parent_path()};
    if (!m_options.tempRoot.empty()) dirs.push_back(m_options.tempRoot);

    std::vector<fs::path> unique;
    for (const auto& d : dirs) {
        if (d.empty()) continue;
        fs::path canonical = d.lexically_normal();
        if (std::find(unique.begin(), unique.end(), canonical) == unique.end()) unique.push_back(canonical);
    }
    return unique;
}

std::vector<std::string> ArchiveRecompiler::outputNames(const fs::path& sourceDir) {
    std::vector<std::string> names = {"pak01_dir.vpk"};
    fs::path normal = sourceDir.lexically_normal();
    if (!normal.has_filename()) normal = normal.parent_path();
    std::string own = normal.filename().string() + ".vpk";
    if (!normal.filename().empty() && !iequals(own, names[0])) names.push_back(own);
    return names;
}

fs::path ArchiveRecompiler::findNewArchive(const std::vector<fs::path>& dirs, const std::vector<std::string>& names,
                                           fs::file_time_type notBefore) const {
    struct Candidate {
        fs::path path;
        fs::file_time_type written;
    };
    std::vector<Candidate> found;

    for (const auto& dir : dirs) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) continue;
        for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
            if (!it->is_regular_file(ec)) continue;
            const std::string name = it->path().filename().string();
            bool expected = std::any_of(names.begin(), names.end(),
                                        [&](const std::string& n) { return iequals(n, name); });
            if (!expected) continue;
            auto written = fs::last_write_time(it->path(), ec);
            if (ec || written < notBefore) continue;
            found.push_back({it->path(), written});
        }
    }
    if (found.empty()) return fs::path();

    // Newest first; among equals keep the directory priority order
    std::stable_sort(found.begin(), found.end(),
                     [](const Candidate& a, const Candidate& b) { return a.written > b.written; });
    return found.front().path;
}

static void logToolOutput(const std::string& label, const std::string& output) {
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        if (!trim(line).empty()) Console::debug("  [", label, "] ", line);
    }
}

Result<fs::path> ArchiveRecompiler::recompile(const fs::path& sourceDir, const fs::path& buildDir,
                                              const CancellationToken& token) {
    using R = Result<fs::path>;

    Status pre = checkPreconditions(sourceDir, buildDir);
    if (!pre) return R::failure(pre);

    const auto notBefore = fs::file_time_type::clock::now() -
        std::chrono::duration_cast<fs::file_time_type::duration>(m_options.staleTolerance);

    CommandSpec spec;
    spec.executable = m_options.packerPath;
    spec.args = {sourceDir.string()};
    spec.workingDir = buildDir.string();
    spec.timeout = m_options.timeout;

    Console::log("Packing ", sourceDir.string(), "...");
    CommandResult run = m_runner.run(spec, token);
    logToolOutput("stdout", run.output);
    logToolOutput("stderr", run.errorOutput);

    switch (run.status) {
        case CommandStatus::LaunchFailed:
            return R::failure(ErrorKind::ToolMissing, "cannot start VPK packer: " + run.launchError);
        case CommandStatus::Cancelled:
            return R::failure(ErrorKind::Cancelled, "packing cancelled");
        case CommandStatus::TimedOut:
            return R::failure(ErrorKind::ToolFailed,
                              "VPK packer timed out after " +
                                  std::to_string(std::chrono::duration_cast<std::chrono::seconds>(spec.timeout).count()) +
                                  "s");
        case CommandStatus::Exited:
            break;
    }
    if (run.exitCode != 0) {
        std::string detail = trim(run.errorOutput.empty() ? run.output : run.errorOutput);
        if (detail.size() > 400) detail = "..." + detail.substr(detail.size() - 400);
        return R::failure(ErrorKind::ToolFailed, "VPK packer exited with code " + std::to_string(run.exitCode) +
                                                     (detail.empty() ? "" : ": " + detail));
    }

    if (!sleepFor(m_options.postProcessDelay, token)) {
        return R::failure(ErrorKind::Cancelled, "packing cancelled");
    }

    const auto dirs = candidateDirectories(sourceDir, buildDir);
    const auto names = outputNames(sourceDir);
    fs::path archive;
    for (int attempt = 1; attempt <= m_options.searchRetries; ++attempt) {
        archive = findNewArchive(dirs, names, notBefore);
        if (!archive.empty()) break;
        if (attempt < m_options.searchRetries && !sleepFor(m_options.searchInterval, token)) {
            return R::failure(ErrorKind::Cancelled, "packing cancelled");
        }
    }
    if (archive.empty()) {
        std::string searched;
        std::string expected;
        for (const auto& d : dirs) searched += (searched.empty() ? "" : ", ") + d.string();
        for (const auto& n : names) expected += (expected.empty() ? "" : " or ") + n;
        return R::failure(ErrorKind::ArtifactNotFound, "packer produced no new " + expected + " in: " + searched);
    }

    Console::debug("Packer output: ", archive.string());
    Status ready = waitForFileReady(archive, m_options.readyAttempts, m_options.readyInterval, token);
    if (!ready) {
        if (ready.kind() == ErrorKind::Cancelled) return R::failure(ready);
        return R::failure(ErrorKind::ArtifactNotFound, archive.string() + " is still locked by the packer");
    }
    return R::success(archive);
}

} // namespace PakForge
