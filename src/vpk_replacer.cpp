#include "vpk_replacer.hpp"
#include "console.h"
#include <fstream>

namespace PakForge {

AtomicReplacer::AtomicReplacer(ReplacerOptions options) : m_options(std::move(options)) {
    if (!m_options.copier) {
        m_options.copier = [](const fs::path& from, const fs::path& to, std::error_code& ec) {
            return fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
        };
    }
}

fs::path AtomicReplacer::liveArchivePath(const fs::path& targetDir) const {
    return targetDir / "game" / m_options.modDirName / m_options.archiveName;
}

// Readable from start to end, not just present
static bool isFullyReadable(const fs::path& path, uintmax_t& size) {
    std::error_code ec;
    size = fs::file_size(path, ec);
    if (ec || size == 0) return false;
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    in.seekg(static_cast<std::streamoff>(size - 1));
    char last;
    return static_cast<bool>(in.read(&last, 1));
}

Result<fs::path> AtomicReplacer::replace(const fs::path& targetDir, const fs::path& newArchive,
                                         const CancellationToken& token) {
    using R = Result<fs::path>;
    std::error_code ec;

    if (!fs::is_directory(targetDir, ec)) {
        return R::failure(ErrorKind::InvalidInput, "target installation not found: " + targetDir.string());
    }

    uintmax_t sourceSize = 0;
    bool ready = false;
    for (int attempt = 1; attempt <= m_options.readyAttempts; ++attempt) {
        if (isFullyReadable(newArchive, sourceSize)) {
            ready = true;
            break;
        }
        if (attempt < m_options.readyAttempts && !sleepFor(m_options.readyInterval, token)) {
            return R::failure(ErrorKind::Cancelled, "replace cancelled");
        }
    }
    if (token.isCancelled()) {
        return R::failure(ErrorKind::Cancelled, "replace cancelled");
    }
    if (!ready) {
        return R::failure(ErrorKind::ReplaceFailed, "new archive never became readable: " + newArchive.string());
    }

    const fs::path live = liveArchivePath(targetDir);
    fs::create_directories(live.parent_path(), ec);
    if (ec) {
        return R::failure(ErrorKind::ReplaceFailed,
                          "cannot create " + live.parent_path().string() + ": " + ec.message());
    }

    fs::path staging = live;
    staging += ".incoming";
    auto discardStaging = [&]() {
        std::error_code ignored;
        fs::remove(staging, ignored);
    };

    ec.clear();
    bool copied = m_options.copier(newArchive, staging, ec);
    if (!copied || ec) {
        discardStaging();
        return R::failure(ErrorKind::ReplaceFailed,
                          "copy to " + staging.string() + " failed" + (ec ? ": " + ec.message() : std::string()));
    }

    uintmax_t stagedSize = fs::file_size(staging, ec);
    if (ec || stagedSize != sourceSize) {
        discardStaging();
        return R::failure(ErrorKind::ReplaceFailed,
                          "staged copy is incomplete (" + std::to_string(ec ? 0 : stagedSize) + " of " +
                              std::to_string(sourceSize) + " bytes)");
    }

    if (token.isCancelled()) {
        discardStaging();
        return R::failure(ErrorKind::Cancelled, "replace cancelled");
    }

    fs::rename(staging, live, ec);
    if (ec) {
        discardStaging();
        return R::failure(ErrorKind::ReplaceFailed, "cannot swap in new archive: " + ec.message());
    }

    Console::log("Installed ", live.string(), " (", sourceSize, " bytes)");
    return R::success(live);
}

} // namespace PakForge
