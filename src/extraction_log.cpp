#include "extraction_log.hpp"
#include "console.h"
#include "file_utils.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

namespace PakForge {

using json = nlohmann::json;

void ExtractionLog::addFiles(const std::string& category, const std::string& entryId,
                             const std::vector<std::string>& files) {
    auto it = std::find_if(entries.begin(), entries.end(), [&](const ExtractionEntry& e) {
        return e.category == category && e.entryId == entryId;
    });
    if (it == entries.end()) {
        entries.push_back({category, entryId, {}});
        it = entries.end() - 1;
    }
    for (const auto& file : files) {
        if (std::find(it->files.begin(), it->files.end(), file) == it->files.end()) {
            it->files.push_back(file);
        }
    }
}

std::vector<std::string> ExtractionLog::filesFor(const std::string& category) const {
    std::vector<std::string> result;
    for (const auto& entry : entries) {
        if (!iequals(entry.category, category)) continue;
        result.insert(result.end(), entry.files.begin(), entry.files.end());
    }
    return result;
}

fs::path extractionLogPath(const fs::path& targetDir, const std::string& modDirName) {
    return targetDir / "game" / modDirName / "_temp" / "extraction_log.json";
}

Result<ExtractionLog> parseExtractionLog(const std::string& text) {
    using R = Result<ExtractionLog>;
    ExtractionLog log;
    try {
        json root = json::parse(text);
        if (!root.is_object()) return R::failure(ErrorKind::CorruptArtifact, "extraction log must be an object");

        log.generatedAt = root.value("generatedAt", "");
        log.mode = root.value("mode", "");
        if (root.contains("selections") && root["selections"].is_object()) {
            for (auto it = root["selections"].begin(); it != root["selections"].end(); ++it) {
                if (it.value().is_string()) log.selections[it.key()] = it.value().get<std::string>();
            }
        }
        if (root.contains("entries") && root["entries"].is_array()) {
            for (const auto& item : root["entries"]) {
                ExtractionEntry entry;
                entry.category = item.value("category", "");
                entry.entryId = item.value("entryId", "");
                if (item.contains("files") && item["files"].is_array()) {
                    for (const auto& f : item["files"]) {
                        if (f.is_string()) entry.files.push_back(f.get<std::string>());
                    }
                }
                log.entries.push_back(entry);
            }
        }
    } catch (const json::exception& e) {
        return R::failure(ErrorKind::CorruptArtifact, std::string("invalid extraction log: ") + e.what());
    }
    return R::success(log);
}

std::string serializeExtractionLog(const ExtractionLog& log) {
    json root;
    root["generatedAt"] = log.generatedAt;
    root["mode"] = log.mode;
    root["selections"] = json::object();
    for (const auto& [category, choice] : log.selections) {
        root["selections"][category] = choice;
    }
    root["entries"] = json::array();
    for (const auto& entry : log.entries) {
        root["entries"].push_back({{"category", entry.category},
                                   {"entryId", entry.entryId},
                                   {"files", entry.files}});
    }
    return root.dump(2);
}

Result<ExtractionLog> loadExtractionLog(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return Result<ExtractionLog>::success(ExtractionLog{});
    auto result = parseExtractionLog(readFile(path.string()));
    if (!result) {
        return Result<ExtractionLog>::failure(result.kind(), path.string() + ": " + result.message());
    }
    return result;
}

Status saveExtractionLog(const fs::path& path, const ExtractionLog& log) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Status::failure(ErrorKind::InvalidInput, "cannot create " + path.parent_path().string() + ": " + ec.message());
    }
    ExtractionLog stamped = log;
    if (stamped.generatedAt.empty()) stamped.generatedAt = utcTimestamp();
    return writeFile(path, serializeExtractionLog(stamped));
}

Status removeExtractionLog(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) return Status::failure(ErrorKind::InvalidInput, "cannot remove " + path.string() + ": " + ec.message());
    return Status::success();
}

size_t removeOwnedFiles(const ExtractionLog& log, const fs::path& baseDir, const std::string& category,
                        const std::vector<std::string>& keep) {
    size_t removed = 0;
    for (const auto& file : log.filesFor(category)) {
        fs::path rel = fs::path(file).lexically_normal();
        bool kept = std::any_of(keep.begin(), keep.end(), [&](const std::string& k) {
            return iequals(fs::path(k).lexically_normal().generic_string(), rel.generic_string());
        });
        if (kept) continue;
        // Never follow a logged path outside the base directory
        if (rel.is_absolute() || rel.empty() || *rel.begin() == "..") {
            Console::warn("Ignoring logged path outside the base: ", file);
            continue;
        }
        std::error_code ec;
        if (fs::remove(baseDir / rel, ec)) {
            ++removed;
        } else if (ec) {
            Console::warn("Could not remove ", (baseDir / rel).string(), ": ", ec.message());
        }
    }
    if (removed > 0) Console::debug("Removed ", removed, " file(s) owned by ", category);
    return removed;
}

} // namespace PakForge
