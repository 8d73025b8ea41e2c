#pragma once

#include "errors.hpp"
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace PakForge {

namespace fs = std::filesystem;

struct ExtractionEntry {
    std::string category;
    std::string entryId;
    std::vector<std::string> files;    // relative to the extracted base
};

// Record of what the last generation installed, kept beside the live archive
struct ExtractionLog {
    std::string generatedAt;
    std::string mode;
    std::map<std::string, std::string> selections;   // category -> choice
    std::vector<ExtractionEntry> entries;

    // Merge into the entry for (category, entryId), skipping duplicate paths
    void addFiles(const std::string& category, const std::string& entryId,
                  const std::vector<std::string>& files);

    // Every file owned by a category, in insertion order
    std::vector<std::string> filesFor(const std::string& category) const;
};

// <target>/game/<modDir>/_temp/extraction_log.json
fs::path extractionLogPath(const fs::path& targetDir, const std::string& modDirName = "_pakforge");

Result<ExtractionLog> parseExtractionLog(const std::string& text);
std::string serializeExtractionLog(const ExtractionLog& log);

// A missing log is an empty log
Result<ExtractionLog> loadExtractionLog(const fs::path& path);
Status saveExtractionLog(const fs::path& path, const ExtractionLog& log);
Status removeExtractionLog(const fs::path& path);

// Delete a category's files below baseDir, except paths listed in keep;
// returns how many were removed
size_t removeOwnedFiles(const ExtractionLog& log, const fs::path& baseDir, const std::string& category,
                        const std::vector<std::string>& keep = {});

} // namespace PakForge
