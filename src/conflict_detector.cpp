#include "conflict_detector.hpp"
#include "console.h"
#include "file_utils.hpp"
#include <algorithm>
#include <set>

namespace PakForge {

static std::string normalizeFileKey(const std::string& path) {
    std::string key = toLower(path);
    std::replace(key.begin(), key.end(), '\\', '/');
    while (!key.empty() && key.front() == '/') key.erase(key.begin());
    return key;
}

static std::string fileName(const std::string& path) {
    std::string key = normalizeFileKey(path);
    size_t slash = key.find_last_of('/');
    return slash == std::string::npos ? key : key.substr(slash + 1);
}

static std::string extensionOf(const std::string& path) {
    std::string name = fileName(path);
    size_t dot = name.find_last_of('.');
    return dot == std::string::npos ? "" : name.substr(dot);
}

static std::string displayName(const ModSource& source) {
    return source.modName.empty() ? source.modId : source.modName;
}

std::vector<std::string> ConflictDetector::overlappingFiles(const std::vector<std::string>& a,
                                                           const std::vector<std::string>& b) {
    std::set<std::string> other;
    for (const auto& f : b) other.insert(normalizeFileKey(f));

    std::vector<std::string> result;
    std::set<std::string> seen;
    for (const auto& f : a) {
        std::string key = normalizeFileKey(f);
        if (other.count(key) && seen.insert(key).second) result.push_back(f);
    }
    return result;
}

ConflictType ConflictDetector::classifyFiles(const std::vector<std::string>& files) {
    static const std::set<std::string> scriptExts = {".txt", ".kv", ".vdf"};
    static const std::set<std::string> assetExts = {".vtex_c", ".vmat_c", ".vmdl_c", ".vpcf_c", ".vsnd_c", ".vpk"};

    bool script = false;
    bool asset = false;
    for (const auto& f : files) {
        std::string name = fileName(f);
        if (name.find("gameinfo") != std::string::npos || name.find("default") != std::string::npos ||
            name.find("settings") != std::string::npos) {
            return ConflictType::Configuration;
        }
        std::string ext = extensionOf(f);
        if (scriptExts.count(ext)) script = true;
        if (assetExts.count(ext)) asset = true;
    }
    if (script) return ConflictType::Script;
    if (asset) return ConflictType::Asset;
    return ConflictType::File;
}

ConflictSeverity ConflictDetector::severityFor(ConflictType type, size_t overlapCount) {
    if (overlapCount == 0 || type == ConflictType::None) return ConflictSeverity::None;
    switch (type) {
        case ConflictType::Configuration:
            return overlapCount > 3 ? ConflictSeverity::Critical : ConflictSeverity::High;
        case ConflictType::Script:
            return overlapCount > 5 ? ConflictSeverity::High : ConflictSeverity::Medium;
        case ConflictType::File:
        case ConflictType::Asset:
        case ConflictType::None:
            break;
    }
    if (overlapCount <= 2) return ConflictSeverity::Low;
    if (overlapCount <= 5) return ConflictSeverity::Medium;
    if (overlapCount <= 10) return ConflictSeverity::High;
    return ConflictSeverity::Critical;
}

bool ConflictDetector::isCriticalOverlap(const ModSource& a, const ModSource& b,
                                         const std::vector<std::string>& files) {
    if (!a.category.empty() && iequals(a.category, b.category) && files.size() > 10) return true;
    for (const auto& f : files) {
        std::string key = normalizeFileKey(f);
        if (key.find("gameinfo") != std::string::npos || key.find("pak01_dir") != std::string::npos) return true;
    }
    return false;
}

std::vector<ModConflict> ConflictDetector::detect(const std::vector<ModSource>& sources) const {
    std::vector<ModConflict> conflicts;

    for (size_t i = 0; i < sources.size(); ++i) {
        for (size_t j = i + 1; j < sources.size(); ++j) {
            const ModSource& a = sources[i];
            const ModSource& b = sources[j];
            const std::string pair = a.modId + ":" + b.modId;

            auto files = overlappingFiles(a.affectedFiles, b.affectedFiles);
            if (!files.empty()) {
                ConflictType type = classifyFiles(files);
                ConflictSeverity severity = severityFor(type, files.size());
                if (isCriticalOverlap(a, b, files)) {
                    type = ConflictType::Configuration;
                    severity = ConflictSeverity::Critical;
                }
                std::string description = displayName(a) + " and " + displayName(b) + " both modify " +
                                          std::to_string(files.size()) + " file(s)";
                conflicts.push_back(makeConflict("file:" + pair, type, severity, description, {a, b}, files));
            }

            std::vector<std::string> keys;
            for (const auto& key : a.configKeys) {
                if (std::find(b.configKeys.begin(), b.configKeys.end(), key) != b.configKeys.end() &&
                    std::find(keys.begin(), keys.end(), key) == keys.end()) {
                    keys.push_back(key);
                }
            }
            if (!keys.empty()) {
                std::string description = displayName(a) + " and " + displayName(b) + " both patch " +
                                          std::to_string(keys.size()) + " config block(s)";
                conflicts.push_back(makeConflict("keys:" + pair, ConflictType::Script,
                                                 severityFor(ConflictType::Script, keys.size()),
                                                 description, {a, b}, keys));
            }

            std::vector<std::string> clashing;
            std::string detail;
            for (const auto& [name, value] : a.settings) {
                auto other = b.settings.find(name);
                if (other == b.settings.end() || other->second == value) continue;
                clashing.push_back(name);
                detail += (detail.empty() ? "" : "; ") + name + "=" + value + " vs " + name + "=" + other->second;
            }
            if (!clashing.empty()) {
                std::string description = displayName(a) + " and " + displayName(b) +
                                          " require incompatible settings (" + detail + ")";
                conflicts.push_back(makeConflict("settings:" + pair, ConflictType::Configuration,
                                                 ConflictSeverity::Critical, description, {a, b}, clashing));
            }
        }
    }

    std::stable_sort(conflicts.begin(), conflicts.end(), [](const ModConflict& x, const ModConflict& y) {
        return static_cast<int>(x.severity) > static_cast<int>(y.severity);
    });

    if (!conflicts.empty()) {
        Console::log("Detected ", conflicts.size(), " conflict(s) among ", sources.size(), " mod(s)");
    }
    return conflicts;
}

} // namespace PakForge
