#pragma once

#include "errors.hpp"
#include "mod_conflict.hpp"
#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace PakForge {

namespace fs = std::filesystem;

struct ModPriority {
    std::string modId;
    std::string modName;
    std::string category;
    int priority = 100;
    bool isLocked = false;
    std::string notes;
};

// Persisted priority table plus the strategies used for automatic
// conflict resolution
struct ModPriorityConfig {
    static constexpr int kMinPriority = 1;
    static constexpr int kMaxPriority = 999;
    static constexpr int kDefaultPriority = 100;

    std::string lastModified;
    std::vector<ModPriority> priorities;
    ResolutionStrategy defaultStrategy = ResolutionStrategy::HigherPriority;
    bool autoResolveNonBreaking = true;
    std::map<std::string, ResolutionStrategy> categoryStrategies;

    // Weather and River default to MostRecent
    static ModPriorityConfig createDefault();

    int getPriority(const std::string& modId) const;

    // Clamped to 1-999. Returns false and changes nothing for a locked entry.
    bool setPriority(const std::string& modId, int priority,
                     const std::string& modName = "", const std::string& category = "");

    // Ascending priority; empty category = all
    std::vector<ModPriority> ordered(const std::string& category = "") const;

    std::optional<ResolutionStrategy> strategyForCategory(const std::string& category) const;
};

// <target>/game/<modDir>/_temp/mod_priority.json
fs::path priorityConfigPath(const fs::path& targetDir, const std::string& modDirName = "_pakforge");

Result<ModPriorityConfig> parsePriorityConfig(const std::string& text);
std::string serializePriorityConfig(const ModPriorityConfig& config);

// Missing file yields createDefault(); unreadable JSON is CorruptArtifact
Result<ModPriorityConfig> loadPriorityConfig(const fs::path& path);
Status savePriorityConfig(const fs::path& path, const ModPriorityConfig& config);

// Loads the priority table per installation and caches it briefly
class ModPriorityService {
public:
    explicit ModPriorityService(std::chrono::seconds cacheTtl = std::chrono::seconds(30),
                                std::string modDirName = "_pakforge");

    Result<ModPriorityConfig> load(const fs::path& targetDir);
    Status save(const fs::path& targetDir, const ModPriorityConfig& config);

    int getPriority(const fs::path& targetDir, const std::string& modId);
    Status setPriority(const fs::path& targetDir, const std::string& modId, int priority,
                       const std::string& modName = "", const std::string& category = "");
    std::vector<ModPriority> orderedPriorities(const fs::path& targetDir, const std::string& category = "");

    // Stamp each source with its configured priority, sorted ascending
    std::vector<ModSource> applyPriorities(const fs::path& targetDir, std::vector<ModSource> sources);

    void invalidateCache();

private:
    struct CacheEntry {
        ModPriorityConfig config;
        std::chrono::steady_clock::time_point loadedAt;
    };

    std::chrono::seconds m_cacheTtl;
    std::string m_modDirName;
    std::mutex m_mutex;
    std::map<std::string, CacheEntry> m_cache;
};

} // namespace PakForge
