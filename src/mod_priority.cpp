#include "mod_priority.hpp"
#include "console.h"
#include "file_utils.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

namespace PakForge {

using json = nlohmann::json;

ModPriorityConfig ModPriorityConfig::createDefault() {
    ModPriorityConfig config;
    config.lastModified = utcTimestamp();
    config.categoryStrategies["Weather"] = ResolutionStrategy::MostRecent;
    config.categoryStrategies["River"] = ResolutionStrategy::MostRecent;
    return config;
}

int ModPriorityConfig::getPriority(const std::string& modId) const {
    for (const auto& p : priorities) {
        if (p.modId == modId) return p.priority;
    }
    return kDefaultPriority;
}

bool ModPriorityConfig::setPriority(const std::string& modId, int priority,
                                    const std::string& modName, const std::string& category) {
    int clamped = std::clamp(priority, kMinPriority, kMaxPriority);
    for (auto& p : priorities) {
        if (p.modId != modId) continue;
        if (p.isLocked) return false;
        p.priority = clamped;
        if (!modName.empty()) p.modName = modName;
        if (!category.empty()) p.category = category;
        return true;
    }
    ModPriority entry;
    entry.modId = modId;
    entry.modName = modName;
    entry.category = category;
    entry.priority = clamped;
    priorities.push_back(entry);
    return true;
}

std::vector<ModPriority> ModPriorityConfig::ordered(const std::string& category) const {
    std::vector<ModPriority> result;
    for (const auto& p : priorities) {
        if (category.empty() || iequals(p.category, category)) result.push_back(p);
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const ModPriority& a, const ModPriority& b) { return a.priority < b.priority; });
    return result;
}

std::optional<ResolutionStrategy> ModPriorityConfig::strategyForCategory(const std::string& category) const {
    for (const auto& [name, strategy] : categoryStrategies) {
        if (iequals(name, category)) return strategy;
    }
    return std::nullopt;
}

// ============================================================================
// Persistence
// ============================================================================

fs::path priorityConfigPath(const fs::path& targetDir, const std::string& modDirName) {
    return targetDir / "game" / modDirName / "_temp" / "mod_priority.json";
}

static ResolutionStrategy strategyOr(const json& value, ResolutionStrategy fallback) {
    if (!value.is_string()) return fallback;
    auto parsed = parseStrategy(value.get<std::string>());
    if (!parsed) {
        Console::warn("Unknown resolution strategy '", value.get<std::string>(), "', using ",
                      strategyName(fallback));
        return fallback;
    }
    return *parsed;
}

Result<ModPriorityConfig> parsePriorityConfig(const std::string& text) {
    using R = Result<ModPriorityConfig>;
    ModPriorityConfig config = ModPriorityConfig::createDefault();
    try {
        json root = json::parse(text);
        if (!root.is_object()) return R::failure(ErrorKind::CorruptArtifact, "priority config must be an object");

        config.lastModified = root.value("lastModified", config.lastModified);
        config.autoResolveNonBreaking = root.value("autoResolveNonBreaking", true);
        if (root.contains("defaultStrategy")) {
            config.defaultStrategy = strategyOr(root["defaultStrategy"], ResolutionStrategy::HigherPriority);
        }
        if (root.contains("categoryStrategies") && root["categoryStrategies"].is_object()) {
            config.categoryStrategies.clear();
            for (auto it = root["categoryStrategies"].begin(); it != root["categoryStrategies"].end(); ++it) {
                config.categoryStrategies[it.key()] = strategyOr(it.value(), config.defaultStrategy);
            }
        }
        if (root.contains("priorities") && root["priorities"].is_array()) {
            for (const auto& item : root["priorities"]) {
                ModPriority p;
                p.modId = item.value("modId", "");
                if (p.modId.empty()) continue;
                p.modName = item.value("modName", "");
                p.category = item.value("category", "");
                p.priority = std::clamp(item.value("priority", ModPriorityConfig::kDefaultPriority),
                                        ModPriorityConfig::kMinPriority, ModPriorityConfig::kMaxPriority);
                p.isLocked = item.value("isLocked", false);
                p.notes = item.value("notes", "");
                config.priorities.push_back(p);
            }
        }
    } catch (const json::exception& e) {
        return R::failure(ErrorKind::CorruptArtifact, std::string("invalid priority config: ") + e.what());
    }
    return R::success(config);
}

std::string serializePriorityConfig(const ModPriorityConfig& config) {
    json root;
    root["lastModified"] = config.lastModified;
    root["defaultStrategy"] = strategyName(config.defaultStrategy);
    root["autoResolveNonBreaking"] = config.autoResolveNonBreaking;
    root["categoryStrategies"] = json::object();
    for (const auto& [category, strategy] : config.categoryStrategies) {
        root["categoryStrategies"][category] = strategyName(strategy);
    }
    root["priorities"] = json::array();
    for (const auto& p : config.priorities) {
        root["priorities"].push_back({{"modId", p.modId},
                                      {"modName", p.modName},
                                      {"category", p.category},
                                      {"priority", p.priority},
                                      {"isLocked", p.isLocked},
                                      {"notes", p.notes}});
    }
    return root.dump(2);
}

Result<ModPriorityConfig> loadPriorityConfig(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<ModPriorityConfig>::success(ModPriorityConfig::createDefault());
    }
    auto result = parsePriorityConfig(readFile(path.string()));
    if (!result) {
        return Result<ModPriorityConfig>::failure(result.kind(), path.string() + ": " + result.message());
    }
    return result;
}

Status savePriorityConfig(const fs::path& path, const ModPriorityConfig& config) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Status::failure(ErrorKind::InvalidInput, "cannot create " + path.parent_path().string() + ": " + ec.message());
    }
    ModPriorityConfig stamped = config;
    stamped.lastModified = utcTimestamp();
    return writeFile(path, serializePriorityConfig(stamped));
}

// ============================================================================
// ModPriorityService
// ============================================================================

ModPriorityService::ModPriorityService(std::chrono::seconds cacheTtl, std::string modDirName)
    : m_cacheTtl(cacheTtl), m_modDirName(std::move(modDirName)) {}

Result<ModPriorityConfig> ModPriorityService::load(const fs::path& targetDir) {
    const std::string key = targetDir.lexically_normal().string();
    auto now = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_cache.find(key);
        if (it != m_cache.end() && now - it->second.loadedAt < m_cacheTtl) {
            return Result<ModPriorityConfig>::success(it->second.config);
        }
    }

    auto loaded = loadPriorityConfig(priorityConfigPath(targetDir, m_modDirName));
    if (!loaded) return loaded;

    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache[key] = {loaded.value(), now};
    return loaded;
}

Status ModPriorityService::save(const fs::path& targetDir, const ModPriorityConfig& config) {
    Status s = savePriorityConfig(priorityConfigPath(targetDir, m_modDirName), config);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache.erase(targetDir.lexically_normal().string());
    return s;
}

int ModPriorityService::getPriority(const fs::path& targetDir, const std::string& modId) {
    auto config = load(targetDir);
    if (!config) return ModPriorityConfig::kDefaultPriority;
    return config->getPriority(modId);
}

Status ModPriorityService::setPriority(const fs::path& targetDir, const std::string& modId, int priority,
                                       const std::string& modName, const std::string& category) {
    auto config = load(targetDir);
    if (!config) return config.status();
    if (!config->setPriority(modId, priority, modName, category)) {
        return Status::failure(ErrorKind::InvalidInput, "priority of " + modId + " is locked");
    }
    return save(targetDir, config.value());
}

std::vector<ModPriority> ModPriorityService::orderedPriorities(const fs::path& targetDir,
                                                               const std::string& category) {
    auto config = load(targetDir);
    if (!config) return {};
    return config->ordered(category);
}

std::vector<ModSource> ModPriorityService::applyPriorities(const fs::path& targetDir,
                                                           std::vector<ModSource> sources) {
    auto config = load(targetDir);
    if (config) {
        for (auto& source : sources) {
            for (const auto& p : config->priorities) {
                if (p.modId == source.modId) {
                    source.priority = p.priority;
                    break;
                }
            }
        }
    } else {
        Console::warn("Using request priorities: ", config.message());
    }
    std::stable_sort(sources.begin(), sources.end(),
                     [](const ModSource& a, const ModSource& b) { return a.priority < b.priority; });
    return sources;
}

void ModPriorityService::invalidateCache() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache.clear();
}

} // namespace PakForge
