#include "settings.hpp"
#include "console.h"
#include "file_utils.hpp"
#include <cstdlib>
#include <nlohmann/json.hpp>

namespace PakForge {

using json = nlohmann::json;

fs::path Settings::resolvedCacheRoot() const {
    const char* env = std::getenv("PAKFORGE_CACHE");
    if (env && *env) return fs::path(env);
    if (!cacheRoot.empty()) return fs::path(cacheRoot);
    return getTempDir() / "pakforge" / "cache";
}

template<typename T>
static void readKey(const json& obj, const char* key, T& target) {
    auto it = obj.find(key);
    if (it != obj.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

Result<Settings> parseSettings(const std::string& text) {
    Settings settings;
    try {
        json root = json::parse(text);
        if (!root.is_object()) {
            return Result<Settings>::failure(ErrorKind::InvalidInput, "settings root must be an object");
        }

        readKey(root, "sources", settings.sources);
        readKey(root, "assetPath", settings.assetPath);
        readKey(root, "probeAsset", settings.probeAsset);
        readKey(root, "cacheRoot", settings.cacheRoot);
        readKey(root, "retriesPerSource", settings.retriesPerSource);
        readKey(root, "logFile", settings.logFile);
        readKey(root, "verbose", settings.verbose);

        if (root.contains("tools") && root["tools"].is_object()) {
            const json& tools = root["tools"];
            readKey(tools, "extractor", settings.tools.extractor);
            readKey(tools, "packer", settings.tools.packer);
            readKey(tools, "packerLibraries", settings.tools.packerLibraries);
            readKey(tools, "sevenZip", settings.tools.sevenZip);
        }

        if (root.contains("timeouts") && root["timeouts"].is_object()) {
            const json& t = root["timeouts"];
            readKey(t, "overallSeconds", settings.timeouts.overallSeconds);
            readKey(t, "stallSeconds", settings.timeouts.stallSeconds);
            readKey(t, "stallWarningSeconds", settings.timeouts.stallWarningSeconds);
            readKey(t, "extractMinutes", settings.timeouts.extractMinutes);
            readKey(t, "packMinutes", settings.timeouts.packMinutes);
        }
    } catch (const json::exception& e) {
        return Result<Settings>::failure(ErrorKind::InvalidInput,
                                         std::string("invalid settings: ") + e.what());
    }

    if (settings.sources.empty()) {
        return Result<Settings>::failure(ErrorKind::InvalidInput, "settings contain no content sources");
    }
    if (settings.timeouts.stallWarningSeconds >= settings.timeouts.stallSeconds) {
        Console::warn("stallWarningSeconds is not below stallSeconds; the stall warning will not fire");
    }
    return Result<Settings>::success(settings);
}

Result<Settings> loadSettings(const std::string& path) {
    std::vector<fs::path> candidates;
    if (!path.empty()) {
        if (!fs::exists(path)) {
            return Result<Settings>::failure(ErrorKind::InvalidInput, "settings file not found: " + path);
        }
        candidates.push_back(path);
    } else {
        const char* env = std::getenv("PAKFORGE_CONFIG");
        if (env && *env) candidates.push_back(env);
        candidates.push_back(getExecutableDir() / "pakforge.json");
        candidates.push_back(fs::current_path() / "pakforge.json");
    }

    for (const auto& candidate : candidates) {
        if (!fs::exists(candidate)) continue;
        Console::debug("Loading settings from ", candidate.string());
        auto result = parseSettings(readFile(candidate.string()));
        if (!result) {
            return Result<Settings>::failure(result.kind(), candidate.string() + ": " + result.message());
        }
        return result;
    }
    return Result<Settings>::success(Settings());
}

} // namespace PakForge
