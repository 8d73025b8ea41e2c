#pragma once

#include "errors.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace PakForge {

namespace fs = std::filesystem;

struct ToolSettings {
    std::string extractor;                     // HLExtract-compatible unpacker
    std::string packer;                        // vpk packer
    std::vector<std::string> packerLibraries = {
        "libtier0.so", "libvstdlib.so", "libfilesystem_stdio.so"};
    std::string sevenZip;                      // empty = bundled 7zzs, then PATH
};

struct TimeoutSettings {
    int overallSeconds = 600;
    int stallSeconds = 30;
    int stallWarningSeconds = 10;
    int extractMinutes = 10;
    int packMinutes = 5;
};

struct Settings {
    std::vector<std::string> sources = {
        "https://cdn.ardysamods.my.id",
        "https://cdn.jsdelivr.net/gh/Anneardysa/ModsPack@main",
        "https://raw.githubusercontent.com/Anneardysa/ModsPack/main"};
    std::string assetPath = "Assets/Original.zip";
    std::string probeAsset = "Assets/set_update.json";
    std::string cacheRoot;                     // empty = <temp>/pakforge/cache
    ToolSettings tools;
    TimeoutSettings timeouts;
    int retriesPerSource = 1;
    std::string logFile;
    bool verbose = false;

    fs::path resolvedCacheRoot() const;
};

// Parse settings JSON. Missing keys keep their defaults.
Result<Settings> parseSettings(const std::string& text);

// Load settings from `path`; an empty path searches PAKFORGE_CONFIG, then
// pakforge.json next to the executable, then in the working directory. No
// file at all yields the defaults.
Result<Settings> loadSettings(const std::string& path = "");

} // namespace PakForge
