#pragma once

#include "cancellation.hpp"
#include "errors.hpp"
#include <chrono>
#include <filesystem>
#include <string>

namespace PakForge {

namespace fs = std::filesystem;

// Whole file as bytes; empty string when the file cannot be opened
std::string readFile(const std::string& path);

Status writeFile(const fs::path& path, const std::string& content);

// Directory containing this executable
fs::path getExecutableDir();

// Cross-platform temp directory
fs::path getTempDir();

// Fresh, uniquely named directory under the temp directory
Result<fs::path> makeTempRoot(const std::string& prefix);

// Remove a directory tree, logging instead of failing. Only for cleanup.
void removeTreeQuietly(const fs::path& path);

std::string trim(const std::string& str);
std::string toLower(std::string value);
bool iequals(const std::string& a, const std::string& b);
bool icontains(const std::string& haystack, const std::string& needle);

// Encode spaces in the path portion (before ?) to %20
std::string encodeUrlSpaces(const std::string& url);

// base + "/" + path with exactly one separator
std::string joinUrl(const std::string& base, const std::string& path);

// Current UTC time as ISO-8601 text
std::string utcTimestamp();

// Poll until `path` can be opened for read and locked exclusively.
// Fails with ArtifactNotFound when the file never becomes available, or
// Cancelled when the token fires between polls.
Status waitForFileReady(const fs::path& path, int maxAttempts,
                        std::chrono::milliseconds interval,
                        const CancellationToken& token);

} // namespace PakForge
