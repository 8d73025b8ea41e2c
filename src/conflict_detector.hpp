#pragma once

#include "mod_conflict.hpp"
#include <string>
#include <vector>

namespace PakForge {

// Compares every pair of contributions for overlapping files, overlapping
// KeyValues block ids and mutually exclusive settings.
class ConflictDetector {
public:
    // Sorted Critical first; order within a severity follows registration
    std::vector<ModConflict> detect(const std::vector<ModSource>& sources) const;

    // Configuration (gameinfo/default/settings in the name), then Script
    // (.txt .kv .vdf), then Asset (compiled resources and .vpk), else File
    static ConflictType classifyFiles(const std::vector<std::string>& files);

    static ConflictSeverity severityFor(ConflictType type, size_t overlapCount);

    // Same-category overlap of more than 10 files, or any file that is the
    // game's gameinfo or the content archive itself
    static bool isCriticalOverlap(const ModSource& a, const ModSource& b,
                                  const std::vector<std::string>& files);

    // Case-insensitive intersection of two path lists, '\' treated as '/'
    static std::vector<std::string> overlappingFiles(const std::vector<std::string>& a,
                                                     const std::vector<std::string>& b);
};

} // namespace PakForge
