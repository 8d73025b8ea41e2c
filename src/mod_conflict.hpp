#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace PakForge {

enum class ConflictType { None, File, Script, Asset, Configuration };

enum class ConflictSeverity { None, Low, Medium, High, Critical };

enum class ResolutionStrategy {
    HigherPriority,   // lowest priority number wins
    LowerPriority,    // highest priority number wins
    MostRecent,       // latest appliedAt wins
    Merge,            // structural merge, Script/Configuration only
    KeepExisting,     // first registered source wins
    UseNew,           // last registered source wins
    Interactive       // caller must choose
};

// Detected -> AutoResolved, or Detected -> AwaitingUserChoice -> Resolved.
// AutoResolved and Resolved are terminal.
enum class ConflictState { Detected, AutoResolved, AwaitingUserChoice, Resolved };

const char* conflictTypeName(ConflictType type);
const char* severityName(ConflictSeverity severity);
const char* strategyName(ResolutionStrategy strategy);
const char* conflictStateName(ConflictState state);
std::optional<ResolutionStrategy> parseStrategy(const std::string& name);

// One independently selectable contribution
struct ModSource {
    std::string modId;
    std::string modName;
    std::string category;
    int priority = 100;                         // lower = higher precedence
    int64_t appliedAt = 0;                      // unix seconds
    std::vector<std::string> affectedFiles;
    std::vector<std::string> configKeys;        // KeyValues block ids patched
    std::map<std::string, std::string> settings;
};

struct ConflictResolutionOption {
    std::string id;
    ResolutionStrategy strategy = ResolutionStrategy::Interactive;
    std::string description;
    std::string preferredSource;                // modId, interactive choices only

    bool isAutomatic() const { return strategy != ResolutionStrategy::Interactive; }
};

struct ModConflict {
    std::string id;
    ConflictType type = ConflictType::None;
    ConflictSeverity severity = ConflictSeverity::None;
    std::string description;
    std::vector<std::string> affectedFiles;
    std::vector<ModSource> conflictingSources;  // registration order
    std::vector<ConflictResolutionOption> availableResolutions;
    std::optional<ConflictResolutionOption> selectedResolution;
    ConflictState state = ConflictState::Detected;

    bool isResolved() const {
        return state == ConflictState::AutoResolved || state == ConflictState::Resolved;
    }
    const ConflictResolutionOption* findOption(const std::string& optionId) const;
    const ModSource* findSource(const std::string& modId) const;
};

struct ResolutionOutcome {
    std::string conflictId;
    bool success = false;
    ResolutionStrategy usedStrategy = ResolutionStrategy::Interactive;
    std::optional<ModSource> winningSource;
    std::vector<std::string> resolvedFiles;
    std::string errorMessage;

    static ResolutionOutcome succeeded(const ModConflict& conflict, ResolutionStrategy strategy,
                                       std::optional<ModSource> winner);
    static ResolutionOutcome failed(const ModConflict& conflict, ResolutionStrategy strategy,
                                    std::string message);
};

// Build a conflict with the resolution options its severity allows:
// Critical offers one interactive choice per source and nothing else; every
// other severity offers the automatic strategies (Merge first for Script and
// Configuration) followed by the interactive choices.
ModConflict makeConflict(std::string id, ConflictType type, ConflictSeverity severity,
                         std::string description, std::vector<ModSource> sources,
                         std::vector<std::string> affected);

} // namespace PakForge
