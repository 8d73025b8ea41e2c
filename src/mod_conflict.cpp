#include "mod_conflict.hpp"
#include "file_utils.hpp"

namespace PakForge {

const char* conflictTypeName(ConflictType type) {
    switch (type) {
        case ConflictType::None: return "None";
        case ConflictType::File: return "File";
        case ConflictType::Script: return "Script";
        case ConflictType::Asset: return "Asset";
        case ConflictType::Configuration: return "Configuration";
    }
    return "Unknown";
}

const char* severityName(ConflictSeverity severity) {
    switch (severity) {
        case ConflictSeverity::None: return "None";
        case ConflictSeverity::Low: return "Low";
        case ConflictSeverity::Medium: return "Medium";
        case ConflictSeverity::High: return "High";
        case ConflictSeverity::Critical: return "Critical";
    }
    return "Unknown";
}

const char* strategyName(ResolutionStrategy strategy) {
    switch (strategy) {
        case ResolutionStrategy::HigherPriority: return "HigherPriority";
        case ResolutionStrategy::LowerPriority: return "LowerPriority";
        case ResolutionStrategy::MostRecent: return "MostRecent";
        case ResolutionStrategy::Merge: return "Merge";
        case ResolutionStrategy::KeepExisting: return "KeepExisting";
        case ResolutionStrategy::UseNew: return "UseNew";
        case ResolutionStrategy::Interactive: return "Interactive";
    }
    return "Unknown";
}

const char* conflictStateName(ConflictState state) {
    switch (state) {
        case ConflictState::Detected: return "Detected";
        case ConflictState::AutoResolved: return "AutoResolved";
        case ConflictState::AwaitingUserChoice: return "AwaitingUserChoice";
        case ConflictState::Resolved: return "Resolved";
    }
    return "Unknown";
}

std::optional<ResolutionStrategy> parseStrategy(const std::string& name) {
    static const ResolutionStrategy all[] = {
        ResolutionStrategy::HigherPriority, ResolutionStrategy::LowerPriority, ResolutionStrategy::MostRecent,
        ResolutionStrategy::Merge, ResolutionStrategy::KeepExisting, ResolutionStrategy::UseNew,
        ResolutionStrategy::Interactive};
    for (auto s : all) {
        if (iequals(name, strategyName(s))) return s;
    }
    return std::nullopt;
}

const ConflictResolutionOption* ModConflict::findOption(const std::string& optionId) const {
    for (const auto& option : availableResolutions) {
        if (option.id == optionId) return &option;
    }
    return nullptr;
}

const ModSource* ModConflict::findSource(const std::string& modId) const {
    for (const auto& source : conflictingSources) {
        if (source.modId == modId) return &source;
    }
    return nullptr;
}

ResolutionOutcome ResolutionOutcome::succeeded(const ModConflict& conflict, ResolutionStrategy strategy,
                                               std::optional<ModSource> winner) {
    ResolutionOutcome outcome;
    outcome.conflictId = conflict.id;
    outcome.success = true;
    outcome.usedStrategy = strategy;
    outcome.winningSource = std::move(winner);
    outcome.resolvedFiles = conflict.affectedFiles;
    return outcome;
}

ResolutionOutcome ResolutionOutcome::failed(const ModConflict& conflict, ResolutionStrategy strategy,
                                            std::string message) {
    ResolutionOutcome outcome;
    outcome.conflictId = conflict.id;
    outcome.usedStrategy = strategy;
    outcome.errorMessage = std::move(message);
    return outcome;
}

ModConflict makeConflict(std::string id, ConflictType type, ConflictSeverity severity,
                         std::string description, std::vector<ModSource> sources,
                         std::vector<std::string> affected) {
    ModConflict conflict;
    conflict.id = std::move(id);
    conflict.type = type;
    conflict.severity = severity;
    conflict.description = std::move(description);
    conflict.conflictingSources = std::move(sources);
    conflict.affectedFiles = std::move(affected);

    auto& options = conflict.availableResolutions;
    if (severity != ConflictSeverity::Critical) {
        if (type == ConflictType::Script || type == ConflictType::Configuration) {
            options.push_back({"merge", ResolutionStrategy::Merge, "Merge both changes where possible", ""});
        }
        options.push_back({"priority", ResolutionStrategy::HigherPriority, "Use the higher priority mod", ""});
        options.push_back({"recent", ResolutionStrategy::MostRecent, "Use the most recently applied mod", ""});
        options.push_back({"keep_existing", ResolutionStrategy::KeepExisting, "Keep the first mod's files", ""});
        options.push_back({"use_new", ResolutionStrategy::UseNew, "Use the last mod's files", ""});
    }
    for (const auto& source : conflict.conflictingSources) {
        std::string name = source.modName.empty() ? source.modId : source.modName;
        options.push_back({"choose_" + source.modId, ResolutionStrategy::Interactive, "Use " + name,
                           source.modId});
    }
    return conflict;
}

} // namespace PakForge
