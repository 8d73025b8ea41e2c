#include "conflict_resolver.hpp"
#include "console.h"
#include <algorithm>

namespace PakForge {

ConflictResolver::ConflictResolver(MergeFunction merge) : m_merge(std::move(merge)) {}

std::optional<ModSource> ConflictResolver::selectWinner(const std::vector<ModSource>& sources,
                                                        ResolutionStrategy strategy) {
    if (sources.empty()) return std::nullopt;

    switch (strategy) {
        case ResolutionStrategy::HigherPriority:
            return *std::min_element(sources.begin(), sources.end(),
                                     [](const ModSource& a, const ModSource& b) { return a.priority < b.priority; });
        case ResolutionStrategy::LowerPriority:
            return *std::max_element(sources.begin(), sources.end(),
                                     [](const ModSource& a, const ModSource& b) { return a.priority < b.priority; });
        case ResolutionStrategy::MostRecent:
            // Ties go to the earlier registration
            return *std::max_element(sources.begin(), sources.end(),
                                     [](const ModSource& a, const ModSource& b) { return a.appliedAt < b.appliedAt; });
        case ResolutionStrategy::KeepExisting:
            return sources.front();
        case ResolutionStrategy::UseNew:
            return sources.back();
        case ResolutionStrategy::Merge:
        case ResolutionStrategy::Interactive:
            break;
    }
    return std::nullopt;
}

bool ConflictResolver::tryMerge(const ModConflict& conflict, std::string& error) const {
    if (conflict.type != ConflictType::Script && conflict.type != ConflictType::Configuration) {
        error = std::string("merge is not supported for ") + conflictTypeName(conflict.type) + " conflicts";
        return false;
    }
    if (!m_merge) {
        error = "no merge handler available";
        return false;
    }
    return m_merge(conflict, error);
}

void ConflictResolver::select(ModConflict& conflict, ResolutionStrategy strategy, ConflictState state) {
    for (const auto& option : conflict.availableResolutions) {
        if (option.strategy == strategy) {
            conflict.selectedResolution = option;
            break;
        }
    }
    if (!conflict.selectedResolution) {
        conflict.selectedResolution = ConflictResolutionOption{strategyName(strategy), strategy, strategyName(strategy), ""};
    }
    conflict.state = state;
}

ResolutionOutcome ConflictResolver::resolve(ModConflict& conflict, ResolutionStrategy strategy) {
    if (conflict.isResolved()) {
        return ResolutionOutcome::failed(conflict, strategy, "conflict " + conflict.id + " is already resolved");
    }
    if (strategy == ResolutionStrategy::Interactive) {
        conflict.state = ConflictState::AwaitingUserChoice;
        return ResolutionOutcome::failed(conflict, strategy, "interactive resolution requires a user choice");
    }
    if (conflict.severity == ConflictSeverity::Critical) {
        conflict.state = ConflictState::AwaitingUserChoice;
        return ResolutionOutcome::failed(conflict, strategy, "critical conflict requires a user choice");
    }
    if (conflict.conflictingSources.empty()) {
        return ResolutionOutcome::failed(conflict, strategy, "conflict has no sources");
    }

    const ConflictState finalState = conflict.state == ConflictState::AwaitingUserChoice
        ? ConflictState::Resolved
        : ConflictState::AutoResolved;

    if (strategy == ResolutionStrategy::Merge) {
        std::string error;
        if (tryMerge(conflict, error)) {
            select(conflict, ResolutionStrategy::Merge, finalState);
            Console::log("Merged ", conflict.id);
            return ResolutionOutcome::succeeded(conflict, ResolutionStrategy::Merge, std::nullopt);
        }
        Console::warn("Merge of ", conflict.id, " failed (", error, "); using higher priority");
        strategy = ResolutionStrategy::HigherPriority;
    }

    auto winner = selectWinner(conflict.conflictingSources, strategy);
    if (!winner) {
        return ResolutionOutcome::failed(conflict, strategy, "could not determine a winning mod");
    }
    select(conflict, strategy, finalState);
    Console::log("Resolved ", conflict.id, " -> ", winner->modName.empty() ? winner->modId : winner->modName,
                 " (", strategyName(strategy), ")");
    return ResolutionOutcome::succeeded(conflict, strategy, winner);
}

ResolutionOutcome ConflictResolver::applyUserChoice(ModConflict& conflict, const ConflictResolutionOption& choice) {
    if (conflict.isResolved()) {
        return ResolutionOutcome::failed(conflict, choice.strategy,
                                         "conflict " + conflict.id + " is already resolved");
    }
    if (conflict.state == ConflictState::Detected) {
        conflict.state = ConflictState::AwaitingUserChoice;
    }

    if (choice.strategy == ResolutionStrategy::Merge) {
        std::string error;
        if (tryMerge(conflict, error)) {
            conflict.selectedResolution = choice;
            conflict.state = ConflictState::Resolved;
            return ResolutionOutcome::succeeded(conflict, ResolutionStrategy::Merge, std::nullopt);
        }
        Console::warn("Merge of ", conflict.id, " failed (", error, "); using higher priority");
        auto winner = selectWinner(conflict.conflictingSources, ResolutionStrategy::HigherPriority);
        if (!winner) {
            return ResolutionOutcome::failed(conflict, choice.strategy, "conflict has no sources");
        }
        conflict.selectedResolution = choice;
        conflict.state = ConflictState::Resolved;
        return ResolutionOutcome::succeeded(conflict, ResolutionStrategy::HigherPriority, winner);
    }

    if (choice.preferredSource.empty()) {
        return ResolutionOutcome::failed(conflict, choice.strategy, "no preferred source in chosen option");
    }
    const ModSource* winner = conflict.findSource(choice.preferredSource);
    if (!winner) {
        return ResolutionOutcome::failed(conflict, choice.strategy,
                                         choice.preferredSource + " is not part of conflict " + conflict.id);
    }

    conflict.selectedResolution = choice;
    conflict.state = ConflictState::Resolved;
    Console::log("Resolved ", conflict.id, " -> ", winner->modId, " (user choice)");
    return ResolutionOutcome::succeeded(conflict, choice.strategy, *winner);
}

ResolutionOutcome ConflictResolver::applyUserChoice(ModConflict& conflict, const std::string& optionId) {
    const ConflictResolutionOption* option = conflict.findOption(optionId);
    if (!option) {
        return ResolutionOutcome::failed(conflict, ResolutionStrategy::Interactive,
                                         "conflict " + conflict.id + " has no option '" + optionId + "'");
    }
    ConflictResolutionOption chosen = *option;
    return applyUserChoice(conflict, chosen);
}

bool ConflictResolver::canAutoResolve(const ModConflict& conflict, const ModPriorityConfig& config) {
    switch (conflict.severity) {
        case ConflictSeverity::Critical:
        case ConflictSeverity::High:
            return false;
        case ConflictSeverity::Medium:
            return config.autoResolveNonBreaking;
        case ConflictSeverity::Low:
        case ConflictSeverity::None:
            return true;
    }
    return false;
}

ResolutionStrategy ConflictResolver::strategyFor(const ModConflict& conflict, const ModPriorityConfig& config) {
    for (const auto& source : conflict.conflictingSources) {
        if (auto strategy = config.strategyForCategory(source.category)) return *strategy;
    }
    return config.defaultStrategy;
}

std::vector<ResolutionOutcome> ConflictResolver::resolveAll(std::vector<ModConflict>& conflicts,
                                                            const ModPriorityConfig& config) {
    std::vector<ResolutionOutcome> outcomes;
    for (auto& conflict : conflicts) {
        if (conflict.isResolved()) continue;

        if (!canAutoResolve(conflict, config)) {
            conflict.state = ConflictState::AwaitingUserChoice;
            Console::log("Conflict ", conflict.id, " (", severityName(conflict.severity), ") needs a decision");
            outcomes.push_back(ResolutionOutcome::failed(conflict, ResolutionStrategy::Interactive,
                                                         "conflict requires user intervention"));
            continue;
        }
        outcomes.push_back(resolve(conflict, strategyFor(conflict, config)));
    }
    return outcomes;
}

} // namespace PakForge
