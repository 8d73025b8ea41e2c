#pragma once

#include "mod_conflict.hpp"
#include "mod_priority.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace PakForge {

// Attempts a structural merge of a Script or Configuration conflict.
// Returns false and fills `error` when the contributions cannot be merged.
using MergeFunction = std::function<bool(const ModConflict& conflict, std::string& error)>;

class ConflictResolver {
public:
    explicit ConflictResolver(MergeFunction merge = {});

    // Automatic resolution. Critical conflicts and the Interactive strategy
    // never resolve here; they move to AwaitingUserChoice.
    ResolutionOutcome resolve(ModConflict& conflict, ResolutionStrategy strategy);

    // Apply a caller decision. A choice without a preferred source fails
    // unless its strategy is Merge.
    ResolutionOutcome applyUserChoice(ModConflict& conflict, const ConflictResolutionOption& choice);
    ResolutionOutcome applyUserChoice(ModConflict& conflict, const std::string& optionId);

    // Critical and High: never. Medium: only with autoResolveNonBreaking.
    // Low and None: always.
    static bool canAutoResolve(const ModConflict& conflict, const ModPriorityConfig& config);

    // First category override among the conflicting sources, else the default
    static ResolutionStrategy strategyFor(const ModConflict& conflict, const ModPriorityConfig& config);

    // Auto-resolve what may be, mark the rest AwaitingUserChoice
    std::vector<ResolutionOutcome> resolveAll(std::vector<ModConflict>& conflicts, const ModPriorityConfig& config);

    static std::optional<ModSource> selectWinner(const std::vector<ModSource>& sources, ResolutionStrategy strategy);

private:
    bool tryMerge(const ModConflict& conflict, std::string& error) const;
    static void select(ModConflict& conflict, ResolutionStrategy strategy, ConflictState state);

    MergeFunction m_merge;
};

} // namespace PakForge
