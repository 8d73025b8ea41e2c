#include "conflict_detector.hpp"
#include "conflict_resolver.hpp"
#include "test_common.hpp"

using namespace PakForge;
using namespace PakForge::Test;

static ModSource mod(const std::string& id, int priority, std::vector<std::string> files,
                     const std::string& category = "Misc", int64_t appliedAt = 0) {
    ModSource s;
    s.modId = id;
    s.modName = id + " mod";
    s.category = category;
    s.priority = priority;
    s.appliedAt = appliedAt;
    s.affectedFiles = std::move(files);
    return s;
}

static ModPriorityConfig plainConfig() {
    ModPriorityConfig config;
    config.defaultStrategy = ResolutionStrategy::HigherPriority;
    return config;
}

static void testDetection() {
    ConflictDetector detector;

    std::vector<std::string> textures;
    for (int i = 0; i < 6; ++i) textures.push_back("materials/terrain/tile" + std::to_string(i) + ".vtex_c");
    auto many = detector.detect({mod("a", 10, textures), mod("b", 20, textures)});
    check(many.size() == 1 && many[0].type == ConflictType::Asset, "six shared textures are one Asset conflict");
    check(!many.empty() && many[0].severity == ConflictSeverity::High, "six shared assets escalate to High");
    check(!many.empty() && many[0].id == "file:a:b", "file conflict id names both mods");

    std::vector<std::string> sounds;
    for (int i = 0; i < 11; ++i) sounds.push_back("sounds/ambient/loop" + std::to_string(i) + ".vsnd_c");
    std::vector<std::string> tenSounds(sounds.begin(), sounds.begin() + 10);
    auto ten = detector.detect({mod("a", 10, tenSounds, "Audio"), mod("b", 20, tenSounds, "Weather")});
    check(ten.size() == 1 && ten[0].severity == ConflictSeverity::High, "ten shared assets stay High");
    auto eleven = detector.detect({mod("a", 10, sounds, "Audio"), mod("b", 20, sounds, "Weather")});
    check(eleven.size() == 1 && eleven[0].severity == ConflictSeverity::Critical,
          "more than ten shared files are Critical across categories");
    check(!eleven.empty() && !ConflictResolver::canAutoResolve(eleven[0], ModPriorityConfig::createDefault()),
          "eleven shared files never auto-resolve");

    auto one = detector.detect({mod("a", 10, {"materials/x.vtex_c"}), mod("b", 20, {"Materials\\X.VTEX_C"})});
    check(one.size() == 1 && static_cast<int>(one[0].severity) <= static_cast<int>(ConflictSeverity::Medium),
          "a single shared file is at most Medium, matched case-insensitively");

    auto none = detector.detect({mod("a", 10, {"a.vtex_c"}), mod("b", 20, {"b.vtex_c"})});
    check(none.empty(), "disjoint mods do not conflict");

    ModSource x = mod("x", 10, {});
    x.settings["dota_shadow_quality"] = "high";
    ModSource y = mod("y", 20, {});
    y.settings["dota_shadow_quality"] = "off";
    auto clash = detector.detect({x, y});
    check(clash.size() == 1 && clash[0].severity == ConflictSeverity::Critical &&
              clash[0].type == ConflictType::Configuration,
          "incompatible settings are a Critical configuration conflict");
    bool onlyChoices = !clash.empty() && clash[0].availableResolutions.size() == 2;
    if (!clash.empty()) {
        for (const auto& option : clash[0].availableResolutions) {
            if (option.isAutomatic()) onlyChoices = false;
        }
    }
    check(onlyChoices, "critical conflict offers only per-source choices");

    ModSource k1 = mod("k1", 10, {});
    k1.configKeys = {"5012", "5013"};
    ModSource k2 = mod("k2", 20, {});
    k2.configKeys = {"5013"};
    auto keys = detector.detect({k1, k2});
    check(keys.size() == 1 && keys[0].id == "keys:k1:k2" && keys[0].type == ConflictType::Script &&
              keys[0].affectedFiles == std::vector<std::string>{"5013"},
          "shared block id is a Script conflict on that id");

    auto critical = detector.detect({mod("a", 10, {"gameinfo.gi"}), mod("b", 20, {"gameinfo.gi"})});
    check(critical.size() == 1 && critical[0].severity == ConflictSeverity::Critical,
          "touching gameinfo is Critical");

    auto pairs = detector.detect({x, mod("a", 10, {"m.vtex_c"}), y});
    check(pairs.size() == 1 && pairs[0].id == "settings:x:y", "only overlapping pairs are reported");

    check(ConflictDetector::classifyFiles({"scripts/npc/npc_units.txt"}) == ConflictType::Script, "txt is Script");
    check(ConflictDetector::classifyFiles({"cfg/default.cfg"}) == ConflictType::Configuration,
          "default config is Configuration");
    check(ConflictDetector::classifyFiles({"readme.md"}) == ConflictType::File, "other files are File");
}

static void testAutoResolvePolicy() {
    ModPriorityConfig config = plainConfig();
    ModConflict conflict = makeConflict("c", ConflictType::File, ConflictSeverity::Critical, "", {}, {});
    check(!ConflictResolver::canAutoResolve(conflict, config), "Critical never auto-resolves");
    conflict.severity = ConflictSeverity::High;
    check(!ConflictResolver::canAutoResolve(conflict, config), "High never auto-resolves");
    conflict.severity = ConflictSeverity::Medium;
    check(ConflictResolver::canAutoResolve(conflict, config), "Medium auto-resolves when allowed");
    config.autoResolveNonBreaking = false;
    check(!ConflictResolver::canAutoResolve(conflict, config), "Medium waits when auto-resolve is off");
    conflict.severity = ConflictSeverity::Low;
    check(ConflictResolver::canAutoResolve(conflict, config), "Low always auto-resolves");
}

static void testWinnerSelection() {
    std::vector<ModSource> sources = {mod("old", 50, {}, "Misc", 100), mod("new", 10, {}, "Misc", 200),
                                      mod("tie", 10, {}, "Misc", 200)};
    check(ConflictResolver::selectWinner(sources, ResolutionStrategy::HigherPriority)->modId == "new",
          "HigherPriority picks the lowest number, first on a tie");
    check(ConflictResolver::selectWinner(sources, ResolutionStrategy::LowerPriority)->modId == "old",
          "LowerPriority picks the highest number");
    check(ConflictResolver::selectWinner(sources, ResolutionStrategy::MostRecent)->modId == "new",
          "MostRecent picks the latest, earlier registration on a tie");
    check(ConflictResolver::selectWinner(sources, ResolutionStrategy::KeepExisting)->modId == "old",
          "KeepExisting picks the first registered");
    check(ConflictResolver::selectWinner(sources, ResolutionStrategy::UseNew)->modId == "tie",
          "UseNew picks the last registered");
    check(!ConflictResolver::selectWinner(sources, ResolutionStrategy::Interactive), "Interactive has no winner");
    check(!ConflictResolver::selectWinner({}, ResolutionStrategy::HigherPriority), "no sources, no winner");
}

static void testWeatherScenario() {
    ConflictDetector detector;
    auto conflicts = detector.detect({mod("rain", 10, {"weather.vpk"}, "Weather"),
                                      mod("snow", 50, {"weather.vpk"}, "Weather")});
    check(conflicts.size() == 1, "two weather mods on one archive conflict once");
    if (conflicts.empty()) return;

    ConflictResolver resolver;
    auto outcome = resolver.resolve(conflicts[0], ResolutionStrategy::HigherPriority);
    check(outcome.success && outcome.winningSource && outcome.winningSource->modId == "rain",
          "priority 10 beats priority 50");
    check(conflicts[0].state == ConflictState::AutoResolved, "automatic resolution is AutoResolved");
    check(conflicts[0].selectedResolution && conflicts[0].selectedResolution->id == "priority",
          "selected option recorded");
    check(outcome.resolvedFiles == std::vector<std::string>{"weather.vpk"}, "outcome lists the resolved files");

    auto again = resolver.resolve(conflicts[0], ResolutionStrategy::UseNew);
    check(!again.success && conflicts[0].state == ConflictState::AutoResolved, "resolving twice fails");

    // Default config resolves Weather by recency
    auto recent = detector.detect({mod("rain", 10, {"weather.vpk"}, "Weather", 500),
                                   mod("snow", 50, {"weather.vpk"}, "Weather", 900)});
    ModPriorityConfig defaults = ModPriorityConfig::createDefault();
    check(!recent.empty() && ConflictResolver::strategyFor(recent[0], defaults) == ResolutionStrategy::MostRecent,
          "Weather category uses MostRecent by default");
    auto outcomes = resolver.resolveAll(recent, defaults);
    check(outcomes.size() == 1 && outcomes[0].success && outcomes[0].winningSource->modId == "snow",
          "resolveAll applies the category strategy");
}

static void testCriticalAndChoices() {
    ConflictDetector detector;
    ModSource x = mod("x", 10, {});
    x.settings["fps_max"] = "120";
    ModSource y = mod("y", 20, {});
    y.settings["fps_max"] = "240";
    auto conflicts = detector.detect({x, y});
    if (conflicts.empty()) {
        check(false, "settings clash detected");
        return;
    }

    ConflictResolver resolver;
    auto outcomes = resolver.resolveAll(conflicts, plainConfig());
    check(outcomes.size() == 1 && !outcomes[0].success, "resolveAll leaves Critical unresolved");
    check(conflicts[0].state == ConflictState::AwaitingUserChoice, "Critical waits for a user choice");

    auto forced = resolver.resolve(conflicts[0], ResolutionStrategy::HigherPriority);
    check(!forced.success, "automatic strategy refused on a Critical conflict");

    auto unknown = resolver.applyUserChoice(conflicts[0], "choose_z");
    check(!unknown.success, "unknown option id rejected");

    auto chosen = resolver.applyUserChoice(conflicts[0], "choose_y");
    check(chosen.success && chosen.winningSource && chosen.winningSource->modId == "y", "user choice wins");
    check(conflicts[0].state == ConflictState::Resolved, "user choice ends Resolved");

    auto twice = resolver.applyUserChoice(conflicts[0], "choose_x");
    check(!twice.success && conflicts[0].selectedResolution->id == "choose_y", "second choice rejected");

    ModConflict bare = makeConflict("bare", ConflictType::File, ConflictSeverity::Low, "", {x, y}, {"f"});
    ConflictResolutionOption sourceless{"custom", ResolutionStrategy::HigherPriority, "custom", ""};
    auto empty = resolver.applyUserChoice(bare, sourceless);
    check(!empty.success && bare.state == ConflictState::AwaitingUserChoice,
          "choice without a preferred source fails");
}

static void testMerge() {
    ModSource a = mod("a", 30, {"scripts/items/items_game.txt"});
    ModSource b = mod("b", 20, {"scripts/items/items_game.txt"});
    ModConflict script = makeConflict("file:a:b", ConflictType::Script, ConflictSeverity::Medium, "", {a, b},
                                      {"scripts/items/items_game.txt"});
    check(!script.availableResolutions.empty() && script.availableResolutions[0].id == "merge",
          "script conflicts offer merge first");

    ConflictResolver failing([](const ModConflict&, std::string& error) {
        error = "blocks differ";
        return false;
    });
    ModConflict first = script;
    auto fallback = failing.resolve(first, ResolutionStrategy::Merge);
    check(fallback.success && fallback.usedStrategy == ResolutionStrategy::HigherPriority &&
              fallback.winningSource->modId == "b",
          "failed merge falls back to higher priority");

    int calls = 0;
    ConflictResolver merging([&calls](const ModConflict&, std::string&) {
        ++calls;
        return true;
    });
    ModConflict second = script;
    auto merged = merging.resolve(second, ResolutionStrategy::Merge);
    check(merged.success && !merged.winningSource && calls == 1, "successful merge has no single winner");

    ModConflict asset = makeConflict("file:a:b", ConflictType::Asset, ConflictSeverity::Low, "", {a, b}, {"x.vpk"});
    auto assetMerge = merging.resolve(asset, ResolutionStrategy::Merge);
    check(assetMerge.success && calls == 1 && assetMerge.winningSource->modId == "b",
          "asset conflicts never call the merge handler");

    ModConflict decided = script;
    auto userMerge = failing.applyUserChoice(decided, "merge");
    check(userMerge.success && decided.state == ConflictState::Resolved && userMerge.winningSource->modId == "b",
          "user-chosen merge falls back and ends Resolved");
}

int main() {
    std::cout << "Running conflict tests..." << std::endl;
    testDetection();
    testAutoResolvePolicy();
    testWinnerSelection();
    testWeatherScenario();
    testCriticalAndChoices();
    testMerge();
    return finish("test_conflict");
}
