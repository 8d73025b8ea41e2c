#pragma once

#include "cancellation.hpp"
#include "conflict_resolver.hpp"
#include "downloader.hpp"
#include "errors.hpp"
#include "keyvalues.hpp"
#include "mod_conflict.hpp"
#include "mod_priority.hpp"
#include "vpk_extractor.hpp"
#include "vpk_recompiler.hpp"
#include "vpk_replacer.hpp"
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace PakForge {

namespace fs = std::filesystem;

// One mod's share of a generation: its conflict metadata, the patch index
// its blocks come from, and optionally loose files laid over the base
struct ModContribution {
    ModSource source;
    std::string patchText;
    std::vector<KeyValues::PatchRequest> entries;
    fs::path filesDir;
};

// Generate rebuilds from the pristine base. AddToCurrent patches on top of
// the installed archive, dropping files the previous run logged for the
// categories being regenerated.
enum class GenerationMode {
    Generate,
    AddToCurrent
};

// "generate" / "add"
const char* generationModeName(GenerationMode mode);
std::optional<GenerationMode> parseGenerationMode(const std::string& name);

struct GenerationRequest {
    fs::path targetDir;
    GenerationMode mode = GenerationMode::Generate;
    std::vector<ModContribution> contributions;
    std::map<std::string, std::string> decisions;   // conflict id -> option id
    bool appendMissing = false;
};

struct GenerationResult {
    bool success = false;
    ErrorKind kind = ErrorKind::None;
    std::string message;
    fs::path archivePath;
    std::vector<ModConflict> pendingConflicts;
    std::vector<ResolutionOutcome> outcomes;
};

struct PipelineOptions {
    std::string assetPath = "Assets/Original.zip";
    std::string cacheKey = "Original.zip";
    fs::path baseDir;                          // cached extraction of the base archive
    std::vector<std::string> requiredTools;    // checked before anything runs
    std::string modDirName = "_pakforge";
    FetchCallbacks fetchCallbacks;
    std::function<void(const std::string& stage)> onStage;
};

// Parse a request document. Relative patchFile and filesDir entries are
// resolved against baseDir.
Result<GenerationRequest> parseGenerationRequest(const std::string& text, const fs::path& baseDir);

// fetch -> extract -> patch -> resolve -> recompile -> replace for one request
class GenerationPipeline {
public:
    GenerationPipeline(ResilientFetcher& fetcher, ArchiveExtractor& extractor,
                       ArchiveRecompiler& recompiler, AtomicReplacer& replacer,
                       ModPriorityService& priorities, PipelineOptions options);

    GenerationResult run(const GenerationRequest& request, const CancellationToken& token = {});

    // Detect and resolve conflicts without touching anything on disk. Entries
    // still awaiting a decision are returned as pendingConflicts.
    GenerationResult plan(const GenerationRequest& request);

    // Extracted base directory, reusing the cached extraction when its marker
    // file is present. scratchDir holds the unpacked download.
    Result<fs::path> prepareBase(const fs::path& scratchDir, const CancellationToken& token = {});

    // Extract the installed archive into scratchDir/current and drop the files
    // the previous extraction log assigns to `categories`
    Result<fs::path> prepareCurrent(const fs::path& targetDir, const fs::path& scratchDir,
                                    const std::set<std::string>& categories,
                                    const CancellationToken& token = {});

private:
    struct Plan {
        std::vector<ModContribution> ordered;            // ascending priority
        std::map<std::string, KeyValues::BlockMap> blocks;   // modId -> parsed patch index
        std::vector<ModConflict> conflicts;
        std::vector<ResolutionOutcome> outcomes;
        std::map<std::string, std::set<std::string>> losses;   // modId -> keys it lost
    };

    Status buildPlan(const GenerationRequest& request, Plan& plan);
    bool mergeIdentical(const Plan& plan, const ModConflict& conflict, std::string& error) const;
    bool loses(const Plan& plan, const std::string& modId, const std::string& key) const;

    Status patchConfig(const Plan& plan, const fs::path& workDir, bool appendMissing,
                       std::vector<std::string>& patchedBy);
    Status overlayFiles(const Plan& plan, const fs::path& workDir,
                        std::map<std::string, std::vector<std::string>>& installed);
    void stage(const std::string& name) const;

    ResilientFetcher& m_fetcher;
    ArchiveExtractor& m_extractor;
    ArchiveRecompiler& m_recompiler;
    AtomicReplacer& m_replacer;
    ModPriorityService& m_priorities;
    PipelineOptions m_options;
};

} // namespace PakForge
