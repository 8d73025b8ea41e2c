#include "pipeline.hpp"
#include "conflict_detector.hpp"
#include "console.h"
#include "extraction_log.hpp"
#include "file_utils.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

namespace PakForge {

using json = nlohmann::json;

// ============================================================================
// Helpers
// ============================================================================

static std::string itemKey(const std::string& item) {
    std::string key = toLower(item);
    std::replace(key.begin(), key.end(), '\\', '/');
    while (!key.empty() && key.front() == '/') key.erase(key.begin());
    return key;
}

// Regular files below dir as generic relative paths, sorted
static std::vector<std::string> listFiles(const fs::path& dir) {
    std::vector<std::string> files;
    std::error_code ec;
    if (dir.empty() || !fs::is_directory(dir, ec)) return files;
    for (auto it = fs::recursive_directory_iterator(dir, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            files.push_back(fs::relative(it->path(), dir, ec).generic_string());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

static std::string categoryOf(const ModContribution& c) {
    return c.source.category.empty() ? "General" : c.source.category;
}

static const ModContribution* findContribution(const std::vector<ModContribution>& list, const std::string& modId) {
    for (const auto& c : list) {
        if (c.source.modId == modId) return &c;
    }
    return nullptr;
}

namespace {
// Removes the per-run scratch directory on every exit path
struct ScratchDir {
    fs::path path;
    ~ScratchDir() { removeTreeQuietly(path); }
};
}

static Status validateRequest(const GenerationRequest& request) {
    std::error_code ec;
    if (request.targetDir.empty() || !fs::is_directory(request.targetDir, ec)) {
        return Status::failure(ErrorKind::InvalidInput,
                               "target installation not found: " + request.targetDir.string());
    }
    if (request.contributions.empty()) {
        return Status::failure(ErrorKind::InvalidInput, "request contains no contributions");
    }
    std::set<std::string> ids;
    for (const auto& c : request.contributions) {
        if (c.source.modId.empty()) {
            return Status::failure(ErrorKind::InvalidInput, "contribution without a modId");
        }
        if (!ids.insert(c.source.modId).second) {
            return Status::failure(ErrorKind::InvalidInput, "duplicate modId " + c.source.modId);
        }
        if (!c.filesDir.empty() && !fs::is_directory(c.filesDir, ec)) {
            return Status::failure(ErrorKind::InvalidInput,
                                   c.source.modId + ": files directory not found: " + c.filesDir.string());
        }
    }
    return Status::success();
}

// ============================================================================
// Request parsing
// ============================================================================

const char* generationModeName(GenerationMode mode) {
    switch (mode) {
        case GenerationMode::Generate: return "generate";
        case GenerationMode::AddToCurrent: return "add";
    }
    return "generate";
}

std::optional<GenerationMode> parseGenerationMode(const std::string& name) {
    for (GenerationMode mode : {GenerationMode::Generate, GenerationMode::AddToCurrent}) {
        if (iequals(name, generationModeName(mode))) return mode;
    }
    return std::nullopt;
}

static std::vector<std::string> stringList(const json& node, const char* key) {
    std::vector<std::string> result;
    if (!node.contains(key) || !node[key].is_array()) return result;
    for (const auto& item : node[key]) {
        if (item.is_string()) result.push_back(item.get<std::string>());
    }
    return result;
}

Result<GenerationRequest> parseGenerationRequest(const std::string& text, const fs::path& baseDir) {
    using R = Result<GenerationRequest>;
    GenerationRequest request;
    try {
        json root = json::parse(text);
        if (!root.is_object()) return R::failure(ErrorKind::InvalidInput, "request must be a JSON object");

        std::string target = root.value("target", "");
        if (target.empty()) return R::failure(ErrorKind::InvalidInput, "request has no target");
        request.targetDir = target;
        std::string mode = root.value("mode", std::string(generationModeName(request.mode)));
        auto parsedMode = parseGenerationMode(mode);
        if (!parsedMode) {
            return R::failure(ErrorKind::InvalidInput, "unknown mode '" + mode + "' (expected generate or add)");
        }
        request.mode = *parsedMode;
        request.appendMissing = root.value("appendMissing", false);

        if (root.contains("decisions") && root["decisions"].is_object()) {
            for (auto it = root["decisions"].begin(); it != root["decisions"].end(); ++it) {
                if (it.value().is_string()) request.decisions[it.key()] = it.value().get<std::string>();
            }
        }

        if (!root.contains("contributions") || !root["contributions"].is_array()) {
            return R::failure(ErrorKind::InvalidInput, "request has no contributions array");
        }
        for (const auto& item : root["contributions"]) {
            ModContribution c;
            c.source.modId = item.value("modId", "");
            c.source.modName = item.value("modName", "");
            c.source.category = item.value("category", "");
            c.source.priority = item.value("priority", ModPriorityConfig::kDefaultPriority);
            c.source.appliedAt = item.value("appliedAt", static_cast<int64_t>(0));
            c.source.affectedFiles = stringList(item, "affectedFiles");
            c.source.configKeys = stringList(item, "configKeys");
            if (item.contains("settings") && item["settings"].is_object()) {
                for (auto it = item["settings"].begin(); it != item["settings"].end(); ++it) {
                    c.source.settings[it.key()] = it.value().is_string() ? it.value().get<std::string>()
                                                                         : it.value().dump();
                }
            }

            if (item.contains("patchText")) {
                c.patchText = item["patchText"].get<std::string>();
            } else if (item.contains("patchFile")) {
                fs::path patchFile = item["patchFile"].get<std::string>();
                if (patchFile.is_relative()) patchFile = baseDir / patchFile;
                std::error_code ec;
                if (!fs::is_regular_file(patchFile, ec)) {
                    return R::failure(ErrorKind::InvalidInput, "patch file not found: " + patchFile.string());
                }
                c.patchText = readFile(patchFile.string());
            }

            if (item.contains("entries") && item["entries"].is_array()) {
                for (const auto& entry : item["entries"]) {
                    KeyValues::PatchRequest patch;
                    if (entry.is_string()) {
                        patch.id = entry.get<std::string>();
                    } else if (entry.is_number_integer()) {
                        patch.id = std::to_string(entry.get<long long>());
                    } else {
                        patch.id = entry.value("id", "");
                        patch.ownerTag = entry.value("ownerTag", "");
                    }
                    if (!patch.id.empty()) c.entries.push_back(patch);
                }
            }

            std::string filesDir = item.value("filesDir", "");
            if (!filesDir.empty()) {
                c.filesDir = filesDir;
                if (c.filesDir.is_relative()) c.filesDir = baseDir / c.filesDir;
            }
            request.contributions.push_back(std::move(c));
        }
    } catch (const json::exception& e) {
        return R::failure(ErrorKind::InvalidInput, std::string("invalid request: ") + e.what());
    }
    return R::success(std::move(request));
}

// ============================================================================
// GenerationPipeline
// ============================================================================

GenerationPipeline::GenerationPipeline(ResilientFetcher& fetcher, ArchiveExtractor& extractor,
                                       ArchiveRecompiler& recompiler, AtomicReplacer& replacer,
                                       ModPriorityService& priorities, PipelineOptions options)
    : m_fetcher(fetcher), m_extractor(extractor), m_recompiler(recompiler), m_replacer(replacer),
      m_priorities(priorities), m_options(std::move(options)) {}

void GenerationPipeline::stage(const std::string& name) const {
    Console::debug("Stage: ", name);
    if (m_options.onStage) m_options.onStage(name);
}

bool GenerationPipeline::loses(const Plan& plan, const std::string& modId, const std::string& key) const {
    auto it = plan.losses.find(modId);
    return it != plan.losses.end() && it->second.count(itemKey(key)) > 0;
}

bool GenerationPipeline::mergeIdentical(const Plan& plan, const ModConflict& conflict, std::string& error) const {
    for (const auto& item : conflict.affectedFiles) {
        std::optional<std::string> first;
        for (const auto& source : conflict.conflictingSources) {
            std::string content;
            auto blocks = plan.blocks.find(source.modId);
            const ModContribution* c = findContribution(plan.ordered, source.modId);
            std::error_code ec;
            if (blocks != plan.blocks.end() && blocks->second.count(item)) {
                content = KeyValues::normalize(blocks->second.at(item));
            } else if (c && !c->filesDir.empty() && fs::is_regular_file(c->filesDir / item, ec)) {
                content = readFile((c->filesDir / item).string());
            } else {
                error = source.modId + " has no content for " + item;
                return false;
            }
            if (!first) {
                first = content;
            } else if (*first != content) {
                error = "contributions differ on " + item;
                return false;
            }
        }
    }
    return true;
}

Status GenerationPipeline::buildPlan(const GenerationRequest& request, Plan& plan) {
    std::vector<ModSource> sources;
    for (const auto& c : request.contributions) {
        ModSource source = c.source;
        if (source.configKeys.empty()) {
            for (const auto& entry : c.entries) source.configKeys.push_back(entry.id);
        }
        if (source.affectedFiles.empty()) source.affectedFiles = listFiles(c.filesDir);
        sources.push_back(source);

        if (!c.entries.empty()) {
            auto parsed = KeyValues::parseBlocks(c.patchText);
            if (!parsed) {
                return Status::failure(ErrorKind::PatchNotApplied,
                                       source.modId + ": patch index unreadable: " + parsed.message());
            }
            plan.blocks[source.modId] = parsed.value();
        }
    }

    sources = m_priorities.applyPriorities(request.targetDir, sources);
    for (const auto& source : sources) {
        ModContribution c = *findContribution(request.contributions, source.modId);
        c.source = source;
        plan.ordered.push_back(std::move(c));
    }

    ModPriorityConfig config = ModPriorityConfig::createDefault();
    auto loaded = m_priorities.load(request.targetDir);
    if (loaded) {
        config = loaded.value();
    } else {
        Console::warn("Using default priorities: ", loaded.message());
    }

    ConflictDetector detector;
    plan.conflicts = detector.detect(sources);

    ConflictResolver resolver([this, &plan](const ModConflict& conflict, std::string& error) {
        return mergeIdentical(plan, conflict, error);
    });

    for (const auto& [conflictId, optionId] : request.decisions) {
        auto conflict = std::find_if(plan.conflicts.begin(), plan.conflicts.end(),
                                     [&](const ModConflict& c) { return c.id == conflictId; });
        if (conflict == plan.conflicts.end()) {
            Console::warn("Decision for unknown conflict ", conflictId, " ignored");
            continue;
        }
        const ConflictResolutionOption* option = conflict->findOption(optionId);
        if (!option) {
            return Status::failure(ErrorKind::InvalidInput,
                                   "conflict " + conflictId + " has no option '" + optionId + "'");
        }
        ConflictResolutionOption chosen = *option;
        conflict->state = ConflictState::AwaitingUserChoice;
        if (chosen.isAutomatic() && chosen.strategy != ResolutionStrategy::Merge) {
            plan.outcomes.push_back(resolver.resolve(*conflict, chosen.strategy));
        } else {
            plan.outcomes.push_back(resolver.applyUserChoice(*conflict, chosen));
        }
    }

    auto automatic = resolver.resolveAll(plan.conflicts, config);
    plan.outcomes.insert(plan.outcomes.end(), automatic.begin(), automatic.end());

    for (const auto& outcome : plan.outcomes) {
        if (!outcome.success || !outcome.winningSource) continue;
        auto conflict = std::find_if(plan.conflicts.begin(), plan.conflicts.end(),
                                     [&](const ModConflict& c) { return c.id == outcome.conflictId; });
        if (conflict == plan.conflicts.end()) continue;
        for (const auto& source : conflict->conflictingSources) {
            if (source.modId == outcome.winningSource->modId) continue;
            for (const auto& item : conflict->affectedFiles) {
                plan.losses[source.modId].insert(itemKey(item));
            }
        }
    }
    return Status::success();
}

GenerationResult GenerationPipeline::plan(const GenerationRequest& request) {
    GenerationResult result;
    Status valid = validateRequest(request);
    if (!valid) {
        result.kind = valid.kind();
        result.message = valid.message();
        return result;
    }

    Plan plan;
    Status built = buildPlan(request, plan);
    result.outcomes = plan.outcomes;
    if (!built) {
        result.kind = built.kind();
        result.message = built.message();
        return result;
    }
    for (const auto& conflict : plan.conflicts) {
        if (!conflict.isResolved()) result.pendingConflicts.push_back(conflict);
    }
    if (!result.pendingConflicts.empty()) {
        result.kind = ErrorKind::ConflictUnresolved;
        result.message = std::to_string(result.pendingConflicts.size()) + " conflict(s) need a decision";
        return result;
    }
    result.success = true;
    result.message = std::to_string(plan.conflicts.size()) + " conflict(s) resolved";
    return result;
}

Result<fs::path> GenerationPipeline::prepareBase(const fs::path& scratchDir, const CancellationToken& token) {
    const fs::path& baseDir = m_options.baseDir;
    if (m_extractor.hasMarker(baseDir)) {
        Console::log("Using cached base at ", baseDir.string());
        return Result<fs::path>::success(baseDir);
    }

    auto fetched = m_fetcher.fetch(m_options.assetPath, m_options.cacheKey, m_options.fetchCallbacks, token);
    if (!fetched) return Result<fs::path>::failure(fetched.error());

    // A bad download must not be served from the cache again
    auto discard = [&](const Status& status) {
        if (status.kind() != ErrorKind::Cancelled) m_fetcher.clearCache(m_options.cacheKey);
        return Result<fs::path>::failure(status);
    };

    fs::path unpacked = scratchDir / "download";
    Status unzip = m_extractor.extractZip(fetched->localPath, unpacked, token);
    if (!unzip) return discard(unzip);

    fs::path archive = ArchiveExtractor::findArchive(unpacked);
    if (archive.empty()) {
        return discard(Status::failure(ErrorKind::CorruptArtifact,
                                       "no VPK archive inside " + fetched->localPath.filename().string()));
    }

    Status extracted = m_extractor.extract(archive, baseDir, token);
    if (!extracted) {
        if (extracted.kind() == ErrorKind::CorruptArtifact) return discard(extracted);
        return Result<fs::path>::failure(extracted);
    }
    removeTreeQuietly(unpacked);
    return Result<fs::path>::success(baseDir);
}

Result<fs::path> GenerationPipeline::prepareCurrent(const fs::path& targetDir, const fs::path& scratchDir,
                                                   const std::set<std::string>& categories,
                                                   const CancellationToken& token) {
    const fs::path live = m_replacer.liveArchivePath(targetDir);
    std::error_code ec;
    if (!fs::is_regular_file(live, ec)) {
        return Result<fs::path>::failure(ErrorKind::ArtifactNotFound,
                                         "no installed archive to add to: " + live.string());
    }

    fs::path current = scratchDir / "current";
    Status extracted = m_extractor.extract(live, current, token);
    if (!extracted) return Result<fs::path>::failure(extracted);

    auto previous = loadExtractionLog(extractionLogPath(targetDir, m_options.modDirName));
    if (!previous) {
        Console::warn("Keeping installed files, previous extraction log unreadable: ", previous.message());
        return Result<fs::path>::success(current);
    }
    // The config file is patched in place, never dropped
    const std::vector<std::string> keep = {m_extractor.options().markerFile};
    for (const auto& category : categories) {
        size_t removed = removeOwnedFiles(previous.value(), current, category, keep);
        if (removed > 0) Console::log("Dropped ", removed, " file(s) from the previous ", category, " selection");
    }
    return Result<fs::path>::success(current);
}

Status GenerationPipeline::patchConfig(const Plan& plan, const fs::path& workDir, bool appendMissing,
                                       std::vector<std::string>& patchedBy) {
    KeyValues::BlockMap index;
    std::vector<KeyValues::PatchRequest> requests;
    for (const auto& c : plan.ordered) {
        bool contributed = false;
        for (const auto& entry : c.entries) {
            if (loses(plan, c.source.modId, entry.id) || index.count(entry.id)) continue;
            const auto& blocks = plan.blocks.at(c.source.modId);
            auto block = blocks.find(entry.id);
            if (block == blocks.end()) {
                return Status::failure(ErrorKind::PatchNotApplied,
                                       c.source.modId + ": patch index has no block " + entry.id);
            }
            index[entry.id] = block->second;
            requests.push_back(entry);
            contributed = true;
        }
        if (contributed) patchedBy.push_back(c.source.modId);
    }
    if (requests.empty()) return Status::success();

    const fs::path marker = workDir / m_extractor.options().markerFile;
    std::error_code ec;
    if (!fs::is_regular_file(marker, ec)) {
        return Status::failure(ErrorKind::ArtifactNotFound, "config file not found: " + marker.string());
    }

    std::string text = KeyValues::normalize(readFile(marker.string()));
    if (KeyValues::isOneLiner(text)) {
        Console::log("Reformatting single-line ", marker.filename().string());
        auto pretty = KeyValues::prettify(text);
        if (!pretty) return pretty.status();
        text = pretty.value();
    }

    KeyValues::PatchOptions options;
    options.appendMissing = appendMissing;
    auto report = KeyValues::applyPatches(text, index, requests, options);
    if (!report) return report.status();
    if (!report->missing.empty()) {
        std::string detail;
        for (const auto& m : report->missing) detail += (detail.empty() ? "" : "; ") + m;
        return Status::failure(ErrorKind::PatchNotApplied, detail);
    }

    Console::log("Patched ", report->applied.size(), " block(s)",
                 report->appended.empty() ? "" : ", appended " + std::to_string(report->appended.size()));
    return writeFile(marker, report->text);
}

Status GenerationPipeline::overlayFiles(const Plan& plan, const fs::path& workDir,
                                        std::map<std::string, std::vector<std::string>>& installed) {
    std::set<std::string> written;
    for (const auto& c : plan.ordered) {
        for (const auto& file : listFiles(c.filesDir)) {
            if (loses(plan, c.source.modId, file) || !written.insert(itemKey(file)).second) continue;

            fs::path dest = workDir / file;
            std::error_code ec;
            fs::create_directories(dest.parent_path(), ec);
            if (!ec) fs::copy_file(c.filesDir / file, dest, fs::copy_options::overwrite_existing, ec);
            if (ec) {
                return Status::failure(ErrorKind::InvalidInput,
                                       c.source.modId + ": cannot copy " + file + ": " + ec.message());
            }
            installed[c.source.modId].push_back(file);
        }
    }
    return Status::success();
}

GenerationResult GenerationPipeline::run(const GenerationRequest& request, const CancellationToken& token) {
    GenerationResult result;
    auto fail = [&result](const Status& status) {
        result.success = false;
        result.kind = status.kind();
        result.message = status.message();
        Console::error("Generation failed [", errorKindName(status.kind()), "]: ", status.message());
        return result;
    };
    auto cancelled = [&]() { return Status::failure(ErrorKind::Cancelled, "generation cancelled"); };

    Status valid = validateRequest(request);
    if (!valid) return fail(valid);

    std::error_code ec;
    for (const auto& tool : m_options.requiredTools) {
        if (tool.empty() || !fs::exists(tool, ec)) {
            return fail(Status::failure(ErrorKind::ToolMissing,
                                        "required tool not found: " + (tool.empty() ? std::string("(not configured)") : tool)));
        }
    }

    stage("conflicts");
    Plan plan;
    Status built = buildPlan(request, plan);
    result.outcomes = plan.outcomes;
    if (!built) return fail(built);
    for (const auto& conflict : plan.conflicts) {
        if (!conflict.isResolved()) result.pendingConflicts.push_back(conflict);
    }
    if (!result.pendingConflicts.empty()) {
        return fail(Status::failure(ErrorKind::ConflictUnresolved,
                                    std::to_string(result.pendingConflicts.size()) +
                                        " conflict(s) need a decision; installation left unchanged"));
    }
    if (token.isCancelled()) return fail(cancelled());

    auto tempRoot = makeTempRoot("pakforge-run");
    if (!tempRoot) return fail(tempRoot.status());
    ScratchDir scratch{tempRoot.value()};

    std::set<std::string> categories;
    for (const auto& c : plan.ordered) categories.insert(categoryOf(c));

    stage("base");
    fs::path workDir;
    if (request.mode == GenerationMode::AddToCurrent) {
        Console::log("Mode: add to the installed archive");
        auto current = prepareCurrent(request.targetDir, scratch.path, categories, token);
        if (!current) return fail(current.status());
        workDir = current.value();
    } else {
        auto base = prepareBase(scratch.path, token);
        if (!base) return fail(base.status());

        workDir = scratch.path / "work";
        fs::copy(base.value(), workDir, fs::copy_options::recursive, ec);
        if (ec) {
            return fail(Status::failure(ErrorKind::InvalidInput, "cannot stage base copy: " + ec.message()));
        }
    }
    if (token.isCancelled()) return fail(cancelled());

    stage("patch");
    std::vector<std::string> patchedBy;
    Status patched = patchConfig(plan, workDir, request.appendMissing, patchedBy);
    if (!patched) return fail(patched);

    stage("overlay");
    std::map<std::string, std::vector<std::string>> installed;
    Status overlaid = overlayFiles(plan, workDir, installed);
    if (!overlaid) return fail(overlaid);
    if (token.isCancelled()) return fail(cancelled());

    stage("recompile");
    auto archive = m_recompiler.recompile(workDir, scratch.path / "build", token);
    if (!archive) return fail(archive.status());

    stage("replace");
    auto live = m_replacer.replace(request.targetDir, archive.value(), token);
    if (!live) return fail(live.status());

    stage("log");
    const fs::path logPath = extractionLogPath(request.targetDir, m_options.modDirName);
    ExtractionLog log;
    log.mode = generationModeName(request.mode);
    if (request.mode == GenerationMode::AddToCurrent) {
        // Categories left alone this run keep their previous record
        auto previous = loadExtractionLog(logPath);
        if (previous) {
            for (const auto& entry : previous->entries) {
                if (!categories.count(entry.category)) log.addFiles(entry.category, entry.entryId, entry.files);
            }
            for (const auto& [category, choice] : previous->selections) {
                if (!categories.count(category)) log.selections[category] = choice;
            }
        }
    }
    for (const auto& c : plan.ordered) {
        std::string category = categoryOf(c);
        std::vector<std::string> files = installed[c.source.modId];
        if (std::find(patchedBy.begin(), patchedBy.end(), c.source.modId) != patchedBy.end()) {
            files.push_back(m_extractor.options().markerFile);
        }
        if (files.empty()) continue;
        log.selections[category] = c.source.modId;
        log.addFiles(category, c.source.modId, files);
    }
    Status saved = saveExtractionLog(logPath, log);
    if (!saved) Console::warn("Could not write extraction log: ", saved.message());

    result.success = true;
    result.archivePath = live.value();
    result.message = "installed " + live->string();
    Console::log("Generation complete: ", live->string());
    return result;
}

} // namespace PakForge
