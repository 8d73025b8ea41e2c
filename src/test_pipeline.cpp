#include "pipeline.hpp"
#include "console.h"
#include "extraction_log.hpp"
#include "test_common.hpp"
#include <cstdlib>
#include <nlohmann/json.hpp>

using namespace PakForge;
using namespace PakForge::Test;

static const std::string kMirror = "http://mirror.test/pack";
static const std::string kMarker = "scripts/items/items_game.txt";

static const std::string kBase =
    "\"items_game\"\n"
    "{\n"
    "\t\"items\"\n"
    "\t{\n"
    "\t\t\"5001\"\n"
    "\t\t{\n"
    "\t\t\t\"name\"\t\t\"Base Rain\"\n"
    "\t\t}\n"
    "\t\t\"5002\"\n"
    "\t\t{\n"
    "\t\t\t\"name\"\t\t\"Base Snow\"\n"
    "\t\t}\n"
    "\t}\n"
    "}\n";

// What the installed archive holds after an earlier run
static const std::string kInstalled =
    "\"items_game\"\n"
    "{\n"
    "\t\"items\"\n"
    "\t{\n"
    "\t\t\"5001\"\n"
    "\t\t{\n"
    "\t\t\t\"name\"\t\t\"Installed Rain\"\n"
    "\t\t}\n"
    "\t\t\"5002\"\n"
    "\t\t{\n"
    "\t\t\t\"name\"\t\t\"Installed Snow\"\n"
    "\t\t}\n"
    "\t}\n"
    "}\n";

// A patch index carrying one replacement block
static std::string indexWith(const std::string& id, const std::string& name) {
    return "\"items_game\"\n{\n\t\"items\"\n\t{\n\t\t\"" + id + "\"\n\t\t{\n\t\t\t\"name\"\t\t\"" + name +
           "\"\n\t\t}\n\t}\n}\n";
}

// The same text as saved by a Windows editor: BOM, CRLF and curly quotes
static std::string windowsText(const std::string& text) {
    std::string out = "\xEF\xBB\xBF";
    for (char ch : text) {
        if (ch == '\n') {
            out += "\r\n";
        } else if (ch == '"') {
            out += "\xE2\x80\x9C";
        } else {
            out += ch;
        }
    }
    return out;
}

static ModContribution contribution(const std::string& id, int priority, const std::string& category,
                                    const std::vector<std::string>& entries = {},
                                    const std::string& patchText = "") {
    ModContribution c;
    c.source.modId = id;
    c.source.modName = id;
    c.source.category = category;
    c.source.priority = priority;
    c.patchText = patchText;
    for (const auto& entry : entries) c.entries.push_back({entry, ""});
    return c;
}

// Every regular file below dir keyed by its relative path
static std::map<std::string, std::string> snapshotTree(const fs::path& dir) {
    std::map<std::string, std::string> files;
    for (const auto& entry : fs::recursive_directory_iterator(dir)) {
        if (entry.is_regular_file()) {
            files[fs::relative(entry.path(), dir).generic_string()] = readFile(entry.path().string());
        }
    }
    return files;
}

// The pipeline wired to a fake mirror and fake external tools
class Harness {
public:
    Harness(const Scratch& scratch, const std::string& name, bool cachedBase)
        : root(scratch / name),
          target(root / "dota"),
          baseDir(root / "base"),
          ranker(std::vector<std::string>{kMirror}),
          runner([this](const CommandSpec& spec) { return handle(spec); }),
          fetcher(transport, ranker, fetcherOptions()),
          extractor(runner, extractorOptions()),
          recompiler(runner, recompilerOptions()),
          replacer(replacerOptions()),
          priorities(std::chrono::seconds(0)),
          pipeline(fetcher, extractor, recompiler, replacer, priorities, pipelineOptions()) {
        writeText(root / "tools/hlextract", "#!/bin/sh\n");
        writeText(root / "tools/vpk", "#!/bin/sh\n");
        writeText(root / "tools/libtier0.so", "elf");
        fs::create_directories(target / "game");
        if (cachedBase) {
            writeText(baseDir / kMarker, kBase);
            writeText(baseDir / "materials/base.vmat_c", "base material");
        }
        FakeResponse zip;
        zip.body = makeZipBytes(root / "fixture.zip");
        transport.respond(joinUrl(kMirror, "Assets/Original.zip"), zip);
    }

    GenerationRequest request(std::vector<ModContribution> contributions) const {
        GenerationRequest r;
        r.targetDir = target;
        r.contributions = std::move(contributions);
        return r;
    }

    fs::path live() const { return replacer.liveArchivePath(target); }

    fs::path root;
    fs::path target;
    fs::path baseDir;

    bool extractWritesMarker = true;
    int unzipCount = 0;
    int extractCount = 0;
    int packCount = 0;
    std::map<std::string, std::string> packed;   // tree handed to the packer
    std::vector<std::string> stages;

    FakeTransport transport;
    SourceRanker ranker;
    FakeRunner runner;
    ResilientFetcher fetcher;
    ArchiveExtractor extractor;
    ArchiveRecompiler recompiler;
    AtomicReplacer replacer;
    ModPriorityService priorities;
    GenerationPipeline pipeline;

private:
    CommandResult handle(const CommandSpec& spec) {
        if (spec.executable == "7z") {
            ++unzipCount;
            fs::path out = spec.args.at(2).substr(2);
            writeText(out / "Original" / "pak01_dir.vpk", "vpk");
            return FakeRunner::exited(0);
        }
        if (spec.executable == (root / "tools/hlextract").string()) {
            ++extractCount;
            fs::path dir = spec.args.at(3);
            if (fs::path(spec.args.at(1)) == live()) {
                writeText(dir / "root" / kMarker, kInstalled);
                writeText(dir / "root" / "particles" / "old_rain.vpcf_c", "old rain");
                writeText(dir / "root" / "materials" / "snow.vtex_c", "installed snow");
                return FakeRunner::exited(0);
            }
            writeText(dir / "root" / "materials" / "base.vmat_c", "base material");
            if (extractWritesMarker) writeText(dir / "root" / kMarker, kBase);
            return FakeRunner::exited(0);
        }
        ++packCount;
        packed = snapshotTree(spec.args.at(0));
        writeText(fs::path(spec.workingDir) / "pak01_dir.vpk", "packed run " + std::to_string(packCount));
        return FakeRunner::exited(0);
    }

    FetcherOptions fetcherOptions() const {
        FetcherOptions options;
        options.cacheRoot = root / "cache";
        options.stallTimeout = std::chrono::milliseconds(2000);
        options.stallWarning = std::chrono::milliseconds(1000);
        options.monitorInterval = std::chrono::milliseconds(20);
        options.initialBackoff = std::chrono::milliseconds(10);
        return options;
    }

    ExtractorOptions extractorOptions() const {
        ExtractorOptions options;
        options.toolPath = (root / "tools/hlextract").string();
        options.sevenZip = "7z";
        return options;
    }

    RecompilerOptions recompilerOptions() const {
        RecompilerOptions options;
        options.packerPath = (root / "tools/vpk").string();
        options.requiredLibraries = {"libtier0.so"};
        options.postProcessDelay = std::chrono::milliseconds(0);
        options.searchRetries = 3;
        options.searchInterval = std::chrono::milliseconds(20);
        options.readyAttempts = 3;
        options.readyInterval = std::chrono::milliseconds(20);
        return options;
    }

    static ReplacerOptions replacerOptions() {
        ReplacerOptions options;
        options.readyAttempts = 3;
        options.readyInterval = std::chrono::milliseconds(10);
        return options;
    }

    PipelineOptions pipelineOptions() {
        PipelineOptions options;
        options.baseDir = baseDir;
        options.requiredTools = {(root / "tools/vpk").string()};
        options.onStage = [this](const std::string& name) { stages.push_back(name); };
        return options;
    }
};

static bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

static void testGenerate(const Scratch& scratch) {
    Harness h(scratch, "generate", true);
    auto rain = contribution("rain", 10, "Effects", {"5001"}, indexWith("5001", "Rain Reworked"));
    rain.filesDir = h.root / "mods/rain";
    writeText(rain.filesDir / "particles/rain.vpcf_c", "rain particles");
    auto snow = contribution("snow", 20, "Terrain", {"5002"}, indexWith("5002", "Snow Reworked"));

    std::vector<std::string> lines;
    Console::setSink([&lines](Console::Level, const std::string& line) { lines.push_back(line); });
    auto result = h.pipeline.run(h.request({rain, snow}));
    Console::setSink(nullptr);
    check(result.success, "generation succeeds");
    check(std::any_of(lines.begin(), lines.end(),
                      [](const std::string& line) { return line.find("Generation complete") != std::string::npos; }),
          "progress lines reach the console sink");
    if (!result.success) {
        std::cout << "  " << result.message << std::endl;
        return;
    }
    check(result.archivePath == h.target / "game/_pakforge/pak01_dir.vpk", "archive installed under the target");
    check(readFile(result.archivePath.string()) == "packed run 1", "live archive is the packer output");

    const std::string config = h.packed[kMarker];
    check(contains(config, "Rain Reworked") && contains(config, "Snow Reworked"), "both blocks patched");
    check(!contains(config, "Base Rain") && !contains(config, "Base Snow"), "original blocks replaced");
    check(h.packed["particles/rain.vpcf_c"] == "rain particles", "loose files laid over the base");
    check(h.packed.count("materials/base.vmat_c") == 1, "base content packed alongside");

    check(readFile((h.baseDir / kMarker).string()) == kBase, "cached base left pristine");
    check(h.transport.totalRequests() == 0 && h.extractCount == 0, "cached base skips download and extraction");
    check(h.stages == std::vector<std::string>{"conflicts", "base", "patch", "overlay", "recompile", "replace", "log"},
          "stages run in order");

    auto log = loadExtractionLog(extractionLogPath(h.target));
    check(log.ok() && log->mode == "generate", "extraction log written");
    if (log.ok()) {
        auto effects = log->filesFor("Effects");
        check(effects.size() == 2 && effects[0] == "particles/rain.vpcf_c" && effects[1] == kMarker,
              "log lists installed files and the patched config");
        check(log->selections["Effects"] == "rain" && log->selections["Terrain"] == "snow", "selections recorded");
    }
}

static void testWindowsPatchText(const Scratch& scratch) {
    Harness h(scratch, "windows", true);
    auto rain = contribution("rain", 10, "Effects", {"5001"}, windowsText(indexWith("5001", "Rain Reworked")));
    auto result = h.pipeline.run(h.request({rain}));
    check(result.success, "patch index saved with BOM, CRLF and curly quotes is accepted");
    check(contains(h.packed[kMarker], "Rain Reworked") && !contains(h.packed[kMarker], "Base Rain"),
          "block from a Windows-edited index applied");
    check(h.packed[kMarker].find('\r') == std::string::npos, "patched config uses LF line endings");
}

static void testAddToCurrent(const Scratch& scratch) {
    Harness h(scratch, "add", true);
    writeText(h.live(), "installed archive");

    ExtractionLog previous;
    previous.mode = "generate";
    previous.selections["Effects"] = "rain-v1";
    previous.selections["Terrain"] = "snow";
    previous.addFiles("Effects", "rain-v1", {"particles/old_rain.vpcf_c", kMarker});
    previous.addFiles("Terrain", "snow", {"materials/snow.vtex_c"});
    check(saveExtractionLog(extractionLogPath(h.target), previous).ok(), "previous extraction log saved");

    auto rain = contribution("rain", 10, "Effects", {"5001"}, indexWith("5001", "Rain Reworked"));
    rain.filesDir = h.root / "mods/rain";
    writeText(rain.filesDir / "particles/rain.vpcf_c", "rain particles");
    GenerationRequest request = h.request({rain});
    request.mode = GenerationMode::AddToCurrent;

    auto result = h.pipeline.run(request);
    check(result.success, "adding to the installed archive succeeds");
    if (!result.success) {
        std::cout << "  " << result.message << std::endl;
        return;
    }
    const std::string config = h.packed[kMarker];
    check(contains(config, "Rain Reworked") && contains(config, "Installed Snow") && !contains(config, "Base Snow"),
          "patch applied on top of the installed config");
    check(h.packed.count("particles/old_rain.vpcf_c") == 0, "files of the replaced selection dropped");
    check(h.packed["materials/snow.vtex_c"] == "installed snow", "files of other categories kept");
    check(h.packed["particles/rain.vpcf_c"] == "rain particles", "new loose files laid over");
    check(h.extractCount == 1 && h.transport.totalRequests() == 0 && h.unzipCount == 0,
          "installed archive extracted instead of downloading the base");

    auto log = loadExtractionLog(extractionLogPath(h.target));
    check(log.ok() && log->mode == "add", "log records the add mode");
    if (log.ok()) {
        check(log->selections["Effects"] == "rain" && log->selections["Terrain"] == "snow",
              "untouched category keeps its selection");
        auto terrain = log->filesFor("Terrain");
        check(terrain.size() == 1 && terrain[0] == "materials/snow.vtex_c", "untouched category keeps its files");
        auto effects = log->filesFor("Effects");
        check(std::find(effects.begin(), effects.end(), "particles/old_rain.vpcf_c") == effects.end(),
              "replaced selection no longer logged");
    }

    Harness fresh(scratch, "add-none", true);
    GenerationRequest nothingInstalled = fresh.request({rain});
    nothingInstalled.mode = GenerationMode::AddToCurrent;
    auto missing = fresh.pipeline.run(nothingInstalled);
    check(!missing.success && missing.kind == ErrorKind::ArtifactNotFound && fresh.packCount == 0,
          "adding without an installed archive is ArtifactNotFound");

    Harness regenerate(scratch, "add-generate", true);
    writeText(regenerate.live(), "installed archive");
    auto rebuilt = regenerate.pipeline.run(regenerate.request({rain}));
    check(rebuilt.success && contains(regenerate.packed[kMarker], "Base Snow") &&
              !contains(regenerate.packed[kMarker], "Installed Snow") && regenerate.extractCount == 0,
          "generate mode starts from the pristine base");
}

static void testConsoleSinkReentry() {
    std::vector<std::string> lines;
    Console::setSink([&lines](Console::Level, const std::string& line) {
        lines.push_back(line);
        if (line.rfind("echo: ", 0) != 0) Console::log("echo: ", line);
    });
    Console::log("sink reentry");
    Console::setSink(nullptr);
    check(lines == std::vector<std::string>{"sink reentry", "echo: sink reentry"}, "a sink can log through the console");
}

static void testConflictGate(const Scratch& scratch) {
    Harness h(scratch, "gate", true);
    writeText(h.live(), "previous archive");

    auto a = contribution("a", 10, "Terrain");
    auto b = contribution("b", 20, "Terrain");
    a.filesDir = h.root / "mods/a";
    b.filesDir = h.root / "mods/b";
    for (int i = 0; i < 6; ++i) {
        std::string file = "materials/terrain/t" + std::to_string(i) + ".vtex_c";
        writeText(a.filesDir / file, "from a");
        writeText(b.filesDir / file, "from b");
    }
    GenerationRequest request = h.request({a, b});

    auto planned = h.pipeline.plan(request);
    check(!planned.success && planned.kind == ErrorKind::ConflictUnresolved, "plan reports the open conflict");
    check(planned.pendingConflicts.size() == 1 && planned.pendingConflicts[0].id == "file:a:b" &&
              planned.pendingConflicts[0].severity == ConflictSeverity::High,
          "six shared textures need a decision");

    auto blocked = h.pipeline.run(request);
    check(!blocked.success && blocked.kind == ErrorKind::ConflictUnresolved && blocked.pendingConflicts.size() == 1,
          "run refuses to proceed");
    check(h.runner.calls.empty() && h.transport.totalRequests() == 0, "nothing launched or downloaded");
    check(readFile(h.live().string()) == "previous archive", "installation left unchanged");

    request.decisions["file:a:b"] = "choose_b";
    auto decided = h.pipeline.run(request);
    check(decided.success, "decision unblocks the run");
    check(h.packed["materials/terrain/t0.vtex_c"] == "from b" && h.packed["materials/terrain/t5.vtex_c"] == "from b",
          "chosen mod's files packed");
    auto log = loadExtractionLog(extractionLogPath(h.target));
    check(log.ok() && log->selections["Terrain"] == "b" && log->filesFor("Terrain").size() == 6,
          "only the winner's files are logged");

    request.decisions["file:a:b"] = "no_such_option";
    auto bad = h.pipeline.run(request);
    check(!bad.success && bad.kind == ErrorKind::InvalidInput, "unknown option id rejected");

    request.decisions.clear();
    request.decisions["file:x:y"] = "choose_x";
    auto stray = h.pipeline.plan(request);
    check(stray.kind == ErrorKind::ConflictUnresolved, "decision for an unknown conflict is ignored");
}

static void testCriticalSettings(const Scratch& scratch) {
    Harness h(scratch, "critical", true);
    auto a = contribution("a", 10, "Interface");
    a.source.settings["fps_max"] = "120";
    auto b = contribution("b", 20, "Interface");
    b.source.settings["fps_max"] = "240";
    GenerationRequest request = h.request({a, b});

    auto planned = h.pipeline.plan(request);
    check(planned.kind == ErrorKind::ConflictUnresolved && planned.pendingConflicts.size() == 1 &&
              planned.pendingConflicts[0].severity == ConflictSeverity::Critical,
          "incompatible settings block generation");

    request.decisions["settings:a:b"] = "priority";
    auto automatic = h.pipeline.plan(request);
    check(automatic.kind == ErrorKind::InvalidInput, "critical conflicts offer no automatic option");

    request.decisions["settings:a:b"] = "choose_b";
    auto chosen = h.pipeline.plan(request);
    check(chosen.success && chosen.outcomes.size() == 1 && chosen.outcomes[0].winningSource &&
              chosen.outcomes[0].winningSource->modId == "b",
          "explicit choice resolves the critical conflict");
}

static void testSharedBlocks(const Scratch& scratch) {
    Harness h(scratch, "shared", true);
    auto a = contribution("a", 10, "Effects", {"5001"}, indexWith("5001", "Same Rain"));
    auto b = contribution("b", 20, "Effects", {"5001"}, indexWith("5001", "Same Rain"));

    GenerationRequest request = h.request({a, b});
    request.decisions["keys:a:b"] = "merge";
    auto merged = h.pipeline.plan(request);
    check(merged.success && merged.outcomes.size() == 1 &&
              merged.outcomes[0].usedStrategy == ResolutionStrategy::Merge && !merged.outcomes[0].winningSource,
          "identical blocks merge without a winner");
    auto run = h.pipeline.run(request);
    check(run.success && contains(h.packed[kMarker], "Same Rain"), "merged block applied once");

    b.patchText = indexWith("5001", "Other Rain");
    request = h.request({a, b});
    request.decisions["keys:a:b"] = "merge";
    auto fallback = h.pipeline.plan(request);
    check(fallback.success && fallback.outcomes.size() == 1 &&
              fallback.outcomes[0].usedStrategy == ResolutionStrategy::HigherPriority &&
              fallback.outcomes[0].winningSource->modId == "a",
          "differing blocks fall back to priority");

    // The persisted table overrides request priorities
    ModPriorityConfig config = ModPriorityConfig::createDefault();
    config.setPriority("b", 5);
    check(savePriorityConfig(priorityConfigPath(h.target), config).ok(), "priority table saved");
    request.decisions.clear();
    auto reordered = h.pipeline.run(request);
    check(reordered.success && contains(h.packed[kMarker], "Other Rain") && !contains(h.packed[kMarker], "Same Rain"),
          "persisted priority picks the winning block");

    config.autoResolveNonBreaking = false;
    check(savePriorityConfig(priorityConfigPath(h.target), config).ok(), "auto-resolve disabled");
    auto held = h.pipeline.plan(request);
    check(held.kind == ErrorKind::ConflictUnresolved, "medium conflict waits when auto-resolve is off");
}

static void testPatchFailures(const Scratch& scratch) {
    Harness h(scratch, "patch", true);
    writeText(h.live(), "previous archive");

    auto absentFromIndex = contribution("a", 10, "Effects", {"7777"}, indexWith("5001", "Rain"));
    auto result = h.pipeline.run(h.request({absentFromIndex}));
    check(!result.success && result.kind == ErrorKind::PatchNotApplied && contains(result.message, "7777"),
          "entry missing from the patch index is PatchNotApplied");

    auto absentFromBase = contribution("a", 10, "Effects", {"5999"}, indexWith("5999", "Brand New"));
    result = h.pipeline.run(h.request({absentFromBase}));
    check(!result.success && result.kind == ErrorKind::PatchNotApplied, "block missing from the base is PatchNotApplied");
    check(readFile(h.live().string()) == "previous archive" && h.packCount == 0, "failed patch never reaches the packer");

    GenerationRequest append = h.request({absentFromBase});
    append.appendMissing = true;
    result = h.pipeline.run(append);
    check(result.success && contains(h.packed[kMarker], "Brand New") && contains(h.packed[kMarker], "Base Rain"),
          "appendMissing adds the block");

    auto unreadable = contribution("a", 10, "Effects", {"5001"}, "\"5001\" { \"name\" \"open");
    result = h.pipeline.run(h.request({unreadable}));
    check(!result.success && result.kind == ErrorKind::PatchNotApplied, "malformed patch index rejected");
}

static void testDownloadedBase(const Scratch& scratch) {
    Harness h(scratch, "download", false);
    auto rain = contribution("rain", 10, "Effects", {"5001"}, indexWith("5001", "Rain Reworked"));

    h.extractWritesMarker = false;
    auto corrupt = h.pipeline.run(h.request({rain}));
    check(!corrupt.success && corrupt.kind == ErrorKind::CorruptArtifact, "base without the marker is corrupt");
    check(!fs::exists(h.fetcher.cachePath("Original.zip")), "corrupt download evicted from the cache");
    check(!h.extractor.hasMarker(h.baseDir), "no half-extracted base left behind");

    h.extractWritesMarker = true;
    auto fresh = h.pipeline.run(h.request({rain}));
    check(fresh.success, "base downloaded and extracted");
    check(h.transport.totalRequests() == 2 && h.unzipCount == 2 && h.extractCount == 2,
          "second attempt downloads again");
    check(h.extractor.hasMarker(h.baseDir), "extracted base cached");
    check(contains(h.packed[kMarker], "Rain Reworked"), "downloaded base patched");

    auto cached = h.pipeline.run(h.request({rain}));
    check(cached.success && h.transport.totalRequests() == 2 && h.extractCount == 2, "later runs reuse the base");
}

static void testRejectedRequests(const Scratch& scratch) {
    Harness h(scratch, "reject", true);
    auto a = contribution("a", 10, "Effects");

    GenerationRequest noTarget = h.request({a});
    noTarget.targetDir = h.root / "missing";
    check(h.pipeline.run(noTarget).kind == ErrorKind::InvalidInput, "missing installation rejected");
    check(h.pipeline.run(h.request({})).kind == ErrorKind::InvalidInput, "empty request rejected");
    check(h.pipeline.run(h.request({a, a})).kind == ErrorKind::InvalidInput, "duplicate mod ids rejected");

    auto noFiles = contribution("b", 10, "Effects");
    noFiles.filesDir = h.root / "mods/none";
    check(h.pipeline.run(h.request({noFiles})).kind == ErrorKind::InvalidInput, "missing files directory rejected");

    fs::remove(h.root / "tools/vpk");
    auto noTool = h.pipeline.run(h.request({a}));
    check(noTool.kind == ErrorKind::ToolMissing, "missing packer detected before any work");
    writeText(h.root / "tools/vpk", "#!/bin/sh\n");

    CancellationSource cancel;
    cancel.cancel();
    auto cancelled = h.pipeline.run(h.request({a}), cancel.token());
    check(cancelled.kind == ErrorKind::Cancelled && h.runner.calls.empty(), "cancelled run stops before the base");

    // Temp root pointing at a regular file
    const char* oldTmp = std::getenv("TMPDIR");
    const std::string savedTmp = oldTmp ? oldTmp : "";
    writeText(h.root / "not-a-dir", "file");
    setenv("TMPDIR", (h.root / "not-a-dir").c_str(), 1);
    auto noScratch = h.pipeline.run(h.request({a}));
    if (oldTmp) {
        setenv("TMPDIR", savedTmp.c_str(), 1);
    } else {
        unsetenv("TMPDIR");
    }
    check(!noScratch.success && noScratch.kind == ErrorKind::InvalidInput &&
              contains(noScratch.message, "Cannot create temp directory"),
          "unusable temp directory reported as an error");
    check(h.runner.calls.empty(), "nothing launched without a scratch directory");
}

static void testParseRequest(const Scratch& scratch) {
    fs::path dir = scratch / "request";
    writeText(dir / "rain_index.txt", indexWith("5001", "Rain"));
    fs::create_directories(dir / "rain_files");

    nlohmann::json doc;
    doc["target"] = (scratch.root / "dota").string();
    doc["appendMissing"] = true;
    doc["decisions"] = {{"file:a:b", "choose_b"}};
    nlohmann::json rain;
    rain["modId"] = "rain";
    rain["category"] = "Weather";
    rain["priority"] = 10;
    rain["appliedAt"] = 1700000000;
    rain["patchFile"] = "rain_index.txt";
    rain["entries"] = nlohmann::json::array({"5001", 5002, {{"id", "5003"}, {"ownerTag", "prefab"}}});
    rain["filesDir"] = "rain_files";
    rain["settings"] = {{"fps_max", 120}};
    doc["contributions"] = nlohmann::json::array({rain});

    auto parsed = parseGenerationRequest(doc.dump(), dir);
    check(parsed.ok(), "request parses");
    check(parsed.ok() && parsed->mode == GenerationMode::Generate, "mode defaults to generate");
    if (parsed.ok()) {
        const auto& c = parsed->contributions.at(0);
        check(parsed->appendMissing && parsed->decisions["file:a:b"] == "choose_b", "flags and decisions read");
        check(c.source.priority == 10 && c.source.appliedAt == 1700000000 && c.source.category == "Weather",
              "source metadata read");
        check(c.patchText == indexWith("5001", "Rain"), "patch file resolved against the request directory");
        check(c.entries.size() == 3 && c.entries[1].id == "5002" && c.entries[2].ownerTag == "prefab",
              "entries accept strings, numbers and objects");
        check(c.filesDir == dir / "rain_files", "files directory resolved against the request directory");
        check(c.source.settings.at("fps_max") == "120", "non-string settings kept as text");
    }

    doc["mode"] = "add";
    auto adding = parseGenerationRequest(doc.dump(), dir);
    check(adding.ok() && adding->mode == GenerationMode::AddToCurrent, "add mode read");
    doc["mode"] = "sideways";
    auto unknownMode = parseGenerationRequest(doc.dump(), dir);
    check(!unknownMode.ok() && unknownMode.kind() == ErrorKind::InvalidInput &&
              unknownMode.message().find("sideways") != std::string::npos,
          "unknown mode rejected");
    check(parseGenerationMode("ADD") == GenerationMode::AddToCurrent && !parseGenerationMode(""),
          "mode names compare case-insensitively");
    doc.erase("mode");

    doc["contributions"][0]["patchFile"] = "absent.txt";
    auto noPatch = parseGenerationRequest(doc.dump(), dir);
    check(!noPatch.ok() && noPatch.kind() == ErrorKind::InvalidInput, "missing patch file rejected");

    auto noTarget = parseGenerationRequest(R"({"contributions": []})", dir);
    check(!noTarget.ok() && noTarget.kind() == ErrorKind::InvalidInput, "request without target rejected");

    auto broken = parseGenerationRequest("{", dir);
    check(!broken.ok() && broken.kind() == ErrorKind::InvalidInput, "malformed request rejected");
}

int main() {
    std::cout << "Running pipeline tests..." << std::endl;
    Scratch scratch("pipeline");
    testConsoleSinkReentry();
    testGenerate(scratch);
    testWindowsPatchText(scratch);
    testAddToCurrent(scratch);
    testConflictGate(scratch);
    testCriticalSettings(scratch);
    testSharedBlocks(scratch);
    testPatchFailures(scratch);
    testDownloadedBase(scratch);
    testRejectedRequests(scratch);
    testParseRequest(scratch);
    return finish("test_pipeline");
}
