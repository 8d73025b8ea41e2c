#include "cancellation.hpp"
#include "console.h"
#include "downloader.hpp"
#include "errors.hpp"
#include "file_utils.hpp"
#include "http_client.hpp"
#include "mod_priority.hpp"
#include "pipeline.hpp"
#include "process_runner.hpp"
#include "settings.hpp"
#include "source_ranker.hpp"
#include "vpk_extractor.hpp"
#include "vpk_recompiler.hpp"
#include "vpk_replacer.hpp"
#include <csignal>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace PakForge;

static CancellationSource* g_interrupt = nullptr;

static void onInterrupt(int) {
  if (g_interrupt) g_interrupt->cancel();
}

void printUsage(const char *progName) {
  std::cout << "PakForge - builds and installs a patched content archive" << std::endl;
  std::cout << std::endl;
  std::cout << "Usage:" << std::endl;
  std::cout << "  " << progName << " generate <request.json> [--mode generate|add] [--decide <conflict>=<option>]..." << std::endl;
  std::cout << "  " << progName << " plan <request.json> [--decide <conflict>=<option>]..." << std::endl;
  std::cout << "  " << progName << " priority list <target> [category]" << std::endl;
  std::cout << "  " << progName << " priority get <target> <modId>" << std::endl;
  std::cout << "  " << progName << " priority set <target> <modId> <1-999>" << std::endl;
  std::cout << "  " << progName << " sources [--probe]" << std::endl;
  std::cout << "  " << progName << " cache clear" << std::endl;
  std::cout << std::endl;
  std::cout << "Options:" << std::endl;
  std::cout << "  --config <file>     Settings file (default: pakforge.json)" << std::endl;
  std::cout << "  --log-file <file>   Mirror all output into a file" << std::endl;
  std::cout << "  -v, --verbose       Debug output" << std::endl;
  std::cout << std::endl;
}

static int reportError(const Error &error) {
  Console::error("Error [", errorKindName(error.kind), "]: ", error.message);
  Console::error("  ", errorKindHint(error.kind));
  return 1;
}

static int reportError(const Status &status) { return reportError(status.error()); }

static void printConflicts(const std::vector<ModConflict> &conflicts) {
  for (const auto &conflict : conflicts) {
    std::cout << "[" << severityName(conflict.severity) << "] " << conflict.id << ": "
              << conflict.description << std::endl;
    for (const auto &file : conflict.affectedFiles) {
      std::cout << "    " << file << std::endl;
    }
    std::cout << "  options:" << std::endl;
    for (const auto &option : conflict.availableResolutions) {
      std::cout << "    " << std::left << std::setw(24) << option.id << option.description << std::endl;
    }
  }
}

static void printOutcomes(const std::vector<ResolutionOutcome> &outcomes) {
  for (const auto &outcome : outcomes) {
    if (!outcome.success) continue;
    std::cout << "  " << outcome.conflictId << " -> "
              << (outcome.winningSource ? outcome.winningSource->modId : std::string("merged")) << " ("
              << strategyName(outcome.usedStrategy) << ")" << std::endl;
  }
}

// Shared wiring for every command that touches the network or the tools
struct Services {
  explicit Services(const Settings &settings)
      : ranker(settings.sources),
        fetcher(transport, ranker, fetcherOptions(settings)),
        extractor(runner, extractorOptions(settings)),
        recompiler(runner, recompilerOptions(settings)),
        measurements(settings.resolvedCacheRoot() / "sources.json") {
    ranker.loadMeasurements(measurements, std::chrono::hours(6));
  }

  static FetcherOptions fetcherOptions(const Settings &settings) {
    FetcherOptions options;
    options.cacheRoot = settings.resolvedCacheRoot() / "downloads";
    options.overallTimeout = std::chrono::seconds(settings.timeouts.overallSeconds);
    options.stallTimeout = std::chrono::seconds(settings.timeouts.stallSeconds);
    options.stallWarning = std::chrono::seconds(settings.timeouts.stallWarningSeconds);
    options.retriesPerSource = settings.retriesPerSource;
    return options;
  }

  static ExtractorOptions extractorOptions(const Settings &settings) {
    ExtractorOptions options;
    options.toolPath = settings.tools.extractor;
    options.sevenZip = settings.tools.sevenZip;
    options.timeout = std::chrono::minutes(settings.timeouts.extractMinutes);
    return options;
  }

  static RecompilerOptions recompilerOptions(const Settings &settings) {
    RecompilerOptions options;
    options.packerPath = settings.tools.packer;
    options.requiredLibraries = settings.tools.packerLibraries;
    options.timeout = std::chrono::minutes(settings.timeouts.packMinutes);
    options.tempRoot = getTempDir();
    return options;
  }

  void saveMeasurements() {
    Status saved = ranker.saveMeasurements(measurements);
    if (!saved) Console::warn("Could not save source measurements: ", saved.message());
  }

  CurlTransport transport;
  PosixCommandRunner runner;
  SourceRanker ranker;
  ResilientFetcher fetcher;
  ArchiveExtractor extractor;
  ArchiveRecompiler recompiler;
  AtomicReplacer replacer;
  ModPriorityService priorities;
  fs::path measurements;
};

static bool parseDecision(const std::string &arg, std::map<std::string, std::string> &decisions) {
  size_t eq = arg.rfind('=');
  if (eq == std::string::npos || eq == 0 || eq + 1 == arg.size()) return false;
  decisions[arg.substr(0, eq)] = arg.substr(eq + 1);
  return true;
}

static int runGenerate(const Settings &settings, const std::vector<std::string> &args, bool dryRun) {
  if (args.empty()) {
    Console::error("Missing request file");
    return 1;
  }

  fs::path requestPath = args[0];
  std::error_code ec;
  if (!fs::is_regular_file(requestPath, ec)) {
    return reportError(Status::failure(ErrorKind::InvalidInput, "request file not found: " + requestPath.string()));
  }
  auto request = parseGenerationRequest(readFile(requestPath.string()), fs::absolute(requestPath).parent_path());
  if (!request) return reportError(request.error());

  for (size_t i = 1; i < args.size(); ++i) {
    if (args[i] == "--decide" && i + 1 < args.size()) {
      if (!parseDecision(args[++i], request->decisions)) {
        Console::error("Invalid decision '", args[i], "', expected <conflict>=<option>");
        return 1;
      }
    } else if (args[i] == "--mode" && i + 1 < args.size()) {
      auto mode = parseGenerationMode(args[++i]);
      if (!mode) {
        Console::error("Unknown mode '", args[i], "', expected generate or add");
        return 1;
      }
      request->mode = *mode;
    } else {
      Console::error("Unknown argument: ", args[i]);
      return 1;
    }
  }

  Services services(settings);

  PipelineOptions options;
  options.assetPath = settings.assetPath;
  options.baseDir = settings.resolvedCacheRoot() / "base";
  options.requiredTools = {settings.tools.packer};
  options.fetchCallbacks.onProgress = [lastMb = uint64_t(0)](uint64_t received, uint64_t) mutable {
    uint64_t mb = received / (1024 * 1024);
    if (mb == lastMb) return;
    lastMb = mb;
    Console::debug("Downloaded ", mb, " MB");
  };
  options.fetchCallbacks.onStallWarning = [](const std::string &message) { Console::warn(message); };
  options.onStage = [](const std::string &stage) { Console::log("== ", stage, " =="); };

  GenerationPipeline pipeline(services.fetcher, services.extractor, services.recompiler, services.replacer,
                              services.priorities, options);

  GenerationResult result;
  if (dryRun) {
    result = pipeline.plan(request.value());
  } else {
    CancellationSource interrupt;
    g_interrupt = &interrupt;
    std::signal(SIGINT, onInterrupt);
    result = pipeline.run(request.value(), interrupt.token());
    std::signal(SIGINT, SIG_DFL);
    g_interrupt = nullptr;
    services.saveMeasurements();
  }

  if (!result.outcomes.empty()) {
    std::cout << "Resolved conflicts:" << std::endl;
    printOutcomes(result.outcomes);
  }
  if (!result.pendingConflicts.empty()) {
    std::cout << std::endl << "Conflicts needing a decision (use --decide <conflict>=<option>):" << std::endl;
    printConflicts(result.pendingConflicts);
  }
  if (!result.success) return reportError(Error{result.kind, result.message});

  Console::log(result.message);
  return 0;
}

static int runPriority(const std::vector<std::string> &args) {
  if (args.size() < 2) {
    Console::error("Usage: priority list|get|set <target> ...");
    return 1;
  }
  const std::string &action = args[0];
  fs::path target = args[1];
  ModPriorityService service;

  if (action == "list") {
    auto loaded = service.load(target);
    if (!loaded) return reportError(loaded.error());
    std::string category = args.size() > 2 ? args[2] : "";
    for (const auto &p : loaded->ordered(category)) {
      std::cout << std::setw(4) << p.priority << "  " << p.modId
                << (p.modName.empty() ? "" : " (" + p.modName + ")")
                << (p.category.empty() ? "" : " [" + p.category + "]") << (p.isLocked ? " locked" : "")
                << std::endl;
    }
    return 0;
  }
  if (action == "get" && args.size() >= 3) {
    auto loaded = service.load(target);
    if (!loaded) return reportError(loaded.error());
    std::cout << loaded->getPriority(args[2]) << std::endl;
    return 0;
  }
  if (action == "set" && args.size() >= 4) {
    int priority = 0;
    try {
      priority = std::stoi(args[3]);
    } catch (const std::exception &) {
      return reportError(Status::failure(ErrorKind::InvalidInput, "priority must be a number: " + args[3]));
    }
    Status set = service.setPriority(target, args[2], priority);
    if (!set) return reportError(set);
    Console::log("Priority of ", args[2], " set to ", service.getPriority(target, args[2]));
    return 0;
  }
  Console::error("Unknown priority command: ", action);
  return 1;
}

static int runSources(const Settings &settings, const std::vector<std::string> &args) {
  Services services(settings);
  if (!args.empty() && args[0] == "--probe") {
    Console::log("Probing ", settings.sources.size(), " source(s)...");
    services.fetcher.probeSources(settings.probeAsset);
    services.saveMeasurements();
  }
  int rank = 1;
  for (const auto &url : services.ranker.rank()) {
    for (const auto &source : services.ranker.snapshot()) {
      if (source.baseUrl != url) continue;
      std::cout << rank++ << ". " << url;
      if (!source.reachable) {
        std::cout << "  unreachable";
      } else if (source.speedKBps) {
        std::cout << "  " << std::fixed << std::setprecision(1) << *source.speedKBps << " KB/s, "
                  << source.latencyMs.value_or(0) << " ms";
      } else {
        std::cout << "  not measured";
      }
      std::cout << std::endl;
    }
  }
  return 0;
}

static int runCache(const Settings &settings, const std::vector<std::string> &args) {
  if (args.empty() || args[0] != "clear") {
    Console::error("Usage: cache clear");
    return 1;
  }
  fs::path root = settings.resolvedCacheRoot();
  removeTreeQuietly(root);
  Console::log("Cleared ", root.string());
  return 0;
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  // Global flags may appear anywhere
  std::string configPath;
  std::string logFile;
  bool verbose = false;
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      configPath = argv[++i];
    } else if (arg == "--log-file" && i + 1 < argc) {
      logFile = argv[++i];
    } else if (arg == "-v" || arg == "--verbose") {
      verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else {
      args.push_back(arg);
    }
  }
  if (args.empty()) {
    printUsage(argv[0]);
    return 1;
  }

  auto settings = loadSettings(configPath);
  if (!settings) return reportError(settings.error());

  Console::setVerbose(verbose || settings->verbose);
  std::string mirror = logFile.empty() ? settings->logFile : logFile;
  if (!mirror.empty() && !Console::setLogFile(mirror)) {
    Console::warn("Cannot open log file ", mirror);
  }

  std::string command = args[0];
  std::vector<std::string> rest(args.begin() + 1, args.end());

  if (command == "generate") return runGenerate(settings.value(), rest, false);
  if (command == "plan") return runGenerate(settings.value(), rest, true);
  if (command == "priority") return runPriority(rest);
  if (command == "sources") return runSources(settings.value(), rest);
  if (command == "cache") return runCache(settings.value(), rest);

  Console::error("Unknown command: ", command);
  printUsage(argv[0]);
  return 1;
}
