#include "vpk_recompiler.hpp"
#include "test_common.hpp"

using namespace PakForge;
using namespace PakForge::Test;

static RecompilerOptions makeOptions(const Scratch& scratch) {
    RecompilerOptions options;
    options.packerPath = (scratch.root / "bin/vpk").string();
    options.requiredLibraries = {"libtier0.so", "libvstdlib.so", "libfilesystem_stdio.so"};
    options.postProcessDelay = std::chrono::milliseconds(0);
    options.searchRetries = 3;
    options.searchInterval = std::chrono::milliseconds(20);
    options.readyAttempts = 3;
    options.readyInterval = std::chrono::milliseconds(20);
    return options;
}

int main() {
    std::cout << "Running recompiler tests..." << std::endl;
    Scratch scratch("recompiler");

    writeText(scratch / "bin/vpk", "#!/bin/sh\n");
    for (const char* lib : {"libtier0.so", "libvstdlib.so", "libfilesystem_stdio.so"}) {
        writeText(scratch.root / "bin" / lib, "elf");
    }
    fs::path source = scratch / "work/pak01_dir";
    writeText(source / "scripts/items/items_game.txt", "\"items_game\" { }");
    fs::path build = scratch / "build";

    {
        FakeRunner runner([](const CommandSpec& spec) {
            writeText(fs::path(spec.workingDir) / "pak01_dir.vpk", "packed archive");
            return FakeRunner::exited(0, "creating pak01_dir.vpk");
        });
        ArchiveRecompiler recompiler(runner, makeOptions(scratch));
        auto result = recompiler.recompile(source, build);
        check(result.ok(), "packing succeeds");
        check(result.ok() && result.value() == build / "pak01_dir.vpk", "new archive found in the build directory");
        check(runner.calls.size() == 1 && runner.calls[0].args.size() == 1 &&
                  runner.calls[0].args[0] == source.string() && runner.calls[0].workingDir == build.string(),
              "packer invoked on the source directory from the build directory");
    }

    {
        // Output written beside the source directory instead
        FakeRunner runner([source](const CommandSpec&) {
            writeText(source.parent_path() / "pak01_dir.vpk", "packed elsewhere");
            return FakeRunner::exited(0);
        });
        fs::remove_all(build);
        ArchiveRecompiler recompiler(runner, makeOptions(scratch));
        auto result = recompiler.recompile(source, build);
        check(result.ok() && result.value() == source.parent_path() / "pak01_dir.vpk",
              "output discovered in the parent of the source directory");
        fs::remove(source.parent_path() / "pak01_dir.vpk");
    }

    {
        // Archives laid over the content are as fresh as the output but are not it
        FakeRunner runner([source](const CommandSpec& spec) {
            writeText(fs::path(spec.workingDir) / "pak01_dir.vpk", "packed archive");
            writeText(source / "weather.vpk", "overlay content");
            writeText(source.parent_path() / "extra.vpk", "other content");
            auto later = fs::file_time_type::clock::now() + std::chrono::seconds(1);
            fs::last_write_time(source / "weather.vpk", later);
            fs::last_write_time(source.parent_path() / "extra.vpk", later);
            return FakeRunner::exited(0);
        });
        fs::remove_all(build);
        ArchiveRecompiler recompiler(runner, makeOptions(scratch));
        auto result = recompiler.recompile(source, build);
        check(result.ok() && result.value() == build / "pak01_dir.vpk", "only the packer's output name is accepted");
        fs::remove(source / "weather.vpk");
        fs::remove(source.parent_path() / "extra.vpk");

        check(ArchiveRecompiler::outputNames("/tmp/run/work/") == std::vector<std::string>{"pak01_dir.vpk", "work.vpk"},
              "output may also be named after the source directory");
        check(ArchiveRecompiler::outputNames(source) == std::vector<std::string>{"pak01_dir.vpk"},
              "a source directory named pak01_dir adds no second name");
    }

    {
        // A stale archive from an earlier run must not be picked up
        fs::remove_all(build);
        writeText(build / "pak01_dir.vpk", "stale");
        fs::last_write_time(build / "pak01_dir.vpk", fs::file_time_type::clock::now() - std::chrono::hours(1));
        FakeRunner runner;
        ArchiveRecompiler recompiler(runner, makeOptions(scratch));
        auto result = recompiler.recompile(source, build);
        check(!result.ok() && result.kind() == ErrorKind::ArtifactNotFound, "stale output ignored");
    }

    {
        FakeRunner runner([](const CommandSpec&) { return FakeRunner::exited(1, "bad input"); });
        ArchiveRecompiler recompiler(runner, makeOptions(scratch));
        auto result = recompiler.recompile(source, build);
        check(!result.ok() && result.kind() == ErrorKind::ToolFailed &&
                  result.message().find("code 1") != std::string::npos,
              "non-zero exit is ToolFailed");
    }

    {
        FakeRunner runner([](const CommandSpec&) { return FakeRunner::withStatus(CommandStatus::TimedOut); });
        ArchiveRecompiler recompiler(runner, makeOptions(scratch));
        auto result = recompiler.recompile(source, build);
        check(!result.ok() && result.kind() == ErrorKind::ToolFailed &&
                  result.message().find("timed out") != std::string::npos,
              "timeout is ToolFailed with a distinct message");
    }

    {
        FakeRunner runner;
        RecompilerOptions options = makeOptions(scratch);
        options.requiredLibraries.push_back("libmissing.so");
        ArchiveRecompiler recompiler(runner, options);
        auto result = recompiler.recompile(source, build);
        check(!result.ok() && result.kind() == ErrorKind::ToolMissing &&
                  result.message().find("libmissing.so") != std::string::npos,
              "missing packer library is ToolMissing");
        check(runner.calls.empty(), "packer not launched when a library is missing");

        options = makeOptions(scratch);
        options.packerPath = (scratch.root / "bin/absent").string();
        ArchiveRecompiler noPacker(runner, options);
        check(noPacker.recompile(source, build).kind() == ErrorKind::ToolMissing, "missing packer is ToolMissing");
    }

    {
        FakeRunner runner;
        ArchiveRecompiler recompiler(runner, makeOptions(scratch));
        fs::create_directories(scratch / "empty");
        auto empty = recompiler.recompile(scratch / "empty", build);
        check(!empty.ok() && empty.kind() == ErrorKind::InvalidInput, "empty source directory rejected");
        auto absent = recompiler.recompile(scratch / "absent", build);
        check(!absent.ok() && absent.kind() == ErrorKind::InvalidInput, "missing source directory rejected");
    }

    {
        FakeRunner runner;
        RecompilerOptions options = makeOptions(scratch);
        options.tempRoot = build;
        ArchiveRecompiler recompiler(runner, options);
        auto dirs = recompiler.candidateDirectories(source, build);
        check(dirs.size() == 3 && dirs[0] == build && dirs[1] == source && dirs[2] == source.parent_path(),
              "candidate directories are deduplicated and ordered");
    }

    return finish("test_recompiler");
}
