#pragma once
#include <fstream>
#include <functional>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace PakForge {

// Process-wide console logger. Every line is written under one mutex so that
// messages from the stall monitor and the pipeline thread never interleave.
class Console {
public:
    enum class Level { Debug, Info, Warn, Error };

    using Sink = std::function<void(Level, const std::string&)>;

    static std::mutex& getMutex() {
        static std::mutex mutex_;
        return mutex_;
    }

    static void setVerbose(bool verbose) {
        std::lock_guard<std::mutex> lock(getMutex());
        verboseFlag() = verbose;
    }

    static bool isVerbose() {
        std::lock_guard<std::mutex> lock(getMutex());
        return verboseFlag();
    }

    // Mirror every line into a file (appending). Empty path closes the mirror.
    static bool setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(getMutex());
        auto& file = logFile();
        if (file.is_open()) file.close();
        if (path.empty()) return true;
        file.open(path, std::ios::app);
        return file.is_open();
    }

    // Forward every line to an embedding UI as well
    static void setSink(Sink sink) {
        std::lock_guard<std::mutex> lock(getMutex());
        sinkRef() = std::move(sink);
    }

    template<typename T, typename... Args>
    static void log(const T& first, const Args&... args) {
        write(Level::Info, format(first, args...));
    }

    template<typename T, typename... Args>
    static void warn(const T& first, const Args&... args) {
        write(Level::Warn, "[WARN] " + format(first, args...));
    }

    template<typename T, typename... Args>
    static void error(const T& first, const Args&... args) {
        write(Level::Error, format(first, args...));
    }

    template<typename T, typename... Args>
    static void debug(const T& first, const Args&... args) {
        if (!isVerbose()) return;
        write(Level::Debug, "[DEBUG] " + format(first, args...));
    }

private:
    static bool& verboseFlag() {
        static bool verbose_ = false;
        return verbose_;
    }

    static std::ofstream& logFile() {
        static std::ofstream file_;
        return file_;
    }

    static Sink& sinkRef() {
        static Sink sink_;
        return sink_;
    }

    template<typename T, typename... Args>
    static std::string format(const T& first, const Args&... args) {
        std::ostringstream out;
        out << first;
        ((out << args), ...);
        return out.str();
    }

    static void write(Level level, const std::string& line) {
        Sink sink;
        {
            std::lock_guard<std::mutex> lock(getMutex());
            if (level == Level::Warn || level == Level::Error) {
                std::cerr << line << std::endl;
            } else {
                std::cout << line << std::endl;
            }
            if (logFile().is_open()) {
                logFile() << line << '\n';
                logFile().flush();
            }
            sink = sinkRef();
        }
        // Unlocked; a sink may log through Console
        if (sink) sink(level, line);
    }
};

} // namespace PakForge
