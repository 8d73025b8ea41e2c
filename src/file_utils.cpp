#include "file_utils.hpp"
#include "console.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <climits>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace PakForge {

std::string readFile(const std::string& path) {
    std::ifstream t(path, std::ios::binary);
    if (!t.is_open())
        return "";
    std::stringstream buffer;
    buffer << t.rdbuf();
    return buffer.str();
}

Status writeFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Status::failure(ErrorKind::InvalidInput, "Cannot open for writing: " + path.string());
    }
    out << content;
    out.close();
    if (!out) {
        return Status::failure(ErrorKind::InvalidInput, "Write failed: " + path.string());
    }
    return Status::success();
}

fs::path getExecutableDir() {
    static fs::path dir;
    if (!dir.empty()) return dir;

    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len != -1) {
        buf[len] = '\0';
        dir = fs::path(buf).parent_path();
        return dir;
    }
    dir = fs::current_path();
    return dir;
}

fs::path getTempDir() {
    const char* temp = std::getenv("TMPDIR");
    if (temp && *temp) return fs::path(temp);
    return fs::path("/tmp");
}

Result<fs::path> makeTempRoot(const std::string& prefix) {
    static std::atomic<unsigned> counter{0};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    std::error_code ec;
    fs::path root;
    do {
        std::ostringstream name;
        name << prefix << "_" << getpid() << "_" << stamp << "_" << counter++;
        root = getTempDir() / name.str();
    } while (fs::exists(root, ec));
    if (!fs::create_directories(root, ec) || ec) {
        return Result<fs::path>::failure(ErrorKind::InvalidInput,
                                         "Cannot create temp directory " + root.string() +
                                             (ec ? ": " + ec.message() : std::string()));
    }
    return Result<fs::path>::success(root);
}

void removeTreeQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        Console::warn("Could not clean up ", path.string(), ": ", ec.message());
    }
}

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r");
    if (std::string::npos == first)
        return "";
    size_t last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, (last - first + 1));
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool icontains(const std::string& haystack, const std::string& needle) {
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

std::string encodeUrlSpaces(const std::string& url) {
    std::string result;
    result.reserve(url.size() + 10);

    size_t queryPos = url.find('?');
    std::string path = (queryPos != std::string::npos) ? url.substr(0, queryPos) : url;
    std::string query = (queryPos != std::string::npos) ? url.substr(queryPos) : "";

    for (char c : path) {
        if (c == ' ') {
            result += "%20";
        } else {
            result += c;
        }
    }
    result += query;
    return result;
}

std::string joinUrl(const std::string& base, const std::string& path) {
    std::string left = base;
    while (!left.empty() && left.back() == '/') left.pop_back();
    size_t start = path.find_first_not_of('/');
    std::string right = (start == std::string::npos) ? "" : path.substr(start);
    return encodeUrlSpaces(left + "/" + right);
}

std::string utcTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

Status waitForFileReady(const fs::path& path, int maxAttempts,
                        std::chrono::milliseconds interval,
                        const CancellationToken& token) {
    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        if (token.isCancelled()) {
            return Status::failure(ErrorKind::Cancelled, "Cancelled while waiting for " + path.string());
        }

        int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd >= 0) {
            bool locked = ::flock(fd, LOCK_EX | LOCK_NB) == 0;
            if (locked) ::flock(fd, LOCK_UN);
            ::close(fd);
            if (locked) {
                return Status::success();
            }
        }

        if (attempt < maxAttempts && !sleepFor(interval, token)) {
            return Status::failure(ErrorKind::Cancelled, "Cancelled while waiting for " + path.string());
        }
    }
    return Status::failure(ErrorKind::ArtifactNotFound,
                           path.string() + " did not become readable after " +
                               std::to_string(maxAttempts) + " attempts");
}

} // namespace PakForge
