#include "broom/utils.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <pwd.h>
#include <unistd.h>

namespace Broom {

namespace {
    std::atomic<bool> verboseLogging{false};
}

std::mutex& outputMutex()
{
    static std::mutex mutex;
    return mutex;
}

void setVerbose(bool verbose)
{
    verboseLogging = verbose;
}

bool isVerbose()
{
    return verboseLogging;
}

/**
 * @brief $HOME first, then the passwd database.
 */
std::string homeDirectory()
{
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return home;
    }

    struct passwd* pw = getpwuid(geteuid());
    if (pw && pw->pw_dir) {
        return pw->pw_dir;
    }
    return "";
}

std::string expandHome(const std::string& path, const std::string& home)
{
    if (path == "~") {
        return home;
    }
    if (path.rfind("~/", 0) == 0) {
        return home + path.substr(1);
    }
    return path;
}

std::string trimmed(const std::string& s)
{
    const char* whitespace = " \t\n\r\f\v";
    size_t first = s.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(whitespace);
    return s.substr(first, last - first + 1);
}

std::string toLower(const std::string& s)
{
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string normalizeName(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (!std::isspace(c)) {
            out.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    return out;
}

std::string generateId()
{
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<std::uint64_t> dist;

    std::uint64_t hi = dist(gen);
    std::uint64_t lo = dist(gen);

    // Version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buffer[37];
    std::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return std::string(buffer);
}

std::string formatBytes(std::uint64_t bytes)
{
    static const std::array<const char*, 5> units = {"B", "KB", "MB", "GB", "TB"};

    if (bytes < 1000) {
        return std::to_string(bytes) + " B";
    }

    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1000.0 && unit + 1 < units.size()) {
        value /= 1000.0;
        ++unit;
    }

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1f %s", value, units[unit]);
    return std::string(buffer);
}

} // namespace Broom
