#pragma once
#include <string>
#include <cstdlib>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <chrono>
#include <ctime>
#include <iomanip>

namespace skilldeck {

namespace fs = std::filesystem;

inline std::string home_dir() {
    const char* h = std::getenv("HOME");
    return h ? std::string(h) : ".";
}

inline std::string expand_path(const std::string& p) {
    if (p == "~") return home_dir();
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        return home_dir() + p.substr(1);
    }
    return p;
}

inline std::string env_or(const char* name, const std::string& fallback) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : fallback;
}

// Binary read, content returned untouched. Empty string on any failure.
inline std::string read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) return "";
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

// Same as read_file() but reports why the file could not be read.
inline std::string read_file_checked(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw std::runtime_error("No such file: " + path);
    }
    if (fs::is_directory(path, ec)) {
        throw std::runtime_error("Is a directory: " + path);
    }
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) {
        throw std::runtime_error("Read failed: " + path);
    }
    return ss.str();
}

inline std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

inline std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

inline std::string format_local_time(const char* fmt) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), fmt, &tm);
    return buf;
}

// "2026-10-19 14:03:59"
inline std::string timestamp_str() {
    return format_local_time("%Y-%m-%d %H:%M:%S");
}

// date(1) style: "Mon Oct 19 14:03:59 CEST 2026"
inline std::string date_str() {
    return format_local_time("%a %b %e %H:%M:%S %Z %Y");
}

} // namespace skilldeck
