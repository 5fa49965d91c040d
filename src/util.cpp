#include "util.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <unistd.h>

namespace engram {

std::string iso8601_from_millis(uint64_t millis) {
    auto secs = static_cast<std::time_t>(millis / 1000);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03uZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<unsigned>(millis % 1000));
    return buf;
}

uint64_t epoch_millis() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::string generate_id() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t val = dist(gen);
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(val));
    return buf;
}

static bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Byte length of the sequence introduced by lead byte c (1 for invalid leads).
static size_t sequence_length(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;
}

size_t utf8_length(const std::string& s) {
    size_t count = 0;
    size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        size_t len = sequence_length(c);
        size_t j = i + 1;
        while (j < s.size() && j < i + len && is_continuation(static_cast<unsigned char>(s[j]))) {
            ++j;
        }
        i = j;
        ++count;
    }
    return count;
}

std::string truncate_utf8(const std::string& s, size_t max_chars) {
    if (max_chars == 0) return {};

    // Walk code points, remembering the byte offset where the cut lands.
    size_t count = 0;
    size_t i = 0;
    size_t last_space = std::string::npos; // byte offset of last whitespace
    size_t space_chars = 0;                // code points before that whitespace
    while (i < s.size() && count < max_chars) {
        auto c = static_cast<unsigned char>(s[i]);
        size_t len = sequence_length(c);
        size_t j = i + 1;
        while (j < s.size() && j < i + len && is_continuation(static_cast<unsigned char>(s[j]))) {
            ++j;
        }
        if (len == 1 && std::isspace(c)) {
            last_space = i;
            space_chars = count;
        }
        i = j;
        ++count;
    }
    if (i >= s.size()) return s;

    size_t cut = i;
    bool at_boundary = std::isspace(static_cast<unsigned char>(s[i])) != 0;
    if (!at_boundary && last_space != std::string::npos && space_chars >= max_chars / 2) {
        cut = last_space;
    }
    std::string out = s.substr(0, cut);
    while (!out.empty() && std::isspace(static_cast<unsigned char>(out.back()))) {
        out.pop_back();
    }
    return out;
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

bool atomic_write_file(const std::string& path, const std::string& content) {
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) return false;
    }

    std::string tmp = path + ".tmp." + std::to_string(getpid());
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) return false;
        out << content;
        if (!out.good()) {
            out.close();
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

} // namespace engram
