#include "utils.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>

namespace fs = std::filesystem;

namespace {
    std::atomic<bool> verbose_mode{false};
    std::mutex log_mutex;

    // Diagnostics only; rendered results are written by the shell to stdout.
    void emit(std::string_view color, const std::string& prefix, std::string_view msg) {
        static const bool colored = isatty(STDERR_FILENO);
        std::lock_guard<std::mutex> lock(log_mutex);
        std::ostream& stream = std::cerr;
        if (colored) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << '\n';
        } else {
            stream << prefix << msg << '\n';
        }
        stream.flush();
    }

    std::string labelled(const char* key) {
        return get_string(key) + " ";
    }
}

void log_warning(std::string_view msg) {
    emit(COLOR_YELLOW, labelled("warning.prefix"), msg);
}

void log_error(std::string_view msg) {
    emit(COLOR_RED, labelled("error.prefix"), msg);
}

void log_debug(std::string_view msg) {
    if (!verbose_mode) return;
    emit(COLOR_BLUE, labelled("debug.prefix"), msg);
}

void set_verbose_mode(bool enable) {
    verbose_mode = enable;
}

std::string_view trim(std::string_view s) {
    constexpr std::string_view blanks = " \t\r\n";
    const auto first = s.find_first_not_of(blanks);
    if (first == std::string_view::npos) return {};
    return s.substr(first, s.find_last_not_of(blanks) - first + 1);
}

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string out;
    for (const auto& part : parts) {
        if (&part != &parts.front()) out += separator;
        out += part;
    }
    return out;
}

void ensure_dir_exists(const fs::path& path) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) return;
    if (fs::exists(path, ec)) {
        throw DepviewException(string_format("error.path_not_dir", path.string()));
    }
    fs::create_directories(path, ec);
    if (ec) {
        throw DepviewException(string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
    }
}

std::unordered_set<std::string> read_set_from_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw DepviewException(string_format("error.open_file_failed", path.string()));
    }
    std::unordered_set<std::string> entries;
    for (std::string line; std::getline(in, line);) {
        std::string_view entry = trim(line);
        if (!entry.empty()) entries.emplace(entry);
    }
    return entries;
}

// Written to a sibling file first so readers never see a partial set.
void write_set_to_file(const fs::path& path, const std::unordered_set<std::string>& data) {
    std::vector<std::string> sorted(data.begin(), data.end());
    std::sort(sorted.begin(), sorted.end());

    const fs::path staging = fs::path(path).concat(".tmp");
    {
        std::ofstream out(staging, std::ios::trunc);
        if (!out) {
            throw DepviewException(string_format("error.create_file_failed", staging.string()) + ": " + std::strerror(errno));
        }
        for (const auto& entry : sorted) out << entry << '\n';
        if (!out.flush()) {
            throw DepviewException(string_format("error.create_file_failed", staging.string()));
        }
    }

    std::error_code ec;
    fs::rename(staging, path, ec);
    if (ec) {
        throw DepviewException(string_format("error.create_file_failed", path.string()) + ": " + ec.message());
    }
}
