#pragma once

#include "exception.hpp"
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>
#include <filesystem>

// Color codes
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_BLUE = "\033[1;34m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions (thread-safe)
void log_warning(std::string_view msg);
void log_error(std::string_view msg);
void log_debug(std::string_view msg);

// Mode control
void set_verbose_mode(bool enable);

// String helpers
std::string_view trim(std::string_view s);
std::string join(const std::vector<std::string>& parts, std::string_view separator);

// Filesystem utilities
void ensure_dir_exists(const std::filesystem::path& path);
std::unordered_set<std::string> read_set_from_file(const std::filesystem::path& path);
void write_set_to_file(const std::filesystem::path& path, const std::unordered_set<std::string>& data);
