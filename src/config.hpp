#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <filesystem>

// Global variables for paths (initially set to defaults, but can be modified)
extern std::filesystem::path CONFIG_DIR;
extern std::filesystem::path L10N_DIR;
extern std::filesystem::path STATE_DIR;

// Derived paths
extern std::filesystem::path CONFIG_FILE;
extern std::filesystem::path STATE_FILE;

void set_config_dir(const std::string& dir);
void set_l10n_dir(const std::string& dir);
void set_state_dir(const std::string& dir);
std::filesystem::path default_state_dir();

// Runtime settings, loaded once at startup and handed to the shell.
struct Settings {
    std::string provider_command = "apt-cache";
    std::chrono::milliseconds timeout{std::chrono::seconds(10)};
    size_t breadth_limit = 10;
    size_t max_depth = 0;
    bool exhaustive = false;
    bool deduplicate = false;
    bool lookahead = true;
    size_t cycle_display_limit = 20;
    bool show_welcome = true;
};

// Reads key=value lines. A missing file yields the defaults.
// Throws DepviewException on malformed values.
Settings load_settings(const std::filesystem::path& path);
void apply_setting(Settings& settings, const std::string& key, const std::string& value);

struct SessionState {
    bool welcome_shown = false;
};

SessionState load_session_state();
void save_session_state(const SessionState& state);
