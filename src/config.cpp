#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

fs::path default_state_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return fs::path(xdg) / "depview";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / ".config" / "depview";
    }
    return fs::temp_directory_path() / "depview";
}

fs::path CONFIG_DIR = DEPVIEW_CONF_DIR;
fs::path L10N_DIR = DEPVIEW_L10N_DIR;
fs::path STATE_DIR = default_state_dir();

// Derived paths
fs::path CONFIG_FILE = fs::path(DEPVIEW_CONF_DIR) / "depview.conf";
fs::path STATE_FILE = STATE_DIR / "state";

void set_config_dir(const std::string& dir) {
    CONFIG_DIR = fs::path(dir).lexically_normal();
    CONFIG_FILE = CONFIG_DIR / "depview.conf";
}

void set_l10n_dir(const std::string& dir) {
    L10N_DIR = fs::path(dir).lexically_normal();
}

void set_state_dir(const std::string& dir) {
    STATE_DIR = fs::path(dir).lexically_normal();
    STATE_FILE = STATE_DIR / "state";
}

namespace {

size_t parse_count(const std::string& key, const std::string& value) {
    size_t result = 0;
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, result);
    if (ec != std::errc() || ptr != end) {
        throw DepviewException(string_format("error.invalid_setting_value", key, value));
    }
    return result;
}

bool parse_flag(const std::string& key, const std::string& value) {
    if (value == "true" || value == "yes" || value == "1") return true;
    if (value == "false" || value == "no" || value == "0") return false;
    throw DepviewException(string_format("error.invalid_setting_value", key, value));
}

} // anonymous namespace

void apply_setting(Settings& settings, const std::string& key, const std::string& value) {
    if (key == "provider") {
        if (value.empty()) throw DepviewException(string_format("error.invalid_setting_value", key, value));
        settings.provider_command = value;
    } else if (key == "timeout") {
        const size_t seconds = parse_count(key, value);
        if (seconds == 0) throw DepviewException(string_format("error.invalid_setting_value", key, value));
        settings.timeout = std::chrono::seconds(seconds);
    } else if (key == "breadth_limit") {
        settings.breadth_limit = parse_count(key, value);
        if (settings.breadth_limit == 0) throw DepviewException(string_format("error.invalid_setting_value", key, value));
    } else if (key == "max_depth") {
        settings.max_depth = parse_count(key, value);
    } else if (key == "exhaustive") {
        settings.exhaustive = parse_flag(key, value);
    } else if (key == "deduplicate") {
        settings.deduplicate = parse_flag(key, value);
    } else if (key == "lookahead") {
        settings.lookahead = parse_flag(key, value);
    } else if (key == "cycle_display_limit") {
        settings.cycle_display_limit = parse_count(key, value);
    } else if (key == "show_welcome") {
        settings.show_welcome = parse_flag(key, value);
    } else {
        log_warning(string_format("warning.unknown_setting", key));
    }
}

Settings load_settings(const fs::path& path) {
    Settings settings;
    if (!fs::exists(path)) {
        log_debug(string_format("debug.settings_missing", path.string()));
        return settings;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw DepviewException(string_format("error.open_file_failed", path.string()));
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        std::string_view sv = trim(line);
        if (sv.empty() || sv.front() == '#') continue;

        const auto pos = sv.find('=');
        if (pos == std::string_view::npos) {
            throw DepviewException(string_format("error.malformed_setting_line", path.string(), line_no));
        }
        const std::string key(trim(sv.substr(0, pos)));
        const std::string value(trim(sv.substr(pos + 1)));
        apply_setting(settings, key, value);
    }
    return settings;
}

SessionState load_session_state() {
    SessionState state;
    if (!fs::exists(STATE_FILE)) return state;
    const auto flags = read_set_from_file(STATE_FILE);
    state.welcome_shown = flags.contains("welcome_shown");
    return state;
}

void save_session_state(const SessionState& state) {
    ensure_dir_exists(STATE_DIR);
    std::unordered_set<std::string> flags;
    if (state.welcome_shown) flags.insert("welcome_shown");
    write_set_to_file(STATE_FILE, flags);
}
