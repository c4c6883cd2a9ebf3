#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "provider.hpp"
#include "shell.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

constexpr std::string_view DEPVIEW_VERSION = "1.0.0";

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.commands") << std::endl;
    std::cerr << get_string("info.depends_desc") << std::endl;
    std::cerr << get_string("info.rdepends_desc") << std::endl;
    std::cerr << get_string("info.cycles_desc") << std::endl;
    std::cerr << get_string("info.debug_info_desc") << std::endl;
}

std::vector<std::string> require_packages(const cxxopts::ParseResult& result, const cxxopts::Options& options) {
    std::vector<std::string> packages;
    if (result.count("packages")) {
        packages = result["packages"].as<std::vector<std::string>>();
    }
    if (packages.empty()) {
        print_usage(options);
        throw DepviewException(get_string("error.invalid_arg_count"));
    }
    return packages;
}

// Command line flags override the settings file.
void apply_overrides(Settings& settings, const cxxopts::ParseResult& result) {
    if (result.count("provider")) apply_setting(settings, "provider", result["provider"].as<std::string>());
    if (result.count("timeout")) apply_setting(settings, "timeout", result["timeout"].as<std::string>());
    if (result.count("breadth")) apply_setting(settings, "breadth_limit", result["breadth"].as<std::string>());
    if (result.count("max-depth")) apply_setting(settings, "max_depth", result["max-depth"].as<std::string>());
    if (result.count("limit")) apply_setting(settings, "cycle_display_limit", result["limit"].as<std::string>());
    if (result["exhaustive"].as<bool>()) settings.exhaustive = true;
    if (result["dedup"].as<bool>()) settings.deduplicate = true;
    if (result["no-lookahead"].as<bool>()) settings.lookahead = false;
    if (result["no-welcome"].as<bool>()) settings.show_welcome = false;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("help.help"))
            ("c,config", get_string("help.config"), cxxopts::value<std::string>())
            ("provider", get_string("help.provider"), cxxopts::value<std::string>())
            ("t,timeout", get_string("help.timeout"), cxxopts::value<std::string>())
            ("b,breadth", get_string("help.breadth"), cxxopts::value<std::string>())
            ("exhaustive", get_string("help.exhaustive"), cxxopts::value<bool>()->default_value("false"))
            ("max-depth", get_string("help.max_depth"), cxxopts::value<std::string>())
            ("dedup", get_string("help.dedup"), cxxopts::value<bool>()->default_value("false"))
            ("no-lookahead", get_string("help.no_lookahead"), cxxopts::value<bool>()->default_value("false"))
            ("limit", get_string("help.limit"), cxxopts::value<std::string>())
            ("no-welcome", get_string("help.no_welcome"), cxxopts::value<bool>()->default_value("false"))
            ("v,verbose", get_string("help.verbose"), cxxopts::value<bool>()->default_value("false"))
            ("command", "", cxxopts::value<std::string>())
            ("packages", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command", "packages"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        set_verbose_mode(result["verbose"].as<bool>());

        if (!result.count("command")) {
            print_usage(options);
            return 1;
        }

        const std::filesystem::path config_path = result.count("config")
            ? std::filesystem::path(result["config"].as<std::string>()) : CONFIG_FILE;
        Settings settings = load_settings(config_path);
        apply_overrides(settings, result);

        AptCacheProvider provider(settings.provider_command, settings.timeout);
        const std::string& command = result["command"].as<std::string>();

        std::optional<QueryKind> kind;
        if (command == "depends") {
            kind = QueryKind::DEPENDENCIES;
        } else if (command == "rdepends") {
            kind = QueryKind::REVERSE_DEPENDENCIES;
        } else if (command == "cycles") {
            kind = QueryKind::CYCLES;
        } else if (command == "debug-info") {
            Shell shell(settings, load_session_state(), provider, std::cout);
            shell.print_debug_info(DEPVIEW_VERSION);
            return 0;
        } else {
            print_usage(options);
            return 1;
        }

        const auto packages = require_packages(result, options);
        Shell shell(std::move(settings), load_session_state(), provider, std::cout);
        shell.show_welcome_if_needed();
        if (shell.run(*kind, packages) > 0) {
            return 2;
        }

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const DepviewException& e) {
        log_error(string_format("error.depview_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
