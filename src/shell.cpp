#include "shell.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "process.hpp"
#include "render.hpp"
#include "utils.hpp"

#include <cstdlib>

ViewOptions view_options_from(const Settings& settings) {
    return ViewOptions{
        .deduplicate = settings.deduplicate,
        .lookahead = settings.lookahead
    };
}

CycleSearchOptions cycle_options_from(const Settings& settings) {
    return CycleSearchOptions{
        .breadth_limit = settings.breadth_limit,
        .mode = settings.exhaustive ? CycleSearchMode::EXHAUSTIVE : CycleSearchMode::MEMOIZED,
        .max_depth = settings.max_depth
    };
}

Shell::Shell(Settings settings, SessionState session, MetadataProvider& provider, std::ostream& out)
    : settings_(std::move(settings)), session_(session), provider_(provider), out_(out) {}

void Shell::show_welcome_if_needed() {
    if (!settings_.show_welcome || session_.welcome_shown) return;

    out_ << get_string("welcome.title") << "\n\n";
    out_ << get_string("welcome.body") << "\n";
    for (const char* key : {"welcome.feature_depends", "welcome.feature_cycles", "welcome.feature_rdepends"}) {
        out_ << "  ✓ " << get_string(key) << "\n";
    }
    out_ << std::endl;

    session_.welcome_shown = true;
    try {
        save_session_state(session_);
    } catch (const DepviewException& e) {
        log_warning(string_format("warning.state_save_failed", e.what()));
    }
}

size_t Shell::run(QueryKind kind, const std::vector<std::string>& packages) {
    QueryDispatcher dispatcher(provider_, view_options_from(settings_), cycle_options_from(settings_));

    size_t failures = 0;
    for (const auto& pkg : packages) {
        try {
            dispatcher.submit(kind, pkg);
        } catch (const DepviewException& e) {
            log_warning(e.what());
        }
    }

    bool first = true;
    while (dispatcher.in_flight() > 0) {
        QueryOutcome outcome = dispatcher.wait_next();
        if (!first) out_ << "\n";
        first = false;
        if (!render(outcome)) ++failures;
    }
    out_.flush();
    return failures;
}

bool Shell::render(const QueryOutcome& outcome) {
    if (outcome.failed()) {
        log_error(string_format("error.query_failed", outcome.request.package, outcome.error));
        return false;
    }

    if (const auto* view = std::get_if<DependencyView>(&outcome.result)) {
        render_view(*view, out_);
        out_ << status_line(*view) << "\n";
        return view->ok();
    }
    if (const auto* report = std::get_if<CycleReport>(&outcome.result)) {
        render_cycles(*report, out_, settings_.cycle_display_limit);
        out_ << status_line(*report) << "\n";
        return report->ok();
    }
    return false;
}

void Shell::print_debug_info(std::string_view version) {
    const char* lang = std::getenv("LANG");
    out_ << string_format("debug_info.version", version) << "\n";
    out_ << string_format("debug_info.provider", settings_.provider_command) << "\n";
    out_ << string_format("debug_info.timeout", settings_.timeout.count()) << "\n";
    out_ << string_format("debug_info.breadth", settings_.breadth_limit) << "\n";
    out_ << string_format("debug_info.mode", settings_.exhaustive ? "exhaustive" : "memoized") << "\n";
    out_ << string_format("debug_info.config_file", CONFIG_FILE.string()) << "\n";
    out_ << string_format("debug_info.state_file", STATE_FILE.string()) << "\n";
    out_ << string_format("debug_info.l10n_dir", L10N_DIR.string()) << "\n";
    out_ << string_format("debug_info.lang", lang ? lang : "") << "\n";

    CommandResult probe = run_command({settings_.provider_command, "--version"}, settings_.timeout);
    if (probe.succeeded()) {
        std::string_view first_line = probe.output;
        first_line = trim(first_line.substr(0, first_line.find('\n')));
        out_ << string_format("debug_info.provider_version", std::string(first_line)) << "\n";
    } else {
        out_ << string_format("debug_info.provider_unavailable", probe.error.empty() ? std::to_string(probe.exit_code) : probe.error) << "\n";
    }
    out_.flush();
}
