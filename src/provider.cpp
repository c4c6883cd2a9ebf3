#include "provider.hpp"

#include "localization.hpp"
#include "process.hpp"
#include "utils.hpp"

#include <array>

namespace {

// Splits on '\n' and hands each line to fn, including a final unterminated one.
template <typename Fn>
void for_each_line(std::string_view text, Fn&& fn) {
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        fn(text.substr(start, end - start));
        start = end + 1;
    }
}

constexpr std::array<std::string_view, 2> DEPENDS_MARKERS = {"Depends:", "PreDepends:"};

} // anonymous namespace

std::string describe_status(QueryStatus status) {
    switch (status) {
        case QueryStatus::OK: return get_string("status.ok");
        case QueryStatus::PROVIDER_UNAVAILABLE: return get_string("status.provider_unavailable");
        case QueryStatus::PROVIDER_FAILED: return get_string("status.provider_failed");
        case QueryStatus::TIMED_OUT: return get_string("status.timed_out");
    }
    return get_string("status.provider_failed");
}

std::string normalize_package_name(std::string_view raw) {
    std::string_view name = trim(raw);
    if (!name.empty() && name.front() == '<') {
        while (!name.empty() && name.front() == '<') name.remove_prefix(1);
        while (!name.empty() && name.back() == '>') name.remove_suffix(1);
    }
    return std::string(trim(name));
}

std::vector<std::string> parse_depends_output(std::string_view output) {
    std::vector<std::string> deps;
    for_each_line(output, [&](std::string_view raw_line) {
        std::string_view line = trim(raw_line);
        for (auto marker : DEPENDS_MARKERS) {
            if (!line.starts_with(marker)) continue;

            std::string_view rest = trim(line.substr(marker.size()));
            const auto end = rest.find_first_of(" \t");
            std::string dep = normalize_package_name(rest.substr(0, end));
            if (dep.empty()) {
                log_debug(string_format("debug.parse_anomaly", std::string(line)));
            } else {
                deps.push_back(std::move(dep));
            }
            break;
        }
    });
    return deps;
}

std::vector<std::string> parse_rdepends_output(std::string_view output) {
    std::vector<std::string> rdeps;
    size_t line_no = 0;
    for_each_line(output, [&](std::string_view raw_line) {
        // First two lines are the package name and the "Reverse Depends:" header.
        if (line_no++ < 2) return;
        std::string_view line = trim(raw_line);
        if (line.empty() || line.front() == '|') return;
        rdeps.emplace_back(line);
    });
    return rdeps;
}

AptCacheProvider::AptCacheProvider(std::string executable, std::chrono::milliseconds timeout)
    : executable_(std::move(executable)), timeout_(timeout) {}

QueryResult AptCacheProvider::get_direct_dependencies(const std::string& pkg) {
    return query("depends", pkg, &parse_depends_output);
}

QueryResult AptCacheProvider::get_reverse_dependencies(const std::string& pkg) {
    return query("rdepends", pkg, &parse_rdepends_output);
}

QueryResult AptCacheProvider::query(const std::string& subcommand, const std::string& pkg,
                                    std::vector<std::string> (*parse)(std::string_view)) {
    log_debug(string_format("debug.provider_call", executable_, subcommand, pkg));
    CommandResult cmd = run_command({executable_, subcommand, pkg}, timeout_);

    QueryResult result;
    switch (cmd.status) {
        case CommandStatus::COMPLETED:
            if (cmd.exit_code != 0) {
                result.status = QueryStatus::PROVIDER_FAILED;
                result.detail = string_format("error.provider_exit_code", executable_, subcommand, pkg, cmd.exit_code);
            } else {
                result.packages = parse(cmd.output);
            }
            break;
        case CommandStatus::NOT_FOUND:
        case CommandStatus::SPAWN_FAILED:
            result.status = QueryStatus::PROVIDER_UNAVAILABLE;
            result.detail = cmd.error;
            break;
        case CommandStatus::TIMED_OUT:
            result.status = QueryStatus::TIMED_OUT;
            result.detail = cmd.error;
            break;
    }

    if (!result.ok()) {
        log_debug(result.detail);
    }
    return result;
}
