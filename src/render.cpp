#include "render.hpp"

#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>

std::string format_cycle(const Cycle& cycle) {
    return join(cycle, " → ");
}

void render_view(const DependencyView& view, std::ostream& out) {
    const char* title_key = (view.kind == ViewKind::DEPENDENCIES) ? "view.title_depends" : "view.title_rdepends";
    out << string_format(title_key, view.root) << "\n";

    if (!view.ok()) {
        out << "  " << string_format("view.lookup_failed", describe_status(view.status)) << "\n";
        if (!view.detail.empty()) out << "  " << view.detail << "\n";
        return;
    }

    out << "  " << string_format("view.package_count", view.total()) << "\n";
    for (const auto& entry : view.entries) {
        out << "  - " << entry.name;
        if (entry.lookup_status != QueryStatus::OK) {
            out << " (" << string_format("view.entry_lookup_failed", describe_status(entry.lookup_status)) << ")";
        } else if (entry.annotated && entry.dependency_count > 0) {
            out << " (" << string_format("view.entry_dependencies", entry.dependency_count) << ")";
        }
        out << "\n";
    }
}

void render_cycles(const CycleReport& report, std::ostream& out, size_t display_limit) {
    if (!report.ok()) {
        out << string_format("cycles.lookup_failed", report.root, describe_status(report.status)) << "\n";
        if (!report.detail.empty()) out << "  " << report.detail << "\n";
        return;
    }

    if (report.cycles.empty()) {
        out << get_string("cycles.none") << "\n";
        out << "  " << report.root << "\n";
    } else {
        const size_t shown = (display_limit == 0) ? report.cycles.size() : std::min(display_limit, report.cycles.size());
        for (size_t i = 0; i < shown; ++i) {
            out << "  " << format_cycle(report.cycles[i]) << "\n";
        }
        if (shown < report.cycles.size()) {
            out << "  " << string_format("cycles.more", report.cycles.size() - shown) << "\n";
        }
    }

    if (!report.failed_lookups.empty()) {
        out << string_format("cycles.incomplete", report.failed_lookups.size(), join(report.failed_lookups, ", ")) << "\n";
    }
}

std::string status_line(const DependencyView& view) {
    if (!view.ok()) {
        return string_format("status.view_failed", view.root, describe_status(view.status));
    }
    const char* key = (view.kind == ViewKind::DEPENDENCIES) ? "status.view_count" : "status.reverse_count";
    return string_format(key, view.root, view.total());
}

std::string status_line(const CycleReport& report) {
    if (!report.ok()) {
        return string_format("status.cycles_failed", report.root, describe_status(report.status));
    }
    return string_format("status.cycle_count", report.cycles.size());
}
