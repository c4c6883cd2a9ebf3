#pragma once

#include "cycle_detector.hpp"
#include "graph_builder.hpp"

#include <ostream>
#include <string>

inline constexpr size_t DEFAULT_CYCLE_DISPLAY_LIMIT = 20;

std::string format_cycle(const Cycle& cycle);

void render_view(const DependencyView& view, std::ostream& out);
// Shows at most display_limit cycles; 0 shows all of them.
void render_cycles(const CycleReport& report, std::ostream& out, size_t display_limit = DEFAULT_CYCLE_DISPLAY_LIMIT);

std::string status_line(const DependencyView& view);
std::string status_line(const CycleReport& report);
