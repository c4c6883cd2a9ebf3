#include <gtest/gtest.h>
#include "../src/render.hpp"
#include "test_support.hpp"

#include <sstream>

class RenderTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_test_localization();
    }

    static DependencyView make_view(ViewKind kind, const std::string& root) {
        DependencyView view;
        view.kind = kind;
        view.root = root;
        return view;
    }
};

TEST_F(RenderTest, CycleArrowFormat) {
    EXPECT_EQ(format_cycle({"a", "b", "a"}), "a → b → a");
    EXPECT_EQ(format_cycle({"x", "x"}), "x → x");
}

TEST_F(RenderTest, DependencyView) {
    auto view = make_view(ViewKind::DEPENDENCIES, "bash");
    view.entries = {
        {.name = "libc6", .dependency_count = 2, .annotated = true},
        {.name = "base-files", .dependency_count = 0, .annotated = true},
        {.name = "debianutils", .lookup_status = QueryStatus::TIMED_OUT},
    };

    std::ostringstream out;
    render_view(view, out);
    EXPECT_EQ(out.str(),
              "Dependencies of bash\n"
              "  3 packages\n"
              "  - libc6 (2 dependencies)\n"
              "  - base-files\n"
              "  - debianutils (lookup failed: timed out)\n");
    EXPECT_EQ(status_line(view), "bash: 3 dependencies");
}

TEST_F(RenderTest, EmptyDependencyView) {
    auto view = make_view(ViewKind::DEPENDENCIES, "leaf");
    std::ostringstream out;
    render_view(view, out);
    EXPECT_EQ(out.str(), "Dependencies of leaf\n  0 packages\n");
}

TEST_F(RenderTest, ReverseView) {
    auto view = make_view(ViewKind::REVERSE_DEPENDENCIES, "libc6");
    view.entries = {{.name = "bash"}, {.name = "coreutils"}};

    std::ostringstream out;
    render_view(view, out);
    EXPECT_EQ(out.str(),
              "Reverse dependencies of libc6\n"
              "  2 packages\n"
              "  - bash\n"
              "  - coreutils\n");
    EXPECT_EQ(status_line(view), "libc6: 2 reverse dependencies");
}

TEST_F(RenderTest, FailedView) {
    auto view = make_view(ViewKind::DEPENDENCIES, "ghost");
    view.status = QueryStatus::PROVIDER_FAILED;
    view.detail = "apt-cache depends ghost exited with status 100";

    std::ostringstream out;
    render_view(view, out);
    EXPECT_EQ(out.str(),
              "Dependencies of ghost\n"
              "  Lookup failed: provider failed\n"
              "  apt-cache depends ghost exited with status 100\n");
    EXPECT_EQ(status_line(view), "ghost: lookup error (provider failed)");
}

TEST_F(RenderTest, NoCycles) {
    CycleReport report;
    report.root = "bash";

    std::ostringstream out;
    render_cycles(report, out);
    EXPECT_EQ(out.str(), "No circular dependencies found\n  bash\n");
    EXPECT_EQ(status_line(report), "0 circular dependencies found");
}

TEST_F(RenderTest, CyclesAreTruncatedToLimit) {
    CycleReport report;
    report.root = "a";
    report.cycles = {{"a", "b", "a"}, {"b", "b"}, {"c", "c"}};

    std::ostringstream out;
    render_cycles(report, out, 2);
    EXPECT_EQ(out.str(),
              "  a → b → a\n"
              "  b → b\n"
              "  ... and 1 more\n");
    EXPECT_EQ(status_line(report), "3 circular dependencies found");

    std::ostringstream all;
    render_cycles(report, all, 0);
    EXPECT_EQ(all.str(), "  a → b → a\n  b → b\n  c → c\n");
}

TEST_F(RenderTest, IncompleteSearchIsFlagged) {
    CycleReport report;
    report.root = "a";
    report.failed_lookups = {"x", "y"};

    std::ostringstream out;
    render_cycles(report, out);
    EXPECT_EQ(out.str(),
              "No circular dependencies found\n"
              "  a\n"
              "Lookup failed for 2 packages during the search: x, y\n");
}

TEST_F(RenderTest, FailedCycleCheck) {
    CycleReport report;
    report.root = "ghost";
    report.status = QueryStatus::PROVIDER_UNAVAILABLE;

    std::ostringstream out;
    render_cycles(report, out);
    EXPECT_EQ(out.str(), "Cannot check ghost for circular dependencies: provider unavailable\n");
    EXPECT_EQ(status_line(report), "ghost: cycle check failed (provider unavailable)");
}
