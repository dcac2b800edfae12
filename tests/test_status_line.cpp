// tests/test_status_line.cpp
#include <catch2/catch_test_macros.hpp>
#include "status_line.hpp"
#include <sstream>

using namespace skilldeck;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("Directory display is relative to the project", "[status]") {
    REQUIRE(directory_display("/work/proj/src/net", "/work/proj") == "src/net");
    REQUIRE(directory_display("/work/proj", "/work/proj") == "proj");
    REQUIRE(directory_display("/elsewhere/tmp", "/work/proj") == "tmp");
    REQUIRE(directory_display("", "/work/proj") == "proj");
    REQUIRE(directory_display("/work/other", "") == "other");
    REQUIRE(directory_display("", "") == "unknown");
}

TEST_CASE("Input is read from the host JSON", "[status]") {
    auto j = nlohmann::json::parse(R"({
        "model": {"display_name": "Opus"},
        "workspace": {"current_dir": "/w/p/src", "project_dir": "/w/p"},
        "cost": {"total_cost_usd": 0.07, "total_duration_ms": 45000,
                 "total_lines_added": 10, "total_lines_removed": 3}
    })");

    auto in = StatusInput::from_json(j);
    REQUIRE(in.model == "Opus");
    REQUIRE(in.current_dir == "/w/p/src");
    REQUIRE(in.duration_ms == 45000);
    REQUIRE(in.lines_removed == 3);

    auto line = render_status_line(in, std::string("main"));
    REQUIRE(contains(line, "[Opus]"));
    REQUIRE(contains(line, "📁 src"));
    REQUIRE(contains(line, "⎇ main"));
    REQUIRE(contains(line, "\033[33m💰 $0.070"));
    REQUIRE(contains(line, "⏱ 45s"));
    REQUIRE(contains(line, "\033[32m📝 +7"));
}

TEST_CASE("Missing fields use defaults", "[status]") {
    auto in = StatusInput::from_json(nlohmann::json::object());
    REQUIRE(in.model == "Claude");
    REQUIRE(session_metrics(in).empty());

    auto line = render_status_line(in, std::nullopt);
    REQUIRE(contains(line, "[Claude]"));
    REQUIRE_FALSE(contains(line, "⎇"));
}

TEST_CASE("Metric thresholds", "[status]") {
    StatusInput in;

    in.cost_usd = 0.0075;
    REQUIRE(contains(session_metrics(in), "\033[32m💰 1¢"));
    in.cost_usd = 0.25;
    REQUIRE(contains(session_metrics(in), "\033[31m💰 $0.250"));

    in = StatusInput{};
    in.duration_ms = 30 * 60000;
    REQUIRE(contains(session_metrics(in), "\033[33m⏱ 30m"));

    in = StatusInput{};
    in.lines_added = 2;
    in.lines_removed = 5;
    REQUIRE(contains(session_metrics(in), "\033[31m📝 -3"));
    in.lines_added = 5;
    REQUIRE(contains(session_metrics(in), "\033[33m📝 +0"));
}

TEST_CASE("Bad input prints the fallback line", "[status]") {
    std::istringstream in("{not json");
    std::ostringstream out;

    REQUIRE(run_status_line(in, out) == 0);
    REQUIRE(contains(out.str(), "[Claude]"));
    REQUIRE(contains(out.str(), "[Error: "));
    REQUIRE(out.str().back() == '\n');
}

TEST_CASE("Fallback error text is truncated", "[status]") {
    auto line = fallback_status_line("abcdefghijklmnopqrstuvwxyz");
    REQUIRE(contains(line, "[Error: abcdefghijklmnopqrst]"));
}

TEST_CASE("Null sections are treated as absent", "[status]") {
    auto in = StatusInput::from_json(nlohmann::json::parse(
        R"({"model": null, "workspace": {"current_dir": "/w/p"}, "cost": null})"));
    REQUIRE(in.model == "Claude");
    REQUIRE(in.current_dir == "/w/p");
    REQUIRE(session_metrics(in).empty());

    std::istringstream input(R"({"model": {"display_name": "Opus"}, "cost": null})");
    std::ostringstream out;
    REQUIRE(run_status_line(input, out) == 0);
    REQUIRE(contains(out.str(), "[Opus]"));
    REQUIRE_FALSE(contains(out.str(), "[Error: "));
}

TEST_CASE("Non-object input prints the fallback line", "[status]") {
    std::istringstream input("[1, 2]");
    std::ostringstream out;
    REQUIRE(run_status_line(input, out) == 0);
    REQUIRE(contains(out.str(), "[Error: "));
}
