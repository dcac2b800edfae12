#pragma once
#include <string>
#include <optional>
#include <istream>
#include <ostream>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace skilldeck {

// Subset of the host's status-line JSON we display.
struct StatusInput {
    std::string model = "Claude";
    std::string current_dir;
    std::string project_dir;
    double cost_usd = 0.0;
    int64_t duration_ms = 0;
    int64_t lines_added = 0;
    int64_t lines_removed = 0;

    // Throws on a non-object document or fields of the wrong type
    static StatusInput from_json(const nlohmann::json& j);
};

std::string directory_display(const std::string& current_dir, const std::string& project_dir);

// " | 💰 ... ⏱ ... 📝 ..." with ANSI colors, empty when nothing to show
std::string session_metrics(const StatusInput& in);

// `git branch --show-current` in the working directory
std::optional<std::string> git_branch();

std::string render_status_line(const StatusInput& in, const std::optional<std::string>& branch);
std::string fallback_status_line(const std::string& error);

// Reads the JSON document from in and prints one line. Always returns 0.
int run_status_line(std::istream& in, std::ostream& out);

} // namespace skilldeck
