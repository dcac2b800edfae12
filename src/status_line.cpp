#include "status_line.hpp"
#include "utils.hpp"
#include <array>
#include <cstdio>
#include <stdexcept>
#include <vector>

namespace skilldeck {

namespace {

constexpr const char* kReset   = "\033[0m";
constexpr const char* kRed     = "\033[31m";
constexpr const char* kGreen   = "\033[32m";
constexpr const char* kYellow  = "\033[33m";
constexpr const char* kGray    = "\033[90m";
constexpr const char* kBlue    = "\033[94m";
constexpr const char* kMagenta = "\033[95m";
constexpr const char* kBrightYellow = "\033[93m";

std::string basename_of(const std::string& p) {
    return fs::path(p).filename().string();
}

std::string format_fixed(double value, int decimals) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    return buf;
}

// Missing or null sections read as empty objects
nlohmann::json section(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return nlohmann::json::object();
    return *it;
}

} // namespace

StatusInput StatusInput::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("status input is not an object");
    }

    StatusInput in;
    auto model = section(j, "model");
    in.model = model.value("display_name", in.model);

    auto ws = section(j, "workspace");
    in.current_dir = ws.value("current_dir", "");
    in.project_dir = ws.value("project_dir", "");

    auto cost = section(j, "cost");
    in.cost_usd = cost.value("total_cost_usd", 0.0);
    in.duration_ms = cost.value("total_duration_ms", int64_t{0});
    in.lines_added = cost.value("total_lines_added", int64_t{0});
    in.lines_removed = cost.value("total_lines_removed", int64_t{0});
    return in;
}

std::string directory_display(const std::string& current_dir, const std::string& project_dir) {
    if (!current_dir.empty() && !project_dir.empty()) {
        if (current_dir.compare(0, project_dir.size(), project_dir) == 0) {
            std::string rel = current_dir.substr(project_dir.size());
            while (!rel.empty() && rel.front() == '/') rel.erase(0, 1);
            return rel.empty() ? basename_of(project_dir) : rel;
        }
        return basename_of(current_dir);
    }
    if (!project_dir.empty()) return basename_of(project_dir);
    if (!current_dir.empty()) return basename_of(current_dir);
    return "unknown";
}

std::string session_metrics(const StatusInput& in) {
    std::vector<std::string> metrics;

    if (in.cost_usd > 0) {
        const char* color = in.cost_usd >= 0.10 ? kRed : in.cost_usd >= 0.05 ? kYellow : kGreen;
        std::string cost = in.cost_usd < 0.01
            ? format_fixed(in.cost_usd * 100, 0) + "¢"
            : "$" + format_fixed(in.cost_usd, 3);
        metrics.push_back(std::string(color) + "💰 " + cost + kReset);
    }

    if (in.duration_ms > 0) {
        double minutes = static_cast<double>(in.duration_ms) / 60000.0;
        const char* color = minutes >= 30 ? kYellow : kGreen;
        std::string duration = minutes < 1
            ? std::to_string(in.duration_ms / 1000) + "s"
            : format_fixed(minutes, 0) + "m";
        metrics.push_back(std::string(color) + "⏱ " + duration + kReset);
    }

    if (in.lines_added > 0 || in.lines_removed > 0) {
        int64_t net = in.lines_added - in.lines_removed;
        const char* color = net > 0 ? kGreen : net < 0 ? kRed : kYellow;
        std::string sign = net >= 0 ? "+" : "";
        metrics.push_back(std::string(color) + "📝 " + sign + std::to_string(net) + kReset);
    }

    if (metrics.empty()) return "";
    std::string out = std::string(" ") + kGray + "|" + kReset + " ";
    for (size_t i = 0; i < metrics.size(); i++) {
        if (i > 0) out += " ";
        out += metrics[i];
    }
    return out;
}

std::optional<std::string> git_branch() {
    FILE* pipe = popen("git branch --show-current 2>/dev/null", "r");
    if (!pipe) return std::nullopt;

    std::string output;
    std::array<char, 256> buf;
    while (auto n = std::fread(buf.data(), 1, buf.size(), pipe)) {
        output.append(buf.data(), n);
    }
    int status = pclose(pipe);
    if (status != 0) return std::nullopt;

    std::string branch = trim(output);
    if (branch.empty()) return std::nullopt;
    return branch;
}

std::string render_status_line(const StatusInput& in, const std::optional<std::string>& branch) {
    std::string line = std::string(kBlue) + "[" + in.model + "]" + kReset;
    line += std::string(" ") + kBrightYellow + "📁 " +
            directory_display(in.current_dir, in.project_dir) + kReset;
    if (branch) {
        line += std::string(" ") + kMagenta + "⎇ " + *branch + kReset;
    }
    line += session_metrics(in);
    return line;
}

std::string fallback_status_line(const std::string& error) {
    std::error_code ec;
    std::string cwd = basename_of(fs::current_path(ec).string());
    return std::string(kBlue) + "[Claude]" + kReset + " " + kBrightYellow + "📁 " + cwd + kReset +
           " " + kRed + "[Error: " + error.substr(0, 20) + "]" + kReset;
}

int run_status_line(std::istream& in, std::ostream& out) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        StatusInput input = StatusInput::from_json(j);
        out << render_status_line(input, git_branch()) << "\n";
    } catch (const std::exception& e) {
        out << fallback_status_line(e.what()) << "\n";
    }
    return 0;
}

} // namespace skilldeck
