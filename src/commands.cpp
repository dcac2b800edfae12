#include "commands.hpp"
#include "skill_query.hpp"
#include "skill_runner.hpp"
#include "session_context.hpp"
#include "status_line.hpp"
#include <iostream>

namespace skilldeck {

// ── find-skills ──────────────────────────────────────────────────────

int cmd_find_skills(const Config& cfg, const std::vector<std::string>& args) {
    std::optional<std::string> pattern;
    for (auto& a : args) {
        if (a == "-h" || a == "--help") {
            std::cout << "Usage: find-skills [PATTERN]\n\n"
                      << "List skills under " << cfg.skills_root_path() << ", grouped by category.\n"
                      << "PATTERN is a case-insensitive regular expression matched against\n"
                      << "name, description, when_to_use and category.\n";
            return 0;
        }
        if (pattern) {
            std::cerr << "Usage: find-skills [PATTERN]\n";
            return kExitUsage;
        }
        pattern = a;
    }

    auto scanned = SkillRegistry::scan(cfg.skills_root_path());
    if (auto* missing = std::get_if<RootNotFound>(&scanned)) {
        std::cerr << "find-skills: skills root not found: " << missing->root
                  << " (" << missing->reason << ")\n";
        return 1;
    }

    const auto& registry = std::get<SkillRegistry>(scanned);
    auto result = find_skills(registry, pattern);
    if (result.used_literal_fallback) {
        std::cerr << "[skills] '" << *pattern << "' is not a valid regex, matching it literally\n";
    }
    std::cout << format_listing(result, registry);
    return 0;
}

// ── skill-run ────────────────────────────────────────────────────────

int cmd_skill_run(const Config& cfg, const std::vector<std::string>& args) {
    if (args.empty() || args[0] == "-h" || args[0] == "--help") {
        std::ostream& os = args.empty() ? std::cerr : std::cout;
        os << "Usage: skill-run <skill-id> [args...]\n\n"
           << "Runs the skill's entrypoint (or run / run.sh / run.py beside its SKILL.md),\n"
           << "or prints the SKILL.md when it has none. Exits with the script's status.\n";
        return args.empty() ? kExitUsage : 0;
    }

    const std::string& id = args[0];
    std::vector<std::string> forwarded(args.begin() + 1, args.end());

    SkillRunner runner(cfg);
    RunOutcome outcome = runner.run(id, forwarded, std::cout);

    if (auto* nf = std::get_if<NotFound>(&outcome)) {
        std::cerr << "skill-run: skill not found: " << nf->id << "\n"
                  << "Run find-skills to list available skills.\n";
    } else if (auto* missing = std::get_if<RootNotFound>(&outcome)) {
        std::cerr << "skill-run: skills root not found: " << missing->root
                  << " (" << missing->reason << ")\n";
    } else if (auto* err = std::get_if<ExecutionError>(&outcome)) {
        std::cerr << "skill-run: " << err->id << ": " << err->detail << "\n";
    }
    return SkillRunner::exit_code(outcome);
}

// ── session-start ────────────────────────────────────────────────────

int cmd_session_start(const Config& cfg) {
    SessionContextBuilder builder(cfg);
    return builder.run(std::cout);
}

// ── status-line ──────────────────────────────────────────────────────

int cmd_status_line() {
    return run_status_line(std::cin, std::cout);
}

} // namespace skilldeck
