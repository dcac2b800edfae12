#include <iostream>
#include <string>
#include <vector>
#include "commands.hpp"

static void print_usage() {
    std::cout << "Usage: skilldeck <command> [options]\n\n"
              << "Commands:\n"
              << "  find-skills [PATTERN]       List skills, optionally filtered\n"
              << "  skill-run <id> [args...]    Run a skill's script or show its document\n"
              << "  session-start               Emit the SessionStart hook JSON\n"
              << "  status-line                 Render a status line from JSON on stdin\n\n"
              << "Each command can also be invoked directly through a link with its name.\n"
              << "Environment: CC_CONFIG_ROOT (default ~/.claude), CC_SKILLS_ROOT\n"
              << "(default $CC_CONFIG_ROOT/skills).\n";
}

static int dispatch(const std::string& cmd, const std::vector<std::string>& args) {
    if (cmd == "status-line") {
        return skilldeck::cmd_status_line();
    }

    // Roots are resolved exactly once per process
    const skilldeck::Config cfg = skilldeck::Config::load();

    if (cmd == "find-skills") {
        return skilldeck::cmd_find_skills(cfg, args);
    }
    else if (cmd == "skill-run") {
        return skilldeck::cmd_skill_run(cfg, args);
    }
    else if (cmd == "session-start") {
        return skilldeck::cmd_session_start(cfg);
    }
    std::cerr << "Unknown command: " << cmd << "\n";
    print_usage();
    return 1;
}

int main(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) {
        args.push_back(argv[i]);
    }

    // Multi-call: find-skills, skill-run, ... may be links to this binary
    std::string self = argc > 0 ? argv[0] : "skilldeck";
    auto slash = self.rfind('/');
    if (slash != std::string::npos) self = self.substr(slash + 1);

    if (self == "find-skills" || self == "skill-run" ||
        self == "session-start" || self == "status-line") {
        return dispatch(self, args);
    }

    if (args.empty()) {
        print_usage();
        return 1;
    }
    if (args[0] == "-h" || args[0] == "--help" || args[0] == "help") {
        print_usage();
        return 0;
    }

    std::string cmd = args[0];
    args.erase(args.begin());
    return dispatch(cmd, args);
}
