#pragma once
#include <string>
#include <vector>
#include "config.hpp"

namespace skilldeck {

// Exit code for malformed command lines (sysexits EX_USAGE)
constexpr int kExitUsage = 64;

int cmd_find_skills(const Config& cfg, const std::vector<std::string>& args);
int cmd_skill_run(const Config& cfg, const std::vector<std::string>& args);
int cmd_session_start(const Config& cfg);
int cmd_status_line();

} // namespace skilldeck
