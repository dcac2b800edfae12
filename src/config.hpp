#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace skilldeck {

struct Config {
    std::string config_root = "~/.claude";
    std::string skills_root;             // empty = <config_root>/skills
    std::string intro_skill = "using-skills";
    std::string debug_log = "/tmp/claude-hook-debug.log";
    std::string tools_dir;               // empty = <skills_root>/<intro_skill>
    std::string product_name = "skilldeck";

    // Derived helpers
    std::string config_root_path() const {
        return expand_path(config_root);
    }
    std::string skills_root_path() const;
    std::string tools_dir_path() const;
    std::string intro_skill_path() const;
    std::string settings_path() const {
        return config_root_path() + "/skilldeck.json";
    }

    static Config make_default();
    static Config from_json(const nlohmann::json& j, Config base = make_default());

    // Defaults, then CC_CONFIG_ROOT, then <config_root>/skilldeck.json,
    // then CC_SKILLS_ROOT. Called once per process.
    static Config load();
    static Config load_file(const std::string& path, Config base);
};

} // namespace skilldeck
