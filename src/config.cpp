#include "config.hpp"
#include <fstream>
#include <iostream>

namespace skilldeck {

std::string Config::skills_root_path() const {
    if (!skills_root.empty()) return expand_path(skills_root);
    return config_root_path() + "/skills";
}

std::string Config::tools_dir_path() const {
    if (!tools_dir.empty()) return expand_path(tools_dir);
    return skills_root_path() + "/" + intro_skill;
}

std::string Config::intro_skill_path() const {
    return skills_root_path() + "/" + intro_skill + "/SKILL.md";
}

Config Config::make_default() {
    Config c;
    c.config_root = home_dir() + "/.claude";
    return c;
}

Config Config::from_json(const nlohmann::json& j, Config base) {
    Config c = std::move(base);
    if (!j.is_object()) return c;

    c.skills_root = j.value("skills_root", c.skills_root);
    c.intro_skill = j.value("intro_skill", c.intro_skill);
    c.debug_log = j.value("debug_log", c.debug_log);
    c.tools_dir = j.value("tools_dir", c.tools_dir);
    c.product_name = j.value("product_name", c.product_name);
    return c;
}

Config Config::load_file(const std::string& path, Config base) {
    std::ifstream f(path);
    if (!f) return base;  // settings file is optional
    try {
        nlohmann::json j = nlohmann::json::parse(f);
        return from_json(j, base);
    } catch (const std::exception& e) {
        std::cerr << "[config] Warning: failed to parse " << path << ": " << e.what()
                  << ", using defaults\n";
        return base;
    }
}

Config Config::load() {
    Config c = make_default();
    c.config_root = env_or("CC_CONFIG_ROOT", c.config_root);

    const std::string settings = c.settings_path();
    c = load_file(settings, c);

    // Environment wins over the settings file for the skills root.
    c.skills_root = env_or("CC_SKILLS_ROOT", c.skills_root);
    return c;
}

} // namespace skilldeck
