#include "session_context.hpp"
#include "skill_query.hpp"
#include "utils.hpp"
#include <fstream>
#include <iostream>
#include <sstream>

namespace skilldeck {

// ── Payload ──────────────────────────────────────────────────────────

nlohmann::json ContextPayload::to_json() const {
    return {
        {"hookSpecificOutput", {
            {"hookEventName", hook_event_name},
            {"additionalContext", additional_context}
        }}
    };
}

std::string ContextPayload::dump() const {
    // Skill bodies are arbitrary bytes; invalid UTF-8 must not abort the hook
    return to_json().dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

// ── Sections ─────────────────────────────────────────────────────────

std::string SessionContextBuilder::catalog_text() const {
    try {
        auto scanned = SkillRegistry::scan(cfg_.skills_root_path());
        if (auto* missing = std::get_if<RootNotFound>(&scanned)) {
            return "Error running find-skills: skills root not found: " + missing->root +
                   " (" + missing->reason + ")";
        }
        const auto& registry = std::get<SkillRegistry>(scanned);
        return format_listing(find_skills(registry), registry);
    } catch (const std::exception& e) {
        return std::string("Error running find-skills: ") + e.what();
    }
}

std::string SessionContextBuilder::intro_text() const {
    try {
        return read_file_checked(cfg_.intro_skill_path());
    } catch (const std::exception& e) {
        return "Error reading " + cfg_.intro_skill + ": " + e.what();
    }
}

std::string SessionContextBuilder::compose(const std::string& intro, const std::string& catalog,
                                           const std::string& timestamp) const {
    const std::string tools = cfg_.tools_dir_path();

    std::ostringstream ss;
    ss << "<EXTREMELY_IMPORTANT>\n"
       << "🎯 SessionStart hook executed successfully at " << timestamp << "\n\n"
       << "You have " << cfg_.product_name << " skills available.\n\n"
       << "**The content below is from skills/" << cfg_.intro_skill
       << "/SKILL.md - your introduction to using skills:**\n\n"
       << intro << "\n\n"
       << "**Tool paths (use these when you need to search for or run skills):**\n"
       << "- find-skills: " << tools << "/find-skills\n"
       << "- skill-run: " << tools << "/skill-run\n\n"
       << "**Skills live in:** " << cfg_.skills_root_path() << "/ (you can edit any skill)\n\n"
       << "**Available skills (output of find-skills):**\n\n"
       << catalog << "\n"
       << "</EXTREMELY_IMPORTANT>";
    return ss.str();
}

ContextPayload SessionContextBuilder::build() const {
    ContextPayload payload;
    payload.additional_context = compose(intro_text(), catalog_text(), timestamp_str());
    return payload;
}

// ── Hook routine ─────────────────────────────────────────────────────

bool SessionContextBuilder::append_debug_log() const {
    if (cfg_.debug_log.empty()) return true;

    std::ofstream f(expand_path(cfg_.debug_log), std::ios::app);
    if (!f) {
        std::cerr << "[hook] Warning: cannot open debug log " << cfg_.debug_log << "\n";
        return false;
    }
    f << "Hook executed at " << date_str() << "\n";
    if (!f) {
        std::cerr << "[hook] Warning: failed writing debug log " << cfg_.debug_log << "\n";
        return false;
    }
    return true;
}

int SessionContextBuilder::run(std::ostream& out) const {
    ContextPayload payload = build();
    (void)append_debug_log();  // a failed write is only reported on stderr
    out << payload.dump() << "\n";
    out.flush();
    return 0;
}

} // namespace skilldeck
