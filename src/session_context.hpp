#pragma once
#include <string>
#include <ostream>
#include <nlohmann/json.hpp>
#include "config.hpp"

namespace skilldeck {

// What the host runtime reads from the SessionStart hook's stdout.
struct ContextPayload {
    std::string hook_event_name = "SessionStart";
    std::string additional_context;   // raw text, escaped only by the JSON encoder

    // {"hookSpecificOutput": {"hookEventName": ..., "additionalContext": ...}}
    nlohmann::json to_json() const;
    std::string dump() const;
};

class SessionContextBuilder {
public:
    explicit SessionContextBuilder(Config cfg) : cfg_(std::move(cfg)) {}

    // find-skills listing for the whole registry, or a fallback line
    // carrying the error. Never throws.
    std::string catalog_text() const;

    // Raw text of the introductory SKILL.md, or a fallback line. Never throws.
    std::string intro_text() const;

    std::string compose(const std::string& intro, const std::string& catalog,
                        const std::string& timestamp) const;

    ContextPayload build() const;

    // Appends one timestamped line to the debug log. Returns false (after a
    // warning on stderr) when the log cannot be written.
    bool append_debug_log() const;

    // Full hook routine: build, log, write exactly one JSON object to out.
    // Always returns 0.
    int run(std::ostream& out) const;

private:
    Config cfg_;
};

} // namespace skilldeck
