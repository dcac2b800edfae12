#pragma once
#include <string>
#include <vector>
#include <optional>
#include "skill_registry.hpp"

namespace skilldeck {

struct SkillGroup {
    std::string category;
    std::vector<const SkillDocument*> skills;  // points into the registry
};

struct QueryResult {
    std::optional<std::string> pattern;
    std::vector<SkillGroup> groups;       // categories ascending, names ascending
    bool used_literal_fallback = false;   // pattern was not a valid regex

    size_t match_count() const;
    bool empty() const { return groups.empty(); }
};

// Case-insensitive match over name, description, when_to_use and category.
// Falls back to a literal substring search when pattern is not a valid
// regular expression. The result borrows from registry.
QueryResult find_skills(const SkillRegistry& registry,
                        const std::optional<std::string>& pattern = std::nullopt);

// Human-readable listing with one header per category. Parse errors of the
// registry are appended at the end.
std::string format_listing(const QueryResult& result, const SkillRegistry& registry);

} // namespace skilldeck
