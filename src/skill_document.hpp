#pragma once
#include <string>
#include <vector>
#include <map>
#include <set>
#include <variant>

namespace skilldeck {

struct SkillMetadata {
    std::string name;
    std::string description;
    std::string when_to_use;
    std::string version;                        // optional
    std::set<std::string> languages;            // empty = not specified
    std::map<std::string, std::string> extra;   // unknown header keys, raw values

    // True when languages is unset or contains "all"
    bool applies_to_all_languages() const {
        return languages.empty() || languages.count("all") > 0;
    }
};

struct SkillDocument {
    std::string id;         // path relative to the registry root, '/'-separated
    std::string path;       // SKILL.md the document was read from
    SkillMetadata meta;
    std::string body;       // everything after the header, untouched

    // First segment of id; the whole id for skills directly under the root
    std::string category() const;
};

struct ParseError {
    std::string path;
    std::string reason;
};

using ParseResult = std::variant<SkillDocument, ParseError>;

// Split the "---" delimited header from the body and validate required keys.
// Never throws; a malformed document yields a ParseError.
ParseResult parse_skill_document(const std::string& text, const std::string& path);

// Raw header key/value pairs. Exposed for tests and tooling.
std::map<std::string, std::string> parse_frontmatter(const std::string& header);

// Accepts "[a, b]", "a, b" or a single scalar
std::vector<std::string> parse_list_value(const std::string& value);

} // namespace skilldeck
