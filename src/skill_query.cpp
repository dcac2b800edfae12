#include "skill_query.hpp"
#include "utils.hpp"
#include <algorithm>
#include <functional>
#include <map>
#include <memory>
#include <regex>
#include <sstream>

namespace skilldeck {

namespace {

std::string searchable_text(const SkillDocument& doc) {
    return doc.meta.name + "\n" + doc.meta.description + "\n" +
           doc.meta.when_to_use + "\n" + doc.category();
}

// Returns the predicate for pattern, flagging whether the regex compiled.
std::function<bool(const std::string&)> make_matcher(const std::string& pattern,
                                                     bool& literal_fallback) {
    literal_fallback = false;
    try {
        auto re = std::make_shared<std::regex>(
            pattern, std::regex::ECMAScript | std::regex::icase);
        return [re](const std::string& text) { return std::regex_search(text, *re); };
    } catch (const std::regex_error&) {
        literal_fallback = true;
        std::string needle = to_lower(pattern);
        return [needle](const std::string& text) {
            return to_lower(text).find(needle) != std::string::npos;
        };
    }
}

} // namespace

size_t QueryResult::match_count() const {
    size_t n = 0;
    for (auto& g : groups) n += g.skills.size();
    return n;
}

QueryResult find_skills(const SkillRegistry& registry, const std::optional<std::string>& pattern) {
    QueryResult result;
    result.pattern = pattern;

    std::function<bool(const std::string&)> matches;
    if (pattern) {
        matches = make_matcher(*pattern, result.used_literal_fallback);
    }

    std::map<std::string, std::vector<const SkillDocument*>> by_category;
    for (auto& [id, doc] : registry.valid()) {
        if (matches && !matches(searchable_text(doc))) continue;
        by_category[doc.category()].push_back(&doc);
    }

    for (auto& [category, docs] : by_category) {
        std::sort(docs.begin(), docs.end(), [](const SkillDocument* a, const SkillDocument* b) {
            if (a->meta.name != b->meta.name) return a->meta.name < b->meta.name;
            return a->id < b->id;
        });
        result.groups.push_back({category, std::move(docs)});
    }
    return result;
}

std::string format_listing(const QueryResult& result, const SkillRegistry& registry) {
    std::ostringstream out;

    if (result.empty()) {
        if (result.pattern) {
            out << "No skills found matching '" << *result.pattern << "'.\n";
        } else {
            out << "No skills found.\n";
        }
    }

    bool first = true;
    for (auto& group : result.groups) {
        if (!first) out << "\n";
        first = false;
        out << group.category << "/\n";
        for (auto* doc : group.skills) {
            // Show the directory name; fall back to the declared name for
            // odd layouts where they differ
            std::string label = doc->id.substr(doc->id.rfind('/') + 1);
            out << "  " << label << " - " << doc->meta.description << "\n";
            if (label != doc->meta.name) {
                out << "    Name: " << doc->meta.name << "\n";
            }
            out << "    When to use: " << doc->meta.when_to_use << "\n";
            if (!doc->meta.applies_to_all_languages()) {
                out << "    Languages:";
                const char* sep = " ";
                for (auto& lang : doc->meta.languages) {
                    out << sep << lang;
                    sep = ", ";
                }
                out << "\n";
            }
            out << "    Path: " << doc->path << "\n";
        }
    }

    const auto& errors = registry.errors();
    if (!errors.empty()) {
        out << "\nSkipped " << errors.size() << " invalid skill document(s):\n";
        for (auto& err : errors) {
            out << "  " << err.path << ": " << err.reason << "\n";
        }
    }
    return out.str();
}

} // namespace skilldeck
