#pragma once
#include <string>
#include <vector>
#include <map>
#include <variant>
#include "skill_document.hpp"

namespace skilldeck {

struct RootNotFound {
    std::string root;
    std::string reason;
};

class SkillRegistry;
using RegistryResult = std::variant<SkillRegistry, RootNotFound>;

// Snapshot of every SKILL.md beneath a root. Built by scan(), never
// modified afterwards.
class SkillRegistry {
public:
    static constexpr const char* kDocumentName = "SKILL.md";

    // Walks root recursively. Malformed documents end up in errors(), they
    // never abort the scan. Only a missing/unreadable root fails.
    static RegistryResult scan(const std::string& root);

    const std::string& root() const { return root_; }
    const std::map<std::string, SkillDocument>& valid() const { return valid_; }
    const std::vector<ParseError>& errors() const { return errors_; }

    size_t size() const { return valid_.size(); }
    bool empty() const { return valid_.empty(); }

    // nullptr when id is unknown
    const SkillDocument* find(const std::string& id) const;

    // Identifier for a SKILL.md (or its directory) relative to root;
    // empty if the path is not inside root.
    static std::string make_id(const std::string& root, const std::string& document_path);

private:
    SkillRegistry(std::string root,
                  std::map<std::string, SkillDocument> valid,
                  std::vector<ParseError> errors)
        : root_(std::move(root)), valid_(std::move(valid)), errors_(std::move(errors)) {}

    std::string root_;
    std::map<std::string, SkillDocument> valid_;
    std::vector<ParseError> errors_;
};

} // namespace skilldeck
