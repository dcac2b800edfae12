#include "skill_registry.hpp"
#include "utils.hpp"
#include <algorithm>
#include <iostream>

namespace skilldeck {

// ── Identifiers ──────────────────────────────────────────────────────

std::string SkillRegistry::make_id(const std::string& root, const std::string& document_path) {
    fs::path doc(document_path);
    fs::path dir = doc.filename() == kDocumentName ? doc.parent_path() : doc;

    fs::path rel = dir.lexically_normal().lexically_relative(fs::path(root).lexically_normal());
    std::string id = rel.generic_string();
    if (id.empty() || id == "." || id.rfind("..", 0) == 0) return "";
    while (!id.empty() && id.back() == '/') id.pop_back();
    return id;
}

const SkillDocument* SkillRegistry::find(const std::string& id) const {
    auto it = valid_.find(id);
    return it == valid_.end() ? nullptr : &it->second;
}

// ── Discovery ────────────────────────────────────────────────────────

RegistryResult SkillRegistry::scan(const std::string& root) {
    std::error_code ec;
    bool present = fs::exists(root, ec);
    if (ec) {
        return RootNotFound{root, ec.message()};  // e.g. a symlink loop
    }
    if (!present) {
        return RootNotFound{root, "does not exist"};
    }
    if (!fs::is_directory(root, ec)) {
        return RootNotFound{root, "not a directory"};
    }

    // skip_permission_denied would turn an unreadable root into an empty one
    fs::directory_iterator probe(root, ec);
    if (ec) {
        return RootNotFound{root, ec.message()};
    }

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return RootNotFound{root, ec.message()};
    }

    std::map<std::string, SkillDocument> valid;
    std::vector<ParseError> errors;

    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            std::cerr << "[skills] Warning: scan of " << root << " stopped early: "
                      << ec.message() << "\n";
            break;
        }

        const auto& entry = *it;
        std::string filename = entry.path().filename().string();

        std::error_code type_ec;
        if (entry.is_directory(type_ec)) {
            if (!filename.empty() && filename[0] == '.') it.disable_recursion_pending();
            continue;
        }
        if (filename != kDocumentName || !entry.is_regular_file(type_ec)) continue;

        std::string path = entry.path().string();
        std::string id = make_id(root, path);
        if (id.empty()) continue;  // SKILL.md directly in the root has no identifier

        std::string text;
        try {
            text = read_file_checked(path);
        } catch (const std::exception& e) {
            std::cerr << "[skills] Skipping " << path << ": " << e.what() << "\n";
            errors.push_back({path, e.what()});
            continue;
        }

        auto parsed = parse_skill_document(text, path);
        if (auto* err = std::get_if<ParseError>(&parsed)) {
            std::cerr << "[skills] Skipping " << err->path << ": " << err->reason << "\n";
            errors.push_back(std::move(*err));
            continue;
        }

        auto& doc = std::get<SkillDocument>(parsed);
        doc.id = id;
        valid.emplace(id, std::move(doc));
    }

    std::sort(errors.begin(), errors.end(),
              [](const ParseError& a, const ParseError& b) { return a.path < b.path; });

    return SkillRegistry(root, std::move(valid), std::move(errors));
}

} // namespace skilldeck
