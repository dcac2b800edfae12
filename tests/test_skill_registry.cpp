// tests/test_skill_registry.cpp
#include <catch2/catch_test_macros.hpp>
#include "skill_registry.hpp"
#include "test_helpers.hpp"
#include <unistd.h>

using namespace skilldeck;
using namespace skilldeck::testing;

TEST_CASE("Registry partitions valid and invalid documents", "[registry]") {
    TempDir dir;
    auto root = dir.path() / "skills";

    add_skill(root, "analysis/code-archaeology",
              skill_text("code-archaeology", "Read history", "Working in a legacy codebase"));
    add_skill(root, "testing/tdd",
              skill_text("tdd", "Test first", "Implementing a feature"));
    add_skill(root, "testing/unit/mocks",
              skill_text("mocks", "Fake collaborators", "Isolating a unit"));
    add_skill(root, "broken/no-when", "---\nname: x\ndescription: y\n---\n");
    add_skill(root, "broken/no-header", "plain text\n");

    auto scanned = SkillRegistry::scan(root.string());
    REQUIRE(std::holds_alternative<SkillRegistry>(scanned));
    const auto& reg = std::get<SkillRegistry>(scanned);

    REQUIRE(reg.size() == 3);
    REQUIRE(reg.errors().size() == 2);
    REQUIRE(reg.find("analysis/code-archaeology") != nullptr);
    REQUIRE(reg.find("testing/unit/mocks") != nullptr);
    REQUIRE(reg.find("testing/unit/mocks")->category() == "testing");
    REQUIRE(reg.find("broken/no-when") == nullptr);

    for (auto& err : reg.errors()) {
        REQUIRE(err.path.find("broken") != std::string::npos);
        REQUIRE_FALSE(err.reason.empty());
    }
}

TEST_CASE("Registry counts do not depend on creation order", "[registry]") {
    auto build = [](bool invalid_first) {
        TempDir dir;
        auto root = dir.path();
        auto add_valid = [&] {
            for (int i = 0; i < 4; i++) {
                std::string n = "skill" + std::to_string(i);
                add_skill(root, "cat" + std::to_string(i % 2) + "/" + n, skill_text(n, "d", "w"));
            }
        };
        auto add_invalid = [&] {
            for (int i = 0; i < 3; i++) {
                add_skill(root, "bad/b" + std::to_string(i), "---\nname: only\n---\n");
            }
        };
        if (invalid_first) { add_invalid(); add_valid(); }
        else { add_valid(); add_invalid(); }

        auto scanned = SkillRegistry::scan(root.string());
        const auto& reg = std::get<SkillRegistry>(scanned);
        return std::make_pair(reg.size(), reg.errors().size());
    };

    REQUIRE(build(true) == std::make_pair<size_t, size_t>(4, 3));
    REQUIRE(build(false) == std::make_pair<size_t, size_t>(4, 3));
}

TEST_CASE("Missing root is RootNotFound, empty root is an empty catalog", "[registry]") {
    TempDir dir;

    auto missing = SkillRegistry::scan((dir.path() / "nope").string());
    REQUIRE(std::holds_alternative<RootNotFound>(missing));
    REQUIRE(std::get<RootNotFound>(missing).root == (dir.path() / "nope").string());

    write_file(dir.path() / "file.txt", "x");
    auto not_dir = SkillRegistry::scan((dir.path() / "file.txt").string());
    REQUIRE(std::holds_alternative<RootNotFound>(not_dir));
    REQUIRE(std::get<RootNotFound>(not_dir).reason == "not a directory");

    fs::create_directories(dir.path() / "empty");
    auto empty = SkillRegistry::scan((dir.path() / "empty").string());
    REQUIRE(std::holds_alternative<SkillRegistry>(empty));
    REQUIRE(std::get<SkillRegistry>(empty).empty());
    REQUIRE(std::get<SkillRegistry>(empty).errors().empty());
}

TEST_CASE("Unreadable root is RootNotFound", "[registry]") {
    if (geteuid() == 0) {
        SKIP("permission bits are not enforced for root");
    }
    TempDir dir;
    auto root = dir.path() / "locked";
    add_skill(root, "a/b", skill_text("b", "d", "w"));
    fs::permissions(root, fs::perms::none);

    auto scanned = SkillRegistry::scan(root.string());
    fs::permissions(root, fs::perms::owner_all);
    REQUIRE(std::holds_alternative<RootNotFound>(scanned));
}

TEST_CASE("Roots that cannot be resolved to a directory are RootNotFound", "[registry]") {
    TempDir dir;
    write_file(dir.path() / "plain.txt", "x");

    SECTION("symlink to a file") {
        fs::create_symlink(dir.path() / "plain.txt", dir.path() / "link");
        auto scanned = SkillRegistry::scan((dir.path() / "link").string());
        REQUIRE(std::holds_alternative<RootNotFound>(scanned));
        REQUIRE(std::get<RootNotFound>(scanned).reason == "not a directory");
    }

    SECTION("symlink loop") {
        fs::create_symlink(dir.path() / "loop", dir.path() / "loop");
        auto scanned = SkillRegistry::scan((dir.path() / "loop").string());
        REQUIRE(std::holds_alternative<RootNotFound>(scanned));
        REQUIRE(std::get<RootNotFound>(scanned).reason != "does not exist");
    }

    SECTION("path through a file") {
        auto scanned = SkillRegistry::scan((dir.path() / "plain.txt" / "skills").string());
        REQUIRE(std::holds_alternative<RootNotFound>(scanned));
    }
}

TEST_CASE("Symlinked root is scanned like a directory", "[registry]") {
    TempDir dir;
    add_skill(dir.path() / "real", "tools/git", skill_text("git", "d", "w"));
    fs::create_directory_symlink(dir.path() / "real", dir.path() / "alias");

    auto scanned = SkillRegistry::scan((dir.path() / "alias").string());
    REQUIRE(std::holds_alternative<SkillRegistry>(scanned));
    REQUIRE(std::get<SkillRegistry>(scanned).find("tools/git") != nullptr);
}

TEST_CASE("Hidden directories and stray files are ignored", "[registry]") {
    TempDir dir;
    auto root = dir.path();
    add_skill(root, "tools/git", skill_text("git", "d", "w"));
    add_skill(root, ".git/hooks", skill_text("hidden", "d", "w"));
    add_skill(root, "tools/.cache/x", skill_text("cached", "d", "w"));
    write_file(root / "SKILL.md", skill_text("root-level", "d", "w"));
    write_file(root / "tools/README.md", "not a skill");

    auto scanned = SkillRegistry::scan(root.string());
    const auto& reg = std::get<SkillRegistry>(scanned);
    REQUIRE(reg.size() == 1);
    REQUIRE(reg.find("tools/git") != nullptr);
    REQUIRE(reg.errors().empty());
}

TEST_CASE("Identifiers are relative to the root", "[registry]") {
    REQUIRE(SkillRegistry::make_id("/s", "/s/analysis/code-archaeology/SKILL.md") ==
            "analysis/code-archaeology");
    REQUIRE(SkillRegistry::make_id("/s/", "/s/using-skills/SKILL.md") == "using-skills");
    REQUIRE(SkillRegistry::make_id("/s", "/s/testing/tdd") == "testing/tdd");
    REQUIRE(SkillRegistry::make_id("/s", "/s/SKILL.md").empty());
    REQUIRE(SkillRegistry::make_id("/s", "/other/x/SKILL.md").empty());
}

TEST_CASE("Parsed documents keep their path and body", "[registry]") {
    TempDir dir;
    auto path = add_skill(dir.path(), "writing/docs",
                          skill_text("docs", "Write docs", "Documenting an API", "Body \"x\"\n"));

    auto scanned = SkillRegistry::scan(dir.str());
    const auto* doc = std::get<SkillRegistry>(scanned).find("writing/docs");
    REQUIRE(doc != nullptr);
    REQUIRE(doc->id == "writing/docs");
    REQUIRE(doc->path == path.string());
    REQUIRE(doc->body == "Body \"x\"\n");
}
