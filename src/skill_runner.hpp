#pragma once
#include <string>
#include <vector>
#include <ostream>
#include <variant>
#include "config.hpp"
#include "skill_registry.hpp"

namespace skilldeck {

// Exit codes reported by skill-run itself. Anything else is the artifact's.
constexpr int kExitRootNotFound = 2;
constexpr int kExitNotFound = 3;
constexpr int kExitNotExecutable = 126;
constexpr int kExitLaunchFailed = 127;

struct NotFound {
    std::string id;
};

struct ExecutionError {
    std::string id;
    int status = 1;       // passed through as the process exit code
    std::string detail;
};

struct RunSuccess {
    std::string id;
    std::string artifact;
};

using RunOutcome = std::variant<RunSuccess, NotFound, ExecutionError, RootNotFound>;

enum class ArtifactKind {
    script,     // companion executable, run with inherited stdio
    document,   // no script: the SKILL.md itself is displayed
};

struct Artifact {
    ArtifactKind kind = ArtifactKind::document;
    std::string path;
    bool declared = false;  // came from the "entrypoint" header key
};

class SkillRunner {
public:
    explicit SkillRunner(Config cfg) : cfg_(std::move(cfg)) {}

    // Scans the skills root, resolves id and runs its artifact. Documents are
    // written to out; scripts inherit the process stdio.
    RunOutcome run(const std::string& id, const std::vector<std::string>& args,
                   std::ostream& out) const;

    // "entrypoint" header key, else run / run.sh / run.py, else the document
    static Artifact resolve_artifact(const SkillDocument& doc);

    // "/testing/tdd/SKILL.md" -> "testing/tdd"
    static std::string normalize_id(const std::string& raw);

    static int exit_code(const RunOutcome& outcome);

private:
    int spawn(const SkillDocument& doc, const std::string& script,
              const std::vector<std::string>& args) const;

    Config cfg_;
};

} // namespace skilldeck
