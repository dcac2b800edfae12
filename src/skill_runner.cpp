#include "skill_runner.hpp"
#include "utils.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace skilldeck {

namespace {

const char* const kCompanionScripts[] = {"run", "run.sh", "run.py"};

bool is_executable_file(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
}

} // namespace

// ── Resolution ───────────────────────────────────────────────────────

std::string SkillRunner::normalize_id(const std::string& raw) {
    std::string id = trim(raw);
    const std::string suffix = std::string("/") + SkillRegistry::kDocumentName;
    if (id.size() >= suffix.size() &&
        id.compare(id.size() - suffix.size(), suffix.size(), suffix) == 0) {
        id.resize(id.size() - suffix.size());
    }
    while (!id.empty() && id.front() == '/') id.erase(0, 1);
    while (!id.empty() && id.back() == '/') id.pop_back();
    return id;
}

Artifact SkillRunner::resolve_artifact(const SkillDocument& doc) {
    fs::path dir = fs::path(doc.path).parent_path();

    auto it = doc.meta.extra.find("entrypoint");
    if (it != doc.meta.extra.end() && !trim(it->second).empty()) {
        fs::path entry(trim(it->second));
        if (entry.is_relative()) entry = dir / entry;
        return {ArtifactKind::script, entry.string(), true};
    }

    for (const char* name : kCompanionScripts) {
        fs::path candidate = dir / name;
        if (is_executable_file(candidate)) {
            return {ArtifactKind::script, candidate.string(), false};
        }
    }
    return {ArtifactKind::document, doc.path, false};
}

// ── Execution ────────────────────────────────────────────────────────

int SkillRunner::spawn(const SkillDocument& doc, const std::string& script,
                       const std::vector<std::string>& args) const {
    // Child inherits our stdio; anything still buffered would be written twice.
    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);

    std::string skill_dir = fs::path(doc.path).parent_path().string();
    std::string config_root = cfg_.config_root_path();
    std::string skills_root = cfg_.skills_root_path();

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(script.c_str()));
    for (auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        std::cerr << "[run] Fork failed for '" << doc.id << "': " << std::strerror(errno) << "\n";
        return kExitLaunchFailed;
    }

    if (pid == 0) {
        // Child
        setenv("SKILL_DIR", skill_dir.c_str(), 1);
        setenv("SKILL_ID", doc.id.c_str(), 1);
        setenv("CC_CONFIG_ROOT", config_root.c_str(), 1);
        setenv("CC_SKILLS_ROOT", skills_root.c_str(), 1);

        execv(script.c_str(), argv.data());
        _exit(kExitLaunchFailed);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            std::cerr << "[run] waitpid failed for '" << doc.id << "': "
                      << std::strerror(errno) << "\n";
            return kExitLaunchFailed;
        }
    }

    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return kExitLaunchFailed;
}

RunOutcome SkillRunner::run(const std::string& raw_id, const std::vector<std::string>& args,
                            std::ostream& out) const {
    auto scanned = SkillRegistry::scan(cfg_.skills_root_path());
    if (auto* missing = std::get_if<RootNotFound>(&scanned)) {
        return *missing;
    }
    const auto& registry = std::get<SkillRegistry>(scanned);

    std::string id = normalize_id(raw_id);
    const SkillDocument* doc = registry.find(id);
    if (!doc) {
        return NotFound{id.empty() ? raw_id : id};
    }

    Artifact artifact = resolve_artifact(*doc);

    if (artifact.kind == ArtifactKind::document) {
        try {
            out << read_file_checked(artifact.path);
            out.flush();
        } catch (const std::exception& e) {
            return ExecutionError{id, 1, e.what()};
        }
        return RunSuccess{id, artifact.path};
    }

    std::error_code ec;
    if (!fs::is_regular_file(artifact.path, ec)) {
        return ExecutionError{id, kExitLaunchFailed, "entrypoint not found: " + artifact.path};
    }
    if (access(artifact.path.c_str(), X_OK) != 0) {
        return ExecutionError{id, kExitNotExecutable, "entrypoint is not executable: " + artifact.path};
    }

    int code = spawn(*doc, artifact.path, args);
    if (code != 0) {
        return ExecutionError{id, code, artifact.path + " exited with status " + std::to_string(code)};
    }
    return RunSuccess{id, artifact.path};
}

int SkillRunner::exit_code(const RunOutcome& outcome) {
    if (std::holds_alternative<RunSuccess>(outcome)) return 0;
    if (std::holds_alternative<NotFound>(outcome)) return kExitNotFound;
    if (std::holds_alternative<RootNotFound>(outcome)) return kExitRootNotFound;
    return std::get<ExecutionError>(outcome).status;
}

} // namespace skilldeck
