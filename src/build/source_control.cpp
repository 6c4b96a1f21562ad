#include "build/source_control.hpp"

#include "io/process.hpp"
#include "util/logger.hpp"

namespace fwbundle {

std::optional<std::string> GitSourceControl::FirstLineOf(const std::string& project_root,
                                                         std::initializer_list<const char*> args) const {
    ProcessRequest req;
    req.argv.push_back(git_);
    for (const char* a : args) req.argv.emplace_back(a);
    req.working_dir = project_root;
    req.capture_stdout = true;
    req.silence_stderr = true;

    ProcessOutcome outcome;
    auto r = RunProcess(req, outcome);
    if (!r.is_ok()) {
        LogWarn("git query failed: %s", r.msg.c_str());
        return std::nullopt;
    }
    if (outcome.exit_code != 0) {
        return std::nullopt;
    }

    std::string line = outcome.stdout_text.substr(0, outcome.stdout_text.find('\n'));
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();
    if (line.empty()) return std::nullopt;
    return line;
}

std::optional<std::string> GitSourceControl::ExactTag(const std::string& project_root) const {
    return FirstLineOf(project_root, {"describe", "--tags", "--exact-match", "HEAD"});
}

std::optional<std::string> GitSourceControl::ShortCommit(const std::string& project_root) const {
    return FirstLineOf(project_root, {"rev-parse", "--short", "HEAD"});
}

} // namespace fwbundle
