#include "build/build_tool.hpp"

#include "io/process.hpp"
#include "util/logger.hpp"

namespace fwbundle {

std::vector<std::string> IdfBuildTool::CommandLine(const BuildInvocation& inv) {
    std::vector<std::string> argv{inv.tool_command, "-B", inv.build_dir};
    if (!inv.sdkconfig_defaults.empty()) {
        std::string joined;
        for (const auto& f : inv.sdkconfig_defaults) {
            if (!joined.empty()) joined.push_back(';');
            joined += f;
        }
        argv.emplace_back("-D");
        argv.push_back("SDKCONFIG_DEFAULTS=" + joined);
    }
    argv.emplace_back("build");
    return argv;
}

Result IdfBuildTool::CheckEnvironment(const BuildInvocation& inv) const {
    if (inv.tool_command.empty()) {
        return Result::Fail(ErrorKind::BuildTool, "no build tool command configured");
    }
    if (idf_path_.empty()) {
        return Result::Fail(ErrorKind::BuildTool,
                            "IDF_PATH is not set; source the ESP-IDF export.sh before building");
    }
    return Result::Ok();
}

Result IdfBuildTool::Build(const BuildInvocation& inv) const {
    ProcessRequest req;
    req.argv = CommandLine(inv);
    req.working_dir = inv.project_root;

    LogInfo("Building %s firmware with %s", BuildTypeName(inv.build_type), inv.tool_command.c_str());

    ProcessOutcome outcome;
    auto r = RunProcess(req, outcome);
    if (!r.is_ok()) {
        return Result::Fail(ErrorKind::BuildTool, inv.tool_command + ": " + r.msg);
    }
    if (outcome.exit_code == kExecFailedExitCode) {
        return Result::Fail(ErrorKind::BuildTool,
                            inv.tool_command + " could not be started (exit " +
                                std::to_string(outcome.exit_code) + ")");
    }
    if (outcome.exit_code != 0) {
        return Result::Fail(ErrorKind::BuildTool,
                            BuildTypeName(inv.build_type) + std::string(" build failed: ") +
                                inv.tool_command + " exited with " + std::to_string(outcome.exit_code));
    }
    return Result::Ok();
}

} // namespace fwbundle
