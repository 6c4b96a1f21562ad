#pragma once

#include "build/build_descriptor.hpp"
#include "build/build_tool.hpp"
#include "build/source_control.hpp"
#include "package/release_packager.hpp"
#include "util/logger.hpp"
#include "util/result.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fwbundle {

enum class PipelineStage {
    Start,
    ResolveRoot,
    ResolveIdentity,
    ValidateInputs,
    CleanPreviousBuild,
    InvokeBuildTool,
    InvokePackager,
    Done,
};

const char* PipelineStageName(PipelineStage stage);

enum class PipelineMode {
    BuildAndPackage,
    // Package an existing build directory; no clean, no build.
    PackageOnly,
};

// What the caller asked for. Unset values fall back to the project config
// file, then to built-in defaults relative to the project root.
struct OrchestratorRequest {
    PipelineMode mode = PipelineMode::BuildAndPackage;
    std::string working_dir;
    std::optional<std::string> project_dir;
    std::optional<std::string> config_path;
    std::optional<std::string> build_type;
    std::optional<std::string> release_name;
    std::optional<std::string> build_dir;
    std::optional<std::string> signing_key;
    std::optional<std::string> output_dir;
    std::optional<std::string> build_tool;
    // Set when the command line fixed the log level; config LogLevel is ignored then.
    std::optional<LogLevel> log_level;
};

// Inputs after root discovery and config merge; every path is absolute.
struct ResolvedInputs {
    std::string project_root;
    std::string build_dir;
    std::string signing_key;
    std::string output_dir;
    std::string build_tool = "idf.py";
    std::vector<std::string> dev_sdkconfig_defaults;
    std::vector<std::string> release_sdkconfig_defaults{"sdkconfig.defaults", "sdkconfig.release"};
};

struct OrchestratorOutcome {
    ResolvedInputs inputs;
    BuildDescriptor build;
    PackageOutcome package;
};

// start -> resolve_root -> resolve_identity -> validate_inputs ->
// clean_previous_build -> invoke_build_tool -> invoke_packager -> done
//
// Strictly linear. The first failing stage ends the run; LastStage() names it.
class BuildOrchestrator {
  public:
    BuildOrchestrator(std::shared_ptr<const ISourceControl> source_control,
                      std::shared_ptr<const IBuildTool> build_tool);

    Result Run(const OrchestratorRequest& request, OrchestratorOutcome& out);

    PipelineStage LastStage() const { return stage_; }

    // Walks up from start to the first directory holding a ".git" entry;
    // falls back to start itself.
    static std::string FindProjectRoot(const std::string& start);

  private:
    Result ResolveRoot(const OrchestratorRequest& request, ResolvedInputs& inputs) const;
    Result ResolveIdentity(const OrchestratorRequest& request,
                           const ResolvedInputs& inputs,
                           BuildDescriptor& build) const;
    Result ValidateInputs(const OrchestratorRequest& request,
                          const ResolvedInputs& inputs,
                          const BuildDescriptor& build) const;
    Result CleanPreviousBuild(const ResolvedInputs& inputs) const;
    Result InvokeBuildTool(const ResolvedInputs& inputs, const BuildDescriptor& build) const;
    Result InvokePackager(const ResolvedInputs& inputs,
                          const BuildDescriptor& build,
                          PackageOutcome& out) const;

    static BuildInvocation MakeInvocation(const ResolvedInputs& inputs, const BuildDescriptor& build);

    std::shared_ptr<const ISourceControl> source_control_;
    std::shared_ptr<const IBuildTool> build_tool_;
    PipelineStage stage_ = PipelineStage::Start;
};

} // namespace fwbundle
