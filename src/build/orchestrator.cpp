#include "build/orchestrator.hpp"

#include "io/temp_file.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <filesystem>
#include <system_error>

namespace fwbundle {

namespace fs = std::filesystem;

namespace {

constexpr const char kGitMarker[] = ".git";
constexpr const char kSdkconfigFile[] = "sdkconfig";
constexpr const char kDefaultBuildDir[] = "build";
constexpr const char kDefaultSigningKey[] = "keys/secure_boot_signing_key.pem";
constexpr const char kDefaultOutputDir[] = "release";
constexpr const char kDefaultBuildType[] = "release";

// Relative paths resolve against base; the result is lexically normalised.
std::string ResolvePath(const std::string& base, const std::string& p) {
    if (p.empty()) return p;
    fs::path path(p);
    if (path.is_relative()) path = fs::path(base) / path;
    return path.lexically_normal().string();
}

std::string StripTrailingSlash(std::string p) {
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    return p;
}

// True if child is parent or lies below it (lexically).
bool IsSameOrInside(const std::string& child, const std::string& parent) {
    const std::string c = StripTrailingSlash(child);
    const std::string p = StripTrailingSlash(parent);
    if (c == p) return true;
    if (p == "/") return true;
    return c.size() > p.size() && c.compare(0, p.size(), p) == 0 && c[p.size()] == '/';
}

} // namespace

const char* PipelineStageName(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Start:              return "start";
        case PipelineStage::ResolveRoot:        return "resolve_root";
        case PipelineStage::ResolveIdentity:    return "resolve_identity";
        case PipelineStage::ValidateInputs:     return "validate_inputs";
        case PipelineStage::CleanPreviousBuild: return "clean_previous_build";
        case PipelineStage::InvokeBuildTool:    return "invoke_build_tool";
        case PipelineStage::InvokePackager:     return "invoke_packager";
        case PipelineStage::Done:               return "done";
    }
    return "unknown";
}

BuildOrchestrator::BuildOrchestrator(std::shared_ptr<const ISourceControl> source_control,
                                     std::shared_ptr<const IBuildTool> build_tool)
    : source_control_(std::move(source_control)), build_tool_(std::move(build_tool)) {}

std::string BuildOrchestrator::FindProjectRoot(const std::string& start) {
    std::error_code ec;
    fs::path dir = fs::absolute(start.empty() ? fs::path(".") : fs::path(start), ec).lexically_normal();
    if (ec) return start;
    const fs::path origin = dir;

    while (true) {
        if (fs::exists(dir / kGitMarker, ec)) return StripTrailingSlash(dir.string());
        const fs::path parent = dir.parent_path();
        if (parent == dir || parent.empty()) break;
        dir = parent;
    }
    return StripTrailingSlash(origin.string());
}

BuildInvocation BuildOrchestrator::MakeInvocation(const ResolvedInputs& inputs, const BuildDescriptor& build) {
    BuildInvocation inv;
    inv.tool_command = inputs.build_tool;
    inv.project_root = inputs.project_root;
    inv.build_dir = inputs.build_dir;
    inv.build_type = build.build_type;
    inv.sdkconfig_defaults = build.build_type == BuildType::Release ? inputs.release_sdkconfig_defaults
                                                                     : inputs.dev_sdkconfig_defaults;
    return inv;
}

Result BuildOrchestrator::ResolveRoot(const OrchestratorRequest& request, ResolvedInputs& inputs) const {
    std::error_code ec;
    std::string cwd = request.working_dir;
    if (cwd.empty()) {
        cwd = fs::current_path(ec).string();
        if (ec) return Result::Fail(ErrorKind::Configuration, "cannot determine working directory: " + ec.message());
    }

    inputs.project_root = request.project_dir ? StripTrailingSlash(ResolvePath(cwd, *request.project_dir))
                                              : FindProjectRoot(cwd);
    if (!fs::is_directory(inputs.project_root, ec)) {
        return Result::Fail(ErrorKind::Configuration, "project directory not found: " + inputs.project_root);
    }
    LogInfo("Project root: %s", inputs.project_root.c_str());

    config::FwbundleConfigFromFile cfg;
    std::string config_path;
    if (request.config_path) {
        config_path = ResolvePath(cwd, *request.config_path);
    } else {
        const fs::path candidate = fs::path(inputs.project_root) / config::kDefaultConfigFileName;
        if (fs::exists(candidate, ec)) config_path = candidate.string();
    }
    if (!config_path.empty()) {
        auto r = cfg.LoadFile(config_path);
        if (!r.is_ok()) return r;
        LogInfo("Loaded config %s", config_path.c_str());
    }
    if (!request.log_level && cfg.log_level) {
        Logger::Instance().SetLevel(*cfg.log_level);
    }

    const std::string& root = inputs.project_root;
    auto pick = [&](const std::optional<std::string>& cli,
                    const std::optional<std::string>& file,
                    const char* fallback) {
        if (cli) return ResolvePath(cwd, *cli);
        if (file) return ResolvePath(root, *file);
        return ResolvePath(root, fallback);
    };

    inputs.build_dir = StripTrailingSlash(pick(request.build_dir, cfg.build_dir, kDefaultBuildDir));
    inputs.signing_key = pick(request.signing_key, cfg.signing_key, kDefaultSigningKey);
    inputs.output_dir = StripTrailingSlash(pick(request.output_dir, cfg.output_dir, kDefaultOutputDir));
    inputs.build_tool = request.build_tool ? *request.build_tool : cfg.build_tool.value_or(inputs.build_tool);
    if (cfg.dev_sdkconfig_defaults) inputs.dev_sdkconfig_defaults = *cfg.dev_sdkconfig_defaults;
    if (cfg.release_sdkconfig_defaults) inputs.release_sdkconfig_defaults = *cfg.release_sdkconfig_defaults;
    return Result::Ok();
}

Result BuildOrchestrator::ResolveIdentity(const OrchestratorRequest& request,
                                          const ResolvedInputs& inputs,
                                          BuildDescriptor& build) const {
    const std::string type_text = request.build_type.value_or(kDefaultBuildType);
    const auto type = ParseBuildType(type_text);
    if (!type) {
        return Result::Fail(ErrorKind::Configuration,
                            "invalid build type '" + type_text + "'; use 'dev' or 'release'");
    }
    build.build_type = *type;
    build.build_directory = inputs.build_dir;

    if (request.release_name && !SanitizeReleaseName(*request.release_name).empty()) {
        build.release_name = *request.release_name;
        LogInfo("Release name (explicit): %s", build.release_name.c_str());
        return Result::Ok();
    }

    if (request.mode == PipelineMode::PackageOnly) {
        std::optional<ProjectDescription> project;
        auto r = ReleasePackager::LoadProjectDescription(inputs.build_dir, project);
        if (!r.is_ok()) return r;
        build.release_name = ReleasePackager::DefaultReleaseName(project);
        LogInfo("Release name (project version): %s", build.release_name.c_str());
        return Result::Ok();
    }

    if (!source_control_) {
        return Result::Fail(ErrorKind::Configuration, "no release name given and no source control available");
    }
    if (auto tag = source_control_->ExactTag(inputs.project_root)) {
        build.release_name = *tag;
        LogInfo("Release name (tag): %s", build.release_name.c_str());
        return Result::Ok();
    }
    if (auto commit = source_control_->ShortCommit(inputs.project_root)) {
        build.release_name = *commit;
        LogInfo("Release name (commit): %s", build.release_name.c_str());
        return Result::Ok();
    }
    return Result::Fail(ErrorKind::Configuration,
                        "cannot resolve release name: no --name, no tag on HEAD and no commit in " +
                            inputs.project_root);
}

Result BuildOrchestrator::ValidateInputs(const OrchestratorRequest& request,
                                         const ResolvedInputs& inputs,
                                         const BuildDescriptor& build) const {
    std::error_code ec;
    if (build.build_type == BuildType::Release) {
        if (inputs.signing_key.empty()) {
            return Result::Fail(ErrorKind::Configuration, "release build requires a signing key");
        }
        if (!fs::is_regular_file(inputs.signing_key, ec)) {
            return Result::Fail(ErrorKind::Configuration, "signing key not found: " + inputs.signing_key);
        }
        LogInfo("Using signing key: %s", inputs.signing_key.c_str());
    }

    if (inputs.build_dir.empty() || IsSameOrInside(inputs.project_root, inputs.build_dir)) {
        return Result::Fail(ErrorKind::Configuration,
                            "refusing to use build directory " + inputs.build_dir +
                                " (it contains the project root)");
    }
    if (IsSameOrInside(inputs.output_dir, inputs.build_dir)) {
        return Result::Fail(ErrorKind::Configuration,
                            "output directory " + inputs.output_dir + " lies inside build directory " +
                                inputs.build_dir);
    }

    if (request.mode == PipelineMode::PackageOnly) {
        if (!fs::is_directory(inputs.build_dir, ec)) {
            return Result::Fail(ErrorKind::Configuration, "build directory not found: " + inputs.build_dir);
        }
        return Result::Ok();
    }

    if (!build_tool_) {
        return Result::Fail(ErrorKind::BuildTool, "no build tool available");
    }
    return build_tool_->CheckEnvironment(MakeInvocation(inputs, build));
}

Result BuildOrchestrator::CleanPreviousBuild(const ResolvedInputs& inputs) const {
    std::error_code ec;

    const fs::path sdkconfig = fs::path(inputs.project_root) / kSdkconfigFile;
    if (fs::exists(sdkconfig, ec)) {
        LogInfo("Removing old %s", sdkconfig.c_str());
        if (!fs::remove(sdkconfig, ec) || ec) {
            return Result::Fail(ErrorKind::Io, "cannot remove " + sdkconfig.string() + ": " + ec.message());
        }
    }

    if (fs::exists(inputs.build_dir, ec)) {
        LogInfo("Removing old build directory: %s", inputs.build_dir.c_str());
        fs::remove_all(inputs.build_dir, ec);
        if (ec) {
            return Result::Fail(ErrorKind::Io, "cannot remove " + inputs.build_dir + ": " + ec.message());
        }
    }
    fs::create_directories(inputs.build_dir, ec);
    if (ec) {
        return Result::Fail(ErrorKind::Io, "cannot create " + inputs.build_dir + ": " + ec.message());
    }

    // Temp bundles left behind by an interrupted run.
    if (fs::is_directory(inputs.output_dir, ec)) {
        const std::string marker = std::string(".zip") + kTempFileMarker;
        for (const auto& entry : fs::directory_iterator(inputs.output_dir, ec)) {
            const std::string name = entry.path().filename().string();
            if (name.find(marker) == std::string::npos || !entry.is_regular_file(ec)) continue;
            LogInfo("Removing stale temp bundle: %s", entry.path().c_str());
            fs::remove(entry.path(), ec);
            if (ec) {
                return Result::Fail(ErrorKind::Io, "cannot remove " + entry.path().string() + ": " + ec.message());
            }
        }
    }
    return Result::Ok();
}

Result BuildOrchestrator::InvokeBuildTool(const ResolvedInputs& inputs, const BuildDescriptor& build) const {
    auto r = build_tool_->Build(MakeInvocation(inputs, build));
    if (!r.is_ok() && r.err != ErrorKind::BuildTool) {
        return Result::Fail(ErrorKind::BuildTool, r.msg);
    }
    return r;
}

Result BuildOrchestrator::InvokePackager(const ResolvedInputs& inputs,
                                         const BuildDescriptor& build,
                                         PackageOutcome& out) const {
    PackageOptions options;
    options.output_dir = inputs.output_dir;
    options.protected_key_path = inputs.signing_key;
    // Dev output must not depend on whatever key happens to be lying around.
    if (build.build_type == BuildType::Release) {
        options.signing_key_path = inputs.signing_key;
    }

    const ReleasePackager packager;
    return packager.Package(build, options, out);
}

Result BuildOrchestrator::Run(const OrchestratorRequest& request, OrchestratorOutcome& out) {
    out = OrchestratorOutcome{};
    stage_ = PipelineStage::Start;

    stage_ = PipelineStage::ResolveRoot;
    auto r = ResolveRoot(request, out.inputs);
    if (!r.is_ok()) return r;

    stage_ = PipelineStage::ResolveIdentity;
    r = ResolveIdentity(request, out.inputs, out.build);
    if (!r.is_ok()) return r;
    LogInfo("Starting %s build '%s' in %s",
            BuildTypeName(out.build.build_type),
            out.build.release_name.c_str(),
            out.build.build_directory.c_str());

    stage_ = PipelineStage::ValidateInputs;
    r = ValidateInputs(request, out.inputs, out.build);
    if (!r.is_ok()) return r;

    if (request.mode == PipelineMode::BuildAndPackage) {
        stage_ = PipelineStage::CleanPreviousBuild;
        r = CleanPreviousBuild(out.inputs);
        if (!r.is_ok()) return r;

        stage_ = PipelineStage::InvokeBuildTool;
        r = InvokeBuildTool(out.inputs, out.build);
        if (!r.is_ok()) return r;
    }

    stage_ = PipelineStage::InvokePackager;
    r = InvokePackager(out.inputs, out.build, out.package);
    if (!r.is_ok()) return r;

    stage_ = PipelineStage::Done;
    LogInfo("%s build completed: %s", BuildTypeName(out.build.build_type), out.package.bundle_path.c_str());
    return Result::Ok();
}

} // namespace fwbundle
