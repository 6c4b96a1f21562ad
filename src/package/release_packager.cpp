#include "package/release_packager.hpp"

#include "package/bundle_assembler.hpp"
#include "package/digest_deriver.hpp"
#include "package/flash_manifest.hpp"
#include "package/flash_rewriter.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <filesystem>
#include <system_error>

namespace fwbundle {

namespace fs = std::filesystem;

namespace {
constexpr const char kDirtySuffix[] = "-dirty";
constexpr const char kLatest[] = "latest";
} // namespace

std::string ReleasePackager::BundleFileName(const std::optional<ProjectDescription>& project,
                                            const std::string& release_name) {
    const std::string name = SanitizeReleaseName(release_name);
    if (project && !project->project_name.empty()) {
        return project->project_name + "_" + name + ".zip";
    }
    return name + ".zip";
}

std::string ReleasePackager::DefaultReleaseName(const std::optional<ProjectDescription>& project) {
    if (!project) return kLatest;
    std::string version = SanitizeReleaseName(project->project_version);
    if (EndsWith(version, kDirtySuffix)) {
        version.resize(version.size() - (sizeof(kDirtySuffix) - 1));
    }
    return version.empty() ? kLatest : version;
}

Result ReleasePackager::LoadProjectDescription(const std::string& build_dir,
                                               std::optional<ProjectDescription>& out) {
    out.reset();
    const fs::path path = fs::path(build_dir) / kProjectDescriptionFileName;
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        LogDebug("no %s in %s", kProjectDescriptionFileName, build_dir.c_str());
        return Result::Ok();
    }
    ProjectDescription desc;
    auto r = ProjectDescription::LoadFromFile(path.string(), desc);
    if (!r.is_ok()) return r;
    out = std::move(desc);
    return Result::Ok();
}

Result ReleasePackager::Package(const BuildDescriptor& build,
                                const PackageOptions& options,
                                PackageOutcome& out) const {
    out = PackageOutcome{};

    std::error_code ec;
    if (!fs::is_directory(build.build_directory, ec)) {
        return Result::Fail(ErrorKind::Configuration, "build directory not found: " + build.build_directory);
    }
    const std::string file_stem = SanitizeReleaseName(build.release_name);
    if (file_stem.empty()) {
        return Result::Fail(ErrorKind::Configuration, "release name is empty");
    }
    if (file_stem == "." || file_stem == "..") {
        return Result::Fail(ErrorKind::Configuration, "release name is not usable as a file name: " +
                                                          build.release_name);
    }
    if (options.output_dir.empty()) {
        return Result::Fail(ErrorKind::Configuration, "output directory is empty");
    }

    FlashManifest manifest;
    auto r = LoadFlashManifest((fs::path(build.build_directory) / kFlashManifestFileName).string(), manifest);
    if (!r.is_ok()) return r;

    std::optional<ProjectDescription> project;
    r = LoadProjectDescription(build.build_directory, project);
    if (!r.is_ok()) return r;

    LogInfo("Packaging %s build '%s' from %s",
            BuildTypeName(build.build_type),
            build.release_name.c_str(),
            build.build_directory.c_str());

    const SecurityPostureClassifier classifier;
    r = classifier.Classify(manifest, options.signing_key_path, build.build_type, out.posture);
    if (!r.is_ok()) return r;

    const FlashInstructionRewriter rewriter;
    r = rewriter.Rewrite(manifest, out.posture);
    if (!r.is_ok()) return r;

    BundleContents contents;
    contents.build_dir = build.build_directory;
    contents.signing_key_path =
        options.protected_key_path.empty() ? options.signing_key_path : options.protected_key_path;

    if (out.posture.secure_boot) {
        LogInfo("Deriving Secure Boot V2 public key digest from %s", options.signing_key_path.c_str());
        Sha256Digest digest{};
        const DigestDeriver deriver;
        r = deriver.Derive(options.signing_key_path, digest);
        if (!r.is_ok()) return r;
        contents.digest = digest;
        manifest.security->digest_file = kDigestFileName;
    }

    const FlashScriptGenerator generator(options.script);
    contents.flash_script = generator.Generate(manifest, out.posture, build.release_name);
    contents.manifest_json = SerializeFlashManifest(manifest);
    contents.binary_paths = BundleAssembler::CollectBinaryPaths(manifest);

    const std::string bundle_path =
        (fs::path(options.output_dir) / BundleFileName(project, build.release_name)).string();

    const BundleAssembler assembler;
    r = assembler.Assemble(contents, bundle_path);
    if (!r.is_ok()) return r;

    out.bundle_path = bundle_path;
    out.has_digest = contents.digest.has_value();
    return Result::Ok();
}

} // namespace fwbundle
