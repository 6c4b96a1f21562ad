#pragma once

#include "build/build_descriptor.hpp"
#include "package/project_description.hpp"
#include "package/script_generator.hpp"
#include "package/security_posture.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>

namespace fwbundle {

struct PackageOptions {
    std::string signing_key_path;
    // Key file kept out of the bundle even when it is not used for signing.
    // Falls back to signing_key_path when empty.
    std::string protected_key_path;
    std::string output_dir;
    FlashScriptOptions script;
};

struct PackageOutcome {
    std::string bundle_path;
    SecurityPosture posture;
    bool has_digest = false;
};

// Turns one build directory into a release bundle:
// classify -> rewrite -> digest (secure boot only) -> script -> assemble.
class ReleasePackager {
  public:
    Result Package(const BuildDescriptor& build,
                   const PackageOptions& options,
                   PackageOutcome& out) const;

    // "<project>_<name>.zip", or "<name>.zip" without a project description.
    static std::string BundleFileName(const std::optional<ProjectDescription>& project,
                                      const std::string& release_name);

    // Name used when none was given: the project version without a trailing
    // "-dirty", else "latest".
    static std::string DefaultReleaseName(const std::optional<ProjectDescription>& project);

    static Result LoadProjectDescription(const std::string& build_dir,
                                         std::optional<ProjectDescription>& out);
};

} // namespace fwbundle
