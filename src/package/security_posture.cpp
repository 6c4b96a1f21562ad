#include "package/security_posture.hpp"

#include "util/logger.hpp"

#include <filesystem>
#include <system_error>

namespace fwbundle {

namespace fs = std::filesystem;

bool SecurityPostureClassifier::HasBootloaderEntry(const FlashManifest& manifest) {
    return manifest.Bootloader() != nullptr;
}

bool SecurityPostureClassifier::ManifestRequestsEncryption(const FlashManifest& manifest) {
    if (manifest.HasWriteFlashArg(kEncryptFlag)) return true;
    const FlashSection* app = manifest.FindSection(kAppSection);
    return app && app->encrypted;
}

Result SecurityPostureClassifier::Classify(const FlashManifest& manifest,
                                           const std::string& signing_key_path,
                                           BuildType build_type,
                                           SecurityPosture& out) const {
    out = SecurityPosture{};
    const bool has_bootloader = HasBootloaderEntry(manifest);

    if (build_type == BuildType::Release && has_bootloader) {
        if (signing_key_path.empty()) {
            return Result::Fail(ErrorKind::Configuration,
                                "release build requires a signing key for the bootloader, none given");
        }
        std::error_code ec;
        if (!fs::is_regular_file(signing_key_path, ec)) {
            return Result::Fail(ErrorKind::Configuration,
                                "release build requires a signing key, not found: " + signing_key_path);
        }
        out.secure_boot = true;
    } else if (build_type == BuildType::Dev && !signing_key_path.empty()) {
        LogDebug("dev build: ignoring signing key %s", signing_key_path.c_str());
    }

    out.encryption = ManifestRequestsEncryption(manifest) ||
                     (build_type == BuildType::Release && out.secure_boot);

    LogInfo("Security posture: secure_boot=%s encryption=%s",
            out.secure_boot ? "on" : "off",
            out.encryption ? "on" : "off");
    return Result::Ok();
}

} // namespace fwbundle
