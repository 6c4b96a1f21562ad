#pragma once

#include "build/build_descriptor.hpp"
#include "package/flash_manifest.hpp"
#include "util/result.hpp"

#include <string>

namespace fwbundle {

struct SecurityPosture {
    bool secure_boot = false;
    bool encryption = false;

    bool operator==(const SecurityPosture&) const = default;
};

class SecurityPostureClassifier {
  public:
    // secure_boot: release build, bootloader entry present, key file exists.
    // encryption: manifest already asks for it, or release with secure boot.
    // A release build with a bootloader entry and no usable key is a
    // ConfigurationError. Dev builds ignore the key entirely.
    Result Classify(const FlashManifest& manifest,
                    const std::string& signing_key_path,
                    BuildType build_type,
                    SecurityPosture& out) const;

    static bool HasBootloaderEntry(const FlashManifest& manifest);
    static bool ManifestRequestsEncryption(const FlashManifest& manifest);
};

} // namespace fwbundle
