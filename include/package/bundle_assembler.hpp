#pragma once

#include "crypto/sha256.hpp"
#include "package/flash_manifest.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fwbundle {

struct BundleContents {
    std::string build_dir;
    std::string manifest_json;
    std::string flash_script;
    std::optional<Sha256Digest> digest;
    // Manifest-relative binary paths, in flashing order.
    std::vector<std::string> binary_paths;
    // No artifact may resolve to this file. Empty when no key is in play.
    std::string signing_key_path;
};

// Writes the release ZIP. All referenced binaries are checked before any
// output file is created; the archive is built in a temp file beside
// output_path and renamed over it only when complete. An artifact that is the
// signing key, or that carries PEM private key material, is a ManifestError.
class BundleAssembler {
  public:
    Result Assemble(const BundleContents& contents, const std::string& output_path) const;

    // flash_files first (manifest order), then section files not already
    // listed. Paths are compared after normalization.
    static std::vector<std::string> CollectBinaryPaths(const FlashManifest& manifest);

  private:
    Result CheckNotKeyMaterial(const std::string& rel, const std::string& abs, const std::string& key_path) const;
    Result ValidateBinaries(const BundleContents& contents, std::vector<std::string>& normalized) const;
};

} // namespace fwbundle
