#pragma once

#include "package/flash_manifest.hpp"
#include "package/security_posture.hpp"
#include "util/result.hpp"

namespace fwbundle {

// Applies a security posture to a manifest in place. Running it again over
// its own output changes nothing.
class FlashInstructionRewriter {
  public:
    Result Rewrite(FlashManifest& manifest, const SecurityPosture& posture) const;

  private:
    Result ApplySecureBoot(FlashManifest& manifest) const;
    void ApplyEncryption(FlashManifest& manifest) const;
};

} // namespace fwbundle
