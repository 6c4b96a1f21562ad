#pragma once

#include "package/flash_manifest.hpp"
#include "package/security_posture.hpp"

#include <string>
#include <utility>

namespace fwbundle {

inline constexpr const char kFlashScriptFileName[] = "flash.sh";

struct FlashScriptOptions {
    std::string default_port = "/dev/ttyUSB0";
    unsigned baud = 460800;
    std::string esptool = "esptool.py";
};

// Renders a standalone bash script that flashes every manifest entry, in
// manifest order, with one esptool invocation per entry. The operator only
// picks the serial port (first argument).
class FlashScriptGenerator {
  public:
    FlashScriptGenerator() = default;
    explicit FlashScriptGenerator(FlashScriptOptions opt) : opt_(std::move(opt)) {}

    std::string Generate(const FlashManifest& manifest,
                         const SecurityPosture& posture,
                         const std::string& release_name) const;

  private:
    std::string FlashCommand(const FlashManifest& manifest,
                             const FlashFileEntry& entry,
                             bool encrypt,
                             bool force) const;

    FlashScriptOptions opt_{};
};

} // namespace fwbundle
