#include "package/flash_rewriter.hpp"

#include "util/logger.hpp"

#include <algorithm>

namespace fwbundle {

namespace {

constexpr const char kAutoDetect[] = "detect";
constexpr const char kKeepHeader[] = "keep";

// Leaves exactly one copy of flag in args; a new flag goes to the front or back.
void EnsureSingleFlag(std::vector<std::string>& args, const std::string& flag, bool at_front) {
    const auto first = std::find(args.begin(), args.end(), flag);
    if (first == args.end()) {
        if (at_front) {
            args.insert(args.begin(), flag);
        } else {
            args.push_back(flag);
        }
        return;
    }
    args.erase(std::remove(std::next(first), args.end(), flag), args.end());
}

void ReplaceAutoDetect(std::string& value) {
    if (value == kAutoDetect) value = kKeepHeader;
}

} // namespace

Result FlashInstructionRewriter::Rewrite(FlashManifest& manifest, const SecurityPosture& posture) const {
    if (posture.secure_boot) {
        auto r = ApplySecureBoot(manifest);
        if (!r.is_ok()) return r;
    }
    if (posture.encryption) {
        ApplyEncryption(manifest);
    }

    SecuritySummary summary;
    summary.secure_boot = posture.secure_boot;
    summary.encryption = posture.encryption;
    if (posture.secure_boot && manifest.security) {
        summary.digest_file = manifest.security->digest_file;
    }
    if (posture.encryption) {
        const FlashSection* bootloader = manifest.Bootloader();
        for (const auto& f : manifest.flash_files) {
            if (bootloader && f.offset == bootloader->offset) continue;
            summary.read_protected.push_back(f.offset);
        }
    }
    manifest.security = summary;
    return Result::Ok();
}

Result FlashInstructionRewriter::ApplySecureBoot(FlashManifest& manifest) const {
    FlashSection* bootloader = manifest.Bootloader();
    if (!bootloader) {
        return Result::Fail(ErrorKind::Manifest,
                            "secure boot requested but manifest has no 'bootloader' section");
    }

    bootloader->force = true;
    EnsureSingleFlag(manifest.write_flash_args, kForceFlag, /*at_front=*/true);

    // Secure-boot builds may leave the bootloader out of the flash list.
    if (!manifest.FindFlashFile(bootloader->offset)) {
        LogWarn("Bootloader %s missing from flash_files, adding it at %s",
                bootloader->file.c_str(), bootloader->offset.c_str());
        manifest.flash_files.insert(manifest.flash_files.begin(),
                                    FlashFileEntry{bootloader->offset, bootloader->file});
    }

    // Auto-detection rewrites the image header, which breaks the signature.
    ReplaceAutoDetect(manifest.flash_settings.flash_mode);
    ReplaceAutoDetect(manifest.flash_settings.flash_freq);
    ReplaceAutoDetect(manifest.flash_settings.flash_size);
    for (auto& arg : manifest.write_flash_args) ReplaceAutoDetect(arg);

    return Result::Ok();
}

void FlashInstructionRewriter::ApplyEncryption(FlashManifest& manifest) const {
    EnsureSingleFlag(manifest.write_flash_args, kEncryptFlag, /*at_front=*/false);

    for (auto& sec : manifest.sections) {
        sec.encrypted = true;
        if (sec.name != kBootloaderSection) {
            sec.read_protected = true;
        }
    }
}

} // namespace fwbundle
