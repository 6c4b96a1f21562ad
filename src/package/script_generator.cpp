#include "package/script_generator.hpp"

#include <cstdint>
#include <sstream>

namespace fwbundle {

namespace {

// Single-quote for bash; manifest values come from the build tool, not the operator.
std::string ShellQuote(const std::string& s) {
    std::string out = "'";
    for (const char c : s) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

void EmitConfirm(std::ostringstream& os, const char* var, const char* question) {
    os << "read -r -p \"" << question << " (y/N): \" " << var << " || true\n"
       << "if [[ ! ${" << var << ":-} =~ ^[Yy]$ ]]; then\n"
       << "    echo \"Flashing aborted.\"\n"
       << "    exit 1\n"
       << "fi\n";
}

void EmitEncryptionWarning(std::ostringstream& os) {
    os << "\n"
       << "echo \"WARNING: flash encryption is enabled for this release.\"\n"
       << "echo \"   - Every image except the bootloader is written encrypted and cannot be read back in plaintext.\"\n"
       << "echo \"   - Without the matching encryption key provisioned, the device becomes unreadable and unrecoverable.\"\n"
       << "echo \"   - Future updates must be flashed with the same key.\"\n"
       << "echo \"\"\n";
    EmitConfirm(os, "CONFIRM_ENCRYPT", "Continue flashing with encryption enabled?");
}

void EmitSecureBootWarning(std::ostringstream& os, const FlashFileEntry& bootloader) {
    os << "\n"
       << "echo \"WARNING: secure boot is enabled; the signed bootloader is flashed with --force.\"\n"
       << "echo \"   - Secure boot write-protects the region below the partition table; esptool refuses it without --force.\"\n"
       << "echo \"   - --force is required to replace the bootloader at " << bootloader.offset
       << " with this signed image.\"\n"
       << "echo \"   - Flashing a bootloader not signed with the device key will leave the device unbootable.\"\n"
       << "echo \"\"\n";
    EmitConfirm(os, "CONFIRM_SECURE_BOOT", "Continue flashing the signed bootloader with --force?");
}

std::string SingleLine(std::string s) {
    for (auto& c : s) {
        if (c == '\n' || c == '\r') c = ' ';
    }
    return s;
}

} // namespace

std::string FlashScriptGenerator::FlashCommand(const FlashManifest& manifest,
                                               const FlashFileEntry& entry,
                                               bool encrypt,
                                               bool force) const {
    const auto& esp = manifest.extra_esptool_args;
    const auto& fs = manifest.flash_settings;

    std::ostringstream os;
    os << opt_.esptool << " -p \"$PORT\" -b \"$BAUD\""
       << " --before " << ShellQuote(esp.before)
       << " --after " << ShellQuote(esp.after);
    if (!esp.stub) os << " --no-stub";
    os << " --chip " << ShellQuote(esp.chip)
       << " write_flash"
       << " --flash_mode " << ShellQuote(fs.flash_mode)
       << " --flash_freq " << ShellQuote(fs.flash_freq)
       << " --flash_size " << ShellQuote(fs.flash_size);
    if (force) os << " " << kForceFlag;
    if (encrypt) os << " " << kEncryptFlag;
    os << " " << entry.offset << " " << ShellQuote(entry.file);
    return os.str();
}

std::string FlashScriptGenerator::Generate(const FlashManifest& manifest,
                                           const SecurityPosture& posture,
                                           const std::string& release_name) const {
    const FlashSection* bootloader = manifest.Bootloader();
    const std::uint64_t boot_offset =
        bootloader ? ParseFlashOffset(bootloader->offset).value_or(~0ULL) : ~0ULL;

    const std::string quoted_name = ShellQuote(release_name);

    std::ostringstream os;
    os << "#!/usr/bin/env bash\n"
       << "# Flash script for release " << SingleLine(release_name) << "\n"
       << "# Usage: ./" << kFlashScriptFileName << " [PORT]   (default " << opt_.default_port << ")\n"
       << "set -euo pipefail\n"
       << "cd \"$(dirname \"$0\")\"\n"
       << "\n"
       << "PORT=\"${1:-" << opt_.default_port << "}\"\n"
       << "BAUD=\"${BAUD:-" << opt_.baud << "}\"\n"
       << "\n"
       << "echo \"Flashing release \"" << quoted_name << "\" to $PORT\"\n";

    if (posture.encryption) {
        EmitEncryptionWarning(os);
    }

    for (const auto& entry : manifest.flash_files) {
        const bool is_bootloader = ParseFlashOffset(entry.offset) == boot_offset;
        const bool force = posture.secure_boot && is_bootloader;
        if (force) {
            EmitSecureBootWarning(os, entry);
        }
        os << "\n" << FlashCommand(manifest, entry, posture.encryption, force) << "\n";
    }

    os << "\n"
       << "echo \"Release \"" << quoted_name << "\" flashed successfully.\"\n";
    return os.str();
}

} // namespace fwbundle
