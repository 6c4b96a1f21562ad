#pragma once

#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fwbundle {

inline constexpr const char kFlashManifestFileName[] = "flasher_args.json";
inline constexpr const char kBootloaderSection[] = "bootloader";
inline constexpr const char kAppSection[] = "app";
inline constexpr const char kForceFlag[] = "--force";
inline constexpr const char kEncryptFlag[] = "--encrypt";

struct FlashFileEntry {
    std::string offset;
    std::string file;

    bool operator==(const FlashFileEntry&) const = default;
};

struct FlashSettings {
    std::string flash_mode;
    std::string flash_freq;
    std::string flash_size;
    nlohmann::ordered_json extensions = nlohmann::ordered_json::object();

    bool operator==(const FlashSettings&) const = default;
};

struct EsptoolArgs {
    std::string before;
    std::string after;
    std::string chip;
    bool stub = true;
    nlohmann::ordered_json extensions = nlohmann::ordered_json::object();

    bool operator==(const EsptoolArgs&) const = default;
};

// One named binary description ("bootloader", "app", "partition-table", ...).
struct FlashSection {
    std::string name;
    std::string offset;
    std::string file;
    bool encrypted = false;
    bool read_protected = false;
    bool force = false;
    nlohmann::ordered_json extensions = nlohmann::ordered_json::object();

    bool operator==(const FlashSection&) const = default;
};

struct SecuritySummary {
    bool secure_boot = false;
    bool encryption = false;
    std::string digest_file;
    // Offsets of every flash_files entry except the bootloader, set when
    // encryption is on. Covers files that have no named section.
    std::vector<std::string> read_protected;

    bool operator==(const SecuritySummary&) const = default;
};

// Typed form of the build tool's flasher_args.json. flash_files keeps the
// document order, which is the flashing order.
struct FlashManifest {
    std::vector<FlashFileEntry> flash_files;
    FlashSettings flash_settings;
    std::vector<std::string> write_flash_args;
    EsptoolArgs extra_esptool_args;
    std::vector<FlashSection> sections;
    std::optional<SecuritySummary> security;
    // Unrecognised top-level keys, carried through untouched.
    nlohmann::ordered_json extensions = nlohmann::ordered_json::object();

    const FlashSection* FindSection(std::string_view name) const;
    FlashSection* FindSection(std::string_view name);

    const FlashSection* Bootloader() const { return FindSection(kBootloaderSection); }
    FlashSection* Bootloader() { return FindSection(kBootloaderSection); }

    const FlashFileEntry* FindFlashFile(std::string_view offset) const;
    bool HasWriteFlashArg(std::string_view arg) const;

    bool operator==(const FlashManifest&) const = default;
};

class FlashManifestParser {
  public:
    std::expected<FlashManifest, std::string> Parse(const std::string& json_input) const;
};

std::string SerializeFlashManifest(const FlashManifest& manifest);

// Reads and parses a manifest file; failures are ErrorKind::Manifest and name the path.
Result LoadFlashManifest(const std::string& path, FlashManifest& out);

// Parses "0x..." offsets; nullopt on anything else.
std::optional<std::uint64_t> ParseFlashOffset(std::string_view offset);

} // namespace fwbundle
