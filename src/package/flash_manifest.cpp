#include "package/flash_manifest.hpp"

#include <charconv>
#include <fstream>
#include <sstream>

namespace fwbundle {

using json = nlohmann::ordered_json;

namespace {

constexpr const char kWriteFlashArgs[] = "write_flash_args";
constexpr const char kFlashSettings[] = "flash_settings";
constexpr const char kFlashFiles[] = "flash_files";
constexpr const char kExtraEsptoolArgs[] = "extra_esptool_args";
constexpr const char kSecurity[] = "security";

bool IsSectionObject(const json& v) {
    return v.is_object() && v.contains("offset") && v["offset"].is_string() &&
           v.contains("file") && v["file"].is_string();
}

// ESP-IDF writes "true"/"false" strings; plain booleans are accepted too.
std::expected<bool, std::string> ParseFlag(const json& v, const std::string& where) {
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_string()) {
        const auto s = v.get<std::string>();
        if (s == "true") return true;
        if (s == "false") return false;
    }
    return std::unexpected(where + ": expected true/false");
}

std::expected<FlashSettings, std::string> ParseFlashSettings(const json& j) {
    if (!j.is_object()) return std::unexpected(std::string(kFlashSettings) + " must be an object");
    FlashSettings s;
    for (const auto& [key, val] : j.items()) {
        std::string* dst = nullptr;
        if (key == "flash_mode") dst = &s.flash_mode;
        else if (key == "flash_freq") dst = &s.flash_freq;
        else if (key == "flash_size") dst = &s.flash_size;

        if (!dst) {
            s.extensions[key] = val;
            continue;
        }
        if (!val.is_string()) {
            return std::unexpected(std::string(kFlashSettings) + "." + key + " must be a string");
        }
        *dst = val.get<std::string>();
    }
    if (s.flash_mode.empty() || s.flash_freq.empty() || s.flash_size.empty()) {
        return std::unexpected(std::string(kFlashSettings) +
                               ": flash_mode, flash_freq and flash_size are required");
    }
    return s;
}

std::expected<EsptoolArgs, std::string> ParseEsptoolArgs(const json& j) {
    if (!j.is_object()) return std::unexpected(std::string(kExtraEsptoolArgs) + " must be an object");
    EsptoolArgs a;
    for (const auto& [key, val] : j.items()) {
        if (key == "stub") {
            if (!val.is_boolean()) {
                return std::unexpected(std::string(kExtraEsptoolArgs) + ".stub must be a boolean");
            }
            a.stub = val.get<bool>();
            continue;
        }
        std::string* dst = nullptr;
        if (key == "before") dst = &a.before;
        else if (key == "after") dst = &a.after;
        else if (key == "chip") dst = &a.chip;

        if (!dst) {
            a.extensions[key] = val;
            continue;
        }
        if (!val.is_string()) {
            return std::unexpected(std::string(kExtraEsptoolArgs) + "." + key + " must be a string");
        }
        *dst = val.get<std::string>();
    }
    if (a.before.empty() || a.after.empty() || a.chip.empty()) {
        return std::unexpected(std::string(kExtraEsptoolArgs) +
                               ": before, after and chip are required");
    }
    return a;
}

std::expected<FlashSection, std::string> ParseSection(const std::string& name, const json& j) {
    FlashSection sec;
    sec.name = name;
    for (const auto& [key, val] : j.items()) {
        if (key == "offset") {
            sec.offset = val.get<std::string>();
        } else if (key == "file") {
            sec.file = val.get<std::string>();
        } else if (key == "encrypted" || key == "read_protected" || key == "force") {
            auto flag = ParseFlag(val, name + "." + key);
            if (!flag) return std::unexpected(flag.error());
            if (key == "encrypted") sec.encrypted = *flag;
            else if (key == "read_protected") sec.read_protected = *flag;
            else sec.force = *flag;
        } else {
            sec.extensions[key] = val;
        }
    }
    if (!ParseFlashOffset(sec.offset)) {
        return std::unexpected(name + ": invalid offset '" + sec.offset + "'");
    }
    return sec;
}

std::expected<std::vector<FlashFileEntry>, std::string> ParseFlashFiles(const json& j) {
    if (!j.is_object()) return std::unexpected(std::string(kFlashFiles) + " must be an object");
    std::vector<FlashFileEntry> out;
    out.reserve(j.size());
    for (const auto& [offset, file] : j.items()) {
        if (!ParseFlashOffset(offset)) {
            return std::unexpected(std::string(kFlashFiles) + ": invalid offset '" + offset + "'");
        }
        if (!file.is_string() || file.get<std::string>().empty()) {
            return std::unexpected(std::string(kFlashFiles) + "." + offset +
                                   " must be a non-empty string");
        }
        out.push_back({offset, file.get<std::string>()});
    }
    if (out.empty()) return std::unexpected(std::string(kFlashFiles) + " is empty");
    return out;
}

std::expected<SecuritySummary, std::string> ParseSecurity(const json& j) {
    if (!j.is_object()) return std::unexpected(std::string(kSecurity) + " must be an object");
    SecuritySummary s;
    s.secure_boot = j.value("secure_boot", false);
    s.encryption = j.value("encryption", false);
    s.digest_file = j.value("digest_file", "");
    if (auto it = j.find("read_protected"); it != j.end()) {
        if (!it->is_array()) return std::unexpected(std::string(kSecurity) + ".read_protected must be an array");
        for (const auto& v : *it) {
            if (!v.is_string()) {
                return std::unexpected(std::string(kSecurity) + ".read_protected entries must be strings");
            }
            s.read_protected.push_back(v.get<std::string>());
        }
    }
    return s;
}

json SectionToJson(const FlashSection& sec) {
    json j = json::object();
    j["offset"] = sec.offset;
    j["file"] = sec.file;
    j["encrypted"] = sec.encrypted ? "true" : "false";
    if (sec.read_protected) j["read_protected"] = true;
    if (sec.force) j["force"] = true;
    for (const auto& [key, val] : sec.extensions.items()) j[key] = val;
    return j;
}

} // namespace

const FlashSection* FlashManifest::FindSection(std::string_view name) const {
    for (const auto& s : sections) {
        if (s.name == name) return &s;
    }
    return nullptr;
}

FlashSection* FlashManifest::FindSection(std::string_view name) {
    for (auto& s : sections) {
        if (s.name == name) return &s;
    }
    return nullptr;
}

const FlashFileEntry* FlashManifest::FindFlashFile(std::string_view offset) const {
    const auto wanted = ParseFlashOffset(offset);
    for (const auto& f : flash_files) {
        if (f.offset == offset) return &f;
        if (wanted && ParseFlashOffset(f.offset) == wanted) return &f;
    }
    return nullptr;
}

bool FlashManifest::HasWriteFlashArg(std::string_view arg) const {
    for (const auto& a : write_flash_args) {
        if (a == arg) return true;
    }
    return false;
}

std::optional<std::uint64_t> ParseFlashOffset(std::string_view offset) {
    if (offset.size() < 3 || offset[0] != '0' || (offset[1] != 'x' && offset[1] != 'X')) {
        return std::nullopt;
    }
    std::uint64_t v = 0;
    const char* first = offset.data() + 2;
    const char* last = offset.data() + offset.size();
    auto [ptr, ec] = std::from_chars(first, last, v, 16);
    if (ec != std::errc() || ptr != last) return std::nullopt;
    return v;
}

std::expected<FlashManifest, std::string> FlashManifestParser::Parse(const std::string& json_input) const {
    try {
        if (json_input.find_first_not_of(" \t\n\r") == std::string::npos) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(json_input);
        if (!j.is_object()) {
            return std::unexpected("JSON root must be an object");
        }

        FlashManifest m;
        bool have_files = false;
        bool have_settings = false;
        bool have_esptool = false;

        for (const auto& [key, val] : j.items()) {
            if (key == kWriteFlashArgs) {
                if (!val.is_array()) return std::unexpected(std::string(kWriteFlashArgs) + " must be an array");
                for (const auto& arg : val) {
                    if (!arg.is_string()) {
                        return std::unexpected(std::string(kWriteFlashArgs) + " entries must be strings");
                    }
                    m.write_flash_args.push_back(arg.get<std::string>());
                }
            } else if (key == kFlashSettings) {
                auto parsed = ParseFlashSettings(val);
                if (!parsed) return std::unexpected(parsed.error());
                m.flash_settings = std::move(*parsed);
                have_settings = true;
            } else if (key == kFlashFiles) {
                auto parsed = ParseFlashFiles(val);
                if (!parsed) return std::unexpected(parsed.error());
                m.flash_files = std::move(*parsed);
                have_files = true;
            } else if (key == kExtraEsptoolArgs) {
                auto parsed = ParseEsptoolArgs(val);
                if (!parsed) return std::unexpected(parsed.error());
                m.extra_esptool_args = std::move(*parsed);
                have_esptool = true;
            } else if (key == kSecurity) {
                auto parsed = ParseSecurity(val);
                if (!parsed) return std::unexpected(parsed.error());
                m.security = std::move(*parsed);
            } else if (IsSectionObject(val)) {
                auto parsed = ParseSection(key, val);
                if (!parsed) return std::unexpected(parsed.error());
                m.sections.push_back(std::move(*parsed));
            } else {
                m.extensions[key] = val;
            }
        }

        if (!have_files) return std::unexpected(std::string("missing field '") + kFlashFiles + "'");
        if (!have_settings) return std::unexpected(std::string("missing field '") + kFlashSettings + "'");
        if (!have_esptool) return std::unexpected(std::string("missing field '") + kExtraEsptoolArgs + "'");

        return m;
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Internal Error: ") + e.what());
    }
}

std::string SerializeFlashManifest(const FlashManifest& m) {
    json j = json::object();
    j[kWriteFlashArgs] = m.write_flash_args;

    json settings = json::object();
    settings["flash_mode"] = m.flash_settings.flash_mode;
    settings["flash_freq"] = m.flash_settings.flash_freq;
    settings["flash_size"] = m.flash_settings.flash_size;
    for (const auto& [key, val] : m.flash_settings.extensions.items()) settings[key] = val;
    j[kFlashSettings] = std::move(settings);

    json files = json::object();
    for (const auto& f : m.flash_files) files[f.offset] = f.file;
    j[kFlashFiles] = std::move(files);

    for (const auto& sec : m.sections) j[sec.name] = SectionToJson(sec);

    json esptool = json::object();
    esptool["before"] = m.extra_esptool_args.before;
    esptool["after"] = m.extra_esptool_args.after;
    esptool["stub"] = m.extra_esptool_args.stub;
    esptool["chip"] = m.extra_esptool_args.chip;
    for (const auto& [key, val] : m.extra_esptool_args.extensions.items()) esptool[key] = val;
    j[kExtraEsptoolArgs] = std::move(esptool);

    for (const auto& [key, val] : m.extensions.items()) j[key] = val;

    if (m.security) {
        json sec = json::object();
        sec["secure_boot"] = m.security->secure_boot;
        sec["encryption"] = m.security->encryption;
        if (!m.security->digest_file.empty()) sec["digest_file"] = m.security->digest_file;
        if (!m.security->read_protected.empty()) sec["read_protected"] = m.security->read_protected;
        j[kSecurity] = std::move(sec);
    }

    return j.dump(4) + "\n";
}

Result LoadFlashManifest(const std::string& path, FlashManifest& out) {
    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(ErrorKind::Manifest, "flash manifest not found: " + path);
    }
    std::ostringstream ss;
    ss << is.rdbuf();

    FlashManifestParser parser;
    auto parsed = parser.Parse(ss.str());
    if (!parsed) {
        return Result::Fail(ErrorKind::Manifest, path + ": " + parsed.error());
    }
    out = std::move(*parsed);
    return Result::Ok();
}

} // namespace fwbundle
