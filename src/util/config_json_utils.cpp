#include "util/config_json_utils.hpp"

#include <fstream>

namespace fwbundle::config::detail {

namespace {

// Absent keys are fine; present keys of the wrong type are errors.
bool GetStringIfPresent(const nlohmann::json& j,
                        const char* key,
                        std::optional<std::string>& out,
                        std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetStringListIfPresent(const nlohmann::json& j,
                            const char* key,
                            std::optional<std::vector<std::string>>& out,
                            std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_array()) {
        err = std::string(key) + " must be an array of strings";
        return false;
    }
    std::vector<std::string> values;
    for (const auto& v : *it) {
        if (!v.is_string()) {
            err = std::string(key) + " must be an array of strings";
            return false;
        }
        values.push_back(v.get<std::string>());
    }
    out = std::move(values);
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, FwbundleConfigFromFile& cfg, std::string& err) {
    if (!GetStringIfPresent(j, "BuildDir", cfg.build_dir, err) ||
        !GetStringIfPresent(j, "SigningKey", cfg.signing_key, err) ||
        !GetStringIfPresent(j, "OutputDir", cfg.output_dir, err) ||
        !GetStringIfPresent(j, "BuildTool", cfg.build_tool, err)) {
        return false;
    }

    if (auto it = j.find("SdkconfigDefaults"); it != j.end()) {
        if (!it->is_object()) {
            err = "SdkconfigDefaults must be an object with dev/release lists";
            return false;
        }
        if (!GetStringListIfPresent(*it, "dev", cfg.dev_sdkconfig_defaults, err) ||
            !GetStringListIfPresent(*it, "release", cfg.release_sdkconfig_defaults, err)) {
            err = "SdkconfigDefaults." + err;
            return false;
        }
    }

    std::optional<std::string> level_text;
    if (!GetStringIfPresent(j, "LogLevel", level_text, err)) {
        return false;
    }
    if (level_text) {
        cfg.log_level = ParseLogLevel(*level_text);
        if (!cfg.log_level) {
            err = "unknown LogLevel '" + *level_text + "'";
            return false;
        }
    }

    return true;
}

} // namespace fwbundle::config::detail
