#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fwbundle::config {

inline constexpr const char kDefaultConfigFileName[] = "fwbundle.json";

// Optional per-project settings. Every field is unset unless the file names it;
// command line values take precedence over anything here.
struct FwbundleConfigFromFile {
    std::optional<std::string> build_dir;
    std::optional<std::string> signing_key;
    std::optional<std::string> output_dir;
    std::optional<std::string> build_tool;
    std::optional<std::vector<std::string>> dev_sdkconfig_defaults;
    std::optional<std::vector<std::string>> release_sdkconfig_defaults;
    std::optional<LogLevel> log_level;

    void Reset();
    Result LoadFile(const std::string& path);
};

} // namespace fwbundle::config
