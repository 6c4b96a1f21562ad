#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

namespace fwbundle::config {

void FwbundleConfigFromFile::Reset() {
    build_dir.reset();
    signing_key.reset();
    output_dir.reset();
    build_tool.reset();
    dev_sdkconfig_defaults.reset();
    release_sdkconfig_defaults.reset();
    log_level.reset();
}

Result FwbundleConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(ErrorKind::Configuration, "config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(ErrorKind::Configuration, "config: " + err + " in " + path);
    }

    return Result::Ok();
}

} // namespace fwbundle::config
