#include "build/build_descriptor.hpp"

namespace fwbundle {

std::optional<BuildType> ParseBuildType(std::string_view text) {
    if (text == "dev") return BuildType::Dev;
    if (text == "release") return BuildType::Release;
    return std::nullopt;
}

const char* BuildTypeName(BuildType type) {
    return type == BuildType::Dev ? "dev" : "release";
}

} // namespace fwbundle
