#pragma once

#include "util/result.hpp"

#include <string>

namespace fwbundle {

inline constexpr const char kProjectDescriptionFileName[] = "project_description.json";

// Subset of the build tool's project_description.json used for naming bundles.
struct ProjectDescription {
    std::string project_name;
    std::string project_version;

    static Result LoadFromFile(const std::string& path, ProjectDescription& out);
};

} // namespace fwbundle
