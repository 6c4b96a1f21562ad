#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace fwbundle {

enum class BuildType {
    Dev,
    Release,
};

std::optional<BuildType> ParseBuildType(std::string_view text);
const char* BuildTypeName(BuildType type);

// Resolved identity of one build. Immutable once the orchestrator (or the
// package command) has filled it in.
struct BuildDescriptor {
    BuildType build_type = BuildType::Release;
    std::string release_name;
    std::string build_directory;
};

} // namespace fwbundle
