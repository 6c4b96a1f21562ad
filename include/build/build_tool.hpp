#pragma once

#include "build/build_descriptor.hpp"
#include "util/result.hpp"

#include <string>
#include <utility>
#include <vector>

namespace fwbundle {

struct BuildInvocation {
    std::string tool_command = "idf.py";
    std::string project_root;
    std::string build_dir;
    BuildType build_type = BuildType::Release;
    // Configuration overlay files, joined into SDKCONFIG_DEFAULTS.
    std::vector<std::string> sdkconfig_defaults;
};

// The external firmware build. Build() must leave flasher_args.json and the
// binaries it references in build_dir.
class IBuildTool {
  public:
    virtual ~IBuildTool() = default;
    virtual Result CheckEnvironment(const BuildInvocation& inv) const = 0;
    virtual Result Build(const BuildInvocation& inv) const = 0;
};

class IdfBuildTool final : public IBuildTool {
  public:
    // idf_path is the IDF_PATH of the calling environment; empty means unset.
    explicit IdfBuildTool(std::string idf_path) : idf_path_(std::move(idf_path)) {}

    Result CheckEnvironment(const BuildInvocation& inv) const override;
    Result Build(const BuildInvocation& inv) const override;

    static std::vector<std::string> CommandLine(const BuildInvocation& inv);

  private:
    std::string idf_path_;
};

} // namespace fwbundle
