#pragma once

#include "util/result.hpp"

#include <string>

namespace fwbundle {

// Validates the binary paths a flash manifest points at before they are
// resolved against the build directory or stored in the bundle.
class ArchivePathPolicy {
  public:
    explicit ArchivePathPolicy(bool safe_paths_only) : safe_paths_only_(safe_paths_only) {}

    Result NormalizeEntryPath(const std::string& raw_path, std::string& out_relative) const;

  private:
    static bool IsSafeRelativePath(const std::string& p);

    bool safe_paths_only_ = true;
};

} // namespace fwbundle
