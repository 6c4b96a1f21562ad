#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <utility>

namespace fwbundle {

// Read-only view of the repository the firmware is built from.
class ISourceControl {
  public:
    virtual ~ISourceControl() = default;
    // Tag pointing exactly at HEAD, if any.
    virtual std::optional<std::string> ExactTag(const std::string& project_root) const = 0;
    virtual std::optional<std::string> ShortCommit(const std::string& project_root) const = 0;
};

class GitSourceControl final : public ISourceControl {
  public:
    explicit GitSourceControl(std::string git = "git") : git_(std::move(git)) {}

    std::optional<std::string> ExactTag(const std::string& project_root) const override;
    std::optional<std::string> ShortCommit(const std::string& project_root) const override;

  private:
    std::optional<std::string> FirstLineOf(const std::string& project_root,
                                           std::initializer_list<const char*> args) const;

    std::string git_;
};

} // namespace fwbundle
