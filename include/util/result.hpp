#pragma once
#include <string>
#include <utility>

namespace fwbundle {

enum class ErrorKind : int {
    None = 0,
    Configuration,
    KeyMissing,
    KeyUnsupported,
    Manifest,
    MissingArtifact,
    BuildTool,
    Io,
};

const char* ErrorKindName(ErrorKind kind);

struct Result {
    bool ok{true};
    ErrorKind err{ErrorKind::None};
    std::string msg;

    bool is_ok() const { return ok; }
    ErrorKind kind() const { return err; }
    const std::string& message() const { return msg; }

    // KeyMissing and KeyUnsupported are both reported as key errors.
    bool is_key_error() const {
        return err == ErrorKind::KeyMissing || err == ErrorKind::KeyUnsupported;
    }

    static Result Ok() { return {}; }
    static Result Fail(ErrorKind e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }
};

} // namespace fwbundle
