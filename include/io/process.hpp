#pragma once

#include "util/result.hpp"

#include <string>
#include <vector>

namespace fwbundle {

struct ProcessRequest {
    std::vector<std::string> argv;
    std::string working_dir;
    bool capture_stdout = false;
    bool silence_stderr = false;
};

struct ProcessOutcome {
    int exit_code = -1;
    std::string stdout_text;
};

// Runs argv[0] (looked up in PATH) and waits for it. A non-zero exit code is
// not an error here; spawn and wait failures are (ErrorKind::Io).
Result RunProcess(const ProcessRequest& req, ProcessOutcome& out);

// Exit code reported when the child could not exec the program.
inline constexpr int kExecFailedExitCode = 127;

} // namespace fwbundle
