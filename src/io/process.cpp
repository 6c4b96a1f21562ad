#include "io/process.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fwbundle {

namespace {

std::string JoinArgs(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out.push_back(' ');
        out += a;
    }
    return out;
}

[[noreturn]] void ExecChild(const ProcessRequest& req, int stdout_fd) {
    if (stdout_fd >= 0) {
        ::dup2(stdout_fd, STDOUT_FILENO);
        ::close(stdout_fd);
    }
    if (req.silence_stderr) {
        const int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDERR_FILENO);
            ::close(devnull);
        }
    }
    if (!req.working_dir.empty() && ::chdir(req.working_dir.c_str()) != 0) {
        ::_exit(kExecFailedExitCode);
    }

    std::vector<char*> args;
    args.reserve(req.argv.size() + 1);
    for (const auto& a : req.argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    ::execvp(args[0], args.data());
    ::_exit(kExecFailedExitCode);
}

} // namespace

Result RunProcess(const ProcessRequest& req, ProcessOutcome& out) {
    out = ProcessOutcome{};
    if (req.argv.empty() || req.argv.front().empty()) {
        return Result::Fail(ErrorKind::Io, "empty command line");
    }

    Fd read_end;
    Fd write_end;
    if (req.capture_stdout) {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            return Result::Fail(ErrorKind::Io, std::string("pipe failed: ") + std::strerror(errno));
        }
        read_end.Reset(fds[0]);
        write_end.Reset(fds[1]);
    }

    LogDebug("exec: %s (cwd=%s)", JoinArgs(req.argv).c_str(), req.working_dir.c_str());

    const pid_t pid = ::fork();
    if (pid < 0) {
        return Result::Fail(ErrorKind::Io, std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        ExecChild(req, write_end.Valid() ? write_end.Release() : -1);
    }

    write_end.Close();
    if (read_end.Valid()) {
        char buf[4096];
        while (true) {
            const ssize_t n = ::read(read_end.Get(), buf, sizeof(buf));
            if (n > 0) {
                out.stdout_text.append(buf, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            break;
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return Result::Fail(ErrorKind::Io, std::string("waitpid failed: ") + std::strerror(errno));
        }
    }

    if (WIFEXITED(status)) {
        out.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        out.exit_code = 128 + WTERMSIG(status);
    }
    return Result::Ok();
}

} // namespace fwbundle
