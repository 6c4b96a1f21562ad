#include "io/temp_file.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace fwbundle {

Result TempFile::CreateFor(const std::string& final_path, TempFile& out) {
    std::string tmpl = final_path + kTempFileMarker + "XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    const int fd = ::mkstemp(buf.data());
    if (fd < 0) {
        return Result::Fail(ErrorKind::Io,
                            "mkstemp failed for " + tmpl + ": " + std::strerror(errno));
    }
    out.Cleanup();
    out.fd_.Reset(fd);
    out.path_ = buf.data();

    // mkstemp creates 0600; the committed file is a normal artifact.
    if (::fchmod(fd, 0644) != 0) {
        const std::string err = std::strerror(errno);
        out.Cleanup();
        return Result::Fail(ErrorKind::Io, "chmod failed for " + tmpl + ": " + err);
    }
    return Result::Ok();
}

TempFile::TempFile() = default;
TempFile::TempFile(TempFile&& other) noexcept { *this = std::move(other); }
TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        Cleanup();
        fd_ = std::move(other.fd_);
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}
TempFile::~TempFile() { Cleanup(); }

int TempFile::GetFd() const { return fd_.Get(); }
const std::string& TempFile::Path() const { return path_; }

Result TempFile::WriteAll(std::span<const std::uint8_t> data) {
    if (!fd_.Valid()) return Result::Fail(ErrorKind::Io, "temp file not open: " + path_);
    size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(fd_.Get(), data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result::Fail(ErrorKind::Io,
                                "write failed: " + path_ + " (" + std::strerror(errno) + ")");
        }
        off += static_cast<size_t>(n);
    }
    return Result::Ok();
}

Result TempFile::Commit(const std::string& final_path) {
    if (path_.empty()) return Result::Fail(ErrorKind::Io, "no temp file to commit");

    if (fd_.Valid()) {
        if (::fsync(fd_.Get()) != 0) {
            return Result::Fail(ErrorKind::Io,
                                "fsync failed: " + path_ + " (" + std::strerror(errno) + ")");
        }
        fd_.Close();
    }

    if (::rename(path_.c_str(), final_path.c_str()) != 0) {
        return Result::Fail(ErrorKind::Io,
                            "rename " + path_ + " -> " + final_path + " failed: " +
                                std::strerror(errno));
    }
    path_.clear();
    return Result::Ok();
}

void TempFile::Close() { fd_.Close(); }

void TempFile::Cleanup() {
    Close();
    if (!path_.empty()) {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

} // namespace fwbundle
