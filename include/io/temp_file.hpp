#pragma once

#include "io/fd.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace fwbundle {

// A file created next to its final destination and removed on destruction
// unless Commit() renamed it into place.
class TempFile {
public:
    // Creates "<final_path>.tmp-XXXXXX" in the directory of final_path.
    static Result CreateFor(const std::string& final_path, TempFile& out);

    TempFile();
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    ~TempFile();

    int GetFd() const;
    const std::string& Path() const;

    Result WriteAll(std::span<const std::uint8_t> data);

    // fsync, close and rename onto final_path. The temp path is gone afterwards.
    Result Commit(const std::string& final_path);
    void Close();

private:
    void Cleanup();

    Fd fd_;
    std::string path_;
};

// Marker embedded in every temp file name so stale ones can be recognised.
inline constexpr const char kTempFileMarker[] = ".tmp-";

} // namespace fwbundle
