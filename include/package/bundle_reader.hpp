#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

struct archive;
struct archive_entry;

namespace fwbundle {

struct BundleEntryInfo {
    std::string name;
    std::uint64_t size = 0;
    unsigned perm = 0;
};

struct BundleEntry {
    BundleEntryInfo info;
    std::string data;
};

// Sequential reader over a release ZIP.
class BundleReader {
public:
    BundleReader() = default;
    ~BundleReader();

    BundleReader(const BundleReader&) = delete;
    BundleReader& operator=(const BundleReader&) = delete;

    Result Open(const std::string& path);

    // Move to next regular file entry.
    // Returns Ok + eof=true when end-of-archive.
    Result Next(BundleEntryInfo& out, bool& eof);

    Result ReadCurrentToString(std::string& out);

    // Skip any remaining bytes of current entry.
    Result SkipCurrent();

    static Result ReadAll(const std::string& path, std::vector<BundleEntry>& out);

private:
    struct archive* ar_ = nullptr;
    struct archive_entry* cur_entry_ = nullptr;
    bool in_entry_ = false;
    std::string path_;
};

} // namespace fwbundle
