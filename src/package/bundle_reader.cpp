#include "package/bundle_reader.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <vector>

namespace fwbundle {

namespace {

std::string ArchiveError(struct archive* ar) {
    const char* em = ar ? archive_error_string(ar) : nullptr;
    return em ? em : "unknown";
}

} // namespace

BundleReader::~BundleReader() {
    if (ar_) {
        archive_read_free(ar_);
        ar_ = nullptr;
    }
}

Result BundleReader::Open(const std::string& path) {
    if (ar_) return Result::Fail(ErrorKind::Io, "Bundle already opened");

    ar_ = archive_read_new();
    if (!ar_) return Result::Fail(ErrorKind::Io, "archive_read_new failed");
    archive_read_support_format_zip(ar_);

    if (archive_read_open_filename(ar_, path.c_str(), 64 * 1024) != ARCHIVE_OK) {
        const std::string em = ArchiveError(ar_);
        archive_read_free(ar_);
        ar_ = nullptr;
        return Result::Fail(ErrorKind::Io, "cannot open bundle " + path + ": " + em);
    }
    path_ = path;
    return Result::Ok();
}

Result BundleReader::Next(BundleEntryInfo& out, bool& eof) {
    eof = false;
    if (!ar_) return Result::Fail(ErrorKind::Io, "Bundle not opened");

    if (in_entry_) {
        return Result::Fail(ErrorKind::Io, "Previous entry not finished (read it or call SkipCurrent)");
    }

    while (true) {
        const int r = archive_read_next_header(ar_, &cur_entry_);
        if (r == ARCHIVE_EOF) {
            eof = true;
            return Result::Ok();
        }
        if (r != ARCHIVE_OK) {
            return Result::Fail(ErrorKind::Io, path_ + ": archive_read_next_header: " + ArchiveError(ar_));
        }

        if (archive_entry_filetype(cur_entry_) != AE_IFREG) {
            archive_read_data_skip(ar_);
            continue;
        }

        const char* name = archive_entry_pathname(cur_entry_);
        out.name = name ? std::string(name) : std::string();
        out.size = static_cast<std::uint64_t>(archive_entry_size(cur_entry_));
        out.perm = static_cast<unsigned>(archive_entry_perm(cur_entry_));

        in_entry_ = true;
        return Result::Ok();
    }
}

Result BundleReader::SkipCurrent() {
    if (!in_entry_) return Result::Ok();
    if (archive_read_data_skip(ar_) != ARCHIVE_OK) {
        return Result::Fail(ErrorKind::Io, path_ + ": archive_read_data_skip: " + ArchiveError(ar_));
    }
    in_entry_ = false;
    return Result::Ok();
}

Result BundleReader::ReadCurrentToString(std::string& out) {
    if (!in_entry_) return Result::Fail(ErrorKind::Io, "No current entry");
    out.clear();

    std::vector<char> buf(64 * 1024);
    while (true) {
        const la_ssize_t n = archive_read_data(ar_, buf.data(), buf.size());
        if (n == 0) break;
        if (n < 0) {
            return Result::Fail(ErrorKind::Io, path_ + ": archive_read_data: " + ArchiveError(ar_));
        }
        out.append(buf.data(), static_cast<size_t>(n));
    }

    in_entry_ = false;
    return Result::Ok();
}

Result BundleReader::ReadAll(const std::string& path, std::vector<BundleEntry>& out) {
    out.clear();
    BundleReader reader;
    auto r = reader.Open(path);
    if (!r.is_ok()) return r;

    while (true) {
        BundleEntry entry;
        bool eof = false;
        r = reader.Next(entry.info, eof);
        if (!r.is_ok()) return r;
        if (eof) break;
        r = reader.ReadCurrentToString(entry.data);
        if (!r.is_ok()) return r;
        out.push_back(std::move(entry));
    }
    return Result::Ok();
}

} // namespace fwbundle
