#include "package/bundle_assembler.hpp"

#include "io/fd.hpp"
#include "io/temp_file.hpp"
#include "package/archive_path_policy.hpp"
#include "package/digest_deriver.hpp"
#include "package/script_generator.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <memory>
#include <span>
#include <string_view>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace fwbundle {

namespace fs = std::filesystem;

namespace {

// Tail of every PEM private key armor line ("BEGIN PRIVATE KEY", "BEGIN RSA PRIVATE KEY", ...).
constexpr std::string_view kPemPrivateKeyMarker = "PRIVATE KEY-----";

// Fixed entry timestamp (2000-01-01T00:00:00Z) so identical inputs give identical archives.
constexpr time_t kEntryMtime = 946684800;

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const { archive_write_free(a); }
};
struct ArchiveEntryDeleter {
    void operator()(struct archive_entry* e) const { archive_entry_free(e); }
};
using ArchiveWritePtr = std::unique_ptr<struct archive, ArchiveWriteDeleter>;
using ArchiveEntryPtr = std::unique_ptr<struct archive_entry, ArchiveEntryDeleter>;

std::string ArchiveError(struct archive* a) {
    const char* em = archive_error_string(a);
    return em ? em : "unknown";
}

Result WriteHeader(struct archive* a, const std::string& name, std::uint64_t size, unsigned perm) {
    ArchiveEntryPtr hdr(archive_entry_new());
    if (!hdr) return Result::Fail(ErrorKind::Io, "archive_entry_new failed");
    archive_entry_set_pathname(hdr.get(), name.c_str());
    archive_entry_set_filetype(hdr.get(), AE_IFREG);
    archive_entry_set_perm(hdr.get(), perm);
    archive_entry_set_size(hdr.get(), static_cast<la_int64_t>(size));
    archive_entry_set_mtime(hdr.get(), kEntryMtime, 0);
    if (archive_write_header(a, hdr.get()) != ARCHIVE_OK) {
        return Result::Fail(ErrorKind::Io, "archive_write_header(" + name + "): " + ArchiveError(a));
    }
    return Result::Ok();
}

Result WriteData(struct archive* a, const std::string& name, std::span<const std::uint8_t> data) {
    size_t off = 0;
    while (off < data.size()) {
        const la_ssize_t n = archive_write_data(a, data.data() + off, data.size() - off);
        if (n < 0) {
            return Result::Fail(ErrorKind::Io, "archive_write_data(" + name + "): " + ArchiveError(a));
        }
        off += static_cast<size_t>(n);
    }
    return Result::Ok();
}

Result AddMemoryEntry(struct archive* a, const std::string& name, std::span<const std::uint8_t> data, unsigned perm) {
    auto r = WriteHeader(a, name, data.size(), perm);
    if (!r.is_ok()) return r;
    return WriteData(a, name, data);
}

std::span<const std::uint8_t> AsBytes(const std::string& s) {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

Result AddFileEntry(struct archive* a, const std::string& name, const std::string& src_path) {
    Fd fd(::open(src_path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.Valid()) {
        return Result::Fail(ErrorKind::MissingArtifact,
                            "cannot open artifact " + src_path + " (" + std::strerror(errno) + ")");
    }
    struct stat st{};
    if (::fstat(fd.Get(), &st) != 0) {
        return Result::Fail(ErrorKind::Io, "fstat failed: " + src_path);
    }

    auto r = WriteHeader(a, name, static_cast<std::uint64_t>(st.st_size), 0644);
    if (!r.is_ok()) return r;

    std::vector<std::uint8_t> buf(64 * 1024);
    std::uint64_t total = 0;
    while (true) {
        const ssize_t n = ::read(fd.Get(), buf.data(), buf.size());
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result::Fail(ErrorKind::Io, "read failed: " + src_path + " (" + std::strerror(errno) + ")");
        }
        r = WriteData(a, name, std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!r.is_ok()) return r;
        total += static_cast<std::uint64_t>(n);
    }
    if (total != static_cast<std::uint64_t>(st.st_size)) {
        return Result::Fail(ErrorKind::Io, "artifact changed size while bundling: " + src_path);
    }
    return Result::Ok();
}

} // namespace

std::vector<std::string> BundleAssembler::CollectBinaryPaths(const FlashManifest& manifest) {
    std::vector<std::string> out;
    std::vector<std::string> seen;
    auto add = [&out, &seen](const std::string& p) {
        std::string key = NormalizeArchivePath(p);
        if (std::find(seen.begin(), seen.end(), key) != seen.end()) return;
        seen.push_back(std::move(key));
        out.push_back(p);
    };
    for (const auto& f : manifest.flash_files) add(f.file);
    for (const auto& s : manifest.sections) add(s.file);
    return out;
}

Result BundleAssembler::CheckNotKeyMaterial(const std::string& rel,
                                            const std::string& abs,
                                            const std::string& key_path) const {
    if (!key_path.empty()) {
        std::error_code ec;
        if (fs::exists(key_path, ec) && fs::equivalent(abs, key_path, ec)) {
            return Result::Fail(ErrorKind::Manifest, "artifact " + rel + " is the signing key");
        }
    }

    Fd fd(::open(abs.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.Valid()) {
        return Result::Fail(ErrorKind::MissingArtifact,
                            "cannot open artifact " + abs + " (" + std::strerror(errno) + ")");
    }

    // Scan in blocks, carrying the marker length minus one byte across block edges.
    const size_t keep = kPemPrivateKeyMarker.size() - 1;
    std::vector<char> buf(64 * 1024);
    std::string window;
    while (true) {
        const ssize_t n = ::read(fd.Get(), buf.data(), buf.size());
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result::Fail(ErrorKind::Io, "read failed: " + abs + " (" + std::strerror(errno) + ")");
        }
        window.append(buf.data(), static_cast<size_t>(n));
        if (window.find(kPemPrivateKeyMarker) != std::string::npos) {
            return Result::Fail(ErrorKind::Manifest, "artifact " + rel + " contains private key material");
        }
        if (window.size() > keep) window.erase(0, window.size() - keep);
    }
    return Result::Ok();
}

Result BundleAssembler::ValidateBinaries(const BundleContents& contents,
                                         std::vector<std::string>& normalized) const {
    const ArchivePathPolicy policy(/*safe_paths_only=*/true);
    normalized.clear();
    normalized.reserve(contents.binary_paths.size());

    for (const auto& raw : contents.binary_paths) {
        std::string rel;
        auto r = policy.NormalizeEntryPath(raw, rel);
        if (!r.is_ok()) return r;

        if (rel == kFlashManifestFileName || rel == kFlashScriptFileName || rel == kDigestFileName) {
            return Result::Fail(ErrorKind::Manifest, "artifact path collides with bundle metadata: " + rel);
        }

        if (std::find(normalized.begin(), normalized.end(), rel) != normalized.end()) continue;

        const fs::path abs = fs::path(contents.build_dir) / rel;
        std::error_code ec;
        if (!fs::is_regular_file(abs, ec)) {
            return Result::Fail(ErrorKind::MissingArtifact, "missing artifact: " + abs.string());
        }
        r = CheckNotKeyMaterial(rel, abs.string(), contents.signing_key_path);
        if (!r.is_ok()) return r;
        normalized.push_back(std::move(rel));
    }
    return Result::Ok();
}

Result BundleAssembler::Assemble(const BundleContents& contents, const std::string& output_path) const {
    std::vector<std::string> binaries;
    auto vr = ValidateBinaries(contents, binaries);
    if (!vr.is_ok()) return vr;

    const fs::path out_dir = fs::path(output_path).parent_path();
    if (!out_dir.empty()) {
        std::error_code ec;
        fs::create_directories(out_dir, ec);
        if (ec) {
            return Result::Fail(ErrorKind::Io,
                                "cannot create output directory " + out_dir.string() + ": " + ec.message());
        }
    }

    TempFile tmp;
    auto tr = TempFile::CreateFor(output_path, tmp);
    if (!tr.is_ok()) return tr;

    {
        ArchiveWritePtr a(archive_write_new());
        if (!a) return Result::Fail(ErrorKind::Io, "archive_write_new failed");
        if (archive_write_set_format_zip(a.get()) != ARCHIVE_OK ||
            archive_write_zip_set_compression_deflate(a.get()) != ARCHIVE_OK) {
            return Result::Fail(ErrorKind::Io, "zip format setup failed: " + ArchiveError(a.get()));
        }
        if (archive_write_open_fd(a.get(), tmp.GetFd()) != ARCHIVE_OK) {
            return Result::Fail(ErrorKind::Io, "archive_write_open_fd: " + ArchiveError(a.get()));
        }

        auto r = AddMemoryEntry(a.get(), kFlashManifestFileName, AsBytes(contents.manifest_json), 0644);
        if (!r.is_ok()) return r;
        r = AddMemoryEntry(a.get(), kFlashScriptFileName, AsBytes(contents.flash_script), 0755);
        if (!r.is_ok()) return r;
        if (contents.digest) {
            r = AddMemoryEntry(a.get(), kDigestFileName, *contents.digest, 0644);
            if (!r.is_ok()) return r;
        }

        for (const auto& rel : binaries) {
            const std::string src = (fs::path(contents.build_dir) / rel).string();
            r = AddFileEntry(a.get(), rel, src);
            if (!r.is_ok()) return r;
            LogDebug("bundled %s", rel.c_str());
        }

        if (archive_write_close(a.get()) != ARCHIVE_OK) {
            return Result::Fail(ErrorKind::Io, "archive_write_close: " + ArchiveError(a.get()));
        }
    }

    auto cr = tmp.Commit(output_path);
    if (!cr.is_ok()) return cr;

    LogInfo("Bundle written: %s (%zu binaries%s)",
            output_path.c_str(),
            binaries.size(),
            contents.digest ? ", digest" : "");
    return Result::Ok();
}

} // namespace fwbundle
