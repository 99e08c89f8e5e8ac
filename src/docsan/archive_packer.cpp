#include "docsan/archive_packer.hpp"

#include "docsan/manifest_sync.hpp"
#include "util/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sys/stat.h>
#include <system_error>

namespace docsan {

namespace fs = std::filesystem;

namespace {

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

struct ArchiveEntryDeleter {
    void operator()(archive_entry* e) const {
        if (e) archive_entry_free(e);
    }
};

std::string ArchiveErr(archive* a) {
    const char* s = archive_error_string(a);
    return s ? std::string(s) : std::string("unknown libarchive error");
}

Result ConfigureZip(archive* a, int level) {
    if (archive_write_set_format_zip(a) != ARCHIVE_OK) {
        return Result::Fail(ErrorKind::OutputFailure, "archive_write_set_format_zip: " + ArchiveErr(a));
    }

    const char* method = (level == 0) ? "store" : "deflate";
    if (archive_write_set_format_option(a, "zip", "compression", method) != ARCHIVE_OK) {
        return Result::Fail(ErrorKind::OutputFailure,
                            std::string("zip compression=") + method + ": " + ArchiveErr(a));
    }

    if (level > 0) {
        const std::string lvl = std::to_string(level);
        if (archive_write_set_format_option(a, "zip", "compression-level", lvl.c_str()) != ARCHIVE_OK) {
            // Older libarchive has no level option and always deflates at its default.
            LogWarn("zip compression-level=%s not supported: %s", lvl.c_str(), ArchiveErr(a).c_str());
        }
    }
    return Result::Ok();
}

} // namespace

Result ArchivePacker::CollectEntries(const std::string& src_dir, std::vector<PackEntry>& out) {
    out.clear();

    const fs::path root(src_dir);
    std::error_code ec;
    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        return Result::Fail(ErrorKind::OutputFailure, "cannot list " + src_dir + ": " + ec.message());
    }

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return Result::Fail(ErrorKind::OutputFailure, "cannot list " + src_dir + ": " + ec.message());
        }

        const fs::directory_entry& de = *it;
        const std::string rel = de.path().lexically_relative(root).generic_string();

        if (de.is_directory(ec)) {
            if (fs::is_empty(de.path(), ec)) {
                out.push_back({rel + "/", de.path().string(), true});
            }
        } else if (de.is_regular_file(ec)) {
            out.push_back({rel, de.path().string(), false});
        } else {
            LogWarn("skipping non-regular file: %s", rel.c_str());
        }
    }
    if (ec) {
        return Result::Fail(ErrorKind::OutputFailure, "cannot list " + src_dir + ": " + ec.message());
    }

    std::sort(out.begin(), out.end(), [](const PackEntry& a, const PackEntry& b) {
        const bool a_ct = a.relative_path == kContentTypesPart;
        const bool b_ct = b.relative_path == kContentTypesPart;
        if (a_ct != b_ct) return a_ct;
        return a.relative_path < b.relative_path;
    });
    return Result::Ok();
}

Result ArchivePacker::Pack(const std::string& src_dir,
                           const std::string& output_path,
                           std::size_t* entries_out) const {
    std::vector<PackEntry> entries;
    auto collect_result = CollectEntries(src_dir, entries);
    if (!collect_result.is_ok()) return collect_result;

    // Stage beside the target so the final rename replaces it in one step.
    const std::string staging_path = output_path + ".partial";
    auto write_result = WriteZip(entries, staging_path);
    if (!write_result.is_ok()) {
        std::error_code ec;
        fs::remove(staging_path, ec);
        return write_result;
    }

    std::error_code ec;
    fs::rename(staging_path, output_path, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(staging_path, rm_ec);
        return Result::Fail(ErrorKind::OutputFailure,
                            "cannot move archive into place at " + output_path + ": " + ec.message());
    }

    if (entries_out) *entries_out = entries.size();
    LogDebug("packed %zu entries into %s", entries.size(), output_path.c_str());
    return Result::Ok();
}

Result ArchivePacker::WriteZip(const std::vector<PackEntry>& entries, const std::string& zip_path) const {
    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_new());
    if (!aw) return Result::Fail(ErrorKind::OutputFailure, "archive_write_new failed");

    auto cfg_result = ConfigureZip(aw.get(), opt_.compression_level);
    if (!cfg_result.is_ok()) return cfg_result;

    if (archive_write_open_filename(aw.get(), zip_path.c_str()) != ARCHIVE_OK) {
        return Result::Fail(ErrorKind::OutputFailure,
                            "cannot create " + zip_path + ": " + ArchiveErr(aw.get()));
    }

    std::array<char, 64 * 1024> buf{};

    for (const auto& e : entries) {
        struct stat st{};
        if (::stat(e.source_path.c_str(), &st) != 0) {
            return Result::Fail(ErrorKind::OutputFailure,
                                "stat " + e.source_path + ": " + std::strerror(errno));
        }

        std::unique_ptr<archive_entry, ArchiveEntryDeleter> hdr(archive_entry_new());
        if (!hdr) return Result::Fail(ErrorKind::OutputFailure, "archive_entry_new failed");

        archive_entry_set_pathname(hdr.get(), e.relative_path.c_str());
        archive_entry_set_mtime(hdr.get(), st.st_mtime, 0);
        if (e.is_directory) {
            archive_entry_set_filetype(hdr.get(), AE_IFDIR);
            archive_entry_set_perm(hdr.get(), 0755);
            archive_entry_set_size(hdr.get(), 0);
        } else {
            archive_entry_set_filetype(hdr.get(), AE_IFREG);
            archive_entry_set_perm(hdr.get(), 0644);
            archive_entry_set_size(hdr.get(), static_cast<la_int64_t>(st.st_size));
        }

        if (archive_write_header(aw.get(), hdr.get()) != ARCHIVE_OK) {
            return Result::Fail(ErrorKind::OutputFailure,
                                "archive_write_header " + e.relative_path + ": " + ArchiveErr(aw.get()));
        }
        if (e.is_directory) continue;

        std::ifstream is(e.source_path, std::ios::binary);
        if (!is.good()) {
            return Result::Fail(ErrorKind::OutputFailure, "cannot open " + e.source_path);
        }
        while (is) {
            is.read(buf.data(), static_cast<std::streamsize>(buf.size()));
            const std::streamsize n = is.gcount();
            if (n <= 0) break;
            if (archive_write_data(aw.get(), buf.data(), static_cast<size_t>(n)) < 0) {
                return Result::Fail(ErrorKind::OutputFailure,
                                    "archive_write_data " + e.relative_path + ": " + ArchiveErr(aw.get()));
            }
        }
        if (is.bad()) {
            return Result::Fail(ErrorKind::OutputFailure, "read failed: " + e.source_path);
        }
    }

    if (archive_write_close(aw.get()) != ARCHIVE_OK) {
        return Result::Fail(ErrorKind::OutputFailure,
                            "archive_write_close " + zip_path + ": " + ArchiveErr(aw.get()));
    }
    return Result::Ok();
}

} // namespace docsan
