#include "docsan/archive_unpacker.hpp"

#include "docsan/archive_path_policy.hpp"
#include "docsan/document_pipeline.hpp"
#include "util/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <filesystem>
#include <memory>

namespace docsan {

namespace {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

std::string ArchiveErr(archive* a) {
    const char* s = archive_error_string(a);
    return s ? std::string(s) : std::string("unknown libarchive error");
}

} // namespace

Result ArchiveUnpacker::Unpack(const std::string& archive_path,
                               const std::string& dst_dir,
                               std::size_t* entries_out) const {
    namespace fs = std::filesystem;

    const fs::path base_dir(dst_dir);

    std::error_code ec;
    if (!fs::is_directory(base_dir, ec) || ec) {
        return Result::Fail(ErrorKind::TransformFailure, "Work directory does not exist: " + dst_dir);
    }

    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return Result::Fail(ErrorKind::InvalidArchive, "archive_read_new failed");

    archive_read_support_format_zip(ar.get());

    if (archive_read_open_filename(ar.get(), archive_path.c_str(), 10240) != ARCHIVE_OK) {
        return Result::Fail(ErrorKind::InvalidArchive,
                            "Could not open archive " + archive_path + ": " + ArchiveErr(ar.get()));
    }

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_disk_new());
    if (!aw) return Result::Fail(ErrorKind::TransformFailure, "archive_write_disk_new failed");

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    // Entry paths are rewritten to absolute paths under dst_dir, so
    // NOABSOLUTEPATHS would reject every valid target.

    archive_write_disk_set_options(aw.get(), flags);
    archive_write_disk_set_standard_lookup(aw.get());

    ArchivePathPolicy path_policy;
    std::size_t extracted = 0;
    archive_entry* entry = nullptr;

    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            return Result::Fail(ErrorKind::InvalidArchive,
                                "archive_read_next_header: " + ArchiveErr(ar.get()));
        }

        std::string rel;
        auto path_res = path_policy.NormalizeEntryPath(archive_entry_pathname(entry), rel);
        if (!path_res.is_ok()) return path_res;
        if (rel.empty() || rel == ".") {
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        const auto type = archive_entry_filetype(entry);
        if (type != AE_IFREG && type != AE_IFDIR) {
            LogWarn("skipping non-regular entry: %s", rel.c_str());
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        // Zip writers on other platforms may store no usable mode bits.
        archive_entry_set_perm(entry, type == AE_IFDIR ? 0755 : 0644);

        const std::string target_path = (base_dir / fs::path(rel)).string();
        archive_entry_set_pathname(entry, target_path.c_str());

        LogDebug("entry: %s", rel.c_str());

        const int wh = archive_write_header(aw.get(), entry);
        if (wh != ARCHIVE_OK) {
            return Result::Fail(ErrorKind::TransformFailure,
                                "archive_write_header: " + ArchiveErr(aw.get()));
        }

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;

        while (true) {
            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr != ARCHIVE_OK) {
                return Result::Fail(ErrorKind::InvalidArchive,
                                    "archive_read_data_block: " + ArchiveErr(ar.get()));
            }

            const la_ssize_t ww = archive_write_data_block(aw.get(), buff, size, offset);
            if (ww != ARCHIVE_OK) {
                return Result::Fail(ErrorKind::TransformFailure,
                                    "archive_write_data_block: " + ArchiveErr(aw.get()));
            }
        }

        const int wf = archive_write_finish_entry(aw.get());
        if (wf != ARCHIVE_OK) {
            return Result::Fail(ErrorKind::TransformFailure,
                                "archive_write_finish_entry: " + ArchiveErr(aw.get()));
        }
        ++extracted;
    }

    if (archive_write_close(aw.get()) != ARCHIVE_OK) {
        return Result::Fail(ErrorKind::TransformFailure, "archive_write_close: " + ArchiveErr(aw.get()));
    }

    if (entries_out) *entries_out = extracted;
    LogDebug("extracted %zu entries from %s", extracted, archive_path.c_str());

    if (!fs::is_regular_file(base_dir / kMainDocumentPart, ec)) {
        return Result::Fail(ErrorKind::MissingCoreFile,
                            std::string(kMainDocumentPart) + " not found in " + archive_path +
                                " (not a word-processing package?)");
    }

    return Result::Ok();
}

} // namespace docsan
