#include "docsan/document_pipeline.hpp"

#include "docsan/document_passes.hpp"
#include "io/text_file.hpp"
#include "util/logger.hpp"

#include <filesystem>
#include <system_error>

namespace docsan {

namespace fs = std::filesystem;

void DocumentTransformPipeline::ApplyMarkupPasses(std::string& xml, SanitizeStats& stats) {
    stats.svg_extensions_removed += StripSvgExtensions(xml);

    const RevisionCounts revisions = ResolveRevisions(xml);
    stats.deletions_removed += revisions.deletions;
    stats.insertions_accepted += revisions.insertions;
    stats.change_records_removed += revisions.change_records;

    stats.comment_markers_removed += StripCommentMarkers(xml);
    stats.alternate_content_simplified += SimplifyAlternateContent(xml);
}

Result DocumentTransformPipeline::Run(SanitizeStats& stats) const {
    const std::string doc_path = (fs::path(work_dir_) / kMainDocumentPart).string();

    std::string xml;
    auto read_result = ReadTextFile(doc_path, xml);
    if (!read_result.is_ok()) return read_result;
    LogDebug("Loaded %s (%zu bytes)", kMainDocumentPart, xml.size());

    passes_(xml, stats);

    auto parts_result = RemoveCommentParts(stats);
    if (!parts_result.is_ok()) return parts_result;

    auto write_result = WriteTextFile(doc_path, xml);
    if (!write_result.is_ok()) return write_result;

    LogDebug("Wrote %s (%zu bytes)", kMainDocumentPart, xml.size());
    return Result::Ok();
}

Result DocumentTransformPipeline::RemoveCommentParts(SanitizeStats& stats) const {
    for (const char* part : kCommentParts) {
        const fs::path p = fs::path(work_dir_) / part;

        std::error_code ec;
        const bool removed = fs::remove(p, ec);
        if (ec) {
            return Result::Fail(ErrorKind::TransformFailure,
                                "cannot remove " + std::string(part) + ": " + ec.message());
        }
        if (removed) {
            LogDebug("Removed %s", part);
            ++stats.comment_parts_removed;
        }
    }
    return Result::Ok();
}

} // namespace docsan
