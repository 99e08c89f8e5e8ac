#include "docsan/manifest_sync.hpp"

#include "docsan/markup_edits.hpp"
#include "docsan/markup_scanner.hpp"
#include "io/text_file.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <filesystem>
#include <system_error>

namespace docsan {

namespace fs = std::filesystem;

std::size_t ManifestSynchronizer::PruneContentTypes(std::string& xml) {
    return markup::RemoveElements(xml, "Override", [](std::string_view tag_text) {
        return tag_text.find("comments") != std::string_view::npos;
    }).Total();
}

std::size_t ManifestSynchronizer::PruneRelationships(std::string& xml) {
    return markup::RemoveElements(xml, "Relationship", [](std::string_view tag_text) {
        auto target = markup::AttributeValue(tag_text, "Target");
        return target && ContainsIgnoreCase(*target, "comments");
    }).Total();
}

Result ManifestSynchronizer::Run(std::size_t& removed_entries) const {
    auto ct_result = PruneFile(kContentTypesPart, &PruneContentTypes, removed_entries);
    if (!ct_result.is_ok()) return ct_result;

    return PruneFile(kDocumentRelsPart, &PruneRelationships, removed_entries);
}

Result ManifestSynchronizer::PruneFile(const char* part,
                                       std::size_t (*prune)(std::string&),
                                       std::size_t& removed_entries) const {
    const fs::path p = fs::path(work_dir_) / part;

    std::error_code ec;
    if (!fs::exists(p, ec)) {
        if (ec) {
            return Result::Fail(ErrorKind::TransformFailure,
                                "cannot stat " + std::string(part) + ": " + ec.message());
        }
        LogDebug("%s not present, skipped", part);
        return Result::Ok();
    }

    std::string xml;
    auto read_result = ReadTextFile(p.string(), xml);
    if (!read_result.is_ok()) return read_result;

    const std::size_t removed = prune(xml);
    if (removed == 0) return Result::Ok();

    auto write_result = WriteTextFile(p.string(), xml);
    if (!write_result.is_ok()) return write_result;

    LogDebug("%s: %zu comment entries removed", part, removed);
    removed_entries += removed;
    return Result::Ok();
}

} // namespace docsan
