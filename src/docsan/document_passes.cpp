#include "docsan/document_passes.hpp"

#include "docsan/markup_edits.hpp"
#include "docsan/markup_scanner.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <array>
#include <optional>

namespace docsan {

namespace {

constexpr std::array<std::string_view, 9> kChangeRecords = {
    "pPrChange",
    "rPrChange",
    "sectPrChange",
    "tblPrChange",
    "tblPrExChange",
    "trPrChange",
    "tcPrChange",
    "tblGridChange",
    "numberingChange",
};

constexpr std::array<std::string_view, 4> kMoveRangeMarkers = {
    "moveFromRangeStart",
    "moveFromRangeEnd",
    "moveToRangeStart",
    "moveToRangeEnd",
};

constexpr std::array<std::string_view, 3> kCommentMarkers = {
    "commentRangeStart",
    "commentRangeEnd",
    "commentReference",
};

// Drops w:rsidDel="..." from every start and empty tag. Text between tags is
// never touched.
void StripDeletionRsids(std::string& xml) {
    const std::string_view view(xml);
    markup::Splicer splicer(xml);

    std::size_t pos = 0;
    while (auto tag = markup::NextTag(view, pos)) {
        pos = tag->end;
        if (tag->kind == markup::TagKind::End) continue;

        const auto text = markup::TagText(view, *tag);
        auto attr = markup::FindAttribute(text, "rsidDel");
        if (!attr) continue;

        splicer.Drop(tag->begin + attr->begin, tag->begin + attr->end);
    }

    splicer.Commit(xml);
}

std::optional<markup::Element> FindFallback(std::string_view xml, const markup::Element& block) {
    std::size_t pos = block.content_begin;
    while (auto tag = markup::NextTag(xml, pos)) {
        if (tag->begin >= block.content_end) break;
        if (tag->kind == markup::TagKind::End) {
            pos = tag->end;
            continue;
        }

        auto child = markup::MatchElement(xml, *tag);
        if (!child) return std::nullopt;
        if (tag->LocalName() == "Fallback") return child;
        pos = child->end;
    }
    return std::nullopt;
}

} // namespace

std::size_t StripSvgExtensions(std::string& xml) {
    const auto removed = markup::RemoveElements(xml, "ext", [](std::string_view tag_text) {
        auto uri = markup::AttributeValue(tag_text, "uri");
        return uri && uri->size() == kSvgBlipExtensionUri.size() &&
               ContainsIgnoreCase(*uri, kSvgBlipExtensionUri);
    });

    const std::size_t emptied = markup::RemoveBlankElements(xml, "extLst");
    LogDebug("svg extensions: %zu removed, %zu empty extLst dropped", removed.Total(), emptied);
    return removed.Total();
}

RevisionCounts ResolveRevisions(std::string& xml) {
    RevisionCounts counts;

    // Reject deletions before accepting insertions so an insertion nested in a
    // deletion disappears with it.
    counts.deletions += markup::RemoveElements(xml, "del").blocks;
    counts.deletions += markup::RemoveElements(xml, "moveFrom").blocks;

    counts.insertions += markup::UnwrapElements(xml, "ins");
    counts.insertions += markup::UnwrapElements(xml, "moveTo");

    for (const auto name : kChangeRecords) {
        counts.change_records += markup::RemoveElements(xml, name).Total();
    }
    for (const auto name : kMoveRangeMarkers) {
        (void)markup::RemoveElements(xml, name);
    }

    StripDeletionRsids(xml);

    LogDebug("revisions: %zu deletions, %zu insertions, %zu change records",
             counts.deletions, counts.insertions, counts.change_records);
    return counts;
}

std::size_t StripCommentMarkers(std::string& xml) {
    std::size_t removed = 0;
    for (const auto name : kCommentMarkers) {
        removed += markup::RemoveElements(xml, name).Total();
    }
    LogDebug("comment markers: %zu removed", removed);
    return removed;
}

std::size_t SimplifyAlternateContent(std::string& xml) {
    std::size_t simplified = 0;
    const std::string_view view(xml);
    markup::Splicer splicer(xml);

    std::size_t pos = 0;
    while (auto tag = markup::FindTag(view, "AlternateContent", pos)) {
        pos = tag->end;
        if (tag->kind != markup::TagKind::Start) continue;

        auto block = markup::MatchElement(view, *tag);
        if (!block) {
            LogWarn("unclosed <%.*s> at offset %zu left in place",
                    static_cast<int>(tag->qname.size()), tag->qname.data(), tag->begin);
            continue;
        }

        // Without a Fallback the wrapper stays; scanning continues inside it.
        auto fallback = FindFallback(view, *block);
        if (!fallback) continue;

        std::string kept(view.substr(fallback->content_begin,
                                     fallback->content_end - fallback->content_begin));
        simplified += 1 + SimplifyAlternateContent(kept);

        splicer.Replace(block->start.begin, block->end, kept);
        pos = block->end;
    }

    splicer.Commit(xml);
    return simplified;
}

} // namespace docsan
