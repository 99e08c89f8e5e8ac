#include "docsan/markup_edits.hpp"

#include "docsan/markup_scanner.hpp"
#include "util/logger.hpp"

namespace docsan::markup {

namespace {

void WarnUnclosed(const Tag& tag) {
    LogWarn("unclosed <%.*s> at offset %zu left in place",
            static_cast<int>(tag.qname.size()), tag.qname.data(), tag.begin);
}

} // namespace

void Splicer::Drop(std::size_t begin, std::size_t end) {
    if (!edited_) out_.reserve(src_.size());
    out_.append(src_, cursor_, begin - cursor_);
    cursor_ = end;
    edited_ = true;
}

void Splicer::Replace(std::size_t begin, std::size_t end, std::string_view with) {
    Drop(begin, end);
    out_.append(with);
}

void Splicer::Commit(std::string& dst) {
    if (!edited_) return;
    out_.append(src_, cursor_, std::string::npos);
    dst.swap(out_);
    out_.clear();
    cursor_ = 0;
    edited_ = false;
}

RemovalCount RemoveElements(std::string& xml,
                            std::string_view local_name,
                            const TagPredicate& select) {
    RemovalCount count;
    const std::string_view view(xml);
    Splicer splicer(xml);

    std::size_t pos = 0;
    while (auto tag = FindTag(view, local_name, pos)) {
        pos = tag->end;
        if (tag->kind == TagKind::End) continue;
        if (select && !select(TagText(view, *tag))) continue;

        auto element = MatchElement(view, *tag);
        if (!element) {
            WarnUnclosed(*tag);
            continue;
        }

        splicer.Drop(element->start.begin, element->end);
        pos = element->end;
        if (tag->kind == TagKind::Empty) {
            ++count.empty;
        } else {
            ++count.blocks;
        }
    }

    splicer.Commit(xml);
    return count;
}

std::size_t UnwrapElements(std::string& xml, std::string_view local_name) {
    std::size_t unwrapped = 0;
    const std::string_view view(xml);
    Splicer splicer(xml);

    std::size_t pos = 0;
    while (auto tag = FindTag(view, local_name, pos)) {
        splicer.Drop(tag->begin, tag->end);
        pos = tag->end;
        if (tag->kind == TagKind::Start) ++unwrapped;
    }

    splicer.Commit(xml);
    return unwrapped;
}

std::size_t RemoveBlankElements(std::string& xml, std::string_view local_name) {
    std::size_t removed = 0;
    const std::string_view view(xml);
    Splicer splicer(xml);

    std::size_t pos = 0;
    while (auto tag = FindTag(view, local_name, pos)) {
        pos = tag->end;
        if (tag->kind == TagKind::End) continue;

        auto element = MatchElement(view, *tag);
        if (!element) continue;

        const auto content = view.substr(element->content_begin,
                                         element->content_end - element->content_begin);
        if (!IsBlank(content)) continue;

        splicer.Drop(element->start.begin, element->end);
        pos = element->end;
        ++removed;
    }

    splicer.Commit(xml);
    return removed;
}

} // namespace docsan::markup
