#include "docsan/markup_scanner.hpp"

#include <cctype>

namespace docsan::markup {

namespace {

bool IsNameChar(char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '_' || c == '-' || c == '.' || c == ':' || uc >= 0x80;
}

bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool StartsWithAt(std::string_view s, std::size_t pos, std::string_view prefix) {
    return s.size() >= pos + prefix.size() && s.compare(pos, prefix.size(), prefix) == 0;
}

std::string_view LocalPart(std::string_view qname) {
    const auto colon = qname.find(':');
    return colon == std::string_view::npos ? qname : qname.substr(colon + 1);
}

// Offset of the '>' closing the tag whose name ends at from, skipping quoted
// attribute values.
std::size_t FindTagClose(std::string_view xml, std::size_t from) {
    char quote = 0;
    for (std::size_t i = from; i < xml.size(); ++i) {
        const char c = xml[i];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '>') {
            return i;
        }
    }
    return std::string_view::npos;
}

} // namespace

std::string_view Tag::LocalName() const {
    return LocalPart(qname);
}

std::optional<Tag> NextTag(std::string_view xml, std::size_t from) {
    std::size_t pos = from;
    while (pos < xml.size()) {
        pos = xml.find('<', pos);
        if (pos == std::string_view::npos) return std::nullopt;

        if (StartsWithAt(xml, pos, "<!--")) {
            const auto close = xml.find("-->", pos + 4);
            if (close == std::string_view::npos) return std::nullopt;
            pos = close + 3;
            continue;
        }
        if (StartsWithAt(xml, pos, "<![CDATA[")) {
            const auto close = xml.find("]]>", pos + 9);
            if (close == std::string_view::npos) return std::nullopt;
            pos = close + 3;
            continue;
        }
        if (StartsWithAt(xml, pos, "<?")) {
            const auto close = xml.find("?>", pos + 2);
            if (close == std::string_view::npos) return std::nullopt;
            pos = close + 2;
            continue;
        }
        if (StartsWithAt(xml, pos, "<!")) {
            const auto close = xml.find('>', pos + 2);
            if (close == std::string_view::npos) return std::nullopt;
            pos = close + 1;
            continue;
        }

        const bool closing = StartsWithAt(xml, pos, "</");
        const std::size_t name_begin = pos + (closing ? 2 : 1);
        std::size_t name_end = name_begin;
        while (name_end < xml.size() && IsNameChar(xml[name_end])) ++name_end;
        if (name_end == name_begin) {
            ++pos; // stray '<' in text
            continue;
        }

        const std::size_t gt = FindTagClose(xml, name_end);
        if (gt == std::string_view::npos) return std::nullopt;

        Tag tag;
        tag.begin = pos;
        tag.end = gt + 1;
        tag.qname = xml.substr(name_begin, name_end - name_begin);
        if (closing) {
            tag.kind = TagKind::End;
        } else if (xml[gt - 1] == '/') {
            tag.kind = TagKind::Empty;
        } else {
            tag.kind = TagKind::Start;
        }
        return tag;
    }
    return std::nullopt;
}

std::optional<Tag> FindTag(std::string_view xml, std::string_view local_name, std::size_t from) {
    std::size_t pos = from;
    while (auto tag = NextTag(xml, pos)) {
        if (tag->LocalName() == local_name) return tag;
        pos = tag->end;
    }
    return std::nullopt;
}

std::optional<Element> MatchElement(std::string_view xml, const Tag& start) {
    if (start.kind == TagKind::End) return std::nullopt;

    if (start.kind == TagKind::Empty) {
        return Element{start, start.end, start.end, start.end};
    }

    int depth = 1;
    std::size_t pos = start.end;
    while (auto tag = NextTag(xml, pos)) {
        pos = tag->end;
        if (tag->qname != start.qname) continue;

        if (tag->kind == TagKind::Start) {
            ++depth;
        } else if (tag->kind == TagKind::End && --depth == 0) {
            return Element{start, start.end, tag->begin, tag->end};
        }
    }
    return std::nullopt;
}

std::optional<Attribute> FindAttribute(std::string_view tag_text, std::string_view local_name) {
    std::size_t i = 0;
    if (StartsWithAt(tag_text, 0, "<")) ++i;
    while (i < tag_text.size() && IsNameChar(tag_text[i])) ++i; // element name

    while (i < tag_text.size()) {
        const std::size_t attr_begin = i;
        while (i < tag_text.size() && IsSpace(tag_text[i])) ++i;
        const std::size_t name_begin = i;
        while (i < tag_text.size() && IsNameChar(tag_text[i])) ++i;
        if (i == name_begin) return std::nullopt; // '/', '>' or junk

        const auto name = tag_text.substr(name_begin, i - name_begin);
        while (i < tag_text.size() && IsSpace(tag_text[i])) ++i;
        if (i >= tag_text.size() || tag_text[i] != '=') return std::nullopt;
        ++i;
        while (i < tag_text.size() && IsSpace(tag_text[i])) ++i;
        if (i >= tag_text.size()) return std::nullopt;

        const char quote = tag_text[i];
        if (quote != '"' && quote != '\'') return std::nullopt;
        const auto value_end = tag_text.find(quote, i + 1);
        if (value_end == std::string_view::npos) return std::nullopt;

        if (LocalPart(name) == local_name) {
            return Attribute{attr_begin, value_end + 1, tag_text.substr(i + 1, value_end - i - 1)};
        }
        i = value_end + 1;
    }
    return std::nullopt;
}

std::optional<std::string_view> AttributeValue(std::string_view tag_text,
                                               std::string_view local_name) {
    auto attr = FindAttribute(tag_text, local_name);
    if (!attr) return std::nullopt;
    return attr->value;
}

bool IsBlank(std::string_view s) {
    for (char c : s) {
        if (!IsSpace(c)) return false;
    }
    return true;
}

} // namespace docsan::markup
