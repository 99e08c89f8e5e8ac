#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace docsan::markup {

// Lightweight tag tokenizer over raw package markup. It does not validate the
// document: it only locates tags and the extent of elements so callers can
// splice text. Comments, CDATA sections, processing instructions and
// declarations are skipped.

enum class TagKind {
    Start, // <p:name ...>
    End,   // </p:name>
    Empty, // <p:name .../>
};

struct Tag {
    TagKind kind = TagKind::Start;
    std::size_t begin = 0; // offset of '<'
    std::size_t end = 0;   // one past '>'
    std::string_view qname;

    // Part after the namespace prefix ("del" for "w:del").
    std::string_view LocalName() const;
};

struct Element {
    Tag start;
    std::size_t content_begin = 0;
    std::size_t content_end = 0;
    std::size_t end = 0; // one past the closing tag, or start.end for empty elements
};

std::optional<Tag> NextTag(std::string_view xml, std::size_t from);

// Next tag of any kind whose local name equals local_name, whatever its prefix.
std::optional<Tag> FindTag(std::string_view xml, std::string_view local_name, std::size_t from);

// Extent of the element opened by start. Nested elements with the same
// qualified name are balanced, so the match ends at the nearest close tag that
// belongs to start. Returns nullopt for an End tag or an unclosed element.
std::optional<Element> MatchElement(std::string_view xml, const Tag& start);

struct Attribute {
    std::size_t begin = 0; // offset of the whitespace before the name
    std::size_t end = 0;   // one past the closing quote
    std::string_view value;
};

// First attribute whose local name is local_name inside a start or empty tag
// text. Offsets are relative to tag_text, so erasing [begin, end) leaves a
// well-formed tag.
std::optional<Attribute> FindAttribute(std::string_view tag_text, std::string_view local_name);

// Value of the attribute whose local name is local_name inside a start or
// empty tag text, e.g. AttributeValue("<a:ext uri=\"x\">", "uri") == "x".
std::optional<std::string_view> AttributeValue(std::string_view tag_text,
                                               std::string_view local_name);

inline std::string_view TagText(std::string_view xml, const Tag& tag) {
    return xml.substr(tag.begin, tag.end - tag.begin);
}

bool IsBlank(std::string_view s);

} // namespace docsan::markup
