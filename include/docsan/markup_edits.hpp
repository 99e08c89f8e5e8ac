#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace docsan::markup {

// Copies the untouched text between edits and swaps the result in on Commit,
// so a pass costs one copy of the document however many matches it has.
// Edits must be issued in increasing offset order.
class Splicer {
  public:
    explicit Splicer(const std::string& src) : src_(src) {}

    void Drop(std::size_t begin, std::size_t end);
    void Replace(std::size_t begin, std::size_t end, std::string_view with);
    void Commit(std::string& dst);

  private:
    const std::string& src_;
    std::string out_;
    std::size_t cursor_ = 0;
    bool edited_ = false;
};

struct RemovalCount {
    std::size_t blocks = 0; // <x>...</x>
    std::size_t empty = 0;  // <x/>

    std::size_t Total() const { return blocks + empty; }
};

// Receives the text of a start or empty tag; true selects the element.
using TagPredicate = std::function<bool(std::string_view tag_text)>;

// Removes every element with the given local name, content included. An
// element whose close tag is missing is left in place.
RemovalCount RemoveElements(std::string& xml,
                            std::string_view local_name,
                            const TagPredicate& select = nullptr);

// Drops the start and end tags of every element with the given local name
// and keeps its content byte-for-byte. Empty-element forms are dropped as
// well. Returns the number of start tags unwrapped.
std::size_t UnwrapElements(std::string& xml, std::string_view local_name);

// Removes elements with the given local name whose content is whitespace
// only, including the empty-element form.
std::size_t RemoveBlankElements(std::string& xml, std::string_view local_name);

} // namespace docsan::markup
