#pragma once

#include <cstddef>

namespace docsan {

struct SanitizeStats {
    std::size_t svg_extensions_removed = 0;
    std::size_t deletions_removed = 0;
    std::size_t insertions_accepted = 0;
    std::size_t comment_markers_removed = 0;
    std::size_t alternate_content_simplified = 0;

    std::size_t change_records_removed = 0;
    std::size_t comment_parts_removed = 0;
    std::size_t manifest_entries_removed = 0;
};

} // namespace docsan
