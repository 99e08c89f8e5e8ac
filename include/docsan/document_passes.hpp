#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace docsan {

// a:ext uri of the SVG blip extension that carries the vector copy of a picture.
inline constexpr std::string_view kSvgBlipExtensionUri = "{96DAC541-7B7A-43D3-8B79-37D633B846F1}";

struct RevisionCounts {
    std::size_t deletions = 0;      // del and moveFrom blocks removed
    std::size_t insertions = 0;     // ins and moveTo blocks unwrapped
    std::size_t change_records = 0; // *PrChange and friends removed
};

// Each pass rewrites the main document text in place and returns how many
// constructs it handled. They are meant to run in the order declared here.

std::size_t StripSvgExtensions(std::string& xml);

RevisionCounts ResolveRevisions(std::string& xml);

std::size_t StripCommentMarkers(std::string& xml);

// Replaces each AlternateContent block that has a Fallback child with the
// Fallback's content. Outer blocks are handled first and the kept content is
// simplified again, so nested blocks are counted as well.
std::size_t SimplifyAlternateContent(std::string& xml);

} // namespace docsan
