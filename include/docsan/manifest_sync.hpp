#pragma once

#include "util/result.hpp"

#include <cstddef>
#include <string>
#include <utility>

namespace docsan {

inline constexpr const char* kContentTypesPart = "[Content_Types].xml";
inline constexpr const char* kDocumentRelsPart = "word/_rels/document.xml.rels";

class ManifestSynchronizer {
  public:
    explicit ManifestSynchronizer(std::string work_dir) : work_dir_(std::move(work_dir)) {}

    // Prunes comment entries from both manifests. Absent manifests are skipped.
    Result Run(std::size_t& removed_entries) const;

    // Override entries whose tag text mentions "comments".
    static std::size_t PruneContentTypes(std::string& xml);
    // Relationship entries whose Target mentions "comments", any case.
    static std::size_t PruneRelationships(std::string& xml);

  private:
    Result PruneFile(const char* part,
                     std::size_t (*prune)(std::string&),
                     std::size_t& removed_entries) const;

    std::string work_dir_;
};

} // namespace docsan
