#pragma once

#include "docsan/sanitize_stats.hpp"
#include "util/result.hpp"

#include <array>
#include <functional>
#include <string>
#include <utility>

namespace docsan {

inline constexpr const char* kMainDocumentPart = "word/document.xml";

inline constexpr std::array<const char*, 4> kCommentParts = {
    "word/comments.xml",
    "word/commentsExtended.xml",
    "word/commentsIds.xml",
    "word/commentsExtensible.xml",
};

class DocumentTransformPipeline {
  public:
    using MarkupPasses = std::function<void(std::string& xml, SanitizeStats& stats)>;

    // Text passes only, in pipeline order.
    static void ApplyMarkupPasses(std::string& xml, SanitizeStats& stats);

    explicit DocumentTransformPipeline(std::string work_dir, MarkupPasses passes = nullptr)
        : work_dir_(std::move(work_dir)),
          passes_(passes ? std::move(passes) : MarkupPasses(&ApplyMarkupPasses)) {}

    /**
     * @brief Rewrites word/document.xml under the work directory and removes
     *        the comment parts. Any read, write or delete failure is fatal.
     */
    Result Run(SanitizeStats& stats) const;

  private:
    Result RemoveCommentParts(SanitizeStats& stats) const;

    std::string work_dir_;
    MarkupPasses passes_;
};

} // namespace docsan
