#pragma once

#include "docsan/document_pipeline.hpp"
#include "docsan/sanitize_stats.hpp"
#include "docsan/work_dir.hpp"
#include "util/config_parser.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>

namespace docsan {

struct SanitizeRequest {
    std::string input_path;
    std::string output_path; // empty => <stem><OutputSuffix><ext> beside the input
};

struct SanitizeReport {
    SanitizeStats stats;
    std::string input_path;  // absolute
    std::string output_path; // absolute
};

// unpack -> transform -> synchronize manifests -> pack; the work directory is
// removed on every exit path, including exceptions escaping a stage.
class DocumentSanitizer {
  public:
    DocumentSanitizer();
    explicit DocumentSanitizer(config::SanitizerConfig cfg,
                               std::shared_ptr<const WorkDir::ISystemOps> work_dir_ops = nullptr,
                               DocumentTransformPipeline::MarkupPasses markup_passes = nullptr);

    Result Run(const SanitizeRequest& request, SanitizeReport& report) const;

    static Result ResolvePaths(const SanitizeRequest& request,
                               const std::string& output_suffix,
                               std::string& input_abs,
                               std::string& output_abs);

  private:
    Result RunStages(const SanitizeRequest& request, SanitizeReport& report) const;

    config::SanitizerConfig cfg_;
    std::shared_ptr<const WorkDir::ISystemOps> work_dir_ops_;
    DocumentTransformPipeline::MarkupPasses markup_passes_;
};

} // namespace docsan
