#include "docsan/sanitizer.hpp"

#include "docsan/archive_packer.hpp"
#include "docsan/archive_unpacker.hpp"
#include "docsan/manifest_sync.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <exception>
#include <filesystem>
#include <system_error>
#include <utility>

namespace docsan {

namespace fs = std::filesystem;

DocumentSanitizer::DocumentSanitizer() = default;

DocumentSanitizer::DocumentSanitizer(config::SanitizerConfig cfg,
                                     std::shared_ptr<const WorkDir::ISystemOps> work_dir_ops,
                                     DocumentTransformPipeline::MarkupPasses markup_passes)
    : cfg_(std::move(cfg)),
      work_dir_ops_(std::move(work_dir_ops)),
      markup_passes_(std::move(markup_passes)) {}

Result DocumentSanitizer::ResolvePaths(const SanitizeRequest& request,
                                       const std::string& output_suffix,
                                       std::string& input_abs,
                                       std::string& output_abs) {
    if (request.input_path.empty()) {
        return Result::Fail(ErrorKind::InputNotFound, "no input path given");
    }

    std::error_code ec;
    const fs::path input = fs::absolute(request.input_path, ec);
    if (ec) {
        return Result::Fail(ErrorKind::InputNotFound,
                            "cannot resolve " + request.input_path + ": " + ec.message());
    }
    if (!fs::is_regular_file(input, ec)) {
        return Result::Fail(ErrorKind::InputNotFound, "input file not found: " + input.string());
    }

    fs::path output;
    if (request.output_path.empty()) {
        output = DefaultOutputPath(input, output_suffix);
    } else {
        output = fs::absolute(request.output_path, ec);
        if (ec) {
            return Result::Fail(ErrorKind::OutputFailure,
                                "cannot resolve " + request.output_path + ": " + ec.message());
        }
    }

    input_abs = input.lexically_normal().string();
    output_abs = output.lexically_normal().string();
    return Result::Ok();
}

Result DocumentSanitizer::Run(const SanitizeRequest& request, SanitizeReport& report) const {
    // The work directory lives in RunStages, so it is already released when
    // an exception reaches this frame.
    try {
        return RunStages(request, report);
    } catch (const std::exception& e) {
        LogError("Sanitizing aborted: %s", e.what());
        return Result::Fail(ErrorKind::TransformFailure, std::string("unexpected failure: ") + e.what());
    }
}

Result DocumentSanitizer::RunStages(const SanitizeRequest& request, SanitizeReport& report) const {
    report = SanitizeReport{};

    // Checked before any temporary resource exists.
    auto paths_result =
        ResolvePaths(request, cfg_.output_suffix, report.input_path, report.output_path);
    if (!paths_result.is_ok()) return paths_result;

    LogInfo("Sanitizing %s", report.input_path.c_str());

    WorkDir work_dir(work_dir_ops_);
    auto wd_result = WorkDir::Create(cfg_.work_dir_base, cfg_.work_dir_prefix, work_dir);
    if (!wd_result.is_ok()) return wd_result;

    std::size_t entry_count = 0;
    ArchiveUnpacker unpacker;
    auto unpack_result = unpacker.Unpack(report.input_path, work_dir.Dir(), &entry_count);
    if (!unpack_result.is_ok()) return unpack_result;
    LogInfo("Unpacked %zu entries", entry_count);

    DocumentTransformPipeline pipeline(work_dir.Dir(), markup_passes_);
    auto transform_result = pipeline.Run(report.stats);
    if (!transform_result.is_ok()) return transform_result;

    ManifestSynchronizer manifests(work_dir.Dir());
    auto sync_result = manifests.Run(report.stats.manifest_entries_removed);
    if (!sync_result.is_ok()) return sync_result;

    ArchivePacker packer(ArchivePacker::Options{.compression_level = cfg_.compression_level});
    auto pack_result = packer.Pack(work_dir.Dir(), report.output_path, &entry_count);
    if (!pack_result.is_ok()) return pack_result;

    LogInfo("Wrote %s (%zu entries)", report.output_path.c_str(), entry_count);
    return Result::Ok();
}

} // namespace docsan
