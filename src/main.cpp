#include "docsan/sanitizer.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <getopt.h>
#include <optional>
#include <string>

namespace {

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-o <output.docx>] [-c <config.json>] [-v|-q] <input.docx>\n"
        "   %s -i <input.docx> [-o <output.docx>] ...\n"
        "\n"
        "Options:\n"
        "  -i, --input            Input .docx package\n"
        "  -o, --output           Output path (default: <input>_clean.docx beside the input)\n"
        "  -c, --config           JSON config file (default: $DOCSAN_CONFIG, then %s)\n"
        "  -v, --verbose          Debug logging\n"
        "  -q, --quiet            Errors only\n"
        "  -h, --help             Show this help\n",
        argv, argv, docsan::config::kDefaultConfigPath);
}

void PrintSummary(const docsan::SanitizeReport &report) {
    const auto &s = report.stats;
    std::printf("Sanitized document written to %s\n", report.output_path.c_str());
    std::printf("  SVG extensions removed:        %zu\n", s.svg_extensions_removed);
    std::printf("  Deletions removed:             %zu\n", s.deletions_removed);
    std::printf("  Insertions accepted:           %zu\n", s.insertions_accepted);
    std::printf("  Comment markers removed:       %zu\n", s.comment_markers_removed);
    std::printf("  Alternate content simplified:  %zu\n", s.alternate_content_simplified);
    std::printf("  Change records removed:        %zu\n", s.change_records_removed);
    std::printf("  Comment parts removed:         %zu\n", s.comment_parts_removed);
    std::printf("  Manifest entries removed:      %zu\n", s.manifest_entries_removed);
}

} // namespace

int main(int argc, char **argv) {
    const char *in = nullptr;
    const char *out = nullptr;
    const char *config_path = nullptr;
    std::optional<docsan::LogLevel> cli_level;

    static option long_opts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"output", required_argument, nullptr, 'o'},
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hi:o:c:vq", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'i':
                in = optarg;
                break;

            case 'o':
                out = optarg;
                break;

            case 'c':
                config_path = optarg;
                break;

            case 'v':
                cli_level = docsan::LogLevel::Debug;
                break;

            case 'q':
                cli_level = docsan::LogLevel::Error;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (!in && optind < argc) {
        in = argv[optind++];
    }
    if (!in || optind < argc) {
        PrintUsage(argv[0]);
        return 2;
    }

    if (cli_level) {
        docsan::Logger::Instance().SetLevel(*cli_level);
    }

    docsan::config::SanitizerConfig cfg;
    if (auto r = docsan::config::LoadEffectiveConfig(config_path, cfg); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }
    if (cfg.log_level && !cli_level) {
        docsan::Logger::Instance().SetLevel(*cfg.log_level);
    }

    docsan::SanitizeRequest request;
    request.input_path = in;
    if (out) {
        request.output_path = out;
    }

    docsan::DocumentSanitizer sanitizer(cfg);
    docsan::SanitizeReport report;
    auto res = sanitizer.Run(request, report);
    if (!res.ok) {
        std::fprintf(stderr, "ERROR: [%s] %s\n", docsan::ToString(res.kind), res.msg.c_str());
        return 1;
    }

    PrintSummary(report);
    return 0;
}
