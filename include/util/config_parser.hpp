#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <expected>
#include <optional>
#include <string>

namespace docsan::config {

inline constexpr const char* kDefaultConfigPath = "/etc/docsan/docsan.json";
inline constexpr const char* kConfigEnvVar = "DOCSAN_CONFIG";

struct SanitizerConfig {
    std::string output_suffix = "_clean";
    std::string work_dir_base; // empty => system temp directory
    std::string work_dir_prefix = "docsan-";
    int compression_level = 9;
    std::optional<LogLevel> log_level;
};

std::expected<SanitizerConfig, std::string> ParseConfig(const std::string& json_text);

Result LoadConfigFile(const std::string& path, SanitizerConfig& out);

// Resolution order: explicit path, $DOCSAN_CONFIG, kDefaultConfigPath.
// The first two must exist; a missing default file leaves the defaults.
Result LoadEffectiveConfig(const char* cli_path, SanitizerConfig& out);

} // namespace docsan::config
