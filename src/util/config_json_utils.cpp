#include "util/config_json_utils.hpp"

#include <cstdint>
#include <limits>

namespace docsan::config::detail {

namespace {

// Absent keys keep the default; present keys of the wrong type are errors.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetIntIfPresent(const nlohmann::json& j, const char* key, int& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be an integer";
        return false;
    }

    // Large unsigned values are rejected before the signed read so they cannot wrap.
    const bool too_big = it->is_number_unsigned() &&
                         it->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    const std::int64_t v = too_big ? 0 : it->get<std::int64_t>();
    if (too_big || v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        err = std::string(key) + " is out of range";
        return false;
    }
    out = static_cast<int>(v);
    return true;
}

} // namespace

bool FillConfigFromJson(const nlohmann::json& j, SanitizerConfig& cfg, std::string& err) {
    if (!GetStringIfPresent(j, "OutputSuffix", cfg.output_suffix, err)) return false;
    if (!GetStringIfPresent(j, "WorkDirBase", cfg.work_dir_base, err)) return false;
    if (!GetStringIfPresent(j, "WorkDirPrefix", cfg.work_dir_prefix, err)) return false;
    if (!GetIntIfPresent(j, "CompressionLevel", cfg.compression_level, err)) return false;

    if (cfg.output_suffix.empty()) {
        err = "OutputSuffix must not be empty";
        return false;
    }
    if (cfg.output_suffix.find('/') != std::string::npos ||
        cfg.work_dir_prefix.find('/') != std::string::npos) {
        err = "OutputSuffix and WorkDirPrefix must not contain '/'";
        return false;
    }
    if (cfg.compression_level < 0 || cfg.compression_level > 9) {
        err = "CompressionLevel must be within 0..9";
        return false;
    }

    {
        std::string level;
        if (!GetStringIfPresent(j, "LogLevel", level, err)) return false;
        if (!level.empty()) {
            auto parsed = ParseLogLevel(level);
            if (!parsed) {
                err = "unknown LogLevel: " + level;
                return false;
            }
            cfg.log_level = *parsed;
        }
    }

    return true;
}

} // namespace docsan::config::detail
