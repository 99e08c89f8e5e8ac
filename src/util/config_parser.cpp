#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace docsan::config {

std::expected<SanitizerConfig, std::string> ParseConfig(const std::string& json_text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    }
    if (!j.is_object()) {
        return std::unexpected("JSON root must be an object");
    }

    SanitizerConfig cfg;
    std::string err;
    if (!detail::FillConfigFromJson(j, cfg, err)) {
        return std::unexpected(err);
    }
    return cfg;
}

Result LoadConfigFile(const std::string& path, SanitizerConfig& out) {
    out = SanitizerConfig{};

    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(ErrorKind::InvalidConfig, "Config: cannot open " + path);
    }
    const std::string text((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());

    auto parsed = ParseConfig(text);
    if (!parsed) {
        return Result::Fail(ErrorKind::InvalidConfig, "Config: " + parsed.error() + " in " + path);
    }

    out = std::move(*parsed);
    return Result::Ok();
}

Result LoadEffectiveConfig(const char* cli_path, SanitizerConfig& out) {
    out = SanitizerConfig{};

    if (cli_path && *cli_path) {
        return LoadConfigFile(cli_path, out);
    }

    const char* env_path = std::getenv(kConfigEnvVar);
    if (env_path && *env_path) {
        return LoadConfigFile(env_path, out);
    }

    std::error_code ec;
    if (!std::filesystem::exists(kDefaultConfigPath, ec)) {
        LogDebug("no config at %s, using defaults", kDefaultConfigPath);
        return Result::Ok();
    }
    return LoadConfigFile(kDefaultConfigPath, out);
}

} // namespace docsan::config
