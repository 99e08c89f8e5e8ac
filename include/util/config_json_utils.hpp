#pragma once

#include "util/config_parser.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace docsan::config::detail {

bool FillConfigFromJson(const nlohmann::json& j, SanitizerConfig& cfg, std::string& err);

} // namespace docsan::config::detail
