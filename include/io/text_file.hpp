#pragma once

#include "util/result.hpp"

#include <string>

namespace docsan {

// Whole-file text access for package parts. A leading UTF-8 byte-order mark
// is dropped on read; writes never emit one.
Result ReadTextFile(const std::string& path, std::string& out);
Result WriteTextFile(const std::string& path, const std::string& content);

} // namespace docsan
