#pragma once

#include "util/result.hpp"

#include <string>

namespace docsan {

// Maps raw archive entry names to paths that stay inside the work directory.
class ArchivePathPolicy {
  public:
    Result NormalizeEntryPath(const char* raw_path, std::string& out_relative) const;

  private:
    static bool IsSafeRelativePath(const std::string& p);
};

} // namespace docsan
