#pragma once

#include "util/result.hpp"

#include <cstddef>
#include <string>

namespace docsan {

class ArchiveUnpacker {
  public:
    ArchiveUnpacker() = default;

    /**
     * @brief Extracts every entry of a zip package under dst_dir, keeping
     *        relative paths.
     * @param archive_path Path to the .docx package.
     * @param dst_dir Existing, empty work directory.
     * @param entries_out Optional count of entries written.
     *
     * Fails with InvalidArchive when the package cannot be read or holds an
     * unsafe path, and with MissingCoreFile when word/document.xml is absent.
     */
    Result Unpack(const std::string& archive_path,
                  const std::string& dst_dir,
                  std::size_t* entries_out = nullptr) const;
};

} // namespace docsan
