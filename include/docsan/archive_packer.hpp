#pragma once

#include "util/result.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace docsan {

class ArchivePacker {
  public:
    struct Options {
        int compression_level = 9; // 0 stores entries uncompressed
    };

    struct PackEntry {
        std::string relative_path; // '/'-separated; directories end with '/'
        std::string source_path;
        bool is_directory = false;
    };

    ArchivePacker() = default;
    explicit ArchivePacker(const Options& opt) : opt_(opt) {}

    /**
     * @brief Writes every file under src_dir into a zip at output_path, entry
     *        names relative to src_dir. An existing output file is replaced.
     */
    Result Pack(const std::string& src_dir,
                const std::string& output_path,
                std::size_t* entries_out = nullptr) const;

    // [Content_Types].xml first, then files and empty directories by path.
    static Result CollectEntries(const std::string& src_dir, std::vector<PackEntry>& out);

  private:
    Result WriteZip(const std::vector<PackEntry>& entries, const std::string& zip_path) const;

    Options opt_{};
};

} // namespace docsan
