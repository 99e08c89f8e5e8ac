#pragma once

#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>

namespace docsan {

// Normalize an archive entry path to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
inline std::string NormalizeArchivePath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);
    while (!s.empty() && s.front() == '/') s.erase(0, 1);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    return out;
}

inline bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) return true;
    if (needle.size() > haystack.size()) return false;
    for (size_t i = 0; i + needle.size() <= haystack.size(); ++i) {
        size_t j = 0;
        while (j < needle.size() &&
               std::tolower(static_cast<unsigned char>(haystack[i + j])) ==
                   std::tolower(static_cast<unsigned char>(needle[j]))) {
            ++j;
        }
        if (j == needle.size()) return true;
    }
    return false;
}

// "<dir>/<stem><suffix><ext>" next to the input, e.g. report.docx -> report_clean.docx
inline std::filesystem::path DefaultOutputPath(const std::filesystem::path& input,
                                               std::string_view suffix) {
    std::filesystem::path out = input.parent_path();
    out /= input.stem().string() + std::string(suffix) + input.extension().string();
    return out;
}

} // namespace docsan
