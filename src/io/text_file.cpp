#include "io/text_file.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string_view>

namespace docsan {

namespace {
constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";
} // namespace

Result ReadTextFile(const std::string& path, std::string& out) {
    out.clear();

    std::ifstream is(path, std::ios::binary);
    if (!is.good()) {
        return Result::Fail(ErrorKind::TransformFailure,
                            "cannot open " + path + " (" + std::strerror(errno) + ")");
    }

    out.assign(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
    if (is.bad()) {
        return Result::Fail(ErrorKind::TransformFailure, "read failed: " + path);
    }

    if (std::string_view(out).substr(0, kUtf8Bom.size()) == kUtf8Bom) {
        out.erase(0, kUtf8Bom.size());
    }
    return Result::Ok();
}

Result WriteTextFile(const std::string& path, const std::string& content) {
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    if (!os.good()) {
        return Result::Fail(ErrorKind::TransformFailure,
                            "cannot open for writing " + path + " (" + std::strerror(errno) + ")");
    }

    os.write(content.data(), static_cast<std::streamsize>(content.size()));
    os.flush();
    if (!os.good()) {
        return Result::Fail(ErrorKind::TransformFailure, "write failed: " + path);
    }
    return Result::Ok();
}

} // namespace docsan
