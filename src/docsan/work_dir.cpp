#include "docsan/work_dir.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <memory>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace docsan {

namespace {

class PosixSystemOps final : public WorkDir::ISystemOps {
  public:
    Result CreateTempDir(std::string_view base_dir,
                         std::string_view prefix,
                         std::string& out_dir) const override {
        std::error_code ec;
        fs::path base = base_dir.empty() ? fs::temp_directory_path(ec) : fs::path(base_dir);
        if (ec) {
            base = "/tmp";
            ec.clear();
        }
        fs::create_directories(base, ec);

        std::string tmpl = (base / (std::string(prefix) + "XXXXXX")).string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');

        char* created = ::mkdtemp(buf.data());
        if (!created) {
            const int err = errno;
            return Result::Fail(ErrorKind::TransformFailure,
                                "mkdtemp failed in " + base.string() + ": " + std::strerror(err));
        }

        out_dir = created;
        return Result::Ok();
    }

    void RemoveTree(std::string_view dir) const override {
        std::error_code ec;
        fs::remove_all(fs::path(dir), ec);
        if (ec) {
            LogWarn("cannot remove work directory %.*s: %s",
                    static_cast<int>(dir.size()), dir.data(), ec.message().c_str());
        }
    }
};

} // namespace

std::shared_ptr<const WorkDir::ISystemOps> WorkDir::DefaultSystemOps() {
    static const std::shared_ptr<const ISystemOps> kDefault = std::make_shared<PosixSystemOps>();
    return kDefault;
}

WorkDir::WorkDir() : system_ops_(DefaultSystemOps()) {}

WorkDir::WorkDir(std::shared_ptr<const ISystemOps> system_ops)
    : system_ops_(system_ops ? std::move(system_ops) : DefaultSystemOps()) {}

WorkDir::WorkDir(WorkDir&& other) noexcept
    : system_ops_(std::move(other.system_ops_)), dir_(std::move(other.dir_)) {
    other.dir_.clear();
    other.system_ops_ = DefaultSystemOps();
}

WorkDir& WorkDir::operator=(WorkDir&& other) noexcept {
    if (this == &other)
        return *this;
    Release();
    system_ops_ = std::move(other.system_ops_);
    dir_ = std::move(other.dir_);
    other.dir_.clear();
    other.system_ops_ = DefaultSystemOps();
    return *this;
}

WorkDir::~WorkDir() { Release(); }

Result WorkDir::Create(std::string_view base_dir, std::string_view prefix, WorkDir& out) {
    out.Release();

    auto create_result = out.system_ops_->CreateTempDir(base_dir, prefix, out.dir_);
    if (!create_result.is_ok()) {
        out.dir_.clear();
        return create_result;
    }

    LogDebug("work directory: %s", out.dir_.c_str());
    return Result::Ok();
}

void WorkDir::Release() {
    if (dir_.empty())
        return;
    system_ops_->RemoveTree(dir_);
    LogDebug("removed work directory: %s", dir_.c_str());
    dir_.clear();
}

} // namespace docsan
