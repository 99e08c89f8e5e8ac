#pragma once

#include "util/result.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace docsan {

// Owns an ephemeral directory tree for one sanitizer run. The tree is removed
// when the owner is destroyed, whichever way the run ends.
class WorkDir {
  public:
    class ISystemOps {
      public:
        virtual ~ISystemOps() = default;
        virtual Result CreateTempDir(std::string_view base_dir,
                                     std::string_view prefix,
                                     std::string& out_dir) const = 0;
        virtual void RemoveTree(std::string_view dir) const = 0;
    };

    WorkDir();
    explicit WorkDir(std::shared_ptr<const ISystemOps> system_ops);
    WorkDir(const WorkDir&) = delete;
    WorkDir& operator=(const WorkDir&) = delete;
    WorkDir(WorkDir&& other) noexcept;
    WorkDir& operator=(WorkDir&& other) noexcept;
    ~WorkDir();

    // Empty base_dir means the system temporary directory.
    static Result Create(std::string_view base_dir, std::string_view prefix, WorkDir& out);

    void Release();
    const std::string& Dir() const { return dir_; }
    bool Active() const { return !dir_.empty(); }

  private:
    static std::shared_ptr<const ISystemOps> DefaultSystemOps();

    std::shared_ptr<const ISystemOps> system_ops_;
    std::string dir_;
};

} // namespace docsan
