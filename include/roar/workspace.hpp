// === Temporary Workspace =====================================================
//
// Process-lifetime scratch directory holding every repository checkout. The
// directory is removed when the owning object is destroyed, whether the run
// succeeded or not.

#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace roar {

class TemporaryWorkspace final {
  public:
    /**
     * @brief Create `<system temp>/<prefix>XXXXXX`.
     * @throws WorkspaceError when the directory cannot be created.
     */
    TemporaryWorkspace(const std::string& prefix, std::shared_ptr<spdlog::logger> logger);
    ~TemporaryWorkspace();

    TemporaryWorkspace(const TemporaryWorkspace&) = delete;
    TemporaryWorkspace& operator=(const TemporaryWorkspace&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept;

  private:
    std::filesystem::path path_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace roar
