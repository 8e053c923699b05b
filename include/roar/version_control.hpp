// === Version Control =========================================================
//
// Boundary to the repository checkout tool. GitCliClient performs a shallow,
// single-branch clone with the `git` command.

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

namespace roar {

/** @brief Materializes one repository revision onto local storage. */
class VersionControlClient {
  public:
    virtual ~VersionControlClient() = default;

    /**
     * @brief Check out `revision` of `repository_address` into `destination`.
     * @throws CloneError when the checkout fails.
     */
    virtual void clone(const std::string& repository_address,
                       const std::string& revision,
                       const std::filesystem::path& destination) = 0;
};

/** @brief VersionControlClient backed by `git clone --depth 1 --single-branch`. */
class GitCliClient final : public VersionControlClient {
  public:
    GitCliClient(std::string git_binary, std::shared_ptr<spdlog::logger> logger);

    void clone(const std::string& repository_address,
               const std::string& revision,
               const std::filesystem::path& destination) override;

    /** @brief Full argv; `--branch` is omitted for an empty revision. */
    [[nodiscard]] std::vector<std::string> build_arguments(const std::string& repository_address,
                                                           const std::string& revision,
                                                           const std::filesystem::path& destination) const;

  private:
    std::string str_git_binary_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace roar
