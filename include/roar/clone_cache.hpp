// === Clone Cache =============================================================
//
// Shares repository checkouts between render workers. Each distinct
// `<normalized repository>@<revision>` key is cloned exactly once into
// `<workspace>/clone-<N>`; workers racing on the same key wait for the
// in-flight clone and reuse its result (or its failure).

#pragma once

#include <cstddef>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <spdlog/logger.h>

#include "roar/version_control.hpp"

namespace roar {

/** @brief Outcome of a cache lookup. */
struct CloneLease final {
    std::filesystem::path path{}; /**< Local checkout root. */
    bool cache_hit{};             /**< False only for the caller that performed the clone. */
};

/** @brief Thread-safe, append-only map from cache key to local checkout. */
class CloneCache final {
  public:
    CloneCache(std::filesystem::path workspace_root,
               VersionControlClient& version_control,
               std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Return the checkout for `normalized_repository` at `revision`, cloning on first use.
     * @throws CloneError (or whatever the client threw) for every caller of a failed key.
     */
    [[nodiscard]] CloneLease acquire(const std::string& normalized_repository, const std::string& revision);

    /** @brief Number of distinct keys a clone was started for. */
    [[nodiscard]] std::size_t clone_count() const;

  private:
    std::filesystem::path workspace_root_;
    VersionControlClient& version_control_;
    std::shared_ptr<spdlog::logger> logger_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_future<std::filesystem::path>> map_clones_;
    std::size_t clone_counter_{0};
};

}  // namespace roar
