#include "roar/clone_cache.hpp"

#include <exception>
#include <utility>

#include <fmt/format.h>

#include "roar/repository_identity.hpp"

namespace roar {

CloneCache::CloneCache(std::filesystem::path workspace_root,
                       VersionControlClient& version_control,
                       std::shared_ptr<spdlog::logger> logger)
    : workspace_root_(std::move(workspace_root)),
      version_control_(version_control),
      logger_(std::move(logger)) {}

CloneLease CloneCache::acquire(const std::string& normalized_repository, const std::string& revision) {
    const std::string cache_key = make_cache_key(normalized_repository, revision);

    std::promise<std::filesystem::path> clone_promise;
    std::shared_future<std::filesystem::path> clone_future;
    std::filesystem::path clone_path;
    bool owns_clone = false;
    {
        std::scoped_lock lock(mutex_);
        const auto it = map_clones_.find(cache_key);
        if (it == map_clones_.end()) {
            ++clone_counter_;
            clone_path = workspace_root_ / fmt::format("clone-{}", clone_counter_);
            clone_future = clone_promise.get_future().share();
            map_clones_.emplace(cache_key, clone_future);
            owns_clone = true;
        } else {
            clone_future = it->second;
        }
    }

    if (!owns_clone) {
        logger_->debug("Waiting for cached checkout of {}", cache_key);
        return CloneLease{clone_future.get(), true};
    }

    logger_->info("Cloning {} to {}", cache_key, clone_path.string());
    try {
        version_control_.clone(normalized_repository, revision, clone_path);
    } catch (const std::exception&) {
        // Waiters on this key observe the same failure.
        clone_promise.set_exception(std::current_exception());
        throw;
    }
    clone_promise.set_value(clone_path);
    return CloneLease{clone_path, false};
}

std::size_t CloneCache::clone_count() const {
    std::scoped_lock lock(mutex_);
    return clone_counter_;
}

}  // namespace roar
