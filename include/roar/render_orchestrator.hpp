// === Render Orchestrator =====================================================
//
// Renders every resolved application concurrently on a bounded worker pool.
// Each worker merges identity overrides, acquires a (possibly shared) clone,
// renders the child chart and writes `<output>/<env>/<instance>/<name>.yaml`.
// Failures are isolated per application; all workers run to completion and
// the run reports one aggregate RenderFailure.

#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

#include <spdlog/logger.h>

#include "roar/application_descriptor.hpp"
#include "roar/clone_cache.hpp"
#include "roar/template_engine.hpp"
#include "roar/version_control.hpp"

namespace roar {

inline constexpr std::size_t k_default_max_concurrency{10};

/** @brief Where clones and rendered manifests go, and how many run at once. */
struct OrchestratorConfig final {
    std::filesystem::path output_directory{"rendered"};
    std::filesystem::path workspace_root{};
    std::size_t max_concurrency{k_default_max_concurrency};
};

/** @brief Lifecycle of a single application render. */
enum class WorkerStage {
    Queued,
    Cloning,
    CacheHit,
    Rendering,
    Writing,
    Done
};

[[nodiscard]] std::string_view to_string(WorkerStage stage) noexcept;

/** @brief Result of a fully successful run. */
struct RenderSummary final {
    std::vector<std::filesystem::path> output_files{}; /**< One per application, in input order. */
    std::size_t clone_count{};                        /**< Distinct repository checkouts performed. */
};

class RenderOrchestrator final {
  public:
    RenderOrchestrator(OrchestratorConfig config,
                       TemplateEngine& template_engine,
                       VersionControlClient& version_control,
                       std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Render all applications.
     * @throws RenderFailure naming the failure count and the first failed application's error.
     */
    RenderSummary render_all(const ApplicationDescriptorList& applications);

    /** @brief Setters plus `global.instance` / `global.env` when those are set. */
    [[nodiscard]] static SetterMap build_set_values(const ApplicationDescriptor& application);
    /** @brief `root[/env][/instance]`. */
    [[nodiscard]] static std::filesystem::path output_directory_for(const std::filesystem::path& root,
                                                                    const ApplicationDescriptor& application);

  private:
    std::filesystem::path render_application(const ApplicationDescriptor& application,
                                             CloneCache& clone_cache,
                                             WorkerStage& stage);

    OrchestratorConfig config_;
    TemplateEngine& template_engine_;
    VersionControlClient& version_control_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace roar
