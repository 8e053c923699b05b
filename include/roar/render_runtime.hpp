// === Render Runtime ==========================================================
//
// Top-level run: prepare the workspace and output directory, render the
// app-of-apps chart, resolve its Applications and hand them to the
// RenderOrchestrator. Runs once and returns.

#pragma once

#include <memory>

#include <spdlog/logger.h>

#include "roar/application_descriptor.hpp"
#include "roar/configuration.hpp"
#include "roar/render_orchestrator.hpp"
#include "roar/template_engine.hpp"
#include "roar/version_control.hpp"

namespace roar {

inline constexpr char k_app_of_apps_release[] = "app-of-apps";

class RenderRuntime final {
  public:
    RenderRuntime(const Configuration& configuration,
                  TemplateEngine& template_engine,
                  VersionControlClient& version_control,
                  std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Execute the whole pipeline.
     * @throws WorkspaceError, ApplicationParseError, TemplateError (root chart) or RenderFailure.
     */
    RenderSummary run();

  private:
    /** @brief Render the root chart and resolve the Applications it declares. */
    ApplicationDescriptorList render_and_parse_app_of_apps();

    const Configuration& configuration_;
    TemplateEngine& template_engine_;
    VersionControlClient& version_control_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace roar
