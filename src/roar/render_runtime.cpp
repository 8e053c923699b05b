#include "roar/render_runtime.hpp"

#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "roar/application_parser.hpp"
#include "roar/errors.hpp"
#include "roar/workspace.hpp"

namespace roar {

namespace {
constexpr char k_workspace_prefix[] = "roar-clones-";
}  // namespace

RenderRuntime::RenderRuntime(const Configuration& configuration,
                             TemplateEngine& template_engine,
                             VersionControlClient& version_control,
                             std::shared_ptr<spdlog::logger> logger)
    : configuration_(configuration),
      template_engine_(template_engine),
      version_control_(version_control),
      logger_(std::move(logger)) {}

RenderSummary RenderRuntime::run() {
    const TemporaryWorkspace workspace{k_workspace_prefix, logger_};

    std::error_code error_output;
    std::filesystem::create_directories(configuration_.output_directory, error_output);
    if (error_output) {
        throw WorkspaceError(fmt::format("failed to create output directory {}: {}",
                                         configuration_.output_directory.string(), error_output.message()));
    }

    ApplicationDescriptorList applications;
    try {
        applications = render_and_parse_app_of_apps();
    } catch (const ApplicationParseError& exc) {
        throw ApplicationParseError(fmt::format("initialization failed: {}", exc.what()));
    } catch (const TemplateError& exc) {
        throw TemplateError(fmt::format("initialization failed: {}", exc.what()));
    }

    OrchestratorConfig orchestrator_config{};
    orchestrator_config.output_directory = configuration_.output_directory;
    orchestrator_config.workspace_root = workspace.path();
    orchestrator_config.max_concurrency = configuration_.max_concurrency;

    RenderOrchestrator orchestrator{orchestrator_config, template_engine_, version_control_, logger_};
    RenderSummary summary = orchestrator.render_all(applications);
    logger_->info("All {} application(s) rendered into {}", summary.output_files.size(),
                  configuration_.output_directory.string());
    return summary;
}

ApplicationDescriptorList RenderRuntime::render_and_parse_app_of_apps() {
    logger_->info("Rendering the main 'app-of-apps' chart from {}", configuration_.chart_path.string());
    RenderOptions options{};
    options.release_name = k_app_of_apps_release;
    options.chart_path = configuration_.chart_path;
    options.values_files = configuration_.values_files;
    const std::string manifests = template_engine_.render(options);

    logger_->info("Parsing for Argo CD applications...");
    ApplicationDescriptorList applications = parse_applications(manifests, *logger_);
    logger_->info("Found {} applications to process.", applications.size());
    return applications;
}

}  // namespace roar
