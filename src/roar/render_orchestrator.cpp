#include "roar/render_orchestrator.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "roar/errors.hpp"
#include "roar/repository_identity.hpp"
#include "roar/worker_pool.hpp"

namespace roar {

namespace {

constexpr char k_chart_directory[] = ".helm";
constexpr char k_instance_key[] = "global.instance";
constexpr char k_env_key[] = "global.env";

/** Join without letting an absolute `relative` escape `base`. */
std::filesystem::path join_inside(const std::filesystem::path& base, const std::string& relative) {
    return (base / std::filesystem::path{relative}.relative_path()).lexically_normal();
}

void write_manifest(const std::filesystem::path& output_file, const std::string& manifest) {
    std::ofstream stream(output_file, std::ios::binary | std::ios::trunc);
    if (!stream) {
        throw std::runtime_error("failed to open " + output_file.string() + " for writing");
    }
    stream.write(manifest.data(), static_cast<std::streamsize>(manifest.size()));
    if (!stream) {
        throw std::runtime_error("failed to write manifest to " + output_file.string());
    }
}

}  // namespace

std::string_view to_string(WorkerStage stage) noexcept {
    switch (stage) {
        case WorkerStage::Queued:
            return "queued";
        case WorkerStage::Cloning:
            return "cloning";
        case WorkerStage::CacheHit:
            return "cache-hit";
        case WorkerStage::Rendering:
            return "rendering";
        case WorkerStage::Writing:
            return "writing";
        case WorkerStage::Done:
            return "done";
    }
    return "unknown";
}

RenderOrchestrator::RenderOrchestrator(OrchestratorConfig config,
                                       TemplateEngine& template_engine,
                                       VersionControlClient& version_control,
                                       std::shared_ptr<spdlog::logger> logger)
    : config_(std::move(config)),
      template_engine_(template_engine),
      version_control_(version_control),
      logger_(std::move(logger)) {}

SetterMap RenderOrchestrator::build_set_values(const ApplicationDescriptor& application) {
    SetterMap set_values = application.setters;
    if (!application.instance.empty()) {
        set_values[k_instance_key] = application.instance;
    }
    if (!application.env.empty()) {
        set_values[k_env_key] = application.env;
    }
    return set_values;
}

std::filesystem::path RenderOrchestrator::output_directory_for(const std::filesystem::path& root,
                                                               const ApplicationDescriptor& application) {
    std::filesystem::path directory = root;
    if (!application.env.empty()) {
        directory /= application.env;
    }
    if (!application.instance.empty()) {
        directory /= application.instance;
    }
    return directory;
}

RenderSummary RenderOrchestrator::render_all(const ApplicationDescriptorList& applications) {
    CloneCache clone_cache{config_.workspace_root, version_control_, logger_};
    RenderSummary summary{};
    summary.output_files.resize(applications.size());

    std::mutex failures_mutex;
    std::map<std::size_t, std::string> map_failures;

    const std::size_t worker_count = std::min(std::max<std::size_t>(1, config_.max_concurrency), applications.size());
    logger_->info("Rendering {} application(s) with {} worker(s)", applications.size(), worker_count);

    if (!applications.empty()) {
        // Pool tasks must not throw: every failure is recorded here instead.
        const auto record_failure = [&](std::size_t index, std::string_view reason, WorkerStage stage) {
            const ApplicationDescriptor& application = applications[index];
            logger_->error("Application {} failed while {}: {}", application.name, to_string(stage), reason);
            std::scoped_lock lock(failures_mutex);
            map_failures.emplace(index, fmt::format("application '{}' failed while {}: {}",
                                                    application.name, to_string(stage), reason));
        };

        WorkerPool pool{worker_count};
        for (std::size_t index = 0; index < applications.size(); ++index) {
            pool.submit([&, index]() {
                const ApplicationDescriptor& application = applications[index];
                WorkerStage stage = WorkerStage::Queued;
                try {
                    summary.output_files[index] = render_application(application, clone_cache, stage);
                } catch (const std::exception& exc) {
                    record_failure(index, exc.what(), stage);
                } catch (...) {
                    record_failure(index, "unknown error", stage);
                }
            });
        }
        pool.wait_idle();
    }

    summary.clone_count = clone_cache.clone_count();
    if (!map_failures.empty()) {
        logger_->error("Completed with {} errors.", map_failures.size());
        throw RenderFailure(map_failures.size(), map_failures.begin()->second);
    }

    logger_->info("Rendered {} application(s) from {} clone(s)", applications.size(), summary.clone_count);
    return summary;
}

std::filesystem::path RenderOrchestrator::render_application(const ApplicationDescriptor& application,
                                                             CloneCache& clone_cache,
                                                             WorkerStage& stage) {
    logger_->info("Application {}: processing", application.name);

    RenderOptions options{};
    options.release_name = application.name;
    options.set_values = build_set_values(application);
    logger_->info("Application {}: {} --set value(s) and {} values file(s)",
                  application.name, options.set_values.size(), application.values_files.size());

    const std::string normalized_repository = normalize_repository_url(application.repo_url);

    stage = WorkerStage::Cloning;
    const CloneLease lease = clone_cache.acquire(normalized_repository, application.target_revision);
    if (lease.cache_hit) {
        stage = WorkerStage::CacheHit;
        logger_->info("Application {}: using cached repository from path {}", application.name, lease.path.string());
    }

    const std::filesystem::path service_path = join_inside(lease.path, application.path);
    options.chart_path = service_path / k_chart_directory;
    options.values_files.reserve(application.values_files.size());
    for (const std::string& values_file : application.values_files) {
        options.values_files.push_back(join_inside(service_path, values_file));
    }

    stage = WorkerStage::Rendering;
    const std::string manifest = template_engine_.render(options);

    stage = WorkerStage::Writing;
    const std::filesystem::path output_directory = output_directory_for(config_.output_directory, application);
    std::filesystem::create_directories(output_directory);
    const std::filesystem::path output_file = output_directory / (application.name + ".yaml");
    write_manifest(output_file, manifest);

    stage = WorkerStage::Done;
    logger_->info("Application {}: saved manifest to {}", application.name, output_file.string());
    return output_file;
}

}  // namespace roar
