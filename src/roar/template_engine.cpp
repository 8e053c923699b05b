#include "roar/template_engine.hpp"

#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "roar/errors.hpp"
#include "roar/process.hpp"

namespace roar {

HelmTemplateEngine::HelmTemplateEngine(std::string helm_binary, std::shared_ptr<spdlog::logger> logger)
    : str_helm_binary_(std::move(helm_binary)),
      logger_(std::move(logger)) {}

std::vector<std::string> HelmTemplateEngine::build_arguments(const RenderOptions& options) const {
    std::vector<std::string> arguments{
        str_helm_binary_,
        "template",
        options.release_name,
        options.chart_path.string(),
    };
    for (const auto& values_file : options.values_files) {
        arguments.emplace_back("-f");
        arguments.push_back(values_file.string());
    }
    for (const auto& [key, value] : options.set_values) {
        arguments.emplace_back("--set");
        arguments.push_back(fmt::format("{}={}", key, value));
    }
    return arguments;
}

std::string HelmTemplateEngine::render(const RenderOptions& options) {
    const std::vector<std::string> arguments = build_arguments(options);
    logger_->debug("Running {}", fmt::join(arguments, " "));

    ProcessResult result{};
    try {
        result = run_process(arguments);
    } catch (const ProcessError& exc) {
        throw TemplateError(fmt::format("helm template failed for release {}: {}", options.release_name, exc.what()));
    }

    if (result.exit_code != 0) {
        throw TemplateError(fmt::format(
            "helm template failed for release {} (exit code {}): {}",
            options.release_name,
            result.exit_code,
            result.stderr_text
        ));
    }
    return std::move(result.stdout_text);
}

}  // namespace roar
