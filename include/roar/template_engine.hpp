// === Template Engine =========================================================
//
// Boundary to the chart templating tool. The orchestrator only depends on the
// abstract TemplateEngine; HelmTemplateEngine shells out to `helm template`.

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "roar/application_descriptor.hpp"

namespace roar {

/** @brief Inputs for rendering one chart. */
struct RenderOptions final {
    std::string release_name{};
    std::filesystem::path chart_path{};
    std::vector<std::filesystem::path> values_files{}; /**< Applied in order. */
    SetterMap set_values{};
};

/** @brief Renders a chart directory plus values into manifest text. */
class TemplateEngine {
  public:
    virtual ~TemplateEngine() = default;

    /**
     * @brief Render the chart and return the manifest stream verbatim.
     * @throws TemplateError when rendering fails.
     */
    [[nodiscard]] virtual std::string render(const RenderOptions& options) = 0;
};

/** @brief TemplateEngine backed by the `helm template` command. */
class HelmTemplateEngine final : public TemplateEngine {
  public:
    HelmTemplateEngine(std::string helm_binary, std::shared_ptr<spdlog::logger> logger);

    [[nodiscard]] std::string render(const RenderOptions& options) override;

    /** @brief Full argv for `options`; `--set` flags follow key order. */
    [[nodiscard]] std::vector<std::string> build_arguments(const RenderOptions& options) const;

  private:
    std::string str_helm_binary_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace roar
