// === Application Parser ======================================================
//
// Turns the rendered app-of-apps manifest stream into ApplicationDescriptor
// values. Documents that are not Argo CD Applications are skipped; any
// malformed document or unresolvable Application fails the whole call.
//
// Resolution merges redundant metadata into one descriptor:
// - `instance`/`env` come from labels or from `WERF_SET_INSTANCE` /
//   `WERF_SET_ENV` plugin variables; differing values are a conflict.
// - `WERF_VALUES_<N>` variables become values files ordered by N.
// - `WERF_SET_*` variables holding `key=value` become setters.
// - `rawRepository`/`rawPath` annotations take priority over spec.source.

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

#include "roar/application_descriptor.hpp"

namespace roar {

inline constexpr std::string_view k_application_api_version{"argoproj.io/v1alpha1"};
inline constexpr std::string_view k_application_kind{"Application"};

/** @brief Fields of one manifest document as decoded from YAML, before resolution. */
struct RawApplication final {
    std::string api_version{};
    std::string kind{};
    std::string name{};
    std::map<std::string, std::string> labels{};
    std::map<std::string, std::string> annotations{};
    std::string repo_url{};
    std::string path{};
    std::string target_revision{};
    std::optional<EnvVarList> plugin_env{}; /**< Unset when the source has no plugin block. */
};

/** @brief True when the document declares the Argo CD Application type. */
[[nodiscard]] bool is_application(const RawApplication& raw) noexcept;

/**
 * @brief Resolve a decoded Application into a validated descriptor.
 * @throws ApplicationParseError on instance/env conflicts or a missing repository.
 */
[[nodiscard]] ApplicationDescriptor resolve_application(const RawApplication& raw, spdlog::logger& logger);

/**
 * @brief Parse every Application in a multi-document YAML stream, in order.
 * @throws ApplicationParseError when any document is malformed or invalid.
 */
[[nodiscard]] ApplicationDescriptorList parse_applications(std::string_view yaml_stream, spdlog::logger& logger);

}  // namespace roar
