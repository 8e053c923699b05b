// === Configuration ===========================================================
//
// Strongly-typed run settings. `ConfigurationLoader` reads the command line
// (chart path, values files, output directory, log level) and a handful of
// `ROAR_*` environment knobs so that downstream modules never touch argv or
// `std::getenv` directly.

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "roar/logging.hpp"
#include "roar/render_orchestrator.hpp"

namespace roar {

/**
 * @brief Immutable bundle of settings for one render run.
 *
 * Populated by ConfigurationLoader; consumers treat the values as
 * authoritative.
 */
struct Configuration final {
    std::filesystem::path chart_path{};                /**< Root app-of-apps chart. */
    std::vector<std::filesystem::path> values_files{}; /**< Values files for the root chart, in order. */
    std::filesystem::path output_directory{"rendered"};
    LoggingConfig logging{};
    std::size_t max_concurrency{k_default_max_concurrency};
    std::string helm_binary{"helm"};
    std::string git_binary{"git"};
    bool show_version{};
    bool show_help{};
    std::vector<std::string> list_warnings{};          /**< Ignored inputs, logged once the logger exists. */
};

/** @brief Builds Configuration from argv and the process environment. */
class ConfigurationLoader final {
  public:
    /** @throws UsageError on unknown flags, missing values or a wrong positional count. */
    static Configuration load(int argc, const char* const argv[]);

    /** @brief Help text printed for `--help` and usage errors. */
    static std::string usage(std::string_view program_name);

  private:
    static void load_environment(Configuration& config);
};

}  // namespace roar
