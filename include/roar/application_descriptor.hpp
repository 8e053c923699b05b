// === Application Descriptor ==================================================
//
// Resolved, validated representation of one child application extracted from
// the rendered app-of-apps chart. Descriptors are produced by the application
// parser and treated as immutable by the render orchestrator.

#pragma once

#include <map>
#include <string>
#include <vector>

namespace roar {

/** @brief Name/value pair attached to the plugin source of an Application. */
struct EnvVar final {
    std::string name{};
    std::string value{};

    friend bool operator==(const EnvVar&, const EnvVar&) = default;
};

using EnvVarList = std::vector<EnvVar>;

/** @brief Dotted chart key to string value overrides (`--set key=value`). */
using SetterMap = std::map<std::string, std::string>;

/**
 * @brief A single child application ready to be cloned and rendered.
 *
 * `name` and `repo_url` are never empty on a descriptor returned by the
 * parser. `instance` and `env` are empty when no source supplied them.
 */
struct ApplicationDescriptor final {
    std::string name{};                      /**< Release name and output file stem. */
    std::string instance{};                  /**< Optional output partition and `global.instance`. */
    std::string env{};                       /**< Optional output partition and `global.env`. */
    std::string repo_url{};                  /**< Repository holding the child chart. */
    std::string path{"."};                   /**< Service directory inside the repository. */
    std::string target_revision{};           /**< Branch cloned for this application. */
    EnvVarList plugin_env{};                 /**< Plugin variables not consumed by resolution. */
    std::vector<std::string> values_files{}; /**< Values files relative to `path`, in index order. */
    SetterMap setters{};                     /**< Overrides extracted from `WERF_SET_*` variables. */

    friend bool operator==(const ApplicationDescriptor&, const ApplicationDescriptor&) = default;
};

using ApplicationDescriptorList = std::vector<ApplicationDescriptor>;

}  // namespace roar
