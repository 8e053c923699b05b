// === Errors ==================================================================
//
// Exception types raised across the renderer. Input and environment errors
// abort a run; clone and template errors are isolated to a single application
// and surface upward only through RenderFailure.

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace roar {

/** @brief Malformed YAML or an Application that cannot be resolved. */
class ApplicationParseError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief An external command could not be spawned or awaited. */
class ProcessError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief The version-control collaborator failed to materialize a revision. */
class CloneError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief The templating collaborator failed to render a chart. */
class TemplateError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Temporary workspace or output directory could not be prepared. */
class WorkspaceError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Invalid command line. */
class UsageError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Aggregate of per-application failures from a render run. */
class RenderFailure : public std::runtime_error {
  public:
    RenderFailure(std::size_t failure_count, const std::string& first_error);

    [[nodiscard]] std::size_t failure_count() const noexcept;

  private:
    std::size_t failure_count_;
};

}  // namespace roar
