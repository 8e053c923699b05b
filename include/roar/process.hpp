// === Process Runner ==========================================================
//
// Synchronous execution of external tools (helm, git) with captured output.
// Safe to call from several worker threads at once.

#pragma once

#include <string>
#include <vector>

namespace roar {

/** @brief Exit status and captured streams of a finished child process. */
struct ProcessResult final {
    int exit_code{};           /**< Exit status, or 128 + signal number when killed. */
    std::string stdout_text{};
    std::string stderr_text{};
};

/**
 * @brief Run `arguments[0]` (looked up in PATH) and wait for it to exit.
 * @throws ProcessError when the command cannot be started.
 */
[[nodiscard]] ProcessResult run_process(const std::vector<std::string>& arguments);

}  // namespace roar
