// === Logging =================================================================
//
// Builds the spdlog logger handed to every component. There is no global
// accessor: callers thread the returned handle through constructors.

#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace roar {

/** @brief Sink and level selection for the process logger. */
struct LoggingConfig final {
    std::string level{"warn"};     /**< spdlog level name. */
    std::string log_directory{};   /**< Optional directory for the rotating JSON log; empty disables it. */
};

/** @brief Create the `roar` logger with a stderr console sink and optional file sink. */
std::shared_ptr<spdlog::logger> initialize_logger(const LoggingConfig& config);

/** @brief Apply a level by name, falling back to info on unknown names. */
void set_log_level(spdlog::logger& logger, const std::string& str_level);

}  // namespace roar
