#include "roar/workspace.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>
#include <vector>

#include <stdlib.h>

#include <fmt/format.h>

#include "roar/errors.hpp"

namespace roar {

TemporaryWorkspace::TemporaryWorkspace(const std::string& prefix, std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {
    std::error_code error_temp;
    const std::filesystem::path temp_root = std::filesystem::temp_directory_path(error_temp);
    if (error_temp) {
        throw WorkspaceError(fmt::format("failed to locate temp directory: {}", error_temp.message()));
    }

    const std::string pattern = (temp_root / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        throw WorkspaceError(fmt::format("failed to create temp directory {}: {}", pattern, std::strerror(errno)));
    }
    path_ = buffer.data();
    logger_->info("Using temporary directory for clones: {}", path_.string());
}

TemporaryWorkspace::~TemporaryWorkspace() {
    std::error_code error_remove;
    std::filesystem::remove_all(path_, error_remove);
    if (error_remove) {
        logger_->warn("Failed to remove temporary directory {}: {}", path_.string(), error_remove.message());
    }
}

const std::filesystem::path& TemporaryWorkspace::path() const noexcept {
    return path_;
}

}  // namespace roar
