#include "roar/version_control.hpp"

#include <utility>

#include <fmt/format.h>

#include "roar/errors.hpp"
#include "roar/process.hpp"

namespace roar {

GitCliClient::GitCliClient(std::string git_binary, std::shared_ptr<spdlog::logger> logger)
    : str_git_binary_(std::move(git_binary)),
      logger_(std::move(logger)) {}

std::vector<std::string> GitCliClient::build_arguments(const std::string& repository_address,
                                                       const std::string& revision,
                                                       const std::filesystem::path& destination) const {
    std::vector<std::string> arguments{str_git_binary_, "clone", "--quiet", "--depth", "1", "--single-branch"};
    if (!revision.empty()) {
        arguments.emplace_back("--branch");
        arguments.push_back(revision);
    }
    arguments.emplace_back("--");
    arguments.push_back(repository_address);
    arguments.push_back(destination.string());
    return arguments;
}

void GitCliClient::clone(const std::string& repository_address,
                         const std::string& revision,
                         const std::filesystem::path& destination) {
    logger_->info("Cloning {} (revision {}) into {}", repository_address, revision, destination.string());

    ProcessResult result{};
    try {
        result = run_process(build_arguments(repository_address, revision, destination));
    } catch (const ProcessError& exc) {
        throw CloneError(fmt::format("git clone failed for {} (revision {}): {}", repository_address, revision, exc.what()));
    }

    if (result.exit_code != 0) {
        throw CloneError(fmt::format(
            "git clone failed for {} (revision {}, exit code {}): {}",
            repository_address,
            revision,
            result.exit_code,
            result.stderr_text
        ));
    }
    logger_->debug("Cloned {} (revision {})", repository_address, revision);
}

}  // namespace roar
