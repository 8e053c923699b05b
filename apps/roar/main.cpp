#include <cstdlib>
#include <iostream>

#include <spdlog/spdlog.h>

#include "roar/configuration.hpp"
#include "roar/errors.hpp"
#include "roar/logging.hpp"
#include "roar/render_runtime.hpp"
#include "roar/template_engine.hpp"
#include "roar/version.hpp"
#include "roar/version_control.hpp"

int main(int argc, char* argv[]) {
    using namespace roar;

    const char* const program_name = "roar";

    Configuration configuration{};
    try {
        configuration = ConfigurationLoader::load(argc, argv);
    } catch (const UsageError& exc) {
        std::cerr << "Error: " << exc.what() << "\n\n" << ConfigurationLoader::usage(program_name);
        return EXIT_FAILURE;
    }

    if (configuration.show_help) {
        std::cout << ConfigurationLoader::usage(program_name);
        return EXIT_SUCCESS;
    }
    if (configuration.show_version) {
        std::cout << "roar version: " << k_version << '\n';
        return EXIT_SUCCESS;
    }

    try {
        auto logger = initialize_logger(configuration.logging);
        for (const std::string& warning : configuration.list_warnings) {
            logger->warn(warning);
        }

        try {
            HelmTemplateEngine template_engine{configuration.helm_binary, logger};
            GitCliClient version_control{configuration.git_binary, logger};
            RenderRuntime runtime{configuration, template_engine, version_control, logger};
            runtime.run();
        } catch (const std::exception& exc) {
            logger->critical("Application failed: {}", exc.what());
            logger->flush();
            return EXIT_FAILURE;
        }
    } catch (const std::exception& exc) {
        std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
