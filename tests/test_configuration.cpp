#include <cstdlib>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "roar/configuration.hpp"
#include "roar/errors.hpp"

using namespace roar;

namespace {

Configuration load(std::vector<const char*> arguments) {
    arguments.insert(arguments.begin(), "roar");
    return ConfigurationLoader::load(static_cast<int>(arguments.size()), arguments.data());
}

}  // namespace

TEST_CASE("ConfigurationLoader applies defaults") {
    ::unsetenv("ROAR_MAX_CONCURRENCY");
    const Configuration config = load({"charts/app-of-apps"});

    REQUIRE(config.chart_path == "charts/app-of-apps");
    REQUIRE(config.values_files.empty());
    REQUIRE(config.output_directory == "rendered");
    REQUIRE(config.logging.level == "warn");
    REQUIRE(config.max_concurrency == k_default_max_concurrency);
    REQUIRE_FALSE(config.show_version);
}

TEST_CASE("ConfigurationLoader reads every flag spelling") {
    const Configuration config = load({
        "-f", "base.yaml",
        "--values", "dev.yaml,extra.yaml",
        "--values=last.yaml",
        "-ooutput",
        "--log-level", "debug",
        "chart",
    });

    REQUIRE(config.chart_path == "chart");
    REQUIRE(config.values_files == std::vector<std::filesystem::path>{"base.yaml", "dev.yaml", "extra.yaml", "last.yaml"});
    REQUIRE(config.output_directory == "output");
    REQUIRE(config.logging.level == "debug");
}

TEST_CASE("ConfigurationLoader short-circuits on version and help") {
    REQUIRE(load({"--version"}).show_version);
    REQUIRE(load({"-v"}).show_version);
    REQUIRE(load({"-h"}).show_help);
}

TEST_CASE("ConfigurationLoader rejects invalid command lines") {
    REQUIRE_THROWS_WITH(load({}), "exactly one argument [CHART_PATH] is required");
    REQUIRE_THROWS_AS(load({"one", "two"}), UsageError);
    REQUIRE_THROWS_WITH(load({"--bogus", "chart"}), "unknown flag: --bogus");
    REQUIRE_THROWS_WITH(load({"chart", "-o"}), "flag needs an argument: -o");
    REQUIRE_THROWS_AS(load({"--version=yes"}), UsageError);
}

TEST_CASE("ConfigurationLoader reads environment knobs") {
    ::setenv("ROAR_MAX_CONCURRENCY", "4", 1);
    ::setenv("ROAR_HELM_BINARY", "/opt/helm/bin/helm", 1);
    const Configuration config = load({"chart"});
    REQUIRE(config.max_concurrency == 4);
    REQUIRE(config.helm_binary == "/opt/helm/bin/helm");
    REQUIRE(config.list_warnings.empty());

    ::setenv("ROAR_MAX_CONCURRENCY", "-2", 1);
    const Configuration fallback = load({"chart"});
    REQUIRE(fallback.max_concurrency == k_default_max_concurrency);
    REQUIRE(fallback.list_warnings.size() == 1);

    ::unsetenv("ROAR_MAX_CONCURRENCY");
    ::unsetenv("ROAR_HELM_BINARY");
}

TEST_CASE("ConfigurationLoader rejects concurrency values with trailing characters") {
    for (const char* raw_value : {"5abc", "5 ", "0", "+4"}) {
        ::setenv("ROAR_MAX_CONCURRENCY", raw_value, 1);
        const Configuration config = load({"chart"});
        INFO("ROAR_MAX_CONCURRENCY=" << raw_value);
        REQUIRE(config.max_concurrency == k_default_max_concurrency);
        REQUIRE(config.list_warnings.size() == 1);
    }
    ::unsetenv("ROAR_MAX_CONCURRENCY");
}

TEST_CASE("ConfigurationLoader usage lists the flags") {
    const std::string usage = ConfigurationLoader::usage("roar");
    REQUIRE_THAT(usage, Catch::StartsWith("Usage: roar [CHART_PATH] [flags]"));
    REQUIRE_THAT(usage, Catch::Contains("--output-dir"));
}
