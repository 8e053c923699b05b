#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <catch2/catch.hpp>

#include "fakes.hpp"
#include "logging_test_fixture.hpp"
#include "roar/errors.hpp"
#include "roar/render_orchestrator.hpp"

using namespace roar;

namespace {

ApplicationDescriptor make_application(const std::string& name, const std::string& repo_url, const std::string& revision) {
    ApplicationDescriptor app{};
    app.name = name;
    app.repo_url = repo_url;
    app.target_revision = revision;
    return app;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream stream(path, std::ios::binary);
    std::ostringstream contents;
    contents << stream.rdbuf();
    return contents.str();
}

struct OrchestratorHarness final {
    test::ScratchDirectory scratch{"roar-orchestrator"};
    test::FakeTemplateEngine template_engine;
    test::FakeVersionControl version_control;

    RenderOrchestrator make(std::size_t max_concurrency = k_default_max_concurrency) {
        OrchestratorConfig config{};
        config.output_directory = scratch.path() / "out";
        config.workspace_root = scratch.path() / "workspace";
        config.max_concurrency = max_concurrency;
        return RenderOrchestrator{config, template_engine, version_control, test::null_logger()};
    }
};

}  // namespace

TEST_CASE("build_set_values layers identity over setters") {
    ApplicationDescriptor app = make_application("svc", "repo", "main");
    app.setters = {{"global.instance", "stale"}, {"global.replicaCount", "3"}};
    app.instance = "inf1";
    app.env = "dev";

    REQUIRE(RenderOrchestrator::build_set_values(app)
            == SetterMap{{"global.instance", "inf1"}, {"global.env", "dev"}, {"global.replicaCount", "3"}});

    app.instance.clear();
    app.env.clear();
    REQUIRE(RenderOrchestrator::build_set_values(app) == app.setters);
}

TEST_CASE("output_directory_for partitions by env then instance") {
    ApplicationDescriptor app = make_application("svc", "repo", "main");
    const std::filesystem::path root{"rendered"};

    REQUIRE(RenderOrchestrator::output_directory_for(root, app) == root);
    app.instance = "inf1";
    REQUIRE(RenderOrchestrator::output_directory_for(root, app) == root / "inf1");
    app.env = "dev";
    REQUIRE(RenderOrchestrator::output_directory_for(root, app) == root / "dev" / "inf1");
}

TEST_CASE("RenderOrchestrator renders each application from its clone") {
    OrchestratorHarness harness;
    ApplicationDescriptor app = make_application("svc", "https://git.example.com/org/repo", "main");
    app.path = "stable/svc";
    app.values_files = {"values.yaml", "values-dev.yaml"};
    app.env = "dev";

    RenderOrchestrator orchestrator = harness.make();
    const RenderSummary summary = orchestrator.render_all({app});

    const std::filesystem::path clone_root = harness.scratch.path() / "workspace" / "clone-1";
    const RenderOptions options = harness.template_engine.call_for("svc");
    REQUIRE(options.chart_path == clone_root / "stable" / "svc" / ".helm");
    REQUIRE(options.values_files == std::vector<std::filesystem::path>{
        clone_root / "stable" / "svc" / "values.yaml",
        clone_root / "stable" / "svc" / "values-dev.yaml",
    });
    REQUIRE(options.set_values == SetterMap{{"global.env", "dev"}});

    const auto clones = harness.version_control.calls();
    REQUIRE(clones.size() == 1);
    REQUIRE(clones[0].repository_address == "git@git.example.com:org/repo");

    const std::filesystem::path expected_output = harness.scratch.path() / "out" / "dev" / "svc.yaml";
    REQUIRE(summary.output_files == std::vector<std::filesystem::path>{expected_output});
    REQUIRE(read_file(expected_output) == "kind: FakedHelmOutputForApp\nname: svc\n");
}

TEST_CASE("RenderOrchestrator resolves the default path to the clone root") {
    OrchestratorHarness harness;
    RenderOrchestrator orchestrator = harness.make();

    (void)orchestrator.render_all({make_application("root-app", "git@host:org/repo", "main")});

    const std::filesystem::path clone_root = harness.scratch.path() / "workspace" / "clone-1";
    REQUIRE(harness.template_engine.call_for("root-app").chart_path == clone_root / ".helm");
}

TEST_CASE("RenderOrchestrator shares clones between identical repository identities") {
    OrchestratorHarness harness;
    harness.version_control.set_delay(std::chrono::milliseconds{20});
    RenderOrchestrator orchestrator = harness.make();

    const RenderSummary summary = orchestrator.render_all({
        make_application("one", "https://git.example.com/org/repo", "main"),
        make_application("two", "git@git.example.com:org/repo", "main"),
        make_application("three", "https://git.example.com/org/repo", "release"),
    });

    REQUIRE(summary.clone_count == 2);
    const auto clones = harness.version_control.calls();
    REQUIRE(clones.size() == 2);
    REQUIRE(harness.template_engine.call_for("one").chart_path.parent_path()
            == harness.template_engine.call_for("two").chart_path.parent_path());
    REQUIRE(harness.template_engine.call_for("one").chart_path.parent_path()
            != harness.template_engine.call_for("three").chart_path.parent_path());
}

TEST_CASE("RenderOrchestrator bounds the number of concurrent workers") {
    OrchestratorHarness harness;
    harness.template_engine.set_delay(std::chrono::milliseconds{5});
    RenderOrchestrator orchestrator = harness.make(10);

    ApplicationDescriptorList applications;
    for (int index = 0; index < 40; ++index) {
        applications.push_back(make_application("app-" + std::to_string(index), "git@host:org/repo-" + std::to_string(index), "main"));
    }

    const RenderSummary summary = orchestrator.render_all(applications);

    REQUIRE(summary.output_files.size() == applications.size());
    REQUIRE(harness.template_engine.max_in_flight() <= 10);
    REQUIRE(harness.template_engine.max_in_flight() > 1);
    REQUIRE(harness.version_control.calls().size() == applications.size());
}

TEST_CASE("RenderOrchestrator isolates failures and aggregates them") {
    OrchestratorHarness harness;
    harness.version_control.fail_for("git@host:org/broken");
    harness.template_engine.fail_for("bad-chart");
    RenderOrchestrator orchestrator = harness.make(2);

    const ApplicationDescriptorList applications{
        make_application("healthy-a", "git@host:org/repo", "main"),
        make_application("clone-fails", "git@host:org/broken", "main"),
        make_application("bad-chart", "git@host:org/repo", "main"),
        make_application("healthy-b", "git@host:org/other", "main"),
    };

    try {
        (void)orchestrator.render_all(applications);
        FAIL("render_all should have thrown");
    } catch (const RenderFailure& failure) {
        REQUIRE(failure.failure_count() == 2);
        REQUIRE_THAT(failure.what(), Catch::StartsWith("failed to process 2 application(s), first error: "));
        REQUIRE_THAT(failure.what(), Catch::Contains("application 'clone-fails' failed while cloning"));
    }

    REQUIRE(std::filesystem::exists(harness.scratch.path() / "out" / "healthy-a.yaml"));
    REQUIRE(std::filesystem::exists(harness.scratch.path() / "out" / "healthy-b.yaml"));
    REQUIRE_FALSE(std::filesystem::exists(harness.scratch.path() / "out" / "clone-fails.yaml"));
    REQUIRE_FALSE(std::filesystem::exists(harness.scratch.path() / "out" / "bad-chart.yaml"));
}

TEST_CASE("RenderOrchestrator reports output write failures per application") {
    OrchestratorHarness harness;
    std::filesystem::create_directories(harness.scratch.path() / "out");
    {
        // A regular file where the env directory should go.
        std::ofstream blocker(harness.scratch.path() / "out" / "dev");
        blocker << "not a directory\n";
    }

    ApplicationDescriptor blocked = make_application("blocked", "git@host:org/repo", "main");
    blocked.env = "dev";
    RenderOrchestrator orchestrator = harness.make();

    try {
        (void)orchestrator.render_all({blocked, make_application("fine", "git@host:org/repo", "main")});
        FAIL("render_all should have thrown");
    } catch (const RenderFailure& failure) {
        REQUIRE(failure.failure_count() == 1);
        REQUIRE_THAT(failure.what(), Catch::Contains("application 'blocked' failed while writing"));
    }

    REQUIRE(read_file(harness.scratch.path() / "out" / "fine.yaml") == "kind: FakedHelmOutputForApp\nname: fine\n");
}

TEST_CASE("RenderOrchestrator records exceptions of any type as failures") {
    OrchestratorHarness harness;
    harness.template_engine.fail_with_foreign_exception_for("odd");
    RenderOrchestrator orchestrator = harness.make(2);

    try {
        (void)orchestrator.render_all({
            make_application("odd", "git@host:org/repo", "main"),
            make_application("plain", "git@host:org/repo", "main"),
        });
        FAIL("render_all should have thrown");
    } catch (const RenderFailure& failure) {
        REQUIRE(failure.failure_count() == 1);
        REQUIRE_THAT(failure.what(), Catch::Contains("application 'odd' failed while rendering: unknown error"));
    }

    REQUIRE(std::filesystem::exists(harness.scratch.path() / "out" / "plain.yaml"));
}

TEST_CASE("RenderOrchestrator overwrites existing output files") {
    OrchestratorHarness harness;
    const std::filesystem::path output_file = harness.scratch.path() / "out" / "svc.yaml";
    std::filesystem::create_directories(output_file.parent_path());
    {
        std::ofstream stale(output_file);
        stale << "stale contents that are longer than the new manifest\n";
    }

    RenderOrchestrator orchestrator = harness.make();
    (void)orchestrator.render_all({make_application("svc", "git@host:org/repo", "main")});

    REQUIRE(read_file(output_file) == "kind: FakedHelmOutputForApp\nname: svc\n");
}

TEST_CASE("RenderOrchestrator accepts an empty application list") {
    OrchestratorHarness harness;
    RenderOrchestrator orchestrator = harness.make();

    const RenderSummary summary = orchestrator.render_all({});

    REQUIRE(summary.output_files.empty());
    REQUIRE(summary.clone_count == 0);
}
