#include <chrono>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include "fakes.hpp"
#include "logging_test_fixture.hpp"
#include "roar/clone_cache.hpp"
#include "roar/errors.hpp"

using namespace roar;

TEST_CASE("CloneCache clones each repository and revision once") {
    test::ScratchDirectory workspace{"roar-clone-cache"};
    test::FakeVersionControl version_control;
    CloneCache cache{workspace.path(), version_control, test::null_logger()};

    const CloneLease first = cache.acquire("git@host:org/repo", "main");
    const CloneLease second = cache.acquire("git@host:org/repo", "main");
    const CloneLease third = cache.acquire("git@host:org/repo", "dev");

    REQUIRE_FALSE(first.cache_hit);
    REQUIRE(second.cache_hit);
    REQUIRE_FALSE(third.cache_hit);
    REQUIRE(first.path == workspace.path() / "clone-1");
    REQUIRE(second.path == first.path);
    REQUIRE(third.path == workspace.path() / "clone-2");
    REQUIRE(cache.clone_count() == 2);

    const auto calls = version_control.calls();
    REQUIRE(calls.size() == 2);
    REQUIRE(calls[0].repository_address == "git@host:org/repo");
    REQUIRE(calls[0].revision == "main");
    REQUIRE(calls[1].revision == "dev");
}

TEST_CASE("CloneCache makes concurrent callers wait for the in-flight clone") {
    test::ScratchDirectory workspace{"roar-clone-race"};
    test::FakeVersionControl version_control;
    version_control.set_delay(std::chrono::milliseconds{50});
    CloneCache cache{workspace.path(), version_control, test::null_logger()};

    constexpr std::size_t k_thread_count{16};
    std::vector<CloneLease> leases(k_thread_count);
    std::vector<std::thread> threads;
    for (std::size_t index = 0; index < k_thread_count; ++index) {
        threads.emplace_back([&, index]() { leases[index] = cache.acquire("git@host:org/shared", "main"); });
    }
    for (std::thread& thread : threads) {
        thread.join();
    }

    REQUIRE(version_control.calls().size() == 1);
    std::size_t owners = 0;
    for (const CloneLease& lease : leases) {
        REQUIRE(lease.path == workspace.path() / "clone-1");
        owners += lease.cache_hit ? 0 : 1;
    }
    REQUIRE(owners == 1);
}

TEST_CASE("CloneCache reports a failed clone to every caller of that key") {
    test::ScratchDirectory workspace{"roar-clone-failure"};
    test::FakeVersionControl version_control;
    version_control.fail_for("git@host:org/missing");
    CloneCache cache{workspace.path(), version_control, test::null_logger()};

    REQUIRE_THROWS_AS(cache.acquire("git@host:org/missing", "main"), CloneError);
    REQUIRE_THROWS_WITH(cache.acquire("git@host:org/missing", "main"), Catch::Contains("repository not found"));
    REQUIRE(version_control.calls().size() == 1);

    const CloneLease other = cache.acquire("git@host:org/present", "main");
    REQUIRE(other.path == workspace.path() / "clone-2");
}
