/**
 * Unit tests for alias graph and resolver
 */

#include <fplaunch/alias_resolver.hpp>
#include <fplaunch/platform.hpp>
#include <doctest/doctest.h>

#include "test_helpers.hpp"

#include <random>
#include <set>
#include <string>

using namespace fplaunch;
using fplaunch_test::TestHome;
using fplaunch_test::read_text;
using fplaunch_test::write_file;

namespace {

bool no_wrappers(const std::string&) {
    return false;
}

} // namespace

TEST_CASE("AliasGraph resolve") {
    AliasGraph graph({{"ff", "firefox"}, {"browser", "ff"}});

    CHECK(graph.resolve("browser").value() == "firefox");
    CHECK(graph.resolve("ff").value() == "firefox");
    CHECK(graph.resolve("firefox").value() == "firefox");
    CHECK(graph.resolve("unknown").value() == "unknown");
    CHECK(graph.targetOf("ff") == std::optional<std::string>("firefox"));
    CHECK(!graph.targetOf("firefox"));
}

TEST_CASE("AliasGraph hop limit") {
    SUBCASE("a chain of exactly the limit resolves") {
        AliasGraph graph;
        for (int i = 0; i < kMaxAliasHops; ++i) {
            graph.setEdge("n" + std::to_string(i), "n" + std::to_string(i + 1));
        }
        auto result = graph.resolve("n0");
        REQUIRE(result.isOk());
        CHECK(result.value() == "n" + std::to_string(kMaxAliasHops));
    }

    SUBCASE("one more hop fails") {
        AliasGraph graph;
        for (int i = 0; i <= kMaxAliasHops; ++i) {
            graph.setEdge("n" + std::to_string(i), "n" + std::to_string(i + 1));
        }
        auto result = graph.resolve("n0");
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::AliasResolution);
    }

    SUBCASE("a loop loaded from disk fails instead of spinning") {
        AliasGraph graph({{"a", "b"}, {"b", "a"}});
        CHECK(graph.resolve("a").isErr());
    }
}

TEST_CASE("AliasGraph check") {
    AliasGraph graph({{"ff", "firefox"}, {"browser", "ff"}});

    CHECK(graph.check("web", "browser", false, no_wrappers) == AliasVerdict::Ok);
    CHECK(graph.check("firefox", "browser", false, no_wrappers) == AliasVerdict::Cycle);
    CHECK(graph.check("firefox", "browser", true, no_wrappers) == AliasVerdict::Cycle);
    CHECK(graph.check("self", "self", false, no_wrappers) == AliasVerdict::Cycle);

    SUBCASE("retargeting an alias needs force") {
        CHECK(graph.check("ff", "chromium", false, no_wrappers) == AliasVerdict::Collision);
        CHECK(graph.check("ff", "chromium", true, no_wrappers) == AliasVerdict::Ok);
        CHECK(graph.check("ff", "firefox", false, no_wrappers) == AliasVerdict::Ok);
    }

    SUBCASE("shadowing a wrapper needs force") {
        auto is_gimp = [](const std::string& name) { return name == "gimp"; };
        CHECK(graph.check("gimp", "krita", false, is_gimp) == AliasVerdict::Collision);
        CHECK(graph.check("gimp", "krita", true, is_gimp) == AliasVerdict::Ok);
    }
}

TEST_CASE("AliasGraph never holds a cycle when edges go through check") {
    std::mt19937 rng(20240611);
    std::uniform_int_distribution<int> pick(0, 9);
    std::bernoulli_distribution coin(0.5);

    AliasGraph graph;
    std::set<std::string> names;
    for (int step = 0; step < 500; ++step) {
        std::string alias = "app" + std::to_string(pick(rng));
        std::string target = "app" + std::to_string(pick(rng));
        names.insert(alias);
        names.insert(target);

        if (coin(rng)) {
            graph.removeEdge(alias);
            continue;
        }
        if (graph.check(alias, target, true, no_wrappers) == AliasVerdict::Ok) {
            graph.setEdge(alias, target);
        }

        for (const auto& name : names) {
            auto resolved = graph.resolve(name);
            REQUIRE(resolved.isOk());
            CHECK(!graph.targetOf(resolved.value()));
        }
    }
}

TEST_CASE("AliasGraph records are sorted by alias") {
    AliasGraph graph({{"zz", "a"}, {"mm", "b"}, {"aa", "c"}});
    auto records = graph.records();
    REQUIRE(records.size() == 3);
    CHECK(records[0].alias == "aa");
    CHECK(records[1].alias == "mm");
    CHECK(records[2].alias == "zz");
}

TEST_CASE("AliasResolver create and remove") {
    TestHome env;
    auto store = env.open();
    std::string bin = store->binDir();
    write_file(bin + "/firefox", "#!/bin/sh\n");

    AliasResolver resolver(*store);

    SUBCASE("alias is persisted and linked") {
        REQUIRE(resolver.createAlias("ff", "firefox").isOk());
        CHECK(read_text(env.root + "/aliases") == "ff firefox\n");
        CHECK(read_symlink(bin + "/ff") == std::optional<std::string>("firefox"));
        CHECK(resolver.resolve("ff").value() == "firefox");

        AliasResolver fresh(*store);
        CHECK(fresh.resolve("ff").value() == "firefox");

        REQUIRE(resolver.removeAlias("ff").isOk());
        CHECK(!path_exists(bin + "/ff"));
        CHECK(resolver.records().empty());
        CHECK(resolver.removeAlias("ff").error().code() == ErrorCode::NotFound);
    }

    SUBCASE("no link without a target wrapper") {
        REQUIRE(resolver.createAlias("ed", "editor").isOk());
        CHECK(!path_exists(bin + "/ed"));
    }

    SUBCASE("cycle is reported") {
        REQUIRE(resolver.createAlias("ff", "firefox").isOk());
        auto result = resolver.createAlias("firefox", "ff", true);
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::AliasResolution);
        CHECK(result.error().message().rfind("CYCLE:", 0) == 0);
    }

    SUBCASE("collision with a wrapper needs force") {
        auto result = resolver.createAlias("firefox", "chromium");
        REQUIRE(result.isErr());
        CHECK(result.error().message().rfind("COLLISION:", 0) == 0);
        CHECK(result.error().message().find("--force") != std::string::npos);

        REQUIRE(resolver.createAlias("firefox", "chromium", true).isOk());
        CHECK(resolver.resolve("firefox").value() == "chromium");
        // A real wrapper file is never replaced by the alias link
        CHECK(is_regular_file(bin + "/firefox"));
        CHECK(!is_symlink(bin + "/firefox"));
    }

    SUBCASE("names are validated") {
        CHECK(resolver.createAlias("sudo", "firefox").error().code() == ErrorCode::Validation);
        CHECK(resolver.createAlias("ff", "a;b").error().code() == ErrorCode::Validation);
        CHECK(resolver.createAlias("../x", "firefox").error().code() == ErrorCode::Validation);

        REQUIRE(store->block("tracker").isOk());
        CHECK(resolver.createAlias("tracker", "firefox").error().code() == ErrorCode::Validation);
    }
}

TEST_CASE("AliasResolver uses an injected wrapper check") {
    TestHome env;
    auto store = env.open();
    AliasResolver resolver(*store, [](const std::string& name) { return name == "vlc"; });

    CHECK(resolver.createAlias("vlc", "mpv").isErr());
    CHECK(resolver.createAlias("player", "vlc").isOk());
    CHECK(resolver.resolve("player").value() == "vlc");
}
