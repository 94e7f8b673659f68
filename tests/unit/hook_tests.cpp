/**
 * Unit tests for HookExecutor
 */

#include <fplaunch/hook_executor.hpp>
#include <doctest/doctest.h>

#include "test_helpers.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

using namespace fplaunch;
using fplaunch_test::TempTestDir;
using fplaunch_test::read_text;
using fplaunch_test::write_file;
using fplaunch_test::write_script;

namespace {

struct HookFixture {
    HookFixture() {
        options.base_env = {{"PATH", "/usr/bin:/bin"}};
        options.warn_sink = [this](const std::string& message) { warnings.push_back(message); };
        context.wrapper_name = "firefox";
        context.app_id = "org.mozilla.firefox";
        context.source = "package";
    }

    HookExecutor executor() const {
        return HookExecutor(options);
    }

    TempTestDir dir;
    HookExecutor::Options options;
    HookContext context;
    std::vector<std::string> warnings;
};

FailureModeChain only_app(FailureMode mode) {
    FailureModeChain chain;
    chain.app_config = mode;
    return chain;
}

} // namespace

TEST_CASE("HookExecutor with no hook") {
    HookFixture f;

    SUBCASE("unset script") {
        auto outcome = f.executor().run(HookKind::Pre, std::nullopt, f.context, {});
        REQUIRE(outcome.isOk());
        CHECK(!outcome.value().executed);
        CHECK(!outcome.value().failed);
    }

    SUBCASE("missing script is not a failure") {
        auto outcome = f.executor().run(HookKind::Pre, f.dir.sub("missing.sh"), f.context,
                                        only_app(FailureMode::Abort));
        REQUIRE(outcome.isOk());
        CHECK(!outcome.value().executed);
        CHECK(!outcome.value().abort_launch);
        CHECK(f.warnings.empty());
    }

    SUBCASE("non-executable script is not a failure") {
        write_file(f.dir.sub("plain.sh"), "#!/bin/sh\nexit 1\n");
        auto outcome = f.executor().run(HookKind::Pre, f.dir.sub("plain.sh"), f.context,
                                        only_app(FailureMode::Abort));
        REQUIRE(outcome.isOk());
        CHECK(!outcome.value().executed);
    }
}

TEST_CASE("HookExecutor rejects unsafe scripts") {
    HookFixture f;
    auto real = write_script(f.dir.sub("real.sh"), "exit 0");
    std::filesystem::create_symlink(real, f.dir.sub("link.sh"));

    auto outcome = f.executor().run(HookKind::Pre, f.dir.sub("link.sh"), f.context, {});
    REQUIRE(outcome.isErr());
    CHECK(outcome.error().code() == ErrorCode::Validation);

    write_file(f.dir.sub("noshebang.sh"), "exit 0\n");
    std::filesystem::permissions(f.dir.sub("noshebang.sh"), std::filesystem::perms::owner_all);
    CHECK(f.executor().run(HookKind::Pre, f.dir.sub("noshebang.sh"), f.context, {}).isErr());
}

TEST_CASE("HookExecutor success") {
    HookFixture f;
    auto script = write_script(f.dir.sub("ok.sh"), "exit 0");

    auto outcome = f.executor().run(HookKind::Pre, script, f.context, only_app(FailureMode::Abort));
    REQUIRE(outcome.isOk());
    CHECK(outcome.value().executed);
    CHECK(!outcome.value().failed);
    CHECK(outcome.value().exit_code == 0);
    CHECK(!outcome.value().abort_launch);
    CHECK(f.warnings.empty());
}

TEST_CASE("HookExecutor exports the invocation context") {
    HookFixture f;
    std::string out = f.dir.sub("env.txt");
    auto script = write_script(f.dir.sub("env.sh"),
        "echo \"$FPWRAPPER_WRAPPER_NAME|$FPWRAPPER_APP_ID|$FPWRAPPER_SOURCE|"
        "$FPWRAPPER_HOOK|$FPWRAPPER_EXIT_CODE|$PATH\" > '" + out + "'");

    SUBCASE("pre hook") {
        REQUIRE(f.executor().run(HookKind::Pre, script, f.context, {}).isOk());
        CHECK(read_text(out) == "firefox|org.mozilla.firefox|package|pre||/usr/bin:/bin\n");
    }

    SUBCASE("post hook sees the application exit code") {
        f.context.app_exit_code = 3;
        REQUIRE(f.executor().run(HookKind::Post, script, f.context, {}).isOk());
        CHECK(read_text(out) == "firefox|org.mozilla.firefox|package|post|3|/usr/bin:/bin\n");
    }
}

TEST_CASE("HookExecutor failure modes") {
    HookFixture f;
    auto failing = write_script(f.dir.sub("fail.sh"), "exit 3");

    SUBCASE("pre abort stops the launch") {
        auto outcome = f.executor().run(HookKind::Pre, failing, f.context,
                                        only_app(FailureMode::Abort));
        REQUIRE(outcome.isOk());
        CHECK(outcome.value().failed);
        CHECK(outcome.value().abort_launch);
        CHECK(outcome.value().exit_code == 3);
        CHECK(outcome.value().applied_mode == FailureMode::Abort);
        REQUIRE(f.warnings.size() == 1);
        CHECK(f.warnings[0].find("exited with status 3") != std::string::npos);
        CHECK(f.warnings[0].find("launch aborted") != std::string::npos);
    }

    SUBCASE("post abort degrades to warn") {
        auto outcome = f.executor().run(HookKind::Post, failing, f.context,
                                        only_app(FailureMode::Abort));
        REQUIRE(outcome.isOk());
        CHECK(outcome.value().failed);
        CHECK(!outcome.value().abort_launch);
        CHECK(outcome.value().applied_mode == FailureMode::Warn);
        CHECK(f.warnings.size() == 1);
    }

    SUBCASE("warn reports and continues") {
        auto outcome = f.executor().run(HookKind::Pre, failing, f.context,
                                        only_app(FailureMode::Warn));
        REQUIRE(outcome.isOk());
        CHECK(!outcome.value().abort_launch);
        REQUIRE(f.warnings.size() == 1);
        CHECK(f.warnings[0].find("pre-launch hook") != std::string::npos);
    }

    SUBCASE("ignore is silent") {
        auto outcome = f.executor().run(HookKind::Pre, failing, f.context,
                                        only_app(FailureMode::Ignore));
        REQUIRE(outcome.isOk());
        CHECK(outcome.value().failed);
        CHECK(!outcome.value().abort_launch);
        CHECK(f.warnings.empty());
    }

    SUBCASE("built-in default is warn") {
        auto outcome = f.executor().run(HookKind::Pre, failing, f.context, FailureModeChain{});
        REQUIRE(outcome.isOk());
        CHECK(outcome.value().applied_mode == FailureMode::Warn);
        CHECK(f.warnings.size() == 1);
    }
}

TEST_CASE("HookExecutor failure mode precedence") {
    HookFixture f;
    auto failing = write_script(f.dir.sub("fail.sh"), "exit 1");

    const FailureMode modes[] = {FailureMode::Abort, FailureMode::Warn, FailureMode::Ignore};

    // Level 0 is the runtime override, 3 the global default
    for (int level = 0; level < 4; ++level) {
        for (FailureMode mode : modes) {
            FailureMode other = mode == FailureMode::Ignore ? FailureMode::Abort : FailureMode::Ignore;

            FailureModeChain chain;
            std::optional<FailureMode>* slots[] = {
                &chain.runtime_override, &chain.env_override,
                &chain.app_config, &chain.global_default,
            };
            *slots[level] = mode;
            for (int lower = level + 1; lower < 4; ++lower) {
                *slots[lower] = other;
            }

            INFO("level " << level << " mode " << failure_mode_to_string(mode));
            auto outcome = f.executor().run(HookKind::Pre, failing, f.context, chain);
            REQUIRE(outcome.isOk());
            CHECK(outcome.value().applied_mode == mode);
            CHECK(outcome.value().abort_launch == (mode == FailureMode::Abort));
        }
    }
}

TEST_CASE("HookExecutor timeout") {
    HookFixture f;
    f.options.timeout = std::chrono::milliseconds(200);
    auto slow = write_script(f.dir.sub("slow.sh"), "sleep 5");

    auto start = std::chrono::steady_clock::now();
    auto outcome = f.executor().run(HookKind::Pre, slow, f.context, only_app(FailureMode::Abort));
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(outcome.isOk());
    CHECK(outcome.value().timed_out);
    CHECK(outcome.value().failed);
    CHECK(outcome.value().abort_launch);
    CHECK(elapsed < std::chrono::seconds(4));
    REQUIRE(f.warnings.size() == 1);
    CHECK(f.warnings[0].find("timed out after 200ms") != std::string::npos);
}

TEST_CASE("failure_mode_from_env") {
    CHECK(failure_mode_from_env({}) == std::nullopt);
    CHECK(failure_mode_from_env({{kHookFailureEnv, "abort"}}) == FailureMode::Abort);
    CHECK(failure_mode_from_env({{kHookFailureEnv, " Ignore "}}) == FailureMode::Ignore);
    CHECK(failure_mode_from_env({{kHookFailureEnv, "sometimes"}}) == std::nullopt);
    CHECK(failure_mode_from_env({{kHookFailureEnv, ""}}) == std::nullopt);
}
