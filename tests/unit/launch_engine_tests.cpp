/**
 * Unit tests for the launch decision engine
 */

#include <fplaunch/alias_resolver.hpp>
#include <fplaunch/launch_engine.hpp>
#include <fplaunch/platform.hpp>
#include <fplaunch/wrapper.hpp>
#include <doctest/doctest.h>

#include "test_helpers.hpp"

#include <algorithm>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

using namespace fplaunch;
using fplaunch_test::TestHome;
using fplaunch_test::read_text;
using fplaunch_test::write_file;
using fplaunch_test::write_script;

namespace {

class FakeLocator : public TargetLocator {
public:
    std::optional<std::string> findSystemBinary(const std::string& name,
                                                const std::string& exclude) const override {
        last_exclude = exclude;
        auto it = binaries.find(name);
        if (it == binaries.end()) return std::nullopt;
        return it->second;
    }

    bool packageInstalled(const std::string& id) const override {
        return packages.count(id) > 0;
    }

    std::map<std::string, std::string> binaries;
    std::set<std::string> packages;
    mutable std::string last_exclude;
};

class FakePrompt : public ChoicePrompt {
public:
    std::optional<std::string> ask(const std::string& question,
                                   std::chrono::seconds timeout) override {
        ++calls;
        last_question = question;
        last_timeout = timeout;
        return answer;
    }

    std::optional<std::string> answer;
    int calls = 0;
    std::string last_question;
    std::chrono::seconds last_timeout{0};
};

class FakeRunner : public AppRunner {
public:
    Result<int> run(const LaunchDecision& decision, bool wait) override {
        runs.push_back(decision);
        waits.push_back(wait);
        return Result<int>::ok(exit_code);
    }

    int exit_code = 0;
    std::vector<LaunchDecision> runs;
    std::vector<bool> waits;
};

struct EngineFixture {
    EngineFixture() {
        store = env.open();
        hook_options.base_env = {{"PATH", "/usr/bin:/bin"}};
        hook_options.warn_sink = [this](const std::string& message) {
            hook_warnings.push_back(message);
        };
        locator.binaries["firefox"] = "/usr/bin/firefox";
        locator.packages.insert("org.mozilla.firefox");
    }

    LaunchEngine engine() {
        return LaunchEngine(*store, locator, prompt, runner, HookExecutor(hook_options));
    }

    static LaunchEnvironment terminal() {
        LaunchEnvironment environment;
        environment.env = {{"PATH", "/usr/bin:/bin"}, {"HOME", "/nonexistent"}};
        environment.stdin_tty = true;
        environment.stdout_tty = true;
        return environment;
    }

    static LaunchEnvironment desktop() {
        LaunchEnvironment environment = terminal();
        environment.stdin_tty = false;
        environment.stdout_tty = false;
        return environment;
    }

    static LaunchRequest request(const std::string& name, const std::string& id = "") {
        LaunchRequest req;
        req.wrapper_name = name;
        req.package_id = id;
        return req;
    }

    void set(const std::string& app, const std::string& key, const std::string& value) {
        REQUIRE(store->save(LayerRef{LayerKind::App, app}, key, value).isOk());
    }

    TestHome env;
    std::unique_ptr<ConfigStore> store;
    FakeLocator locator;
    FakePrompt prompt;
    FakeRunner runner;
    HookExecutor::Options hook_options;
    std::vector<std::string> hook_warnings;
};

bool has_state(const LaunchOutcome& outcome, LaunchState state) {
    return std::find(outcome.states.begin(), outcome.states.end(), state) != outcome.states.end();
}

} // namespace

TEST_CASE("evaluate_interactivity") {
    InteractivityInputs inputs;

    SUBCASE("no terminal") {
        auto result = evaluate_interactivity(inputs);
        CHECK(!result.interactive);
        CHECK(result.reason == "no terminal");
    }

    SUBCASE("both streams on a terminal") {
        inputs.stdin_tty = true;
        inputs.stdout_tty = true;
        CHECK(evaluate_interactivity(inputs).interactive);
    }

    SUBCASE("one stream redirected") {
        inputs.stdin_tty = true;
        CHECK(!evaluate_interactivity(inputs).interactive);
    }

    SUBCASE("flag beats everything") {
        inputs.force_interactive_flag = true;
        inputs.force_desktop_flag = true;
        inputs.force_env = "desktop";
        auto result = evaluate_interactivity(inputs);
        CHECK(result.interactive);
        CHECK(result.reason == "--interactive");
    }

    SUBCASE("environment forces interactive") {
        inputs.force_env = " Interactive ";
        CHECK(evaluate_interactivity(inputs).interactive);
    }

    SUBCASE("desktop flag beats environment") {
        inputs.force_env = "interactive";
        inputs.force_desktop_flag = true;
        CHECK(!evaluate_interactivity(inputs).interactive);
    }

    SUBCASE("environment forces desktop on a terminal") {
        inputs.force_env = "desktop";
        inputs.stdin_tty = true;
        inputs.stdout_tty = true;
        auto result = evaluate_interactivity(inputs);
        CHECK(!result.interactive);
        CHECK(result.reason == "FPWRAPPER_FORCE=desktop");
    }

    SUBCASE("unknown environment value falls through") {
        inputs.force_env = "sometimes";
        inputs.stdin_tty = true;
        inputs.stdout_tty = true;
        CHECK(evaluate_interactivity(inputs).reason == "terminal");
    }
}

TEST_CASE("interpret_choice") {
    CHECK(interpret_choice(std::nullopt) == TargetKind::System);
    CHECK(interpret_choice(std::string("")) == TargetKind::System);
    CHECK(interpret_choice(std::string("1")) == TargetKind::System);
    CHECK(interpret_choice(std::string("2")) == TargetKind::Package);
    CHECK(interpret_choice(std::string(" Flatpak\n")) == TargetKind::Package);
    CHECK(interpret_choice(std::string("p")) == TargetKind::Package);
    CHECK(interpret_choice(std::string("maybe")) == TargetKind::System);
}

TEST_CASE("build_launch_decision") {
    ResolvedSettings settings;
    settings.custom_args = {"--private"};
    settings.env = {{"ZED", "z"}, {"ALPHA", "a"}};
    std::unordered_map<std::string, std::string> process_env = {{"PATH", "/bin"}, {"ALPHA", "old"}};

    SUBCASE("system target") {
        auto decision = build_launch_decision(TargetKind::System, "/usr/bin/firefox", "",
                                              settings, {}, {"https://example.org"}, process_env);
        CHECK(decision.program == "/usr/bin/firefox");
        CHECK(decision.argv ==
              std::vector<std::string>{"/usr/bin/firefox", "--private", "https://example.org"});
        CHECK(decision.env.at("ALPHA") == "a");
        CHECK(decision.env.at("ZED") == "z");
        CHECK(decision.env.at("PATH") == "/bin");
    }

    SUBCASE("package target") {
        auto decision = build_launch_decision(TargetKind::Package, "", "org.mozilla.firefox",
                                              settings, {"--share=ipc"}, {"-x"}, process_env);
        CHECK(decision.program == "flatpak");
        CHECK(decision.argv == std::vector<std::string>{
            "flatpak", "run", "--env=ALPHA=a", "--env=ZED=z", "--share=ipc",
            "org.mozilla.firefox", "--private", "-x"});
        CHECK(decision.env.at("ALPHA") == "old");
    }
}

TEST_CASE("LaunchEngine bypass") {
    EngineFixture f;
    std::string bin = f.store->binDir();
    std::string other = f.env.dir.sub("other");

    // The wrapper itself sits first on PATH; the real binary comes later
    write_file(bin + "/editor",
               render_wrapper_script("editor", "org.example.Editor", "/usr/bin/fplaunch"));
    std::filesystem::permissions(bin + "/editor", std::filesystem::perms::owner_all);
    write_script(other + "/editor", "exit 0");

    REQUIRE(f.store->writePreference("editor", TargetKind::Package).isOk());

    SystemTargetLocator locator(bin + ":" + other, f.env.home);
    LaunchEngine engine(*f.store, locator, f.prompt, f.runner, HookExecutor(f.hook_options));

    auto outcome = engine.launch(EngineFixture::request("editor"), EngineFixture::desktop());
    REQUIRE(outcome.isOk());
    CHECK(!outcome.value().interactivity.interactive);
    CHECK(has_state(outcome.value(), LaunchState::Bypass));
    CHECK(!has_state(outcome.value(), LaunchState::ResolveTarget));
    CHECK(!has_state(outcome.value(), LaunchState::PreHook));
    CHECK(!has_state(outcome.value(), LaunchState::PostHook));

    REQUIRE(f.runner.runs.size() == 1);
    CHECK(f.runner.runs[0].target_kind == TargetKind::System);
    CHECK(f.runner.runs[0].program == other + "/editor");
    CHECK(f.runner.waits[0] == false);
    CHECK(f.prompt.calls == 0);

    // The stored preference is neither used nor rewritten
    CHECK(read_text(f.env.root + "/prefs/editor.pref") == "package\n");
}

TEST_CASE("LaunchEngine bypass falls back to the package and honours one-shot") {
    EngineFixture f;

    SUBCASE("no system binary") {
        auto outcome = f.engine().launch(EngineFixture::request("gimp", "org.gimp.GIMP"),
                                         EngineFixture::desktop());
        REQUIRE(outcome.isOk());
        CHECK(outcome.value().decision->target_kind == TargetKind::Package);
        CHECK(outcome.value().decision->argv ==
              std::vector<std::string>{"flatpak", "run", "org.gimp.GIMP"});
    }

    SUBCASE("one-shot package") {
        auto req = EngineFixture::request("firefox", "org.mozilla.firefox");
        req.one_shot = TargetKind::Package;
        auto outcome = f.engine().launch(req, EngineFixture::desktop());
        REQUIRE(outcome.isOk());
        CHECK(outcome.value().decision->target_kind == TargetKind::Package);
    }

    SUBCASE("nothing to run") {
        auto outcome = f.engine().launch(EngineFixture::request("nothing"), EngineFixture::desktop());
        REQUIRE(outcome.isErr());
        CHECK(outcome.error().code() == ErrorCode::NotFound);
    }

    SUBCASE("bypass ignores configured hooks and args") {
        write_script(f.env.home + "/hooks/pre.sh", "exit 9");
        f.set("firefox", "pre_launch_script", "~/hooks/pre.sh");
        f.set("firefox", "pre_launch_failure_mode", "abort");
        f.set("firefox", "custom_args", "--kiosk");

        auto outcome = f.engine().launch(EngineFixture::request("firefox", "org.mozilla.firefox"),
                                         EngineFixture::desktop());
        REQUIRE(outcome.isOk());
        CHECK(outcome.value().success);
        CHECK(!outcome.value().pre_hook);
        CHECK(outcome.value().decision->argv == std::vector<std::string>{"/usr/bin/firefox"});
    }

    SUBCASE("FPWRAPPER_FORCE=desktop bypasses on a terminal") {
        auto environment = EngineFixture::terminal();
        environment.env[kForceModeEnv] = "desktop";
        auto outcome = f.engine().launch(EngineFixture::request("firefox", "org.mozilla.firefox"),
                                         environment);
        REQUIRE(outcome.isOk());
        CHECK(has_state(outcome.value(), LaunchState::Bypass));
        CHECK(f.prompt.calls == 0);
    }
}

TEST_CASE("LaunchEngine interactive choice") {
    EngineFixture f;
    auto req = EngineFixture::request("firefox", "org.mozilla.firefox");

    SUBCASE("no answer picks the system binary and saves the choice") {
        auto outcome = f.engine().launch(req, EngineFixture::terminal());
        REQUIRE(outcome.isOk());
        CHECK(f.prompt.calls == 1);
        CHECK(f.prompt.last_timeout == kChoiceTimeout);
        CHECK(f.prompt.last_question.find("/usr/bin/firefox") != std::string::npos);
        CHECK(outcome.value().decision->target_kind == TargetKind::System);
        CHECK(read_text(f.env.root + "/prefs/firefox.pref") == "system\n");

        auto again = f.engine().launch(req, EngineFixture::terminal());
        REQUIRE(again.isOk());
        CHECK(f.prompt.calls == 1);
        CHECK(again.value().decision->target_kind == TargetKind::System);
    }

    SUBCASE("answer 2 picks the package") {
        f.prompt.answer = "2";
        auto outcome = f.engine().launch(req, EngineFixture::terminal());
        REQUIRE(outcome.isOk());
        CHECK(outcome.value().decision->target_kind == TargetKind::Package);
        CHECK(f.store->readPreference("firefox").value() == TargetKind::Package);
    }

    SUBCASE("no prompt when only one target exists") {
        f.locator.packages.clear();
        auto outcome = f.engine().launch(req, EngineFixture::terminal());
        REQUIRE(outcome.isOk());
        CHECK(f.prompt.calls == 0);
        CHECK(outcome.value().decision->target_kind == TargetKind::System);
        CHECK(!path_exists(f.env.root + "/prefs/firefox.pref"));
    }

    SUBCASE("configured system method without a binary falls back with a warning") {
        f.set("gimp", "launch_method", "system");
        auto outcome = f.engine().launch(EngineFixture::request("gimp", "org.gimp.GIMP"),
                                         EngineFixture::terminal());
        REQUIRE(outcome.isOk());
        CHECK(outcome.value().decision->target_kind == TargetKind::Package);
        CHECK(outcome.value().warnings.size() == 1);
    }

    SUBCASE("one-shot overrides the configured method without saving") {
        f.set("firefox", "launch_method", "system");
        req.one_shot = TargetKind::Package;
        auto outcome = f.engine().launch(req, EngineFixture::terminal());
        REQUIRE(outcome.isOk());
        CHECK(outcome.value().decision->target_kind == TargetKind::Package);
        CHECK(f.prompt.calls == 0);
        CHECK(!path_exists(f.env.root + "/prefs/firefox.pref"));
    }
}

TEST_CASE("LaunchEngine applies settings to the command") {
    EngineFixture f;
    f.set("firefox", "custom_args", R"(["--new-window"])");
    f.set("firefox", "env.MOZ_ENABLE_WAYLAND", "1");
    f.set("firefox", "launch_method", "package");

    auto req = EngineFixture::request("firefox", "org.mozilla.firefox");
    req.args = {"https://example.org"};
    req.preset = "minimal";

    auto outcome = f.engine().launch(req, EngineFixture::terminal());
    REQUIRE(outcome.isOk());
    CHECK(outcome.value().decision->argv == std::vector<std::string>{
        "flatpak", "run", "--env=MOZ_ENABLE_WAYLAND=1", "--share=ipc",
        "org.mozilla.firefox", "--new-window", "https://example.org"});

    SUBCASE("unknown preset") {
        req.preset = "nope";
        auto missing = f.engine().launch(req, EngineFixture::terminal());
        REQUIRE(missing.isErr());
        CHECK(missing.error().code() == ErrorCode::NotFound);
    }
}

TEST_CASE("LaunchEngine hooks") {
    EngineFixture f;
    auto req = EngineFixture::request("firefox", "org.mozilla.firefox");
    f.set("firefox", "launch_method", "system");

    SUBCASE("pre-hook abort never runs the application") {
        write_script(f.env.home + "/hooks/pre.sh", "exit 5");
        f.set("firefox", "pre_launch_script", "~/hooks/pre.sh");
        f.set("firefox", "pre_launch_failure_mode", "abort");

        auto outcome = f.engine().launch(req, EngineFixture::terminal());
        REQUIRE(outcome.isOk());
        CHECK(!outcome.value().success);
        CHECK(outcome.value().exit_code == 5);
        CHECK(!outcome.value().app_exit_code);
        CHECK(f.runner.runs.empty());
        CHECK(!has_state(outcome.value(), LaunchState::Execute));
        CHECK(outcome.value().states.back() == LaunchState::Done);
        REQUIRE(f.hook_warnings.size() == 1);
        CHECK(f.hook_warnings[0].find("launch aborted") != std::string::npos);
    }

    SUBCASE("runtime override ignore lets the launch continue") {
        write_script(f.env.home + "/hooks/pre.sh", "exit 5");
        f.set("firefox", "pre_launch_script", "~/hooks/pre.sh");
        f.set("firefox", "pre_launch_failure_mode", "abort");
        req.hook_failure = FailureMode::Ignore;

        auto outcome = f.engine().launch(req, EngineFixture::terminal());
        REQUIRE(outcome.isOk());
        CHECK(outcome.value().success);
        CHECK(f.runner.runs.size() == 1);
        CHECK(f.hook_warnings.empty());
    }

    SUBCASE("environment override warn lets the launch continue") {
        write_script(f.env.home + "/hooks/pre.sh", "exit 5");
        f.set("firefox", "pre_launch_script", "~/hooks/pre.sh");
        f.set("firefox", "pre_launch_failure_mode", "abort");
        auto environment = EngineFixture::terminal();
        environment.env[kHookFailureEnv] = "warn";

        auto outcome = f.engine().launch(req, environment);
        REQUIRE(outcome.isOk());
        CHECK(f.runner.runs.size() == 1);
        CHECK(f.hook_warnings.size() == 1);
    }

    SUBCASE("post hook makes the runner wait and sees the exit code") {
        std::string out = f.env.home + "/post.out";
        write_script(f.env.home + "/hooks/post.sh", "echo \"$FPWRAPPER_EXIT_CODE\" > '" + out + "'");
        f.set("firefox", "post_launch_script", "~/hooks/post.sh");
        f.runner.exit_code = 2;

        auto outcome = f.engine().launch(req, EngineFixture::terminal());
        REQUIRE(outcome.isOk());
        REQUIRE(f.runner.waits.size() == 1);
        CHECK(f.runner.waits[0]);
        CHECK(outcome.value().app_exit_code == 2);
        CHECK(outcome.value().exit_code == 2);
        CHECK(has_state(outcome.value(), LaunchState::PostHook));
        CHECK(read_text(out) == "2\n");
    }

    SUBCASE("post-hook abort reports the hook's status") {
        write_script(f.env.home + "/hooks/post.sh", "exit 4");
        f.set("firefox", "post_launch_script", "~/hooks/post.sh");
        f.set("firefox", "post_launch_failure_mode", "abort");

        auto outcome = f.engine().launch(req, EngineFixture::terminal());
        REQUIRE(outcome.isOk());
        CHECK(!outcome.value().success);
        CHECK(outcome.value().exit_code == 4);
        CHECK(outcome.value().app_exit_code == 0);
        REQUIRE(outcome.value().post_hook);
        CHECK(outcome.value().post_hook->applied_mode == FailureMode::Warn);
    }

    SUBCASE("no post hook lets the runner replace the process") {
        auto outcome = f.engine().launch(req, EngineFixture::terminal());
        REQUIRE(outcome.isOk());
        REQUIRE(f.runner.waits.size() == 1);
        CHECK(!f.runner.waits[0]);
    }

    SUBCASE("hooks see the wrapper name and source") {
        std::string out = f.env.home + "/pre.out";
        write_script(f.env.home + "/hooks/pre.sh",
                     "echo \"$FPWRAPPER_WRAPPER_NAME $FPWRAPPER_SOURCE $FPWRAPPER_APP_ID\" > '" +
                     out + "'");
        f.set("firefox", "pre_launch_script", "~/hooks/pre.sh");
        REQUIRE(f.engine().launch(req, EngineFixture::terminal()).isOk());
        CHECK(read_text(out) == "firefox system /usr/bin/firefox\n");
    }
}

TEST_CASE("LaunchEngine names and aliases") {
    EngineFixture f;

    SUBCASE("alias resolves before launching") {
        AliasResolver aliases(*f.store, [](const std::string&) { return false; });
        REQUIRE(aliases.createAlias("ff", "firefox").isOk());

        auto outcome = f.engine().launch(EngineFixture::request("ff", "org.mozilla.firefox"),
                                         EngineFixture::desktop());
        REQUIRE(outcome.isOk());
        CHECK(outcome.value().decision->program == "/usr/bin/firefox");
        CHECK(f.locator.last_exclude == f.store->binDir() + "/firefox");
    }

    SUBCASE("invalid names are rejected") {
        for (const char* name : {"", "bash", "a;b", "../x"}) {
            INFO(name);
            auto outcome = f.engine().launch(EngineFixture::request(name), EngineFixture::terminal());
            REQUIRE(outcome.isErr());
            CHECK(outcome.error().code() == ErrorCode::Validation);
        }
    }

    SUBCASE("blocked names are rejected") {
        REQUIRE(f.store->block("firefox").isOk());
        auto outcome = f.engine().launch(EngineFixture::request("firefox"), EngineFixture::terminal());
        REQUIRE(outcome.isErr());
        CHECK(outcome.error().code() == ErrorCode::Validation);
    }

    SUBCASE("invalid package ids are rejected") {
        auto outcome = f.engine().launch(EngineFixture::request("firefox", "not an id"),
                                         EngineFixture::terminal());
        REQUIRE(outcome.isErr());
        CHECK(outcome.error().code() == ErrorCode::Validation);
    }

    SUBCASE("package id is read from the installed wrapper") {
        std::string bin = f.store->binDir();
        write_file(bin + "/gimp", render_wrapper_script("gimp", "org.gimp.GIMP", "/usr/bin/fplaunch"));
        auto outcome = f.engine().launch(EngineFixture::request("gimp"), EngineFixture::desktop());
        REQUIRE(outcome.isOk());
        CHECK(outcome.value().decision->argv ==
              std::vector<std::string>{"flatpak", "run", "org.gimp.GIMP"});
    }
}
