/**
 * Unit tests for the safety validators
 */

#include <fplaunch/safety.hpp>
#include <doctest/doctest.h>

#include "test_helpers.hpp"

#include <filesystem>
#include <string>

using namespace fplaunch;
using fplaunch_test::TempTestDir;
using fplaunch_test::write_file;
using fplaunch_test::write_script;

TEST_CASE("validate_identifier_format") {
    SUBCASE("ordinary names pass") {
        CHECK(validate_identifier_format("firefox").ok());
        CHECK(validate_identifier_format("org.mozilla.firefox").ok());
        CHECK(validate_identifier_format("gimp-2.10").ok());
    }

    SUBCASE("empty and whitespace are forbidden") {
        CHECK(validate_identifier_format("").verdict == SafetyVerdict::Forbidden);
        CHECK(validate_identifier_format("   \t").verdict == SafetyVerdict::Forbidden);
    }

    SUBCASE("shell metacharacters are forbidden") {
        for (const char* raw : {"a;b", "a|b", "a&b", "a`b", "$(x)", "a<b", "a>b", "a\nb"}) {
            INFO(raw);
            CHECK(validate_identifier_format(raw).verdict == SafetyVerdict::Forbidden);
        }
    }

    SUBCASE("deny list is exact and case-sensitive") {
        CHECK(validate_identifier_format("bash").verdict == SafetyVerdict::Forbidden);
        CHECK(validate_identifier_format("sudo").verdict == SafetyVerdict::Forbidden);
        CHECK(validate_identifier_format("rm").verdict == SafetyVerdict::Forbidden);
        CHECK(validate_identifier_format("flatpak").verdict == SafetyVerdict::Forbidden);
        CHECK(validate_identifier_format("Bash").ok());
        CHECK(validate_identifier_format("bashful").ok());
    }

    SUBCASE("user block list") {
        std::vector<std::string> blocked = {"steam"};
        CHECK(validate_identifier_format("steam", blocked).verdict == SafetyVerdict::Forbidden);
        CHECK(validate_identifier_format("steam2", blocked).ok());
    }

    SUBCASE("reason is filled on failure only") {
        CHECK(validate_identifier_format("ok").reason.empty());
        CHECK(!validate_identifier_format("").reason.empty());
    }
}

TEST_CASE("validate_path_within_home") {
    TempTestDir temp;
    REQUIRE(!temp.path.empty());
    std::string home = temp.sub("home");
    std::filesystem::create_directories(home + "/scripts");
    std::filesystem::create_directories(temp.sub("outside"));

    SUBCASE("paths inside home resolve to canonical form") {
        auto check = validate_path_within_home(home + "/scripts/pre.sh", home);
        REQUIRE(check.ok());
        CHECK(check.canonical == home + "/scripts/pre.sh");
    }

    SUBCASE("tilde and relative paths are anchored at home") {
        CHECK(validate_path_within_home("~/scripts", home).canonical == home + "/scripts");
        CHECK(validate_path_within_home("scripts", home).canonical == home + "/scripts");
        CHECK(validate_path_within_home("~", home).canonical == home);
    }

    SUBCASE("dotdot segments are rejected before resolution") {
        CHECK(validate_path_within_home(home + "/scripts/../scripts", home).verdict ==
              SafetyVerdict::Traversal);
        CHECK(validate_path_within_home("../outside", home).verdict == SafetyVerdict::Traversal);
    }

    SUBCASE("encoded traversal is rejected") {
        CHECK(validate_path_within_home(home + "/%2e%2e/outside", home).verdict ==
              SafetyVerdict::Traversal);
        CHECK(validate_path_within_home(home + "/a%2Fb", home).verdict == SafetyVerdict::Traversal);
        CHECK(validate_path_within_home(home + "/%252e", home).verdict == SafetyVerdict::Traversal);
    }

    SUBCASE("other users' homes are rejected") {
        CHECK(validate_path_within_home("~root/.bashrc", home).verdict == SafetyVerdict::Traversal);
    }

    SUBCASE("absolute paths outside home are rejected") {
        CHECK(validate_path_within_home("/etc/passwd", home).verdict == SafetyVerdict::Traversal);
        CHECK(validate_path_within_home(temp.sub("outside"), home).verdict ==
              SafetyVerdict::Traversal);
    }

    SUBCASE("sibling with a common prefix is outside") {
        std::filesystem::create_directories(home + "2");
        CHECK(validate_path_within_home(home + "2", home).verdict == SafetyVerdict::Traversal);
    }

    SUBCASE("the expanded path keeps symlinks unresolved") {
        write_script(home + "/real.sh", "exit 0");
        std::filesystem::create_symlink(home + "/real.sh", home + "/scripts/link.sh");
        auto check = validate_path_within_home("~/scripts/link.sh", home);
        REQUIRE(check.ok());
        CHECK(check.expanded == home + "/scripts/link.sh");
        CHECK(check.canonical == home + "/real.sh");
        CHECK(validate_executable_candidate(check.expanded).verdict == SafetyVerdict::Rejected);
        CHECK(validate_path_within_home("scripts/./link.sh", home).expanded ==
              home + "/scripts/link.sh");
    }

    SUBCASE("symlink escaping home is rejected") {
        std::filesystem::create_directory_symlink(temp.sub("outside"), home + "/escape");
        CHECK(validate_path_within_home(home + "/escape/file", home).verdict ==
              SafetyVerdict::Traversal);
    }
}

TEST_CASE("validate_executable_candidate") {
    TempTestDir temp;
    REQUIRE(!temp.path.empty());

    SUBCASE("script with absolute interpreter passes") {
        auto path = write_script(temp.sub("ok.sh"), "exit 0");
        CHECK(validate_executable_candidate(path).ok());
    }

    SUBCASE("missing file") {
        CHECK(validate_executable_candidate(temp.sub("missing")).verdict == SafetyVerdict::Rejected);
    }

    SUBCASE("symlink is rejected even when the target is fine") {
        auto path = write_script(temp.sub("real.sh"), "exit 0");
        std::filesystem::create_symlink(path, temp.sub("link.sh"));
        auto check = validate_executable_candidate(temp.sub("link.sh"));
        CHECK(check.verdict == SafetyVerdict::Rejected);
        CHECK(check.reason.find("symlink") != std::string::npos);
    }

    SUBCASE("directory is rejected") {
        std::filesystem::create_directories(temp.sub("dir"));
        CHECK(validate_executable_candidate(temp.sub("dir")).verdict == SafetyVerdict::Rejected);
    }

    SUBCASE("oversized file is rejected") {
        std::string big = "#!/bin/sh\n" + std::string(kMaxExecutableSize, '#');
        write_file(temp.sub("big.sh"), big);
        CHECK(validate_executable_candidate(temp.sub("big.sh")).verdict == SafetyVerdict::Rejected);
    }

    SUBCASE("interpreter line rules") {
        write_file(temp.sub("none.sh"), "echo hi\n");
        write_file(temp.sub("relative.sh"), "#!sh\necho hi\n");
        write_file(temp.sub("empty.sh"), "");
        CHECK(!validate_executable_candidate(temp.sub("none.sh")).ok());
        CHECK(!validate_executable_candidate(temp.sub("relative.sh")).ok());
        CHECK(!validate_executable_candidate(temp.sub("empty.sh")).ok());
        CHECK(validate_executable_candidate(temp.sub("none.sh"), false).ok());
    }
}

TEST_CASE("validate_package_id") {
    CHECK(validate_package_id("org.mozilla.firefox").ok());
    CHECK(validate_package_id("com.valvesoftware.Steam").ok());
    CHECK(validate_package_id("io.github.some_user.App-Name").ok());

    CHECK(!validate_package_id("firefox").ok());
    CHECK(!validate_package_id(".org.app").ok());
    CHECK(!validate_package_id("org.app.").ok());
    CHECK(!validate_package_id("org.app/evil").ok());
    CHECK(!validate_package_id("org.app;rm").ok());
    CHECK(!validate_package_id("org.blocked.App", {"org.blocked.App"}).ok());
}

TEST_CASE("validate_name_component") {
    CHECK(validate_name_component("firefox").ok());
    CHECK(validate_name_component("gaming-2").ok());
    CHECK(validate_name_component("g++").ok());

    CHECK(!validate_name_component("").ok());
    CHECK(!validate_name_component(".").ok());
    CHECK(!validate_name_component("..").ok());
    CHECK(!validate_name_component(".hidden").ok());
    CHECK(!validate_name_component("-rf").ok());
    CHECK(!validate_name_component("a/b").ok());
    CHECK(!validate_name_component("a b").ok());
    CHECK(!validate_name_component(std::string(256, 'a')).ok());
}

TEST_CASE("printable_input") {
    CHECK(printable_input("firefox") == "'firefox'");
    CHECK(printable_input("a;b") == "'a\\x3bb'");
    CHECK(printable_input("it's") == "'it\\x27s'");
    CHECK(printable_input("line\nbreak") == "'line\\x0abreak'");
    CHECK(printable_input("abcdef", 3) == "'abc...'");
    CHECK(printable_input("") == "''");
}

TEST_CASE("safety_verdict_to_string") {
    CHECK(std::string(safety_verdict_to_string(SafetyVerdict::Ok)) == "OK");
    CHECK(std::string(safety_verdict_to_string(SafetyVerdict::Traversal)) == "TRAVERSAL");
}
