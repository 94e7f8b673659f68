/**
 * Shared fixtures for the fplaunch unit tests
 */

#pragma once

#include <fplaunch/config_store.hpp>

#include <doctest/doctest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

#include <unistd.h>

namespace fplaunch_test {

// Unique directory under /tmp, removed on destruction
class TempTestDir {
public:
    explicit TempTestDir(const std::string& prefix = "fplaunch_test") {
        std::string templ = "/tmp/" + prefix + "_XXXXXX";
        char* created = mkdtemp(templ.data());
        if (created) {
            path = std::filesystem::canonical(created).string();
        }
    }

    ~TempTestDir() {
        if (!path.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
        }
    }

    TempTestDir(const TempTestDir&) = delete;
    TempTestDir& operator=(const TempTestDir&) = delete;

    std::string sub(const std::string& rel) const {
        return path + "/" + rel;
    }

    std::string path;
};

inline void write_file(const std::string& path, const std::string& content) {
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_text(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Executable /bin/sh script with the given body
inline std::string write_script(const std::string& path, const std::string& body) {
    write_file(path, "#!/bin/sh\n" + body + "\n");
    std::filesystem::permissions(path,
        std::filesystem::perms::owner_exec |
        std::filesystem::perms::owner_read |
        std::filesystem::perms::owner_write);
    return path;
}

inline void safe_setenv(const char* name, const char* value) {
    setenv(name, value, 1);
}

inline void safe_unsetenv(const char* name) {
    unsetenv(name);
}

// A home directory with a configuration root inside it
class TestHome {
public:
    TestHome() {
        home = dir.sub("home");
        root = home + "/.config/fplaunchwrapper";
        std::filesystem::create_directories(home);
    }

    std::unique_ptr<fplaunch::ConfigStore> open() const {
        fplaunch::ConfigStoreOptions options;
        options.root = root;
        options.home_dir = home;
        auto store = fplaunch::ConfigStore::open(options);
        REQUIRE(store.isOk());
        return std::move(store.value());
    }

    TempTestDir dir;
    std::string home;
    std::string root;
};

} // namespace fplaunch_test
