#pragma once

#include "cargomcp.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <ranges>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace cargomcp::test::detail {
    namespace fs = std::filesystem;
    using namespace std::string_view_literals;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            static std::atomic<int> counter{0};
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now << "_" << counter++;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;
    };

    inline void write_file(const fs::path& p, std::string_view content) {
        std::ofstream out{p};
        REQUIRE(out.good());
        out << content;
    }

    // minimal project directory: a manifest and nothing else
    inline fs::path make_project(const fs::path& dir) {
        fs::create_directories(dir);
        write_file(dir / "Cargo.toml", "[package]\nname = \"demo\"\nversion = \"0.1.0\"\nedition = \"2021\"\n");
        return dir;
    }

    // /bin/sh script standing in for the build tool
    inline fs::path write_script(const fs::path& p, std::string_view body) {
        write_file(p, "#!/bin/sh\n" + std::string{body});
        fs::permissions(p, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);
        return p;
    }

    // fake cargo: prints each argument on its own line, then selected variables
    inline fs::path write_echo_cargo(const fs::path& dir) {
        return write_script(
                dir / "fake-cargo",
                "for a in \"$@\"; do echo \"arg:$a\"; done\n"
                "echo \"cwd:$(pwd)\"\n"
                "echo \"RUSTFLAGS:${RUSTFLAGS-unset}\"\n"
                "echo \"CARGOMCP_SENTINEL:${CARGOMCP_SENTINEL-unset}\"\n"
                "echo \"to stderr\" >&2\n");
    }

    inline bool contains(std::string_view haystack, std::string_view needle) {
        return haystack.find(needle) != std::string_view::npos;
    }

    // lines written to an ostringstream-backed sink
    inline std::vector<std::string> split_lines(const std::string& text) {
        std::vector<std::string> lines{};
        std::istringstream in{text};
        std::string line{};
        while (std::getline(in, line)) {
            if (!line.empty()) {
                lines.push_back(line);
            }
        }
        return lines;
    }

    inline std::string tool_call(int id, std::string_view tool, std::string_view arguments) {
        return R"({"jsonrpc":"2.0","id":)" + std::to_string(id) + R"(,"method":"tools/call","params":{"name":")" +
               std::string{tool} + R"(","arguments":)" + std::string{arguments} + "}}";
    }

    inline std::string json_string(std::string_view value) {
        std::string out{};
        auto ec = glz::write_json(value, out);
        REQUIRE(!ec);
        return out;
    }

}  // namespace cargomcp::test::detail
