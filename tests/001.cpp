#include "utils.hpp"

namespace cargomcp::test {

    TEST_CASE("001: registry lists eleven tools in order", "[001][tools]") {
        auto tools = tool_registry();
        REQUIRE(tools.size() == 11U);

        std::vector<std::string_view> names{};
        for (const auto& tool : tools) {
            names.push_back(tool.name);
        }
        CHECK(names ==
              std::vector<std::string_view>{
                      "cargo_check",
                      "cargo_clippy",
                      "cargo_test",
                      "cargo_fmt_check",
                      "cargo_build",
                      "cargo_bench",
                      "cargo_add",
                      "cargo_remove",
                      "cargo_update",
                      "cargo_clean",
                      "cargo_run"});
    }

    TEST_CASE("001: every schema is a closed object requiring path", "[001][tools]") {
        for (const auto& tool : tool_registry()) {
            INFO(tool.name);
            CHECK_FALSE(tool.description.empty());
            CHECK(!glz::validate_json(tool.input_schema));
            CHECK(detail::contains(tool.input_schema, R"("additionalProperties": false)"));
            CHECK(detail::contains(tool.input_schema, R"("required": ["path")"));
            CHECK(detail::contains(tool.input_schema, R"("toolchain")"));
            CHECK(detail::contains(tool.input_schema, R"("cargo_env")"));
        }
    }

    TEST_CASE("001: find_tool resolves names and rejects others", "[001][tools]") {
        const auto* add = find_tool("cargo_add");
        REQUIRE(add != nullptr);
        CHECK(add->kind == tool_kind::add);
        CHECK(detail::contains(add->input_schema, R"("required": ["path", "dependencies"])"));

        CHECK(find_tool("cargo_publish") == nullptr);
        CHECK(find_tool("") == nullptr);
        CHECK(find_tool("check") == nullptr);
        CHECK(find_tool("CARGO_CHECK") == nullptr);
    }

    TEST_CASE("001: subcommand tokens are fixed per tool", "[001][tools]") {
        CHECK(subcommand(tool_kind::check) == "check"sv);
        CHECK(subcommand(tool_kind::fmt_check) == "fmt"sv);
        CHECK(subcommand(tool_kind::update) == "update"sv);
        CHECK(subcommand(tool_kind::run) == "run"sv);
        CHECK(std::format("{}", tool_kind::clippy) == "cargo_clippy");
    }

    TEST_CASE("001: error kinds map to names and codes", "[001][errors]") {
        CHECK(to_string(error_kind::unknown_tool) == "UnknownTool"sv);
        CHECK(to_string(error_kind::validation_error) == "ValidationError"sv);
        CHECK(to_string(error_kind::invalid_project) == "InvalidProject"sv);
        CHECK(to_string(error_kind::spawn_error) == "SpawnError"sv);

        CHECK(rpc_code(error_kind::parse_error) == -32700);
        CHECK(rpc_code(error_kind::method_not_found) == -32601);
        CHECK(rpc_code(error_kind::validation_error) == -32602);
        CHECK(rpc_code(error_kind::unknown_tool) == -32602);
        CHECK(rpc_code(error_kind::invalid_project) == -32001);
        CHECK(rpc_code(error_kind::spawn_error) == -32002);

        tool_error err{error_kind::invalid_project, "no manifest"};
        CHECK(err.kind() == error_kind::invalid_project);
        CHECK(std::string{err.what()} == "no manifest");
        CHECK(std::format("{}", err.kind()) == "InvalidProject");
    }

    TEST_CASE("001: toolchain and display helpers", "[001][utils]") {
        CHECK(utils::is_valid_toolchain("stable"));
        CHECK(utils::is_valid_toolchain("nightly-2024-01-01"));
        CHECK(utils::is_valid_toolchain("1.70.0"));
        CHECK_FALSE(utils::is_valid_toolchain(""));
        CHECK_FALSE(utils::is_valid_toolchain("-stable"));
        CHECK_FALSE(utils::is_valid_toolchain("stable;rm"));
        CHECK_FALSE(utils::is_valid_toolchain("a b"));

        CHECK(utils::display_quote("serde") == "serde");
        CHECK(utils::display_quote("-D warnings") == R"("-D warnings")");
        CHECK(utils::display_quote(R"(a"b)") == R"("a\"b")");

        CHECK(utils::to_valid_utf8("plain ascii\n") == "plain ascii\n");
        CHECK(utils::to_valid_utf8("caf\xC3\xA9 \xF0\x9F\xA6\x80") == "caf\xC3\xA9 \xF0\x9F\xA6\x80");
        CHECK(utils::to_valid_utf8("ok\xFF") == "ok\xEF\xBF\xBD");
        CHECK(utils::to_valid_utf8("\xE2\x82") == "\xEF\xBF\xBD");
        CHECK(utils::to_valid_utf8("\xC0\xAF") == "\xEF\xBF\xBD\xEF\xBF\xBD");
        CHECK(utils::to_valid_utf8("\xED\xA0\x80") == "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
        CHECK(utils::display_quote("") == R"("")");

        CHECK(utils::join_with_separator({"derive", "rc"}, ",") == "derive,rc");
        CHECK(utils::join_with_separator({}, ",").empty());
    }

}  // namespace cargomcp::test
