#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cargomcp {

    using namespace std::string_view_literals;

    enum class error_kind : uint8_t {
        parse_error,
        method_not_found,
        invalid_params,
        unknown_tool,
        validation_error,
        invalid_project,
        spawn_error,
        internal_error,
    };

    inline constexpr std::string_view to_string(error_kind kind) {
        switch (kind) {
            case error_kind::parse_error:
                return "ParseError"sv;
            case error_kind::method_not_found:
                return "MethodNotFound"sv;
            case error_kind::invalid_params:
                return "InvalidParams"sv;
            case error_kind::unknown_tool:
                return "UnknownTool"sv;
            case error_kind::validation_error:
                return "ValidationError"sv;
            case error_kind::invalid_project:
                return "InvalidProject"sv;
            case error_kind::spawn_error:
                return "SpawnError"sv;
            case error_kind::internal_error:
                return "InternalError"sv;
        }
        return "InternalError"sv;
    }

    // JSON-RPC error code carried next to the kind on the wire
    inline constexpr int rpc_code(error_kind kind) {
        switch (kind) {
            case error_kind::parse_error:
                return -32700;
            case error_kind::method_not_found:
                return -32601;
            case error_kind::invalid_params:
            case error_kind::unknown_tool:
            case error_kind::validation_error:
                return -32602;
            case error_kind::invalid_project:
                return -32001;
            case error_kind::spawn_error:
                return -32002;
            case error_kind::internal_error:
                return -32603;
        }
        return -32603;
    }

    /*
     * Request-level failure. Everything except spawn_error is raised before any
     * child process exists; the dispatcher turns each one into exactly one
     * error response for the originating id.
     */
    class tool_error : public std::runtime_error {
      public:
        tool_error(error_kind kind, const std::string& message) : std::runtime_error{message}, kind_{kind} {}

        error_kind kind() const noexcept { return kind_; }

      private:
        error_kind kind_;
    };

}  // namespace cargomcp
