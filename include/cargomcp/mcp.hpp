#pragma once

#include "config.hpp"
#include "process.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <list>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>

namespace cargomcp::mcp {

    // Serialises whole protocol lines onto one output stream.
    class response_sink {
      public:
        explicit response_sink(std::ostream& out) : out_{out} {}

        response_sink(const response_sink&) = delete;
        response_sink& operator=(const response_sink&) = delete;

        // writes `json` plus a newline and flushes, atomically with respect to other writers
        void write_line(std::string_view json);

      private:
        std::mutex mutex_;
        std::ostream& out_;
    };

    using process_runner = std::function<process_result(const process_spec&)>;

    // starts the thread that carries one tool invocation; may throw std::system_error
    using worker_launcher = std::function<std::jthread(std::function<void()>)>;

    /*
     * Reads protocol lines in arrival order. Cheap methods are answered inline;
     * each accepted tools/call is validated and checked against the project
     * directory on the calling thread, then built, executed and answered on its
     * own thread. Every request carrying an id gets exactly one response.
     */
    class dispatcher {
      public:
        dispatcher(
                const startup_config& cfg, response_sink& sink, process_runner runner, worker_launcher launcher);
        dispatcher(const startup_config& cfg, response_sink& sink, process_runner runner);
        dispatcher(const startup_config& cfg, response_sink& sink);
        ~dispatcher();

        dispatcher(const dispatcher&) = delete;
        dispatcher& operator=(const dispatcher&) = delete;

        void handle_line(std::string_view line);

        // blocks until every in-flight invocation has written its response
        void wait_idle();

        size_t in_flight() const;

      private:
        struct unit {
            std::shared_ptr<std::atomic<bool>> done;
            std::jthread worker;
        };

        void reap();
        void start_tool_call(std::string id, std::string_view raw_params);

        const startup_config& cfg_;
        response_sink& sink_;
        process_runner runner_;
        worker_launcher launcher_;
        std::list<unit> units_{};
    };

    int run_mcp_server(const startup_config& cfg, std::istream& in, std::ostream& out);
    int run_mcp_server(const startup_config& cfg);

}  // namespace cargomcp::mcp
