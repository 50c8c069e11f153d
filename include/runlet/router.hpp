#pragma once

#include "config.hpp"
#include "execution.hpp"
#include "search.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace runlet {

    using namespace std::string_view_literals;

    // A required tool argument is absent or empty.
    class missing_argument : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    class unknown_tool : public std::runtime_error {
      public:
        explicit unknown_tool(std::string name);

        const std::string& tool_name() const noexcept { return name; }

      private:
        std::string name{};
    };

    enum class tool_kind { execute_node, execute_deno, search_code };

    inline constexpr std::string_view to_string(tool_kind kind) {
        switch (kind) {
            case tool_kind::execute_node:
                return "executenodejs"sv;
            case tool_kind::execute_deno:
                return "executedeno"sv;
            case tool_kind::search_code:
                return "searchcode"sv;
        }
        return "executenodejs"sv;
    }

    // canonical names plus the aliases older clients still send
    std::optional<tool_kind> resolve_tool(std::string_view name);

    struct tool_response {
        std::vector<std::string> segments{};
        bool is_error{false};
    };

    // stdout, stderr, spawn error and a timing summary, in that order
    std::vector<std::string> render_execution(const execution_result& result, runtime_kind runtime);

    std::vector<std::string> render_search(
            std::string_view query,
            const std::vector<std::filesystem::path>& folders,
            const std::vector<std::string>& extensions,
            const std::vector<std::string>& ignores,
            const std::vector<search::search_hit>& hits,
            int64_t elapsed_ms);

    /*
     * Maps a tool call to an executor or the code index and renders the outcome.
     *
     * route() never throws: missing arguments, unknown tools, malformed argument JSON
     * and collaborator failures all come back as a single "ERROR: ..." segment with
     * is_error set. Safe to call from several threads at once.
     */
    class tool_router {
      public:
        tool_router(const startup_config& cfg, search::code_index& index) : cfg(cfg), index(index) {}

        // `raw_arguments` is the JSON object of the call; empty means no arguments
        tool_response route(std::string_view tool_name, std::string_view raw_arguments) const;

      private:
        tool_response dispatch(std::string_view tool_name, std::string_view raw_arguments) const;
        tool_response run_execution(tool_kind kind, std::string_view raw_arguments) const;
        tool_response run_search(std::string_view raw_arguments) const;

        const startup_config& cfg;
        search::code_index& index;
    };

}  // namespace runlet
