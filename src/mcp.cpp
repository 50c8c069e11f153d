#include "runlet/mcp.hpp"

#include "runlet/format.hpp"
#include "runlet/router.hpp"

#include <glaze/ext/jsonrpc.hpp>
#include <glaze/glaze.hpp>

#include <chrono>
#include <csignal>
#include <exception>
#include <future>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

using namespace runlet::literals;
using namespace std::string_view_literals;

namespace runlet::mcp {

    namespace detail {

        // ── MCP protocol types ──────────────────────────────────────────

        struct client_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = client_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct initialize_params {
            std::string protocolVersion{};
            client_info clientInfo{};
            struct glaze {
                using T = initialize_params;
                static constexpr auto value =
                        glz::object("protocolVersion", &T::protocolVersion, "clientInfo", &T::clientInfo);
            };
        };

        struct server_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = server_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct empty_object {
            struct glaze {
                using T = empty_object;
                static constexpr auto value = glz::object();
            };
        };

        struct server_capabilities {
            empty_object tools{};
            struct glaze {
                using T = server_capabilities;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct initialize_result {
            std::string protocolVersion{};
            server_capabilities capabilities{};
            server_info serverInfo{};
            struct glaze {
                using T = initialize_result;
                static constexpr auto value = glz::object(
                        "protocolVersion",
                        &T::protocolVersion,
                        "capabilities",
                        &T::capabilities,
                        "serverInfo",
                        &T::serverInfo);
            };
        };

        struct tool_definition {
            std::string name{};
            std::string description{};
            glz::raw_json inputSchema{};
            struct glaze {
                using T = tool_definition;
                static constexpr auto value = glz::object(&T::name, &T::description, "inputSchema", &T::inputSchema);
            };
        };

        struct tools_list_result {
            std::vector<tool_definition> tools{};
            struct glaze {
                using T = tools_list_result;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct tool_call_params {
            std::string name{};
            glz::raw_json arguments{};
            struct glaze {
                using T = tool_call_params;
                static constexpr auto value = glz::object(&T::name, &T::arguments);
            };
        };

        struct text_content {
            std::string type{"text"};
            std::string text{};
            struct glaze {
                using T = text_content;
                static constexpr auto value = glz::object(&T::type, &T::text);
            };
        };

        struct tool_call_result {
            std::vector<text_content> content{};
            bool isError{false};
            struct glaze {
                using T = tool_call_result;
                static constexpr auto value = glz::object(&T::content, "isError", &T::isError);
            };
        };

        // ── Tool schemas ────────────────────────────────────────────────

        static constexpr auto execute_node_description =
                R"(Execute JavaScript code directly with Node.js - supports ESM imports and all Node.js features. Code using require, module.exports, __dirname or __filename runs as CommonJS from a temporary file; everything else is piped to node as an ES module. Use console.log for output and JSON.stringify for complex objects. Break problems into testable hypotheses and verify them by running code.)";
        static constexpr auto execute_deno_description =
                R"(Execute JavaScript/TypeScript code with Deno (run --allow-all, program read from stdin) - supports ESM imports and all Deno features. Use fetch() for HTTP requests and console.log for output. Great for TypeScript debugging and type checking.)";
        static constexpr auto execute_input_schema =
                R"json({"type": "object","properties": {"code": {"type": "string","description": "JavaScript code to execute - use for debugging, testing hypotheses, and investigation"},"timeout": {"type": "number","description": "Optional timeout in milliseconds (default: 120000)"}},"required": ["code"]})json"sv;

        static constexpr auto search_description =
                R"(Semantic code search with metadata extraction and AST-aware chunking)";
        static constexpr auto search_input_schema =
                R"json({"type": "object","properties": {"query": {"type": "string","description": "Semantic search query for code"},"folders": {"type": "string","description": "Optional comma-separated list of folders to search (defaults to working directory)"},"extensions": {"type": "string","description": "Optional comma-separated list of file extensions to include (default: js,ts)"},"ignores": {"type": "string","description": "Optional comma-separated list of patterns to ignore (default: node_modules)"},"topK": {"type": "number","description": "Optional number of results to return (default: 8)"}},"required": ["query"]})json"sv;

        // ── Response helpers ────────────────────────────────────────────

        template <typename T>
        static std::string make_response(const glz::rpc::id_t& id, T&& result) {
            glz::rpc::response_t<std::decay_t<T>> resp{};
            resp.id = id;
            resp.result = std::forward<T>(result);
            std::string json{};
            (void)glz::write_json(resp, json);
            return json;
        }

        static std::string make_error_response(
                const glz::rpc::id_t& id, glz::rpc::error_e code, const std::string& message) {
            glz::rpc::response_t<glz::raw_json> resp{};
            resp.id = id;
            resp.error = glz::rpc::error{code, std::nullopt, message};
            std::string json{};
            (void)glz::write_json(resp, json);
            return json;
        }

        // one writer per server; tool calls answer from worker threads
        class response_writer {
          public:
            explicit response_writer(std::ostream& out) : out(out) {}

            void send(const std::string& json) {
                std::lock_guard lock{write_mutex};
                out << json << '\n';
                out.flush();
            }

          private:
            std::mutex write_mutex{};
            std::ostream& out;
        };

        // ── Handlers ────────────────────────────────────────────────────

        static std::string handle_initialize(const glz::rpc::id_t& id, glz::raw_json_view raw_params) {
            initialize_params params{};
            (void)glz::read<glz::opts{.error_on_unknown_keys = false}>(params, raw_params.str);

            initialize_result result{};
            result.protocolVersion = std::string{protocol_version};
            result.capabilities = server_capabilities{};
            result.serverInfo = server_info{.name = std::string{server_name}, .version = std::string{server_version}};

            return make_response(id, std::move(result));
        }

        static std::string handle_tools_list(const glz::rpc::id_t& id) {
            tools_list_result result{};
            result.tools.push_back(
                    tool_definition{
                            .name = std::string{to_string(tool_kind::execute_node)},
                            .description = execute_node_description,
                            .inputSchema = glz::raw_json{execute_input_schema},
                    });
            result.tools.push_back(
                    tool_definition{
                            .name = std::string{to_string(tool_kind::execute_deno)},
                            .description = execute_deno_description,
                            .inputSchema = glz::raw_json{execute_input_schema},
                    });
            result.tools.push_back(
                    tool_definition{
                            .name = std::string{to_string(tool_kind::search_code)},
                            .description = search_description,
                            .inputSchema = glz::raw_json{search_input_schema},
                    });

            return make_response(id, std::move(result));
        }

        static std::string handle_tools_call(
                const glz::rpc::id_t& id, const std::string& raw_params, const tool_router& router) {
            tool_call_params params{};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(params, raw_params);
            if (ec) {
                return make_error_response(id, glz::rpc::error_e::invalid_params, "Failed to parse tool call params");
            }

            auto response = router.route(params.name, params.arguments.str);

            tool_call_result result{};
            for (auto& segment : response.segments) {
                result.content.push_back(text_content{.text = std::move(segment)});
            }
            result.isError = response.is_error;
            return make_response(id, std::move(result));
        }

        // drops calls that have already answered
        static void reap_finished(std::vector<std::future<void>>& in_flight) {
            std::erase_if(in_flight, [](std::future<void>& call) {
                return call.wait_for(std::chrono::seconds{0}) == std::future_status::ready;
            });
        }

    }  // namespace detail

    // ── Server entry points ─────────────────────────────────────────

    int serve(const startup_config& cfg, search::code_index& index, std::istream& in, std::ostream& out) {
        tool_router router{cfg, index};
        detail::response_writer writer{out};
        std::vector<std::future<void>> in_flight{};

        std::string line{};
        while (std::getline(in, line)) {
            detail::reap_finished(in_flight);
            if (utils::trim_view(line).empty()) {
                continue;
            }

            glz::rpc::generic_request_t request{};
            auto ec = glz::read_json(request, line);
            if (ec) {
                if (!cfg.quiet) {
                    std::cerr << "runlet: dropping unparseable message\n";
                }
                writer.send(detail::make_error_response({}, glz::rpc::error_e::parse_error, "JSON parse error"));
                continue;
            }

            bool is_notification = std::holds_alternative<glz::generic::null_t>(request.id);

            try {
                if (request.method == "initialize"sv) {
                    writer.send(detail::handle_initialize(request.id, request.params));
                }
                else if (request.method.starts_with("notifications/"sv)) {
                    // notifications get no response
                }
                else if (request.method == "ping"sv) {
                    writer.send(detail::make_response(request.id, detail::empty_object{}));
                }
                else if (request.method == "tools/list"sv) {
                    writer.send(detail::handle_tools_list(request.id));
                }
                else if (request.method == "tools/call"sv) {
                    // ids and params view into the line buffer; the worker re-reads its own copy.
                    // a call sent as a notification still runs but is never answered
                    auto worker = [&router, &writer, &cfg, message = line, reply = !is_notification] {
                        glz::rpc::generic_request_t call{};
                        if (glz::read_json(call, message)) {
                            return;
                        }
                        try {
                            auto response = detail::handle_tools_call(call.id, std::string{call.params.str}, router);
                            if (reply) {
                                writer.send(response);
                            }
                        } catch (const std::exception& e) {
                            if (!cfg.quiet) {
                                std::cerr << "runlet: tools/call failed: {}\n"_format(e.what());
                            }
                            if (reply) {
                                writer.send(detail::make_error_response(
                                        call.id, glz::rpc::error_e::internal, "Internal error: {}"_format(e.what())));
                            }
                        }
                    };
                    in_flight.push_back(std::async(std::launch::async, std::move(worker)));
                }
                else if (!is_notification) {
                    writer.send(
                            detail::make_error_response(
                                    request.id,
                                    glz::rpc::error_e::method_not_found,
                                    "Unknown method: {}"_format(std::string{request.method})));
                }
            } catch (const std::exception& e) {
                if (!cfg.quiet) {
                    std::cerr << "runlet: {} failed: {}\n"_format(std::string{request.method}, e.what());
                }
                if (!is_notification) {
                    writer.send(detail::make_error_response(
                            request.id, glz::rpc::error_e::internal, "Internal error: {}"_format(e.what())));
                }
            }
        }

        for (auto& call : in_flight) {
            call.wait();
        }
        return 0;
    }

    int run_mcp_server(const startup_config& cfg) {
        ::signal(SIGPIPE, SIG_IGN);

        search::lexical_index index{};

        std::jthread startup_index{};
        if (cfg.index_on_startup) {
            startup_index = std::jthread{[&cfg, &index] {
                try {
                    index.sync({cfg.working_dir}, cfg.search_extensions, cfg.search_ignores);
                    debug_log("startup index ready: ", index.chunk_count(), " chunks");
                } catch (const std::exception& e) {
                    if (!cfg.quiet) {
                        std::cerr << "runlet: initial index of {} failed: {}\n"_format(
                                cfg.working_dir.string(), e.what());
                    }
                }
            }};
        }

        return serve(cfg, index, std::cin, std::cout);
    }

}  // namespace runlet::mcp
