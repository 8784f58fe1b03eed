/// Hello world server: one say_hello tool over stdio.
/// Usage: ./hello_world [--framing line|content-length] [--timeout-ms N] [--log-level L]
/// Logs go to stderr; stdout carries only protocol messages.

#include <toolwire/toolwire.hpp>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {

void usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " [--framing line|content-length] [--timeout-ms N] [--log-level L]\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGPIPE, SIG_IGN);
    toolwire::log::configure_from_env();
    auto logger = toolwire::log::stderr_logger("hello-world-mcp");

    toolwire::ToolServer::Options opts;
    opts.server_info = {"hello-world-mcp", std::nullopt, "1.0.0"};
    opts.logger = logger;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (i + 1 >= argc) {
            usage(argv[0]);
            return 2;
        }
        std::string value = argv[++i];
        try {
            if (arg == "--framing") {
                opts.framing = toolwire::framing_from_string(value);
            } else if (arg == "--timeout-ms") {
                opts.call_timeout = std::chrono::milliseconds(std::stol(value));
            } else if (arg == "--log-level") {
                logger->set_level(spdlog::level::from_str(value));
            } else {
                usage(argv[0]);
                return 2;
            }
        } catch (const std::exception& e) {
            std::cerr << "Invalid value for " << arg << ": " << e.what() << "\n";
            return 2;
        }
    }

    toolwire::ToolServer server{std::move(opts)};

    toolwire::ToolDefinition say_hello;
    say_hello.name = "say_hello";
    say_hello.description = "Says hello to someone";
    say_hello.input_schema = {
        {"type", "object"},
        {"properties", {
            {"name", {{"type", "string"}, {"description", "Name of the person to greet"}}}
        }},
        {"required", {"name"}}
    };

    server.add_tool(say_hello, [](const nlohmann::json& args) {
        const auto name = args.at("name").get<std::string>();
        return toolwire::CallToolResult::text(
            "Hello, " + name + "! This is your MCP server speaking.");
    });

    logger->info("Hello World MCP Server running!");
    server.serve_stdio();
    return EXIT_SUCCESS;
}
