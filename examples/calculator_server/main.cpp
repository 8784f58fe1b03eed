/// Calculator server: arithmetic tools with schema-checked arguments.
/// Usage: ./calculator_server [--framing line|content-length]
/// Division by zero is reported as a tool error (isError), not a protocol error.

#include <toolwire/toolwire.hpp>
#include <cmath>
#include <csignal>
#include <iostream>
#include <numeric>
#include <string>

int main(int argc, char* argv[]) {
    std::signal(SIGPIPE, SIG_IGN);
    toolwire::log::configure_from_env();

    toolwire::ToolServer::Options opts;
    opts.server_info = {"calculator-server", std::string("Calculator"), "1.0.0"};
    opts.instructions = "Use 'calculate' for binary arithmetic and 'sum' to add a list of numbers.";
    opts.call_timeout = std::chrono::milliseconds(10000);
    opts.logger = toolwire::log::stderr_logger("calculator");

    if (argc == 3 && std::string(argv[1]) == "--framing") {
        try {
            opts.framing = toolwire::framing_from_string(argv[2]);
        } catch (const std::invalid_argument& e) {
            std::cerr << e.what() << "\n";
            return 2;
        }
    } else if (argc != 1) {
        std::cerr << "Usage: " << argv[0] << " [--framing line|content-length]\n";
        return 2;
    }

    toolwire::ToolServer server{std::move(opts)};

    toolwire::ToolDefinition calculate;
    calculate.name = "calculate";
    calculate.description = "Apply an arithmetic operation to two numbers";
    calculate.input_schema = {
        {"type", "object"},
        {"properties", {
            {"operation", {{"type", "string"},
                           {"enum", {"add", "subtract", "multiply", "divide"}}}},
            {"a", {{"type", "number"}}},
            {"b", {{"type", "number"}}}
        }},
        {"required", {"operation", "a", "b"}},
        {"additionalProperties", false}
    };
    calculate.annotations = nlohmann::json{{"readOnlyHint", true}, {"idempotentHint", true}};

    server.add_tool(calculate, [](const nlohmann::json& args) {
        const auto op = args.at("operation").get<std::string>();
        const double a = args.at("a").get<double>();
        const double b = args.at("b").get<double>();

        double value = 0;
        if (op == "add") {
            value = a + b;
        } else if (op == "subtract") {
            value = a - b;
        } else if (op == "multiply") {
            value = a * b;
        } else {
            if (b == 0) return toolwire::CallToolResult::error_text("Division by zero");
            value = a / b;
        }

        auto result = toolwire::CallToolResult::text(nlohmann::json(value).dump());
        result.structured_content = nlohmann::json{{"result", value}};
        return result;
    });

    toolwire::ToolDefinition sum;
    sum.name = "sum";
    sum.description = "Add up a list of numbers";
    sum.input_schema = {
        {"type", "object"},
        {"properties", {
            {"values", {{"type", "array"}, {"items", {{"type", "number"}}}, {"minItems", 1}}}
        }},
        {"required", {"values"}}
    };

    server.add_tool(sum, [](const nlohmann::json& args) {
        const auto& values = args.at("values");
        double total = std::accumulate(values.begin(), values.end(), 0.0,
            [](double acc, const nlohmann::json& v) { return acc + v.get<double>(); });
        if (!std::isfinite(total)) {
            return toolwire::CallToolResult::error_text("Sum overflowed");
        }
        return toolwire::CallToolResult::text(nlohmann::json(total).dump());
    });

    server.serve_stdio();
    return 0;
}
