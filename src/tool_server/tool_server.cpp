#include "tool_server.h"
#include "../common/error_handler.h"
#include "../common/json_utils.h"
#include "../common/string_utils.h"
#include "../common/structured_logger.h"
#include <stdexcept>

using json = nlohmann::json;

namespace calcpilot {

namespace {

const char* const PROTOCOL_VERSION = "2024-11-05";

// Protocol-level failure carrying its JSON-RPC code
class RpcError : public std::runtime_error {
public:
    RpcError(int code, const std::string& message) : std::runtime_error(message), m_code(code) {}
    int code() const { return m_code; }

private:
    int m_code;
};

json stringProperty(const std::string& description) {
    return json{{"type", "string"}, {"description", description}};
}

} // namespace

ToolServer::ToolServer(CalculatorTools& tools, std::istream& in, std::ostream& out,
                       StopCheck stopRequested)
    : m_tools(tools)
    , m_in(in)
    , m_out(out)
    , m_stopRequested(std::move(stopRequested)) {}

size_t ToolServer::run() {
    SLOG_INFO().component("tool_server").message("Tool server listening on stdio");

    size_t handled = 0;
    std::string line;
    while (!(m_stopRequested && m_stopRequested()) && std::getline(m_in, line)) {
        if (utils::StringUtils::isWhitespaceOnly(line)) {
            continue;
        }
        ++handled;
        auto response = handleLine(line);
        if (response) {
            m_out << response->dump() << std::endl;
        }
    }

    SLOG_INFO().component("tool_server")
        .message("Tool server stopped")
        .context("requests", handled);
    return handled;
}

std::optional<json> ToolServer::handleLine(const std::string& line) {
    if (utils::StringUtils::isWhitespaceOnly(line)) {
        return std::nullopt;
    }

    json request;
    try {
        request = json::parse(line);
    } catch (const json::parse_error& e) {
        SLOG_WARNING().component("tool_server")
            .message("Malformed request line")
            .context("error", e.what());
        return errorResponse(nullptr, PARSE_ERROR, "Parse error");
    }

    if (!request.is_object()) {
        return errorResponse(nullptr, INVALID_REQUEST, "Invalid Request");
    }

    const bool isNotification = !request.contains("id");
    const json id = isNotification ? json(nullptr) : request["id"];

    std::string method = utils::JsonUtils::getStringField(request, "method");
    if (method.empty()) {
        return isNotification ? std::nullopt
                              : std::optional<json>(errorResponse(id, INVALID_REQUEST, "Invalid Request"));
    }

    json params = json::object();
    utils::JsonUtils::getObjectField(request, "params", params);

    SLOG_DEBUG().component("tool_server")
        .message("Request received")
        .context("method", method)
        .context("id", id);

    json response;
    try {
        response = json{{"jsonrpc", "2.0"}, {"id", id}, {"result", dispatch(method, params)}};
    } catch (const RpcError& e) {
        SLOG_WARNING().component("tool_server")
            .message("Request rejected")
            .context("method", method)
            .context("code", e.code())
            .context("error", e.what());
        response = errorResponse(id, e.code(), e.what());
    } catch (const std::exception& e) {
        ErrorHandler::getInstance().handleException(e, "tool_server " + method);
        response = errorResponse(id, INTERNAL_ERROR, e.what());
    }

    if (isNotification) {
        return std::nullopt;
    }
    return response;
}

json ToolServer::dispatch(const std::string& method, const json& params) {
    if (method == "initialize") {
        return json{
            {"protocolVersion", PROTOCOL_VERSION},
            {"serverInfo", {{"name", "calcpilot"}, {"version", m_version}}},
            {"capabilities", {{"tools", json::object()}}}
        };
    }
    if (method == "tools/list") {
        return json{{"tools", toolDefinitions()}};
    }
    if (method == "tools/call") {
        return callTool(params);
    }
    if (method == "ping" || method == "notifications/initialized") {
        return json::object();
    }
    throw RpcError(METHOD_NOT_FOUND, "Method not found");
}

json ToolServer::callTool(const json& params) {
    std::string name = utils::JsonUtils::getStringField(params, "name");
    if (name.empty()) {
        throw RpcError(INVALID_PARAMS, "tools/call requires a tool name");
    }

    json arguments = json::object();
    utils::JsonUtils::getObjectField(params, "arguments", arguments);

    try {
        return toolResult(invokeTool(name, arguments));
    } catch (const CalcPilotException& e) {
        ErrorHandler::getInstance().handleException(e, "tool " + name);
        return toolResult(errorPayload(e));
    }
}

json ToolServer::invokeTool(const std::string& name, const json& arguments) {
    if (name == "open_calculator") {
        WindowFrame frame = m_tools.openApplication();
        return json{
            {"success", true},
            {"message", "Calculator ready"},
            {"window", {{"x", frame.originX}, {"y", frame.originY}}}
        };
    }

    if (name == "execute_calculation") {
        std::string instruction = utils::JsonUtils::getStringField(arguments, "instruction");
        if (utils::StringUtils::isWhitespaceOnly(instruction)) {
            return json{{"success", false}, {"error", "No instruction provided"}};
        }
        return m_tools.runInstruction(instruction).toJson();
    }

    if (name == "click_button") {
        std::string button = utils::JsonUtils::getStringField(arguments, "button");
        if (utils::StringUtils::isWhitespaceOnly(button)) {
            return json{{"success", false}, {"error", "No button provided"}};
        }
        return m_tools.pressButton(button).toJson();
    }

    throw RpcError(INVALID_PARAMS, "Unknown tool: " + name);
}

json ToolServer::toolDefinitions() {
    json tools = json::array();

    tools.push_back({
        {"name", "open_calculator"},
        {"description", "Opens the Calculator application"},
        {"inputSchema", {{"type", "object"}, {"properties", json::object()}}}
    });

    tools.push_back({
        {"name", "execute_calculation"},
        {"description", "Executes a natural language calculation instruction "
                        "(e.g., 'Add 2 and 3 and then find the square of the result')"},
        {"inputSchema", {
            {"type", "object"},
            {"properties", {{"instruction", stringProperty("Natural language instruction for the calculation")}}},
            {"required", json::array({"instruction"})}
        }}
    });

    tools.push_back({
        {"name", "click_button"},
        {"description", "Clicks a specific calculator button"},
        {"inputSchema", {
            {"type", "object"},
            {"properties", {{"button", stringProperty("Button name (e.g., '2', '+', '=', 'square')")}}},
            {"required", json::array({"button"})}
        }}
    });

    return tools;
}

json ToolServer::toolResult(const json& payload) {
    json result = {
        {"content", json::array({json{{"type", "text"}, {"text", payload.dump(2)}}})}
    };
    if (payload.is_object() && payload.value("success", true) == false) {
        result["isError"] = true;
    }
    return result;
}

json ToolServer::errorPayload(const CalcPilotException& e) {
    const ErrorInfo& info = e.getErrorInfo();
    json payload = {
        {"success", false},
        {"error", info.message},
        {"error_type", ErrorHandler::errorTypeToString(info.type)},
        {"retryable", ErrorHandler::isRetryable(info.type)}
    };
    if (!info.details.empty()) {
        payload["details"] = info.details;
    }
    return payload;
}

json ToolServer::errorResponse(const json& id, int code, const std::string& message) {
    return json{
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
}

} // namespace calcpilot
