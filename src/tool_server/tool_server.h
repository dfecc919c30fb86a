#ifndef CALCPILOT_TOOL_SERVER_H
#define CALCPILOT_TOOL_SERVER_H

#include <string>
#include <istream>
#include <ostream>
#include <optional>
#include <functional>
#include <nlohmann/json.hpp>
#include "../calculator_tools/calculator_tools.h"
#include "../common/error_handler.h"

namespace calcpilot {

/**
 * @brief Line-oriented JSON-RPC 2.0 front end for CalculatorTools.
 *
 * One request per input line, one response per output line. Domain errors
 * become tool results with success=false; only protocol faults use the
 * JSON-RPC error object.
 */
class ToolServer {
public:
    using StopCheck = std::function<bool()>;

    static constexpr int PARSE_ERROR = -32700;
    static constexpr int INVALID_REQUEST = -32600;
    static constexpr int METHOD_NOT_FOUND = -32601;
    static constexpr int INVALID_PARAMS = -32602;
    static constexpr int INTERNAL_ERROR = -32603;

    ToolServer(CalculatorTools& tools, std::istream& in, std::ostream& out,
               StopCheck stopRequested = nullptr);

    // Serves until EOF or until stopRequested() returns true; returns the number of requests handled
    size_t run();

    // Empty optional for blank lines and notifications
    std::optional<nlohmann::json> handleLine(const std::string& line);

    static nlohmann::json toolDefinitions();

    void setServerVersion(const std::string& version) { m_version = version; }

private:
    CalculatorTools& m_tools;
    std::istream& m_in;
    std::ostream& m_out;
    StopCheck m_stopRequested;
    std::string m_version = "1.0.0";

    nlohmann::json dispatch(const std::string& method, const nlohmann::json& params);
    nlohmann::json callTool(const nlohmann::json& params);
    nlohmann::json invokeTool(const std::string& name, const nlohmann::json& arguments);

    static nlohmann::json toolResult(const nlohmann::json& payload);
    static nlohmann::json errorPayload(const CalcPilotException& e);
    static nlohmann::json errorResponse(const nlohmann::json& id, int code, const std::string& message);
};

} // namespace calcpilot

#endif // CALCPILOT_TOOL_SERVER_H
