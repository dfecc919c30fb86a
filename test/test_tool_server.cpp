#include <iostream>
#include <sstream>
#include <cassert>
#include "tool_server/tool_server.h"
#include "common/error_handler.h"
#include "common/structured_logger.h"
#include "test_fakes.h"

using namespace calcpilot;
using namespace calcpilot::testing;
using json = nlohmann::json;

namespace {

ActionExecutor::Settings quickSettings() {
    ActionExecutor::Settings settings;
    settings.settleDelayMs = 0;
    settings.focusDelayMs = 0;
    return settings;
}

// Holds the fakes and a server reading from an empty stream
struct Fixture {
    FakeWindowLocator locator;
    RecordingClicker clicker;
    CalculatorTools tools;
    std::istringstream in;
    std::ostringstream out;
    ToolServer server;

    Fixture()
        : tools(sampleRegistry(), locator, clicker, quickSettings())
        , server(tools, in, out) {}

    json request(const json& message) {
        auto response = server.handleLine(message.dump());
        assert(response);
        return *response;
    }

    json callTool(const std::string& name, const json& arguments) {
        json response = request({{"jsonrpc", "2.0"}, {"id", 7}, {"method", "tools/call"},
                                 {"params", {{"name", name}, {"arguments", arguments}}}});
        assert(response["id"] == 7);
        assert(response.contains("result"));
        return response["result"];
    }
};

json toolPayload(const json& result) {
    return json::parse(result["content"][0]["text"].get<std::string>());
}

} // namespace

void testInitializeAndList() {
    std::cout << "[TEST] Initialize and List Tools\n";

    Fixture fixture;
    fixture.server.setServerVersion("9.9.9");

    json init = fixture.request({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}, {"params", json::object()}});
    assert(init["id"] == 1);
    assert(init["result"]["protocolVersion"] == "2024-11-05");
    assert(init["result"]["serverInfo"]["name"] == "calcpilot");
    assert(init["result"]["serverInfo"]["version"] == "9.9.9");

    json list = fixture.request({{"jsonrpc", "2.0"}, {"id", "list"}, {"method", "tools/list"}});
    assert(list["id"] == "list");
    const json& tools = list["result"]["tools"];
    assert(tools.size() == 3);
    assert(tools[0]["name"] == "open_calculator");
    assert(tools[1]["name"] == "execute_calculation");
    assert(tools[1]["inputSchema"]["required"][0] == "instruction");
    assert(tools[2]["name"] == "click_button");

    json ping = fixture.request({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "ping"}});
    assert(ping["result"].is_object() && ping["result"].empty());

    std::cout << "[OK] Initialize and list tools test passed\n\n";
}

void testToolCalls() {
    std::cout << "[TEST] Tool Calls\n";

    Fixture fixture;

    json opened = toolPayload(fixture.callTool("open_calculator", json::object()));
    assert(opened["success"] == true);
    assert(opened["window"]["x"] == 100);

    json result = fixture.callTool("execute_calculation", {{"instruction", "Add 2 and 3"}});
    assert(!result.contains("isError"));
    json payload = toolPayload(result);
    assert(payload["success"] == true);
    assert(payload["buttons"] == json::array({"2", "+", "3", "="}));
    assert(fixture.clicker.clicks.size() == 4);

    payload = toolPayload(fixture.callTool("click_button", {{"button", "equals"}}));
    assert(payload["success"] == true);
    assert(fixture.clicker.clicks.size() == 5);

    std::cout << "[OK] Tool calls test passed\n\n";
}

void testDomainErrorsAreToolResults() {
    std::cout << "[TEST] Domain Errors as Tool Results\n";

    Fixture fixture;

    json result = fixture.callTool("execute_calculation", {{"instruction", "dance for me"}});
    assert(result["isError"] == true);
    json payload = toolPayload(result);
    assert(payload["success"] == false);
    assert(payload["error_type"] == "UNSUPPORTED_INSTRUCTION");
    assert(payload["retryable"] == false);

    payload = toolPayload(fixture.callTool("click_button", {{"button", "Memory"}}));
    assert(payload["error_type"] == "BUTTON_NOT_FOUND");

    payload = toolPayload(fixture.callTool("execute_calculation", json::object()));
    assert(payload["success"] == false);
    assert(payload["error"] == "No instruction provided");

    payload = toolPayload(fixture.callTool("click_button", {{"button", ""}}));
    assert(payload["error"] == "No button provided");

    fixture.clicker.failAt = 1;
    payload = toolPayload(fixture.callTool("execute_calculation", {{"instruction", "add 2 and 3"}}));
    assert(payload["success"] == false);
    assert(payload["failed_index"] == 1);
    assert(payload["succeeded"] == json::array({0}));

    assert(fixture.clicker.clicks.size() == 1);

    std::cout << "[OK] Domain errors as tool results test passed\n\n";
}

void testProtocolErrors() {
    std::cout << "[TEST] Protocol Errors\n";

    Fixture fixture;

    auto parse = fixture.server.handleLine("{not json");
    assert(parse);
    assert((*parse)["error"]["code"] == ToolServer::PARSE_ERROR);
    assert((*parse)["id"].is_null());

    auto notObject = fixture.server.handleLine("[1, 2]");
    assert((*notObject)["error"]["code"] == ToolServer::INVALID_REQUEST);

    json noMethod = fixture.request({{"jsonrpc", "2.0"}, {"id", 3}});
    assert(noMethod["error"]["code"] == ToolServer::INVALID_REQUEST);

    json unknown = fixture.request({{"jsonrpc", "2.0"}, {"id", 4}, {"method", "resources/list"}});
    assert(unknown["error"]["code"] == ToolServer::METHOD_NOT_FOUND);
    assert(unknown["id"] == 4);

    json unknownTool = fixture.request({{"jsonrpc", "2.0"}, {"id", 5}, {"method", "tools/call"},
                                        {"params", {{"name", "scientific_mode"}}}});
    assert(unknownTool["error"]["code"] == ToolServer::INVALID_PARAMS);
    assert(unknownTool["error"]["message"] == "Unknown tool: scientific_mode");

    json nameless = fixture.request({{"jsonrpc", "2.0"}, {"id", 6}, {"method", "tools/call"}, {"params", json::object()}});
    assert(nameless["error"]["code"] == ToolServer::INVALID_PARAMS);

    std::cout << "[OK] Protocol errors test passed\n\n";
}

void testNotifications() {
    std::cout << "[TEST] Notifications\n";

    Fixture fixture;
    assert(!fixture.server.handleLine(R"({"jsonrpc": "2.0", "method": "notifications/initialized"})"));
    assert(!fixture.server.handleLine(R"({"jsonrpc": "2.0", "method": "no/such/method"})"));
    assert(!fixture.server.handleLine("   "));

    std::cout << "[OK] Notifications test passed\n\n";
}

void testRunLoop() {
    std::cout << "[TEST] Run Loop\n";

    FakeWindowLocator locator;
    RecordingClicker clicker;
    CalculatorTools tools(sampleRegistry(), locator, clicker, quickSettings());

    std::istringstream in(
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\"}\n"
        "\n"
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/call\","
        "\"params\":{\"name\":\"click_button\",\"arguments\":{\"button\":\"2\"}}}\n"
        "garbage\n");
    std::ostringstream out;
    ToolServer server(tools, in, out);

    assert(server.run() == 4);

    std::istringstream lines(out.str());
    std::vector<json> responses;
    std::string line;
    while (std::getline(lines, line)) {
        responses.push_back(json::parse(line));
    }
    assert(responses.size() == 3);
    assert(responses[0]["id"] == 1);
    assert(responses[1]["id"] == 2);
    assert(toolPayload(responses[1]["result"])["success"] == true);
    assert(responses[2]["error"]["code"] == ToolServer::PARSE_ERROR);
    assert(clicker.clicks.size() == 1);

    // A stop request ends the loop before the next line is read
    std::istringstream pending("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n");
    std::ostringstream ignored;
    ToolServer stopped(tools, pending, ignored, [] { return true; });
    assert(stopped.run() == 0);
    assert(ignored.str().empty());

    std::cout << "[OK] Run loop test passed\n\n";
}

int main() {
    std::cout << "=== CalcPilot Tool Server Test Suite ===\n\n";

    StructuredLogger::getInstance().setLogLevel(LogLevel::CRITICAL);
    ErrorHandler::getInstance().setRetryDelay(ErrorType::WINDOW_UNAVAILABLE, 0);

    try {
        testInitializeAndList();
        testToolCalls();
        testDomainErrorsAreToolResults();
        testProtocolErrors();
        testNotifications();
        testRunLoop();

        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
