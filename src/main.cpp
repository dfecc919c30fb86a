#include <iostream>
#include <memory>
#include <string>
#include <csignal>
#include <cstdlib>
#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#undef ERROR
#endif
#include <nlohmann/json.hpp>
#include "common/structured_logger.h"
#include "common/config_manager.h"
#include "common/error_handler.h"
#include "common/shutdown_manager.h"
#include "instruction_parser/instruction_parser.h"
#include "button_compiler/button_compiler.h"
#include "element_registry/element_registry.h"
#include "calculator_tools/calculator_tools.h"
#include "tool_server/tool_server.h"
#include "ocal/ocal.h"
#include "ocal/mouse_control.h"

#ifndef CALCPILOT_VERSION
#define CALCPILOT_VERSION "1.0.0"
#endif

using namespace calcpilot;
using json = nlohmann::json;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

#ifdef _WIN32
BOOL WINAPI consoleHandler(DWORD signal) {
    if (signal == CTRL_C_EVENT || signal == CTRL_BREAK_EVENT) {
        auto& shutdownMgr = ShutdownManager::getInstance();
        if (shutdownMgr.incrementInterruptCount() == 1) {
            shutdownMgr.requestShutdown();
        } else {
            std::_Exit(EXIT_FAILED);
        }
        return TRUE;
    }
    return FALSE;
}
#else
// First signal stops before the next click, a second one exits at once
void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        auto& shutdownMgr = ShutdownManager::getInstance();
        if (shutdownMgr.incrementInterruptCount() == 1) {
            shutdownMgr.requestShutdown();
        } else {
            std::_Exit(EXIT_FAILED);
        }
    }
}
#endif

enum class Action {
    NONE,
    OPEN,
    RUN,
    PRESS,
    DRY_RUN,
    SERVE
};

struct Options {
    std::string configPath = "config/calcpilot.json";
    std::string registryPath;
    Action action = Action::NONE;
    std::string argument;
};

void printUsage() {
    std::cout << "CalcPilot - natural language calculator automation\n";
    std::cout << "Usage: calcpilot [options] <action>\n\n";
    std::cout << "Actions:\n";
    std::cout << "  --open               Open and focus the calculator\n";
    std::cout << "  --run <text>         Execute an instruction, e.g. \"add 2 and 3 then square\"\n";
    std::cout << "  --press <name>       Press a single button (\"7\", \"+\", \"square\", \"MC\")\n";
    std::cout << "  --dry-run <text>     Print the button sequence without touching the desktop\n";
    std::cout << "  --serve              Serve the tools as JSON-RPC on stdin/stdout\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <path>      Configuration file (default config/calcpilot.json)\n";
    std::cout << "  --registry <path>    Element registry, overrides the configured path\n";
    std::cout << "  --help, -h           Show this help message\n";
    std::cout << "  --version, -v        Show version information\n";
}

// Returns an exit code when the arguments end the program, otherwise -1
int parseArguments(int argc, char* argv[], Options& options) {
    auto setAction = [&options](Action action, const std::string& argument) {
        if (options.action != Action::NONE) {
            std::cerr << "Error: only one of --open, --run, --press, --dry-run, --serve may be given\n";
            return false;
        }
        options.action = action;
        options.argument = argument;
        return true;
    };

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            printUsage();
            return EXIT_OK;
        }
        else if (arg == "--version" || arg == "-v") {
            std::cout << "CalcPilot v" << CALCPILOT_VERSION << "\n";
            return EXIT_OK;
        }
        else if (arg == "--config" || arg == "--registry") {
            if (!hasValue) {
                std::cerr << "Error: " << arg << " option requires a path argument\n";
                return EXIT_USAGE;
            }
            (arg == "--config" ? options.configPath : options.registryPath) = argv[++i];
        }
        else if (arg == "--run" || arg == "--press" || arg == "--dry-run") {
            if (!hasValue) {
                std::cerr << "Error: " << arg << " option requires an argument\n";
                return EXIT_USAGE;
            }
            Action action = arg == "--run" ? Action::RUN : arg == "--press" ? Action::PRESS : Action::DRY_RUN;
            if (!setAction(action, argv[++i])) {
                return EXIT_USAGE;
            }
        }
        else if (arg == "--open" || arg == "--serve") {
            if (!setAction(arg == "--open" ? Action::OPEN : Action::SERVE, "")) {
                return EXIT_USAGE;
            }
        }
        else {
            std::cerr << "Error: unknown option " << arg << "\n";
            printUsage();
            return EXIT_USAGE;
        }
    }

    if (options.action == Action::NONE) {
        printUsage();
        return EXIT_USAGE;
    }
    return -1;
}

// In serve mode stdout belongs to the protocol, so the console sink writes to stderr only
void configureLogging(const ConfigManager& config, bool serveMode) {
    auto& slogger = StructuredLogger::getInstance();
    slogger.clearSinks();
    slogger.setLogLevel(logLevelFromString(config.getLogLevel()));

    slogger.addSink(std::make_shared<ConsoleLogSink>(std::make_shared<TextLogFormatter>(), serveMode));

    if (!config.getLogFile().empty()) {
        RotatingFileLogSink::Config fileConfig;
        fileConfig.base_path = config.getLogFile();
        fileConfig.max_file_size = static_cast<size_t>(config.getLogMaxSizeMb()) * 1024 * 1024;
        fileConfig.max_files = static_cast<size_t>(config.getLogMaxFiles());
        slogger.addSink(std::make_shared<RotatingFileLogSink>(fileConfig, std::make_shared<JsonLogFormatter>()));
    }

    slogger.setAsyncLogging(config.getLogAsync());
    slogger.setSlowOperationThreshold(std::chrono::milliseconds(config.getSlowOperationMs()));

    SLOG_INFO().message("Structured logging configured")
        .context("log_level", config.getLogLevel())
        .context("log_file", config.getLogFile())
        .context("async_logging", config.getLogAsync());
}

void logOperationMetrics() {
    auto metrics = StructuredLogger::getInstance().getPerformanceTracker().getAllMetrics();
    if (metrics.empty()) {
        return;
    }
    json summary = json::object();
    for (const auto& [operation, snapshot] : metrics) {
        summary[operation] = snapshot.toJson();
    }
    SLOG_DEBUG().message("Operation timings").context("operations", summary);
}

void configureRetries(const ConfigManager& config) {
    auto& errors = ErrorHandler::getInstance();
    errors.setMaxRetries(ErrorType::WINDOW_UNAVAILABLE, config.getWindowRetryCount());
    errors.setRetryDelay(ErrorType::WINDOW_UNAVAILABLE, config.getWindowRetryDelayMs());
}

int dryRun(const std::string& instruction) {
    InstructionParser parser;
    ButtonCompiler compiler;

    std::vector<Step> steps = parser.parse(instruction);
    std::vector<ButtonSymbol> symbols = compiler.compile(steps);

    json plan = {
        {"success", true},
        {"instruction", instruction},
        {"steps", json::array()},
        {"buttons", ButtonCompiler::names(symbols)}
    };
    for (const auto& step : steps) {
        json entry = {{"op", operatorToString(step.op)}};
        if (step.operandA) entry["a"] = *step.operandA;
        if (step.operandB) entry["b"] = *step.operandB;
        plan["steps"].push_back(entry);
    }

    std::cout << plan.dump(2) << std::endl;
    std::cerr << ButtonCompiler::describe(symbols) << "\n";
    return EXIT_OK;
}

int printReport(const ExecutionReport& report) {
    std::cout << report.toJson().dump(2) << std::endl;
    if (report.cancelled) {
        SLOG_WARNING().message("Stopped by shutdown request");
    }
    return report.success() ? EXIT_OK : EXIT_FAILED;
}

int runAction(const Options& options, const ConfigManager& config) {
    std::string registryPath = options.registryPath.empty() ? config.getRegistryPath() : options.registryPath;
    auto registry = ElementRegistry::loadFromFile(registryPath, config.getRegistryState());

    ocal::DesktopWindowLocator::Settings locatorSettings;
    locatorSettings.windowTitle = config.getWindowTitle();
    locatorSettings.launchCommand = config.getLaunchCommand();
    locatorSettings.launchTimeoutMs = config.getLaunchTimeoutMs();
    locatorSettings.excludedTitles = config.getExcludedTitles();
    ocal::DesktopWindowLocator locator(locatorSettings);
    ocal::DesktopClickPrimitive clicker(config.getClickDelayMs());

    if (!ocal::mouse::isSupported()) {
        SLOG_WARNING().message("This build has no mouse backend; every click will fail");
    }

    ActionExecutor::Settings settings;
    settings.settleDelayMs = config.getSettleDelayMs();
    settings.focusBeforeClick = config.getFocusBeforeClick();
    settings.focusDelayMs = config.getFocusDelayMs();

    CalculatorTools tools(registry, locator, clicker, settings, [] {
        return ShutdownManager::getInstance().isShutdownRequested();
    });

    switch (options.action) {
        case Action::OPEN: {
            WindowFrame frame = tools.openApplication();
            json result = {{"success", true}, {"window", {{"x", frame.originX}, {"y", frame.originY}}}};
            std::cout << result.dump(2) << std::endl;
            return EXIT_OK;
        }
        case Action::RUN:
            return printReport(tools.runInstruction(options.argument));
        case Action::PRESS:
            return printReport(tools.pressButton(options.argument));
        case Action::SERVE: {
            ToolServer server(tools, std::cin, std::cout, [] {
                return ShutdownManager::getInstance().isShutdownRequested();
            });
            server.setServerVersion(CALCPILOT_VERSION);
            server.run();
            return EXIT_OK;
        }
        default:
            return EXIT_USAGE;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    Options options;
    int parsed = parseArguments(argc, argv, options);
    if (parsed >= 0) {
        return parsed;
    }

#ifdef _WIN32
    SetConsoleOutputCP(CP_UTF8);
    if (!SetConsoleCtrlHandler(consoleHandler, TRUE)) {
        std::cerr << "Error: Could not set console control handler\n";
    }
#else
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#endif

    int exitCode = EXIT_FAILED;
    try {
        if (options.action == Action::DRY_RUN) {
            // Nothing to configure: no desktop, no registry, warnings only on stderr
            StructuredLogger::getInstance().clearSinks();
            StructuredLogger::getInstance().addSink(
                std::make_shared<ConsoleLogSink>(std::make_shared<TextLogFormatter>(), true));
            StructuredLogger::getInstance().setLogLevel(LogLevel::WARNING);
            exitCode = dryRun(options.argument);
        } else {
            auto& config = ConfigManager::getInstance();
            config.loadConfig(options.configPath);
            configureLogging(config, options.action == Action::SERVE);
            configureRetries(config);

            SLOG_INFO().message("CalcPilot starting")
                .context("version", CALCPILOT_VERSION)
                .context("config", config.getConfigPath());

            exitCode = runAction(options, config);
            logOperationMetrics();
        }
    } catch (const CalcPilotException& e) {
        ErrorHandler::getInstance().handleException(e, "calcpilot");
        const ErrorInfo& info = e.getErrorInfo();
        json result = {
            {"success", false},
            {"error", info.message},
            {"error_type", ErrorHandler::errorTypeToString(info.type)}
        };
        if (!info.details.empty()) {
            result["details"] = info.details;
        }
        std::cout << result.dump(2) << std::endl;
        exitCode = EXIT_FAILED;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        exitCode = EXIT_FAILED;
    }

    StructuredLogger::getInstance().shutdown();
    return exitCode;
}
