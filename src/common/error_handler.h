#ifndef CALCPILOT_ERROR_HANDLER_H
#define CALCPILOT_ERROR_HANDLER_H

#include <string>
#include <exception>
#include <map>
#include <vector>
#include <mutex>
#include <chrono>

namespace calcpilot {

enum class ErrorType {
    UNSUPPORTED_INSTRUCTION,
    NUMBER_PARSE,
    AMBIGUOUS_OPERAND,
    BUTTON_NOT_FOUND,
    WINDOW_UNAVAILABLE,
    CLICK_ERROR,
    REGISTRY_LOAD,
    CONFIGURATION_ERROR,
    UNKNOWN_ERROR
};

enum class ErrorSeverity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

struct ErrorInfo {
    ErrorType type;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::system_clock::time_point timestamp;

    ErrorInfo(ErrorType t, ErrorSeverity s, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "")
        : type(t), severity(s), message(msg), details(det), context(ctx),
          timestamp(std::chrono::system_clock::now()) {}
};

class CalcPilotException : public std::exception {
public:
    explicit CalcPilotException(const ErrorInfo& error) : m_errorInfo(error) {}

    const char* what() const noexcept override {
        return m_errorInfo.message.c_str();
    }

    const ErrorInfo& getErrorInfo() const { return m_errorInfo; }
    ErrorType getType() const { return m_errorInfo.type; }

private:
    ErrorInfo m_errorInfo;
};

// Input falls outside the supported instruction grammar
class UnsupportedInstructionError : public CalcPilotException {
public:
    explicit UnsupportedInstructionError(const std::string& message,
                                         const std::string& details = "",
                                         const std::string& context = "")
        : CalcPilotException(ErrorInfo(ErrorType::UNSUPPORTED_INSTRUCTION, ErrorSeverity::MEDIUM,
                                       message, details, context)) {}
};

// details carries the offending token
class NumberParseError : public CalcPilotException {
public:
    explicit NumberParseError(const std::string& message,
                              const std::string& details = "",
                              const std::string& context = "")
        : CalcPilotException(ErrorInfo(ErrorType::NUMBER_PARSE, ErrorSeverity::MEDIUM,
                                       message, details, context)) {}
};

class AmbiguousOperandError : public CalcPilotException {
public:
    explicit AmbiguousOperandError(const std::string& message,
                                   const std::string& details = "",
                                   const std::string& context = "")
        : CalcPilotException(ErrorInfo(ErrorType::AMBIGUOUS_OPERAND, ErrorSeverity::MEDIUM,
                                       message, details, context)) {}
};

class ButtonNotFoundError : public CalcPilotException {
public:
    explicit ButtonNotFoundError(const std::string& message,
                                 const std::string& details = "",
                                 const std::string& context = "")
        : CalcPilotException(ErrorInfo(ErrorType::BUTTON_NOT_FOUND, ErrorSeverity::HIGH,
                                       message, details, context)) {}
};

class WindowUnavailableError : public CalcPilotException {
public:
    explicit WindowUnavailableError(const std::string& message,
                                    const std::string& details = "",
                                    const std::string& context = "")
        : CalcPilotException(ErrorInfo(ErrorType::WINDOW_UNAVAILABLE, ErrorSeverity::HIGH,
                                       message, details, context)) {}
};

class ClickError : public CalcPilotException {
public:
    explicit ClickError(const std::string& message,
                        const std::string& details = "",
                        const std::string& context = "")
        : CalcPilotException(ErrorInfo(ErrorType::CLICK_ERROR, ErrorSeverity::HIGH,
                                       message, details, context)) {}
};

class RegistryLoadError : public CalcPilotException {
public:
    explicit RegistryLoadError(const std::string& message,
                               const std::string& details = "",
                               const std::string& context = "")
        : CalcPilotException(ErrorInfo(ErrorType::REGISTRY_LOAD, ErrorSeverity::CRITICAL,
                                       message, details, context)) {}
};

class ConfigurationError : public CalcPilotException {
public:
    explicit ConfigurationError(const std::string& message,
                                const std::string& details = "",
                                const std::string& context = "")
        : CalcPilotException(ErrorInfo(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::CRITICAL,
                                       message, details, context)) {}
};

/**
 * @brief Central error log with bounded history and per-type retry policy
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    // Records and logs; never throws
    void handleError(const ErrorInfo& error);
    void handleException(const std::exception& e, const std::string& context = "");

    void logError(const ErrorInfo& error);
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    void clearErrorHistory();

    // Only WINDOW_UNAVAILABLE is retryable: no click has been issued when it is raised
    static bool isRetryable(ErrorType type);

    void setMaxRetries(ErrorType type, int maxRetries);
    void setRetryDelay(ErrorType type, int delayMs);
    int getMaxRetries(ErrorType type) const;
    int getRetryDelay(ErrorType type) const;

    // True if attempt (0-based count of retries already made) is below the limit
    bool shouldRetry(const ErrorInfo& error, int attempt) const;

    static std::string errorTypeToString(ErrorType type);
    static std::string errorSeverityToString(ErrorSeverity severity);

private:
    ErrorHandler();
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    static constexpr size_t MAX_HISTORY = 1000;

    mutable std::mutex m_mutex;
    std::vector<ErrorInfo> m_errorHistory;
    std::map<ErrorType, int> m_maxRetries;
    std::map<ErrorType, int> m_retryDelays;
};

} // namespace calcpilot

#endif // CALCPILOT_ERROR_HANDLER_H
