#include "error_handler.h"
#include "structured_logger.h"
#include <sstream>

namespace calcpilot {

ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

ErrorHandler::ErrorHandler() {
    m_maxRetries[ErrorType::WINDOW_UNAVAILABLE] = 2;
    m_retryDelays[ErrorType::WINDOW_UNAVAILABLE] = 500;
}

void ErrorHandler::handleError(const ErrorInfo& error) {
    logError(error);
}

void ErrorHandler::handleException(const std::exception& e, const std::string& context) {
    const auto* calcError = dynamic_cast<const CalcPilotException*>(&e);
    if (calcError) {
        ErrorInfo info = calcError->getErrorInfo();
        if (info.context.empty()) {
            info.context = context;
        }
        handleError(info);
    } else {
        handleError(ErrorInfo(ErrorType::UNKNOWN_ERROR, ErrorSeverity::HIGH, e.what(), "", context));
    }
}

void ErrorHandler::logError(const ErrorInfo& error) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_errorHistory.push_back(error);
        if (m_errorHistory.size() > MAX_HISTORY) {
            m_errorHistory.erase(m_errorHistory.begin());
        }
    }

    std::ostringstream logMessage;
    logMessage << "[" << errorTypeToString(error.type) << "] " << error.message;
    if (!error.details.empty()) {
        logMessage << " - Details: " << error.details;
    }
    if (!error.context.empty()) {
        logMessage << " - Context: " << error.context;
    }

    LogLevel level = LogLevel::INFO;
    switch (error.severity) {
        case ErrorSeverity::LOW: level = LogLevel::DEBUG; break;
        case ErrorSeverity::MEDIUM: level = LogLevel::WARNING; break;
        case ErrorSeverity::HIGH: level = LogLevel::ERROR_LEVEL; break;
        case ErrorSeverity::CRITICAL: level = LogLevel::CRITICAL; break;
    }

    StructuredLogger::LogBuilder(&StructuredLogger::getInstance(), level)
        .file(__FILE__, __LINE__)
        .component("error_handler")
        .message(logMessage.str())
        .context("error_type", errorTypeToString(error.type))
        .context("severity", errorSeverityToString(error.severity));
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t start = (m_errorHistory.size() > count) ? m_errorHistory.size() - count : 0;
    return std::vector<ErrorInfo>(m_errorHistory.begin() + start, m_errorHistory.end());
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_errorHistory.clear();
}

bool ErrorHandler::isRetryable(ErrorType type) {
    return type == ErrorType::WINDOW_UNAVAILABLE;
}

void ErrorHandler::setMaxRetries(ErrorType type, int maxRetries) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_maxRetries[type] = maxRetries < 0 ? 0 : maxRetries;
}

void ErrorHandler::setRetryDelay(ErrorType type, int delayMs) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_retryDelays[type] = delayMs < 0 ? 0 : delayMs;
}

int ErrorHandler::getMaxRetries(ErrorType type) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_maxRetries.find(type);
    return it != m_maxRetries.end() ? it->second : 0;
}

int ErrorHandler::getRetryDelay(ErrorType type) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_retryDelays.find(type);
    return it != m_retryDelays.end() ? it->second : 0;
}

bool ErrorHandler::shouldRetry(const ErrorInfo& error, int attempt) const {
    if (!isRetryable(error.type)) {
        return false;
    }
    return attempt < getMaxRetries(error.type);
}

std::string ErrorHandler::errorTypeToString(ErrorType type) {
    switch (type) {
        case ErrorType::UNSUPPORTED_INSTRUCTION: return "UNSUPPORTED_INSTRUCTION";
        case ErrorType::NUMBER_PARSE: return "NUMBER_PARSE";
        case ErrorType::AMBIGUOUS_OPERAND: return "AMBIGUOUS_OPERAND";
        case ErrorType::BUTTON_NOT_FOUND: return "BUTTON_NOT_FOUND";
        case ErrorType::WINDOW_UNAVAILABLE: return "WINDOW_UNAVAILABLE";
        case ErrorType::CLICK_ERROR: return "CLICK_ERROR";
        case ErrorType::REGISTRY_LOAD: return "REGISTRY_LOAD";
        case ErrorType::CONFIGURATION_ERROR: return "CONFIGURATION";
        case ErrorType::UNKNOWN_ERROR: return "UNKNOWN";
        default: return "UNKNOWN";
    }
}

std::string ErrorHandler::errorSeverityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::LOW: return "LOW";
        case ErrorSeverity::MEDIUM: return "MEDIUM";
        case ErrorSeverity::HIGH: return "HIGH";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

} // namespace calcpilot
