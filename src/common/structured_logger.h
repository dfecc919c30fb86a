#ifndef CALCPILOT_STRUCTURED_LOGGER_H
#define CALCPILOT_STRUCTURED_LOGGER_H

#include <string>
#include <memory>
#include <chrono>
#include <atomic>
#include <unordered_map>
#include <thread>
#include <mutex>
#include <shared_mutex>
#include <vector>
#include <fstream>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "thread_safe_queue.h"

namespace calcpilot {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR_LEVEL,  // ERROR collides with a Windows macro
    CRITICAL
};

std::string logLevelToString(LogLevel level);

/**
 * @brief Parse "DEBUG", "info", "Warning"... Unknown names map to INFO.
 */
LogLevel logLevelFromString(const std::string& name);

/**
 * @brief One log record with structured context
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string message;
    std::string component;
    std::string file;
    int line;
    std::thread::id thread_id;
    nlohmann::json context;

    std::chrono::nanoseconds duration;
    std::string operation_name;

    LogEntry() : level(LogLevel::INFO), line(0), duration(0) {}
};

class ILogFormatter {
public:
    virtual ~ILogFormatter() = default;
    virtual std::string format(const LogEntry& entry) = 0;
};

/**
 * @brief One JSON object per line
 */
class JsonLogFormatter : public ILogFormatter {
public:
    std::string format(const LogEntry& entry) override;
};

/**
 * @brief Human-readable single line
 */
class TextLogFormatter : public ILogFormatter {
public:
    std::string format(const LogEntry& entry) override;
};

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() = 0;
};

/**
 * @brief Console sink. Errors go to stderr; with stderrOnly everything does,
 * which keeps stdout free for the tool server protocol.
 */
class ConsoleLogSink : public ILogSink {
public:
    explicit ConsoleLogSink(std::shared_ptr<ILogFormatter> formatter, bool stderrOnly = false);
    void write(const LogEntry& entry) override;
    void flush() override;

private:
    std::shared_ptr<ILogFormatter> m_formatter;
    bool m_stderrOnly;
    std::mutex m_mutex;
};

/**
 * @brief File sink that rotates app.log -> app.1.log -> ... once max_file_size is hit
 */
class RotatingFileLogSink : public ILogSink {
public:
    struct Config {
        std::string base_path;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t max_files = 5;
    };

    RotatingFileLogSink(const Config& config, std::shared_ptr<ILogFormatter> formatter);
    ~RotatingFileLogSink() override;

    void write(const LogEntry& entry) override;
    void flush() override;

private:
    Config m_config;
    std::shared_ptr<ILogFormatter> m_formatter;
    std::unique_ptr<std::ofstream> m_file;
    std::mutex m_mutex;
    size_t m_current_size;

    void rotateIfNeeded();
    void openFile();
    std::string rotatedName(size_t index) const;
};

/**
 * @brief Per-operation timing statistics fed by ScopedTimer
 */
class PerformanceTracker {
public:
    struct MetricsSnapshot {
        uint64_t count = 0;
        uint64_t total_duration_ns = 0;
        uint64_t min_duration_ns = UINT64_MAX;
        uint64_t max_duration_ns = 0;
        uint64_t errors = 0;

        double getAverageDurationMs() const;
        nlohmann::json toJson() const;
    };

    void recordOperation(const std::string& operation,
                         std::chrono::nanoseconds duration,
                         bool success = true);

    MetricsSnapshot getMetrics(const std::string& operation) const;
    std::unordered_map<std::string, MetricsSnapshot> getAllMetrics() const;
    void reset();

private:
    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, MetricsSnapshot> m_metrics;
};

/**
 * @brief Records the lifetime of a scope into the PerformanceTracker.
 *
 * A scope left through an exception counts as a failed operation.
 */
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& operation_name);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string m_operation_name;
    std::chrono::steady_clock::time_point m_start;
    int m_uncaught_at_start;
};

class StructuredLogger {
public:
    static StructuredLogger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;
    void addSink(std::shared_ptr<ILogSink> sink);
    void removeSink(std::shared_ptr<ILogSink> sink);
    void clearSinks();
    void setAsyncLogging(bool async);

    void log(const LogEntry& entry);

    // Operations slower than the threshold are logged as warnings
    void logPerformance(const std::string& operation,
                        std::chrono::nanoseconds duration,
                        bool success = true);
    void setSlowOperationThreshold(std::chrono::milliseconds threshold);

    class LogBuilder {
    public:
        LogBuilder(StructuredLogger* logger, LogLevel level);
        LogBuilder(LogBuilder&& other) noexcept;
        LogBuilder(const LogBuilder&) = delete;
        LogBuilder& operator=(const LogBuilder&) = delete;

        LogBuilder& message(const std::string& msg);
        LogBuilder& context(const std::string& key, const nlohmann::json& value);
        LogBuilder& component(const std::string& name);
        LogBuilder& file(const char* file, int line);

        ~LogBuilder();  // Logs on destruction

    private:
        StructuredLogger* m_logger;
        LogEntry m_entry;
    };

    LogBuilder debug() { return LogBuilder(this, LogLevel::DEBUG); }
    LogBuilder info() { return LogBuilder(this, LogLevel::INFO); }
    LogBuilder warning() { return LogBuilder(this, LogLevel::WARNING); }
    LogBuilder error() { return LogBuilder(this, LogLevel::ERROR_LEVEL); }
    LogBuilder critical() { return LogBuilder(this, LogLevel::CRITICAL); }

    PerformanceTracker& getPerformanceTracker() { return m_performance_tracker; }

    void flush();
    void shutdown();

private:
    StructuredLogger();
    ~StructuredLogger();
    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    std::atomic<LogLevel> m_min_level;
    std::vector<std::shared_ptr<ILogSink>> m_sinks;
    mutable std::mutex m_config_mutex;

    std::atomic<bool> m_async_enabled;
    ThreadSafeQueue<LogEntry> m_log_queue;
    std::thread m_logging_thread;
    std::atomic<bool> m_stop_async{false};
    std::chrono::milliseconds m_slow_threshold;

    PerformanceTracker m_performance_tracker;

    void asyncLoggingLoop();
    void processLogEntry(const LogEntry& entry);
};

#define SLOG_DEBUG() calcpilot::StructuredLogger::getInstance().debug().file(__FILE__, __LINE__)
#define SLOG_INFO() calcpilot::StructuredLogger::getInstance().info().file(__FILE__, __LINE__)
#define SLOG_WARNING() calcpilot::StructuredLogger::getInstance().warning().file(__FILE__, __LINE__)
#define SLOG_ERROR() calcpilot::StructuredLogger::getInstance().error().file(__FILE__, __LINE__)
#define SLOG_CRITICAL() calcpilot::StructuredLogger::getInstance().critical().file(__FILE__, __LINE__)

#define SCOPED_TIMER(operation) calcpilot::ScopedTimer _timer(operation)

} // namespace calcpilot

#endif // CALCPILOT_STRUCTURED_LOGGER_H
