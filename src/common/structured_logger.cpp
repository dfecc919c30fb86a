#include "structured_logger.h"
#include "string_utils.h"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <filesystem>
#include <algorithm>
#include <ctime>
#include <exception>

#ifdef _WIN32
#include <windows.h>
#endif

namespace calcpilot {

namespace fs = std::filesystem;

namespace {
    std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
        auto time_t = std::chrono::system_clock::to_time_t(tp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t);
#else
        localtime_r(&time_t, &tm_buf);
#endif
        std::stringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    std::string threadIdToString(std::thread::id id) {
        std::stringstream ss;
        ss << id;
        return ss.str();
    }
}

std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR_LEVEL: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

LogLevel logLevelFromString(const std::string& name) {
    std::string upper = utils::StringUtils::toUpperCase(utils::StringUtils::trim(name));
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR_LEVEL;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

// JsonLogFormatter
std::string JsonLogFormatter::format(const LogEntry& entry) {
    nlohmann::json log_json;

    log_json["timestamp"] = formatTimestamp(entry.timestamp);
    log_json["level"] = logLevelToString(entry.level);
    log_json["message"] = entry.message;
    log_json["thread"] = threadIdToString(entry.thread_id);

    if (!entry.component.empty()) {
        log_json["component"] = entry.component;
    }

    if (!entry.file.empty()) {
        log_json["source"]["file"] = fs::path(entry.file).filename().string();
        log_json["source"]["line"] = entry.line;
    }

    if (!entry.operation_name.empty()) {
        log_json["operation"] = entry.operation_name;
        log_json["duration_ms"] = entry.duration.count() / 1000000.0;
    }

    if (!entry.context.empty()) {
        log_json["context"] = entry.context;
    }

    return log_json.dump() + "\n";
}

// TextLogFormatter
std::string TextLogFormatter::format(const LogEntry& entry) {
    std::stringstream ss;

    ss << "[" << formatTimestamp(entry.timestamp) << "] ";
    ss << "[" << std::setw(8) << logLevelToString(entry.level) << "] ";

    if (!entry.component.empty()) {
        ss << "[" << entry.component << "] ";
    }

    ss << entry.message;

    // Source location only for errors and above
    if (!entry.file.empty() && entry.level >= LogLevel::ERROR_LEVEL) {
        ss << " (" << fs::path(entry.file).filename().string() << ":" << entry.line << ")";
    }

    if (!entry.operation_name.empty()) {
        ss << " [" << entry.operation_name << ": "
           << std::fixed << std::setprecision(2)
           << (entry.duration.count() / 1000000.0) << "ms]";
    }

    if (!entry.context.empty()) {
        ss << " " << entry.context.dump();
    }

    ss << "\n";
    return ss.str();
}

// ConsoleLogSink
ConsoleLogSink::ConsoleLogSink(std::shared_ptr<ILogFormatter> formatter, bool stderrOnly)
    : m_formatter(std::move(formatter)), m_stderrOnly(stderrOnly) {}

void ConsoleLogSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::string formatted = m_formatter->format(entry);

    if (entry.level >= LogLevel::ERROR_LEVEL) {
#ifdef _WIN32
        HANDLE hConsole = GetStdHandle(STD_ERROR_HANDLE);
        SetConsoleTextAttribute(hConsole, FOREGROUND_RED | FOREGROUND_INTENSITY);
#endif
        std::cerr << formatted;
#ifdef _WIN32
        SetConsoleTextAttribute(hConsole, FOREGROUND_RED | FOREGROUND_GREEN | FOREGROUND_BLUE);
#endif
    } else if (m_stderrOnly) {
        std::cerr << formatted;
    } else {
        std::cout << formatted;
    }
}

void ConsoleLogSink::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_stderrOnly) {
        std::cout.flush();
    }
    std::cerr.flush();
}

// RotatingFileLogSink
RotatingFileLogSink::RotatingFileLogSink(const Config& config,
                                         std::shared_ptr<ILogFormatter> formatter)
    : m_config(config), m_formatter(std::move(formatter)), m_current_size(0) {
    fs::path parent = fs::path(m_config.base_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            std::cerr << "Cannot create log directory " << parent.string()
                      << ": " << ec.message() << std::endl;
        }
    }
    openFile();
}

RotatingFileLogSink::~RotatingFileLogSink() {
    if (m_file && m_file->is_open()) {
        m_file->close();
    }
}

void RotatingFileLogSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_file || !m_file->is_open()) {
        openFile();
        if (!m_file->is_open()) {
            return;
        }
    }

    std::string formatted = m_formatter->format(entry);
    *m_file << formatted;
    m_current_size += formatted.size();

    rotateIfNeeded();
}

void RotatingFileLogSink::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file && m_file->is_open()) {
        m_file->flush();
    }
}

void RotatingFileLogSink::rotateIfNeeded() {
    if (m_current_size < m_config.max_file_size) {
        return;
    }

    m_file->close();

    std::error_code ec;
    size_t keep = std::max<size_t>(m_config.max_files, 1);

    // Shift app.(n-1).log -> app.n.log, dropping the oldest
    fs::remove(rotatedName(keep), ec);
    for (size_t i = keep; i > 1; --i) {
        std::string from = rotatedName(i - 1);
        if (fs::exists(from, ec)) {
            fs::rename(from, rotatedName(i), ec);
        }
    }
    fs::rename(m_config.base_path, rotatedName(1), ec);
    if (ec) {
        std::cerr << "Log rotation failed for " << m_config.base_path
                  << ": " << ec.message() << std::endl;
    }

    openFile();
}

void RotatingFileLogSink::openFile() {
    m_file = std::make_unique<std::ofstream>(m_config.base_path, std::ios::app);
    std::error_code ec;
    auto size = fs::file_size(m_config.base_path, ec);
    m_current_size = ec ? 0 : static_cast<size_t>(size);
}

std::string RotatingFileLogSink::rotatedName(size_t index) const {
    fs::path p(m_config.base_path);
    std::string name = p.stem().string() + "." + std::to_string(index) + p.extension().string();
    return (p.parent_path() / name).string();
}

// PerformanceTracker
double PerformanceTracker::MetricsSnapshot::getAverageDurationMs() const {
    if (count == 0) return 0.0;
    return (static_cast<double>(total_duration_ns) / count) / 1000000.0;
}

nlohmann::json PerformanceTracker::MetricsSnapshot::toJson() const {
    nlohmann::json j;
    j["count"] = count;
    j["errors"] = errors;
    j["average_ms"] = getAverageDurationMs();
    j["min_ms"] = count == 0 ? 0.0 : min_duration_ns / 1000000.0;
    j["max_ms"] = max_duration_ns / 1000000.0;
    j["total_ms"] = total_duration_ns / 1000000.0;
    return j;
}

void PerformanceTracker::recordOperation(const std::string& operation,
                                         std::chrono::nanoseconds duration,
                                         bool success) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);

    auto& metrics = m_metrics[operation];
    uint64_t dur = static_cast<uint64_t>(duration.count());

    metrics.count++;
    metrics.total_duration_ns += dur;
    metrics.min_duration_ns = std::min(metrics.min_duration_ns, dur);
    metrics.max_duration_ns = std::max(metrics.max_duration_ns, dur);
    if (!success) {
        metrics.errors++;
    }
}

PerformanceTracker::MetricsSnapshot PerformanceTracker::getMetrics(const std::string& operation) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_metrics.find(operation);
    return it != m_metrics.end() ? it->second : MetricsSnapshot{};
}

std::unordered_map<std::string, PerformanceTracker::MetricsSnapshot>
PerformanceTracker::getAllMetrics() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_metrics;
}

void PerformanceTracker::reset() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_metrics.clear();
}

// ScopedTimer
ScopedTimer::ScopedTimer(const std::string& operation_name)
    : m_operation_name(operation_name)
    , m_start(std::chrono::steady_clock::now())
    , m_uncaught_at_start(std::uncaught_exceptions()) {}

ScopedTimer::~ScopedTimer() {
    if (m_operation_name.empty()) {
        return;
    }
    auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - m_start);
    bool success = std::uncaught_exceptions() == m_uncaught_at_start;
    StructuredLogger::getInstance().logPerformance(m_operation_name, duration, success);
}

// StructuredLogger
StructuredLogger& StructuredLogger::getInstance() {
    static StructuredLogger instance;
    return instance;
}

StructuredLogger::StructuredLogger()
    : m_min_level(LogLevel::INFO)
    , m_async_enabled(false)
    , m_slow_threshold(std::chrono::milliseconds(1000)) {
    addSink(std::make_shared<ConsoleLogSink>(std::make_shared<TextLogFormatter>()));
}

StructuredLogger::~StructuredLogger() {
    shutdown();
}

void StructuredLogger::setLogLevel(LogLevel level) {
    m_min_level = level;
}

LogLevel StructuredLogger::getLogLevel() const {
    return m_min_level;
}

void StructuredLogger::addSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    m_sinks.push_back(std::move(sink));
}

void StructuredLogger::removeSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    m_sinks.erase(std::remove(m_sinks.begin(), m_sinks.end(), sink), m_sinks.end());
}

void StructuredLogger::clearSinks() {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    m_sinks.clear();
}

void StructuredLogger::setAsyncLogging(bool async) {
    if (m_async_enabled == async) return;

    if (async) {
        m_stop_async = false;
        m_log_queue.reopen();
        m_async_enabled = true;
        m_logging_thread = std::thread(&StructuredLogger::asyncLoggingLoop, this);
    } else {
        m_async_enabled = false;
        m_stop_async = true;
        m_log_queue.close();
        if (m_logging_thread.joinable()) {
            m_logging_thread.join();
        }
    }
}

void StructuredLogger::log(const LogEntry& entry) {
    if (entry.level < m_min_level) return;

    if (m_async_enabled && m_log_queue.push(entry)) {
        return;
    }
    processLogEntry(entry);
}

void StructuredLogger::logPerformance(const std::string& operation,
                                      std::chrono::nanoseconds duration,
                                      bool success) {
    m_performance_tracker.recordOperation(operation, duration, success);

    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level = duration > m_slow_threshold ? LogLevel::WARNING : LogLevel::DEBUG;
    entry.message = duration > m_slow_threshold ? "Slow operation detected" : "Operation timing";
    entry.operation_name = operation;
    entry.duration = duration;
    entry.thread_id = std::this_thread::get_id();
    log(entry);
}

void StructuredLogger::setSlowOperationThreshold(std::chrono::milliseconds threshold) {
    m_slow_threshold = threshold;
}

void StructuredLogger::shutdown() {
    if (m_async_enabled) {
        setAsyncLogging(false);
    }
    flush();
}

void StructuredLogger::flush() {
    if (m_async_enabled) {
        for (int i = 0; i < 200 && !m_log_queue.empty(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    std::lock_guard<std::mutex> lock(m_config_mutex);
    for (auto& sink : m_sinks) {
        sink->flush();
    }
}

void StructuredLogger::asyncLoggingLoop() {
    while (!m_stop_async) {
        auto entry_opt = m_log_queue.popWithTimeout(100);
        if (entry_opt) {
            processLogEntry(*entry_opt);
        }
    }

    // Drain what was queued before close()
    while (auto entry_opt = m_log_queue.tryPop()) {
        processLogEntry(*entry_opt);
    }
}

void StructuredLogger::processLogEntry(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    for (auto& sink : m_sinks) {
        sink->write(entry);
    }
}

// LogBuilder
StructuredLogger::LogBuilder::LogBuilder(StructuredLogger* logger, LogLevel level)
    : m_logger(logger) {
    m_entry.level = level;
    m_entry.timestamp = std::chrono::system_clock::now();
    m_entry.thread_id = std::this_thread::get_id();
}

StructuredLogger::LogBuilder::LogBuilder(LogBuilder&& other) noexcept
    : m_logger(other.m_logger), m_entry(std::move(other.m_entry)) {
    other.m_logger = nullptr;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::message(const std::string& msg) {
    m_entry.message = msg;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::context(const std::string& key, const nlohmann::json& value) {
    m_entry.context[key] = value;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::component(const std::string& name) {
    m_entry.component = name;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::file(const char* file, int line) {
    m_entry.file = file;
    m_entry.line = line;
    return *this;
}

StructuredLogger::LogBuilder::~LogBuilder() {
    if (m_logger && m_entry.level >= m_logger->getLogLevel()) {
        m_logger->log(m_entry);
    }
}

} // namespace calcpilot
