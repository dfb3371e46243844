#include "pch.h"
#include "Logging.hpp"

#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/base_sink.h"
#include "spdlog/pattern_formatter.h"

namespace EncodersLogging {

    static const std::pair<LogLevel, spdlog::level::level_enum> levelMap[] = {
        { LogLevel::Trace,    spdlog::level::trace },
        { LogLevel::Debug,    spdlog::level::debug },
        { LogLevel::Info,     spdlog::level::info },
        { LogLevel::Warn,     spdlog::level::warn },
        { LogLevel::Error,    spdlog::level::err },
        { LogLevel::Critical, spdlog::level::critical },
    };

    static spdlog::level::level_enum ToSpdlogLevel(LogLevel level) {
        for (const auto& entry : levelMap) {
            if (entry.first == level) return entry.second;
        }
        return spdlog::level::info;
    }

    static LogLevel FromSpdlogLevel(spdlog::level::level_enum level) {
        for (const auto& entry : levelMap) {
            if (entry.second == level) return entry.first;
        }
        return LogLevel::Info;
    }

    // Sink that pushes every formatted payload into the in-memory queue
    class QueueSink : public spdlog::sinks::base_sink<std::mutex> {
    public:
        explicit QueueSink(LogQueue& queue) : logQueue(queue) {}

    protected:
        void sink_it_(const spdlog::details::log_msg& msg) override {
            LogLevel level = FromSpdlogLevel(msg.level);
            std::string message = fmt::to_string(msg.payload);
            if (message.empty()) return;

            logQueue.Push(LogMessage(message, level));
        }

        void flush_() override {
            // Nothing to flush for the queue
        }

    private:
        LogQueue& logQueue;
    };

    // Static instances
    static std::shared_ptr<spdlog::logger> logger;

    static LogQueue logQueue;
    static bool initialized = false;

    // LogQueue implementation
    void LogQueue::Push(const LogMessage& message) {
        std::lock_guard<std::mutex> lock(mutex);

        // Remove old messages if queue is full
        while (queue.size() >= MAX_QUEUE_SIZE) {
            queue.pop();
        }

        queue.push(message);
    }

    bool LogQueue::TryPop(LogMessage& message) {
        std::lock_guard<std::mutex> lock(mutex);
        if (queue.empty()) {
            return false;
        }

        message = queue.front();
        queue.pop();
        return true;
    }

    void LogQueue::Clear() {
        std::lock_guard<std::mutex> lock(mutex);
        std::queue<LogMessage> empty;
        queue.swap(empty);
    }

    size_t LogQueue::Size() const {
        std::lock_guard<std::mutex> lock(mutex);
        return queue.size();
    }

    bool Initialize(const std::string& logFilePath) {
        if (initialized) {
            return true;
        }

        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(spdlog::level::trace);
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            sinks.push_back(console_sink);

            if (!logFilePath.empty()) {
                std::filesystem::path parent = std::filesystem::path(logFilePath).parent_path();
                if (!parent.empty()) {
                    std::filesystem::create_directories(parent);
                }

                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFilePath, true);
                file_sink->set_level(spdlog::level::trace);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
                sinks.push_back(file_sink);
            }

            auto queue_sink = std::make_shared<QueueSink>(logQueue);
            queue_sink->set_level(spdlog::level::trace);
            queue_sink->set_pattern("%v");
            sinks.push_back(queue_sink);

            logger = std::make_shared<spdlog::logger>("encoders", sinks.begin(), sinks.end());
            logger->set_level(spdlog::level::trace);
            logger->flush_on(spdlog::level::warn);

            initialized = true;

            LogInfo("Encoders logging system initialized");

            return true;
        }
        catch (const spdlog::spdlog_ex& ex) {
            PrintOutput(std::string("Failed to initialize logging system: ") + ex.what(), LogLevel::Error, false);
            logger.reset();
            return false;
        }
        catch (const std::filesystem::filesystem_error& ex) {
            PrintOutput(std::string("Failed to create log directory: ") + ex.what(), LogLevel::Error, false);
            logger.reset();
            return false;
        }
    }

    void Shutdown() {
        if (!initialized) {
            return;
        }

        LogInfo("Shutting down logging system");

        if (logger) {
            logger->flush();
            logger.reset();
        }

        logQueue.Clear();
        initialized = false;
    }

    bool IsInitialized() {
        return initialized;
    }

    void SetLevel(LogLevel level) {
        if (logger) {
            logger->set_level(ToSpdlogLevel(level));
        }
    }

    bool ParseLogLevel(const std::string& text, LogLevel& out) {
        static const std::pair<const char*, LogLevel> names[] = {
            { "trace", LogLevel::Trace },
            { "debug", LogLevel::Debug },
            { "info", LogLevel::Info },
            { "warn", LogLevel::Warn },
            { "error", LogLevel::Error },
            { "critical", LogLevel::Critical },
        };
        for (const auto& entry : names) {
            if (text == entry.first) {
                out = entry.second;
                return true;
            }
        }
        return false;
    }

    LogQueue& GetLogQueue() {
        return logQueue;
    }

    // Internal helper for logging
    void LogInternal(LogLevel level, const std::string& message) {
        if (!initialized || !logger || message.empty()) {
            // Logger not initialized or already destroyed - fail silently
            return;
        }

        logger->log(ToSpdlogLevel(level), message);
    }

    void PrintOutput(const std::string& message, LogLevel logType, bool toLogger)
    {
        if (!toLogger)
            std::cout << message << std::endl;
        else
            LogInternal(logType, message);
    }

    // Public logging functions
    void LogTrace(const std::string& message) {
        LogInternal(LogLevel::Trace, message);
    }

    void LogDebug(const std::string& message) {
        LogInternal(LogLevel::Debug, message);
    }

    void LogInfo(const std::string& message) {
        LogInternal(LogLevel::Info, message);
    }

    void LogWarn(const std::string& message) {
        LogInternal(LogLevel::Warn, message);
    }

    void LogError(const std::string& message) {
        LogInternal(LogLevel::Error, message);
    }

    void LogCritical(const std::string& message) {
        LogInternal(LogLevel::Critical, message);
    }

}
