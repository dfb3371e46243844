#pragma once

#include <string>
#include <memory>
#include <queue>
#include <mutex>
#include <chrono>

// Cross-platform API export/import macros
#ifdef _WIN32
#ifdef ENCODERS_EXPORTS
#define ENCODERS_API __declspec(dllexport)
#else
#define ENCODERS_API __declspec(dllimport)
#endif
#else
    // Linux/GCC
#ifdef ENCODERS_EXPORTS
#define ENCODERS_API __attribute__((visibility("default")))
#else
#define ENCODERS_API
#endif
#endif

namespace EncodersLogging {

    // Log levels matching spdlog levels
    enum class LogLevel {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5
    };

    // Structure for queued log messages
    struct LogMessage {
        std::string text;
        LogLevel level;
        double timestamp;

        LogMessage() : level(LogLevel::Info), timestamp(0.0) {}
        LogMessage(const std::string& message, LogLevel lvl)
            : text(message), level(lvl), timestamp(std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count()) {}
    };

    // Thread-safe queue that receives every log message, so a host application
    // can drain and display what the encoders reported.
    class LogQueue {
    public:
        void Push(const LogMessage& message);
        bool ENCODERS_API TryPop(LogMessage& message);
        void ENCODERS_API Clear();
        size_t ENCODERS_API Size() const;

    private:
        mutable std::mutex mutex;
        std::queue<LogMessage> queue;
        static constexpr size_t MAX_QUEUE_SIZE = 1000;
    };

    // Initialize the logging system. An empty path disables the file sink.
    bool ENCODERS_API Initialize(const std::string& logFilePath = "");

    // Shutdown the logging system
    void ENCODERS_API Shutdown();

    bool ENCODERS_API IsInitialized();

    // Messages below this level are dropped by every sink
    void ENCODERS_API SetLevel(LogLevel level);

    // Parses "trace", "debug", "info", "warn", "error" or "critical".
    bool ENCODERS_API ParseLogLevel(const std::string& text, LogLevel& out);

    // Get the in-memory log queue
    ENCODERS_API LogQueue& GetLogQueue();

    // Logging functions
    void ENCODERS_API LogTrace(const std::string& message);
    void ENCODERS_API LogDebug(const std::string& message);
    void ENCODERS_API LogInfo(const std::string& message);
    void ENCODERS_API LogWarn(const std::string& message);
    void ENCODERS_API LogError(const std::string& message);
    void ENCODERS_API LogCritical(const std::string& message);

    void ENCODERS_API PrintOutput(const std::string& message, LogLevel logType = LogLevel::Info, bool toLogger = true);

}

#define ENCODERS_LOG_TRACE(msg)    EncodersLogging::LogTrace(msg)
#define ENCODERS_LOG_DEBUG(msg)    EncodersLogging::LogDebug(msg)
#define ENCODERS_LOG_INFO(msg)     EncodersLogging::LogInfo(msg)
#define ENCODERS_LOG_WARN(msg)     EncodersLogging::LogWarn(msg)
#define ENCODERS_LOG_ERROR(msg)    EncodersLogging::LogError(msg)
#define ENCODERS_LOG_CRITICAL(msg) EncodersLogging::LogCritical(msg)

/**
 * @brief Prints a message either to the console or to the encoders logger.
 *
 * @param message   The text you want to output. Cannot be empty.
 * @param logType   The logging level used when printing to the logger (Info is default).
 * @param toLogger  false: prints message to standard output.
 *                  true : sends message to the logger with the specified logType.
 *
 * ENCODERS_PRINT("Something went wrong!", EncodersLogging::LogLevel::Error);
 */
#define ENCODERS_PRINT(...) EncodersLogging::PrintOutput(__VA_ARGS__)
