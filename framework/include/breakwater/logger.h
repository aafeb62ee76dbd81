#ifndef BREAKWATER_LOGGER_H
#define BREAKWATER_LOGGER_H

#include <atomic>
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <queue>
#include <string>
#include <string_view>
#include <thread>

namespace breakwater {

enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR
};

/**
 * @brief Parses "debug", "info", "warn" or "error" (case-insensitive).
 * @throws ConfigError on anything else.
 */
LogLevel parse_log_level(std::string_view name);

/**
 * @brief Asynchronous logger. Messages are queued by the caller and written by
 * a single worker thread, so logging never blocks on I/O.
 */
class Logger {
public:
    static Logger& instance();

    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Sets the destination: "stdout" (or empty), "/dev/null" to disable,
     * or a file path opened in append mode. Parent directories are created.
     * @throws ConfigError if the directories cannot be created or the file opened.
     */
    void configure(const std::string& path);

    void set_level(LogLevel level) { level_ = level; }
    LogLevel level() const { return level_; }

    void log(LogLevel level, std::string_view message);

    void debug(std::string_view message) { log(LogLevel::DEBUG, message); }
    void info(std::string_view message) { log(LogLevel::INFO, message); }
    void warn(std::string_view message) { log(LogLevel::WARN, message); }
    void error(std::string_view message) { log(LogLevel::ERROR, message); }

    // Blocks until every queued message has been written.
    void flush();

private:
    std::ofstream file_stream_;
    std::mutex stream_mutex_;
    std::atomic<bool> use_stdout_{true};
    std::atomic<bool> enabled_{true};
    std::atomic<LogLevel> level_{LogLevel::INFO};

    std::queue<std::string> queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::condition_variable drained_;
    size_t in_flight_ = 0;
    std::thread worker_;
    std::atomic<bool> running_{true};

    static std::string get_timestamp();
    void process_queue();
};

} // namespace breakwater

#endif // BREAKWATER_LOGGER_H
