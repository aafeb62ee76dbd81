#include <breakwater/logger.h>
#include <breakwater/exceptions.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

namespace breakwater {

LogLevel parse_log_level(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    throw ConfigError("Unknown log level: " + std::string(name));
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    worker_ = std::thread(&Logger::process_queue, this);
}

Logger::~Logger() {
    {
        // Under the lock so the worker cannot miss the wakeup between its
        // predicate check and the wait
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    std::lock_guard<std::mutex> lock(stream_mutex_);
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
}

std::string Logger::get_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto now_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};

    localtime_r(&now_time_t, &tm_buf);

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

void Logger::process_queue() {
    while (true) {
        std::string msg;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || !running_; });

            if (queue_.empty() && !running_) {
                break;
            }

            msg = std::move(queue_.front());
            queue_.pop();
            ++in_flight_;
        }

        std::stringstream output;
        output << "[" << get_timestamp() << "] " << msg << "\n";
        std::string out_str = output.str();
        const bool is_error = msg.starts_with("ERROR");

        {
            std::lock_guard<std::mutex> lock(stream_mutex_);
            if (use_stdout_) {
                if (is_error) {
                    std::cerr << out_str;
                } else {
                    std::cout << out_str;
                }
            } else if (file_stream_.is_open()) {
                file_stream_ << out_str;
                // Errors hit the disk immediately, the rest is left to the OS buffer
                if (is_error) {
                    file_stream_.flush();
                }
            }
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            --in_flight_;
            if (queue_.empty() && in_flight_ == 0) {
                drained_.notify_all();
            }
        }
    }
}

void Logger::configure(const std::string& path) {
    flush();

    if (path == "/dev/null") {
        enabled_ = false;
        return;
    }

    enabled_ = true;

    std::lock_guard<std::mutex> lock(stream_mutex_);
    if (path == "stdout" || path.empty()) {
        use_stdout_ = true;
        return;
    }

    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            throw ConfigError("Cannot create log directory " + p.parent_path().string() + ": " + ec.message());
        }
    }

    if (file_stream_.is_open()) file_stream_.close();
    file_stream_.open(path, std::ios::out | std::ios::app);
    if (!file_stream_.is_open()) {
        throw ConfigError("Cannot open log file: " + path);
    }
    use_stdout_ = false;
}

void Logger::log(LogLevel level, std::string_view message) {
    if (!enabled_ || level < level_) return;

    std::string level_str;
    switch (level) {
        case LogLevel::DEBUG: level_str = "DEBUG"; break;
        case LogLevel::INFO:  level_str = "INFO";  break;
        case LogLevel::WARN:  level_str = "WARN";  break;
        case LogLevel::ERROR: level_str = "ERROR"; break;
    }

    std::string msg = level_str + ": " + std::string(message);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push(std::move(msg));
    }
    cv_.notify_one();
}

void Logger::flush() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    drained_.wait(lock, [this] { return queue_.empty() && in_flight_ == 0; });

    std::lock_guard<std::mutex> stream_lock(stream_mutex_);
    if (use_stdout_) {
        std::cout.flush();
    } else if (file_stream_.is_open()) {
        file_stream_.flush();
    }
}

} // namespace breakwater
