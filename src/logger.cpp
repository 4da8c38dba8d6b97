#include "logger.h"
#include "utils.h"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace optidex {

namespace {

thread_local std::string t_thread_name;

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?    ";
}

std::string format_line(LogLevel level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm local_tm{};
    localtime_r(&seconds, &local_tm);

    std::ostringstream line;
    line << "[" << level_tag(level) << "] "
         << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
         << "." << std::setfill('0') << std::setw(3) << ms.count();
    if (!t_thread_name.empty()) {
        line << " [" << t_thread_name << "]";
    }
    line << ": " << message;
    return line.str();
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string n = utils::normalize_copy(utils::trim_copy(name));
    if (n == "debug") return LogLevel::DEBUG;
    if (n == "warn" || n == "warning") return LogLevel::WARN;
    if (n == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

class Logger::Impl {
public:
    Impl(LogLevel min_level, const std::string& output_file)
        : min_level_(min_level) {
        if (output_file.empty()) return;
        file_.open(output_file, std::ios::app);
        if (!file_.is_open()) {
            std::cerr << "Warning: cannot open log file " << output_file
                      << "; logging to console only" << std::endl;
        }
    }

    void write(LogLevel level, const std::string& message) {
        // Formatted outside the lock; only the writes are serialized
        std::string line = format_line(level, message);

        std::lock_guard<std::mutex> lock(mutex_);
        std::ostream& console = level >= LogLevel::WARN ? std::cerr : std::cout;
        console << line << '\n';
        console.flush();
        if (file_.is_open()) {
            file_ << line << '\n';
            file_.flush();
        }
    }

    bool enabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level >= min_level_;
    }

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

private:
    mutable std::mutex mutex_;
    LogLevel min_level_;
    std::ofstream file_;
};

std::unique_ptr<Logger::Impl> Logger::impl_ = nullptr;

void Logger::initialize(LogLevel min_level, const std::string& output_file) {
    if (!impl_) {
        impl_ = std::make_unique<Impl>(min_level, output_file);
    }
}

void Logger::shutdown() {
    impl_.reset();
}

bool Logger::enabled(LogLevel level) {
    // Uninitialized (tests, early startup): INFO and above go to the console
    return impl_ ? impl_->enabled(level) : level >= LogLevel::INFO;
}

void Logger::set_thread_name(const std::string& name) {
    t_thread_name = name;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!enabled(level)) return;
    if (impl_) {
        impl_->write(level, message);
    } else {
        (level >= LogLevel::WARN ? std::cerr : std::cout) << format_line(level, message) << std::endl;
    }
}

void Logger::debug(const std::string& message) { log(LogLevel::DEBUG, message); }
void Logger::info(const std::string& message) { log(LogLevel::INFO, message); }
void Logger::warn(const std::string& message) { log(LogLevel::WARN, message); }
void Logger::error(const std::string& message) { log(LogLevel::ERROR, message); }

void Logger::set_level(LogLevel level) {
    if (impl_) {
        impl_->set_level(level);
    }
}

LogLevel Logger::get_level() {
    return impl_ ? impl_->level() : LogLevel::INFO;
}

} // namespace optidex
