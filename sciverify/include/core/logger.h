/**
 * @file logger.h
 * @brief 日志
 *
 * Logger 把每条日志整理成 LogRecord 交给各个 LogSink，格式由 sink 决定：
 * 控制台为短时间戳 + 彩色级别，文件为完整日期 + 源码位置。
 * 工作线程通过 thread_log_tag() 设置自己的标签（如 "worker-2"）。
 */

#ifndef SCIV_CORE_LOGGER_H
#define SCIV_CORE_LOGGER_H

#include <string>
#include <fstream>
#include <iostream>
#include <sstream>
#include <ctime>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <memory>
#include <vector>
#include <cctype>
#include <optional>
#include <atomic>

namespace sciv {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    OFF   = 6
};

namespace detail {

struct LevelInfo {
    const char *name;     ///< 配置文件里的写法
    const char *label;    ///< 定宽输出
    const char *color;
};

inline const LevelInfo& level_info(LogLevel level) {
    static const LevelInfo table[] = {
        {"trace", "TRACE", "\033[90m"},
        {"debug", "DEBUG", "\033[36m"},
        {"info",  "INFO ", "\033[32m"},
        {"warn",  "WARN ", "\033[33m"},
        {"error", "ERROR", "\033[31m"},
        {"fatal", "FATAL", "\033[35;1m"},
        {"off",   "OFF  ", ""},
    };
    return table[static_cast<int>(level)];
}

} // namespace detail

inline const char* level_to_string(LogLevel level) {
    return detail::level_info(level).label;
}

/**
 * @brief 解析 log.level（大小写不敏感，接受 "warning"）
 */
inline std::optional<LogLevel> parse_log_level(const std::string &text) {
    std::string name;
    for (char c : text) name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (name == "warning") return LogLevel::WARN;
    for (int i = 0; i <= static_cast<int>(LogLevel::OFF); i++) {
        if (name == detail::level_info(static_cast<LogLevel>(i)).name) {
            return static_cast<LogLevel>(i);
        }
    }
    return std::nullopt;
}

/// 当前线程的日志标签，为空时不输出
inline std::string& thread_log_tag() {
    thread_local std::string tag;
    return tag;
}

/**
 * @brief 一条日志
 */
struct LogRecord {
    LogLevel level;
    std::chrono::system_clock::time_point time;
    std::string tag;
    const char *file;
    int line;
    std::string message;

    std::string timestamp(const char *format) const {
        auto t = std::chrono::system_clock::to_time_t(time);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            time.time_since_epoch()).count() % 1000;
        std::tm tm_buf;
        localtime_r(&t, &tm_buf);
        std::ostringstream oss;
        oss << std::put_time(&tm_buf, format) << '.' << std::setfill('0') << std::setw(3) << ms;
        return oss.str();
    }

    std::string location() const {
        if (!file) return "";
        std::string path(file);
        auto slash = path.find_last_of('/');
        return (slash == std::string::npos ? path : path.substr(slash + 1)) + ":" +
               std::to_string(line);
    }
};

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord &record) = 0;
    virtual void flush() {}
};

/**
 * @brief 控制台：WARN 及以上写 stderr
 */
class ConsoleSink : public LogSink {
private:
    bool color_;
    std::mutex mutex_;

public:
    explicit ConsoleSink(bool color = true) : color_(color) {}

    void write(const LogRecord &r) override {
        const auto &info = detail::level_info(r.level);
        std::ostringstream line;
        line << r.timestamp("%H:%M:%S") << ' ';
        if (color_) {
            line << info.color << info.label << "\033[0m";
        } else {
            line << info.label;
        }
        if (!r.tag.empty()) line << " [" << r.tag << ']';
        line << ' ' << r.message << '\n';

        std::lock_guard<std::mutex> lock(mutex_);
        (r.level >= LogLevel::WARN ? std::cerr : std::cout) << line.str();
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout.flush();
        std::cerr.flush();
    }
};

/**
 * @brief 追加写文件，每条日志后立即 flush
 */
class FileSink : public LogSink {
private:
    std::ofstream out_;
    std::mutex mutex_;

public:
    explicit FileSink(const std::string &path) : out_(path, std::ios::app) {}

    bool is_open() const { return out_.is_open(); }

    void write(const LogRecord &r) override {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << r.timestamp("%Y-%m-%d %H:%M:%S") << ' ' << level_to_string(r.level) << ' '
             << (r.tag.empty() ? "main" : r.tag) << ' ' << r.location() << " | " << r.message
             << std::endl;
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(mutex_);
        out_.flush();
    }
};

/**
 * @brief 保存在内存里，测试中用来断言日志
 */
class MemorySink : public LogSink {
private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;

public:
    void write(const LogRecord &r) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(r);
    }

    std::vector<std::string> lines() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        for (const auto &r : records_) out.push_back(r.message);
        return out;
    }

    bool contains(const std::string &needle, LogLevel at_least = LogLevel::TRACE) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &r : records_) {
            if (r.level >= at_least && r.message.find(needle) != std::string::npos) return true;
        }
        return false;
    }
};

class Logger {
private:
    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::mutex mutex_;
    std::vector<std::shared_ptr<LogSink>> sinks_;

public:
    Logger& set_level(LogLevel level) {
        level_ = level;
        return *this;
    }
    LogLevel level() const { return level_.load(); }
    bool enabled(LogLevel level) const { return level != LogLevel::OFF && level >= level_.load(); }

    Logger& add_sink(std::shared_ptr<LogSink> sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.push_back(std::move(sink));
        return *this;
    }

    bool remove_sink(const std::shared_ptr<LogSink> &sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sinks_.begin(); it != sinks_.end(); ++it) {
            if (*it == sink) {
                sinks_.erase(it);
                return true;
            }
        }
        return false;
    }

    Logger& add_console(bool color = true) {
        return add_sink(std::make_shared<ConsoleSink>(color));
    }

    /**
     * @return 文件打不开时返回 false，不添加
     */
    bool add_file(const std::string &path) {
        auto sink = std::make_shared<FileSink>(path);
        if (!sink->is_open()) return false;
        add_sink(std::move(sink));
        return true;
    }

    void clear_sinks() {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.clear();
    }

    void flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &s : sinks_) s->flush();
    }

    void log(LogLevel level, const char *file, int line, std::string message) {
        if (!enabled(level)) return;
        LogRecord record{level, std::chrono::system_clock::now(), thread_log_tag(), file, line,
                         std::move(message)};
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &s : sinks_) s->write(record);
    }
};

/// 进程级日志器，首次使用时挂上彩色控制台
inline Logger& default_logger() {
    static Logger logger;
    static std::once_flag once;
    std::call_once(once, [] { logger.add_console(true); });
    return logger;
}

/**
 * @brief LOG_* 宏背后的临时对象，析构时提交；级别未开启时不做格式化
 */
class LogStream {
private:
    Logger &logger_;
    LogLevel level_;
    const char *file_;
    int line_;
    bool active_;
    std::ostringstream buf_;

public:
    LogStream(Logger &logger, LogLevel level, const char *file, int line)
        : logger_(logger), level_(level), file_(file), line_(line), active_(logger.enabled(level)) {}

    ~LogStream() {
        if (active_) logger_.log(level_, file_, line_, buf_.str());
    }

    template<typename T>
    LogStream& operator<<(const T &value) {
        if (active_) buf_ << value;
        return *this;
    }
};

} // namespace sciv

#define SCIV_LOG(level) sciv::LogStream(sciv::default_logger(), (level), __FILE__, __LINE__)

#define LOG_TRACE SCIV_LOG(sciv::LogLevel::TRACE)
#define LOG_DEBUG SCIV_LOG(sciv::LogLevel::DEBUG)
#define LOG_INFO  SCIV_LOG(sciv::LogLevel::INFO)
#define LOG_WARN  SCIV_LOG(sciv::LogLevel::WARN)
#define LOG_ERROR SCIV_LOG(sciv::LogLevel::ERROR)
#define LOG_FATAL SCIV_LOG(sciv::LogLevel::FATAL)

#endif // SCIV_CORE_LOGGER_H
