#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <source_location>
#include <string>

namespace appsplat::core {

    /**
     * @brief 日志级别，与命令行 --log-level 选项一一对应
     */
    enum class LogLevel : uint8_t {
        Trace,
        Debug,
        Info,
        Warn,
        Error,
        Critical,
        Off
    };

    /**
     * @class Logger
     * @brief 全局日志单例，内部使用spdlog的控制台与文件sink
     * @details 在解析命令行参数后调用init()一次；init()之前的日志以Info级别输出到控制台。
     */
    class Logger {
    public:
        static Logger& get();

        /**
         * [功能描述]：初始化日志系统
         * @param level [参数说明]：最低输出级别
         * @param log_file [参数说明]：可选的日志文件路径，为空时只输出到控制台
         */
        void init(LogLevel level = LogLevel::Info, const std::string& log_file = "");

        void set_level(LogLevel level);
        LogLevel level() const { return level_; }
        bool should_log(LogLevel level) const { return level >= level_ && level_ != LogLevel::Off; }
        void flush();

        template <typename... Args>
        void log(LogLevel level,
                 const std::source_location& loc,
                 std::format_string<Args...> fmt,
                 Args&&... args) {
            if (!should_log(level)) {
                return;
            }
            log_internal(level, loc, std::format(fmt, std::forward<Args>(args)...));
        }

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

    private:
        Logger();
        ~Logger();

        void log_internal(LogLevel level, const std::source_location& loc, const std::string& msg);

        struct Impl;
        std::unique_ptr<Impl> impl_;
        LogLevel level_ = LogLevel::Info;
    };

    /**
     * @class ScopedTimer
     * @brief 作用域计时器，析构时以指定级别输出耗时
     */
    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string name,
                             LogLevel level = LogLevel::Debug,
                             const std::source_location& loc = std::source_location::current())
            : name_(std::move(name)),
              level_(level),
              loc_(loc),
              start_(std::chrono::steady_clock::now()) {}

        ~ScopedTimer() {
            const auto elapsed = std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - start_);
            Logger::get().log(level_, loc_, "{} took {:.3f} ms", name_, elapsed.count());
        }

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

    private:
        std::string name_;
        LogLevel level_;
        std::source_location loc_;
        std::chrono::steady_clock::time_point start_;
    };

} // namespace appsplat::core

#define APPSPLAT_LOG_CONCAT_INNER(a, b) a##b
#define APPSPLAT_LOG_CONCAT(a, b)       APPSPLAT_LOG_CONCAT_INNER(a, b)

#define LOG_TRACE(...)    ::appsplat::core::Logger::get().log(::appsplat::core::LogLevel::Trace, std::source_location::current(), __VA_ARGS__)
#define LOG_DEBUG(...)    ::appsplat::core::Logger::get().log(::appsplat::core::LogLevel::Debug, std::source_location::current(), __VA_ARGS__)
#define LOG_INFO(...)     ::appsplat::core::Logger::get().log(::appsplat::core::LogLevel::Info, std::source_location::current(), __VA_ARGS__)
#define LOG_WARN(...)     ::appsplat::core::Logger::get().log(::appsplat::core::LogLevel::Warn, std::source_location::current(), __VA_ARGS__)
#define LOG_ERROR(...)    ::appsplat::core::Logger::get().log(::appsplat::core::LogLevel::Error, std::source_location::current(), __VA_ARGS__)
#define LOG_CRITICAL(...) ::appsplat::core::Logger::get().log(::appsplat::core::LogLevel::Critical, std::source_location::current(), __VA_ARGS__)

// 作用域计时
#define LOG_TIMER(name) \
    ::appsplat::core::ScopedTimer APPSPLAT_LOG_CONCAT(_appsplat_timer_, __LINE__)(name)
#define LOG_TIMER_TRACE(name) \
    ::appsplat::core::ScopedTimer APPSPLAT_LOG_CONCAT(_appsplat_timer_, __LINE__)(name, ::appsplat::core::LogLevel::Trace)
