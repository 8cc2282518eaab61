#include "appsplat/logger.hpp"

#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace appsplat::core {

    namespace {
        spdlog::level::level_enum to_spdlog(LogLevel level) {
            switch (level) {
            case LogLevel::Trace: return spdlog::level::trace;
            case LogLevel::Debug: return spdlog::level::debug;
            case LogLevel::Info: return spdlog::level::info;
            case LogLevel::Warn: return spdlog::level::warn;
            case LogLevel::Error: return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off: return spdlog::level::off;
            }
            return spdlog::level::info;
        }
    } // namespace

    struct Logger::Impl {
        std::shared_ptr<spdlog::logger> logger;
        std::mutex mutex;
    };

    Logger& Logger::get() {
        static Logger instance;
        return instance;
    }

    Logger::Logger() : impl_(std::make_unique<Impl>()) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        impl_->logger = std::make_shared<spdlog::logger>("appsplat", console);
        impl_->logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        impl_->logger->set_level(to_spdlog(level_));
    }

    Logger::~Logger() {
        if (impl_ && impl_->logger) {
            impl_->logger->flush();
        }
    }

    void Logger::init(LogLevel level, const std::string& log_file) {
        std::lock_guard<std::mutex> lock(impl_->mutex);

        // 控制台sink带颜色，文件sink额外记录源码位置
        std::vector<spdlog::sink_ptr> sinks;
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console);

        if (!log_file.empty()) {
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, /*truncate=*/true);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");
            sinks.push_back(file);
        }

        impl_->logger = std::make_shared<spdlog::logger>("appsplat", sinks.begin(), sinks.end());
        level_ = level;
        impl_->logger->set_level(to_spdlog(level));
        impl_->logger->flush_on(spdlog::level::warn);
    }

    void Logger::set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        level_ = level;
        impl_->logger->set_level(to_spdlog(level));
    }

    void Logger::flush() {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->logger->flush();
    }

    void Logger::log_internal(LogLevel level, const std::source_location& loc, const std::string& msg) {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->logger->log(spdlog::source_loc{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()},
                           to_spdlog(level),
                           msg);
    }

} // namespace appsplat::core
