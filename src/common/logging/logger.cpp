// File: common/logging/logger.cpp

#include "common/logging/logger.hpp"

#include <string_view>
#include <unordered_map>
#include <vector>

namespace common::logging {

    std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;
    spdlog::level::level_enum Logger::level_ = spdlog::level::info;
    std::string Logger::pattern_ = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v";
    std::once_flag Logger::init_flag_;
    std::mutex Logger::sink_mutex_;

    void Logger::init() {
        try {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            logger_ = std::make_shared<spdlog::logger>("panorama", console_sink);
            logger_->set_level(level_);
            logger_->set_pattern(pattern_);
            spdlog::set_default_logger(logger_);
        } catch (const spdlog::spdlog_ex &ex) {
            std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        }
    }

    void Logger::configure(const std::string &level, const std::string &log_file) {
        std::call_once(init_flag_, []() { init(); });
        setLogLevel(level);
        if (log_file.empty() || !logger_) {
            return;
        }

        // A fresh logger carries both sinks; the running logger's sink list is never touched.
        std::lock_guard lock(sink_mutex_);
        std::vector<spdlog::sink_ptr> sinks(logger_->sinks().begin(), logger_->sinks().end());
        std::string failure;
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true));
        } catch (const spdlog::spdlog_ex &ex) {
            failure = ex.what();
        }

        auto logger = std::make_shared<spdlog::logger>("panorama", sinks.begin(), sinks.end());
        logger->set_level(level_);
        logger->set_pattern(pattern_);
        spdlog::set_default_logger(logger);
        logger_ = std::move(logger);

        if (!failure.empty()) {
            logger_->error("Unable to open log file '{}': {}", log_file, failure);
        }
    }

    void Logger::setLogLevel(const std::string &level) {
        std::call_once(init_flag_, []() { init(); });
        level_ = getLogLevel(level);
        if (logger_) {
            logger_->set_level(level_);
        }
    }

    void Logger::setPattern(const std::string &pattern) {
        std::call_once(init_flag_, []() { init(); });
        pattern_ = pattern;
        if (logger_) {
            logger_->set_pattern(pattern_);
        }
    }

    spdlog::level::level_enum Logger::getLogLevel(const std::string &level) {
        static const std::unordered_map<std::string_view, spdlog::level::level_enum> level_map = {
                {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
                {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
                {"error", spdlog::level::err},   {"critical", spdlog::level::critical},
                {"off", spdlog::level::off}};
        const auto iterator = level_map.find(level);
        return iterator != level_map.end() ? iterator->second : spdlog::level::info;
    }

    std::shared_ptr<spdlog::logger> Logger::getLogger() {
        std::call_once(init_flag_, []() { init(); });
        return logger_;
    }

} // namespace common::logging
