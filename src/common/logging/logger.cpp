// File: common/logging/logger.cpp

#include "common/logging/logger.hpp"

#include <filesystem>
#include <string_view>
#include <unordered_map>

namespace common::logging {

    std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;
    spdlog::level::level_enum Logger::level_ = spdlog::level::info;
    std::string Logger::pattern_ = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] [%s:%#] %v";
    std::once_flag Logger::init_flag_;

    void Logger::init(const std::string &log_level, const std::string &pattern) {
        pattern_ = pattern;
        level_ = getLogLevel(log_level);
        try {
            logger_ = std::make_shared<spdlog::logger>("gp_surrogate",
                                                       std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
            logger_->set_level(level_);
            logger_->set_pattern(pattern_);
            spdlog::register_logger(logger_);
        } catch (const spdlog::spdlog_ex &ex) {
            std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        }
    }

    void Logger::addFileSink(const std::string &file_path, const bool truncate) {
        std::call_once(init_flag_, []() { init(); });
        if (!logger_) {
            return;
        }
        try {
            const std::filesystem::path path(file_path);
            if (path.has_parent_path() && !std::filesystem::exists(path.parent_path())) {
                std::filesystem::create_directories(path.parent_path());
            }
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, truncate);
            sink->set_pattern(pattern_);
            logger_->sinks().push_back(std::move(sink));
        } catch (const spdlog::spdlog_ex &ex) {
            std::cerr << "Could not open log file '" << file_path << "': " << ex.what() << std::endl;
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
