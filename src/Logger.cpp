/**
 * @file Logger.cpp
 * @brief spdlog 日志封装的实现文件。
 */

#include "Logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdio>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace {

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        case LogLevel::OFF: return spdlog::level::off;
    }
    return spdlog::level::info;
}

// 全局状态
std::mutex logger_mutex;
std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers;
std::vector<spdlog::sink_ptr> sinks;

// 调用者持有 logger_mutex
void ensure_default_sinks() {
    if (sinks.empty()) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog::level::warn);
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(console_sink);
    }
}

}  // namespace

LogLevel parse_log_level(const std::string& name) {
    if (name == "trace") return LogLevel::TRACE;
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    if (name == "critical") return LogLevel::CRITICAL;
    if (name == "off") return LogLevel::OFF;
    throw std::invalid_argument("unknown log level: " + name);
}

void Logger::init(const std::string& log_file,
                  LogLevel console_level,
                  LogLevel file_level) {
    std::lock_guard<std::mutex> lock(logger_mutex);

    // 重新初始化时，已有的模块 logger 改用新的 sink
    sinks.clear();
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(to_spdlog_level(console_level));
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(console_sink);

        // 文件输出（滚动，单个 10MB，最多 3 个）
        if (!log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 10 * 1024 * 1024, 3);
            file_sink->set_level(to_spdlog_level(file_level));
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] [%t] %v");
            sinks.push_back(file_sink);
        }
    } catch (const spdlog::spdlog_ex& e) {
        // 文件打不开时只保留控制台输出
        std::fprintf(stderr, "Logger initialization failed: %s\n", e.what());
    }

    for (auto& entry : loggers) {
        entry.second->sinks() = sinks;
    }
}

void Logger::shutdown() {
    flush();
    std::lock_guard<std::mutex> lock(logger_mutex);
    loggers.clear();
    sinks.clear();
    spdlog::shutdown();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(logger_mutex);
    for (auto& entry : loggers) {
        entry.second->set_level(to_spdlog_level(level));
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    for (auto& entry : loggers) {
        entry.second->flush();
    }
}

std::shared_ptr<spdlog::logger> Logger::get(const std::string& module) {
    std::lock_guard<std::mutex> lock(logger_mutex);

    auto it = loggers.find(module);
    if (it != loggers.end()) {
        return it->second;
    }

    ensure_default_sinks();
    auto logger = std::make_shared<spdlog::logger>(module, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);  // 实际过滤由各个 sink 完成
    loggers[module] = logger;
    return logger;
}
