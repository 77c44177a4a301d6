/**
 * @file Logger.hpp
 * @brief 基于 spdlog 的日志封装，按模块名获取 logger。
 */

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

/**
 * @brief 日志级别
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6
};

/**
 * @brief 解析 "trace" / "debug" / "info" / "warn" / "error" / "critical" / "off"。
 * @throws std::invalid_argument 未知的级别名称。
 */
LogLevel parse_log_level(const std::string& name);

class Logger {
public:
    /**
     * @brief 初始化日志系统：彩色控制台输出，可选的滚动日志文件。
     *
     * 未调用 init() 时，get() 返回的 logger 只输出 WARN 及以上级别到 stderr。
     *
     * @param log_file 日志文件路径（为空则不写文件）
     * @param console_level 控制台最低输出级别
     * @param file_level 文件最低输出级别
     */
    static void init(const std::string& log_file = "",
                     LogLevel console_level = LogLevel::INFO,
                     LogLevel file_level = LogLevel::DEBUG);

    /**
     * @brief 刷新并关闭所有 logger。
     */
    static void shutdown();

    static void set_level(LogLevel level);

    static void flush();

    /**
     * @brief 获取（或创建）某个模块的 logger。
     */
    static std::shared_ptr<spdlog::logger> get(const std::string& module);
};

// ============================================================================
// Logging Macros
// ============================================================================

#define FRAMETRACK_LOG_TRACE(module, ...) \
    if (auto _log = ::Logger::get(module)) _log->trace(__VA_ARGS__)

#define FRAMETRACK_LOG_DEBUG(module, ...) \
    if (auto _log = ::Logger::get(module)) _log->debug(__VA_ARGS__)

#define FRAMETRACK_LOG_INFO(module, ...) \
    if (auto _log = ::Logger::get(module)) _log->info(__VA_ARGS__)

#define FRAMETRACK_LOG_WARN(module, ...) \
    if (auto _log = ::Logger::get(module)) _log->warn(__VA_ARGS__)

#define FRAMETRACK_LOG_ERROR(module, ...) \
    if (auto _log = ::Logger::get(module)) _log->error(__VA_ARGS__)

#define FRAMETRACK_LOG_CRITICAL(module, ...) \
    if (auto _log = ::Logger::get(module)) _log->critical(__VA_ARGS__)
