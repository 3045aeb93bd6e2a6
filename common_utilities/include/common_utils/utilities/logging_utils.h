/**
 * @file logging_utils.h
 * @brief GeoBridge 日志系统：全局管理器 + 按模块命名的日志器
 *
 * 所有日志器共享同一组 sink（stderr 彩色输出，可选滚动文件）。
 * stdout 只留给命令行的结果 JSON。
 */

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include <spdlog/spdlog.h>

namespace geobridge::common_utils {

/**
 * @brief 日志配置，对应配置文件中的 logging.* 键
 */
struct LoggingConfig {
    std::string level = "info";              ///< logging.level
    std::string filePath;                    ///< logging.file，为空时不写文件
    std::size_t rotateBytes = 5 * 1024 * 1024;
    std::size_t rotateFiles = 3;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

    bool writesFile() const { return !filePath.empty(); }
};

/**
 * @brief 日志管理器
 *
 * @code
 * GEOBRIDGE_LOG_INFO("ResultCache", "已缓存 {}", cacheId);
 * LOG_WARN("配置文件不存在: {}", path);
 * @endcode
 *
 * 未调用 configureGlobal 之前使用默认配置（info 级别，只输出到 stderr）。
 * 重新配置后已有模块日志器会被替换。
 */
class LoggingManager {
public:
    static LoggingManager& getGlobalInstance();

    static void configureGlobal(const LoggingConfig& config);

    /// trace/debug/info/warn(ing)/error/critical/off，无法识别时为 info
    static spdlog::level::level_enum parseLevel(const std::string& level);

    void configure(const LoggingConfig& config);

    const LoggingConfig& config() const { return config_; }

    /// 未指定模块的日志器，名称为 "geobridge"
    std::shared_ptr<spdlog::logger> getLogger();

    std::shared_ptr<spdlog::logger> getModuleLogger(const std::string& moduleName);

    void setLevel(const std::string& level);

    void flushAll();

private:
    LoggingManager();

    std::vector<spdlog::sink_ptr> buildSinks(const LoggingConfig& config) const;
    std::shared_ptr<spdlog::logger> makeLogger(const std::string& name) const;

    LoggingConfig config_;
    std::vector<spdlog::sink_ptr> sinks_;
    std::shared_ptr<spdlog::logger> rootLogger_;
    std::map<std::string, std::shared_ptr<spdlog::logger>> moduleLoggers_;
    mutable std::mutex mutex_;
};

inline std::shared_ptr<spdlog::logger> getModuleLogger(const std::string& moduleName) {
    return LoggingManager::getGlobalInstance().getModuleLogger(moduleName);
}

} // namespace geobridge::common_utils

// 日志宏：参数在级别被过滤时不会求值
#define GEOBRIDGE_LOG_AT(loggerExpr, lvl, ...) \
    do { \
        auto geobridgeLogger_ = (loggerExpr); \
        if (geobridgeLogger_ && geobridgeLogger_->should_log(lvl)) { \
            geobridgeLogger_->log(lvl, __VA_ARGS__); \
        } \
    } while (0)

#define GEOBRIDGE_ROOT_LOGGER() ::geobridge::common_utils::LoggingManager::getGlobalInstance().getLogger()
#define GEOBRIDGE_MODULE_LOGGER(module) ::geobridge::common_utils::getModuleLogger(module)

#define LOG_TRACE(...) GEOBRIDGE_LOG_AT(GEOBRIDGE_ROOT_LOGGER(), ::spdlog::level::trace, __VA_ARGS__)
#define LOG_DEBUG(...) GEOBRIDGE_LOG_AT(GEOBRIDGE_ROOT_LOGGER(), ::spdlog::level::debug, __VA_ARGS__)
#define LOG_INFO(...) GEOBRIDGE_LOG_AT(GEOBRIDGE_ROOT_LOGGER(), ::spdlog::level::info, __VA_ARGS__)
#define LOG_WARN(...) GEOBRIDGE_LOG_AT(GEOBRIDGE_ROOT_LOGGER(), ::spdlog::level::warn, __VA_ARGS__)
#define LOG_ERROR(...) GEOBRIDGE_LOG_AT(GEOBRIDGE_ROOT_LOGGER(), ::spdlog::level::err, __VA_ARGS__)

#define GEOBRIDGE_LOG_TRACE(module, ...) GEOBRIDGE_LOG_AT(GEOBRIDGE_MODULE_LOGGER(module), ::spdlog::level::trace, __VA_ARGS__)
#define GEOBRIDGE_LOG_DEBUG(module, ...) GEOBRIDGE_LOG_AT(GEOBRIDGE_MODULE_LOGGER(module), ::spdlog::level::debug, __VA_ARGS__)
#define GEOBRIDGE_LOG_INFO(module, ...) GEOBRIDGE_LOG_AT(GEOBRIDGE_MODULE_LOGGER(module), ::spdlog::level::info, __VA_ARGS__)
#define GEOBRIDGE_LOG_WARN(module, ...) GEOBRIDGE_LOG_AT(GEOBRIDGE_MODULE_LOGGER(module), ::spdlog::level::warn, __VA_ARGS__)
#define GEOBRIDGE_LOG_ERROR(module, ...) GEOBRIDGE_LOG_AT(GEOBRIDGE_MODULE_LOGGER(module), ::spdlog::level::err, __VA_ARGS__)
#define GEOBRIDGE_LOG_CRITICAL(module, ...) GEOBRIDGE_LOG_AT(GEOBRIDGE_MODULE_LOGGER(module), ::spdlog::level::critical, __VA_ARGS__)
