#include "common_utils/utilities/logging_utils.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <iostream>

namespace geobridge::common_utils {

namespace {
const char* const kRootLoggerName = "geobridge";
}

LoggingManager& LoggingManager::getGlobalInstance() {
    // 函数内静态对象，首次访问时按默认配置建立 stderr 输出
    static LoggingManager instance;
    return instance;
}

void LoggingManager::configureGlobal(const LoggingConfig& config) {
    getGlobalInstance().configure(config);
}

LoggingManager::LoggingManager() {
    sinks_ = buildSinks(config_);
    rootLogger_ = makeLogger(kRootLoggerName);
}

spdlog::level::level_enum LoggingManager::parseLevel(const std::string& level) {
    std::string lower(level);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::map<std::string, spdlog::level::level_enum> kLevels = {
        {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn}, {"error", spdlog::level::err},
        {"critical", spdlog::level::critical}, {"off", spdlog::level::off},
    };
    auto it = kLevels.find(lower);
    return it == kLevels.end() ? spdlog::level::info : it->second;
}

std::vector<spdlog::sink_ptr> LoggingManager::buildSinks(const LoggingConfig& config) const {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern(config.pattern);
    sinks.push_back(console);

    if (config.writesFile()) {
        try {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, config.rotateBytes, config.rotateFiles);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
            sinks.push_back(file);
        } catch (const spdlog::spdlog_ex& ex) {
            // 文件不可写时继续只用控制台
            std::cerr << "geobridge: cannot open log file '" << config.filePath << "': "
                      << ex.what() << std::endl;
        }
    }
    return sinks;
}

std::shared_ptr<spdlog::logger> LoggingManager::makeLogger(const std::string& name) const {
    auto logger = std::make_shared<spdlog::logger>(name, sinks_.begin(), sinks_.end());
    logger->set_level(parseLevel(config_.level));
    logger->flush_on(spdlog::level::err);
    return logger;
}

void LoggingManager::configure(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }

    config_ = config;
    sinks_ = buildSinks(config_);
    rootLogger_ = makeLogger(kRootLoggerName);
    moduleLoggers_.clear();
}

std::shared_ptr<spdlog::logger> LoggingManager::getLogger() {
    std::lock_guard<std::mutex> lock(mutex_);
    return rootLogger_;
}

std::shared_ptr<spdlog::logger> LoggingManager::getModuleLogger(const std::string& moduleName) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& logger = moduleLoggers_[moduleName];
    if (!logger) {
        logger = makeLogger(moduleName);
    }
    return logger;
}

void LoggingManager::setLevel(const std::string& level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.level = level;
    const auto parsed = parseLevel(level);
    rootLogger_->set_level(parsed);
    for (auto& entry : moduleLoggers_) {
        entry.second->set_level(parsed);
    }
}

void LoggingManager::flushAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace geobridge::common_utils
