/**
 * @file command_dispatcher.h
 * @brief 命令行子命令到服务调用的分发
 */
#pragma once

#include "core_services/geo_processing/i_geo_processing_service.h"
#include "core_services/result_cache/result_cache.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace geobridge::application {

/// --name value 形式的子命令选项
using CommandOptions = std::map<std::string, std::string>;

/**
 * @class CommandDispatcher
 * @brief 解析子命令选项、调用服务并返回单个 JSON 文档
 *
 * 数据类选项（data、data_a、data_b、clip_data）以 '@' 开头时从文件读取载荷。
 * 错误以异常形式抛出，由调用方转换为 {"error": {...}}。
 */
class CommandDispatcher {
public:
    CommandDispatcher(std::shared_ptr<core_services::geo_processing::IGeoProcessingService> geoProcessing,
                      std::shared_ptr<core_services::result_cache::ResultCache> cache);

    /**
     * @throws InvalidParameterException 未知命令或选项值非法
     * @throws GeoProcessingException 及其子类，来自服务
     */
    nlohmann::json execute(const std::string& command, const CommandOptions& options);

    static const std::vector<std::string>& commands();

    /**
     * @brief 将失败转换为 {"error": {"code", "message"}}
     */
    static nlohmann::json errorDocument(const std::string& code, const std::string& message);

private:
    nlohmann::json geometryCommand(const std::string& command, const CommandOptions& options);
    nlohmann::json cacheCommand(const std::string& command, const CommandOptions& options);

    std::shared_ptr<core_services::geo_processing::IGeoProcessingService> m_geoProcessing;
    std::shared_ptr<core_services::result_cache::ResultCache> m_cache;
};

} // namespace geobridge::application
