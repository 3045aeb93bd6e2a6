/**
 * @file summary_extractors.h
 * @brief 按操作类别提取缓存条目摘要
 */
#pragma once

#include "core_services/result_cache/result_cache_types.h"

#include <functional>
#include <map>

#include <nlohmann/json.hpp>

namespace geobridge::core_services::result_cache::summary {

/// (result, params) -> summary
using SummaryExtractor = std::function<nlohmann::json(const nlohmann::json&, const nlohmann::json&)>;

/**
 * @brief 每个 OperationKind 对应一个摘要提取器
 */
const std::map<OperationKind, SummaryExtractor>& extractorTable();

nlohmann::json extract(OperationKind kind, const nlohmann::json& result,
                       const nlohmann::json& params = nlohmann::json::object());

nlohmann::json summarizeRoute(const nlohmann::json& result, const nlohmann::json& params);
nlohmann::json summarizeIsochrone(const nlohmann::json& result, const nlohmann::json& params);
nlohmann::json summarizeFeatureCollection(const nlohmann::json& result, const nlohmann::json& params);
nlohmann::json summarizeElevationProfile(const nlohmann::json& result, const nlohmann::json& params);
nlohmann::json summarizeGeneric(const nlohmann::json& result, const nlohmann::json& params);

} // namespace geobridge::core_services::result_cache::summary
