/**
 * @file result_cache_types.h
 * @brief 结果缓存的配置与数据类型
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace geobridge::core_services::result_cache {

/**
 * @brief 缓存配置，每个 ResultCache 实例持有一份
 */
struct CacheConfig {
    std::filesystem::path rootDirectory;                 ///< 缓存根目录，构造时创建
    std::chrono::seconds ttl{std::chrono::hours(24)};    ///< 条目生存期
    std::size_t inlineSizeLimitBytes = 10 * 1024;        ///< 序列化超过该大小则缓存
    std::size_t featureCountLimit = 50;                  ///< features 超过该数量则缓存
};

/**
 * @brief 产生结果的操作类别，决定摘要提取策略
 */
enum class OperationKind {
    ROUTE,
    ISOCHRONE,
    FEATURE_COLLECTION,
    ELEVATION_PROFILE,
    GENERIC
};

/**
 * @brief 工具名到操作类别的映射，未登记的工具名归为 GENERIC
 */
OperationKind operationKindFromToolName(const std::string& toolName);

std::string toString(OperationKind kind);

/**
 * @brief 缓存条目元数据（对应 {cache_id}_meta.json）
 */
struct CacheEntry {
    std::string cacheId;
    std::string toolName;
    nlohmann::json params = nlohmann::json::object();
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point expiresAt;
    std::filesystem::path filePath;
    std::uintmax_t fileSizeBytes = 0;
    nlohmann::json summary = nlohmann::json::object();
};

void to_json(nlohmann::json& j, const CacheEntry& entry);
void from_json(const nlohmann::json& j, CacheEntry& entry);

/**
 * @brief put 的返回值，供调用方内联返回
 */
struct CachePutResult {
    bool cached = true;
    std::string cacheId;
    std::filesystem::path filePath;
    double fileSizeKb = 0.0;
    std::chrono::system_clock::time_point expiresAt;
    nlohmann::json summary = nlohmann::json::object();
    std::string usage;
};

void to_json(nlohmann::json& j, const CachePutResult& result);

struct ExportResult {
    bool success = false;
    std::string cacheId;
    std::filesystem::path outputPath;
    std::uintmax_t fileSizeBytes = 0;
    std::string message;
};

void to_json(nlohmann::json& j, const ExportResult& result);

/**
 * @brief 缓存几何的均匀采样预览，不持久化
 */
struct SampledGeometry {
    std::string cacheId;
    std::string toolName;
    std::string geometryType;
    std::size_t totalPoints = 0;
    nlohmann::json coordinates = nlohmann::json::array();
    bool sampled = false;
    std::optional<std::string> samplingRatio;  ///< "max/N"，仅在 sampled 时设置
    std::optional<std::size_t> polygonsCount;
    std::optional<std::size_t> ringsCount;
    std::optional<std::string> message;
    std::optional<nlohmann::json> bbox;
};

void to_json(nlohmann::json& j, const SampledGeometry& sample);

} // namespace geobridge::core_services::result_cache
