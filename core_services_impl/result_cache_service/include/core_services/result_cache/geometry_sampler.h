/**
 * @file geometry_sampler.h
 * @brief 缓存几何的均匀采样预览
 */

#pragma once

#include "core_services/result_cache/result_cache.h"
#include "core_services/result_cache/result_cache_types.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace geobridge::core_services::result_cache {

/**
 * @brief 从缓存结果中抽取几何的轻量预览
 *
 * 只解析存储文件中的 geometry 与 bbox 两个顶层成员。LineString 与 Polygon
 * 外环按均匀步长采样（始终保留首尾点）；MultiPolygon 与其它类型只给出统计。
 */
class GeometrySampler {
public:
    static constexpr std::size_t DEFAULT_MAX_POINTS = 100;

    explicit GeometrySampler(ResultCache& cache) : cache_(cache) {}

    /**
     * @return 条目未知、已过期或没有几何时为空
     * @throws InvalidParameterException maxPoints < 2
     */
    std::optional<SampledGeometry> sample(const std::string& cacheId,
                                          std::size_t maxPoints = DEFAULT_MAX_POINTS) const;

    /**
     * @brief 均匀采样下标：floor(i * N / max)，i = 0..max-2，外加 N-1
     */
    static std::vector<std::size_t> sampleIndices(std::size_t total, std::size_t maxPoints);

    /**
     * @brief 递归统计坐标位置数（首元素为数字的数组视为一个位置）
     */
    static std::size_t countPositions(const nlohmann::json& coordinates);

private:
    ResultCache& cache_;
};

} // namespace geobridge::core_services::result_cache
