#pragma once

// 首先包含基础类型定义
#include "core_services/common_data_types.h"

// 然后包含boost配置
#include "common_utils/utilities/boost_config.h"
#include <boost/thread/future.hpp>

#include <string>
#include <vector>

#include "core_services/geo_processing/geo_processing_types.h"
#include "core_services/geo_processing/geo_processing_config.h"

namespace geobridge::core_services::geo_processing {

/**
 * @brief Interface for the geodata processing service.
 *
 * Every operation decodes its input payload(s), reconciles coordinate
 * reference systems, applies one geometric operation and re-encodes the
 * result. All methods are asynchronous; errors from the taxonomy in
 * geo_processing_exceptions.h are delivered through the returned future.
 */
class IGeoProcessingService {
public:
    virtual ~IGeoProcessingService() = default;

    // --- 服务管理 (Service Management) ---

    /**
     * @brief 获取服务支持的操作与格式列表
     * @return 操作名称（reproject, buffer, ...）与格式名称组成的列表
     */
    virtual boost::future<std::vector<std::string>> getCapabilities() const = 0;

    virtual GeoProcessingConfig getConfiguration() const = 0;

    virtual std::string getVersion() const = 0;

    virtual bool isReady() const = 0;

    // --- 几何处理 (Geometry Operations) ---

    /**
     * @brief 将输入重投影到 targetCrs。
     * @throw MissingParameterException 未提供 targetCrs (通过future传递)。
     */
    virtual boost::future<GeodataEnvelope> reproject(const ReprojectRequest& request) = 0;

    /**
     * @brief 按有符号距离计算缓冲区，距离单位为工作 CRS 的单位。
     * @throw MissingParameterException 未提供 distance。
     * @throw InvalidStyleParameterException capStyle/joinStyle 不在枚举集合中。
     * @throw MissingCrsException 无法确定工作 CRS。
     */
    virtual boost::future<GeodataEnvelope> buffer(const BufferRequest& request) = 0;

    /**
     * @brief 两个集合的逐对交集，属性来自双方。
     * @throw IncompatibleCrsException 任一输入 CRS 未知且未给出 targetCrs。
     * @throw EmptyResultException 没有任何重叠。
     */
    virtual boost::future<GeodataEnvelope> intersect(const IntersectRequest& request) = 0;

    /**
     * @brief 以 clipData 的并集为掩膜裁剪 data，仅保留 data 的属性。
     */
    virtual boost::future<GeodataEnvelope> clip(const ClipRequest& request) = 0;

    virtual boost::future<GeodataEnvelope> convert(const ConvertRequest& request) = 0;

    virtual boost::future<BoundingBox> bbox(const BboxRequest& request) = 0;

    /**
     * @brief 按属性分组合并几何，并按列聚合属性。
     */
    virtual boost::future<GeodataEnvelope> dissolve(const DissolveRequest& request) = 0;

    /**
     * @brief 将多部件几何拆分为单部件行。
     */
    virtual boost::future<GeodataEnvelope> explode(const ExplodeRequest& request) = 0;
};

} // namespace geobridge::core_services::geo_processing
