/**
 * @file exceptions.h
 * @brief core_services 共用的服务异常
 *
 * 各服务的业务异常（geo_processing_exceptions.h 等）从 ServiceException 派生并带字符串错误码。
 */

#pragma once

#include "common_utils/utilities/exceptions.h"

namespace geobridge {
namespace core_services {

using common_utils::ServiceException;

/// 服务工厂拒绝配置或依赖缺失（如线程池为空）
class ServiceCreationException : public ServiceException {
public:
    using ServiceException::ServiceException;
};

} // namespace core_services
} // namespace geobridge
