#pragma once

#include <string>
#include <vector>

namespace geobridge::core_services::geo_processing::impl {

/**
 * @brief 进程级 GDAL 环境：驱动注册、配置选项、诊断转发到日志
 *
 * 第一次调用 require()/available() 时初始化，之后只读。
 */
class GdalEnvironment {
public:
    /// 编解码所需的 OGR 驱动
    static const std::vector<std::string>& requiredDrivers();

    /**
     * @brief 初始化并确认所有必需驱动可用
     * @throws OperationFailedException 缺少驱动时，消息中列出缺失的驱动
     */
    static void require();

    static bool available();

    static std::vector<std::string> missingDrivers();

    /// 当前线程最近一条 CPL 错误信息，为空时返回占位文本
    static std::string lastError();

    GdalEnvironment() = delete;
};

} // namespace geobridge::core_services::geo_processing::impl
