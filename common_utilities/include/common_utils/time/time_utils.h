#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace geobridge::common_utils::time {

/**
 * @brief 时间格式化与解析工具（UTC）
 */
class TimeUtils {
public:
    TimeUtils() = delete;

    /**
     * @brief 格式化为 ISO-8601 UTC 字符串，秒精度，例如 2024-05-01T12:00:00Z
     */
    static std::string toIsoString(const std::chrono::system_clock::time_point& tp);

    /**
     * @brief 解析 toIsoString 产生的格式（末尾的 'Z' 可省略）
     */
    static std::optional<std::chrono::system_clock::time_point> parseIsoString(const std::string& text);

    /**
     * @brief 自 Unix 纪元起的毫秒数
     */
    static long long toEpochMillis(const std::chrono::system_clock::time_point& tp);
};

} // namespace geobridge::common_utils::time
