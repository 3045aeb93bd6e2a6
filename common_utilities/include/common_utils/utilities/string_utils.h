#pragma once

#include <string>
#include <vector>

namespace geobridge {
namespace common_utils {

/**
 * @brief 字符串工具类
 */
class StringUtils {
public:
    StringUtils() = delete;

    /**
     * @brief 去除字符串两端的空白字符
     */
    static std::string trim(const std::string& s);

    static std::string toLower(const std::string& s);

    static std::string toUpper(const std::string& s);

    /**
     * @brief 按分隔符分割字符串
     * @param s 要分割的字符串
     * @param delimiter 分隔符
     * @param skipEmpty 是否跳过空子串
     */
    static std::vector<std::string> split(const std::string& s,
                                          char delimiter,
                                          bool skipEmpty = true);

    static std::string join(const std::vector<std::string>& v,
                            const std::string& delimiter);

    static bool startsWith(const std::string& s, const std::string& prefix);

    static bool endsWith(const std::string& s, const std::string& suffix);

    /**
     * @brief 不区分大小写比较
     */
    static bool equalsIgnoreCase(const std::string& a, const std::string& b);
};

} // namespace common_utils
} // namespace geobridge
