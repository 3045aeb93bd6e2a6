/**
 * @file app_config_loader.h
 * @brief 分层应用配置
 *
 * 🎯 每个配置键取优先级最高的来源：
 * ✅ 命令行 --key=value
 * ✅ 环境变量 GEOBRIDGE_<KEY>（'.' 写作 '_'）
 * ✅ YAML / JSON 文件（嵌套节展平为 section.key）
 * ✅ setDefault 注册的默认值
 */

#pragma once

#include <array>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace YAML {
class Node;
}

namespace geobridge {
namespace common_utils {

/// 按优先级从高到低排列
enum class ConfigSource {
    COMMAND_LINE = 0,
    ENVIRONMENT = 1,
    FILE = 2,
    DEFAULT_VALUES = 3
};

struct ConfigValue {
    std::string value;
    ConfigSource source = ConfigSource::DEFAULT_VALUES;
    std::string origin;   ///< 文件路径、环境变量名或默认值说明

    int asInt() const;
    bool asBool() const;
    /// 逗号分隔的列表（文件中的序列会被存为这种形式）
    std::vector<std::string> asList() const;
};

class AppConfigLoader {
public:
    /**
     * @param appName 用于查找 <appName>.yaml 等标准配置文件
     */
    explicit AppConfigLoader(std::string appName = "geobridge");

    AppConfigLoader(const AppConfigLoader&) = delete;
    AppConfigLoader& operator=(const AppConfigLoader&) = delete;

    /**
     * @brief 读取 .json（nlohmann）或其他扩展名（yaml-cpp）的配置文件
     * @return 文件不存在或解析失败时记录日志并返回 false
     */
    bool loadFromFile(const std::filesystem::path& configPath);

    /**
     * @brief 依次尝试 ./geobridge.yaml, ./config/geobridge.yaml,
     *        ~/.config/geobridge/geobridge.yaml 等路径
     */
    bool loadStandardConfig();

    /**
     * @brief 为每个已知键（默认值或文件中出现过的）查找环境变量
     *
     * cache.root_dir -> GEOBRIDGE_CACHE_ROOT_DIR
     *
     * @return 命中的变量个数
     */
    int loadFromEnvironment(const std::string& prefix = "GEOBRIDGE_");

    /**
     * @brief 只接受 --key=value，其余参数（命令名、--option value）忽略
     * @return 接受的参数个数
     */
    int loadFromCommandLine(const std::vector<std::string>& args);

    void setDefault(const std::string& key, const std::string& value,
                    const std::string& description = "");

    std::optional<ConfigValue> get(const std::string& key) const;
    bool has(const std::string& key) const { return get(key).has_value(); }

    std::string getString(const std::string& key, const std::string& fallback = "") const;
    /// @throws ConfigurationException 值不是整数
    int getInt(const std::string& key, int fallback = 0) const;

private:
    using Layer = std::map<std::string, ConfigValue>;

    Layer& layer(ConfigSource source) { return m_layers[static_cast<std::size_t>(source)]; }
    const Layer& layer(ConfigSource source) const { return m_layers[static_cast<std::size_t>(source)]; }

    void put(ConfigSource source, const std::string& key, std::string value, std::string origin);

    void flattenJson(const nlohmann::json& node, const std::string& prefix, const std::string& origin);
    void flattenYaml(const YAML::Node& node, const std::string& prefix, const std::string& origin);

    static std::string normalizeKey(const std::string& key);

    std::string m_appName;
    std::array<Layer, 4> m_layers;
};

} // namespace common_utils
} // namespace geobridge
