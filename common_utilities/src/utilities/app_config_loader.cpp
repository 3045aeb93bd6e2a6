/**
 * @file app_config_loader.cpp
 * @brief 分层配置加载实现
 */

#include "common_utils/utilities/app_config_loader.h"
#include "common_utils/utilities/exceptions.h"
#include "common_utils/utilities/logging_utils.h"
#include "common_utils/utilities/string_utils.h"

#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace geobridge {
namespace common_utils {

int ConfigValue::asInt() const {
    const std::string text = StringUtils::trim(value);
    std::size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (text.empty() || consumed != text.size()) {
        GEOBRIDGE_THROW(ConfigurationException, "配置值不是整数: '" + value + "' (" + origin + ")");
    }
    return parsed;
}

bool ConfigValue::asBool() const {
    const std::string lower = StringUtils::toLower(StringUtils::trim(value));
    return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
}

std::vector<std::string> ConfigValue::asList() const {
    std::vector<std::string> items;
    for (const auto& part : StringUtils::split(value, ',')) {
        std::string item = StringUtils::trim(part);
        if (!item.empty()) {
            items.push_back(std::move(item));
        }
    }
    return items;
}

AppConfigLoader::AppConfigLoader(std::string appName) : m_appName(std::move(appName)) {}

std::string AppConfigLoader::normalizeKey(const std::string& key) {
    std::string normalized = StringUtils::toLower(StringUtils::trim(key));
    for (char& c : normalized) {
        if (c == '-') {
            c = '_';
        }
    }
    return normalized;
}

void AppConfigLoader::put(ConfigSource source, const std::string& key, std::string value, std::string origin) {
    if (key.empty()) {
        return;
    }
    ConfigValue entry;
    entry.value = std::move(value);
    entry.source = source;
    entry.origin = std::move(origin);
    layer(source)[normalizeKey(key)] = std::move(entry);
}

bool AppConfigLoader::loadFromFile(const std::filesystem::path& configPath) {
    std::ifstream in(configPath);
    if (!in) {
        LOG_WARN("配置文件不可读: {}", configPath.string());
        return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    // 解析到临时层，失败时不污染已加载的配置
    Layer previous = layer(ConfigSource::FILE);
    const std::string origin = configPath.string();
    try {
        if (StringUtils::toLower(configPath.extension().string()) == ".json") {
            auto root = nlohmann::json::parse(buffer.str());
            if (!root.is_object()) {
                GEOBRIDGE_THROW(ConfigurationException, "JSON 配置的根节点必须是对象");
            }
            flattenJson(root, "", origin);
        } else {
            flattenYaml(YAML::Load(buffer.str()), "", origin);
        }
    } catch (const nlohmann::json::exception& e) {
        layer(ConfigSource::FILE) = std::move(previous);
        LOG_ERROR("解析配置文件失败 {}: {}", origin, e.what());
        return false;
    } catch (const YAML::Exception& e) {
        layer(ConfigSource::FILE) = std::move(previous);
        LOG_ERROR("解析配置文件失败 {}: {}", origin, e.what());
        return false;
    } catch (const ConfigurationException& e) {
        layer(ConfigSource::FILE) = std::move(previous);
        LOG_ERROR("解析配置文件失败 {}: {}", origin, e.what());
        return false;
    }

    LOG_INFO("已加载配置文件: {}", origin);
    return true;
}

bool AppConfigLoader::loadStandardConfig() {
    std::vector<std::filesystem::path> candidates = {
        m_appName + ".yaml",
        m_appName + ".json",
        std::filesystem::path("config") / (m_appName + ".yaml"),
        std::filesystem::path("config") / (m_appName + ".json"),
    };
    if (const char* home = std::getenv("HOME")) {
        candidates.push_back(std::filesystem::path(home) / ".config" / m_appName / (m_appName + ".yaml"));
    }

    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec) && loadFromFile(candidate)) {
            return true;
        }
    }
    LOG_DEBUG("未找到标准配置文件，使用默认值");
    return false;
}

int AppConfigLoader::loadFromEnvironment(const std::string& prefix) {
    std::set<std::string> keys;
    for (auto source : {ConfigSource::DEFAULT_VALUES, ConfigSource::FILE}) {
        for (const auto& entry : layer(source)) {
            keys.insert(entry.first);
        }
    }

    int hits = 0;
    for (const auto& key : keys) {
        std::string variable = prefix + StringUtils::toUpper(key);
        for (char& c : variable) {
            if (c == '.') {
                c = '_';
            }
        }
        if (const char* value = std::getenv(variable.c_str())) {
            put(ConfigSource::ENVIRONMENT, key, value, variable);
            LOG_DEBUG("环境变量 {} -> {}", variable, key);
            ++hits;
        }
    }
    return hits;
}

int AppConfigLoader::loadFromCommandLine(const std::vector<std::string>& args) {
    int accepted = 0;
    for (const auto& arg : args) {
        if (!StringUtils::startsWith(arg, "--")) {
            continue;
        }
        const auto eq = arg.find('=');
        if (eq == std::string::npos || eq == 2) {
            continue;
        }
        put(ConfigSource::COMMAND_LINE, arg.substr(2, eq - 2), arg.substr(eq + 1), "command line");
        ++accepted;
    }
    return accepted;
}

void AppConfigLoader::setDefault(const std::string& key, const std::string& value,
                                 const std::string& description) {
    put(ConfigSource::DEFAULT_VALUES, key, value, description.empty() ? "default" : description);
}

std::optional<ConfigValue> AppConfigLoader::get(const std::string& key) const {
    const std::string normalized = normalizeKey(key);
    for (const auto& candidates : m_layers) {
        auto it = candidates.find(normalized);
        if (it != candidates.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

std::string AppConfigLoader::getString(const std::string& key, const std::string& fallback) const {
    auto value = get(key);
    return value ? value->value : fallback;
}

int AppConfigLoader::getInt(const std::string& key, int fallback) const {
    auto value = get(key);
    return value ? value->asInt() : fallback;
}

void AppConfigLoader::flattenJson(const nlohmann::json& node, const std::string& prefix,
                                  const std::string& origin) {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            flattenJson(it.value(), prefix.empty() ? it.key() : prefix + "." + it.key(), origin);
        }
        return;
    }
    if (node.is_null()) {
        return;
    }
    if (node.is_array()) {
        std::vector<std::string> items;
        for (const auto& item : node) {
            items.push_back(item.is_string() ? item.get<std::string>() : item.dump());
        }
        put(ConfigSource::FILE, prefix, StringUtils::join(items, ","), origin);
        return;
    }
    put(ConfigSource::FILE, prefix, node.is_string() ? node.get<std::string>() : node.dump(), origin);
}

void AppConfigLoader::flattenYaml(const YAML::Node& node, const std::string& prefix,
                                  const std::string& origin) {
    switch (node.Type()) {
        case YAML::NodeType::Map:
            for (const auto& item : node) {
                const std::string key = item.first.as<std::string>();
                flattenYaml(item.second, prefix.empty() ? key : prefix + "." + key, origin);
            }
            break;
        case YAML::NodeType::Sequence: {
            std::vector<std::string> items;
            for (const auto& item : node) {
                items.push_back(item.as<std::string>());
            }
            put(ConfigSource::FILE, prefix, StringUtils::join(items, ","), origin);
            break;
        }
        case YAML::NodeType::Scalar:
            put(ConfigSource::FILE, prefix, node.as<std::string>(), origin);
            break;
        default:
            break;
    }
}

} // namespace common_utils
} // namespace geobridge
