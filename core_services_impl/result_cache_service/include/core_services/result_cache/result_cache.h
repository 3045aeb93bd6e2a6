/**
 * @file result_cache.h
 * @brief 大体量工具结果的文件缓存
 *
 * 每个条目由两个文件组成：
 * - {root}/{cache_id}.json       完整结果
 * - {root}/{cache_id}_meta.json  元数据与摘要
 *
 * 两个文件各自通过临时文件 + 原子重命名写入，不提供跨文件事务。
 * 实例之间不共享任何状态，可以在不同目录上并存多个缓存。
 */

#pragma once

#include "core_services/result_cache/result_cache_types.h"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace geobridge::core_services::result_cache {

class ResultCache {
public:
    /// 时间来源，测试中可替换以模拟过期；为空时使用 system_clock
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @brief 构造缓存并创建根目录
     * @throws OperationFailedException 根目录无法创建
     */
    explicit ResultCache(CacheConfig config, Clock clock = {});

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    const CacheConfig& getConfig() const { return config_; }

    /**
     * @brief 判断结果是否应当写入缓存而非内联返回
     *
     * route / isochrone / elevation profile 总是缓存；features 超过
     * featureCountLimit 或序列化后超过 inlineSizeLimitBytes 时缓存。
     */
    bool shouldCache(const nlohmann::json& result, const std::string& toolName) const;

    /**
     * @brief 写入一个结果，返回可内联的轻量描述
     *
     * 写入前先清理过期文件。cache_id 形如 {tool}_{epoch毫秒}_{8位十六进制}。
     * @throws OperationFailedException 文件写入失败
     */
    CachePutResult put(const nlohmann::json& result,
                       const std::string& toolName,
                       const nlohmann::json& params = nlohmann::json::object());

    /**
     * @brief 读取条目的元数据与摘要（从不返回完整结果）
     * @return 未知或已过期时为空；过期条目的两个文件会被删除
     */
    std::optional<CacheEntry> get(const std::string& cacheId);

    /**
     * @brief 列出所有未过期条目，按创建时间排序
     */
    std::vector<CacheEntry> list();

    /**
     * @brief 将完整结果复制到 destination（支持 ~ 展开，自动创建父目录，覆盖已有文件）
     * @throws CacheEntryNotFoundException 条目不存在或已过期
     * @throws OperationFailedException 复制失败
     */
    ExportResult exportEntry(const std::string& cacheId, const std::string& destination);

    /**
     * @brief 删除修改时间早于 TTL 的缓存文件（含写入中断遗留的 .tmp）
     * @return 删除的文件数
     */
    std::size_t sweepExpired();

    /**
     * @brief 删除全部缓存文件（含 .tmp 遗留文件）
     * @return 删除的文件数
     */
    std::size_t clear();

    /**
     * @brief 仅供进程内处理使用：返回结果中的 {type, coordinates, bbox}
     */
    std::optional<nlohmann::json> loadGeometry(const std::string& cacheId);

    std::filesystem::path payloadPath(const std::string& cacheId) const;
    std::filesystem::path metadataPath(const std::string& cacheId) const;

private:
    std::string generateCacheId(const std::string& toolName, const nlohmann::json& params);
    void removeEntryFiles(const std::string& cacheId);
    std::chrono::system_clock::time_point now() const { return clock_(); }

    static bool isValidCacheId(const std::string& cacheId);
    static std::string paramsDigest(const nlohmann::json& params);

    CacheConfig config_;
    Clock clock_;
    std::mutex putMutex_;
    long long lastIssuedMillis_ = 0;
};

} // namespace geobridge::core_services::result_cache
