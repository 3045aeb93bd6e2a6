#include "core_services/result_cache/result_cache.h"
#include "core_services/geo_processing/geo_processing_exceptions.h"
#include "summary_extractors.h"

#include "common_utils/time/time_utils.h"
#include "common_utils/utilities/exceptions.h"
#include "common_utils/utilities/filesystem_utils.h"
#include "common_utils/utilities/logging_utils.h"

#include <boost/uuid/name_generator_sha1.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <cmath>
#include <system_error>
#include <utility>
#include <vector>

namespace geobridge::core_services::result_cache {

namespace fs = std::filesystem;
using common_utils::FilesystemUtils;
using common_utils::time::TimeUtils;
using geo_processing::CacheEntryNotFoundException;
using geo_processing::GeoProcessingException;
using geo_processing::OperationFailedException;

namespace {

constexpr const char* kModule = "ResultCache";
constexpr const char* kPayloadSuffix = ".json";
constexpr const char* kMetadataSuffix = "_meta.json";
// writeStringToFileAtomic 中断时留下的 {name}.{uuid}.tmp
constexpr const char* kTempSuffix = ".tmp";

// file_time_type 的时钟与 system_clock 不保证相同，按当前偏移换算
std::chrono::system_clock::time_point toSystemTime(fs::file_time_type fileTime) {
    const auto offset = fileTime - fs::file_time_type::clock::now();
    return std::chrono::system_clock::now() +
           std::chrono::duration_cast<std::chrono::system_clock::duration>(offset);
}

std::vector<fs::path> cacheFiles(const fs::path& root) {
    auto files = FilesystemUtils::listFiles(root, kPayloadSuffix);
    auto leftovers = FilesystemUtils::listFiles(root, kTempSuffix);
    files.insert(files.end(), leftovers.begin(), leftovers.end());
    return files;
}

double toKilobytes(std::uintmax_t bytes) {
    return std::round(static_cast<double>(bytes) / 1024.0 * 100.0) / 100.0;
}

} // anonymous namespace

ResultCache::ResultCache(CacheConfig config, Clock clock)
    : config_(std::move(config)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
    if (config_.rootDirectory.empty() || !FilesystemUtils::ensureDirectoryExists(config_.rootDirectory)) {
        GEOBRIDGE_THROW(OperationFailedException, "cache",
                        "cannot create cache directory '" + config_.rootDirectory.string() + "'");
    }
    GEOBRIDGE_LOG_DEBUG(kModule, "Cache root {}, ttl {}s", config_.rootDirectory.string(), config_.ttl.count());
}

fs::path ResultCache::payloadPath(const std::string& cacheId) const {
    return config_.rootDirectory / (cacheId + kPayloadSuffix);
}

fs::path ResultCache::metadataPath(const std::string& cacheId) const {
    return config_.rootDirectory / (cacheId + kMetadataSuffix);
}

bool ResultCache::isValidCacheId(const std::string& cacheId) {
    if (cacheId.empty() || cacheId == "." || cacheId == "..") {
        return false;
    }
    return cacheId.find_first_of("/\\") == std::string::npos;
}

bool ResultCache::shouldCache(const nlohmann::json& result, const std::string& toolName) const {
    switch (operationKindFromToolName(toolName)) {
        case OperationKind::ROUTE:
        case OperationKind::ISOCHRONE:
        case OperationKind::ELEVATION_PROFILE:
            return true;
        default:
            break;
    }

    if (result.is_object()) {
        auto features = result.find("features");
        if (features != result.end() && features->is_array() && features->size() > config_.featureCountLimit) {
            return true;
        }
    }
    return result.dump().size() > config_.inlineSizeLimitBytes;
}

std::string ResultCache::paramsDigest(const nlohmann::json& params) {
    // nlohmann::json 对象按键排序输出，dump() 即规范形式
    static const boost::uuids::uuid kNamespace =
        boost::uuids::string_generator()("6ba7b811-9dad-11d1-80b4-00c04fd430c8");
    boost::uuids::name_generator_sha1 generator(kNamespace);
    const std::string text = boost::uuids::to_string(generator(params.dump()));
    return text.substr(0, 8);
}

std::string ResultCache::generateCacheId(const std::string& toolName, const nlohmann::json& params) {
    const std::string digest = paramsDigest(params);
    long long millis = std::max(TimeUtils::toEpochMillis(now()), lastIssuedMillis_ + 1);

    std::string cacheId;
    for (;;) {
        cacheId = toolName + "_" + std::to_string(millis) + "_" + digest;
        std::error_code ec;
        if (!fs::exists(payloadPath(cacheId), ec) && !fs::exists(metadataPath(cacheId), ec)) {
            break;
        }
        ++millis;
    }
    lastIssuedMillis_ = millis;
    return cacheId;
}

CachePutResult ResultCache::put(const nlohmann::json& result,
                                const std::string& toolName,
                                const nlohmann::json& params) {
    if (toolName.empty() || !isValidCacheId(toolName)) {
        GEOBRIDGE_THROW(geo_processing::InvalidParameterException, "tool_name",
                        "must be non-empty and free of path separators");
    }

    sweepExpired();

    std::lock_guard<std::mutex> lock(putMutex_);
    const std::string cacheId = generateCacheId(toolName, params);
    const fs::path dataFile = payloadPath(cacheId);

    if (!FilesystemUtils::writeStringToFileAtomic(dataFile, result.dump(2))) {
        GEOBRIDGE_THROW(OperationFailedException, "cache", "failed to write " + dataFile.string());
    }

    CacheEntry entry;
    entry.cacheId = cacheId;
    entry.toolName = toolName;
    entry.params = params;
    entry.createdAt = now();
    entry.expiresAt = entry.createdAt + config_.ttl;
    entry.filePath = dataFile;
    entry.fileSizeBytes = FilesystemUtils::getFileSize(dataFile).value_or(0);
    entry.summary = summary::extract(operationKindFromToolName(toolName), result, params);

    const nlohmann::json metadata = entry;
    if (!FilesystemUtils::writeStringToFileAtomic(metadataPath(cacheId), metadata.dump(2))) {
        FilesystemUtils::removeFile(dataFile);
        GEOBRIDGE_THROW(OperationFailedException, "cache", "failed to write metadata for " + cacheId);
    }

    GEOBRIDGE_LOG_INFO(kModule, "Cached {} ({} bytes)", cacheId, entry.fileSizeBytes);

    CachePutResult out;
    out.cacheId = cacheId;
    out.filePath = dataFile;
    out.fileSizeKb = toKilobytes(entry.fileSizeBytes);
    out.expiresAt = entry.expiresAt;
    out.summary = entry.summary;
    out.usage = "Reuse this result with cache_id='" + cacheId +
                "' (cache-get for metadata, cache-sample for a geometry preview, cache-export for the full file)";
    return out;
}

std::optional<CacheEntry> ResultCache::get(const std::string& cacheId) {
    if (!isValidCacheId(cacheId)) {
        return std::nullopt;
    }
    const auto text = FilesystemUtils::readFileToString(metadataPath(cacheId));
    if (!text) {
        return std::nullopt;
    }

    CacheEntry entry;
    try {
        entry = nlohmann::json::parse(*text).get<CacheEntry>();
    } catch (const nlohmann::json::exception& e) {
        GEOBRIDGE_LOG_WARN(kModule, "Unreadable metadata for {}: {}", cacheId, e.what());
        return std::nullopt;
    } catch (const GeoProcessingException& e) {
        GEOBRIDGE_LOG_WARN(kModule, "Unreadable metadata for {}: {}", cacheId, e.what());
        return std::nullopt;
    }

    if (now() > entry.expiresAt) {
        GEOBRIDGE_LOG_DEBUG(kModule, "Entry {} expired, removing", cacheId);
        removeEntryFiles(cacheId);
        return std::nullopt;
    }
    return entry;
}

std::vector<CacheEntry> ResultCache::list() {
    std::vector<CacheEntry> entries;
    const auto current = now();
    for (const auto& path : FilesystemUtils::listFiles(config_.rootDirectory, kMetadataSuffix)) {
        const auto text = FilesystemUtils::readFileToString(path);
        if (!text) {
            continue;
        }
        try {
            auto entry = nlohmann::json::parse(*text).get<CacheEntry>();
            if (current > entry.expiresAt) {
                continue;
            }
            entries.push_back(std::move(entry));
        } catch (const nlohmann::json::exception& e) {
            GEOBRIDGE_LOG_DEBUG(kModule, "Skipping unreadable metadata {}: {}", path.string(), e.what());
        } catch (const GeoProcessingException& e) {
            GEOBRIDGE_LOG_DEBUG(kModule, "Skipping unreadable metadata {}: {}", path.string(), e.what());
        }
    }
    std::sort(entries.begin(), entries.end(), [](const CacheEntry& a, const CacheEntry& b) {
        return a.createdAt != b.createdAt ? a.createdAt < b.createdAt : a.cacheId < b.cacheId;
    });
    return entries;
}

ExportResult ResultCache::exportEntry(const std::string& cacheId, const std::string& destination) {
    auto entry = get(cacheId);
    const fs::path source = payloadPath(cacheId);
    std::error_code ec;
    if (!entry || !fs::exists(source, ec)) {
        GEOBRIDGE_THROW(CacheEntryNotFoundException, cacheId);
    }

    fs::path target = FilesystemUtils::expandUser(destination);
    target = fs::absolute(target, ec);
    if (ec) {
        GEOBRIDGE_THROW(OperationFailedException, "export", "cannot resolve '" + destination + "'");
    }
    if (!FilesystemUtils::copyFile(source, target)) {
        GEOBRIDGE_THROW(OperationFailedException, "export", "failed to copy " + cacheId + " to " + target.string());
    }

    ExportResult result;
    result.success = true;
    result.cacheId = cacheId;
    result.outputPath = target;
    result.fileSizeBytes = FilesystemUtils::getFileSize(target).value_or(0);
    result.message = "Exported to " + target.string();
    GEOBRIDGE_LOG_INFO(kModule, "{}", result.message);
    return result;
}

std::size_t ResultCache::sweepExpired() {
    const auto cutoff = now() - config_.ttl;
    std::size_t removed = 0;
    for (const auto& path : cacheFiles(config_.rootDirectory)) {
        auto modified = FilesystemUtils::getLastModifiedTime(path);
        if (!modified || toSystemTime(*modified) >= cutoff) {
            continue;
        }
        std::error_code ec;
        if (fs::remove(path, ec)) {
            ++removed;
        } else if (ec) {
            // 另一个清理者可能已经删除
            GEOBRIDGE_LOG_DEBUG(kModule, "Could not remove {}: {}", path.string(), ec.message());
        }
    }
    if (removed > 0) {
        GEOBRIDGE_LOG_INFO(kModule, "Swept {} expired cache files", removed);
    }
    return removed;
}

std::size_t ResultCache::clear() {
    std::size_t removed = 0;
    for (const auto& path : cacheFiles(config_.rootDirectory)) {
        std::error_code ec;
        if (fs::remove(path, ec)) {
            ++removed;
        } else if (ec) {
            GEOBRIDGE_LOG_WARN(kModule, "Could not remove {}: {}", path.string(), ec.message());
        }
    }
    GEOBRIDGE_LOG_INFO(kModule, "Cleared {} cache files", removed);
    return removed;
}

std::optional<nlohmann::json> ResultCache::loadGeometry(const std::string& cacheId) {
    if (!get(cacheId)) {
        return std::nullopt;
    }
    const auto text = FilesystemUtils::readFileToString(payloadPath(cacheId));
    if (!text) {
        return std::nullopt;
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(*text);
    } catch (const nlohmann::json::exception& e) {
        GEOBRIDGE_THROW(OperationFailedException, "cache", "corrupt payload for " + cacheId + ": " + e.what());
    }
    if (!document.is_object() || !document.contains("geometry") || !document["geometry"].is_object()) {
        return std::nullopt;
    }
    const auto& geometry = document["geometry"];
    return nlohmann::json{
        {"type", geometry.value("type", nlohmann::json(nullptr))},
        {"coordinates", geometry.value("coordinates", nlohmann::json(nullptr))},
        {"bbox", document.value("bbox", nlohmann::json(nullptr))}
    };
}

void ResultCache::removeEntryFiles(const std::string& cacheId) {
    std::error_code ec;
    fs::remove(payloadPath(cacheId), ec);
    if (ec) {
        GEOBRIDGE_LOG_DEBUG(kModule, "Could not remove payload of {}: {}", cacheId, ec.message());
    }
    fs::remove(metadataPath(cacheId), ec);
    if (ec) {
        GEOBRIDGE_LOG_DEBUG(kModule, "Could not remove metadata of {}: {}", cacheId, ec.message());
    }
}

} // namespace geobridge::core_services::result_cache
