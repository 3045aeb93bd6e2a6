#include "core_services/result_cache/result_cache_types.h"
#include "core_services/geo_processing/geo_processing_exceptions.h"
#include "common_utils/time/time_utils.h"
#include "common_utils/utilities/exceptions.h"

#include <cmath>
#include <map>

namespace geobridge::core_services::result_cache {

using common_utils::time::TimeUtils;

namespace {

const std::map<std::string, OperationKind>& toolKinds() {
    static const std::map<std::string, OperationKind> kinds = {
        {"calculate_route", OperationKind::ROUTE},
        {"calculate_isochrone", OperationKind::ISOCHRONE},
        {"get_wfs_features", OperationKind::FEATURE_COLLECTION},
        {"get_elevation_line", OperationKind::ELEVATION_PROFILE}};
    return kinds;
}

std::chrono::system_clock::time_point parseTimestamp(const nlohmann::json& j, const char* key) {
    const auto text = j.at(key).get<std::string>();
    auto parsed = TimeUtils::parseIsoString(text);
    if (!parsed) {
        GEOBRIDGE_THROW(geo_processing::OperationFailedException, "cache metadata",
                        std::string("malformed timestamp '") + text + "' in " + key);
    }
    return *parsed;
}

double roundKb(std::uintmax_t bytes) {
    return std::round(static_cast<double>(bytes) / 1024.0 * 100.0) / 100.0;
}

} // anonymous namespace

OperationKind operationKindFromToolName(const std::string& toolName) {
    const auto& kinds = toolKinds();
    auto it = kinds.find(toolName);
    return it == kinds.end() ? OperationKind::GENERIC : it->second;
}

std::string toString(OperationKind kind) {
    switch (kind) {
        case OperationKind::ROUTE: return "route";
        case OperationKind::ISOCHRONE: return "isochrone";
        case OperationKind::FEATURE_COLLECTION: return "feature_collection";
        case OperationKind::ELEVATION_PROFILE: return "elevation_profile";
        case OperationKind::GENERIC: return "generic";
    }
    return "generic";
}

void to_json(nlohmann::json& j, const CacheEntry& entry) {
    j = nlohmann::json{
        {"cache_id", entry.cacheId},
        {"tool_name", entry.toolName},
        {"params", entry.params},
        {"created_at", TimeUtils::toIsoString(entry.createdAt)},
        {"expires_at", TimeUtils::toIsoString(entry.expiresAt)},
        {"file_path", entry.filePath.string()},
        {"file_size_bytes", entry.fileSizeBytes},
        {"file_size_kb", roundKb(entry.fileSizeBytes)},
        {"summary", entry.summary}
    };
}

void from_json(const nlohmann::json& j, CacheEntry& entry) {
    entry.cacheId = j.at("cache_id").get<std::string>();
    entry.toolName = j.at("tool_name").get<std::string>();
    entry.params = j.value("params", nlohmann::json::object());
    entry.createdAt = parseTimestamp(j, "created_at");
    entry.expiresAt = parseTimestamp(j, "expires_at");
    entry.filePath = j.at("file_path").get<std::string>();
    entry.fileSizeBytes = j.value("file_size_bytes", std::uintmax_t{0});
    entry.summary = j.value("summary", nlohmann::json::object());
}

void to_json(nlohmann::json& j, const CachePutResult& result) {
    j = nlohmann::json{
        {"cached", result.cached},
        {"cache_id", result.cacheId},
        {"file_path", result.filePath.string()},
        {"file_size_kb", result.fileSizeKb},
        {"expires_at", TimeUtils::toIsoString(result.expiresAt)},
        {"summary", result.summary},
        {"usage", result.usage}
    };
}

void to_json(nlohmann::json& j, const ExportResult& result) {
    j = nlohmann::json{
        {"success", result.success},
        {"cache_id", result.cacheId},
        {"output_path", result.outputPath.string()},
        {"file_size_bytes", result.fileSizeBytes},
        {"message", result.message}
    };
}

void to_json(nlohmann::json& j, const SampledGeometry& sample) {
    j = nlohmann::json{
        {"cache_id", sample.cacheId},
        {"tool_name", sample.toolName},
        {"geometry_type", sample.geometryType},
        {"total_points", sample.totalPoints}
    };
    if (!sample.message) {
        j["coordinates"] = sample.coordinates;
        j["sampled"] = sample.sampled;
    }
    if (sample.samplingRatio) j["sampling_ratio"] = *sample.samplingRatio;
    if (sample.polygonsCount) j["polygons_count"] = *sample.polygonsCount;
    if (sample.ringsCount) j["rings_count"] = *sample.ringsCount;
    if (sample.message) j["message"] = *sample.message;
    if (sample.bbox) j["bbox"] = *sample.bbox;
}

} // namespace geobridge::core_services::result_cache
