#include "core_services/result_cache/geometry_sampler.h"
#include "core_services/geo_processing/geo_processing_exceptions.h"

#include "common_utils/utilities/exceptions.h"
#include "common_utils/utilities/filesystem_utils.h"
#include "common_utils/utilities/logging_utils.h"

#include <cmath>

namespace geobridge::core_services::result_cache {

using nlohmann::json;

namespace {

constexpr const char* kModule = "GeometrySampler";

json pick(const json& points, const std::vector<std::size_t>& indices) {
    json out = json::array();
    for (auto index : indices) {
        out.push_back(points[index]);
    }
    return out;
}

// 对一组点做采样，结果写入 sample
json samplePoints(const json& points, std::size_t maxPoints, SampledGeometry& sample) {
    sample.totalPoints = points.size();
    if (points.size() <= maxPoints) {
        sample.sampled = false;
        return points;
    }
    sample.sampled = true;
    sample.samplingRatio = std::to_string(maxPoints) + "/" + std::to_string(points.size());
    return pick(points, GeometrySampler::sampleIndices(points.size(), maxPoints));
}

} // anonymous namespace

std::vector<std::size_t> GeometrySampler::sampleIndices(std::size_t total, std::size_t maxPoints) {
    std::vector<std::size_t> indices;
    if (total == 0) {
        return indices;
    }
    if (total <= maxPoints) {
        for (std::size_t i = 0; i < total; ++i) {
            indices.push_back(i);
        }
        return indices;
    }
    const double step = static_cast<double>(total) / static_cast<double>(maxPoints);
    for (std::size_t i = 0; i + 1 < maxPoints; ++i) {
        indices.push_back(static_cast<std::size_t>(std::floor(static_cast<double>(i) * step)));
    }
    indices.push_back(total - 1);
    return indices;
}

std::size_t GeometrySampler::countPositions(const json& coordinates) {
    if (!coordinates.is_array() || coordinates.empty()) {
        return 0;
    }
    if (coordinates.front().is_number()) {
        return 1;
    }
    std::size_t count = 0;
    for (const auto& child : coordinates) {
        count += countPositions(child);
    }
    return count;
}

std::optional<SampledGeometry> GeometrySampler::sample(const std::string& cacheId, std::size_t maxPoints) const {
    if (maxPoints < 2) {
        GEOBRIDGE_THROW(geo_processing::InvalidParameterException, "max_points", "must be at least 2");
    }

    auto entry = cache_.get(cacheId);
    if (!entry) {
        return std::nullopt;
    }
    const auto text = common_utils::FilesystemUtils::readFileToString(cache_.payloadPath(cacheId));
    if (!text) {
        return std::nullopt;
    }

    // 只保留 geometry 与 bbox 两个顶层成员
    json::parser_callback_t keepGeometry = [](int depth, json::parse_event_t event, json& parsed) {
        if (depth == 1 && event == json::parse_event_t::key) {
            return parsed == "geometry" || parsed == "bbox";
        }
        return true;
    };

    json document;
    try {
        document = json::parse(*text, keepGeometry);
    } catch (const json::exception& e) {
        GEOBRIDGE_THROW(geo_processing::OperationFailedException, "sample",
                        "corrupt payload for " + cacheId + ": " + e.what());
    }

    if (!document.is_object() || !document.contains("geometry") || !document["geometry"].is_object()) {
        return std::nullopt;
    }
    const json& geometry = document["geometry"];
    const json coords = geometry.value("coordinates", json::array());

    SampledGeometry sample;
    sample.cacheId = cacheId;
    sample.toolName = entry->toolName;
    sample.geometryType = geometry.value("type", std::string());

    if (sample.geometryType == "LineString") {
        sample.coordinates = samplePoints(coords, maxPoints, sample);
    } else if (sample.geometryType == "Polygon") {
        const json ring = coords.is_array() && !coords.empty() ? coords.front() : json::array();
        sample.coordinates = json::array({samplePoints(ring, maxPoints, sample)});
    } else if (sample.geometryType == "MultiPolygon") {
        std::size_t rings = 0;
        for (const auto& polygon : coords) {
            rings += polygon.is_array() ? polygon.size() : 0;
        }
        sample.totalPoints = countPositions(coords);
        sample.polygonsCount = coords.is_array() ? coords.size() : 0;
        sample.ringsCount = rings;
        sample.message = "MultiPolygon is not sampled; export the entry to get the full geometry";
    } else {
        sample.totalPoints = countPositions(coords);
        sample.message = "Sampling is only available for LineString and Polygon geometries; "
                         "export the entry to get the full geometry";
    }

    if (document.contains("bbox")) {
        sample.bbox = document["bbox"];
    }

    GEOBRIDGE_LOG_DEBUG(kModule, "Sampled {} ({} of {} points)", cacheId,
                        sample.coordinates.is_array() ? countPositions(sample.coordinates) : 0,
                        sample.totalPoints);
    return sample;
}

} // namespace geobridge::core_services::result_cache
