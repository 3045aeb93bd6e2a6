#pragma once

#include "core_services/common_data_types.h"

#include <map>
#include <optional>
#include <string>

namespace geobridge::core_services::geo_processing {

/**
 * @enum BufferCapStyle
 * @brief Buffer end-cap styles, values match the GEOS codes.
 */
enum class BufferCapStyle {
    ROUND = 1,
    FLAT = 2,
    SQUARE = 3
};

/**
 * @enum BufferJoinStyle
 * @brief Buffer corner styles, values match the GEOS codes.
 */
enum class BufferJoinStyle {
    ROUND = 1,
    MITRE = 2,
    BEVEL = 3
};

/**
 * @struct BufferOptions
 * @brief Resolved options handed to the geometry kernel.
 */
struct BufferOptions {
    int quadrantSegments = 16;
    BufferCapStyle capStyle = BufferCapStyle::ROUND;
    BufferJoinStyle joinStyle = BufferJoinStyle::ROUND;
    double mitreLimit = 5.0;
    bool singleSided = false;
};

// --- Operation requests ---
// Formats and CRS identifiers stay as caller-supplied strings; they are
// validated by the operation engine before any decoding happens.

struct ReprojectRequest {
    std::string data;
    std::string inputFormat;
    std::optional<std::string> targetCrs;
    std::optional<std::string> sourceCrs;
    std::optional<std::string> outputFormat;
};

struct BufferRequest {
    std::string data;
    std::string inputFormat;
    std::optional<double> distance;
    std::optional<std::string> sourceCrs;
    std::optional<std::string> bufferCrs;
    std::optional<std::string> outputCrs;
    std::optional<std::string> outputFormat;
    std::optional<std::string> capStyle;
    std::optional<std::string> joinStyle;
    std::optional<double> mitreLimit;
    std::optional<bool> singleSided;
    std::optional<int> resolution;  ///< quadrant segments, defaults to the configured resolution
};

struct IntersectRequest {
    std::string dataA;
    std::string inputFormatA;
    std::string dataB;
    std::string inputFormatB;
    std::optional<std::string> sourceCrsA;
    std::optional<std::string> sourceCrsB;
    std::optional<std::string> targetCrs;
    std::optional<std::string> outputFormat;
};

struct ClipRequest {
    std::string data;
    std::string inputFormat;
    std::string clipData;
    std::string clipFormat;
    std::optional<std::string> sourceCrs;
    std::optional<std::string> clipSourceCrs;
    std::optional<std::string> targetCrs;
    std::optional<std::string> outputFormat;
};

struct ConvertRequest {
    std::string data;
    std::string inputFormat;
    std::string outputFormat;
    std::optional<std::string> sourceCrs;
};

struct BboxRequest {
    std::string data;
    std::string inputFormat;
    std::optional<std::string> sourceCrs;
    std::optional<std::string> targetCrs;
};

struct DissolveRequest {
    std::string data;
    std::string inputFormat;
    std::optional<std::string> by;
    std::map<std::string, std::string> aggregations;  ///< column -> first|last|sum|mean|min|max|count
    std::optional<std::string> sourceCrs;
    std::optional<std::string> targetCrs;
    std::optional<std::string> outputFormat;
};

struct ExplodeRequest {
    std::string data;
    std::string inputFormat;
    std::optional<std::string> sourceCrs;
    bool keepIndex = false;
    std::optional<std::string> outputFormat;
};

} // namespace geobridge::core_services::geo_processing
