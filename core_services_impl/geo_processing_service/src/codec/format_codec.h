#pragma once

#include "core_services/common_data_types.h"
#include "engine/feature_table.h"

#include <optional>
#include <string>

namespace geobridge::core_services::geo_processing::codec {

/**
 * @class FormatCodec
 * @brief Converts between exchange envelopes and in-memory feature tables.
 *
 * GeoJSON and KML travel as UTF-8 text, GeoPackage and zipped Shapefile as
 * base64. Every call stages its files in a private /vsimem/ directory.
 */
class FormatCodec {
public:
    /**
     * @brief Case-insensitive format name lookup; "json" is an alias of "geojson".
     * @throws UnsupportedFormatException for any other name
     */
    static GeodataFormat parseFormat(const std::string& format);

    /**
     * @brief Output format of an operation, geojson when not given.
     */
    static GeodataFormat parseOutputFormat(const std::optional<std::string>& format);

    /**
     * @brief Decodes a payload into a feature table.
     *
     * Only the first layer is read and rows without geometry are dropped.
     * @param sourceCrs when given, replaces any CRS embedded in the payload
     * @throws UnsupportedFormatException, InvalidParameterException (bad base64
     *         or unreadable payload), EmptyResultException (no usable rows)
     */
    static engine::FeatureTable load(const std::string& data,
                                     const std::string& format,
                                     const std::optional<std::string>& sourceCrs = std::nullopt);

    /**
     * @brief Encodes a feature table. KML output is always written in EPSG:4326.
     * @throws EmptyResultException when no row with geometry remains
     */
    static GeodataEnvelope dump(engine::FeatureTable table, GeodataFormat format = GeodataFormat::GEOJSON);

    /**
     * @brief "EPSG:<code>", WKT, or std::nullopt when the table has no CRS.
     */
    static std::optional<std::string> crsIdentifier(const engine::FeatureTable& table);

    static std::string encodeBase64(const std::string& bytes);

    /**
     * @throws InvalidParameterException when @p text is not valid base64
     */
    static std::string decodeBase64(const std::string& text);
};

} // namespace geobridge::core_services::geo_processing::codec
