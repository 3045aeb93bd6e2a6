#pragma once

#include "core_services/exceptions.h"

#include <string>

namespace geobridge::core_services::geo_processing {

/**
 * @class GeoProcessingException
 * @brief Base exception class for geodata processing and the result cache
 *
 * Every subclass carries a stable string error code that callers map into
 * their own error envelopes.
 */
class GeoProcessingException : public ServiceException {
public:
    explicit GeoProcessingException(const std::string& message)
        : ServiceException(message), errorCode_("GEO_PROCESSING_ERROR") {}

    GeoProcessingException(const std::string& message, const std::string& errorCode)
        : ServiceException(message), errorCode_(errorCode) {}

    const std::string& getErrorCode() const noexcept { return errorCode_; }

private:
    std::string errorCode_;
};

/**
 * @class UnsupportedFormatException
 * @brief Format string outside geojson/json/kml/gpkg/shapefile
 */
class UnsupportedFormatException : public GeoProcessingException {
public:
    explicit UnsupportedFormatException(const std::string& format)
        : GeoProcessingException("Unsupported format '" + format +
                                 "'. Accepted formats: geojson, gpkg, json, kml, shapefile",
                                 "UNSUPPORTED_FORMAT") {}
};

/**
 * @class MissingParameterException
 */
class MissingParameterException : public GeoProcessingException {
public:
    explicit MissingParameterException(const std::string& parameterName)
        : GeoProcessingException("Parameter '" + parameterName + "' is required", "MISSING_PARAMETER") {}
};

/**
 * @class EmptyResultException
 * @brief Input decodes to zero usable rows, or an operation produced none
 */
class EmptyResultException : public GeoProcessingException {
public:
    explicit EmptyResultException(const std::string& message)
        : GeoProcessingException(message, "EMPTY_RESULT") {}
};

/**
 * @class IncompatibleCrsException
 */
class IncompatibleCrsException : public GeoProcessingException {
public:
    explicit IncompatibleCrsException(const std::string& message)
        : GeoProcessingException(message, "INCOMPATIBLE_CRS") {}

protected:
    IncompatibleCrsException(const std::string& message, const std::string& errorCode)
        : GeoProcessingException(message, errorCode) {}
};

/**
 * @class MissingCrsException
 * @brief No working CRS can be determined for a single-input operation
 */
class MissingCrsException : public IncompatibleCrsException {
public:
    explicit MissingCrsException(const std::string& message)
        : IncompatibleCrsException(message, "MISSING_CRS") {}
};

/**
 * @class InvalidStyleParameterException
 */
class InvalidStyleParameterException : public GeoProcessingException {
public:
    InvalidStyleParameterException(const std::string& parameterName,
                                   const std::string& value,
                                   const std::string& accepted)
        : GeoProcessingException("Invalid " + parameterName + " '" + value +
                                 "', expected one of: " + accepted,
                                 "INVALID_STYLE_PARAMETER") {}
};

/**
 * @class InvalidParameterException
 */
class InvalidParameterException : public GeoProcessingException {
public:
    explicit InvalidParameterException(const std::string& message)
        : GeoProcessingException(message, "INVALID_PARAMETER") {}

    InvalidParameterException(const std::string& parameterName, const std::string& reason)
        : GeoProcessingException("Invalid parameter '" + parameterName + "': " + reason, "INVALID_PARAMETER") {}
};

/**
 * @class OperationFailedException
 * @brief Geometry kernel, driver or I/O failure during an operation
 */
class OperationFailedException : public GeoProcessingException {
public:
    explicit OperationFailedException(const std::string& message)
        : GeoProcessingException(message, "PROCESSING_FAILED") {}

    OperationFailedException(const std::string& operationName, const std::string& reason)
        : GeoProcessingException("Operation '" + operationName + "' failed: " + reason, "PROCESSING_FAILED") {}
};

/**
 * @class CacheEntryNotFoundException
 */
class CacheEntryNotFoundException : public GeoProcessingException {
public:
    explicit CacheEntryNotFoundException(const std::string& cacheId)
        : GeoProcessingException("Cache entry '" + cacheId + "' not found or expired", "NOT_FOUND") {}
};

} // namespace geobridge::core_services::geo_processing
