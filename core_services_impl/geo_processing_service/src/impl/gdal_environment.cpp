#include "gdal_environment.h"

#include <cpl_conv.h>
#include <cpl_error.h>
#include <gdal_priv.h>

#include <mutex>

#include "common_utils/utilities/logging_utils.h"
#include "common_utils/utilities/string_utils.h"
#include "core_services/geo_processing/geo_processing_exceptions.h"

namespace geobridge::core_services::geo_processing::impl {

namespace {

std::once_flag g_initOnce;

void CPL_STDCALL forwardToLog(CPLErr errorClass, CPLErrorNum errorNum, const char* message) {
    const char* text = message ? message : "";
    switch (errorClass) {
        case CE_Debug:
            GEOBRIDGE_LOG_TRACE("GDAL", "{}", text);
            break;
        case CE_Warning:
            GEOBRIDGE_LOG_WARN("GDAL", "[{}] {}", errorNum, text);
            break;
        case CE_Failure:
        case CE_Fatal:
            // 失败也会以异常形式上报，这里只记 debug 避免重复
            GEOBRIDGE_LOG_DEBUG("GDAL", "[{}] {}", errorNum, text);
            break;
        default:
            break;
    }
}

void initializeOnce() {
    std::call_once(g_initOnce, []() {
        CPLSetErrorHandler(forwardToLog);
        // 输入的 .shx 缺失时由 .shp 重建
        CPLSetConfigOption("SHAPE_RESTORE_SHX", "YES");
        // 不在 /vsimem/ 中生成 .aux.xml
        CPLSetConfigOption("GDAL_PAM_ENABLED", "NO");
        GDALAllRegister();
        GEOBRIDGE_LOG_DEBUG("GdalEnvironment", "GDAL {} 已注册 {} 个驱动",
                            GDALVersionInfo("RELEASE_NAME"), GDALGetDriverCount());
    });
}

} // namespace

const std::vector<std::string>& GdalEnvironment::requiredDrivers() {
    static const std::vector<std::string> kDrivers = {"GeoJSON", "LIBKML", "GPKG", "ESRI Shapefile"};
    return kDrivers;
}

std::vector<std::string> GdalEnvironment::missingDrivers() {
    initializeOnce();
    std::vector<std::string> missing;
    for (const auto& name : requiredDrivers()) {
        if (!GetGDALDriverManager()->GetDriverByName(name.c_str())) {
            missing.push_back(name);
        }
    }
    return missing;
}

bool GdalEnvironment::available() {
    return missingDrivers().empty();
}

void GdalEnvironment::require() {
    const auto missing = missingDrivers();
    if (!missing.empty()) {
        GEOBRIDGE_THROW(OperationFailedException, "gdal",
                        "missing OGR drivers: " + common_utils::StringUtils::join(missing, ", "));
    }
}

std::string GdalEnvironment::lastError() {
    const char* message = CPLGetLastErrorMsg();
    if (!message || *message == '\0') {
        return "unknown GDAL error";
    }
    return message;
}

} // namespace geobridge::core_services::geo_processing::impl
