#include "crs/crs_parser.h"

#include <proj.h>

#include <cstring>
#include <stdexcept>
#include <string>

#include "common_utils/utilities/logging_utils.h"

namespace geobridge::core_services::geo_processing::crs {

namespace {

std::optional<int> parseCode(const char* code) {
    if (!code) {
        return std::nullopt;
    }
    try {
        return std::stoi(code);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void cleanupProjLib(PJ_CONTEXT* ctx, PJ* crs, PJ_OBJ_LIST* candidates, int* confidences) {
    if (confidences) {
        proj_int_list_destroy(confidences);
    }
    if (candidates) {
        proj_list_destroy(candidates);
    }
    if (crs) {
        proj_destroy(crs);
    }
    if (ctx) {
        proj_context_destroy(ctx);
    }
}

} // anonymous namespace

std::optional<int> CrsParser::identifyEpsg(const std::string& definition) {
    if (definition.empty()) {
        return std::nullopt;
    }

    PJ_CONTEXT* ctx = proj_context_create();
    if (!ctx) {
        GEOBRIDGE_LOG_WARN("CrsParser", "proj_context_create failed");
        return std::nullopt;
    }

    PJ* crs = proj_create(ctx, definition.c_str());
    if (!crs) {
        cleanupProjLib(ctx, nullptr, nullptr, nullptr);
        return std::nullopt;
    }

    // Definitions that already carry an EPSG identifier need no lookup.
    const char* authName = proj_get_id_auth_name(crs, 0);
    if (authName && std::strcmp(authName, "EPSG") == 0) {
        auto code = parseCode(proj_get_id_code(crs, 0));
        cleanupProjLib(ctx, crs, nullptr, nullptr);
        return code;
    }

    int* confidences = nullptr;
    PJ_OBJ_LIST* candidates = proj_identify(ctx, crs, "EPSG", nullptr, &confidences);
    std::optional<int> result;
    if (candidates) {
        const int count = proj_list_get_count(candidates);
        for (int i = 0; i < count && !result; ++i) {
            if (confidences[i] < MIN_IDENTIFY_CONFIDENCE) {
                continue;
            }
            PJ* candidate = proj_list_get(ctx, candidates, i);
            if (candidate) {
                result = parseCode(proj_get_id_code(candidate, 0));
                proj_destroy(candidate);
            }
        }
    }

    cleanupProjLib(ctx, crs, candidates, confidences);
    return result;
}

} // namespace geobridge::core_services::geo_processing::crs
