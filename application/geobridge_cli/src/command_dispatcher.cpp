#include "app/command_dispatcher.h"

#include "core_services/geo_processing/geo_processing_exceptions.h"
#include "core_services/result_cache/geometry_sampler.h"
#include "common_utils/utilities/exceptions.h"
#include "common_utils/utilities/filesystem_utils.h"
#include "common_utils/utilities/logging_utils.h"
#include "common_utils/utilities/string_utils.h"

#include <stdexcept>

namespace geobridge::application {

using namespace core_services;
using namespace core_services::geo_processing;
using core_services::result_cache::GeometrySampler;
using common_utils::FilesystemUtils;
using common_utils::StringUtils;
using nlohmann::json;

namespace {

std::optional<std::string> optionalValue(const CommandOptions& options, const std::string& name) {
    auto it = options.find(name);
    if (it == options.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string requireValue(const CommandOptions& options, const std::string& name) {
    auto value = optionalValue(options, name);
    if (!value) {
        GEOBRIDGE_THROW(MissingParameterException, name);
    }
    return *value;
}

// '@path' 从文件读取载荷
std::string payloadValue(const CommandOptions& options, const std::string& name) {
    const std::string value = requireValue(options, name);
    if (value.empty() || value[0] != '@') {
        return value;
    }
    const auto path = FilesystemUtils::expandUser(value.substr(1));
    auto content = FilesystemUtils::readFileToString(path);
    if (!content) {
        GEOBRIDGE_THROW(InvalidParameterException, name, "cannot read file '" + path.string() + "'");
    }
    return *content;
}

std::optional<double> doubleValue(const CommandOptions& options, const std::string& name) {
    auto text = optionalValue(options, name);
    if (!text) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        const double value = std::stod(*text, &consumed);
        if (consumed != text->size()) {
            GEOBRIDGE_THROW(InvalidParameterException, name, "'" + *text + "' is not a number");
        }
        return value;
    } catch (const std::invalid_argument&) {
        GEOBRIDGE_THROW(InvalidParameterException, name, "'" + *text + "' is not a number");
    } catch (const std::out_of_range&) {
        GEOBRIDGE_THROW(InvalidParameterException, name, "'" + *text + "' is out of range");
    }
}

std::optional<int> intValue(const CommandOptions& options, const std::string& name) {
    auto text = optionalValue(options, name);
    if (!text) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        const int value = std::stoi(*text, &consumed);
        if (consumed != text->size()) {
            GEOBRIDGE_THROW(InvalidParameterException, name, "'" + *text + "' is not an integer");
        }
        return value;
    } catch (const std::invalid_argument&) {
        GEOBRIDGE_THROW(InvalidParameterException, name, "'" + *text + "' is not an integer");
    } catch (const std::out_of_range&) {
        GEOBRIDGE_THROW(InvalidParameterException, name, "'" + *text + "' is out of range");
    }
}

std::optional<bool> boolValue(const CommandOptions& options, const std::string& name) {
    auto text = optionalValue(options, name);
    if (!text) {
        return std::nullopt;
    }
    const std::string lower = StringUtils::toLower(StringUtils::trim(*text));
    if (lower == "true" || lower == "1" || lower == "yes") return true;
    if (lower == "false" || lower == "0" || lower == "no") return false;
    GEOBRIDGE_THROW(InvalidParameterException, name, "'" + *text + "' is not a boolean");
}

json parseJsonOption(const CommandOptions& options, const std::string& name, const std::string& text) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        GEOBRIDGE_THROW(InvalidParameterException, name, std::string("invalid JSON: ") + e.what());
    }
}

// "value:sum,weight:mean"
std::map<std::string, std::string> aggregationSpec(const CommandOptions& options) {
    std::map<std::string, std::string> aggregations;
    auto text = optionalValue(options, "aggregate");
    if (!text) {
        return aggregations;
    }
    for (const auto& item : StringUtils::split(*text, ',')) {
        const std::string trimmed = StringUtils::trim(item);
        if (trimmed.empty()) {
            continue;
        }
        const auto colon = trimmed.find(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == trimmed.size()) {
            GEOBRIDGE_THROW(InvalidParameterException, "aggregate", "expected column:reduction, got '" + trimmed + "'");
        }
        aggregations[StringUtils::trim(trimmed.substr(0, colon))] = StringUtils::trim(trimmed.substr(colon + 1));
    }
    return aggregations;
}

} // anonymous namespace

CommandDispatcher::CommandDispatcher(std::shared_ptr<IGeoProcessingService> geoProcessing,
                                     std::shared_ptr<result_cache::ResultCache> cache)
    : m_geoProcessing(std::move(geoProcessing)), m_cache(std::move(cache)) {}

const std::vector<std::string>& CommandDispatcher::commands() {
    static const std::vector<std::string> names = {
        "reproject", "buffer", "intersect", "clip", "convert", "bbox", "dissolve", "explode",
        "cache-put", "cache-get", "cache-list", "cache-export", "cache-sample", "cache-clear"};
    return names;
}

json CommandDispatcher::errorDocument(const std::string& code, const std::string& message) {
    return {{"error", {{"code", code}, {"message", message}}}};
}

json CommandDispatcher::execute(const std::string& command, const CommandOptions& options) {
    GEOBRIDGE_LOG_DEBUG("CommandDispatcher", "Executing '{}' with {} options", command, options.size());
    if (StringUtils::startsWith(command, "cache-")) {
        return cacheCommand(command, options);
    }
    return geometryCommand(command, options);
}

json CommandDispatcher::geometryCommand(const std::string& command, const CommandOptions& options) {
    if (!m_geoProcessing) {
        GEOBRIDGE_THROW(OperationFailedException, command, "geo processing service unavailable");
    }

    if (command == "reproject") {
        ReprojectRequest request;
        request.data = payloadValue(options, "data");
        request.inputFormat = requireValue(options, "input_format");
        request.targetCrs = optionalValue(options, "target_crs");
        request.sourceCrs = optionalValue(options, "source_crs");
        request.outputFormat = optionalValue(options, "output_format");
        return m_geoProcessing->reproject(request).get();
    }
    if (command == "buffer") {
        BufferRequest request;
        request.data = payloadValue(options, "data");
        request.inputFormat = requireValue(options, "input_format");
        request.distance = doubleValue(options, "distance");
        request.sourceCrs = optionalValue(options, "source_crs");
        request.bufferCrs = optionalValue(options, "buffer_crs");
        request.outputCrs = optionalValue(options, "output_crs");
        request.outputFormat = optionalValue(options, "output_format");
        request.capStyle = optionalValue(options, "cap_style");
        request.joinStyle = optionalValue(options, "join_style");
        request.mitreLimit = doubleValue(options, "mitre_limit");
        request.singleSided = boolValue(options, "single_sided");
        request.resolution = intValue(options, "resolution");
        return m_geoProcessing->buffer(request).get();
    }
    if (command == "intersect") {
        IntersectRequest request;
        request.dataA = payloadValue(options, "data_a");
        request.inputFormatA = requireValue(options, "input_format_a");
        request.dataB = payloadValue(options, "data_b");
        request.inputFormatB = requireValue(options, "input_format_b");
        request.sourceCrsA = optionalValue(options, "source_crs_a");
        request.sourceCrsB = optionalValue(options, "source_crs_b");
        request.targetCrs = optionalValue(options, "target_crs");
        request.outputFormat = optionalValue(options, "output_format");
        return m_geoProcessing->intersect(request).get();
    }
    if (command == "clip") {
        ClipRequest request;
        request.data = payloadValue(options, "data");
        request.inputFormat = requireValue(options, "input_format");
        request.clipData = payloadValue(options, "clip_data");
        request.clipFormat = requireValue(options, "clip_format");
        request.sourceCrs = optionalValue(options, "source_crs");
        request.clipSourceCrs = optionalValue(options, "clip_source_crs");
        request.targetCrs = optionalValue(options, "target_crs");
        request.outputFormat = optionalValue(options, "output_format");
        return m_geoProcessing->clip(request).get();
    }
    if (command == "convert") {
        ConvertRequest request;
        request.data = payloadValue(options, "data");
        request.inputFormat = requireValue(options, "input_format");
        request.outputFormat = optionalValue(options, "output_format").value_or("");
        request.sourceCrs = optionalValue(options, "source_crs");
        return m_geoProcessing->convert(request).get();
    }
    if (command == "bbox") {
        BboxRequest request;
        request.data = payloadValue(options, "data");
        request.inputFormat = requireValue(options, "input_format");
        request.sourceCrs = optionalValue(options, "source_crs");
        request.targetCrs = optionalValue(options, "target_crs");
        return m_geoProcessing->bbox(request).get();
    }
    if (command == "dissolve") {
        DissolveRequest request;
        request.data = payloadValue(options, "data");
        request.inputFormat = requireValue(options, "input_format");
        request.by = optionalValue(options, "by");
        request.aggregations = aggregationSpec(options);
        request.sourceCrs = optionalValue(options, "source_crs");
        request.targetCrs = optionalValue(options, "target_crs");
        request.outputFormat = optionalValue(options, "output_format");
        return m_geoProcessing->dissolve(request).get();
    }
    if (command == "explode") {
        ExplodeRequest request;
        request.data = payloadValue(options, "data");
        request.inputFormat = requireValue(options, "input_format");
        request.sourceCrs = optionalValue(options, "source_crs");
        request.keepIndex = boolValue(options, "keep_index").value_or(false);
        request.outputFormat = optionalValue(options, "output_format");
        return m_geoProcessing->explode(request).get();
    }

    GEOBRIDGE_THROW(InvalidParameterException, "command",
                    "unknown command '" + command + "', expected one of: " + StringUtils::join(commands(), ", "));
}

json CommandDispatcher::cacheCommand(const std::string& command, const CommandOptions& options) {
    if (!m_cache) {
        GEOBRIDGE_THROW(OperationFailedException, command, "result cache unavailable");
    }

    if (command == "cache-put") {
        const std::string toolName = requireValue(options, "tool_name");
        const json result = parseJsonOption(options, "data", payloadValue(options, "data"));
        const json params = optionalValue(options, "params")
                                ? parseJsonOption(options, "params", *optionalValue(options, "params"))
                                : json::object();
        const bool force = boolValue(options, "force").value_or(false);
        if (!force && !m_cache->shouldCache(result, toolName)) {
            return {{"cached", false}, {"result", result}};
        }
        return m_cache->put(result, toolName, params);
    }
    if (command == "cache-get") {
        const std::string cacheId = requireValue(options, "cache_id");
        auto entry = m_cache->get(cacheId);
        if (!entry) {
            GEOBRIDGE_THROW(CacheEntryNotFoundException, cacheId);
        }
        return *entry;
    }
    if (command == "cache-list") {
        const auto entries = m_cache->list();
        return {{"count", entries.size()}, {"entries", entries}};
    }
    if (command == "cache-export") {
        return m_cache->exportEntry(requireValue(options, "cache_id"), requireValue(options, "output_path"));
    }
    if (command == "cache-sample") {
        const std::string cacheId = requireValue(options, "cache_id");
        const auto maxPoints = intValue(options, "max_points").value_or(
            static_cast<int>(GeometrySampler::DEFAULT_MAX_POINTS));
        if (maxPoints < 2) {
            GEOBRIDGE_THROW(InvalidParameterException, "max_points", "must be at least 2");
        }
        auto sample = GeometrySampler(*m_cache).sample(cacheId, static_cast<std::size_t>(maxPoints));
        if (!sample) {
            GEOBRIDGE_THROW(CacheEntryNotFoundException, cacheId);
        }
        return *sample;
    }
    if (command == "cache-clear") {
        return {{"removed", m_cache->clear()}};
    }

    GEOBRIDGE_THROW(InvalidParameterException, "command",
                    "unknown command '" + command + "', expected one of: " + StringUtils::join(commands(), ", "));
}

} // namespace geobridge::application
