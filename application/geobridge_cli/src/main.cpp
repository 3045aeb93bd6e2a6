/**
 * @file main.cpp
 * @brief GeoBridge 命令行入口
 *
 * geobridge_cli [--config file] [--key=value ...] <command> [--option value ...]
 *
 * --key=value 形式覆盖配置项（如 --cache.ttl_hours=2），--option value 形式为子命令选项。
 * 输出为 stdout 上的单个 JSON 文档；失败时输出 {"error": {...}} 并以 1 退出。
 */

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "app/command_dispatcher.h"
#include "app/geobridge_config_factory.h"
#include "common_utils/utilities/app_config_loader.h"
#include "common_utils/utilities/exceptions.h"
#include "common_utils/utilities/logging_utils.h"
#include "common_utils/utilities/string_utils.h"
#include "core_services/exceptions.h"
#include "core_services/geo_processing/geo_processing_exceptions.h"
#include "core_services/geo_processing/geo_processing_service_factory.h"
#include "core_services/result_cache/result_cache.h"

using namespace geobridge;
using geobridge::application::CommandDispatcher;
using geobridge::application::CommandOptions;
using geobridge::application::GeoBridgeConfigFactory;

namespace {

struct CommandLine {
    std::optional<std::string> configFile;
    std::vector<std::string> configOverrides;
    std::string command;
    CommandOptions options;
    bool help = false;
};

void printUsage(std::ostream& out) {
    out << "Usage: geobridge_cli [--config file] [--key=value ...] <command> [--option value ...]\n\n"
        << "Commands: " << common_utils::StringUtils::join(CommandDispatcher::commands(), " ") << "\n\n"
        << "Data options (data, data_a, data_b, clip_data) accept @path to read the payload from a file.\n"
        << "Configuration keys: logging.level, logging.file, processing.worker_threads,\n"
        << "  processing.default_resolution, cache.root_dir, cache.ttl_hours,\n"
        << "  cache.inline_size_limit_bytes, cache.feature_count_limit\n";
}

CommandLine parseArguments(const std::vector<std::string>& args) {
    using core_services::geo_processing::InvalidParameterException;
    CommandLine parsed;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            parsed.help = true;
        } else if (arg == "--config") {
            if (i + 1 >= args.size()) {
                GEOBRIDGE_THROW(InvalidParameterException, "config", "missing file name");
            }
            parsed.configFile = args[++i];
        } else if (common_utils::StringUtils::startsWith(arg, "--") && arg.find('=') != std::string::npos) {
            parsed.configOverrides.push_back(arg);
        } else if (common_utils::StringUtils::startsWith(arg, "--")) {
            std::string name = arg.substr(2);
            for (auto& c : name) {
                if (c == '-') c = '_';
            }
            if (i + 1 >= args.size()) {
                GEOBRIDGE_THROW(InvalidParameterException, name, "missing value");
            }
            parsed.options[name] = args[++i];
        } else if (parsed.command.empty()) {
            parsed.command = arg;
        } else {
            GEOBRIDGE_THROW(InvalidParameterException, "arguments", "unexpected argument '" + arg + "'");
        }
    }
    return parsed;
}

int fail(const std::string& code, const std::string& message) {
    std::cout << CommandDispatcher::errorDocument(code, message).dump(2) << std::endl;
    return 1;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        const CommandLine commandLine = parseArguments(std::vector<std::string>(argv + 1, argv + argc));
        if (commandLine.help || commandLine.command.empty()) {
            printUsage(commandLine.help ? std::cout : std::cerr);
            return commandLine.help ? 0 : 1;
        }

        // --- 配置 ---
        common_utils::AppConfigLoader loader("geobridge");
        GeoBridgeConfigFactory::registerDefaults(loader);
        if (commandLine.configFile) {
            if (!loader.loadFromFile(*commandLine.configFile)) {
                GEOBRIDGE_THROW(common_utils::ConfigurationException,
                                "cannot load configuration file '" + *commandLine.configFile + "'");
            }
        } else {
            loader.loadStandardConfig();
        }
        loader.loadFromEnvironment("GEOBRIDGE_");
        loader.loadFromCommandLine(commandLine.configOverrides);

        const auto settings = GeoBridgeConfigFactory::build(loader);
        common_utils::LoggingManager::configureGlobal(settings.logging);
        GEOBRIDGE_LOG_DEBUG("geobridge_cli", "Command '{}' with {} options", commandLine.command,
                            commandLine.options.size());

        // --- 按需创建服务 ---
        std::shared_ptr<core_services::geo_processing::IGeoProcessingService> geoProcessing;
        std::shared_ptr<core_services::result_cache::ResultCache> cache;
        if (common_utils::StringUtils::startsWith(commandLine.command, "cache-")) {
            cache = std::make_shared<core_services::result_cache::ResultCache>(settings.cache);
        } else {
            geoProcessing = core_services::geo_processing::GeoProcessingServiceFactory::createService(
                settings.processing);
        }

        CommandDispatcher dispatcher(geoProcessing, cache);
        const auto output = dispatcher.execute(commandLine.command, commandLine.options);
        std::cout << output.dump(2) << std::endl;
        common_utils::LoggingManager::getGlobalInstance().flushAll();
        return 0;

    } catch (const core_services::geo_processing::GeoProcessingException& e) {
        return fail(e.getErrorCode(), e.what());
    } catch (const common_utils::ConfigurationException& e) {
        return fail("CONFIGURATION_ERROR", e.what());
    } catch (const core_services::ServiceException& e) {
        return fail("SERVICE_ERROR", e.what());
    } catch (const std::exception& e) {
        return fail("INTERNAL_ERROR", e.what());
    }
}
