#include "common_utils/utilities/filesystem_utils.h"
#include "common_utils/utilities/logging_utils.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace geobridge {
namespace common_utils {

static void logFilesystemError(const std::string& operation, const fs::path& path, const std::error_code& ec) {
    LOG_ERROR("Filesystem error during '{}' on path '{}': {} ({})",
              operation, path.string(), ec.message(), ec.value());
}

bool FilesystemUtils::ensureDirectoryExists(const fs::path& directory) {
    if (directory.empty()) {
        LOG_ERROR("Attempted to ensure an empty directory path exists.");
        return false;
    }

    std::error_code ec;
    if (fs::is_directory(directory, ec)) {
        return true;
    }
    if (fs::exists(directory, ec)) {
        LOG_ERROR("Path exists but is not a directory: {}", directory.string());
        return false;
    }

    if (fs::create_directories(directory, ec)) {
        LOG_DEBUG("Created directory: {}", directory.string());
        return true;
    }
    // 并发创建时目录可能已由其他调用者建立
    if (fs::is_directory(directory)) {
        return true;
    }
    logFilesystemError("create_directories", directory, ec);
    return false;
}

std::optional<std::string> FilesystemUtils::readFileToString(const fs::path& filePath) {
    std::ifstream file(filePath, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        LOG_ERROR("Failed while reading file: {}", filePath.string());
        return std::nullopt;
    }
    return buffer.str();
}

bool FilesystemUtils::writeStringToFileAtomic(const fs::path& filePath, const std::string& content) {
    auto parentDir = filePath.parent_path();
    if (!parentDir.empty() && !ensureDirectoryExists(parentDir)) {
        LOG_ERROR("Failed to ensure parent directory exists for file: {}", filePath.string());
        return false;
    }

    fs::path tempPath = filePath;
    tempPath += "." + boost::uuids::to_string(boost::uuids::random_generator()()) + ".tmp";

    {
        std::ofstream out(tempPath, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            LOG_ERROR("Failed to open temporary file for writing: {}", tempPath.string());
            return false;
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            LOG_ERROR("Failed to write temporary file: {}", tempPath.string());
            out.close();
            removeFile(tempPath);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tempPath, filePath, ec);
    if (ec) {
        logFilesystemError("rename", tempPath, ec);
        removeFile(tempPath);
        return false;
    }
    return true;
}

bool FilesystemUtils::copyFile(const fs::path& source, const fs::path& destination) {
    auto parentDir = destination.parent_path();
    if (!parentDir.empty() && !ensureDirectoryExists(parentDir)) {
        return false;
    }
    std::error_code ec;
    fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        logFilesystemError("copy_file", source, ec);
        return false;
    }
    return true;
}

bool FilesystemUtils::removeFile(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        logFilesystemError("remove", path, ec);
        return false;
    }
    return true;
}

std::optional<uintmax_t> FilesystemUtils::getFileSize(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return size;
}

std::optional<fs::file_time_type> FilesystemUtils::getLastModifiedTime(const fs::path& path) {
    std::error_code ec;
    auto time = fs::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return time;
}

bool FilesystemUtils::setLastModifiedTime(const fs::path& path, const fs::file_time_type& time) {
    std::error_code ec;
    fs::last_write_time(path, time, ec);
    if (ec) {
        logFilesystemError("last_write_time", path, ec);
        return false;
    }
    return true;
}

fs::path FilesystemUtils::expandUser(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return fs::path(path);
    }
    if (path.size() > 1 && path[1] != '/') {
        // ~otheruser 形式不展开
        return fs::path(path);
    }
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        return fs::path(path);
    }
    return fs::path(std::string(home) + path.substr(1));
}

std::vector<fs::path> FilesystemUtils::listFiles(const fs::path& directory, const std::string& suffix) {
    std::vector<fs::path> files;
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        logFilesystemError("directory_iterator", directory, ec);
        return files;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            logFilesystemError("directory_iterator increment", directory, ec);
            break;
        }
        std::error_code typeEc;
        if (!it->is_regular_file(typeEc)) {
            continue;
        }
        const std::string name = it->path().filename().string();
        if (!suffix.empty() &&
            (name.size() < suffix.size() ||
             name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0)) {
            continue;
        }
        files.push_back(it->path());
    }
    return files;
}

} // namespace common_utils
} // namespace geobridge
