#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace geobridge {
namespace common_utils {
namespace fs = std::filesystem;

/**
 * @brief 文件系统操作工具类
 *
 * 失败时记录日志并通过返回值报告，不抛出 std::filesystem 异常。
 */
class FilesystemUtils {
public:
    FilesystemUtils() = delete;

    /**
     * @brief 确保目录存在，如果不存在则递归创建
     * @return 成功返回true，失败返回false
     */
    static bool ensureDirectoryExists(const fs::path& directory);

    /**
     * @brief 读取整个文件为字符串
     * @return 文件不存在或读取失败时返回 std::nullopt
     */
    static std::optional<std::string> readFileToString(const fs::path& filePath);

    /**
     * @brief 原子写文件：先写入同目录下的临时文件，再 rename 覆盖目标
     * @return 成功返回true，失败返回false（临时文件会被清理）
     */
    static bool writeStringToFileAtomic(const fs::path& filePath, const std::string& content);

    /**
     * @brief 复制文件（覆盖目标），必要时创建目标父目录
     */
    static bool copyFile(const fs::path& source, const fs::path& destination);

    /**
     * @brief 删除文件，文件不存在视为成功
     */
    static bool removeFile(const fs::path& path);

    static std::optional<uintmax_t> getFileSize(const fs::path& path);

    static std::optional<fs::file_time_type> getLastModifiedTime(const fs::path& path);

    static bool setLastModifiedTime(const fs::path& path, const fs::file_time_type& time);

    /**
     * @brief 展开路径开头的 '~' 为 $HOME
     */
    static fs::path expandUser(const std::string& path);

    /**
     * @brief 列出目录下的常规文件（不递归）
     * @param suffix 非空时只返回文件名以该后缀结尾的文件
     */
    static std::vector<fs::path> listFiles(const fs::path& directory, const std::string& suffix = "");
};

} // namespace common_utils
} // namespace geobridge
