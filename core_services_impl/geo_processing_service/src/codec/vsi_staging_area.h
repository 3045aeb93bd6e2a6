#pragma once

#include <string>
#include <vector>

namespace geobridge::core_services::geo_processing::codec {

/**
 * @brief GDAL /vsimem/ 临时目录，每次编解码调用独占一个
 *
 * 目录名由随机 UUID 生成，析构时递归删除。
 */
class VsiStagingArea {
public:
    VsiStagingArea();
    ~VsiStagingArea();

    VsiStagingArea(const VsiStagingArea&) = delete;
    VsiStagingArea& operator=(const VsiStagingArea&) = delete;

    const std::string& root() const { return root_; }

    /**
     * @brief 目录内文件的完整 VSI 路径
     */
    std::string path(const std::string& name) const;

    /**
     * @throws OperationFailedException 写入失败
     */
    void writeFile(const std::string& name, const std::string& bytes) const;

    /**
     * @throws OperationFailedException 文件不存在
     */
    std::string readFile(const std::string& name) const;

    /**
     * @brief 目录内的文件名（不含路径），按名称排序
     */
    std::vector<std::string> listFiles() const;

    /**
     * @brief 把目录内指定文件打包为一个 zip
     */
    void zipFiles(const std::vector<std::string>& names, const std::string& zipName) const;

private:
    std::string root_;
};

} // namespace geobridge::core_services::geo_processing::codec
