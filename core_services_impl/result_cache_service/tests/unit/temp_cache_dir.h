/**
 * @file temp_cache_dir.h
 * @brief 测试用临时缓存目录（析构时递归删除）
 */
#pragma once

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <filesystem>
#include <system_error>

namespace geobridge::test_support {

class TempCacheDir {
public:
    TempCacheDir()
        : path_(std::filesystem::temp_directory_path() /
                ("geobridge_cache_test_" + boost::uuids::to_string(boost::uuids::random_generator()()))) {}

    ~TempCacheDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempCacheDir(const TempCacheDir&) = delete;
    TempCacheDir& operator=(const TempCacheDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace geobridge::test_support
