/**
 * @file exceptions.h
 * @brief GeoBridge 异常根类型
 *
 * - GeoBridgeBaseException
 *   ├─ ConfigurationException   配置文件、环境变量、命令行取值错误
 *   ├─ ValidationException      通用输入校验失败
 *   └─ ServiceException         core_services 业务异常的基类
 */

#pragma once

#include <stdexcept>
#include <string>

#include <boost/throw_exception.hpp>

namespace geobridge {
namespace common_utils {

class GeoBridgeBaseException : public std::runtime_error {
public:
    explicit GeoBridgeBaseException(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigurationException : public GeoBridgeBaseException {
public:
    using GeoBridgeBaseException::GeoBridgeBaseException;
};

class ValidationException : public GeoBridgeBaseException {
public:
    using GeoBridgeBaseException::GeoBridgeBaseException;
};

class ServiceException : public GeoBridgeBaseException {
public:
    using GeoBridgeBaseException::GeoBridgeBaseException;
};

} // namespace common_utils
} // namespace geobridge

/**
 * @brief 经 boost::throw_exception 抛出
 *
 * 这样 boost::current_exception 能保留具体类型，
 * 异常穿过 boost::future 后仍可按原类型捕获。
 */
#define GEOBRIDGE_THROW(ExceptionType, ...) \
    ::boost::throw_exception(ExceptionType(__VA_ARGS__))
