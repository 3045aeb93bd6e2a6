/**
 * @file boost_config.h
 * @brief 项目统一 Boost 库配置头文件
 *
 * 在包含任何 boost/thread 头文件之前包含本文件：
 * ```cpp
 * #include "common_utils/utilities/boost_config.h"
 * #include <boost/thread/future.hpp>
 * ```
 */

#pragma once

#ifndef GEOBRIDGE_BOOST_CONFIG_H
#define GEOBRIDGE_BOOST_CONFIG_H

// ============================================================================
// Boost.Thread Future 支持宏定义
// ============================================================================

#ifndef BOOST_THREAD_PROVIDES_FUTURE
#define BOOST_THREAD_PROVIDES_FUTURE 1
#endif

#ifndef BOOST_THREAD_PROVIDES_FUTURE_CONTINUATION
#define BOOST_THREAD_PROVIDES_FUTURE_CONTINUATION 1
#endif

#ifndef BOOST_THREAD_PROVIDES_FUTURE_WHEN_ALL_WHEN_ANY
#define BOOST_THREAD_PROVIDES_FUTURE_WHEN_ALL_WHEN_ANY 1
#endif

#ifndef BOOST_THREAD_USES_MOVE
#define BOOST_THREAD_USES_MOVE 1
#endif

#ifndef BOOST_THREAD_VERSION
#define BOOST_THREAD_VERSION 4
#endif

// ============================================================================
// boost::asio 配置
// ============================================================================

#ifndef BOOST_ASIO_NO_DEPRECATED
#define BOOST_ASIO_NO_DEPRECATED
#endif

#endif // GEOBRIDGE_BOOST_CONFIG_H
