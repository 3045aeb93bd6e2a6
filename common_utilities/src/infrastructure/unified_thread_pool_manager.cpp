/**
 * @file unified_thread_pool_manager.cpp
 * @brief 统一线程池管理器实现
 */

#include "common_utils/infrastructure/unified_thread_pool_manager.h"
#include "common_utils/utilities/logging_utils.h"
#include <algorithm>
#include <sstream>

namespace geobridge::common_utils::infrastructure {

// === ThreadPoolStatistics 实现 ===

std::string ThreadPoolStatistics::toString() const {
    std::ostringstream oss;
    oss << "ThreadPoolStatistics {"
        << " threads=" << totalThreads
        << " active=" << activeTasks
        << " completed=" << completedTasks
        << " failed=" << failedTasks
        << " }";
    return oss.str();
}

// === UnifiedThreadPoolManager 实现 ===

UnifiedThreadPoolManager::UnifiedThreadPoolManager()
    : UnifiedThreadPoolManager(PoolConfiguration{}) {}

UnifiedThreadPoolManager::UnifiedThreadPoolManager(const PoolConfiguration& config)
    : threadCount_(std::max<size_t>(1, config.threadCount)) {
    pool_ = std::make_unique<boost::asio::thread_pool>(threadCount_);
    GEOBRIDGE_LOG_DEBUG("UnifiedThreadPoolManager", "Initialized worker pool with {} threads", threadCount_);
}

UnifiedThreadPoolManager::~UnifiedThreadPoolManager() {
    requestShutdown();
}

ThreadPoolStatistics UnifiedThreadPoolManager::getStatistics() const {
    ThreadPoolStatistics stats;
    stats.totalThreads = threadCount_;
    stats.activeTasks = activeTasks_.load();
    stats.completedTasks = completedTasks_.load();
    stats.failedTasks = failedTasks_.load();
    return stats;
}

void UnifiedThreadPoolManager::requestShutdown() {
    std::unique_ptr<boost::asio::thread_pool> pool;
    {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        if (shutdownRequested_.exchange(true)) {
            return;
        }
        pool = std::move(pool_);
    }
    // 在锁外 join：正在执行的任务仍可调用 submitTask（会得到关闭异常）
    if (pool) {
        pool->join();
    }
    GEOBRIDGE_LOG_DEBUG("UnifiedThreadPoolManager", "Shutdown completed: {}", getStatistics().toString());
}

bool UnifiedThreadPoolManager::waitForCompletion(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(completionMutex_);
    return completionCv_.wait_for(lock, timeout, [this]() { return activeTasks_.load() == 0; });
}

void UnifiedThreadPoolManager::onTaskFinished(bool failed) {
    if (failed) {
        failedTasks_.fetch_add(1);
    } else {
        completedTasks_.fetch_add(1);
    }
    {
        std::lock_guard<std::mutex> lock(completionMutex_);
        activeTasks_.fetch_sub(1);
    }
    completionCv_.notify_all();
}

} // namespace geobridge::common_utils::infrastructure
