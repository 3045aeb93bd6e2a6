/**
 * @file unified_thread_pool_manager.h
 * @brief 统一线程池管理器 - 有界工作线程池和 future 任务提交
 *
 * 🎯 核心目标：
 * ✅ 所有服务共享同一个有界线程池
 * ✅ 任务结果和异常通过 boost::future 返回
 * ✅ 单线程模式下同步执行，便于测试和调试
 */

#pragma once

#include "../utilities/boost_config.h"
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/post.hpp>
#include <boost/exception_ptr.hpp>
#include <boost/thread/future.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>

namespace geobridge::common_utils::infrastructure {

/**
 * @brief 线程池统计信息
 */
struct ThreadPoolStatistics {
    size_t totalThreads = 0;
    size_t activeTasks = 0;
    size_t completedTasks = 0;
    size_t failedTasks = 0;

    std::string toString() const;
};

/**
 * @brief 统一线程池管理器
 */
class UnifiedThreadPoolManager {
public:
    struct PoolConfiguration {
        size_t threadCount = std::thread::hardware_concurrency();
    };

    enum class RunMode {
        PRODUCTION,    // 多线程执行
        SINGLE_THREAD  // 在调用线程中顺序执行
    };

    explicit UnifiedThreadPoolManager();
    explicit UnifiedThreadPoolManager(const PoolConfiguration& config);

    /**
     * @brief 析构时等待已提交任务完成
     */
    ~UnifiedThreadPoolManager();

    UnifiedThreadPoolManager(const UnifiedThreadPoolManager&) = delete;
    UnifiedThreadPoolManager& operator=(const UnifiedThreadPoolManager&) = delete;
    UnifiedThreadPoolManager(UnifiedThreadPoolManager&&) = delete;
    UnifiedThreadPoolManager& operator=(UnifiedThreadPoolManager&&) = delete;

    void setRunMode(RunMode mode) { runMode_.store(mode); }
    RunMode getRunMode() const { return runMode_.load(); }

    /**
     * @brief 提交任务
     *
     * 任务抛出的异常被捕获并设置到返回的 future 中，由 get() 重新抛出。
     */
    template<typename Func>
    auto submitTask(Func&& func) -> boost::future<std::invoke_result_t<Func>>;

    ThreadPoolStatistics getStatistics() const;

    size_t getThreadCount() const { return threadCount_; }

    /**
     * @brief 停止接收新任务并等待队列中的任务完成
     */
    void requestShutdown();

    bool isShuttingDown() const { return shutdownRequested_.load(); }

    /**
     * @brief 等待所有活跃任务完成
     * @return 超时前全部完成返回 true
     */
    bool waitForCompletion(std::chrono::milliseconds timeout = std::chrono::milliseconds{10000});

private:
    template<typename ResultType, typename Func>
    static void runInto(boost::promise<ResultType>& promise, Func& func);

    void onTaskFinished(bool failed);

    // guards pool_ and the shutdown flag between submit and shutdown
    std::mutex lifecycleMutex_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
    size_t threadCount_ = 1;
    std::atomic<RunMode> runMode_{RunMode::PRODUCTION};

    std::atomic<bool> shutdownRequested_{false};
    std::atomic<size_t> activeTasks_{0};
    std::atomic<size_t> completedTasks_{0};
    std::atomic<size_t> failedTasks_{0};

    std::mutex completionMutex_;
    std::condition_variable completionCv_;
};

// === 模板实现 ===

template<typename ResultType, typename Func>
void UnifiedThreadPoolManager::runInto(boost::promise<ResultType>& promise, Func& func) {
    if constexpr (std::is_void_v<ResultType>) {
        func();
        promise.set_value();
    } else {
        promise.set_value(func());
    }
}

template<typename Func>
auto UnifiedThreadPoolManager::submitTask(Func&& func)
    -> boost::future<std::invoke_result_t<Func>> {

    using ResultType = std::invoke_result_t<Func>;

    auto promise = std::make_shared<boost::promise<ResultType>>();
    auto future = promise->get_future();

    std::unique_lock<std::mutex> lock(lifecycleMutex_);
    if (shutdownRequested_.load()) {
        lock.unlock();
        promise->set_exception(boost::copy_exception(
            std::runtime_error("UnifiedThreadPoolManager is shutting down")));
        return future;
    }

    activeTasks_.fetch_add(1);

    auto task = [this, promise, func = std::forward<Func>(func)]() mutable {
        bool failed = false;
        try {
            runInto(*promise, func);
        } catch (...) {
            failed = true;
            promise->set_exception(boost::current_exception());
        }
        onTaskFinished(failed);
    };

    if (runMode_.load() == RunMode::SINGLE_THREAD) {
        lock.unlock();
        task();
    } else {
        boost::asio::post(*pool_, std::move(task));
    }
    return future;
}

} // namespace geobridge::common_utils::infrastructure
