// threadsignal.hpp
#pragma once
#include <BS_thread_pool.hpp>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

/**
 * 全局单例线程池
 * 数据加载和顶层并发挖掘共用同一个线程池
 * 线程数量在第一次获取时确定，之后的参数被忽略
 */
class ThreadPoolSingleton {
public:
    /**
     * 获取线程池单例实例
     * @param thread_count 线程数量，如果为0则使用硬件并发数
     * @return 线程池的引用
     */
    static BS::thread_pool<>& getInstance(size_t thread_count = 0) {
        static std::once_flag once_flag;
        static std::unique_ptr<BS::thread_pool<>> instance;

        std::call_once(once_flag, [thread_count]() {
            if (thread_count > 0) {
                instance = std::make_unique<BS::thread_pool<>>(thread_count);
            } else {
                instance = std::make_unique<BS::thread_pool<>>();
            }
        });

        return *instance;
    }

    ThreadPoolSingleton(const ThreadPoolSingleton&) = delete;
    ThreadPoolSingleton& operator=(const ThreadPoolSingleton&) = delete;

private:
    ThreadPoolSingleton() = default;
    ~ThreadPoolSingleton() = default;
};

inline BS::thread_pool<>& getThreadPool(size_t thread_count = 0) {
    return ThreadPoolSingleton::getInstance(thread_count);
}

/**
 * 把请求的线程数换算成实际线程数：0 表示硬件并发数，至少为1
 */
inline size_t resolveThreadCount(size_t requested) {
    if (requested > 0) {
        return requested;
    }
    size_t hardware = std::thread::hardware_concurrency();
    return hardware > 0 ? hardware : 1;
}
