#include "ThreadPool.h"
#include "Log.h"
#ifdef __linux__
#include <pthread.h>
#endif
#include <algorithm>
#include <cstdlib>

ThreadPool::ThreadPool(size_t threads, const std::string& name)
    : name_(name)
{
    if (threads == 0) threads = 1;
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this]() { workerLoop_(); });
    }
    LOG_DEBUG("ThreadPool", "Started " << threads << " workers for " << name_);
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

size_t ThreadPool::defaultSize()
{
    unsigned hw = std::thread::hardware_concurrency();
    unsigned suggested = hw ? std::min(3u, hw) : 3u; // keep 1+ cores free
    if (const char* env = std::getenv("STANDINGSWATCH_THREADPOOL_SIZE")) {
        int user = std::atoi(env);
        if (user > 0 && user < 64) suggested = static_cast<unsigned>(user);
    }
    return suggested;
}

void ThreadPool::workerLoop_()
{
#ifdef __linux__
    pthread_setname_np(pthread_self(), name_.substr(0, 15).c_str());
#endif
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
            if (stopping_ && tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        // packaged_task stores exceptions in the future; this only sees wrapper failures
        try {
            task();
        }
        catch (const std::exception& e) {
            LOG_ERROR("ThreadPool", name_ << " task threw: " << e.what());
        }
    }
}

void ThreadPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        stopping_ = true;
    }
    condition_.notify_all();
    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}
