#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

// Fixed set of workers draining one FIFO queue. Results and exceptions come
// back through the future returned by enqueue.
class ThreadPool {
public:
    // name shows up in the log and, on Linux, as the thread name (15 chars max)
    ThreadPool(size_t threads, const std::string& name);
    ~ThreadPool();
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Finishes queued tasks, then joins. Later enqueues throw.
    void shutdown();

    // min(3, hardware threads), or STANDINGSWATCH_THREADPOOL_SIZE when set (1..63)
    static size_t defaultSize();

    size_t size() const { return workers_.size(); }

    template<class F, class... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>;

private:
    void workerLoop_();

    std::string name_;
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queueMutex_;
    std::condition_variable condition_;
    bool stopping_ = false;
};

template<class F, class... Args>
auto ThreadPool::enqueue(F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<F, Args...>>
{
    using return_type = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        [func = std::forward<F>(f), bound = std::make_tuple(std::forward<Args>(args)...)]() mutable -> return_type {
            return std::apply(std::move(func), std::move(bound));
        });

    std::future<return_type> result = task->get_future();
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (stopping_) {
            throw std::runtime_error("enqueue on stopped pool " + name_);
        }
        tasks_.emplace([task]() { (*task)(); });
    }
    condition_.notify_one();
    return result;
}
