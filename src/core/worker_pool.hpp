#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace asciimedia {

// Fixed set of threads draining one FIFO task queue. Destruction finishes
// every queued task before joining.
class WorkerPool {
public:
    explicit WorkerPool(int threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    int size() const { return static_cast<int>(workers_.size()); }

    template <typename Fn>
    auto submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
        using R = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Fn>(fn));
        std::future<R> result = task->get_future();
        enqueue([task] { (*task)(); });
        return result;
    }

    // Applies fn to every input on the pool. Results are index-aligned with
    // the inputs whatever order the workers finish in. The first exception
    // thrown by fn is rethrown here, after every task has completed.
    template <typename T, typename Fn>
    auto map(const std::vector<T>& inputs, Fn fn) -> std::vector<std::invoke_result_t<Fn, const T&>> {
        using R = std::invoke_result_t<Fn, const T&>;
        std::vector<std::future<R>> pending;
        pending.reserve(inputs.size());
        for (const T& input : inputs) {
            const T* item = &input;
            pending.push_back(submit([fn, item] { return fn(*item); }));
        }

        for (auto& f : pending) f.wait();

        std::vector<R> results;
        results.reserve(pending.size());
        for (auto& f : pending) {
            results.push_back(f.get());
        }
        return results;
    }

private:
    void enqueue(std::function<void()> job);
    void worker_loop();
    void stop_and_join();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

}
