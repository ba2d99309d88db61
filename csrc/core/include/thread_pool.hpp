#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace chunkwise {

class ThreadPool {
public:
    explicit ThreadPool(size_t worker_num) {
        if (worker_num == 0) throw std::invalid_argument("ThreadPool needs at least one worker.");
        _workers.reserve(worker_num);
        for (size_t i = 0; i < worker_num; ++i) {
            _workers.emplace_back([this] { run(); });
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _stop = true;
        }
        _cv.notify_all();
        for (auto& worker : _workers) worker.join();
    }

    template <typename Fn>
    auto enqueue(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
        using Result = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        std::future<Result> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_stop) throw std::runtime_error("enqueue on stopped ThreadPool");
            _tasks.emplace([task] { (*task)(); });
        }
        _cv.notify_one();
        return result;
    }

private:
    void run() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(_mutex);
                _cv.wait(lock, [this] { return _stop || !_tasks.empty(); });
                if (_stop && _tasks.empty()) return;
                task = std::move(_tasks.front());
                _tasks.pop();
            }
            task();
        }
    }

    std::vector<std::thread> _workers;
    std::queue<std::function<void()>> _tasks;
    std::mutex _mutex;
    std::condition_variable _cv;
    bool _stop = false;
};

} // namespace chunkwise
