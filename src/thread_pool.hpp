#pragma once

#include <spdlog/spdlog.h>

#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Fixed worker pool for independent render jobs. A job that throws is
// logged, counted in failed(), and treated as finished so wait() never hangs.
class ThreadPool {
public:
    // n_threads < 1 uses the hardware concurrency (4 if unknown).
    explicit ThreadPool(int n_threads)
    {
        if (n_threads < 1) {
            n_threads = static_cast<int>(std::thread::hardware_concurrency());
            if (n_threads < 1) n_threads = 4;
        }
        workers.reserve(n_threads);
        for (int i = 0; i < n_threads; ++i)
            workers.emplace_back([this] { worker_loop(); });
    }

    ~ThreadPool()
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            stopping = true;
        }
        cv_task.notify_all();
        for (auto& t : workers) t.join();
    }

    ThreadPool(const ThreadPool&)            = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    int size() const { return static_cast<int>(workers.size()); }

    // Jobs that ended by throwing since the pool was created.
    int failed()
    {
        std::lock_guard<std::mutex> lock(mtx);
        return failed_jobs;
    }

    void submit(std::function<void()> f)
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            ++pending;
            tasks.push_back(std::move(f));
        }
        cv_task.notify_one();
    }

    // Blocks until every submitted job has finished.
    void wait()
    {
        std::unique_lock<std::mutex> lock(mtx);
        cv_done.wait(lock, [this] { return pending == 0; });
    }

private:
    void worker_loop()
    {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mtx);
                cv_task.wait(lock, [this] { return !tasks.empty() || stopping; });
                if (stopping && tasks.empty()) return;
                task = std::move(tasks.front());
                tasks.pop_front();
            }
            bool threw = true;
            try {
                task();
                threw = false;
            } catch (const std::exception& e) {
                spdlog::error("[ThreadPool] Job failed: {}", e.what());
            } catch (...) {
                spdlog::error("[ThreadPool] Job failed with a non-standard exception");
            }
            {
                std::lock_guard<std::mutex> lock(mtx);
                if (threw) ++failed_jobs;
                if (--pending == 0) cv_done.notify_all();
            }
        }
    }

    std::vector<std::thread>          workers;
    std::deque<std::function<void()>> tasks;
    std::mutex                        mtx;
    std::condition_variable           cv_task;
    std::condition_variable           cv_done;
    int                               pending     = 0;
    int                               failed_jobs = 0;
    bool                              stopping    = false;
};
