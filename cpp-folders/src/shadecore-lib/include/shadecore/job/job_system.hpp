#pragma once

/*
    SHADECORE SHADING LIBRARY

    FILE: job_system.hpp
    MODULE: job
    PURPOSE: Job-system seam used by the draw executor and a fixed-size worker pool
             implementation. Jobs must not touch shared mutable state other than
             the pixels they own.
*/


#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace shadecore
{
    class IJobSystem
    {
    public:
        virtual ~IJobSystem() = default;
        virtual void submit(std::function<void()> job) = 0;
        virtual void wait_idle() = 0;
        virtual size_t concurrency() const = 0;
    };

    class ThreadPoolJobSystem final : public IJobSystem
    {
    public:
        // 0 picks the hardware concurrency (at least one worker).
        explicit ThreadPoolJobSystem(size_t workers = 0)
        {
            size_t n = workers;
            if (n == 0) n = std::max<size_t>(1, (size_t)std::thread::hardware_concurrency());
            threads_.reserve(n);
            for (size_t i = 0; i < n; ++i) threads_.emplace_back([this]() { run_worker(); });
        }

        ThreadPoolJobSystem(const ThreadPoolJobSystem&) = delete;
        ThreadPoolJobSystem& operator=(const ThreadPoolJobSystem&) = delete;

        // Queued jobs are finished before the workers exit.
        ~ThreadPoolJobSystem() override
        {
            {
                std::lock_guard<std::mutex> lock(mtx_);
                shutting_down_ = true;
            }
            work_cv_.notify_all();
            for (std::thread& t : threads_)
            {
                if (t.joinable()) t.join();
            }
        }

        void submit(std::function<void()> job) override
        {
            if (!job) return;
            {
                std::lock_guard<std::mutex> lock(mtx_);
                queue_.push_back(std::move(job));
                ++pending_;
            }
            work_cv_.notify_one();
        }

        void wait_idle() override
        {
            std::unique_lock<std::mutex> lock(mtx_);
            idle_cv_.wait(lock, [this]() { return pending_ == 0; });
        }

        size_t concurrency() const override
        {
            return threads_.size();
        }

    private:
        void run_worker()
        {
            for (;;)
            {
                std::function<void()> job{};
                {
                    std::unique_lock<std::mutex> lock(mtx_);
                    work_cv_.wait(lock, [this]() { return shutting_down_ || !queue_.empty(); });
                    if (queue_.empty()) return;
                    job = std::move(queue_.front());
                    queue_.pop_front();
                }

                job();

                std::lock_guard<std::mutex> lock(mtx_);
                if (--pending_ == 0) idle_cv_.notify_all();
            }
        }

        std::vector<std::thread> threads_{};
        std::deque<std::function<void()>> queue_{};
        std::mutex mtx_{};
        std::condition_variable work_cv_{};
        std::condition_variable idle_cv_{};
        // Queued plus running.
        size_t pending_ = 0;
        bool shutting_down_ = false;
    };
}
