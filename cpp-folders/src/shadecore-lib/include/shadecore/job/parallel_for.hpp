#pragma once

/*
    SHADECORE SHADING LIBRARY

    FILE: parallel_for.hpp
    MODULE: job
    PURPOSE: Completion counter and a 1D range splitter over IJobSystem.
*/


#include <algorithm>
#include <condition_variable>
#include <mutex>

#include "shadecore/job/job_system.hpp"

namespace shadecore
{
    // Blocks in wait() until done() has been called once per add().
    class WaitGroup
    {
    public:
        void add(int n = 1)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            outstanding_ += n;
        }

        void done()
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (--outstanding_ <= 0) cv_.notify_all();
        }

        void wait()
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [this]() { return outstanding_ <= 0; });
        }

    private:
        std::mutex mtx_{};
        std::condition_variable cv_{};
        int outstanding_ = 0;
    };

    // Calls fn(b, e) over disjoint sub-ranges covering [begin, end). Runs inline
    // without a job system or when the range is no larger than one grain.
    // Returns the number of chunks dispatched.
    template<typename Fn>
    inline int parallel_for_1d(IJobSystem* js, int begin, int end, int min_grain, Fn&& fn)
    {
        if (end <= begin) return 0;
        const int count = end - begin;
        const int grain = std::max(1, min_grain);
        if (!js || count <= grain)
        {
            fn(begin, end);
            return 1;
        }

        const int lanes = (int)std::max<size_t>(1, js->concurrency());
        const int by_grain = (count + grain - 1) / grain;
        const int chunks = std::clamp(by_grain, 1, lanes * 2);
        const int step = (count + chunks - 1) / chunks;

        WaitGroup wg{};
        int dispatched = 0;
        for (int b = begin; b < end; b += step)
        {
            const int e = std::min(end, b + step);
            wg.add(1);
            ++dispatched;
            js->submit([b, e, &fn, &wg]() {
                fn(b, e);
                wg.done();
            });
        }
        wg.wait();
        return dispatched;
    }
}
