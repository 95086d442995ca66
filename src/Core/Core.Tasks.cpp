module;
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

module Core:Tasks.Impl;
import :Tasks;
import :Logging;

namespace Core::Tasks
{
    void LocalTask::Reset() noexcept
    {
        if (m_Callable)
        {
            std::destroy_at(m_Callable);
            m_Callable = nullptr;
        }
    }

    void LocalTask::TakeFrom(LocalTask& other) noexcept
    {
        if (!other.m_Callable)
            return;
        m_Callable = other.m_Callable->RelocateTo(m_Storage);
        other.Reset();
    }

    LocalTask& LocalTask::operator=(LocalTask&& other) noexcept
    {
        if (this != &other)
        {
            Reset();
            TakeFrom(other);
        }
        return *this;
    }

    void LocalTask::operator()()
    {
        if (m_Callable)
            m_Callable->Execute();
    }

    namespace
    {
        struct Pool
        {
            std::vector<std::thread> Workers;
            std::deque<LocalTask> Queue;

            std::mutex QueueMutex;
            std::condition_variable Wake;
            bool Running{true}; // guarded by QueueMutex

            // Tasks dispatched but not yet finished, queued ones included.
            // WaitForAll blocks on it with atomic wait.
            std::atomic<int> Outstanding{0};
        };

        std::unique_ptr<Pool> s_Pool;
        thread_local bool t_IsWorker = false;

        bool TryPop(Pool& pool, LocalTask& out)
        {
            std::lock_guard lock(pool.QueueMutex);
            if (pool.Queue.empty())
                return false;
            out = std::move(pool.Queue.front());
            pool.Queue.pop_front();
            return true;
        }

        void RunAndRelease(Pool& pool, LocalTask& task)
        {
            task();
            if (pool.Outstanding.fetch_sub(1, std::memory_order_acq_rel) == 1)
                pool.Outstanding.notify_all();
        }
    }

    void Scheduler::Initialize(unsigned threadCount)
    {
        if (s_Pool)
            return;
        if (t_IsWorker)
        {
            Log::Error("Scheduler::Initialize called from a worker thread");
            return;
        }

        if (threadCount == 0)
        {
            const unsigned hw = std::thread::hardware_concurrency();
            threadCount = hw > 2 ? hw - 1 : 1;
        }

        s_Pool = std::make_unique<Pool>();
        s_Pool->Workers.reserve(threadCount);
        for (unsigned i = 0; i < threadCount; ++i)
            s_Pool->Workers.emplace_back([i] { WorkerEntry(i); });

        Log::Info("Scheduler started with {} worker threads", threadCount);
    }

    void Scheduler::Shutdown()
    {
        if (!s_Pool)
            return;
        if (t_IsWorker)
        {
            Log::Error("Scheduler::Shutdown called from a worker thread");
            return;
        }

        // Queued chunks belong to a caller that may still be waiting on them.
        WaitForAll();

        {
            std::lock_guard lock(s_Pool->QueueMutex);
            s_Pool->Running = false;
        }
        s_Pool->Wake.notify_all();

        for (std::thread& worker : s_Pool->Workers)
            if (worker.joinable())
                worker.join();

        s_Pool.reset();
        Log::Debug("Scheduler stopped");
    }

    bool Scheduler::IsInitialized()
    {
        return s_Pool != nullptr;
    }

    unsigned Scheduler::WorkerCount()
    {
        return s_Pool ? static_cast<unsigned>(s_Pool->Workers.size()) : 0u;
    }

    void Scheduler::DispatchInternal(LocalTask&& task)
    {
        if (!s_Pool)
        {
            task();
            return;
        }

        s_Pool->Outstanding.fetch_add(1, std::memory_order_relaxed);
        {
            std::lock_guard lock(s_Pool->QueueMutex);
            s_Pool->Queue.push_back(std::move(task));
        }
        s_Pool->Wake.notify_one();
    }

    void Scheduler::WaitForAll()
    {
        if (!s_Pool)
            return;
        Pool& pool = *s_Pool;

        // The caller works through the queue alongside the workers, then
        // sleeps until the chunks still in flight elsewhere finish.
        LocalTask task;
        while (TryPop(pool, task))
            RunAndRelease(pool, task);

        for (int outstanding = pool.Outstanding.load(std::memory_order_acquire); outstanding > 0;
             outstanding = pool.Outstanding.load(std::memory_order_acquire))
        {
            pool.Outstanding.wait(outstanding, std::memory_order_acquire);
        }
    }

    void Scheduler::WorkerEntry(unsigned)
    {
        t_IsWorker = true;
        Pool& pool = *s_Pool;

        for (;;)
        {
            LocalTask task;
            {
                std::unique_lock lock(pool.QueueMutex);
                pool.Wake.wait(lock, [&pool] { return !pool.Queue.empty() || !pool.Running; });
                if (pool.Queue.empty())
                    return; // stopped and drained

                task = std::move(pool.Queue.front());
                pool.Queue.pop_front();
            }
            RunAndRelease(pool, task);
        }
    }
}
