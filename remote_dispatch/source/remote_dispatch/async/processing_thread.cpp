#include <remote_dispatch/async/processing_thread.hpp>
#include <remote_dispatch/async/processing_strand.hpp>

#include <log/log.hpp>

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <vector>

namespace RemoteDispatch
{
    ProcessingThread::ProcessingThread() = default;
    ProcessingThread::~ProcessingThread()
    {
        stop();
    }
    bool ProcessingThread::isRunning() const
    {
        return running_;
    }
    void ProcessingThread::start(std::chrono::milliseconds const& waitCycleTimeout)
    {
        if (running_.exchange(true))
            return;

        shuttingDown_ = false;
        std::promise<void> awaitThreadStart{};
        auto started = awaitThreadStart.get_future();
        thread_ = std::thread([this, &awaitThreadStart, waitCycleTimeout] {
            processingThreadId_.store(std::this_thread::get_id());
            awaitThreadStart.set_value();
            run(waitCycleTimeout);
        });
        started.wait();
    }
    void ProcessingThread::stop()
    {
        {
            std::lock_guard lock{taskMutex_};
            running_ = false;
        }
        taskCondition_.notify_all();
        if (thread_.joinable())
        {
            if (withinProcessingThread())
                throw std::logic_error("The processing thread cannot stop itself.");
            thread_.join();
        }
        processingThreadId_.store(std::thread::id{});

        // Execute all pending tasks, so no promise is left unfulfilled:
        shuttingDown_ = true;
        std::deque<std::function<void()>> remaining{};
        {
            std::lock_guard lock{taskMutex_};
            remaining = std::move(tasks_);
            tasks_.clear();
        }
        for (auto const& task : remaining)
            execute(task);
        shuttingDown_ = false;
    }
    bool ProcessingThread::pushTask(std::function<void()> task)
    {
        if (!task)
            throw std::invalid_argument("Task must not be empty.");

        {
            std::lock_guard lock{taskMutex_};
            if (shuttingDown_ || !running_)
                return false;
            tasks_.push_back(std::move(task));
        }
        taskCondition_.notify_one();
        return true;
    }
    std::unique_ptr<ProcessingStrand> ProcessingThread::createStrand()
    {
        return std::make_unique<ProcessingStrand>(this);
    }
    void ProcessingThread::execute(std::function<void()> const& task)
    {
        try
        {
            task();
        }
        catch (std::exception const& exc)
        {
            Log::error("Task on processing thread failed: {}", exc.what());
        }
    }
    void ProcessingThread::run(std::chrono::milliseconds waitCycleTimeout)
    {
        while (true)
        {
            std::vector<std::function<void()>> tasks{};
            {
                std::unique_lock lock{taskMutex_};
                taskCondition_.wait_for(lock, waitCycleTimeout, [this] {
                    return !tasks_.empty() || !running_;
                });
                if (!running_)
                    return;

                const auto count = std::min(tasks_.size(), maximumTasksProcessableAtOnce);
                tasks.reserve(count);
                std::move(tasks_.begin(), tasks_.begin() + static_cast<std::ptrdiff_t>(count), std::back_inserter(tasks));
                tasks_.erase(tasks_.begin(), tasks_.begin() + static_cast<std::ptrdiff_t>(count));
            }

            for (auto const& task : tasks)
                execute(task);
        }
    }
    bool ProcessingThread::awaitCycle(std::chrono::milliseconds maxWait)
    {
        if (withinProcessingThread() || !running_)
            return false;

        return pushPromiseTask([]() {
                   return true;
               }).wait_for(maxWait) == std::future_status::ready;
    }
}
