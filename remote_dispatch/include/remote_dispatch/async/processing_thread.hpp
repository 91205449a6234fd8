#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>

namespace RemoteDispatch
{
    class ProcessingStrand;

    /**
     * @brief Executes tasks sequentially in a separate thread.
     * All calls into a library that is not thread safe can be funneled through one of these.
     */
    class ProcessingThread
    {
      public:
        constexpr static std::size_t maximumTasksProcessableAtOnce = 100;

        ProcessingThread();
        ~ProcessingThread();
        ProcessingThread(ProcessingThread const&) = delete;
        ProcessingThread& operator=(ProcessingThread const&) = delete;
        ProcessingThread(ProcessingThread&&) = delete;
        ProcessingThread& operator=(ProcessingThread&&) = delete;

        /**
         * @brief Starts the processing thread.
         *
         * @param waitCycleTimeout The time to wait for a task to become available before checking if the thread should
         * stop.
         */
        void start(std::chrono::milliseconds const& waitCycleTimeout = std::chrono::milliseconds{100});

        /**
         * @brief Stops the processing thread. Executes all pending tasks on the calling thread.
         */
        void stop();

        bool isRunning() const;

        /**
         * @brief Pushes a task to the processing thread.
         *
         * @param task The task to push.
         * @return true If the task was pushed.
         * @return false If the processing thread is not running or shutting down.
         */
        bool pushTask(std::function<void()> task);

        /**
         * @brief Pushes a task that has a return value to the processing thread.
         * The return value is then accessible through the returned future. Exceptions thrown by the task are
         * forwarded into the future, as is the refusal of the task.
         *
         * @param func The function to execute.
         * @return std::future<std::invoke_result_t<std::decay_t<Func>>> The future that will contain the return value.
         */
        template <typename Func>
        auto pushPromiseTask(Func&& func) -> std::future<std::invoke_result_t<std::decay_t<Func>>>
        {
            using ReturnType = std::invoke_result_t<std::decay_t<Func>>;
            auto promise = std::make_shared<std::promise<ReturnType>>();
            auto future = promise->get_future();
            const bool pushed = pushTask([promise, func = std::forward<Func>(func)]() mutable {
                try
                {
                    if constexpr (std::is_void_v<ReturnType>)
                    {
                        func();
                        promise->set_value();
                    }
                    else
                    {
                        promise->set_value(func());
                    }
                }
                catch (...)
                {
                    promise->set_exception(std::current_exception());
                }
            });
            if (!pushed)
                promise->set_exception(std::make_exception_ptr(std::runtime_error("Processing thread is not accepting tasks.")));
            return future;
        }

        /**
         * @brief Waits for a cycle to complete.
         *
         * @param maxWait The maximum time to wait for a cycle.
         * @return true If a cycle was completed.
         * @return false If the maximum wait time was reached or the thread is not running.
         */
        bool awaitCycle(std::chrono::milliseconds maxWait = std::chrono::seconds{5});

        /**
         * @brief Returns true if the current thread is the processing thread.
         */
        bool withinProcessingThread() const
        {
            return processingThreadId_.load() == std::this_thread::get_id();
        }

        std::unique_ptr<ProcessingStrand> createStrand();

      private:
        void run(std::chrono::milliseconds waitCycleTimeout);
        static void execute(std::function<void()> const& task);

      private:
        std::thread thread_{};
        std::atomic_bool running_{false};
        std::atomic_bool shuttingDown_{false};
        std::atomic<std::thread::id> processingThreadId_{};

        mutable std::mutex taskMutex_{};
        std::condition_variable taskCondition_{};
        std::deque<std::function<void()>> tasks_{};
    };
}
