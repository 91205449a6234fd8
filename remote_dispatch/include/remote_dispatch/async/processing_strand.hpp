#pragma once

#include <remote_dispatch/async/processing_thread.hpp>

#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>

namespace RemoteDispatch
{
    /**
     * @brief Makes it impossible to push tasks to a strand after it has been finalized.
     * Finalization means the resource behind the strand is being closed, so no more work may reach it.
     */
    class ProcessingStrand
    {
      public:
        explicit ProcessingStrand(ProcessingThread* processingThread)
            : processingThread_(processingThread)
        {}

        /**
         * @brief Pushes a task, but not if the strand has been finalized.
         *
         * @return true If the task was pushed.
         */
        bool pushTask(std::function<void()> task)
        {
            std::scoped_lock lock(mutex_);
            if (finalized_)
                return false;
            return processingThread_->pushTask(std::move(task));
        }

        /**
         * @brief Pushes a task whose result is delivered through a future.
         * The future holds an exception if the strand has been finalized.
         */
        template <typename Func>
        auto pushPromiseTask(Func&& func) -> std::future<std::invoke_result_t<std::decay_t<Func>>>
        {
            std::scoped_lock lock(mutex_);
            if (finalized_)
                return refused<std::invoke_result_t<std::decay_t<Func>>>();
            return processingThread_->pushPromiseTask(std::forward<Func>(func));
        }

        /**
         * @brief Pushes a task that makes any further pushes impossible.
         */
        template <typename Func>
        auto pushFinalPromiseTask(Func&& func) -> std::future<std::invoke_result_t<std::decay_t<Func>>>
        {
            std::scoped_lock lock(mutex_);
            if (finalized_)
                return refused<std::invoke_result_t<std::decay_t<Func>>>();
            finalized_ = true;
            return processingThread_->pushPromiseTask(std::forward<Func>(func));
        }

        bool withinProcessingThread() const
        {
            return processingThread_->withinProcessingThread();
        }

        bool isFinalized() const
        {
            std::scoped_lock lock(mutex_);
            return finalized_;
        }

      private:
        template <typename T>
        static std::future<T> refused()
        {
            std::promise<T> promise{};
            promise.set_exception(std::make_exception_ptr(std::runtime_error("Cannot push task to finalized strand.")));
            return promise.get_future();
        }

      private:
        mutable std::recursive_mutex mutex_{};
        bool finalized_ = false;
        ProcessingThread* processingThread_{};
    };
}
