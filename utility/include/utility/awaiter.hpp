#pragma once

#include <atomic>
#include <chrono>
#include <future>

namespace Utility
{
    /**
     * @brief Becomes ready once arrive() was called the given number of times. For synchronizing tests with
     * background threads.
     */
    class Awaiter
    {
      public:
        explicit Awaiter(int maxCount = 1)
            : maxCount_(maxCount)
            , future_{promise_.get_future().share()}
        {}

        bool waitFor(std::chrono::milliseconds const& duration = std::chrono::seconds{1}) const
        {
            return future_.wait_for(duration) == std::future_status::ready;
        }

        void wait() const
        {
            future_.wait();
        }

        void arrive()
        {
            if (++counter_ == maxCount_)
                promise_.set_value();
        }

      private:
        const int maxCount_{0};
        std::atomic_int counter_ = 0;
        std::promise<void> promise_{};
        std::shared_future<void> future_;
    };
}
