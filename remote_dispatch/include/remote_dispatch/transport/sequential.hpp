#pragma once

namespace RemoteDispatch::Detail
{
    /**
     * @brief Outcome of a chain of libssh calls.
     */
    struct SequenceResult
    {
        int result{0};
        // The 1 based position of the last function that ran.
        int index{0};
        int total{0};

        bool reachedEnd() const
        {
            return index == total;
        }
        bool success() const
        {
            return result == 0;
        }
    };

    /**
     * @brief Calls the functions in order until one of them returns non zero.
     */
    template <typename... T>
    SequenceResult sequential(T&&... functions)
    {
        int result = 0;
        int index = 0;

        const auto single = [&](auto&& fn) {
            ++index;
            result = fn();
            return result;
        };

        [[maybe_unused]] const bool allRan = ((single(functions) == 0) && ...);

        return {result, index, static_cast<int>(sizeof...(functions))};
    }
}
