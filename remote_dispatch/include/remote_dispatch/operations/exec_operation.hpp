#pragma once

#include <remote_dispatch/operations/channel_operation.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace RemoteDispatch
{
    struct ExecResult
    {
        std::string standardOutput{};
        std::string standardError{};
        // Empty if the command terminated without an exit status, for instance by a signal.
        std::optional<int> exitStatus{0};
    };

    struct ExecOperationOptions
    {
        std::string command{};
        // How long a single read waits for data on one stream before switching to the other.
        std::chrono::milliseconds pollTimeout{50};
        std::size_t bufferSize = 4096;
    };

    /**
     * @brief Runs one command on its own exec channel and collects both output streams and the exit status.
     * A non zero exit status is a regular result, ExecError is reserved for transport failures.
     */
    class ExecOperation : public ChannelOperation
    {
      public:
        ExecOperation(std::shared_ptr<TransportSession> session, ExecOperationOptions options);

        Type type() const override
        {
            return Type::Exec;
        }

        std::expected<ExecResult, Error> perform();

      private:
        std::expected<void, Error> drain(IExecChannel& channel, ExecResult& result);

      private:
        ExecOperationOptions options_;
    };
}
