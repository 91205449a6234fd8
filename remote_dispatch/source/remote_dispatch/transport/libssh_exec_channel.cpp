#include <remote_dispatch/transport/libssh_exec_channel.hpp>
#include <remote_dispatch/transport/libssh_errors.hpp>

#include <log/log.hpp>

#include <algorithm>
#include <cstdint>
#include <exception>
#include <limits>

namespace RemoteDispatch
{
    LibSshExecChannel::LibSshExecChannel(
        std::unique_ptr<ProcessingStrand> strand,
        std::unique_ptr<ssh::Channel> channel,
        ssh_session session)
        : strand_{std::move(strand)}
        , channel_{std::move(channel)}
        , session_{session}
    {}

    LibSshExecChannel::~LibSshExecChannel()
    {
        if (!strand_->isFinalized())
            close().wait();
    }

    template <typename T, typename FunctionT>
    std::expected<T, Error> LibSshExecChannel::perform(FunctionT&& func)
    {
        auto future = strand_->pushPromiseTask(std::forward<FunctionT>(func));
        try
        {
            return future.get();
        }
        catch (std::exception const&)
        {
            return std::unexpected(channelClosedError(ErrorKind::Exec));
        }
    }

    std::expected<void, Error> LibSshExecChannel::requestExec(std::string const& command)
    {
        return perform<void>([this, command]() -> std::expected<void, Error> {
            if (!channel_)
                return std::unexpected(channelClosedError(ErrorKind::Exec));
            if (channel_->requestExec(command.c_str()) != SSH_OK)
                return std::unexpected(lastLibSshError(ErrorKind::Exec, session_, nullptr, "Exec request"));
            return {};
        });
    }

    std::expected<ReadResult, Error>
    LibSshExecChannel::readSome(StreamKind stream, std::span<char> buffer, std::chrono::milliseconds timeout)
    {
        return perform<ReadResult>([this, stream, buffer, timeout]() -> std::expected<ReadResult, Error> {
            if (!channel_)
                return std::unexpected(channelClosedError(ErrorKind::Exec));

            auto* channel = channel_->getCChannel();
            const auto count = ssh_channel_read_timeout(
                channel,
                buffer.data(),
                static_cast<std::uint32_t>(std::min<std::size_t>(buffer.size(), std::numeric_limits<std::uint32_t>::max())),
                stream == StreamKind::Stderr ? 1 : 0,
                static_cast<int>(timeout.count()));

            if (count == SSH_ERROR)
                return std::unexpected(lastLibSshError(ErrorKind::Exec, session_, nullptr, "Reading from channel"));
            if (count > 0)
                return ReadResult{.bytes = static_cast<std::size_t>(count), .eof = false};
            return ReadResult{.bytes = 0, .eof = ssh_channel_is_eof(channel) != 0};
        });
    }

    std::expected<std::optional<int>, Error> LibSshExecChannel::exitStatus()
    {
        return perform<std::optional<int>>([this]() -> std::expected<std::optional<int>, Error> {
            if (!channel_)
                return std::unexpected(channelClosedError(ErrorKind::Exec));

            // -1 when the server sent exit-signal instead of exit-status.
            const auto status = channel_->getExitStatus();
            if (status < 0)
                return std::nullopt;
            return status;
        });
    }

    std::future<std::expected<void, Error>> LibSshExecChannel::close()
    {
        if (strand_->isFinalized())
        {
            std::promise<std::expected<void, Error>> promise{};
            promise.set_value({});
            return promise.get_future();
        }

        return strand_->pushFinalPromiseTask([this]() -> std::expected<void, Error> {
            if (!channel_)
                return {};

            int result = SSH_OK;
            if (channel_->isOpen())
            {
                if (channel_->sendEof() != SSH_OK)
                    Log::debug("LibSshExecChannel: Sending eof failed: {}", ssh_get_error(session_));
                result = channel_->close();
            }
            channel_.reset();
            if (result != SSH_OK)
                return std::unexpected(lastLibSshError(ErrorKind::Exec, session_, nullptr, "Closing channel"));
            return {};
        });
    }

    bool LibSshExecChannel::isOpen() const
    {
        return !strand_->isFinalized();
    }
}
