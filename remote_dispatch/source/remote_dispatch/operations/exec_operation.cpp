#include <remote_dispatch/operations/exec_operation.hpp>

#include <log/log.hpp>

#include <fmt/format.h>

#include <array>
#include <vector>

namespace RemoteDispatch
{
    namespace
    {
        Error execError(Error const& error, std::string_view context)
        {
            // Lifecycle errors keep their kind, everything else is a transport failure.
            if (error.kind == ErrorKind::State)
                return error;
            return reclassify(error, ErrorKind::Exec, context);
        }
    }

    ExecOperation::ExecOperation(std::shared_ptr<TransportSession> session, ExecOperationOptions options)
        : ChannelOperation{std::move(session)}
        , options_{std::move(options)}
    {
        if (options_.bufferSize == 0)
            options_.bufferSize = 4096;
        // A non positive timeout would either block the processing thread or spin it.
        if (options_.pollTimeout <= std::chrono::milliseconds{0})
            options_.pollTimeout = std::chrono::milliseconds{50};
    }

    std::expected<ExecResult, Error> ExecOperation::perform()
    {
        if (const auto current = state(); current != State::NotStarted)
        {
            if (current == State::Canceled)
                return std::unexpected(makeError(ErrorKind::Exec, "Execution was canceled before it started"));
            return std::unexpected(makeError(
                ErrorKind::State, fmt::format("Exec operation cannot run in state {}", operationStateToString(current))));
        }
        enterState(State::Running);
        Log::info("ExecOperation {}: Executing '{}'", id().value(), options_.command);

        auto channel = session_->openExecChannel();
        if (!channel)
            return enterErrorState<ExecResult>(execError(channel.error(), "Cannot open exec channel"));

        if (!bindChannel(channel->id()))
            return enterErrorState<ExecResult>(makeError(ErrorKind::Exec, "Execution was canceled"));

        auto result = [&]() -> std::expected<ExecResult, Error> {
            ExecResult collected{};
            if (auto requested = (*channel)->requestExec(options_.command); !requested)
                return std::unexpected(execError(requested.error(), "Exec request failed"));

            if (auto drained = drain(**channel, collected); !drained)
                return std::unexpected(std::move(drained).error());

            auto exitStatus = (*channel)->exitStatus();
            if (!exitStatus)
                return std::unexpected(execError(exitStatus.error(), "Cannot retrieve exit status"));
            collected.exitStatus = *exitStatus;
            return collected;
        }();

        unbindChannel();
        channel->release();

        if (!result)
        {
            Log::error("ExecOperation {}: {}", id().value(), result.error().toString());
            if (cancelRequested())
                return enterErrorState<ExecResult>(reclassify(result.error(), ErrorKind::Exec, "Execution was canceled"));
            return enterErrorState<ExecResult>(std::move(result).error());
        }

        if (result->exitStatus)
            Log::info("ExecOperation {}: '{}' exited with {}", id().value(), options_.command, *result->exitStatus);
        else
            Log::warn("ExecOperation {}: '{}' terminated without exit status", id().value(), options_.command);
        enterState(State::Completed);
        return result;
    }

    std::expected<void, Error> ExecOperation::drain(IExecChannel& channel, ExecResult& result)
    {
        std::vector<char> buffer(options_.bufferSize);
        struct Stream
        {
            StreamKind kind;
            std::string* sink;
            bool eof;
        };
        std::array<Stream, 2> streams{{
            {StreamKind::Stdout, &result.standardOutput, false},
            {StreamKind::Stderr, &result.standardError, false},
        }};

        while (!streams[0].eof || !streams[1].eof)
        {
            for (auto& stream : streams)
            {
                if (stream.eof)
                    continue;

                auto read = channel.readSome(stream.kind, buffer, options_.pollTimeout);
                if (!read)
                    return std::unexpected(execError(read.error(), "Reading command output failed"));

                stream.sink->append(buffer.data(), read->bytes);
                stream.eof = read->eof;
            }
        }
        return {};
    }
}
