#include <remote_dispatch/operations/channel_operation.hpp>

#include <log/log.hpp>

namespace RemoteDispatch
{
    std::string_view operationStateToString(ChannelOperation::State state)
    {
        using enum ChannelOperation::State;
        switch (state)
        {
            case NotStarted:
                return "NotStarted";
            case Running:
                return "Running";
            case Completed:
                return "Completed";
            case Failed:
                return "Failed";
            case Canceled:
                return "Canceled";
        }
        return "Unknown";
    }

    ChannelOperation::ChannelOperation(std::shared_ptr<TransportSession> session)
        : session_{std::move(session)}
        , id_{Ids::generateOperationId()}
    {}

    ChannelOperation::State ChannelOperation::state() const
    {
        std::scoped_lock lock{mutex_};
        return state_;
    }

    bool ChannelOperation::cancelRequested() const
    {
        std::scoped_lock lock{mutex_};
        return cancelRequested_;
    }

    void ChannelOperation::enterState(State newState)
    {
        std::scoped_lock lock{mutex_};
        Log::trace(
            "Operation {}: {} -> {}", id_.value(), operationStateToString(state_), operationStateToString(newState));
        state_ = newState;
    }

    void ChannelOperation::cancel()
    {
        std::optional<Ids::ChannelId> channelId{};
        {
            std::scoped_lock lock{mutex_};
            cancelRequested_ = true;
            if (state_ == State::NotStarted)
                state_ = State::Canceled;
            channelId = channelId_;
        }

        Log::info("Operation {}: Cancel requested.", id_.value());
        if (channelId)
            session_->closeChannel(*channelId);
    }

    bool ChannelOperation::bindChannel(Ids::ChannelId const& id)
    {
        std::scoped_lock lock{mutex_};
        channelId_ = id;
        return !cancelRequested_;
    }

    void ChannelOperation::unbindChannel()
    {
        std::scoped_lock lock{mutex_};
        channelId_.reset();
    }

    void ChannelOperation::clearCancelRequest()
    {
        std::scoped_lock lock{mutex_};
        cancelRequested_ = false;
    }
}
