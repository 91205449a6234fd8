#include <remote_dispatch/transport_session.hpp>

#include <log/log.hpp>

#include <fmt/format.h>

#include <exception>
#include <future>

namespace RemoteDispatch
{
    std::string_view transportStateToString(TransportSession::State state)
    {
        using enum TransportSession::State;
        switch (state)
        {
            case Unconnected:
                return "Unconnected";
            case Authenticating:
                return "Authenticating";
            case Established:
                return "Established";
            case Closed:
                return "Closed";
            case Failed:
                return "Failed";
        }
        return "Unknown";
    }

    TransportSession::TransportSession(
        std::unique_ptr<ITransport> transport,
        std::chrono::milliseconds channelCloseTimeout)
        : transport_{std::move(transport)}
        , channelCloseTimeout_{channelCloseTimeout}
    {}

    TransportSession::~TransportSession()
    {
        const auto report = teardown(channelCloseTimeout_);
        if (!report.warnings.empty())
            Log::warn("TransportSession: {} warnings during implicit teardown.", report.warnings.size());
    }

    void TransportSession::enterState(State newState)
    {
        Log::debug("TransportSession: {} -> {}", transportStateToString(state_), transportStateToString(newState));
        state_ = newState;
    }

    void TransportSession::enterFailedState(Error error)
    {
        Log::error("TransportSession: Failed: {}", error.toString());
        enterState(State::Failed);
        failure_ = std::move(error);
    }

    std::expected<void, Error> TransportSession::establish(RemoteHost const& host, Credential const& credential)
    {
        {
            std::scoped_lock lock{mutex_};
            if (state_ != State::Unconnected)
            {
                return std::unexpected(makeError(
                    ErrorKind::State,
                    fmt::format("Cannot establish a session in state {}", transportStateToString(state_))));
            }
            enterState(State::Authenticating);
        }

        // The handshake runs without holding the lock, so teardown can interrupt it.
        Log::info("TransportSession: Connecting to {} with {}", host.toString(), describeCredential(credential));
        auto result = transport_->connect(host).and_then([this, &credential]() {
            return transport_->authenticate(credential);
        });

        std::scoped_lock lock{mutex_};
        if (state_ != State::Authenticating)
        {
            transport_->disconnect();
            return std::unexpected(
                makeError(ErrorKind::State, "The session was torn down while it was being established"));
        }

        if (!result)
        {
            transport_->disconnect();
            auto error = std::move(result).error();
            if (error.kind != ErrorKind::Connect && error.kind != ErrorKind::Auth)
                error = reclassify(error, ErrorKind::Connect, host.toString());
            enterFailedState(error);
            return std::unexpected(std::move(error));
        }

        enterState(State::Established);
        Log::info("TransportSession: Established session to {} as '{}'", host.toString(), credentialUser(credential));
        return {};
    }

    template <typename ChannelT>
    std::expected<ChannelHandle<ChannelT>, Error> TransportSession::openChannel(
        std::string_view kind,
        std::expected<std::shared_ptr<ChannelT>, Error> (ITransport::*open)())
    {
        {
            std::scoped_lock lock{mutex_};
            if (state_ != State::Established)
            {
                return std::unexpected(makeError(
                    ErrorKind::State,
                    fmt::format("Cannot open {} channel in state {}", kind, transportStateToString(state_))));
            }
        }

        // May block until the remote grants the channel.
        auto channel = ((*transport_).*open)();
        if (!channel)
        {
            Log::error("TransportSession: Failed to open {} channel: {}", kind, channel.error().toString());
            return std::unexpected(std::move(channel).error());
        }

        const auto id = Ids::generateChannelId();
        bool registered = false;
        {
            std::scoped_lock lock{mutex_};
            if (state_ == State::Established)
            {
                channels_.emplace(id, *channel);
                registered = true;
            }
        }
        if (!registered)
        {
            // Teardown raced with the open. The fresh channel must not outlive the session.
            if (auto problem = closeAndWait(*channel, channelCloseTimeout_); problem)
                Log::warn("TransportSession: Unregistered {} channel {}", kind, *problem);
            return std::unexpected(makeError(
                ErrorKind::State, fmt::format("Session left the Established state while opening {} channel", kind)));
        }
        Log::debug("TransportSession: Opened {} channel {}", kind, id.value());
        return ChannelHandle<ChannelT>{weak_from_this(), id, std::move(channel).value()};
    }

    std::expected<ChannelHandle<IExecChannel>, Error> TransportSession::openExecChannel()
    {
        return openChannel<IExecChannel>("exec", &ITransport::openExecChannel);
    }

    std::expected<ChannelHandle<ISftpChannel>, Error> TransportSession::openSftpChannel()
    {
        return openChannel<ISftpChannel>("sftp", &ITransport::openSftpChannel);
    }

    std::optional<std::string>
    TransportSession::closeAndWait(std::shared_ptr<IChannel> const& channel, std::chrono::milliseconds timeout)
    {
        auto future = channel->close();
        if (future.wait_for(timeout) != std::future_status::ready)
            return fmt::format("did not close within {}ms", timeout.count());

        try
        {
            if (auto result = future.get(); !result)
                return result.error().toString();
        }
        catch (std::exception const& exc)
        {
            return std::string{exc.what()};
        }
        return std::nullopt;
    }

    bool TransportSession::closeChannel(Ids::ChannelId const& id)
    {
        std::shared_ptr<IChannel> channel{};
        {
            std::scoped_lock lock{mutex_};
            auto iter = channels_.find(id);
            if (iter == channels_.end())
                return false;
            channel = std::move(iter->second);
            channels_.erase(iter);
        }

        if (auto problem = closeAndWait(channel, channelCloseTimeout_); problem)
            Log::warn("TransportSession: Channel {} {}", id.value(), *problem);
        else
            Log::debug("TransportSession: Closed channel {}", id.value());
        return true;
    }

    TeardownReport TransportSession::teardown(std::chrono::milliseconds closeTimeout)
    {
        std::unordered_map<Ids::ChannelId, std::shared_ptr<IChannel>, Ids::IdHash> channels{};
        {
            std::scoped_lock lock{mutex_};
            if (state_ == State::Closed)
                return {};
            enterState(State::Closed);
            channels = std::move(channels_);
            channels_.clear();
        }

        TeardownReport report{};
        for (auto const& [id, channel] : channels)
        {
            if (auto problem = closeAndWait(channel, closeTimeout); problem)
            {
                auto warning = fmt::format("Channel {} {}", id.value(), *problem);
                Log::warn("TransportSession: {}", warning);
                report.warnings.push_back(std::move(warning));
            }
            ++report.channelsClosed;
        }

        transport_->disconnect();
        Log::info("TransportSession: Torn down, {} channels closed.", report.channelsClosed);
        return report;
    }

    TransportSession::State TransportSession::state() const
    {
        std::scoped_lock lock{mutex_};
        return state_;
    }

    std::optional<Error> TransportSession::failure() const
    {
        std::scoped_lock lock{mutex_};
        return failure_;
    }

    std::size_t TransportSession::liveChannelCount() const
    {
        std::scoped_lock lock{mutex_};
        return channels_.size();
    }
}
