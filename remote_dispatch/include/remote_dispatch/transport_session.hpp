#pragma once

#include <remote_dispatch/credential.hpp>
#include <remote_dispatch/error.hpp>
#include <remote_dispatch/remote_host.hpp>
#include <remote_dispatch/transport/transport.hpp>

#include <ids/ids.hpp>

#include <chrono>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace RemoteDispatch
{
    class TransportSession;

    struct TeardownReport
    {
        std::size_t channelsClosed = 0;
        // Channels that failed to close or did not close in time.
        std::vector<std::string> warnings{};

        bool empty() const
        {
            return channelsClosed == 0 && warnings.empty();
        }
    };

    /**
     * @brief Owns one live channel for the duration of an operation.
     * The channel is deregistered from the session and closed when the handle is released or destroyed.
     */
    template <typename ChannelT>
    class ChannelHandle
    {
      public:
        ChannelHandle() = default;
        ChannelHandle(std::weak_ptr<TransportSession> owner, Ids::ChannelId id, std::shared_ptr<ChannelT> channel)
            : owner_{std::move(owner)}
            , id_{std::move(id)}
            , channel_{std::move(channel)}
        {}
        ~ChannelHandle()
        {
            release();
        }
        ChannelHandle(ChannelHandle const&) = delete;
        ChannelHandle& operator=(ChannelHandle const&) = delete;
        ChannelHandle(ChannelHandle&& other) noexcept
            : owner_{std::move(other.owner_)}
            , id_{std::exchange(other.id_, Ids::ChannelId{})}
            , channel_{std::move(other.channel_)}
        {}
        ChannelHandle& operator=(ChannelHandle&& other) noexcept
        {
            if (this != &other)
            {
                release();
                owner_ = std::move(other.owner_);
                id_ = std::exchange(other.id_, Ids::ChannelId{});
                channel_ = std::move(other.channel_);
            }
            return *this;
        }

        ChannelT* operator->() const
        {
            return channel_.get();
        }
        ChannelT& operator*() const
        {
            return *channel_;
        }
        explicit operator bool() const
        {
            return static_cast<bool>(channel_);
        }

        Ids::ChannelId const& id() const
        {
            return id_;
        }

        /**
         * @brief Deregisters and closes the channel. Does nothing if already released.
         */
        void release();

      private:
        std::weak_ptr<TransportSession> owner_{};
        Ids::ChannelId id_{};
        std::shared_ptr<ChannelT> channel_{};
    };

    /**
     * @brief The single authenticated connection to the remote host and the registry of its live channels.
     * Unconnected -> Authenticating -> Established -> Closed, any failure during establishment ends in Failed.
     */
    class TransportSession : public std::enable_shared_from_this<TransportSession>
    {
      public:
        enum class State
        {
            Unconnected,
            Authenticating,
            Established,
            Closed,
            Failed
        };

        /**
         * @param transport The connection implementation.
         * @param channelCloseTimeout How long releasing a single channel may wait for the close to complete.
         */
        TransportSession(
            std::unique_ptr<ITransport> transport,
            std::chrono::milliseconds channelCloseTimeout = std::chrono::milliseconds{5000});
        ~TransportSession();
        TransportSession(TransportSession const&) = delete;
        TransportSession& operator=(TransportSession const&) = delete;
        TransportSession(TransportSession&&) = delete;
        TransportSession& operator=(TransportSession&&) = delete;

        /**
         * @brief Connects and authenticates. Only allowed once, in the Unconnected state.
         * A failure is terminal, the session ends up in the Failed state and is never retried.
         */
        std::expected<void, Error> establish(RemoteHost const& host, Credential const& credential);

        /**
         * @brief Opens a channel. Fails with a StateError without touching the transport unless Established.
         */
        std::expected<ChannelHandle<IExecChannel>, Error> openExecChannel();
        std::expected<ChannelHandle<ISftpChannel>, Error> openSftpChannel();

        /**
         * @brief Closes a single live channel out of band. Used for cancellation.
         *
         * @return true If the channel was live.
         */
        bool closeChannel(Ids::ChannelId const& id);

        /**
         * @brief Closes all live channels, then the connection. Idempotent.
         *
         * @param closeTimeout The time to wait for each channel.
         * @return Channel close failures, which are warnings only.
         */
        TeardownReport teardown(std::chrono::milliseconds closeTimeout);

        State state() const;

        /**
         * @brief The reason for the Failed state.
         */
        std::optional<Error> failure() const;

        std::size_t liveChannelCount() const;

      private:
        template <typename ChannelT>
        std::expected<ChannelHandle<ChannelT>, Error>
        openChannel(std::string_view kind, std::expected<std::shared_ptr<ChannelT>, Error> (ITransport::*open)());

        void enterState(State newState);
        void enterFailedState(Error error);
        std::optional<std::string> closeAndWait(std::shared_ptr<IChannel> const& channel, std::chrono::milliseconds timeout);

      private:
        mutable std::mutex mutex_{};
        std::unique_ptr<ITransport> transport_;
        std::chrono::milliseconds channelCloseTimeout_;
        State state_{State::Unconnected};
        std::optional<Error> failure_{std::nullopt};
        std::unordered_map<Ids::ChannelId, std::shared_ptr<IChannel>, Ids::IdHash> channels_{};
    };

    std::string_view transportStateToString(TransportSession::State state);

    template <typename ChannelT>
    void ChannelHandle<ChannelT>::release()
    {
        if (!channel_)
            return;

        if (auto owner = owner_.lock(); owner)
            owner->closeChannel(id_);
        channel_.reset();
        owner_.reset();
    }
}
