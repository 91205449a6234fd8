#pragma once

#include <remote_dispatch/error.hpp>
#include <remote_dispatch/transport_session.hpp>

#include <ids/ids.hpp>

#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

namespace RemoteDispatch
{
    /**
     * @brief One unit of work carried out over its own channel of a TransportSession.
     */
    class ChannelOperation
    {
      public:
        enum class Type
        {
            Copy,
            Exec,
            Transfer
        };

        enum class State
        {
            NotStarted,
            Running,
            Completed,
            Failed,
            Canceled
        };

        explicit ChannelOperation(std::shared_ptr<TransportSession> session);
        ChannelOperation(ChannelOperation const&) = delete;
        ChannelOperation& operator=(ChannelOperation const&) = delete;
        ChannelOperation(ChannelOperation&&) = delete;
        ChannelOperation& operator=(ChannelOperation&&) = delete;
        virtual ~ChannelOperation() = default;

        virtual Type type() const = 0;

        Ids::OperationId const& id() const
        {
            return id_;
        }

        State state() const;

        /**
         * @brief Closes the channel of the operation out of band. Work in flight fails with the error kind of
         * the operation instead of hanging. An operation that has not started yet will not start.
         */
        void cancel();

        bool cancelRequested() const;

      protected:
        void enterState(State newState);

        /**
         * @brief Enters Failed, or Canceled if the failure was caused by cancel().
         */
        template <typename T = void>
        std::expected<T, Error> enterErrorState(Error error)
        {
            enterState(cancelRequested() ? State::Canceled : State::Failed);
            return std::unexpected(std::move(error));
        }

        /**
         * @brief Remembers the channel in use, so cancel() can close it.
         *
         * @return false If a cancel was requested already.
         */
        bool bindChannel(Ids::ChannelId const& id);
        void unbindChannel();

        /**
         * @brief Accepts work again after a cancel, for operations that outlive a single channel.
         */
        void clearCancelRequest();

      protected:
        std::shared_ptr<TransportSession> session_;

      private:
        mutable std::mutex mutex_{};
        Ids::OperationId id_;
        State state_{State::NotStarted};
        bool cancelRequested_{false};
        std::optional<Ids::ChannelId> channelId_{std::nullopt};
    };

    std::string_view operationStateToString(ChannelOperation::State state);
}
