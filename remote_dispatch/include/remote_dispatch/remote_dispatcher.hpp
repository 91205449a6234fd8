#pragma once

#include <remote_dispatch/credential.hpp>
#include <remote_dispatch/error.hpp>
#include <remote_dispatch/file_information.hpp>
#include <remote_dispatch/key_loader.hpp>
#include <remote_dispatch/local_file_system.hpp>
#include <remote_dispatch/operations/copy_operation.hpp>
#include <remote_dispatch/operations/exec_operation.hpp>
#include <remote_dispatch/operations/transfer_session.hpp>
#include <remote_dispatch/remote_host.hpp>
#include <remote_dispatch/transport/transport.hpp>
#include <remote_dispatch/transport_session.hpp>

#include <persistence/state/dispatcher_options.hpp>

#include <chrono>
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace RemoteDispatch
{
    /**
     * @brief Runs copies, commands and a transfer session against one remote host over one authenticated session.
     * Only ever exists in a ready state, see makeDispatcher. After close() every call fails with a ClosedError.
     */
    class RemoteDispatcher
    {
      public:
        struct Settings
        {
            std::chrono::milliseconds channelCloseTimeout{5000};
            std::chrono::milliseconds execPollTimeout{50};
            std::size_t copyChunkSize = 32768;
        };

        RemoteDispatcher(
            RemoteHost host,
            std::string user,
            Settings settings,
            std::shared_ptr<TransportSession> session,
            std::shared_ptr<ILocalFileSystem const> fileSystem);
        ~RemoteDispatcher();
        RemoteDispatcher(RemoteDispatcher const&) = delete;
        RemoteDispatcher& operator=(RemoteDispatcher const&) = delete;
        RemoteDispatcher(RemoteDispatcher&&) = delete;
        RemoteDispatcher& operator=(RemoteDispatcher&&) = delete;

        /**
         * @brief Copies a local file, directory tree or glob pattern to the remote host.
         */
        std::expected<CopyReport, Error> copy(std::string const& source, std::filesystem::path const& destination);

        /**
         * @brief Runs a command. Safe to call concurrently, every call gets its own channel.
         */
        std::expected<ExecResult, Error> execute(std::string const& command);

        /**
         * @brief Opens the transfer session, or returns the one that is already open.
         */
        std::expected<std::weak_ptr<TransferSession>, Error> connect();

        std::expected<void, Error>
        mkdir(std::filesystem::path const& path, std::filesystem::perms permissions = defaultDirectoryMode);
        std::expected<void, Error> remove(std::filesystem::path const& path);
        std::expected<void, Error> rmdir(std::filesystem::path const& path);
        std::expected<FileInformation, Error> stat(std::filesystem::path const& path);
        std::expected<bool, Error> exists(std::filesystem::path const& path);
        std::expected<bool, Error> isDirectory(std::filesystem::path const& path);
        std::expected<std::vector<FileInformation>, Error> listDirectory(std::filesystem::path const& path);

        /**
         * @brief Closes the transfer session, then the connection. Idempotent.
         */
        TeardownReport close();

        bool isClosed() const;

        RemoteHost const& host() const
        {
            return host_;
        }

        std::string const& user() const
        {
            return user_;
        }

        std::size_t liveChannelCount() const;

      private:
        std::expected<void, Error> checkOpen(std::string_view what) const;
        std::expected<std::shared_ptr<TransferSession>, Error> transferSession(std::string_view what) const;

      private:
        RemoteHost host_;
        std::string user_;
        Settings settings_;
        std::shared_ptr<TransportSession> session_;
        std::shared_ptr<ILocalFileSystem const> fileSystem_;

        mutable std::mutex mutex_{};
        bool closed_{false};
        std::shared_ptr<TransferSession> transferSession_{};
    };

    /**
     * @brief Resolves the credential and establishes the session with the given collaborators.
     */
    std::expected<std::unique_ptr<RemoteDispatcher>, Error> makeDispatcher(
        Persistence::DispatcherOptions const& options,
        std::unique_ptr<ITransport> transport,
        std::shared_ptr<IKeyLoader const> keyLoader,
        std::shared_ptr<ILocalFileSystem const> fileSystem);

    /**
     * @brief Creates a dispatcher using libssh and the local filesystem.
     */
    std::expected<std::unique_ptr<RemoteDispatcher>, Error> makeDispatcher(Persistence::DispatcherOptions const& options);
}
