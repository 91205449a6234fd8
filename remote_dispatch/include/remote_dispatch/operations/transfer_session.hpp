#pragma once

#include <remote_dispatch/file_information.hpp>
#include <remote_dispatch/operations/channel_operation.hpp>

#include <filesystem>
#include <mutex>
#include <vector>

namespace RemoteDispatch
{
    constexpr auto defaultDirectoryMode = std::filesystem::perms::owner_all | std::filesystem::perms::group_read |
        std::filesystem::perms::group_exec | std::filesystem::perms::others_read | std::filesystem::perms::others_exec;

    /**
     * @brief A long lived sftp channel for remote file management.
     * Primitives fail with a SessionError unless connected, remote failures are reported as RemoteFSError.
     */
    class TransferSession : public ChannelOperation
    {
      public:
        explicit TransferSession(std::shared_ptr<TransportSession> session);
        ~TransferSession() override;

        Type type() const override
        {
            return Type::Transfer;
        }

        /**
         * @brief Opens the sftp channel. A channel that is still open is kept, a channel closed from elsewhere
         * is replaced.
         */
        std::expected<void, Error> connect();

        /**
         * @brief Creates a directory. Fails if anything exists at path already.
         */
        std::expected<void, Error>
        mkdir(std::filesystem::path const& path, std::filesystem::perms permissions = defaultDirectoryMode);

        /**
         * @brief Removes a single file. Directories are refused.
         */
        std::expected<void, Error> remove(std::filesystem::path const& path);

        /**
         * @brief Removes an empty directory.
         */
        std::expected<void, Error> rmdir(std::filesystem::path const& path);

        std::expected<FileInformation, Error> stat(std::filesystem::path const& path);
        std::expected<bool, Error> exists(std::filesystem::path const& path);
        std::expected<bool, Error> isDirectory(std::filesystem::path const& path);

        /**
         * @brief Lists a directory without "." and "..", sorted by name.
         */
        std::expected<std::vector<FileInformation>, Error> listDirectory(std::filesystem::path const& path);

        /**
         * @brief Releases the channel. Idempotent, no primitive works afterwards.
         */
        void close();

        bool isOpen() const;
        bool isClosed() const;

      private:
        std::expected<ISftpChannel*, Error> channel(std::string_view primitive);

      private:
        mutable std::recursive_mutex mutex_{};
        ChannelHandle<ISftpChannel> channel_{};
        bool closed_{false};
    };
}
