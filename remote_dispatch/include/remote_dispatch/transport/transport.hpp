#pragma once

#include <remote_dispatch/credential.hpp>
#include <remote_dispatch/error.hpp>
#include <remote_dispatch/file_information.hpp>
#include <remote_dispatch/remote_host.hpp>

#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace RemoteDispatch
{
    enum class StreamKind
    {
        Stdout,
        Stderr
    };

    struct ReadResult
    {
        std::size_t bytes = 0;
        // The stream reached its end, no more data will follow.
        bool eof = false;
    };

    /**
     * @brief A channel multiplexed over an ssh session.
     */
    class IChannel
    {
      public:
        IChannel() = default;
        virtual ~IChannel() = default;
        IChannel(IChannel const&) = delete;
        IChannel& operator=(IChannel const&) = delete;
        IChannel(IChannel&&) = delete;
        IChannel& operator=(IChannel&&) = delete;

        /**
         * @brief Closes the channel. May be called from any thread, also while another thread is blocked in a read.
         * Blocked and subsequent calls on the channel fail with RemoteErrorCode::ChannelClosed.
         * Closing twice is harmless, the second future completes immediately.
         *
         * @return A future so the caller can bound the wait.
         */
        virtual std::future<std::expected<void, Error>> close() = 0;

        virtual bool isOpen() const = 0;
    };

    class IExecChannel : public IChannel
    {
      public:
        virtual std::expected<void, Error> requestExec(std::string const& command) = 0;

        /**
         * @brief Reads what is available on one of the output streams.
         *
         * @param stream stdout or stderr.
         * @param buffer Receives the data.
         * @param timeout How long to wait for data, returns with 0 bytes and no eof when nothing arrived.
         */
        virtual std::expected<ReadResult, Error>
        readSome(StreamKind stream, std::span<char> buffer, std::chrono::milliseconds timeout) = 0;

        /**
         * @brief Exit status of the remote command. Only meaningful after both streams reached eof.
         *
         * @return std::nullopt if the command ended without one, which happens when it was killed by a signal.
         */
        virtual std::expected<std::optional<int>, Error> exitStatus() = 0;
    };

    class IRemoteFile
    {
      public:
        IRemoteFile() = default;
        virtual ~IRemoteFile() = default;
        IRemoteFile(IRemoteFile const&) = delete;
        IRemoteFile& operator=(IRemoteFile const&) = delete;
        IRemoteFile(IRemoteFile&&) = delete;
        IRemoteFile& operator=(IRemoteFile&&) = delete;

        /**
         * @brief Writes the data completely or fails.
         */
        virtual std::expected<void, Error> write(std::span<char const> data) = 0;
        virtual std::expected<void, Error> close() = 0;
    };

    class ISftpChannel : public IChannel
    {
      public:
        virtual std::expected<FileInformation, Error> stat(std::filesystem::path const& path) = 0;
        virtual std::expected<FileInformation, Error> lstat(std::filesystem::path const& path) = 0;

        /**
         * @brief Lists a directory without "." and "..".
         */
        virtual std::expected<std::vector<FileInformation>, Error>
        listDirectory(std::filesystem::path const& path) = 0;

        virtual std::expected<void, Error>
        makeDirectory(std::filesystem::path const& path, std::filesystem::perms permissions) = 0;
        virtual std::expected<void, Error> removeFile(std::filesystem::path const& path) = 0;
        virtual std::expected<void, Error> removeDirectory(std::filesystem::path const& path) = 0;
        virtual std::expected<void, Error>
        chmod(std::filesystem::path const& path, std::filesystem::perms permissions) = 0;

        /**
         * @brief Opens a file for writing, it is created or truncated.
         */
        virtual std::expected<std::unique_ptr<IRemoteFile>, Error>
        openForWrite(std::filesystem::path const& path, std::filesystem::perms permissions) = 0;
    };

    /**
     * @brief The ssh connection. Implementations must allow the channel functions and disconnect to be called
     * from multiple threads.
     */
    class ITransport
    {
      public:
        ITransport() = default;
        virtual ~ITransport() = default;
        ITransport(ITransport const&) = delete;
        ITransport& operator=(ITransport const&) = delete;
        ITransport(ITransport&&) = delete;
        ITransport& operator=(ITransport&&) = delete;

        /**
         * @brief Connects and performs the key exchange. Fails with a ConnectError.
         */
        virtual std::expected<void, Error> connect(RemoteHost const& host) = 0;

        /**
         * @brief Authenticates the connection. Fails with an AuthError if the credential is rejected.
         */
        virtual std::expected<void, Error> authenticate(Credential const& credential) = 0;

        virtual std::expected<std::shared_ptr<IExecChannel>, Error> openExecChannel() = 0;
        virtual std::expected<std::shared_ptr<ISftpChannel>, Error> openSftpChannel() = 0;

        /**
         * @brief Ends the connection. Idempotent.
         */
        virtual void disconnect() = 0;
    };
}
