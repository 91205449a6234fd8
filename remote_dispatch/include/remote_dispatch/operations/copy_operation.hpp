#pragma once

#include <remote_dispatch/local_file_system.hpp>
#include <remote_dispatch/operations/channel_operation.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace RemoteDispatch
{
    struct CopyTask
    {
        enum class Mode
        {
            File,
            Directory,
            Pattern
        };

        std::filesystem::path source{};
        std::filesystem::path destination{};
        Mode mode{Mode::File};
        // Expanded pattern, only used in Pattern mode.
        std::vector<std::filesystem::path> matches{};
    };

    struct CopyReport
    {
        std::size_t filesCopied = 0;
        std::size_t directoriesCreated = 0;
        std::uint64_t bytesTransferred = 0;
    };

    struct CopyOperationOptions
    {
        // A local file, a local directory or a glob pattern.
        std::string source{};
        std::filesystem::path destination{};
        std::size_t chunkSize = 32768;
    };

    /**
     * @brief Classifies the local source of a copy. Fails with a TransferError if the source does not exist
     * and no glob match is found for it.
     */
    std::expected<CopyTask, Error> makeCopyTask(
        std::string const& source,
        std::filesystem::path const& destination,
        ILocalFileSystem const& fileSystem);

    /**
     * @brief Copies local files or trees to the remote host over a single sftp channel.
     * Failures of individual entries do not stop the copy, they are collected into one TransferError.
     * Nothing is ever deleted on the remote side.
     */
    class CopyOperation : public ChannelOperation
    {
      public:
        CopyOperation(
            std::shared_ptr<TransportSession> session,
            std::shared_ptr<ILocalFileSystem const> fileSystem,
            CopyOperationOptions options);

        Type type() const override
        {
            return Type::Copy;
        }

        std::expected<CopyReport, Error> perform();

      private:
        // Set when the channel is gone, no further entry can succeed.
        struct Aborted
        {};

        std::expected<void, Aborted> copyFile(
            ISftpChannel& sftp,
            LocalEntry const& local,
            std::filesystem::path const& remote,
            CopyReport& report,
            std::vector<TransferFailure>& failures);

        std::expected<void, Aborted> copyTree(
            ISftpChannel& sftp,
            std::filesystem::path const& local,
            std::filesystem::path const& remote,
            std::filesystem::perms permissions,
            CopyReport& report,
            std::vector<TransferFailure>& failures,
            int depth);

        std::expected<void, Error> ensureDirectory(
            ISftpChannel& sftp,
            std::filesystem::path const& remote,
            std::filesystem::perms permissions,
            CopyReport& report);

        void skipTree(std::filesystem::path const& local, std::vector<TransferFailure>& failures, int depth);

        std::filesystem::path
        resolveTarget(ISftpChannel& sftp, std::filesystem::path const& source, std::filesystem::path const& destination);

        std::expected<void, Aborted>
        recordFailure(std::vector<TransferFailure>& failures, std::filesystem::path const& path, Error const& error);

      private:
        std::shared_ptr<ILocalFileSystem const> fileSystem_;
        CopyOperationOptions options_;
    };
}
