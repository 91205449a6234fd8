#pragma once

#include <remote_dispatch/async/processing_strand.hpp>
#include <remote_dispatch/transport/transport.hpp>

#include <libssh/libssh.h>
#include <libssh/sftp.h>

#include <exception>
#include <memory>
#include <set>

namespace RemoteDispatch
{
    class LibSshRemoteFile;

    class LibSshSftpChannel : public ISftpChannel
    {
      public:
        friend class LibSshRemoteFile;

        LibSshSftpChannel(std::unique_ptr<ProcessingStrand> strand, sftp_session sftp, ssh_session session);
        ~LibSshSftpChannel() override;

        std::expected<FileInformation, Error> stat(std::filesystem::path const& path) override;
        std::expected<FileInformation, Error> lstat(std::filesystem::path const& path) override;
        std::expected<std::vector<FileInformation>, Error> listDirectory(std::filesystem::path const& path) override;
        std::expected<void, Error>
        makeDirectory(std::filesystem::path const& path, std::filesystem::perms permissions) override;
        std::expected<void, Error> removeFile(std::filesystem::path const& path) override;
        std::expected<void, Error> removeDirectory(std::filesystem::path const& path) override;
        std::expected<void, Error>
        chmod(std::filesystem::path const& path, std::filesystem::perms permissions) override;
        std::expected<std::unique_ptr<IRemoteFile>, Error>
        openForWrite(std::filesystem::path const& path, std::filesystem::perms permissions) override;
        std::future<std::expected<void, Error>> close() override;
        bool isOpen() const override;

      private:
        template <typename T, typename FunctionT>
        std::expected<T, Error> perform(FunctionT&& func)
        {
            auto future = strand_->pushPromiseTask(std::forward<FunctionT>(func));
            try
            {
                return future.get();
            }
            catch (std::exception const&)
            {
                return std::unexpected(channelClosed());
            }
        }

        Error lastError(std::string_view context) const;
        static Error channelClosed();
        std::expected<FileInformation, Error>
        statImpl(std::filesystem::path const& path, sftp_attributes (*statFunction)(sftp_session, char const*));

      private:
        std::unique_ptr<ProcessingStrand> strand_;
        sftp_session sftp_;
        ssh_session session_;
        // Only touched on the processing thread.
        std::set<sftp_file> openFiles_{};
    };

    class LibSshRemoteFile : public IRemoteFile
    {
      public:
        LibSshRemoteFile(LibSshSftpChannel* owner, sftp_file file, std::filesystem::path path);
        ~LibSshRemoteFile() override;

        std::expected<void, Error> write(std::span<char const> data) override;
        std::expected<void, Error> close() override;

      private:
        LibSshSftpChannel* owner_;
        sftp_file file_;
        std::filesystem::path path_;
        bool closed_{false};
    };

    FileInformation fileInformationFromSftpAttributes(sftp_attributes attributes, std::filesystem::path const& path);
}
