#include <remote_dispatch/transport/libssh_sftp_channel.hpp>
#include <remote_dispatch/transport/libssh_errors.hpp>

#include <log/log.hpp>

#include <fmt/format.h>

#include <fcntl.h>

#include <algorithm>
#include <functional>

namespace RemoteDispatch
{
    namespace
    {
        // Servers are not required to accept larger write requests.
        constexpr std::size_t maximumWriteLength = 32768;

        FileType fileTypeFromSftp(std::uint8_t type)
        {
            switch (type)
            {
                case SSH_FILEXFER_TYPE_REGULAR:
                    return FileType::Regular;
                case SSH_FILEXFER_TYPE_DIRECTORY:
                    return FileType::Directory;
                case SSH_FILEXFER_TYPE_SYMLINK:
                    return FileType::Symlink;
                case SSH_FILEXFER_TYPE_SPECIAL:
                    return FileType::Special;
                default:
                    return FileType::Unknown;
            }
        }

        unsigned long modeBits(std::filesystem::perms permissions)
        {
            return static_cast<unsigned long>(permissions & std::filesystem::perms::mask);
        }
    }

    FileInformation fileInformationFromSftpAttributes(sftp_attributes attributes, std::filesystem::path const& path)
    {
        return FileInformation{
            .path = attributes->name ? std::filesystem::path{attributes->name} : path,
            .type = fileTypeFromSftp(attributes->type),
            .size = attributes->size,
            .uid = attributes->uid,
            .gid = attributes->gid,
            .owner = attributes->owner ? std::string{attributes->owner} : std::string{},
            .group = attributes->group ? std::string{attributes->group} : std::string{},
            .permissions = static_cast<std::filesystem::perms>(attributes->permissions) & std::filesystem::perms::mask,
            .atime = attributes->atime64 != 0 ? attributes->atime64 : attributes->atime,
            .mtime = attributes->mtime64 != 0 ? attributes->mtime64 : attributes->mtime,
        };
    }

    LibSshSftpChannel::LibSshSftpChannel(std::unique_ptr<ProcessingStrand> strand, sftp_session sftp, ssh_session session)
        : strand_{std::move(strand)}
        , sftp_{sftp}
        , session_{session}
    {}

    LibSshSftpChannel::~LibSshSftpChannel()
    {
        if (!strand_->isFinalized())
            close().wait();
    }

    Error LibSshSftpChannel::lastError(std::string_view context) const
    {
        return lastLibSshError(ErrorKind::RemoteFileSystem, session_, sftp_, context);
    }

    Error LibSshSftpChannel::channelClosed()
    {
        return channelClosedError(ErrorKind::RemoteFileSystem);
    }

    std::expected<FileInformation, Error> LibSshSftpChannel::statImpl(
        std::filesystem::path const& path,
        sftp_attributes (*statFunction)(sftp_session, char const*))
    {
        return perform<FileInformation>([this, path, statFunction]() -> std::expected<FileInformation, Error> {
            if (sftp_ == nullptr)
                return std::unexpected(channelClosed());

            std::unique_ptr<sftp_attributes_struct, decltype(&sftp_attributes_free)> attributes{
                statFunction(sftp_, path.generic_string().c_str()), sftp_attributes_free};
            if (!attributes)
                return std::unexpected(lastError(fmt::format("stat '{}'", path.generic_string())));

            auto info = fileInformationFromSftpAttributes(attributes.get(), path);
            // stat does not report a name.
            info.path = path;
            return info;
        });
    }

    std::expected<FileInformation, Error> LibSshSftpChannel::stat(std::filesystem::path const& path)
    {
        return statImpl(path, sftp_stat);
    }

    std::expected<FileInformation, Error> LibSshSftpChannel::lstat(std::filesystem::path const& path)
    {
        return statImpl(path, sftp_lstat);
    }

    std::expected<std::vector<FileInformation>, Error> LibSshSftpChannel::listDirectory(std::filesystem::path const& path)
    {
        return perform<std::vector<FileInformation>>(
            [this, path]() -> std::expected<std::vector<FileInformation>, Error> {
                if (sftp_ == nullptr)
                    return std::unexpected(channelClosed());

                int closeResult = SSH_OK;
                std::vector<FileInformation> entries{};
                {
                    std::unique_ptr<sftp_dir_struct, std::function<void(sftp_dir_struct*)>> dir{
                        sftp_opendir(sftp_, path.generic_string().c_str()), [&closeResult](sftp_dir_struct* dir) {
                            if (dir != nullptr)
                                closeResult = sftp_closedir(dir);
                        }};
                    if (!dir)
                        return std::unexpected(lastError(fmt::format("opendir '{}'", path.generic_string())));

                    std::unique_ptr<sftp_attributes_struct, decltype(&sftp_attributes_free)> entry{
                        sftp_readdir(sftp_, dir.get()), sftp_attributes_free};
                    for (; entry != nullptr; entry.reset(sftp_readdir(sftp_, dir.get())))
                    {
                        auto info = fileInformationFromSftpAttributes(entry.get(), {});
                        if (info.path == "." || info.path == "..")
                            continue;
                        entries.push_back(std::move(info));
                    }

                    if (!sftp_dir_eof(dir.get()))
                        return std::unexpected(lastError(fmt::format("readdir '{}'", path.generic_string())));
                }
                if (closeResult != SSH_OK)
                    return std::unexpected(lastError(fmt::format("closedir '{}'", path.generic_string())));

                return entries;
            });
    }

    std::expected<void, Error>
    LibSshSftpChannel::makeDirectory(std::filesystem::path const& path, std::filesystem::perms permissions)
    {
        return perform<void>([this, path, permissions]() -> std::expected<void, Error> {
            if (sftp_ == nullptr)
                return std::unexpected(channelClosed());
            if (sftp_mkdir(sftp_, path.generic_string().c_str(), modeBits(permissions)) != SSH_OK)
                return std::unexpected(lastError(fmt::format("mkdir '{}'", path.generic_string())));
            return {};
        });
    }

    std::expected<void, Error> LibSshSftpChannel::removeFile(std::filesystem::path const& path)
    {
        return perform<void>([this, path]() -> std::expected<void, Error> {
            if (sftp_ == nullptr)
                return std::unexpected(channelClosed());
            if (sftp_unlink(sftp_, path.generic_string().c_str()) != SSH_OK)
                return std::unexpected(lastError(fmt::format("unlink '{}'", path.generic_string())));
            return {};
        });
    }

    std::expected<void, Error> LibSshSftpChannel::removeDirectory(std::filesystem::path const& path)
    {
        return perform<void>([this, path]() -> std::expected<void, Error> {
            if (sftp_ == nullptr)
                return std::unexpected(channelClosed());
            if (sftp_rmdir(sftp_, path.generic_string().c_str()) != SSH_OK)
                return std::unexpected(lastError(fmt::format("rmdir '{}'", path.generic_string())));
            return {};
        });
    }

    std::expected<void, Error>
    LibSshSftpChannel::chmod(std::filesystem::path const& path, std::filesystem::perms permissions)
    {
        return perform<void>([this, path, permissions]() -> std::expected<void, Error> {
            if (sftp_ == nullptr)
                return std::unexpected(channelClosed());
            if (sftp_chmod(sftp_, path.generic_string().c_str(), modeBits(permissions)) != SSH_OK)
                return std::unexpected(lastError(fmt::format("chmod '{}'", path.generic_string())));
            return {};
        });
    }

    std::expected<std::unique_ptr<IRemoteFile>, Error>
    LibSshSftpChannel::openForWrite(std::filesystem::path const& path, std::filesystem::perms permissions)
    {
        auto file = perform<sftp_file>([this, path, permissions]() -> std::expected<sftp_file, Error> {
            if (sftp_ == nullptr)
                return std::unexpected(channelClosed());

            auto* file = sftp_open(sftp_, path.generic_string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, modeBits(permissions));
            if (file == nullptr)
                return std::unexpected(lastError(fmt::format("open '{}'", path.generic_string())));
            openFiles_.insert(file);
            return file;
        });
        if (!file)
            return std::unexpected(std::move(file).error());
        return std::make_unique<LibSshRemoteFile>(this, *file, path);
    }

    std::future<std::expected<void, Error>> LibSshSftpChannel::close()
    {
        if (strand_->isFinalized())
        {
            std::promise<std::expected<void, Error>> promise{};
            promise.set_value({});
            return promise.get_future();
        }

        return strand_->pushFinalPromiseTask([this]() -> std::expected<void, Error> {
            for (auto* file : openFiles_)
            {
                if (sftp_close(file) != SSH_OK)
                    Log::debug("LibSshSftpChannel: Closing a file failed: {}", ssh_get_error(session_));
            }
            openFiles_.clear();
            if (sftp_ != nullptr)
            {
                sftp_free(sftp_);
                sftp_ = nullptr;
            }
            return {};
        });
    }

    bool LibSshSftpChannel::isOpen() const
    {
        return !strand_->isFinalized();
    }

    LibSshRemoteFile::LibSshRemoteFile(LibSshSftpChannel* owner, sftp_file file, std::filesystem::path path)
        : owner_{owner}
        , file_{file}
        , path_{std::move(path)}
    {}

    LibSshRemoteFile::~LibSshRemoteFile()
    {
        if (auto result = close(); !result)
            Log::debug("LibSshRemoteFile: {}", result.error().toString());
    }

    std::expected<void, Error> LibSshRemoteFile::write(std::span<char const> data)
    {
        if (closed_)
            return std::unexpected(makeError(ErrorKind::RemoteFileSystem, "File is closed", RemoteErrorCode::Failure));

        return owner_->perform<void>([this, data]() -> std::expected<void, Error> {
            if (!owner_->openFiles_.contains(file_))
                return std::unexpected(LibSshSftpChannel::channelClosed());

            std::size_t written = 0;
            while (written < data.size())
            {
                const auto chunk = std::min(maximumWriteLength, data.size() - written);
                const auto result = sftp_write(file_, data.data() + written, chunk);
                if (result < 0)
                    return std::unexpected(owner_->lastError(fmt::format("write '{}'", path_.generic_string())));
                if (result == 0)
                {
                    return std::unexpected(makeError(
                        ErrorKind::RemoteFileSystem,
                        fmt::format("write '{}': short write", path_.generic_string()),
                        RemoteErrorCode::Failure));
                }
                written += static_cast<std::size_t>(result);
            }
            return {};
        });
    }

    std::expected<void, Error> LibSshRemoteFile::close()
    {
        if (closed_)
            return {};
        closed_ = true;

        return owner_->perform<void>([this]() -> std::expected<void, Error> {
            if (owner_->openFiles_.erase(file_) == 0)
                return std::unexpected(LibSshSftpChannel::channelClosed());
            if (sftp_close(file_) != SSH_OK)
                return std::unexpected(owner_->lastError(fmt::format("close '{}'", path_.generic_string())));
            return {};
        });
    }
}
