#include <remote_dispatch/operations/transfer_session.hpp>

#include <log/log.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace RemoteDispatch
{
    namespace
    {
        Error remoteFsError(Error const& error, std::string_view primitive, std::filesystem::path const& path)
        {
            if (error.kind == ErrorKind::State || error.kind == ErrorKind::Session)
                return error;
            return reclassify(error, ErrorKind::RemoteFileSystem, fmt::format("{} '{}'", primitive, path.generic_string()));
        }
    }

    TransferSession::TransferSession(std::shared_ptr<TransportSession> session)
        : ChannelOperation{std::move(session)}
    {}

    TransferSession::~TransferSession()
    {
        close();
    }

    std::expected<void, Error> TransferSession::connect()
    {
        std::scoped_lock lock{mutex_};
        if (closed_)
            return std::unexpected(makeError(ErrorKind::Session, "The transfer session was closed"));

        if (channel_ && channel_->isOpen())
            return {};

        if (channel_)
        {
            Log::info("TransferSession {}: Channel was closed, reconnecting.", id().value());
            unbindChannel();
            channel_.release();
        }

        auto opened = session_->openSftpChannel();
        if (!opened)
        {
            Log::error("TransferSession {}: Cannot open sftp channel: {}", id().value(), opened.error().toString());
            return std::unexpected(reclassify(opened.error(), ErrorKind::Session, "Cannot open the transfer session"));
        }

        clearCancelRequest();
        bindChannel(opened->id());
        channel_ = std::move(opened).value();
        enterState(State::Running);
        Log::info("TransferSession {}: Connected.", id().value());
        return {};
    }

    std::expected<ISftpChannel*, Error> TransferSession::channel(std::string_view primitive)
    {
        if (closed_)
        {
            return std::unexpected(
                makeError(ErrorKind::Session, fmt::format("Cannot {}, the transfer session was closed", primitive)));
        }
        if (!channel_)
        {
            return std::unexpected(
                makeError(ErrorKind::Session, fmt::format("Cannot {}, the transfer session is not connected", primitive)));
        }
        if (!channel_->isOpen())
        {
            return std::unexpected(makeError(
                ErrorKind::Session, fmt::format("Cannot {}, the transfer channel was closed", primitive)));
        }
        return &*channel_;
    }

    std::expected<void, Error> TransferSession::mkdir(std::filesystem::path const& path, std::filesystem::perms permissions)
    {
        std::scoped_lock lock{mutex_};
        auto sftp = channel("mkdir");
        if (!sftp)
            return std::unexpected(std::move(sftp).error());

        if (auto existing = (*sftp)->lstat(path); existing)
        {
            return std::unexpected(makeError(
                ErrorKind::RemoteFileSystem,
                fmt::format("mkdir '{}': already exists", path.generic_string()),
                RemoteErrorCode::AlreadyExists));
        }
        else if (existing.error().remoteCode != RemoteErrorCode::NoSuchFile)
        {
            return std::unexpected(remoteFsError(existing.error(), "mkdir", path));
        }

        if (auto made = (*sftp)->makeDirectory(path, permissions); !made)
            return std::unexpected(remoteFsError(made.error(), "mkdir", path));

        Log::debug("TransferSession {}: Created directory '{}'", id().value(), path.generic_string());
        return {};
    }

    std::expected<void, Error> TransferSession::remove(std::filesystem::path const& path)
    {
        std::scoped_lock lock{mutex_};
        auto sftp = channel("remove");
        if (!sftp)
            return std::unexpected(std::move(sftp).error());

        auto info = (*sftp)->lstat(path);
        if (!info)
            return std::unexpected(remoteFsError(info.error(), "remove", path));
        if (info->isDirectory())
        {
            return std::unexpected(makeError(
                ErrorKind::RemoteFileSystem,
                fmt::format("remove '{}': is a directory", path.generic_string()),
                RemoteErrorCode::IsADirectory));
        }

        if (auto removed = (*sftp)->removeFile(path); !removed)
            return std::unexpected(remoteFsError(removed.error(), "remove", path));

        Log::debug("TransferSession {}: Removed '{}'", id().value(), path.generic_string());
        return {};
    }

    std::expected<void, Error> TransferSession::rmdir(std::filesystem::path const& path)
    {
        std::scoped_lock lock{mutex_};
        auto sftp = channel("rmdir");
        if (!sftp)
            return std::unexpected(std::move(sftp).error());

        auto info = (*sftp)->lstat(path);
        if (!info)
            return std::unexpected(remoteFsError(info.error(), "rmdir", path));
        if (!info->isDirectory())
        {
            return std::unexpected(makeError(
                ErrorKind::RemoteFileSystem,
                fmt::format("rmdir '{}': not a directory", path.generic_string()),
                RemoteErrorCode::NotADirectory));
        }

        // Servers report removal of non empty directories inconsistently.
        auto entries = (*sftp)->listDirectory(path);
        if (!entries)
            return std::unexpected(remoteFsError(entries.error(), "rmdir", path));
        if (!entries->empty())
        {
            return std::unexpected(makeError(
                ErrorKind::RemoteFileSystem,
                fmt::format("rmdir '{}': directory not empty", path.generic_string()),
                RemoteErrorCode::NotEmpty));
        }

        if (auto removed = (*sftp)->removeDirectory(path); !removed)
            return std::unexpected(remoteFsError(removed.error(), "rmdir", path));

        Log::debug("TransferSession {}: Removed directory '{}'", id().value(), path.generic_string());
        return {};
    }

    std::expected<FileInformation, Error> TransferSession::stat(std::filesystem::path const& path)
    {
        std::scoped_lock lock{mutex_};
        auto sftp = channel("stat");
        if (!sftp)
            return std::unexpected(std::move(sftp).error());

        auto info = (*sftp)->stat(path);
        if (!info)
            return std::unexpected(remoteFsError(info.error(), "stat", path));
        return info;
    }

    std::expected<bool, Error> TransferSession::exists(std::filesystem::path const& path)
    {
        std::scoped_lock lock{mutex_};
        auto sftp = channel("exists");
        if (!sftp)
            return std::unexpected(std::move(sftp).error());

        auto info = (*sftp)->stat(path);
        if (info)
            return true;
        if (info.error().remoteCode == RemoteErrorCode::NoSuchFile)
            return false;
        return std::unexpected(remoteFsError(info.error(), "exists", path));
    }

    std::expected<bool, Error> TransferSession::isDirectory(std::filesystem::path const& path)
    {
        std::scoped_lock lock{mutex_};
        auto sftp = channel("isDirectory");
        if (!sftp)
            return std::unexpected(std::move(sftp).error());

        auto info = (*sftp)->stat(path);
        if (info)
            return info->isDirectory();
        if (info.error().remoteCode == RemoteErrorCode::NoSuchFile)
            return false;
        return std::unexpected(remoteFsError(info.error(), "isDirectory", path));
    }

    std::expected<std::vector<FileInformation>, Error> TransferSession::listDirectory(std::filesystem::path const& path)
    {
        std::scoped_lock lock{mutex_};
        auto sftp = channel("listDirectory");
        if (!sftp)
            return std::unexpected(std::move(sftp).error());

        auto entries = (*sftp)->listDirectory(path);
        if (!entries)
            return std::unexpected(remoteFsError(entries.error(), "listDirectory", path));

        std::sort(entries->begin(), entries->end(), [](auto const& lhs, auto const& rhs) {
            return lhs.path.native() < rhs.path.native();
        });
        return entries;
    }

    void TransferSession::close()
    {
        std::scoped_lock lock{mutex_};
        if (closed_)
            return;
        closed_ = true;

        unbindChannel();
        if (channel_)
        {
            channel_.release();
            Log::info("TransferSession {}: Closed.", id().value());
        }
        if (state() != State::Canceled)
            enterState(State::Completed);
    }

    bool TransferSession::isOpen() const
    {
        std::scoped_lock lock{mutex_};
        return !closed_ && channel_ && channel_->isOpen();
    }

    bool TransferSession::isClosed() const
    {
        std::scoped_lock lock{mutex_};
        return closed_;
    }
}
