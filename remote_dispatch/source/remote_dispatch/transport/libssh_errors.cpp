#include <remote_dispatch/transport/libssh_errors.hpp>

#include <fmt/format.h>

namespace RemoteDispatch
{
    RemoteErrorCode remoteCodeFromSftpError(int sftpError)
    {
        switch (sftpError)
        {
            case SSH_FX_OK:
                return RemoteErrorCode::None;
            case SSH_FX_NO_SUCH_FILE:
            case SSH_FX_NO_SUCH_PATH:
                return RemoteErrorCode::NoSuchFile;
            case SSH_FX_PERMISSION_DENIED:
            case SSH_FX_WRITE_PROTECT:
                return RemoteErrorCode::PermissionDenied;
            case SSH_FX_FILE_ALREADY_EXISTS:
                return RemoteErrorCode::AlreadyExists;
            case SSH_FX_NO_CONNECTION:
            case SSH_FX_CONNECTION_LOST:
                return RemoteErrorCode::ConnectionLost;
            default:
                return RemoteErrorCode::Failure;
        }
    }

    Error lastLibSshError(ErrorKind kind, ssh_session session, sftp_session sftp, std::string_view context)
    {
        Error error{
            .kind = kind,
            .message = ssh_get_error(session),
            .remoteCode = RemoteErrorCode::Failure,
            .sshError = ssh_get_error_code(session),
            .sftpError = sftp != nullptr ? sftp_get_error(sftp) : 0,
        };
        if (sftp != nullptr && error.sftpError != SSH_FX_OK)
            error.remoteCode = remoteCodeFromSftpError(error.sftpError);
        if (error.sshError == SSH_FATAL)
            error.remoteCode = RemoteErrorCode::ConnectionLost;
        if (error.message.empty())
            error.message = fmt::format("sftp error {}", error.sftpError);
        if (!context.empty())
            error.message = fmt::format("{}: {}", context, error.message);
        return error;
    }

    Error channelClosedError(ErrorKind kind, std::string_view context)
    {
        return makeError(
            kind,
            context.empty() ? std::string{"Channel is closed"} : fmt::format("{}: Channel is closed", context),
            RemoteErrorCode::ChannelClosed);
    }
}
