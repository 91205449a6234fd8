#include <remote_dispatch/error.hpp>

#include <fmt/format.h>

namespace RemoteDispatch
{
    std::string_view errorKindToString(ErrorKind kind)
    {
        switch (kind)
        {
            case ErrorKind::None:
                return "None";
            case ErrorKind::Credential:
                return "CredentialError";
            case ErrorKind::Connect:
                return "ConnectError";
            case ErrorKind::Auth:
                return "AuthError";
            case ErrorKind::State:
                return "StateError";
            case ErrorKind::Transfer:
                return "TransferError";
            case ErrorKind::Exec:
                return "ExecError";
            case ErrorKind::RemoteFileSystem:
                return "RemoteFSError";
            case ErrorKind::Session:
                return "SessionError";
            case ErrorKind::Closed:
                return "ClosedError";
        }
        return "UnknownError";
    }

    std::string_view remoteErrorCodeToString(RemoteErrorCode code)
    {
        switch (code)
        {
            case RemoteErrorCode::None:
                return "none";
            case RemoteErrorCode::NoSuchFile:
                return "no such file";
            case RemoteErrorCode::PermissionDenied:
                return "permission denied";
            case RemoteErrorCode::AlreadyExists:
                return "already exists";
            case RemoteErrorCode::NotADirectory:
                return "not a directory";
            case RemoteErrorCode::IsADirectory:
                return "is a directory";
            case RemoteErrorCode::NotEmpty:
                return "directory not empty";
            case RemoteErrorCode::ConnectionLost:
                return "connection lost";
            case RemoteErrorCode::ChannelClosed:
                return "channel closed";
            case RemoteErrorCode::Failure:
                return "failure";
        }
        return "unknown";
    }

    std::string Error::toString() const
    {
        auto result = fmt::format(
            "{}: message: {}, remoteCode: {}, sshError: {}, sftpError: {}",
            errorKindToString(kind),
            message,
            remoteErrorCodeToString(remoteCode),
            sshError,
            sftpError);

        for (auto const& failure : failures)
        {
            result += fmt::format(
                "\n    {} '{}': {}", failure.skipped ? "skipped" : "failed", failure.path.generic_string(), failure.reason);
        }
        return result;
    }

    Error reclassify(Error const& error, ErrorKind kind, std::string_view context)
    {
        Error result = error;
        result.kind = kind;
        if (!context.empty())
            result.message = fmt::format("{}: {}", context, error.message);
        return result;
    }
}
