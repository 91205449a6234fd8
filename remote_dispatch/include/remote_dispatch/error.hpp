#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace RemoteDispatch
{
    enum class ErrorKind
    {
        None,
        // Resolving or loading the local credential failed.
        Credential,
        // The transport could not reach or handshake with the remote host.
        Connect,
        // The remote host rejected the credential.
        Auth,
        // The operation is not allowed in the current lifecycle state.
        State,
        // A copy failed, possibly partially. See Error::failures.
        Transfer,
        // Transport failure while executing a remote command. Never used for non zero exit codes.
        Exec,
        // A remote file management primitive failed.
        RemoteFileSystem,
        // Misuse of the transfer sub session lifecycle.
        Session,
        // The dispatcher was closed.
        Closed,
    };

    /**
     * @brief Transport independent classification of remote filesystem failures.
     */
    enum class RemoteErrorCode
    {
        None,
        NoSuchFile,
        PermissionDenied,
        AlreadyExists,
        NotADirectory,
        IsADirectory,
        NotEmpty,
        ConnectionLost,
        ChannelClosed,
        Failure,
    };

    struct TransferFailure
    {
        std::filesystem::path path;
        std::string reason;
        // True if the entry was never attempted, because its parent directory could not be created.
        bool skipped = false;
    };

    struct Error
    {
        ErrorKind kind = ErrorKind::None;
        std::string message{};
        RemoteErrorCode remoteCode = RemoteErrorCode::None;
        int sshError = 0;
        int sftpError = 0;
        std::vector<TransferFailure> failures{};

        std::string toString() const;
    };

    std::string_view errorKindToString(ErrorKind kind);
    std::string_view remoteErrorCodeToString(RemoteErrorCode code);

    inline Error makeError(ErrorKind kind, std::string message, RemoteErrorCode remoteCode = RemoteErrorCode::None)
    {
        return Error{
            .kind = kind,
            .message = std::move(message),
            .remoteCode = remoteCode,
        };
    }

    /**
     * @brief Returns a copy of the error reclassified as another kind, the message is prefixed with context.
     */
    Error reclassify(Error const& error, ErrorKind kind, std::string_view context);
}
