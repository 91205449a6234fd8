#pragma once

#include <remote_dispatch/error.hpp>

#include <libssh/libssh.h>
#include <libssh/sftp.h>

#include <string_view>

namespace RemoteDispatch
{
    RemoteErrorCode remoteCodeFromSftpError(int sftpError);

    /**
     * @brief Collects the last error of the ssh session and of the sftp subsystem if given.
     */
    Error lastLibSshError(ErrorKind kind, ssh_session session, sftp_session sftp = nullptr, std::string_view context = {});

    /**
     * @brief The error reported for any call on a channel that was closed.
     */
    Error channelClosedError(ErrorKind kind, std::string_view context = {});
}
