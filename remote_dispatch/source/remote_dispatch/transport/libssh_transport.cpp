#include <remote_dispatch/transport/libssh_transport.hpp>
#include <remote_dispatch/transport/libssh_errors.hpp>
#include <remote_dispatch/transport/libssh_exec_channel.hpp>
#include <remote_dispatch/transport/libssh_sftp_channel.hpp>
#include <remote_dispatch/transport/sequential.hpp>

#include <log/log.hpp>

#include <fmt/format.h>
#include <libssh/sftp.h>

#include <exception>
#include <memory>

namespace RemoteDispatch
{
    LibSshTransport::LibSshTransport(Persistence::SshOptions options)
        : options_{std::move(options)}
        , processingThread_{}
        , session_{}
    {}

    LibSshTransport::~LibSshTransport()
    {
        disconnect();
    }

    template <typename T, typename FunctionT>
    std::expected<T, Error> LibSshTransport::run(ErrorKind kind, FunctionT&& func)
    {
        auto future = processingThread_.pushPromiseTask(std::forward<FunctionT>(func));
        try
        {
            return future.get();
        }
        catch (std::exception const& exc)
        {
            return std::unexpected(makeError(kind, exc.what(), RemoteErrorCode::ConnectionLost));
        }
    }

    std::expected<void, Error> LibSshTransport::applyOptions(RemoteHost const& host)
    {
        auto& session = session_;
        auto const& sshOptions = options_;
        auto result = Detail::sequential(
            [&] {
                if (sshOptions.logVerbosity)
                    return session.setOption(SSH_OPTIONS_LOG_VERBOSITY_STR, sshOptions.logVerbosity->c_str());
                return 0;
            },
            [&] {
                return session.setOption(SSH_OPTIONS_HOST, host.host.c_str());
            },
            [&] {
                int port = host.port;
                return session.setOption(SSH_OPTIONS_PORT, &port);
            },
            [&] {
                if (sshOptions.sshDirectory)
                    return session.setOption(SSH_OPTIONS_SSH_DIR, sshOptions.sshDirectory->generic_string().c_str());
                return 0;
            },
            [&] {
                if (sshOptions.knownHostsFile)
                    return session.setOption(SSH_OPTIONS_KNOWNHOSTS, sshOptions.knownHostsFile->generic_string().c_str());
                return 0;
            },
            [&] {
                if (sshOptions.connectTimeoutSeconds)
                {
                    long timeout = *sshOptions.connectTimeoutSeconds;
                    return session.setOption(SSH_OPTIONS_TIMEOUT, &timeout);
                }
                return 0;
            },
            [&] {
                if (sshOptions.keyExchangeAlgorithms)
                    return session.setOption(SSH_OPTIONS_KEY_EXCHANGE, sshOptions.keyExchangeAlgorithms->c_str());
                return 0;
            },
            [&] {
                if (sshOptions.compressionClientToServer)
                    return session.setOption(SSH_OPTIONS_COMPRESSION_C_S, sshOptions.compressionClientToServer->c_str());
                return 0;
            },
            [&] {
                if (sshOptions.compressionServerToClient)
                    return session.setOption(SSH_OPTIONS_COMPRESSION_S_C, sshOptions.compressionServerToClient->c_str());
                return 0;
            },
            [&] {
                if (sshOptions.strictHostKeyCheck)
                {
                    int strict = *sshOptions.strictHostKeyCheck ? 1 : 0;
                    return session.setOption(SSH_OPTIONS_STRICTHOSTKEYCHECK, &strict);
                }
                return 0;
            },
            [&] {
                if (sshOptions.noDelay)
                {
                    int noDelay = *sshOptions.noDelay ? 1 : 0;
                    return session.setOption(SSH_OPTIONS_NODELAY, &noDelay);
                }
                return 0;
            },
            [&] {
                if (sshOptions.bypassConfig)
                {
                    int processConfig = *sshOptions.bypassConfig ? 0 : 1;
                    return session.setOption(SSH_OPTIONS_PROCESS_CONFIG, &processConfig);
                }
                return 0;
            });

        if (!result.success())
        {
            return std::unexpected(lastLibSshError(
                ErrorKind::Connect,
                session_.getCSession(),
                nullptr,
                fmt::format("Setting ssh option {} of {} failed", result.index, result.total)));
        }
        return {};
    }

    std::expected<void, Error> LibSshTransport::verifyHost()
    {
        const bool strict = options_.strictHostKeyCheck.value_or(false);
        switch (ssh_session_is_known_server(session_.getCSession()))
        {
            case SSH_KNOWN_HOSTS_OK:
                return {};
            case SSH_KNOWN_HOSTS_CHANGED:
            case SSH_KNOWN_HOSTS_OTHER:
                return std::unexpected(
                    makeError(ErrorKind::Connect, "The host key of the server changed, refusing to connect"));
            case SSH_KNOWN_HOSTS_NOT_FOUND:
            case SSH_KNOWN_HOSTS_UNKNOWN:
                if (strict)
                    return std::unexpected(makeError(ErrorKind::Connect, "The server is not a known host"));
                Log::warn("LibSshTransport: The server is not a known host, accepting it anyway.");
                return {};
            case SSH_KNOWN_HOSTS_ERROR:
            default:
                return std::unexpected(
                    lastLibSshError(ErrorKind::Connect, session_.getCSession(), nullptr, "Checking known hosts"));
        }
    }

    std::expected<void, Error> LibSshTransport::connect(RemoteHost const& host)
    {
        {
            std::scoped_lock lock{lifecycleMutex_};
            if (!processingThread_.isRunning())
                processingThread_.start();
        }

        return run<void>(ErrorKind::Connect, [this, host]() -> std::expected<void, Error> {
            if (auto applied = applyOptions(host); !applied)
                return applied;

            if (session_.connect() != SSH_OK)
            {
                return std::unexpected(lastLibSshError(
                    ErrorKind::Connect, session_.getCSession(), nullptr, fmt::format("Connecting to {}", host.toString())));
            }
            connected_ = true;
            return verifyHost();
        });
    }

    std::expected<void, Error> LibSshTransport::authenticate(Credential const& credential)
    {
        return run<void>(ErrorKind::Auth, [this, credential]() -> std::expected<void, Error> {
            if (session_.setOption(SSH_OPTIONS_USER, credentialUser(credential).c_str()) != SSH_OK)
                return std::unexpected(lastLibSshError(ErrorKind::Auth, session_.getCSession(), nullptr, "Setting user"));

            struct Authenticate
            {
                ssh::Session& session;

                std::expected<int, Error> operator()(PasswordCredential const& password) const
                {
                    return session.userauthPassword(password.password.c_str());
                }
                std::expected<int, Error> operator()(KeyCredential const& key) const
                {
                    ssh_key rawKey{nullptr};
                    if (ssh_pki_import_privkey_file(
                            key.keyPath.string().c_str(),
                            key.passphrase ? key.passphrase->c_str() : nullptr,
                            nullptr,
                            nullptr,
                            &rawKey) != SSH_OK)
                    {
                        return std::unexpected(makeError(
                            ErrorKind::Auth, fmt::format("Cannot load key '{}'", key.keyPath.string())));
                    }
                    std::unique_ptr<ssh_key_struct, decltype(&ssh_key_free)> privateKey{rawKey, ssh_key_free};
                    return session.userauthPublickey(privateKey.get());
                }
            };

            auto result = std::visit(Authenticate{session_}, credential);
            if (!result)
                return std::unexpected(std::move(result).error());

            switch (*result)
            {
                case SSH_AUTH_SUCCESS:
                    return {};
                case SSH_AUTH_DENIED:
                case SSH_AUTH_PARTIAL:
                    return std::unexpected(makeError(
                        ErrorKind::Auth,
                        fmt::format("The server rejected the {}", describeCredential(credential))));
                default:
                    return std::unexpected(
                        lastLibSshError(ErrorKind::Auth, session_.getCSession(), nullptr, "Authentication failed"));
            }
        });
    }

    std::expected<std::shared_ptr<IExecChannel>, Error> LibSshTransport::openExecChannel()
    {
        return run<std::shared_ptr<IExecChannel>>(
            ErrorKind::Exec, [this]() -> std::expected<std::shared_ptr<IExecChannel>, Error> {
                auto channel = std::make_unique<ssh::Channel>(session_);
                if (channel->openSession() != SSH_OK)
                {
                    return std::unexpected(
                        lastLibSshError(ErrorKind::Exec, session_.getCSession(), nullptr, "Opening exec channel"));
                }
                return std::make_shared<LibSshExecChannel>(
                    processingThread_.createStrand(), std::move(channel), session_.getCSession());
            });
    }

    std::expected<std::shared_ptr<ISftpChannel>, Error> LibSshTransport::openSftpChannel()
    {
        return run<std::shared_ptr<ISftpChannel>>(
            ErrorKind::RemoteFileSystem, [this]() -> std::expected<std::shared_ptr<ISftpChannel>, Error> {
                auto sftp = sftp_new(session_.getCSession());
                if (sftp == nullptr)
                {
                    return std::unexpected(lastLibSshError(
                        ErrorKind::RemoteFileSystem, session_.getCSession(), nullptr, "Creating sftp session"));
                }

                if (sftp_init(sftp) != SSH_OK)
                {
                    auto error = lastLibSshError(
                        ErrorKind::RemoteFileSystem, session_.getCSession(), sftp, "Initializing sftp session");
                    sftp_free(sftp);
                    return std::unexpected(std::move(error));
                }

                return std::make_shared<LibSshSftpChannel>(processingThread_.createStrand(), sftp, session_.getCSession());
            });
    }

    void LibSshTransport::disconnect()
    {
        std::scoped_lock lock{lifecycleMutex_};
        if (!processingThread_.isRunning())
            return;

        // Pending tasks still run during stop, the disconnect is queued behind them.
        processingThread_.pushTask([this]() {
            if (connected_)
            {
                session_.disconnect();
                connected_ = false;
                Log::debug("LibSshTransport: Disconnected.");
            }
        });
        processingThread_.stop();
    }
}
