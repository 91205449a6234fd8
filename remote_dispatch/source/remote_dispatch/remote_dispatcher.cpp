#include <remote_dispatch/remote_dispatcher.hpp>
#include <remote_dispatch/transport/libssh_key_loader.hpp>
#include <remote_dispatch/transport/libssh_transport.hpp>

#include <persistence/options_loader.hpp>

#include <log/log.hpp>

#include <fmt/format.h>

namespace RemoteDispatch
{
    RemoteDispatcher::RemoteDispatcher(
        RemoteHost host,
        std::string user,
        Settings settings,
        std::shared_ptr<TransportSession> session,
        std::shared_ptr<ILocalFileSystem const> fileSystem)
        : host_{std::move(host)}
        , user_{std::move(user)}
        , settings_{settings}
        , session_{std::move(session)}
        , fileSystem_{std::move(fileSystem)}
    {}

    RemoteDispatcher::~RemoteDispatcher()
    {
        close();
    }

    std::expected<void, Error> RemoteDispatcher::checkOpen(std::string_view what) const
    {
        std::scoped_lock lock{mutex_};
        if (closed_)
            return std::unexpected(makeError(ErrorKind::Closed, fmt::format("Cannot {}, the dispatcher is closed", what)));
        return {};
    }

    std::expected<CopyReport, Error>
    RemoteDispatcher::copy(std::string const& source, std::filesystem::path const& destination)
    {
        if (auto open = checkOpen("copy"); !open)
            return std::unexpected(std::move(open).error());

        CopyOperation operation{
            session_,
            fileSystem_,
            CopyOperationOptions{
                .source = source,
                .destination = destination,
                .chunkSize = settings_.copyChunkSize,
            },
        };
        return operation.perform();
    }

    std::expected<ExecResult, Error> RemoteDispatcher::execute(std::string const& command)
    {
        if (auto open = checkOpen("execute"); !open)
            return std::unexpected(std::move(open).error());

        ExecOperation operation{
            session_,
            ExecOperationOptions{
                .command = command,
                .pollTimeout = settings_.execPollTimeout,
            },
        };
        return operation.perform();
    }

    std::expected<std::weak_ptr<TransferSession>, Error> RemoteDispatcher::connect()
    {
        std::scoped_lock lock{mutex_};
        if (closed_)
            return std::unexpected(makeError(ErrorKind::Closed, "Cannot connect, the dispatcher is closed"));

        if (!transferSession_ || transferSession_->isClosed())
            transferSession_ = std::make_shared<TransferSession>(session_);

        if (auto connected = transferSession_->connect(); !connected)
            return std::unexpected(std::move(connected).error());
        return std::weak_ptr<TransferSession>{transferSession_};
    }

    std::expected<std::shared_ptr<TransferSession>, Error> RemoteDispatcher::transferSession(std::string_view what) const
    {
        std::scoped_lock lock{mutex_};
        if (closed_)
            return std::unexpected(makeError(ErrorKind::Closed, fmt::format("Cannot {}, the dispatcher is closed", what)));
        if (!transferSession_ || transferSession_->isClosed())
        {
            return std::unexpected(
                makeError(ErrorKind::Session, fmt::format("Cannot {}, no transfer session is open", what)));
        }
        return transferSession_;
    }

    std::expected<void, Error> RemoteDispatcher::mkdir(std::filesystem::path const& path, std::filesystem::perms permissions)
    {
        return transferSession("mkdir").and_then([&](auto const& transfer) {
            return transfer->mkdir(path, permissions);
        });
    }

    std::expected<void, Error> RemoteDispatcher::remove(std::filesystem::path const& path)
    {
        return transferSession("remove").and_then([&](auto const& transfer) {
            return transfer->remove(path);
        });
    }

    std::expected<void, Error> RemoteDispatcher::rmdir(std::filesystem::path const& path)
    {
        return transferSession("rmdir").and_then([&](auto const& transfer) {
            return transfer->rmdir(path);
        });
    }

    std::expected<FileInformation, Error> RemoteDispatcher::stat(std::filesystem::path const& path)
    {
        return transferSession("stat").and_then([&](auto const& transfer) {
            return transfer->stat(path);
        });
    }

    std::expected<bool, Error> RemoteDispatcher::exists(std::filesystem::path const& path)
    {
        return transferSession("exists").and_then([&](auto const& transfer) {
            return transfer->exists(path);
        });
    }

    std::expected<bool, Error> RemoteDispatcher::isDirectory(std::filesystem::path const& path)
    {
        return transferSession("isDirectory").and_then([&](auto const& transfer) {
            return transfer->isDirectory(path);
        });
    }

    std::expected<std::vector<FileInformation>, Error> RemoteDispatcher::listDirectory(std::filesystem::path const& path)
    {
        return transferSession("listDirectory").and_then([&](auto const& transfer) {
            return transfer->listDirectory(path);
        });
    }

    TeardownReport RemoteDispatcher::close()
    {
        std::shared_ptr<TransferSession> transfer{};
        {
            std::scoped_lock lock{mutex_};
            if (closed_)
                return {};
            closed_ = true;
            transfer = std::move(transferSession_);
        }

        Log::info("RemoteDispatcher: Closing connection to {}", host_.toString());
        if (transfer)
            transfer->close();
        return session_->teardown(settings_.channelCloseTimeout);
    }

    bool RemoteDispatcher::isClosed() const
    {
        std::scoped_lock lock{mutex_};
        return closed_;
    }

    std::size_t RemoteDispatcher::liveChannelCount() const
    {
        return session_->liveChannelCount();
    }

    std::expected<std::unique_ptr<RemoteDispatcher>, Error> makeDispatcher(
        Persistence::DispatcherOptions const& options,
        std::unique_ptr<ITransport> transport,
        std::shared_ptr<IKeyLoader const> keyLoader,
        std::shared_ptr<ILocalFileSystem const> fileSystem)
    {
        auto effective = options;
        effective.useDefaultsFrom(Persistence::DispatcherOptions::defaults());

        if (effective.host.empty())
            return std::unexpected(makeError(ErrorKind::Connect, "No remote host given"));
        if (auto valid = Persistence::validateDispatcherOptions(effective); !valid)
            return std::unexpected(makeError(ErrorKind::Connect, fmt::format("Invalid options: {}", valid.error())));

        if (options.logLevel)
            Log::setLevel(Log::levelFromString(*options.logLevel));
        if (options.logFile)
            Log::setupFileLogging(*options.logFile);
        if (!transport || !keyLoader || !fileSystem)
            return std::unexpected(makeError(ErrorKind::Connect, "Missing transport, key loader or filesystem"));

        auto credential = resolveCredential(
            CredentialRequest{
                .user = effective.user,
                .password = effective.password,
                .keyPath = effective.sshKey,
                .passphrase = effective.keyPassphrase,
                .sshDirectory = effective.sshOptions.sshDirectory,
            },
            *fileSystem,
            *keyLoader);
        if (!credential)
        {
            Log::error("RemoteDispatcher: {}", credential.error().toString());
            return std::unexpected(std::move(credential).error());
        }

        const RemoteHost host{.host = effective.host, .port = *effective.port};
        const RemoteDispatcher::Settings settings{
            .channelCloseTimeout = std::chrono::milliseconds{*effective.channelCloseTimeoutMs},
            .execPollTimeout = std::chrono::milliseconds{*effective.execPollTimeoutMs},
            .copyChunkSize = *effective.copyChunkSize,
        };

        auto session = std::make_shared<TransportSession>(std::move(transport), settings.channelCloseTimeout);
        if (auto established = session->establish(host, *credential); !established)
            return std::unexpected(std::move(established).error());

        return std::make_unique<RemoteDispatcher>(
            host, credentialUser(*credential), settings, std::move(session), std::move(fileSystem));
    }

    std::expected<std::unique_ptr<RemoteDispatcher>, Error> makeDispatcher(Persistence::DispatcherOptions const& options)
    {
        auto sshOptions = options.sshOptions;
        sshOptions.useDefaultsFrom(Persistence::DispatcherOptions::defaults().sshOptions);

        return makeDispatcher(
            options,
            std::make_unique<LibSshTransport>(std::move(sshOptions)),
            std::make_shared<LibSshKeyLoader>(),
            std::make_shared<LocalFileSystem>());
    }
}
