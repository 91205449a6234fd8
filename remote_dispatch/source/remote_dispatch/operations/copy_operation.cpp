#include <remote_dispatch/operations/copy_operation.hpp>

#include <log/log.hpp>

#include <fmt/format.h>

#include <istream>
#include <span>
#include <tuple>

namespace RemoteDispatch
{
    namespace
    {
        constexpr int maximumTreeDepth = 128;
        constexpr auto defaultDirectoryPermissions = std::filesystem::perms::owner_all |
            std::filesystem::perms::group_read | std::filesystem::perms::group_exec |
            std::filesystem::perms::others_read | std::filesystem::perms::others_exec;

        std::filesystem::path normalizeSource(std::string source)
        {
            while (source.size() > 1 && source.back() == '/')
                source.pop_back();
            return std::filesystem::path{source};
        }

        Error transferError(Error const& error, std::string_view context)
        {
            if (error.kind == ErrorKind::State)
                return error;
            return reclassify(error, ErrorKind::Transfer, context);
        }
    }

    std::expected<CopyTask, Error> makeCopyTask(
        std::string const& source,
        std::filesystem::path const& destination,
        ILocalFileSystem const& fileSystem)
    {
        const auto normalized = normalizeSource(source);
        if (normalized.empty())
            return std::unexpected(makeError(ErrorKind::Transfer, "The copy source is empty"));
        if (destination.empty())
            return std::unexpected(makeError(ErrorKind::Transfer, "The copy destination is empty"));

        const auto entry = fileSystem.status(normalized);
        if (entry)
        {
            if (entry->isRegularFile())
                return CopyTask{.source = normalized, .destination = destination, .mode = CopyTask::Mode::File};
            if (entry->isDirectory())
                return CopyTask{.source = normalized, .destination = destination, .mode = CopyTask::Mode::Directory};
            return std::unexpected(makeError(
                ErrorKind::Transfer,
                fmt::format("'{}' is neither a regular file nor a directory", normalized.generic_string())));
        }

        if (!isGlobPattern(source))
        {
            return std::unexpected(makeError(
                ErrorKind::Transfer,
                fmt::format("Cannot access '{}': {}", normalized.generic_string(), entry.error().message())));
        }

        auto matches = fileSystem.glob(source);
        if (!matches)
        {
            return std::unexpected(makeError(
                ErrorKind::Transfer, fmt::format("Cannot expand pattern '{}': {}", source, matches.error().message())));
        }
        if (matches->empty())
            return std::unexpected(makeError(ErrorKind::Transfer, fmt::format("No match for pattern '{}'", source)));

        return CopyTask{
            .source = normalized,
            .destination = destination,
            .mode = CopyTask::Mode::Pattern,
            .matches = std::move(matches).value(),
        };
    }

    CopyOperation::CopyOperation(
        std::shared_ptr<TransportSession> session,
        std::shared_ptr<ILocalFileSystem const> fileSystem,
        CopyOperationOptions options)
        : ChannelOperation{std::move(session)}
        , fileSystem_{std::move(fileSystem)}
        , options_{std::move(options)}
    {
        if (options_.chunkSize == 0)
            options_.chunkSize = 32768;
    }

    std::expected<CopyReport, Error> CopyOperation::perform()
    {
        if (const auto current = state(); current != State::NotStarted)
        {
            if (current == State::Canceled)
                return std::unexpected(makeError(ErrorKind::Transfer, "Copy was canceled before it started"));
            return std::unexpected(makeError(
                ErrorKind::State, fmt::format("Copy operation cannot run in state {}", operationStateToString(current))));
        }
        enterState(State::Running);

        auto task = makeCopyTask(options_.source, options_.destination, *fileSystem_);
        if (!task)
        {
            Log::error("CopyOperation {}: {}", id().value(), task.error().toString());
            return enterErrorState<CopyReport>(task.error());
        }
        Log::info(
            "CopyOperation {}: Copying '{}' to '{}'",
            id().value(),
            task->source.generic_string(),
            task->destination.generic_string());

        auto channel = session_->openSftpChannel();
        if (!channel)
            return enterErrorState<CopyReport>(transferError(channel.error(), "Cannot open sftp channel"));
        if (!bindChannel(channel->id()))
            return enterErrorState<CopyReport>(makeError(ErrorKind::Transfer, "Copy was canceled"));

        auto& sftp = **channel;
        CopyReport report{};
        std::vector<TransferFailure> failures{};

        switch (task->mode)
        {
            case CopyTask::Mode::File:
            {
                auto local = fileSystem_->status(task->source);
                if (!local)
                {
                    failures.push_back({.path = task->source, .reason = local.error().message()});
                    break;
                }
                std::ignore = copyFile(sftp, *local, resolveTarget(sftp, task->source, task->destination), report, failures);
                break;
            }
            case CopyTask::Mode::Directory:
            {
                auto local = fileSystem_->status(task->source);
                if (!local)
                {
                    failures.push_back({.path = task->source, .reason = local.error().message()});
                    break;
                }
                std::ignore = copyTree(
                    sftp,
                    task->source,
                    resolveTarget(sftp, task->source, task->destination),
                    local->permissions,
                    report,
                    failures,
                    0);
                break;
            }
            case CopyTask::Mode::Pattern:
            {
                if (auto made = ensureDirectory(sftp, task->destination, defaultDirectoryPermissions, report); !made)
                {
                    if (recordFailure(failures, task->destination, made.error()))
                    {
                        for (auto const& match : task->matches)
                            failures.push_back(
                                {.path = match, .reason = "Destination directory is not usable", .skipped = true});
                    }
                    break;
                }

                for (auto const& match : task->matches)
                {
                    auto local = fileSystem_->status(match);
                    if (!local)
                    {
                        failures.push_back({.path = match, .reason = local.error().message()});
                        continue;
                    }

                    const auto remote = task->destination / match.filename();
                    std::expected<void, Aborted> result{};
                    if (local->isDirectory())
                        result = copyTree(sftp, match, remote, local->permissions, report, failures, 0);
                    else if (local->isRegularFile())
                        result = copyFile(sftp, *local, remote, report, failures);
                    else
                        failures.push_back({.path = match, .reason = "Not a regular file or directory"});

                    if (!result)
                        break;
                }
                break;
            }
        }

        unbindChannel();
        channel->release();

        if (!failures.empty())
        {
            auto error = makeError(
                ErrorKind::Transfer,
                cancelRequested() ? std::string{"Copy was canceled"}
                                  : fmt::format("{} entries could not be copied", failures.size()));
            error.failures = std::move(failures);
            Log::error("CopyOperation {}: {}", id().value(), error.toString());
            return enterErrorState<CopyReport>(std::move(error));
        }

        Log::info(
            "CopyOperation {}: Copied {} files, created {} directories, {} bytes.",
            id().value(),
            report.filesCopied,
            report.directoriesCreated,
            report.bytesTransferred);
        enterState(State::Completed);
        return report;
    }

    std::expected<void, CopyOperation::Aborted> CopyOperation::recordFailure(
        std::vector<TransferFailure>& failures,
        std::filesystem::path const& path,
        Error const& error)
    {
        failures.push_back({.path = path, .reason = error.message});
        if (error.remoteCode == RemoteErrorCode::ChannelClosed ||
            error.remoteCode == RemoteErrorCode::ConnectionLost || cancelRequested())
        {
            return std::unexpected(Aborted{});
        }
        return {};
    }

    std::filesystem::path CopyOperation::resolveTarget(
        ISftpChannel& sftp,
        std::filesystem::path const& source,
        std::filesystem::path const& destination)
    {
        if (auto info = sftp.stat(destination); info && info->isDirectory())
            return destination / source.filename();
        return destination;
    }

    std::expected<void, Error> CopyOperation::ensureDirectory(
        ISftpChannel& sftp,
        std::filesystem::path const& remote,
        std::filesystem::perms permissions,
        CopyReport& report)
    {
        auto existing = sftp.stat(remote);
        if (existing)
        {
            if (existing->isDirectory())
                return {};
            return std::unexpected(makeError(
                ErrorKind::Transfer,
                fmt::format("Remote '{}' exists and is not a directory", remote.generic_string()),
                RemoteErrorCode::NotADirectory));
        }
        if (existing.error().remoteCode != RemoteErrorCode::NoSuchFile)
            return std::unexpected(transferError(existing.error(), remote.generic_string()));

        if (auto made = sftp.makeDirectory(remote, permissions); !made)
            return std::unexpected(transferError(made.error(), fmt::format("Cannot create '{}'", remote.generic_string())));

        Log::debug("CopyOperation {}: Created remote directory '{}'", id().value(), remote.generic_string());
        ++report.directoriesCreated;
        return {};
    }

    std::expected<void, CopyOperation::Aborted> CopyOperation::copyFile(
        ISftpChannel& sftp,
        LocalEntry const& local,
        std::filesystem::path const& remote,
        CopyReport& report,
        std::vector<TransferFailure>& failures)
    {
        auto stream = fileSystem_->openForRead(local.path);
        if (!stream)
        {
            failures.push_back(
                {.path = local.path, .reason = fmt::format("Cannot open for reading: {}", stream.error().message())});
            return {};
        }

        const auto permissions = local.permissions & std::filesystem::perms::mask;
        auto remoteFile = sftp.openForWrite(remote, permissions);
        if (!remoteFile)
        {
            return recordFailure(
                failures,
                local.path,
                transferError(remoteFile.error(), fmt::format("Cannot open '{}' for writing", remote.generic_string())));
        }

        const auto closeRemote = [&]() {
            if (auto closed = (*remoteFile)->close(); !closed)
                Log::debug("CopyOperation {}: Closing '{}' failed: {}", id().value(), remote.generic_string(), closed.error().toString());
        };

        std::vector<char> buffer(options_.chunkSize);
        std::uint64_t bytesRead = 0;
        auto& input = **stream;
        while (true)
        {
            input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto count = static_cast<std::size_t>(input.gcount());
            if (count > 0)
            {
                if (auto written = (*remoteFile)->write(std::span<char const>{buffer.data(), count}); !written)
                {
                    closeRemote();
                    return recordFailure(
                        failures,
                        local.path,
                        transferError(written.error(), fmt::format("Writing '{}' failed", remote.generic_string())));
                }
                bytesRead += count;
            }

            if (input.bad())
            {
                closeRemote();
                failures.push_back({.path = local.path, .reason = "Local read error"});
                return {};
            }
            if (input.eof())
                break;
            if (input.fail())
            {
                closeRemote();
                failures.push_back({.path = local.path, .reason = "Local read error"});
                return {};
            }
        }

        if (auto closed = (*remoteFile)->close(); !closed)
        {
            return recordFailure(
                failures,
                local.path,
                transferError(closed.error(), fmt::format("Closing '{}' failed", remote.generic_string())));
        }

        if (auto changed = sftp.chmod(remote, permissions); !changed)
        {
            return recordFailure(
                failures,
                local.path,
                transferError(changed.error(), fmt::format("Setting permissions of '{}' failed", remote.generic_string())));
        }

        auto written = sftp.stat(remote);
        if (!written)
        {
            return recordFailure(
                failures,
                local.path,
                transferError(written.error(), fmt::format("Cannot verify '{}'", remote.generic_string())));
        }
        if (written->size != bytesRead)
        {
            failures.push_back(
                {.path = local.path,
                 .reason = fmt::format("Remote size {} differs from the {} bytes read", written->size, bytesRead)});
            return {};
        }

        Log::debug(
            "CopyOperation {}: Copied '{}' to '{}' ({} bytes)",
            id().value(),
            local.path.generic_string(),
            remote.generic_string(),
            bytesRead);
        ++report.filesCopied;
        report.bytesTransferred += bytesRead;
        return {};
    }

    std::expected<void, CopyOperation::Aborted> CopyOperation::copyTree(
        ISftpChannel& sftp,
        std::filesystem::path const& local,
        std::filesystem::path const& remote,
        std::filesystem::perms permissions,
        CopyReport& report,
        std::vector<TransferFailure>& failures,
        int depth)
    {
        if (depth > maximumTreeDepth)
        {
            failures.push_back({.path = local, .reason = "Directory nesting too deep, possibly a symlink loop"});
            return {};
        }

        // The owner needs full access to fill the directory.
        const auto directoryPermissions = (permissions & std::filesystem::perms::mask) | std::filesystem::perms::owner_all;
        if (auto made = ensureDirectory(sftp, remote, directoryPermissions, report); !made)
        {
            if (auto recorded = recordFailure(failures, local, made.error()); !recorded)
                return recorded;
            skipTree(local, failures, depth);
            return {};
        }

        auto entries = fileSystem_->listDirectory(local);
        if (!entries)
        {
            failures.push_back(
                {.path = local, .reason = fmt::format("Cannot list directory: {}", entries.error().message())});
            return {};
        }

        for (auto const& entry : *entries)
        {
            const auto localPath = local / entry.path;
            const auto remotePath = remote / entry.path;

            if (entry.isDirectory())
            {
                if (auto result = copyTree(sftp, localPath, remotePath, entry.permissions, report, failures, depth + 1);
                    !result)
                    return result;
            }
            else if (entry.isRegularFile())
            {
                auto file = entry;
                file.path = localPath;
                if (auto result = copyFile(sftp, file, remotePath, report, failures); !result)
                    return result;
            }
            else
            {
                failures.push_back({.path = localPath, .reason = "Not a regular file or directory"});
            }
        }
        return {};
    }

    void CopyOperation::skipTree(std::filesystem::path const& local, std::vector<TransferFailure>& failures, int depth)
    {
        if (depth > maximumTreeDepth)
            return;

        auto entries = fileSystem_->listDirectory(local);
        if (!entries)
            return;

        for (auto const& entry : *entries)
        {
            const auto localPath = local / entry.path;
            failures.push_back(
                {.path = localPath, .reason = "Parent directory could not be created", .skipped = true});
            if (entry.isDirectory())
                skipTree(localPath, failures, depth + 1);
        }
    }
}
