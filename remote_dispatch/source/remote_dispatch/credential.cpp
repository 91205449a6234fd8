#include <remote_dispatch/credential.hpp>

#include <log/log.hpp>

#include <fmt/format.h>

namespace RemoteDispatch
{
    namespace
    {
        std::expected<KeyCredential, Error> validateKey(
            std::string const& user,
            std::filesystem::path const& keyPath,
            std::optional<std::string> const& passphrase,
            ILocalFileSystem const& fileSystem,
            IKeyLoader const& keyLoader)
        {
            const auto entry = fileSystem.status(keyPath);
            if (!entry)
            {
                return std::unexpected(makeError(
                    ErrorKind::Credential,
                    fmt::format("Key file '{}' is not accessible: {}", keyPath.string(), entry.error().message())));
            }
            if (!entry->isRegularFile())
            {
                return std::unexpected(
                    makeError(ErrorKind::Credential, fmt::format("Key file '{}' is not a regular file", keyPath.string())));
            }

            if (auto loaded = keyLoader.load(keyPath, passphrase); !loaded)
                return std::unexpected(reclassify(loaded.error(), ErrorKind::Credential, keyPath.string()));

            return KeyCredential{
                .user = user,
                .keyPath = keyPath,
                .passphrase = passphrase,
            };
        }
    }

    std::string const& credentialUser(Credential const& credential)
    {
        return std::visit(
            [](auto const& alternative) -> std::string const& {
                return alternative.user;
            },
            credential);
    }

    std::string describeCredential(Credential const& credential)
    {
        struct Describe
        {
            std::string operator()(PasswordCredential const& password) const
            {
                return fmt::format("password for '{}'", password.user);
            }
            std::string operator()(KeyCredential const& key) const
            {
                return fmt::format(
                    "key '{}' for '{}'{}", key.keyPath.string(), key.user, key.passphrase ? " (with passphrase)" : "");
            }
        };
        return std::visit(Describe{}, credential);
    }

    std::filesystem::path expandHome(std::filesystem::path const& path, ILocalFileSystem const& fileSystem)
    {
        const auto text = path.string();
        if (text.empty() || text.front() != '~')
            return path;

        const auto slash = text.find('/');
        const auto userPart = text.substr(1, slash == std::string::npos ? std::string::npos : slash - 1);
        const auto rest = slash == std::string::npos ? std::string{} : text.substr(slash + 1);

        std::optional<std::string> user = userPart.empty() ? fileSystem.localUser() : std::optional{userPart};
        if (!user)
            return path;

        const auto home = fileSystem.homeDirectory(*user);
        if (!home)
            return path;

        if (rest.empty())
            return *home;
        return *home / rest;
    }

    std::expected<Credential, Error> resolveCredential(
        CredentialRequest const& request,
        ILocalFileSystem const& fileSystem,
        IKeyLoader const& keyLoader)
    {
        std::string user{};
        if (request.user && !request.user->empty())
            user = *request.user;
        else if (auto localUser = fileSystem.localUser(); localUser && !localUser->empty())
            user = *localUser;
        else
            return std::unexpected(makeError(ErrorKind::Credential, "Cannot determine the user to log in as"));

        if (request.password)
        {
            Log::debug("Using password authentication for '{}'", user);
            return PasswordCredential{
                .user = user,
                .password = *request.password,
            };
        }

        if (request.keyPath)
        {
            auto key = validateKey(user, expandHome(*request.keyPath, fileSystem), request.passphrase, fileSystem, keyLoader);
            if (!key)
                return std::unexpected(std::move(key).error());
            Log::debug("Using key '{}' for '{}'", key->keyPath.string(), user);
            return std::move(key).value();
        }

        std::filesystem::path sshDirectory{};
        if (request.sshDirectory)
        {
            sshDirectory = expandHome(*request.sshDirectory, fileSystem);
        }
        else
        {
            const auto home = fileSystem.homeDirectory(user);
            if (!home)
            {
                return std::unexpected(makeError(
                    ErrorKind::Credential,
                    fmt::format("No password or key given and the home directory of '{}' is unknown", user)));
            }
            sshDirectory = *home / ".ssh";
        }

        for (auto const& name : defaultKeyFileNames)
        {
            const auto candidate = sshDirectory / name;
            const auto entry = fileSystem.status(candidate);
            if (!entry || !entry->isRegularFile())
                continue;

            Log::debug("Discovered default key '{}'", candidate.string());
            auto key = validateKey(user, candidate, request.passphrase, fileSystem, keyLoader);
            if (!key)
                return std::unexpected(std::move(key).error());
            return std::move(key).value();
        }

        return std::unexpected(makeError(
            ErrorKind::Credential,
            fmt::format("No password given and no default key found in '{}'", sshDirectory.string())));
    }
}
