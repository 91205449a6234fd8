#pragma once

#include <remote_dispatch/error.hpp>
#include <remote_dispatch/key_loader.hpp>
#include <remote_dispatch/local_file_system.hpp>

#include <array>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace RemoteDispatch
{
    struct PasswordCredential
    {
        std::string user;
        std::string password;
    };

    struct KeyCredential
    {
        std::string user;
        std::filesystem::path keyPath;
        std::optional<std::string> passphrase{std::nullopt};
    };

    using Credential = std::variant<PasswordCredential, KeyCredential>;

    std::string const& credentialUser(Credential const& credential);

    /**
     * @brief Human readable description without any secret, for logging.
     */
    std::string describeCredential(Credential const& credential);

    struct CredentialRequest
    {
        std::optional<std::string> user{std::nullopt};
        std::optional<std::string> password{std::nullopt};
        std::optional<std::filesystem::path> keyPath{std::nullopt};
        std::optional<std::string> passphrase{std::nullopt};
        // Where default keys are searched, defaults to ~user/.ssh
        std::optional<std::filesystem::path> sshDirectory{std::nullopt};
    };

    /**
     * @brief Default key file names in the order they are tried.
     */
    inline constexpr std::array<std::string_view, 4> defaultKeyFileNames{
        "id_rsa",
        "id_dsa",
        "id_ecdsa",
        "id_ed25519",
    };

    /**
     * @brief Expands a leading "~" or "~user" with the respective home directory.
     */
    std::filesystem::path expandHome(std::filesystem::path const& path, ILocalFileSystem const& fileSystem);

    /**
     * @brief Picks the authentication method. Tried in order:
     * 1. password, if given.
     * 2. the given key file.
     * 3. the first default key file found in the ssh directory.
     *
     * The user defaults to the invoking local user. Nothing here touches the network.
     */
    std::expected<Credential, Error> resolveCredential(
        CredentialRequest const& request,
        ILocalFileSystem const& fileSystem,
        IKeyLoader const& keyLoader);
}
