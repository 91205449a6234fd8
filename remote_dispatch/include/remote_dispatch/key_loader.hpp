#pragma once

#include <remote_dispatch/error.hpp>

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace RemoteDispatch
{
    /**
     * @brief Parses private key files. Used to reject unusable keys before any network traffic happens.
     */
    class IKeyLoader
    {
      public:
        IKeyLoader() = default;
        virtual ~IKeyLoader() = default;
        IKeyLoader(IKeyLoader const&) = default;
        IKeyLoader& operator=(IKeyLoader const&) = default;
        IKeyLoader(IKeyLoader&&) = default;
        IKeyLoader& operator=(IKeyLoader&&) = default;

        /**
         * @brief Loads the key to check that it is usable.
         *
         * @param path The private key file.
         * @param passphrase The passphrase for encrypted keys.
         * @return A CredentialError if the key is malformed, unreadable or encrypted and no passphrase was given.
         */
        virtual std::expected<void, Error>
        load(std::filesystem::path const& path, std::optional<std::string> const& passphrase) const = 0;
    };
}
