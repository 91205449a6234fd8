#pragma once

#include <persistence/state_core.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace Persistence
{
    /**
     * @brief Options handed through to the ssh transport. Unset values leave the transport default in place.
     */
    struct SshOptions
    {
        std::optional<std::filesystem::path> sshDirectory{std::nullopt};
        std::optional<std::filesystem::path> knownHostsFile{std::nullopt};
        std::optional<bool> strictHostKeyCheck{std::nullopt};
        std::optional<int> connectTimeoutSeconds{std::nullopt};
        std::optional<std::string> logVerbosity{std::nullopt};
        std::optional<std::string> keyExchangeAlgorithms{std::nullopt};
        std::optional<std::string> compressionClientToServer{std::nullopt};
        std::optional<std::string> compressionServerToClient{std::nullopt};
        std::optional<bool> noDelay{std::nullopt};
        std::optional<bool> bypassConfig{std::nullopt};

        void useDefaultsFrom(SshOptions const& other);
    };
    void to_json(nlohmann::json& j, SshOptions const& options);
    void from_json(nlohmann::json const& j, SshOptions& options);
}
