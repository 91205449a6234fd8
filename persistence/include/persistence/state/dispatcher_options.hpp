#pragma once

#include <persistence/state_core.hpp>
#include <persistence/state/ssh_options.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace Persistence
{
    /**
     * @brief Everything needed to bring up one dispatcher against one remote host.
     * password and keyPassphrase are read from json but never written back.
     */
    struct DispatcherOptions
    {
        std::string host{};
        std::optional<int> port{std::nullopt};
        std::optional<std::string> user{std::nullopt};
        std::optional<std::string> password{std::nullopt};
        std::optional<std::filesystem::path> sshKey{std::nullopt};
        std::optional<std::string> keyPassphrase{std::nullopt};
        std::optional<int> channelCloseTimeoutMs{std::nullopt};
        std::optional<int> execPollTimeoutMs{std::nullopt};
        std::optional<std::size_t> copyChunkSize{std::nullopt};
        std::optional<std::string> logLevel{std::nullopt};
        std::optional<std::filesystem::path> logFile{std::nullopt};
        SshOptions sshOptions{};

        /**
         * @brief The values used for everything left unset.
         */
        static DispatcherOptions defaults();

        void useDefaultsFrom(DispatcherOptions const& other);
    };
    void to_json(nlohmann::json& j, DispatcherOptions const& options);
    void from_json(nlohmann::json const& j, DispatcherOptions& options);
}
