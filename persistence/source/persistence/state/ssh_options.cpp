#include <persistence/state/ssh_options.hpp>

namespace Persistence
{
    void to_json(nlohmann::json& j, SshOptions const& options)
    {
        j = nlohmann::json::object();
        TO_JSON_OPTIONAL(j, options, sshDirectory);
        TO_JSON_OPTIONAL(j, options, knownHostsFile);
        TO_JSON_OPTIONAL(j, options, strictHostKeyCheck);
        TO_JSON_OPTIONAL(j, options, connectTimeoutSeconds);
        TO_JSON_OPTIONAL(j, options, logVerbosity);
        TO_JSON_OPTIONAL(j, options, keyExchangeAlgorithms);
        TO_JSON_OPTIONAL(j, options, compressionClientToServer);
        TO_JSON_OPTIONAL(j, options, compressionServerToClient);
        TO_JSON_OPTIONAL(j, options, noDelay);
        TO_JSON_OPTIONAL(j, options, bypassConfig);
    }
    void from_json(nlohmann::json const& j, SshOptions& options)
    {
        FROM_JSON_OPTIONAL(j, options, sshDirectory);
        FROM_JSON_OPTIONAL(j, options, knownHostsFile);
        FROM_JSON_OPTIONAL(j, options, strictHostKeyCheck);
        FROM_JSON_OPTIONAL(j, options, connectTimeoutSeconds);
        FROM_JSON_OPTIONAL(j, options, logVerbosity);
        FROM_JSON_OPTIONAL(j, options, keyExchangeAlgorithms);
        FROM_JSON_OPTIONAL(j, options, compressionClientToServer);
        FROM_JSON_OPTIONAL(j, options, compressionServerToClient);
        FROM_JSON_OPTIONAL(j, options, noDelay);
        FROM_JSON_OPTIONAL(j, options, bypassConfig);
    }

    void SshOptions::useDefaultsFrom(SshOptions const& other)
    {
        Detail::takeDefault(sshDirectory, other.sshDirectory);
        Detail::takeDefault(knownHostsFile, other.knownHostsFile);
        Detail::takeDefault(strictHostKeyCheck, other.strictHostKeyCheck);
        Detail::takeDefault(connectTimeoutSeconds, other.connectTimeoutSeconds);
        Detail::takeDefault(logVerbosity, other.logVerbosity);
        Detail::takeDefault(keyExchangeAlgorithms, other.keyExchangeAlgorithms);
        Detail::takeDefault(compressionClientToServer, other.compressionClientToServer);
        Detail::takeDefault(compressionServerToClient, other.compressionServerToClient);
        Detail::takeDefault(noDelay, other.noDelay);
        Detail::takeDefault(bypassConfig, other.bypassConfig);
    }
}
