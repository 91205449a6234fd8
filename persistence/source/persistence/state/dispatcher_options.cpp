#include <persistence/state/dispatcher_options.hpp>

namespace Persistence
{
    DispatcherOptions DispatcherOptions::defaults()
    {
        return DispatcherOptions{
            .port = 22,
            .channelCloseTimeoutMs = 5000,
            .execPollTimeoutMs = 50,
            .copyChunkSize = 32 * 1024,
            .logLevel = "info",
            .sshOptions =
                SshOptions{
                    .strictHostKeyCheck = false,
                    .connectTimeoutSeconds = 30,
                },
        };
    }

    void DispatcherOptions::useDefaultsFrom(DispatcherOptions const& other)
    {
        if (host.empty())
            host = other.host;
        Detail::takeDefault(port, other.port);
        Detail::takeDefault(user, other.user);
        Detail::takeDefault(password, other.password);
        Detail::takeDefault(sshKey, other.sshKey);
        Detail::takeDefault(keyPassphrase, other.keyPassphrase);
        Detail::takeDefault(channelCloseTimeoutMs, other.channelCloseTimeoutMs);
        Detail::takeDefault(execPollTimeoutMs, other.execPollTimeoutMs);
        Detail::takeDefault(copyChunkSize, other.copyChunkSize);
        Detail::takeDefault(logLevel, other.logLevel);
        Detail::takeDefault(logFile, other.logFile);

        sshOptions.useDefaultsFrom(other.sshOptions);
    }

    void to_json(nlohmann::json& j, DispatcherOptions const& options)
    {
        j = {{"host", options.host}};

        TO_JSON_OPTIONAL(j, options, port);
        TO_JSON_OPTIONAL(j, options, user);
        TO_JSON_OPTIONAL(j, options, sshKey);
        TO_JSON_OPTIONAL(j, options, channelCloseTimeoutMs);
        TO_JSON_OPTIONAL(j, options, execPollTimeoutMs);
        TO_JSON_OPTIONAL(j, options, copyChunkSize);
        TO_JSON_OPTIONAL(j, options, logLevel);
        TO_JSON_OPTIONAL(j, options, logFile);
        j["sshOptions"] = options.sshOptions;
    }
    void from_json(nlohmann::json const& j, DispatcherOptions& options)
    {
        options = {};

        j.at("host").get_to(options.host);
        FROM_JSON_OPTIONAL(j, options, port);
        FROM_JSON_OPTIONAL(j, options, user);
        FROM_JSON_OPTIONAL(j, options, password);
        FROM_JSON_OPTIONAL(j, options, sshKey);
        FROM_JSON_OPTIONAL(j, options, keyPassphrase);
        FROM_JSON_OPTIONAL(j, options, channelCloseTimeoutMs);
        FROM_JSON_OPTIONAL(j, options, execPollTimeoutMs);
        FROM_JSON_OPTIONAL(j, options, copyChunkSize);
        FROM_JSON_OPTIONAL(j, options, logLevel);
        FROM_JSON_OPTIONAL(j, options, logFile);
        if (j.contains("sshOptions"))
            j.at("sshOptions").get_to(options.sshOptions);
    }
}
