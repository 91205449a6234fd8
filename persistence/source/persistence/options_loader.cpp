#include <persistence/options_loader.hpp>

#include <log/level.hpp>

#include <fmt/format.h>

#include <fstream>
#include <sstream>
#include <utility>

namespace Persistence
{
    std::expected<void, std::string> validateDispatcherOptions(DispatcherOptions const& options)
    {
        if (options.host.empty())
            return std::unexpected(std::string{"Options do not name a host."});
        if (options.port && (*options.port <= 0 || *options.port > 65535))
            return std::unexpected(fmt::format("Port {} is out of range.", *options.port));
        if (options.channelCloseTimeoutMs && *options.channelCloseTimeoutMs <= 0)
            return std::unexpected(
                fmt::format("channelCloseTimeoutMs must be positive, got {}.", *options.channelCloseTimeoutMs));
        if (options.execPollTimeoutMs && *options.execPollTimeoutMs <= 0)
            return std::unexpected(
                fmt::format("execPollTimeoutMs must be positive, got {}.", *options.execPollTimeoutMs));
        if (options.copyChunkSize && (*options.copyChunkSize == 0 || *options.copyChunkSize > maxCopyChunkSize))
            return std::unexpected(fmt::format(
                "copyChunkSize must be between 1 and {}, got {}.", maxCopyChunkSize, *options.copyChunkSize));
        if (options.logLevel && !Log::parseLevel(*options.logLevel))
            return std::unexpected(fmt::format("Unknown log level '{}'.", *options.logLevel));
        return {};
    }

    std::expected<DispatcherOptions, std::string> parseDispatcherOptions(std::string const& text)
    {
        try
        {
            auto options = nlohmann::json::parse(text).get<DispatcherOptions>();
            options.useDefaultsFrom(DispatcherOptions::defaults());

            if (auto valid = validateDispatcherOptions(options); !valid)
                return std::unexpected(std::move(valid).error());

            return options;
        }
        catch (nlohmann::json::exception const& exc)
        {
            return std::unexpected(fmt::format("Invalid dispatcher options: {}", exc.what()));
        }
    }

    std::expected<DispatcherOptions, std::string> loadDispatcherOptions(std::filesystem::path const& path)
    {
        std::ifstream reader{path, std::ios_base::binary};
        if (!reader)
            return std::unexpected(fmt::format("Cannot open options file '{}'.", path.string()));

        std::stringstream buffer;
        buffer << reader.rdbuf();
        return parseDispatcherOptions(buffer.str());
    }
}
