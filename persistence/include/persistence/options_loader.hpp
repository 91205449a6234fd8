#pragma once

#include <persistence/state/dispatcher_options.hpp>

#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>

namespace Persistence
{
    // Upper bound for copyChunkSize, a copy holds one chunk in memory.
    constexpr std::size_t maxCopyChunkSize = 64 * 1024 * 1024;

    /**
     * @brief Checks the value ranges of options that already had their defaults applied.
     * Timeouts must be positive, the chunk size within (0, maxCopyChunkSize] and the log level a known name.
     *
     * @return std::expected<void, std::string> A description of the first offending value.
     */
    std::expected<void, std::string> validateDispatcherOptions(DispatcherOptions const& options);

    /**
     * @brief Reads dispatcher options from a json file and fills unset values from DispatcherOptions::defaults().
     *
     * @param path The json file.
     * @return std::expected<DispatcherOptions, std::string> The options or a description of what went wrong.
     */
    std::expected<DispatcherOptions, std::string> loadDispatcherOptions(std::filesystem::path const& path);

    /**
     * @brief Same as loadDispatcherOptions but for json text.
     */
    std::expected<DispatcherOptions, std::string> parseDispatcherOptions(std::string const& text);
}
