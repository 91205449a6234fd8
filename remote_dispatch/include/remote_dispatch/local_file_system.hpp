#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace RemoteDispatch
{
    struct LocalEntry
    {
        std::filesystem::path path{};
        // Type of the link target for symlinks.
        std::filesystem::file_type type{std::filesystem::file_type::none};
        bool isSymlink{false};
        std::uint64_t size{0};
        std::filesystem::perms permissions{std::filesystem::perms::unknown};

        bool isDirectory() const
        {
            return type == std::filesystem::file_type::directory;
        }
        bool isRegularFile() const
        {
            return type == std::filesystem::file_type::regular;
        }
    };

    /**
     * @brief Access to the local filesystem, as far as copying and key discovery need it.
     */
    class ILocalFileSystem
    {
      public:
        ILocalFileSystem() = default;
        virtual ~ILocalFileSystem() = default;
        ILocalFileSystem(ILocalFileSystem const&) = default;
        ILocalFileSystem& operator=(ILocalFileSystem const&) = default;
        ILocalFileSystem(ILocalFileSystem&&) = default;
        ILocalFileSystem& operator=(ILocalFileSystem&&) = default;

        /**
         * @brief Retrieves type, size and permissions of a path. Symlinks are followed.
         */
        virtual std::expected<LocalEntry, std::error_code> status(std::filesystem::path const& path) const = 0;

        /**
         * @brief Lists a directory without "." and "..". Entry paths are file names only, sorted lexicographically.
         */
        virtual std::expected<std::vector<LocalEntry>, std::error_code>
        listDirectory(std::filesystem::path const& path) const = 0;

        /**
         * @brief Opens a file for binary reading.
         */
        virtual std::expected<std::unique_ptr<std::istream>, std::error_code>
        openForRead(std::filesystem::path const& path) const = 0;

        /**
         * @brief Expands a shell wildcard pattern. No match yields an empty vector. Matches are sorted.
         */
        virtual std::expected<std::vector<std::filesystem::path>, std::error_code>
        glob(std::string const& pattern) const = 0;

        /**
         * @brief Name of the invoking local user.
         */
        virtual std::optional<std::string> localUser() const = 0;

        /**
         * @brief Home directory of the given local user.
         */
        virtual std::optional<std::filesystem::path> homeDirectory(std::string const& user) const = 0;
    };

    class LocalFileSystem : public ILocalFileSystem
    {
      public:
        std::expected<LocalEntry, std::error_code> status(std::filesystem::path const& path) const override;
        std::expected<std::vector<LocalEntry>, std::error_code>
        listDirectory(std::filesystem::path const& path) const override;
        std::expected<std::unique_ptr<std::istream>, std::error_code>
        openForRead(std::filesystem::path const& path) const override;
        std::expected<std::vector<std::filesystem::path>, std::error_code>
        glob(std::string const& pattern) const override;
        std::optional<std::string> localUser() const override;
        std::optional<std::filesystem::path> homeDirectory(std::string const& user) const override;
    };

    /**
     * @brief True if the string contains glob wildcard characters.
     */
    bool isGlobPattern(std::string const& text);
}
