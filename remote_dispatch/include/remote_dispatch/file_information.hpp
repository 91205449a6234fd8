#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace RemoteDispatch
{
    enum class FileType : std::uint8_t
    {
        Unknown = 0,
        Regular = 1,
        Directory = 2,
        Symlink = 3,
        Special = 4,
    };

    /**
     * @brief Attributes of a remote file as reported by the transfer channel.
     */
    struct FileInformation
    {
        // The name as listed, or the path that was queried for stat.
        std::filesystem::path path{};
        FileType type{FileType::Unknown};
        std::uint64_t size{0};
        std::uint32_t uid{0};
        std::uint32_t gid{0};
        std::string owner{};
        std::string group{};
        std::filesystem::perms permissions{std::filesystem::perms::unknown};
        std::uint64_t atime{0};
        std::uint64_t mtime{0};

        bool isDirectory() const
        {
            return type == FileType::Directory;
        }
        bool isRegularFile() const
        {
            return type == FileType::Regular;
        }
        bool isSymlink() const
        {
            return type == FileType::Symlink;
        }
    };
}
