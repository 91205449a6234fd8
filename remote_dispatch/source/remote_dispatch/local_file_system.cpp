#include <remote_dispatch/local_file_system.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fstream>

#include <glob.h>
#include <pwd.h>
#include <unistd.h>

namespace RemoteDispatch
{
    namespace
    {
        std::error_code lastErrnoOr(std::errc fallback)
        {
            if (errno != 0)
                return std::error_code{errno, std::generic_category()};
            return std::make_error_code(fallback);
        }

        std::optional<std::string> environmentValue(char const* name)
        {
            if (auto const* value = std::getenv(name); value != nullptr && *value != '\0')
                return std::string{value};
            return std::nullopt;
        }
    }

    std::expected<LocalEntry, std::error_code> LocalFileSystem::status(std::filesystem::path const& path) const
    {
        std::error_code ec;
        const auto linkStatus = std::filesystem::symlink_status(path, ec);
        if (linkStatus.type() == std::filesystem::file_type::not_found)
            return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
        if (ec)
            return std::unexpected(ec);

        const auto targetStatus = std::filesystem::status(path, ec);
        if (targetStatus.type() == std::filesystem::file_type::not_found)
            return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
        if (ec)
            return std::unexpected(ec);

        LocalEntry entry{
            .path = path,
            .type = targetStatus.type(),
            .isSymlink = linkStatus.type() == std::filesystem::file_type::symlink,
            .permissions = targetStatus.permissions(),
        };

        if (entry.isRegularFile())
        {
            entry.size = std::filesystem::file_size(path, ec);
            if (ec)
                return std::unexpected(ec);
        }
        return entry;
    }

    std::expected<std::vector<LocalEntry>, std::error_code>
    LocalFileSystem::listDirectory(std::filesystem::path const& path) const
    {
        std::error_code ec;
        std::filesystem::directory_iterator iter{path, ec};
        if (ec)
            return std::unexpected(ec);

        std::vector<LocalEntry> entries{};
        for (; iter != std::filesystem::directory_iterator{}; iter.increment(ec))
        {
            if (ec)
                return std::unexpected(ec);

            auto entry = status(iter->path());
            if (!entry)
            {
                // Dangling symlinks are listed as unknown entries, the copy reports them individually.
                entry = LocalEntry{.path = iter->path(), .type = std::filesystem::file_type::unknown};
            }
            entry->path = iter->path().filename();
            entries.push_back(std::move(entry).value());
        }
        if (ec)
            return std::unexpected(ec);

        std::sort(entries.begin(), entries.end(), [](auto const& lhs, auto const& rhs) {
            return lhs.path.native() < rhs.path.native();
        });
        return entries;
    }

    std::expected<std::unique_ptr<std::istream>, std::error_code>
    LocalFileSystem::openForRead(std::filesystem::path const& path) const
    {
        errno = 0;
        auto stream = std::make_unique<std::ifstream>(path, std::ios_base::binary);
        if (!stream->is_open())
            return std::unexpected(lastErrnoOr(std::errc::io_error));
        return std::unique_ptr<std::istream>{std::move(stream)};
    }

    std::expected<std::vector<std::filesystem::path>, std::error_code>
    LocalFileSystem::glob(std::string const& pattern) const
    {
        glob_t globResult{};
        const auto result = ::glob(pattern.c_str(), GLOB_ERR, nullptr, &globResult);

        std::vector<std::filesystem::path> matches{};
        if (result == 0)
        {
            matches.reserve(globResult.gl_pathc);
            for (std::size_t i = 0; i != globResult.gl_pathc; ++i)
                matches.emplace_back(globResult.gl_pathv[i]);
        }
        globfree(&globResult);

        switch (result)
        {
            case 0:
                break;
            case GLOB_NOMATCH:
                return matches;
            case GLOB_NOSPACE:
                return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
            default:
                return std::unexpected(std::make_error_code(std::errc::io_error));
        }

        std::sort(matches.begin(), matches.end());
        return matches;
    }

    std::optional<std::string> LocalFileSystem::localUser() const
    {
        if (auto user = environmentValue("LOGNAME"); user)
            return user;
        if (auto user = environmentValue("USER"); user)
            return user;

        if (auto const* entry = getpwuid(geteuid()); entry != nullptr && entry->pw_name != nullptr)
            return std::string{entry->pw_name};
        return std::nullopt;
    }

    std::optional<std::filesystem::path> LocalFileSystem::homeDirectory(std::string const& user) const
    {
        if (auto const* entry = getpwnam(user.c_str()); entry != nullptr && entry->pw_dir != nullptr)
            return std::filesystem::path{entry->pw_dir};

        if (localUser() == user)
        {
            if (auto home = environmentValue("HOME"); home)
                return std::filesystem::path{*home};
        }
        return std::nullopt;
    }

    bool isGlobPattern(std::string const& text)
    {
        return text.find_first_of("*?[") != std::string::npos;
    }
}
