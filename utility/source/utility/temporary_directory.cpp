#include <utility/temporary_directory.hpp>

#include <cstdlib>
#include <stdexcept>
#include <string>

#include <stdlib.h>

namespace Utility
{
    TemporaryDirectory::TemporaryDirectory()
        : TemporaryDirectory{std::filesystem::temp_directory_path() / "remote_dispatch_tmpdir"}
    {}

    TemporaryDirectory::TemporaryDirectory(std::filesystem::path basePath, bool removeBase)
        : m_basePath{std::move(basePath)}
        , m_path{}
        , m_removeBase{removeBase}
    {
        std::error_code ec;
        std::filesystem::create_directories(m_basePath, ec);
        if (ec)
            throw std::runtime_error("Could not create temporary base directory '" + m_basePath.string() +
                                     "': " + ec.message());

        std::string dirNameAsString{(m_basePath / "dirXXXXXX").string()};
        const bool valid = mkdtemp(dirNameAsString.data()) != nullptr && std::filesystem::is_directory(dirNameAsString);
        if (!valid)
            throw std::runtime_error("Could not setup temporary directory below: " + m_basePath.string());

        m_path = dirNameAsString;
    }

    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code error;
        std::filesystem::remove_all(m_path, error);
        if (m_removeBase)
            std::filesystem::remove(m_basePath, error);
    }

    std::filesystem::path const& TemporaryDirectory::path() const
    {
        return m_path;
    }
}
