#include <log/log.hpp>

namespace Log
{
    namespace Detail
    {
        Logger logger{};
    }

    void setupFileLogging(std::filesystem::path const& path)
    {
        if (path.has_parent_path())
        {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec)
                Detail::logger.log(
                    Level::Warning, "Could not create log directory '{}': {}", path.parent_path().string(), ec.message());
        }
        if (!Detail::logger.addFileSink(path))
            Detail::logger.log(Level::Debug, "Already logging to '{}'", path.string());
    }
}
