#pragma once

#include <filesystem>

namespace Utility
{
    /**
     * @brief Creates a uniquely named directory on construction and removes it, with all contents, on destruction.
     */
    class TemporaryDirectory
    {
      public:
        TemporaryDirectory();

        /**
         * @brief Creates the directory below basePath.
         *
         * @param basePath Parent of the temporary directory, created if missing.
         * @param removeBase If true the base path is removed too, provided it is empty by then.
         */
        explicit TemporaryDirectory(std::filesystem::path basePath, bool removeBase = true);
        ~TemporaryDirectory();

        TemporaryDirectory(TemporaryDirectory const&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory const&) = delete;

        TemporaryDirectory(TemporaryDirectory&&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory&&) = delete;

        std::filesystem::path const& path() const;

      private:
        std::filesystem::path m_basePath;
        std::filesystem::path m_path;
        bool m_removeBase;
    };
}
