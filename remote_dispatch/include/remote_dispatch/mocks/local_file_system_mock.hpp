#pragma once

#include <remote_dispatch/local_file_system.hpp>

#include <gmock/gmock.h>

#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace RemoteDispatch::Test
{
    class LocalFileSystemMock : public RemoteDispatch::ILocalFileSystem
    {
      public:
        MOCK_METHOD(
            (std::expected<LocalEntry, std::error_code>),
            status,
            (std::filesystem::path const& path),
            (const, override));
        MOCK_METHOD(
            (std::expected<std::vector<LocalEntry>, std::error_code>),
            listDirectory,
            (std::filesystem::path const& path),
            (const, override));
        MOCK_METHOD(
            (std::expected<std::unique_ptr<std::istream>, std::error_code>),
            openForRead,
            (std::filesystem::path const& path),
            (const, override));
        MOCK_METHOD(
            (std::expected<std::vector<std::filesystem::path>, std::error_code>),
            glob,
            (std::string const& pattern),
            (const, override));
        MOCK_METHOD(std::optional<std::string>, localUser, (), (const, override));
        MOCK_METHOD(
            std::optional<std::filesystem::path>,
            homeDirectory,
            (std::string const& user),
            (const, override));

        /**
         * @brief Forwards every call to the real filesystem, individual calls can be overridden with ON_CALL.
         */
        void delegateToReal()
        {
            using ::testing::_;
            ON_CALL(*this, status(_)).WillByDefault([this](std::filesystem::path const& path) {
                return real_.status(path);
            });
            ON_CALL(*this, listDirectory(_)).WillByDefault([this](std::filesystem::path const& path) {
                return real_.listDirectory(path);
            });
            ON_CALL(*this, openForRead(_)).WillByDefault([this](std::filesystem::path const& path) {
                return real_.openForRead(path);
            });
            ON_CALL(*this, glob(_)).WillByDefault([this](std::string const& pattern) {
                return real_.glob(pattern);
            });
            ON_CALL(*this, localUser()).WillByDefault([this]() {
                return real_.localUser();
            });
            ON_CALL(*this, homeDirectory(_)).WillByDefault([this](std::string const& user) {
                return real_.homeDirectory(user);
            });
        }

      private:
        LocalFileSystem real_{};
    };
}
