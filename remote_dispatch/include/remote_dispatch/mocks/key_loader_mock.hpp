#pragma once

#include <remote_dispatch/key_loader.hpp>

#include <gmock/gmock.h>

namespace RemoteDispatch::Test
{
    class KeyLoaderMock : public RemoteDispatch::IKeyLoader
    {
      public:
        MOCK_METHOD(
            (std::expected<void, Error>),
            load,
            (std::filesystem::path const& path, std::optional<std::string> const& passphrase),
            (const, override));
    };
}
