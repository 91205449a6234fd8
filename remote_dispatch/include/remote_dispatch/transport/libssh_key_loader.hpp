#pragma once

#include <remote_dispatch/key_loader.hpp>

namespace RemoteDispatch
{
    /**
     * @brief Validates private keys with ssh_pki_import_privkey_file.
     */
    class LibSshKeyLoader : public IKeyLoader
    {
      public:
        std::expected<void, Error>
        load(std::filesystem::path const& path, std::optional<std::string> const& passphrase) const override;
    };
}
