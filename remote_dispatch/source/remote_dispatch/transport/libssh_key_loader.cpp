#include <remote_dispatch/transport/libssh_key_loader.hpp>

#include <log/log.hpp>

#include <fmt/format.h>
#include <libssh/libssh.h>

#include <memory>

namespace RemoteDispatch
{
    namespace
    {
        // Refuses to prompt, an encrypted key without passphrase must fail instead of blocking.
        int refusePassphrasePrompt(char const*, char*, std::size_t, int, int, void*)
        {
            return -1;
        }
    }

    std::expected<void, Error>
    LibSshKeyLoader::load(std::filesystem::path const& path, std::optional<std::string> const& passphrase) const
    {
        ssh_key rawKey{nullptr};
        const auto result = ssh_pki_import_privkey_file(
            path.string().c_str(),
            passphrase ? passphrase->c_str() : nullptr,
            refusePassphrasePrompt,
            nullptr,
            &rawKey);
        std::unique_ptr<ssh_key_struct, decltype(&ssh_key_free)> key{rawKey, ssh_key_free};

        switch (result)
        {
            case SSH_OK:
                break;
            case SSH_EOF:
                return std::unexpected(makeError(
                    ErrorKind::Credential,
                    fmt::format("Key file '{}' does not exist or cannot be read", path.string())));
            default:
                return std::unexpected(makeError(
                    ErrorKind::Credential,
                    fmt::format(
                        "Key file '{}' is malformed or needs a passphrase{}",
                        path.string(),
                        passphrase ? " other than the one given" : "")));
        }

        if (!key || ssh_key_is_private(key.get()) == 0)
        {
            return std::unexpected(
                makeError(ErrorKind::Credential, fmt::format("'{}' does not contain a private key", path.string())));
        }

        Log::debug("Loaded {} key from '{}'", ssh_key_type_to_char(ssh_key_type(key.get())), path.string());
        return {};
    }
}
