#pragma once

#include <remote_dispatch/async/processing_thread.hpp>
#include <remote_dispatch/transport/transport.hpp>

#include <persistence/state/ssh_options.hpp>

#include <libssh/libsshpp.hpp>

#include <mutex>

namespace RemoteDispatch
{
    /**
     * @brief ITransport on top of libssh. All libssh calls of the session are carried out on one processing thread,
     * every channel pushes its work through its own strand.
     */
    class LibSshTransport : public ITransport
    {
      public:
        explicit LibSshTransport(Persistence::SshOptions options);
        ~LibSshTransport() override;

        std::expected<void, Error> connect(RemoteHost const& host) override;
        std::expected<void, Error> authenticate(Credential const& credential) override;
        std::expected<std::shared_ptr<IExecChannel>, Error> openExecChannel() override;
        std::expected<std::shared_ptr<ISftpChannel>, Error> openSftpChannel() override;
        void disconnect() override;

      private:
        std::expected<void, Error> applyOptions(RemoteHost const& host);
        std::expected<void, Error> verifyHost();

        /**
         * @brief Runs a task on the processing thread and waits for it.
         */
        template <typename T, typename FunctionT>
        std::expected<T, Error> run(ErrorKind kind, FunctionT&& func);

      private:
        Persistence::SshOptions options_;
        ProcessingThread processingThread_;
        ssh::Session session_;
        std::mutex lifecycleMutex_{};
        bool connected_{false};
    };
}
