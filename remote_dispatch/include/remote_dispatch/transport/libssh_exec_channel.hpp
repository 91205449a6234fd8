#pragma once

#include <remote_dispatch/async/processing_strand.hpp>
#include <remote_dispatch/transport/transport.hpp>

#include <libssh/libsshpp.hpp>

#include <memory>

namespace RemoteDispatch
{
    class LibSshExecChannel : public IExecChannel
    {
      public:
        LibSshExecChannel(
            std::unique_ptr<ProcessingStrand> strand,
            std::unique_ptr<ssh::Channel> channel,
            ssh_session session);
        ~LibSshExecChannel() override;

        std::expected<void, Error> requestExec(std::string const& command) override;
        std::expected<ReadResult, Error>
        readSome(StreamKind stream, std::span<char> buffer, std::chrono::milliseconds timeout) override;
        std::expected<std::optional<int>, Error> exitStatus() override;
        std::future<std::expected<void, Error>> close() override;
        bool isOpen() const override;

      private:
        template <typename T, typename FunctionT>
        std::expected<T, Error> perform(FunctionT&& func);

      private:
        std::unique_ptr<ProcessingStrand> strand_;
        std::unique_ptr<ssh::Channel> channel_;
        ssh_session session_;
    };
}
