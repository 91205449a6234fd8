#pragma once

#include <remote_dispatch/transport/transport.hpp>

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace RemoteDispatch::Test
{
    struct FakeCommandResult
    {
        std::string standardOutput{};
        std::string standardError{};
        std::optional<int> exitStatus{0};
    };

    /**
     * @brief In memory stand in for an ssh server: a remote filesystem, a tiny command interpreter and knobs to
     * make individual steps fail. Shared between the test and the transports created for it.
     *
     * Built in commands: "true", "false", "exit N", "echo TEXT", "echo-stderr TEXT", "cat PATH", "block", "kill TEXT".
     * "kill" writes TEXT to stdout and ends without an exit status, like a process killed by a signal.
     * "block" produces no output until its channel is closed.
     */
    class FakeServer
    {
      public:
        struct Node
        {
            FileType type{FileType::Regular};
            std::string content{};
            std::filesystem::perms permissions{std::filesystem::perms::none};
        };

        FakeServer();

        void addDirectory(std::filesystem::path const& path, std::filesystem::perms permissions = defaultDirectory);
        void addFile(
            std::filesystem::path const& path,
            std::string content,
            std::filesystem::perms permissions = defaultFile);

        std::optional<std::string> readFile(std::filesystem::path const& path) const;
        std::optional<Node> node(std::filesystem::path const& path) const;
        bool exists(std::filesystem::path const& path) const;
        bool isDirectory(std::filesystem::path const& path) const;

        /**
         * @brief Registers a command handler, consulted before the built in commands.
         */
        void onCommand(std::string const& name, std::function<FakeCommandResult(std::string const& arguments)> handler);

        std::optional<FakeCommandResult> run(std::string const& command);

        std::string normalize(std::filesystem::path const& path) const;

      public:
        static constexpr auto defaultDirectory = std::filesystem::perms{0755};
        static constexpr auto defaultFile = std::filesystem::perms{0644};

        std::filesystem::path homeDirectory{"/home/tester"};

        // Connection behavior
        std::optional<Error> connectError{std::nullopt};
        std::optional<std::string> acceptedPassword{std::nullopt};
        std::optional<std::filesystem::path> acceptedKey{std::nullopt};
        std::optional<Error> openChannelError{std::nullopt};
        // If valid, authenticate blocks until it becomes ready.
        std::shared_future<void> authenticationGate{};
        std::promise<void> authenticationEntered{};

        // Failure injection
        std::set<std::string> deniedPaths{};
        bool failChannelClose{false};
        bool hangChannelClose{false};

        std::atomic_int connectCount{0};
        std::atomic_int authenticateCount{0};
        std::atomic_int disconnectCount{0};
        std::atomic_int execChannelsOpened{0};
        std::atomic_int sftpChannelsOpened{0};

        mutable std::mutex mutex{};
        std::map<std::string, Node> nodes{};
        std::vector<std::promise<std::expected<void, Error>>> hangingCloses{};

      private:
        std::map<std::string, std::function<FakeCommandResult(std::string const&)>> commands_{};
    };

    class FakeTransport : public ITransport
    {
      public:
        explicit FakeTransport(std::shared_ptr<FakeServer> server);

        std::expected<void, Error> connect(RemoteHost const& host) override;
        std::expected<void, Error> authenticate(Credential const& credential) override;
        std::expected<std::shared_ptr<IExecChannel>, Error> openExecChannel() override;
        std::expected<std::shared_ptr<ISftpChannel>, Error> openSftpChannel() override;
        void disconnect() override;

        bool isConnected() const;

      private:
        std::shared_ptr<FakeServer> server_;
        std::atomic_bool connected_{false};
        std::atomic_bool authenticated_{false};
    };

    /**
     * @brief Base for fake channels, implements closing and the knobs that make closing misbehave.
     */
    class FakeChannelState
    {
      public:
        explicit FakeChannelState(std::shared_ptr<FakeServer> server);

        std::future<std::expected<void, Error>> close();
        bool isOpen() const;

      protected:
        std::shared_ptr<FakeServer> server_;
        mutable std::mutex mutex_{};
        std::condition_variable changed_{};
        bool closed_{false};
    };

    class FakeExecChannel
        : public IExecChannel
        , private FakeChannelState
    {
      public:
        explicit FakeExecChannel(std::shared_ptr<FakeServer> server);

        std::expected<void, Error> requestExec(std::string const& command) override;
        std::expected<ReadResult, Error>
        readSome(StreamKind stream, std::span<char> buffer, std::chrono::milliseconds timeout) override;
        std::expected<std::optional<int>, Error> exitStatus() override;
        std::future<std::expected<void, Error>> close() override;
        bool isOpen() const override;

      private:
        bool requested_{false};
        bool finished_{false};
        std::string standardOutput_{};
        std::string standardError_{};
        std::optional<int> exitStatus_{0};
    };

    class FakeSftpChannel
        : public ISftpChannel
        , private FakeChannelState
    {
      public:
        explicit FakeSftpChannel(std::shared_ptr<FakeServer> server);

        std::expected<FileInformation, Error> stat(std::filesystem::path const& path) override;
        std::expected<FileInformation, Error> lstat(std::filesystem::path const& path) override;
        std::expected<std::vector<FileInformation>, Error> listDirectory(std::filesystem::path const& path) override;
        std::expected<void, Error>
        makeDirectory(std::filesystem::path const& path, std::filesystem::perms permissions) override;
        std::expected<void, Error> removeFile(std::filesystem::path const& path) override;
        std::expected<void, Error> removeDirectory(std::filesystem::path const& path) override;
        std::expected<void, Error>
        chmod(std::filesystem::path const& path, std::filesystem::perms permissions) override;
        std::expected<std::unique_ptr<IRemoteFile>, Error>
        openForWrite(std::filesystem::path const& path, std::filesystem::perms permissions) override;
        std::future<std::expected<void, Error>> close() override;
        bool isOpen() const override;

        std::expected<void, Error> checkOpen() const;
        FakeServer& server() const
        {
            return *server_;
        }
    };
}
