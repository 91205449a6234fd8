#pragma once

#include "common_fixture.hpp"

#include <remote_dispatch/mocks/key_loader_mock.hpp>
#include <remote_dispatch/remote_dispatcher.hpp>

#include <log/log.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <future>
#include <thread>

using namespace std::chrono_literals;
using namespace std::string_literals;

namespace RemoteDispatch::Test
{
    class RemoteDispatcherTests : public CommonFixture
    {
      protected:
        Persistence::DispatcherOptions passwordOptions() const
        {
            return Persistence::DispatcherOptions{
                .host = "fake.host",
                .user = "tester",
                .password = "secret",
                .channelCloseTimeoutMs = 200,
                .execPollTimeoutMs = 10,
            };
        }

        std::expected<std::unique_ptr<RemoteDispatcher>, Error> make(Persistence::DispatcherOptions const& options)
        {
            return makeDispatcher(options, makeTransport(), keyLoader_, std::make_shared<LocalFileSystem>());
        }

        std::unique_ptr<RemoteDispatcher> makeReady()
        {
            auto dispatcher = make(passwordOptions());
            if (!dispatcher)
                throw std::runtime_error("Failed to create dispatcher: " + dispatcher.error().toString());
            return std::move(dispatcher).value();
        }

      protected:
        std::shared_ptr<::testing::NiceMock<KeyLoaderMock>> keyLoader_ =
            std::make_shared<::testing::NiceMock<KeyLoaderMock>>();
    };

    TEST_F(RemoteDispatcherTests, CanCreateDispatcher)
    {
        auto dispatcher = make(passwordOptions());

        ASSERT_TRUE(dispatcher.has_value()) << dispatcher.error().toString();
        EXPECT_EQ((*dispatcher)->host().host, "fake.host");
        EXPECT_EQ((*dispatcher)->host().port, 22);
        EXPECT_EQ((*dispatcher)->user(), "tester");
        EXPECT_FALSE((*dispatcher)->isClosed());
    }

    TEST_F(RemoteDispatcherTests, MissingHostIsConnectError)
    {
        auto options = passwordOptions();
        options.host.clear();

        auto dispatcher = make(options);

        ASSERT_FALSE(dispatcher.has_value());
        EXPECT_EQ(dispatcher.error().kind, ErrorKind::Connect);
        EXPECT_EQ(server_->connectCount.load(), 0);
    }

    TEST_F(RemoteDispatcherTests, InvalidPortIsConnectError)
    {
        auto options = passwordOptions();
        options.port = 70000;

        auto dispatcher = make(options);

        ASSERT_FALSE(dispatcher.has_value());
        EXPECT_EQ(dispatcher.error().kind, ErrorKind::Connect);
    }

    TEST_F(RemoteDispatcherTests, NegativeExecPollTimeoutIsRejectedBeforeConnecting)
    {
        auto options = passwordOptions();
        options.execPollTimeoutMs = -1;

        auto dispatcher = make(options);

        ASSERT_FALSE(dispatcher.has_value());
        EXPECT_EQ(dispatcher.error().kind, ErrorKind::Connect);
        EXPECT_EQ(server_->connectCount.load(), 0);
    }

    TEST_F(RemoteDispatcherTests, OversizedCopyChunkIsRejectedBeforeConnecting)
    {
        auto options = passwordOptions();
        options.copyChunkSize = static_cast<std::size_t>(-1);

        auto dispatcher = make(options);

        ASSERT_FALSE(dispatcher.has_value());
        EXPECT_EQ(dispatcher.error().kind, ErrorKind::Connect);
        EXPECT_EQ(server_->connectCount.load(), 0);
    }

    TEST_F(RemoteDispatcherTests, UnknownLogLevelIsRejectedAndLevelIsKept)
    {
        auto options = passwordOptions();
        options.logLevel = "verbos";

        auto dispatcher = make(options);

        ASSERT_FALSE(dispatcher.has_value());
        EXPECT_EQ(dispatcher.error().kind, ErrorKind::Connect);
        EXPECT_EQ(Log::level(), Log::Level::Off);
    }

    TEST_F(RemoteDispatcherTests, RejectedPasswordIsAuthError)
    {
        server_->acceptedPassword = "other";

        auto dispatcher = make(passwordOptions());

        ASSERT_FALSE(dispatcher.has_value());
        EXPECT_EQ(dispatcher.error().kind, ErrorKind::Auth);
    }

    TEST_F(RemoteDispatcherTests, UnreachableHostIsConnectError)
    {
        server_->connectError = makeError(ErrorKind::Connect, "No route to host");

        auto dispatcher = make(passwordOptions());

        ASSERT_FALSE(dispatcher.has_value());
        EXPECT_EQ(dispatcher.error().kind, ErrorKind::Connect);
    }

    TEST_F(RemoteDispatcherTests, UnusableKeyFailsBeforeConnecting)
    {
        const auto key = writeLocalFile("id_broken", "garbage");
        ON_CALL(*keyLoader_, load(::testing::_, ::testing::_))
            .WillByDefault(::testing::Return(std::unexpected(makeError(ErrorKind::Credential, "malformed key"))));
        auto options = passwordOptions();
        options.password.reset();
        options.sshKey = key;

        auto dispatcher = make(options);

        ASSERT_FALSE(dispatcher.has_value());
        EXPECT_EQ(dispatcher.error().kind, ErrorKind::Credential);
        EXPECT_EQ(server_->connectCount.load(), 0);
    }

    TEST_F(RemoteDispatcherTests, CanAuthenticateWithKey)
    {
        const auto key = writeLocalFile("id_ed25519", "key");
        server_->acceptedKey = key;
        auto options = passwordOptions();
        options.password.reset();
        options.sshKey = key;

        auto dispatcher = make(options);

        ASSERT_TRUE(dispatcher.has_value()) << dispatcher.error().toString();
    }

    TEST_F(RemoteDispatcherTests, CanExecuteCommand)
    {
        auto dispatcher = makeReady();

        auto result = dispatcher->execute("echo hi");

        ASSERT_TRUE(result.has_value()) << result.error().toString();
        EXPECT_EQ(result->standardOutput, "hi\n");
        EXPECT_EQ(result->exitStatus, 0);
    }

    TEST_F(RemoteDispatcherTests, CanCopyAndReadBack)
    {
        writeLocalFile("data.txt", "payload");
        auto dispatcher = makeReady();

        auto report = dispatcher->copy((localDirectory_.path() / "data.txt").string(), "/home/tester/data.txt");
        ASSERT_TRUE(report.has_value()) << report.error().toString();

        auto result = dispatcher->execute("cat /home/tester/data.txt");
        ASSERT_TRUE(result.has_value()) << result.error().toString();
        EXPECT_EQ(result->standardOutput, "payload");
    }

    TEST_F(RemoteDispatcherTests, FileManagementRequiresTransferSession)
    {
        auto dispatcher = makeReady();

        auto made = dispatcher->mkdir("/home/tester/dir");

        ASSERT_FALSE(made.has_value());
        EXPECT_EQ(made.error().kind, ErrorKind::Session);
    }

    TEST_F(RemoteDispatcherTests, ConnectReturnsSameTransferSession)
    {
        auto dispatcher = makeReady();

        auto first = dispatcher->connect();
        auto second = dispatcher->connect();

        ASSERT_TRUE(first.has_value()) << first.error().toString();
        ASSERT_TRUE(second.has_value()) << second.error().toString();
        EXPECT_EQ(first->lock(), second->lock());
        EXPECT_EQ(server_->sftpChannelsOpened.load(), 1);
    }

    TEST_F(RemoteDispatcherTests, CanManageFilesAfterConnect)
    {
        auto dispatcher = makeReady();
        ASSERT_TRUE(dispatcher->connect().has_value());

        ASSERT_TRUE(dispatcher->mkdir("/home/tester/dir").has_value());
        EXPECT_EQ(dispatcher->isDirectory("/home/tester/dir"), true);
        ASSERT_TRUE(dispatcher->rmdir("/home/tester/dir").has_value());
        EXPECT_EQ(dispatcher->exists("/home/tester/dir"), false);
    }

    TEST_F(RemoteDispatcherTests, CloseReleasesEverything)
    {
        auto dispatcher = makeReady();
        ASSERT_TRUE(dispatcher->connect().has_value());

        dispatcher->close();

        EXPECT_TRUE(dispatcher->isClosed());
        EXPECT_EQ(dispatcher->liveChannelCount(), 0);
        EXPECT_EQ(server_->disconnectCount.load(), 1);
    }

    TEST_F(RemoteDispatcherTests, CloseIsIdempotent)
    {
        auto dispatcher = makeReady();

        dispatcher->close();
        auto second = dispatcher->close();

        EXPECT_TRUE(second.empty());
        EXPECT_EQ(server_->disconnectCount.load(), 1);
    }

    TEST_F(RemoteDispatcherTests, EverythingFailsAfterClose)
    {
        writeLocalFile("data.txt", "payload");
        auto dispatcher = makeReady();
        auto transfer = dispatcher->connect();
        ASSERT_TRUE(transfer.has_value());
        dispatcher->close();

        auto executed = dispatcher->execute("true");
        auto copied = dispatcher->copy((localDirectory_.path() / "data.txt").string(), "/home/tester");
        auto connected = dispatcher->connect();
        auto made = dispatcher->mkdir("/home/tester/dir");

        ASSERT_FALSE(executed.has_value());
        EXPECT_EQ(executed.error().kind, ErrorKind::Closed);
        ASSERT_FALSE(copied.has_value());
        EXPECT_EQ(copied.error().kind, ErrorKind::Closed);
        ASSERT_FALSE(connected.has_value());
        EXPECT_EQ(connected.error().kind, ErrorKind::Closed);
        ASSERT_FALSE(made.has_value());
        EXPECT_EQ(made.error().kind, ErrorKind::Closed);
        EXPECT_TRUE(transfer->expired());
    }

    TEST_F(RemoteDispatcherTests, CloseUnblocksRunningCommand)
    {
        auto dispatcher = makeReady();
        auto future = std::async(std::launch::async, [&dispatcher] {
            return dispatcher->execute("block");
        });
        for (int i = 0; i < 200 && dispatcher->liveChannelCount() == 0; ++i)
            std::this_thread::sleep_for(5ms);
        ASSERT_EQ(dispatcher->liveChannelCount(), 1);

        auto report = dispatcher->close();

        EXPECT_EQ(report.channelsClosed, 1);
        ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
        auto result = future.get();
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, ErrorKind::Exec);
    }
}
