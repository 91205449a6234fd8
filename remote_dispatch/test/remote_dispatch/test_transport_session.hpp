#pragma once

#include "common_fixture.hpp"

#include <remote_dispatch/transport_session.hpp>

#include <gtest/gtest.h>

#include <future>
#include <thread>

using namespace std::chrono_literals;

namespace RemoteDispatch::Test
{
    class TransportSessionTests : public CommonFixture
    {};

    TEST_F(TransportSessionTests, NewSessionIsUnconnected)
    {
        auto session = makeSession();
        EXPECT_EQ(session->state(), TransportSession::State::Unconnected);
        EXPECT_EQ(session->liveChannelCount(), 0);
    }

    TEST_F(TransportSessionTests, CanEstablishSession)
    {
        auto session = makeSession();
        auto result = session->establish(host_, PasswordCredential{.user = "tester", .password = "secret"});

        ASSERT_TRUE(result.has_value()) << result.error().toString();
        EXPECT_EQ(session->state(), TransportSession::State::Established);
        EXPECT_EQ(server_->connectCount.load(), 1);
        EXPECT_EQ(server_->authenticateCount.load(), 1);
    }

    TEST_F(TransportSessionTests, ConnectFailureEndsInFailedState)
    {
        server_->connectError = makeError(ErrorKind::Connect, "Connection refused");
        auto session = makeSession();

        auto result = session->establish(host_, PasswordCredential{.user = "tester", .password = "secret"});

        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, ErrorKind::Connect);
        EXPECT_EQ(session->state(), TransportSession::State::Failed);
        ASSERT_TRUE(session->failure().has_value());
        EXPECT_EQ(session->failure()->kind, ErrorKind::Connect);
        EXPECT_EQ(server_->authenticateCount.load(), 0);
    }

    TEST_F(TransportSessionTests, RejectedCredentialIsAuthError)
    {
        server_->acceptedPassword = "correct";
        auto session = makeSession();

        auto result = session->establish(host_, PasswordCredential{.user = "tester", .password = "wrong"});

        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, ErrorKind::Auth);
        EXPECT_EQ(session->state(), TransportSession::State::Failed);
    }

    TEST_F(TransportSessionTests, FailedSessionIsNeverRetried)
    {
        server_->connectError = makeError(ErrorKind::Connect, "Connection refused");
        auto session = makeSession();
        ASSERT_FALSE(session->establish(host_, PasswordCredential{.user = "tester", .password = "secret"}));

        server_->connectError.reset();
        auto second = session->establish(host_, PasswordCredential{.user = "tester", .password = "secret"});

        ASSERT_FALSE(second.has_value());
        EXPECT_EQ(second.error().kind, ErrorKind::State);
        EXPECT_EQ(server_->connectCount.load(), 1);
    }

    TEST_F(TransportSessionTests, CannotEstablishTwice)
    {
        auto session = makeEstablishedSession();

        auto second = session->establish(host_, PasswordCredential{.user = "tester", .password = "secret"});

        ASSERT_FALSE(second.has_value());
        EXPECT_EQ(second.error().kind, ErrorKind::State);
        EXPECT_EQ(session->state(), TransportSession::State::Established);
    }

    TEST_F(TransportSessionTests, CannotOpenChannelWhenUnconnected)
    {
        auto session = makeSession();

        auto exec = session->openExecChannel();
        auto sftp = session->openSftpChannel();

        ASSERT_FALSE(exec.has_value());
        EXPECT_EQ(exec.error().kind, ErrorKind::State);
        ASSERT_FALSE(sftp.has_value());
        EXPECT_EQ(sftp.error().kind, ErrorKind::State);
        EXPECT_EQ(server_->execChannelsOpened.load(), 0);
        EXPECT_EQ(server_->sftpChannelsOpened.load(), 0);
    }

    TEST_F(TransportSessionTests, CannotOpenChannelWhenFailed)
    {
        server_->acceptedPassword = "correct";
        auto session = makeSession();
        ASSERT_FALSE(session->establish(host_, PasswordCredential{.user = "tester", .password = "wrong"}));

        auto exec = session->openExecChannel();

        ASSERT_FALSE(exec.has_value());
        EXPECT_EQ(exec.error().kind, ErrorKind::State);
        EXPECT_EQ(server_->execChannelsOpened.load(), 0);
    }

    TEST_F(TransportSessionTests, CannotOpenChannelWhenClosed)
    {
        auto session = makeEstablishedSession();
        session->teardown(closeTimeout);

        auto sftp = session->openSftpChannel();

        ASSERT_FALSE(sftp.has_value());
        EXPECT_EQ(sftp.error().kind, ErrorKind::State);
        EXPECT_EQ(server_->sftpChannelsOpened.load(), 0);
    }

    TEST_F(TransportSessionTests, CannotOpenChannelWhileAuthenticating)
    {
        std::promise<void> gate{};
        server_->authenticationGate = gate.get_future().share();
        auto entered = server_->authenticationEntered.get_future();
        auto session = makeSession();

        std::thread establisher{[&] {
            std::ignore = session->establish(host_, PasswordCredential{.user = "tester", .password = "secret"});
        }};
        ASSERT_EQ(entered.wait_for(2s), std::future_status::ready);

        EXPECT_EQ(session->state(), TransportSession::State::Authenticating);
        auto exec = session->openExecChannel();
        ASSERT_FALSE(exec.has_value());
        EXPECT_EQ(exec.error().kind, ErrorKind::State);
        EXPECT_EQ(server_->execChannelsOpened.load(), 0);

        gate.set_value();
        establisher.join();
        EXPECT_EQ(session->state(), TransportSession::State::Established);
    }

    TEST_F(TransportSessionTests, TeardownDuringAuthenticationWins)
    {
        std::promise<void> gate{};
        server_->authenticationGate = gate.get_future().share();
        auto entered = server_->authenticationEntered.get_future();
        auto session = makeSession();

        std::promise<std::expected<void, Error>> establishResult{};
        std::thread establisher{[&] {
            establishResult.set_value(
                session->establish(host_, PasswordCredential{.user = "tester", .password = "secret"}));
        }};
        ASSERT_EQ(entered.wait_for(2s), std::future_status::ready);

        session->teardown(closeTimeout);
        gate.set_value();
        establisher.join();

        auto result = establishResult.get_future().get();
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, ErrorKind::State);
        EXPECT_EQ(session->state(), TransportSession::State::Closed);
    }

    TEST_F(TransportSessionTests, ChannelsAreTrackedUntilReleased)
    {
        auto session = makeEstablishedSession();

        auto exec = session->openExecChannel();
        auto sftp = session->openSftpChannel();
        ASSERT_TRUE(exec.has_value());
        ASSERT_TRUE(sftp.has_value());
        EXPECT_EQ(session->liveChannelCount(), 2);
        EXPECT_NE(exec->id(), sftp->id());

        exec->release();
        EXPECT_EQ(session->liveChannelCount(), 1);
        EXPECT_FALSE(static_cast<bool>(*exec));
    }

    TEST_F(TransportSessionTests, ChannelHandleDeregistersOnDestruction)
    {
        auto session = makeEstablishedSession();
        {
            auto sftp = session->openSftpChannel();
            ASSERT_TRUE(sftp.has_value());
            EXPECT_EQ(session->liveChannelCount(), 1);
        }
        EXPECT_EQ(session->liveChannelCount(), 0);
    }

    TEST_F(TransportSessionTests, MovedChannelHandleKeepsChannel)
    {
        auto session = makeEstablishedSession();
        auto sftp = session->openSftpChannel();
        ASSERT_TRUE(sftp.has_value());

        ChannelHandle<ISftpChannel> moved = std::move(sftp).value();

        EXPECT_TRUE(static_cast<bool>(moved));
        EXPECT_TRUE(moved->isOpen());
        EXPECT_EQ(session->liveChannelCount(), 1);
    }

    TEST_F(TransportSessionTests, CloseChannelClosesItOutOfBand)
    {
        auto session = makeEstablishedSession();
        auto exec = session->openExecChannel();
        ASSERT_TRUE(exec.has_value());

        EXPECT_TRUE(session->closeChannel(exec->id()));
        EXPECT_FALSE((*exec)->isOpen());
        EXPECT_FALSE(session->closeChannel(exec->id()));
        EXPECT_EQ(session->liveChannelCount(), 0);
    }

    TEST_F(TransportSessionTests, TeardownClosesAllChannels)
    {
        auto session = makeEstablishedSession();
        auto exec = session->openExecChannel();
        auto sftp = session->openSftpChannel();
        ASSERT_TRUE(exec.has_value());
        ASSERT_TRUE(sftp.has_value());

        auto report = session->teardown(closeTimeout);

        EXPECT_EQ(report.channelsClosed, 2);
        EXPECT_TRUE(report.warnings.empty());
        EXPECT_FALSE((*exec)->isOpen());
        EXPECT_FALSE((*sftp)->isOpen());
        EXPECT_EQ(session->state(), TransportSession::State::Closed);
        EXPECT_EQ(session->liveChannelCount(), 0);
        EXPECT_EQ(server_->disconnectCount.load(), 1);
    }

    TEST_F(TransportSessionTests, TeardownIsIdempotent)
    {
        auto session = makeEstablishedSession();
        auto exec = session->openExecChannel();
        ASSERT_TRUE(exec.has_value());

        auto first = session->teardown(closeTimeout);
        auto second = session->teardown(closeTimeout);

        EXPECT_EQ(first.channelsClosed, 1);
        EXPECT_TRUE(second.empty());
        EXPECT_EQ(server_->disconnectCount.load(), 1);
    }

    TEST_F(TransportSessionTests, TeardownOfFailedSessionKeepsFailure)
    {
        server_->acceptedPassword = "correct";
        auto session = makeSession();
        ASSERT_FALSE(session->establish(host_, PasswordCredential{.user = "tester", .password = "wrong"}));

        session->teardown(closeTimeout);

        EXPECT_EQ(session->state(), TransportSession::State::Closed);
        ASSERT_TRUE(session->failure().has_value());
        EXPECT_EQ(session->failure()->kind, ErrorKind::Auth);
    }

    TEST_F(TransportSessionTests, FailingChannelCloseIsReportedAsWarning)
    {
        auto session = makeEstablishedSession();
        auto exec = session->openExecChannel();
        ASSERT_TRUE(exec.has_value());
        server_->failChannelClose = true;

        auto report = session->teardown(closeTimeout);

        EXPECT_EQ(report.channelsClosed, 1);
        EXPECT_EQ(report.warnings.size(), 1);
        EXPECT_EQ(session->state(), TransportSession::State::Closed);
        EXPECT_EQ(server_->disconnectCount.load(), 1);
    }

    TEST_F(TransportSessionTests, HangingChannelCloseDoesNotBlockTeardown)
    {
        auto session = makeEstablishedSession();
        auto sftp = session->openSftpChannel();
        ASSERT_TRUE(sftp.has_value());
        server_->hangChannelClose = true;

        const auto start = std::chrono::steady_clock::now();
        auto report = session->teardown(50ms);
        const auto elapsed = std::chrono::steady_clock::now() - start;

        EXPECT_EQ(report.warnings.size(), 1);
        EXPECT_LT(elapsed, 2s);
        EXPECT_EQ(session->state(), TransportSession::State::Closed);
    }

    TEST_F(TransportSessionTests, OpenChannelFailureDoesNotChangeState)
    {
        auto session = makeEstablishedSession();
        server_->openChannelError = makeError(ErrorKind::Exec, "administratively prohibited");

        auto exec = session->openExecChannel();

        ASSERT_FALSE(exec.has_value());
        EXPECT_EQ(session->state(), TransportSession::State::Established);
        EXPECT_EQ(session->liveChannelCount(), 0);
    }
}
