#pragma once

#include "common_fixture.hpp"

#include <remote_dispatch/operations/transfer_session.hpp>

#include <gtest/gtest.h>

using namespace std::string_literals;

namespace RemoteDispatch::Test
{
    class TransferSessionTests : public CommonFixture
    {
      protected:
        void SetUp() override
        {
            session_ = makeEstablishedSession();
            transfer_ = std::make_unique<TransferSession>(session_);
        }

        void connect()
        {
            auto result = transfer_->connect();
            ASSERT_TRUE(result.has_value()) << result.error().toString();
        }

      protected:
        std::shared_ptr<TransportSession> session_{};
        std::unique_ptr<TransferSession> transfer_{};
    };

    TEST_F(TransferSessionTests, PrimitivesFailBeforeConnect)
    {
        auto made = transfer_->mkdir("/home/tester/dir");

        ASSERT_FALSE(made.has_value());
        EXPECT_EQ(made.error().kind, ErrorKind::Session);
        EXPECT_FALSE(server_->exists("/home/tester/dir"));
    }

    TEST_F(TransferSessionTests, CanConnect)
    {
        connect();
        EXPECT_TRUE(transfer_->isOpen());
        EXPECT_EQ(session_->liveChannelCount(), 1);
    }

    TEST_F(TransferSessionTests, ConnectTwiceKeepsChannel)
    {
        connect();
        connect();
        EXPECT_EQ(server_->sftpChannelsOpened.load(), 1);
        EXPECT_EQ(session_->liveChannelCount(), 1);
    }

    TEST_F(TransferSessionTests, CanCreateDirectory)
    {
        connect();

        auto made = transfer_->mkdir("/home/tester/newdir");

        ASSERT_TRUE(made.has_value()) << made.error().toString();
        ASSERT_TRUE(server_->isDirectory("/home/tester/newdir"));
        EXPECT_EQ(server_->node("/home/tester/newdir")->permissions, defaultDirectoryMode);
    }

    TEST_F(TransferSessionTests, CreateDirectoryWithPermissions)
    {
        connect();

        ASSERT_TRUE(transfer_->mkdir("private", std::filesystem::perms::owner_all).has_value());

        EXPECT_EQ(server_->node("/home/tester/private")->permissions, std::filesystem::perms::owner_all);
    }

    TEST_F(TransferSessionTests, CreatingExistingDirectoryFails)
    {
        connect();
        ASSERT_TRUE(transfer_->mkdir("/home/tester/newdir").has_value());

        auto second = transfer_->mkdir("/home/tester/newdir");

        ASSERT_FALSE(second.has_value());
        EXPECT_EQ(second.error().kind, ErrorKind::RemoteFileSystem);
        EXPECT_EQ(second.error().remoteCode, RemoteErrorCode::AlreadyExists);
    }

    TEST_F(TransferSessionTests, CreatingDirectoryWithMissingParentFails)
    {
        connect();

        auto made = transfer_->mkdir("/home/tester/missing/newdir");

        ASSERT_FALSE(made.has_value());
        EXPECT_EQ(made.error().kind, ErrorKind::RemoteFileSystem);
        EXPECT_EQ(made.error().remoteCode, RemoteErrorCode::NoSuchFile);
    }

    TEST_F(TransferSessionTests, DeniedDirectoryCreationIsPermissionDenied)
    {
        server_->deniedPaths.insert("/home/tester/forbidden");
        connect();

        auto made = transfer_->mkdir("/home/tester/forbidden");

        ASSERT_FALSE(made.has_value());
        EXPECT_EQ(made.error().remoteCode, RemoteErrorCode::PermissionDenied);
    }

    TEST_F(TransferSessionTests, CanRemoveFile)
    {
        server_->addFile("/home/tester/file.txt", "content");
        connect();

        auto removed = transfer_->remove("/home/tester/file.txt");

        ASSERT_TRUE(removed.has_value()) << removed.error().toString();
        EXPECT_FALSE(server_->exists("/home/tester/file.txt"));
    }

    TEST_F(TransferSessionTests, RemovingMissingFileFails)
    {
        connect();

        auto removed = transfer_->remove("/home/tester/file.txt");

        ASSERT_FALSE(removed.has_value());
        EXPECT_EQ(removed.error().kind, ErrorKind::RemoteFileSystem);
        EXPECT_EQ(removed.error().remoteCode, RemoteErrorCode::NoSuchFile);
    }

    TEST_F(TransferSessionTests, RemoveRefusesDirectories)
    {
        server_->addDirectory("/home/tester/dir");
        connect();

        auto removed = transfer_->remove("/home/tester/dir");

        ASSERT_FALSE(removed.has_value());
        EXPECT_EQ(removed.error().remoteCode, RemoteErrorCode::IsADirectory);
        EXPECT_TRUE(server_->isDirectory("/home/tester/dir"));
    }

    TEST_F(TransferSessionTests, CanRemoveEmptyDirectory)
    {
        server_->addDirectory("/home/tester/dir");
        connect();

        auto removed = transfer_->rmdir("/home/tester/dir");

        ASSERT_TRUE(removed.has_value()) << removed.error().toString();
        EXPECT_FALSE(server_->exists("/home/tester/dir"));
    }

    TEST_F(TransferSessionTests, RemovingNonEmptyDirectoryFails)
    {
        server_->addDirectory("/home/tester/dir");
        server_->addFile("/home/tester/dir/file.txt", "content");
        connect();

        auto removed = transfer_->rmdir("/home/tester/dir");

        ASSERT_FALSE(removed.has_value());
        EXPECT_EQ(removed.error().remoteCode, RemoteErrorCode::NotEmpty);
        EXPECT_TRUE(server_->exists("/home/tester/dir/file.txt"));
    }

    TEST_F(TransferSessionTests, RmdirRefusesFiles)
    {
        server_->addFile("/home/tester/file.txt", "content");
        connect();

        auto removed = transfer_->rmdir("/home/tester/file.txt");

        ASSERT_FALSE(removed.has_value());
        EXPECT_EQ(removed.error().remoteCode, RemoteErrorCode::NotADirectory);
    }

    TEST_F(TransferSessionTests, StatReportsTypeAndSize)
    {
        server_->addFile("/home/tester/file.txt", "12345");
        connect();

        auto info = transfer_->stat("file.txt");

        ASSERT_TRUE(info.has_value()) << info.error().toString();
        EXPECT_TRUE(info->isRegularFile());
        EXPECT_EQ(info->size, 5);
    }

    TEST_F(TransferSessionTests, ExistsAndIsDirectory)
    {
        server_->addDirectory("/home/tester/dir");
        server_->addFile("/home/tester/file.txt", "content");
        connect();

        EXPECT_EQ(transfer_->exists("/home/tester/dir"), true);
        EXPECT_EQ(transfer_->exists("/home/tester/file.txt"), true);
        EXPECT_EQ(transfer_->exists("/home/tester/nothing"), false);
        EXPECT_EQ(transfer_->isDirectory("/home/tester/dir"), true);
        EXPECT_EQ(transfer_->isDirectory("/home/tester/file.txt"), false);
        EXPECT_EQ(transfer_->isDirectory("/home/tester/nothing"), false);
    }

    TEST_F(TransferSessionTests, ListingIsSortedByName)
    {
        server_->addFile("/home/tester/c.txt", "");
        server_->addFile("/home/tester/a.txt", "");
        server_->addDirectory("/home/tester/b");
        connect();

        auto entries = transfer_->listDirectory("/home/tester");

        ASSERT_TRUE(entries.has_value()) << entries.error().toString();
        ASSERT_EQ(entries->size(), 3);
        EXPECT_EQ((*entries)[0].path, "a.txt");
        EXPECT_EQ((*entries)[1].path, "b");
        EXPECT_TRUE((*entries)[1].isDirectory());
        EXPECT_EQ((*entries)[2].path, "c.txt");
    }

    TEST_F(TransferSessionTests, PrimitivesFailAfterClose)
    {
        connect();
        transfer_->close();

        auto made = transfer_->mkdir("/home/tester/newdir");
        auto connected = transfer_->connect();

        ASSERT_FALSE(made.has_value());
        EXPECT_EQ(made.error().kind, ErrorKind::Session);
        ASSERT_FALSE(connected.has_value());
        EXPECT_EQ(connected.error().kind, ErrorKind::Session);
        EXPECT_TRUE(transfer_->isClosed());
        EXPECT_EQ(session_->liveChannelCount(), 0);
    }

    TEST_F(TransferSessionTests, CloseIsIdempotent)
    {
        connect();
        transfer_->close();
        transfer_->close();
        EXPECT_TRUE(transfer_->isClosed());
        EXPECT_EQ(transfer_->state(), ChannelOperation::State::Completed);
    }

    TEST_F(TransferSessionTests, ConnectReplacesChannelClosedElsewhere)
    {
        connect();
        transfer_->cancel();
        EXPECT_FALSE(transfer_->isOpen());

        auto failed = transfer_->stat("/home/tester");
        ASSERT_FALSE(failed.has_value());
        EXPECT_EQ(failed.error().kind, ErrorKind::Session);

        connect();
        EXPECT_TRUE(transfer_->isOpen());
        EXPECT_EQ(server_->sftpChannelsOpened.load(), 2);
        EXPECT_TRUE(transfer_->stat("/home/tester").has_value());
    }

    TEST_F(TransferSessionTests, SessionTeardownClosesTransferChannel)
    {
        connect();
        session_->teardown(closeTimeout);

        auto info = transfer_->stat("/home/tester");

        ASSERT_FALSE(info.has_value());
        EXPECT_EQ(info.error().kind, ErrorKind::Session);

        auto reconnected = transfer_->connect();
        ASSERT_FALSE(reconnected.has_value());
        EXPECT_EQ(reconnected.error().kind, ErrorKind::Session);
    }
}
