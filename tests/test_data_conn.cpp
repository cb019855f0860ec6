// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#include <gtest/gtest.h>
#include <rvfs/extra_log.h>
#include <vfs/ftp/data_conn.h>
#include <vfs/ftp/ftp_file.h>
#include <vfs/ftp/ftp_file_system.h>
#include "fake_ftp_client.h"

using namespace vfs;
using namespace vfs::test;
using ::testing::Return;


namespace
{
std::string readAll(DataConnection& dc)
{
    std::string content;
    char buffer[5];
    for (size_t bytesRead = 0; (bytesRead = dc.read(buffer, sizeof(buffer))) != 0;)
        content.append(buffer, bytesRead);
    return content;
}


class DataConnTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        client->addFile("/dir/file.txt", "hello world!");
        client->addFolder("/dir/");
        fs.withClient(client);
    }

    DataConnectionFactory::GetClientFun countingGetter()
    {
        return [this] { ++clientRequests; return std::static_pointer_cast<FtpClient>(client); };
    }

    std::shared_ptr<FakeFtpClient> client = std::make_shared<FakeFtpClient>();
    FtpFileSystem fs;
    const Authority authority = parseAuthority("user@host");
    int clientRequests = 0;
};
}


TEST_F(DataConnTest, ReadSessionDeliversContentAndClosesOnce)
{
    ReadSession session(client->retrFrom("/dir/file.txt", 6));
    EXPECT_EQ(session.mode(), DataConnMode::read);
    EXPECT_EQ(readAll(session), "world!");

    session.close();
    session.close(); //second close: no error
    EXPECT_EQ(client->sourceCloseCount, 1);
}


TEST_F(DataConnTest, ReadSessionRejectsOtherModes)
{
    ReadSession session(client->retrFrom("/dir/file.txt", 0));
    char c = 'x';
    EXPECT_THROW(session.write(&c, 1), ErrorModeMismatch);
    EXPECT_THROW(session.deleteFile("/dir/file.txt"), ErrorModeMismatch);
    EXPECT_THROW(session.getEntry("/dir/file.txt"), ErrorModeMismatch);
    EXPECT_THROW(session.list("/dir/"), ErrorModeMismatch);
    EXPECT_THROW(session.makeDir("/new/"), ErrorModeMismatch);
    EXPECT_THROW(session.rename("/dir/file.txt", "/dir/b.txt"), ErrorModeMismatch);
    EXPECT_THROW(session.setTime("/dir/file.txt", 0), ErrorModeMismatch);
    EXPECT_THROW(session.isSetTimeSupported(), ErrorModeMismatch);
    EXPECT_THROW(session.isTimePreciseInList(), ErrorModeMismatch);
    session.close();

    EXPECT_TRUE(client->getContent("/dir/file.txt")); //nothing was touched
}


TEST_F(DataConnTest, ModeMismatchMessages)
{
    SingleOpSession single(client);
    char c = 'x';
    try
    {
        single.read(&c, 1);
        FAIL();
    }
    catch (const ErrorModeMismatch& e) { EXPECT_EQ(e.toString(), L"dataconn must be open for read mode to conduct a read"); }

    try
    {
        single.write(&c, 1);
        FAIL();
    }
    catch (const ErrorModeMismatch& e) { EXPECT_EQ(e.toString(), L"dataconn must be open for write mode to conduct a write"); }

    WriteSession writer(client, "/dir/out.txt", 0);
    try
    {
        writer.list("/dir/");
        FAIL();
    }
    catch (const ErrorModeMismatch& e) { EXPECT_EQ(e.toString(), L"dataconn must be open for single op mode to conduct a single op action"); }
    writer.close();
}


TEST_F(DataConnTest, SingleOpSessionForwardsToClient)
{
    SingleOpSession session(client);
    EXPECT_EQ(session.mode(), DataConnMode::singleOp);

    EXPECT_TRUE(session.isTimePreciseInList());
    EXPECT_EQ(session.getEntry("/dir/file.txt").size, 12u);
    session.rename("/dir/file.txt", "/dir/renamed.txt");
    session.deleteFile("/dir/renamed.txt");
    session.close(); //no-op

    EXPECT_FALSE(client->getContent("/dir/renamed.txt"));
    EXPECT_EQ(client->countCalls("RNFR"), 1u);
    EXPECT_EQ(client->countCalls("DELE"), 1u);
}


TEST_F(DataConnTest, WriteSessionUploadsOnClose)
{
    WriteSession session(client, "/dir/out.txt", 0);
    EXPECT_EQ(session.write("hello ", 6), 6u);
    EXPECT_EQ(session.write("world!", 6), 6u);
    session.close();

    EXPECT_EQ(client->getContent("/dir/out.txt"), "hello world!");
    EXPECT_EQ(session.getTotalBytesWritten(), 12u);

    session.close(); //neither errors nor blocks
    EXPECT_THROW(session.write("x", 1), rvfs::SysError);
}


TEST_F(DataConnTest, WriteSessionResumesAtOffset)
{
    WriteSession session(client, "/dir/file.txt", 6);
    session.write("there", 5);
    session.close();

    EXPECT_EQ(client->getContent("/dir/file.txt"), "hello there");
    EXPECT_EQ(client->countCalls("STOR /dir/file.txt@6"), 1u);
}


TEST_F(DataConnTest, UploadFailureSurfacesAtCloseExactlyOnce)
{
    client->failStorAfterUpload = L"451 Disk quota exceeded.";

    WriteSession session(client, "/dir/out.txt", 0);
    EXPECT_EQ(session.write("buffered", 8), 8u); //succeeds locally

    try
    {
        session.close();
        FAIL();
    }
    catch (const SysErrorFtpProtocol& e)
    {
        EXPECT_EQ(e.ftpErrorCode, 451);
        EXPECT_EQ(e.toString(), L"451 Disk quota exceeded.");
    }

    EXPECT_NO_THROW(session.close());
    EXPECT_FALSE(client->getContent("/dir/out.txt"));
}


TEST_F(DataConnTest, WriteFailsOnceUploaderHasTornDownThePipe)
{
    client->failStorBeforeUpload = L"553 Permission denied.";

    WriteSession session(client, "/dir/out.txt", 0);

    //the uploader doesn't drain the pipe: once it's full, write() waits for the worker's error
    const std::string block(64 * 1024, 'x');
    EXPECT_THROW(for (int i = 0; i < 64; ++i) session.write(block.data(), block.size()), SysErrorFtpProtocol);

    EXPECT_THROW(session.close(), SysErrorFtpProtocol);
}


TEST_F(DataConnTest, AbandonedWriteSessionDoesNotBlock)
{
    rvfs::fetchExtraLog();
    {
        WriteSession session(client, "/dir/out.txt", 0);
        session.write("partial", 7);
    }
    const rvfs::ErrorLog log = rvfs::fetchExtraLog();
    ASSERT_EQ(log.size(), 1u);
    EXPECT_NE(log[0].message.find("/dir/out.txt"), std::string::npos);
    EXPECT_FALSE(client->getContent("/dir/out.txt"));
}

//------------------------------------------------------------------------------------

TEST_F(DataConnTest, FactoryReusesMatchingSession)
{
    FtpFile file(fs, authority, "/dir/file.txt");
    FtpDataConnFactory factory;
    DataConnSlot slot;

    DataConnection& first  = factory.getDataConn(slot, DataConnMode::read, &file, countingGetter());
    DataConnection& second = factory.getDataConn(slot, DataConnMode::read, &file, countingGetter());

    EXPECT_EQ(&first, &second);
    EXPECT_EQ(clientRequests, 1);
    EXPECT_EQ(client->countCalls("RETR"), 1u);
    EXPECT_EQ(slot.owner, &file);
    slot.conn->close();
}


TEST_F(DataConnTest, FactoryClosesPreviousSessionExactlyOnceOnModeSwitch)
{
    FtpFile file(fs, authority, "/dir/file.txt");
    FtpDataConnFactory factory;
    DataConnSlot slot;

    auto mock = std::make_unique<MockDataConnection>();
    EXPECT_CALL(*mock, mode()).WillRepeatedly(Return(DataConnMode::read));
    EXPECT_CALL(*mock, close()).Times(1);
    slot.conn = std::move(mock);

    DataConnection& dc = factory.getDataConn(slot, DataConnMode::singleOp, &file, countingGetter());
    EXPECT_EQ(dc.mode(), DataConnMode::singleOp);
    EXPECT_EQ(slot.owner, nullptr);
}


TEST_F(DataConnTest, FactoryPropagatesCloseErrorOnModeSwitch)
{
    FtpFile file(fs, authority, "/dir/out.txt");
    FtpDataConnFactory factory;
    DataConnSlot slot;

    client->failStorAfterUpload = L"451 Upload failed.";
    factory.getDataConn(slot, DataConnMode::write, &file, countingGetter()).write("abc", 3);

    EXPECT_THROW(factory.getDataConn(slot, DataConnMode::read, &file, countingGetter()), SysErrorFtpProtocol);
    EXPECT_FALSE(slot.conn);
}


TEST_F(DataConnTest, FactoryRecreatesOnReset)
{
    FtpFile file(fs, authority, "/dir/file.txt");
    FtpDataConnFactory factory;
    DataConnSlot slot;

    factory.getDataConn(slot, DataConnMode::read, &file, countingGetter());
    slot.resetConn = true;
    factory.getDataConn(slot, DataConnMode::read, &file, countingGetter());

    EXPECT_FALSE(slot.resetConn);
    EXPECT_EQ(client->countCalls("RETR"), 2u);
    EXPECT_EQ(client->sourceCloseCount, 1);
    slot.conn->close();
}


TEST_F(DataConnTest, FactoryKeepsResetFlagForSingleOpWithoutFile)
{
    FtpDataConnFactory factory;
    DataConnSlot slot;
    slot.resetConn = true;

    factory.getDataConn(slot, DataConnMode::singleOp, nullptr, countingGetter());
    EXPECT_TRUE(slot.resetConn);
}


TEST_F(DataConnTest, FactoryReplacesSessionOfAnotherFile)
{
    client->addFile("/dir/other.txt", "other");
    FtpFile file(fs, authority, "/dir/file.txt");
    FtpFile other(fs, authority, "/dir/other.txt");
    FtpDataConnFactory factory;
    DataConnSlot slot;

    factory.getDataConn(slot, DataConnMode::read, &file, countingGetter());
    DataConnection& dc = factory.getDataConn(slot, DataConnMode::read, &other, countingGetter());

    EXPECT_EQ(readAll(dc), "other");
    EXPECT_EQ(slot.owner, &other);
    EXPECT_EQ(client->sourceCloseCount, 1);
    slot.conn->close();
}


TEST_F(DataConnTest, FactoryKeepsCloseErrorForTheSessionOwner)
{
    FtpFile writer(fs, authority, "/dir/out.txt");
    FtpFile reader(fs, authority, "/dir/file.txt");
    FtpDataConnFactory factory;
    DataConnSlot slot;

    client->failStorAfterUpload = L"451 Upload failed.";
    factory.getDataConn(slot, DataConnMode::write, &writer, countingGetter()).write("abc", 3);

    DataConnection& dc = factory.getDataConn(slot, DataConnMode::read, &reader, countingGetter()); //not the reader's error
    EXPECT_EQ(readAll(dc), "hello world!");
    EXPECT_EQ(slot.owner, &reader);

    ASSERT_EQ(slot.ownerErrors.size(), 1u);
    EXPECT_THROW(std::rethrow_exception(slot.ownerErrors.at(&writer)), SysErrorFtpProtocol);
    slot.conn->close();
}


TEST_F(DataConnTest, FactoryReadErrorsAreSynchronous)
{
    FtpFile file(fs, authority, "/dir/missing.txt");
    FtpDataConnFactory factory;
    DataConnSlot slot;

    try
    {
        factory.getDataConn(slot, DataConnMode::read, &file, countingGetter());
        FAIL();
    }
    catch (const rvfs::SysError& e) { EXPECT_TRUE(isFileUnavailable(e)); }
    EXPECT_FALSE(slot.conn);
}


TEST_F(DataConnTest, FactoryRequiresFileForStreams)
{
    FtpDataConnFactory factory;
    DataConnSlot slot;
    EXPECT_THROW(factory.getDataConn(slot, DataConnMode::read,  nullptr, countingGetter()), std::logic_error);
    EXPECT_THROW(factory.getDataConn(slot, DataConnMode::write, nullptr, countingGetter()), std::logic_error);
    EXPECT_EQ(clientRequests, 0);
}


TEST_F(DataConnTest, WriteSessionCreatesMissingFolder)
{
    FtpFile file(fs, authority, "/new/out.txt");
    FtpDataConnFactory factory;
    DataConnSlot slot;

    factory.getDataConn(slot, DataConnMode::write, &file, countingGetter()).write("data", 4);
    slot.conn->close();

    EXPECT_TRUE(client->hasFolder("/new/"));
    EXPECT_EQ(client->countCalls("MKD /new/"), 1u);
    EXPECT_EQ(client->getContent("/new/out.txt"), "data");
}


TEST_F(DataConnTest, WriteSessionToleratesConcurrentlyCreatedFolder)
{
    client->failMkdCode = FTP_STATUS_FILE_UNAVAILABLE;

    FtpFile file(fs, authority, "/new/out.txt");
    FtpDataConnFactory factory;
    DataConnSlot slot;

    EXPECT_NO_THROW(factory.getDataConn(slot, DataConnMode::write, &file, countingGetter()));
    slot.conn->close();
}


TEST_F(DataConnTest, WriteSessionFailsOnFolderCreationError)
{
    client->failMkdCode = 530;

    FtpFile file(fs, authority, "/new/out.txt");
    FtpDataConnFactory factory;
    DataConnSlot slot;

    EXPECT_THROW(factory.getDataConn(slot, DataConnMode::write, &file, countingGetter()), SysErrorFtpProtocol);
    EXPECT_FALSE(slot.conn);
    EXPECT_EQ(client->countCalls("STOR"), 0u);
}


TEST_F(DataConnTest, WriteSessionSkipsMkdForExistingFolder)
{
    FtpFile file(fs, authority, "/dir/out.txt");
    FtpDataConnFactory factory;
    DataConnSlot slot;

    factory.getDataConn(slot, DataConnMode::write, &file, countingGetter());
    slot.conn->close();
    EXPECT_EQ(client->countCalls("MKD"), 0u);
}
