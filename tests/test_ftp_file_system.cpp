// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#include <gtest/gtest.h>
#include <rvfs/extra_log.h>
#include <vfs/ftp/ftp_file.h>
#include <vfs/ftp/ftp_file_system.h>
#include "fake_ftp_client.h"

using namespace rvfs;
using namespace vfs;
using namespace vfs::test;


namespace
{
//ClientGetter that hands out fresh fakes and remembers what it was asked for
struct RecordingDialer
{
    std::vector<std::shared_ptr<FakeFtpClient>> clients;
    std::vector<Authority> authorities;
    std::vector<FtpOptions> options;
    std::optional<std::wstring> failure;

    ClientGetter getter()
    {
        return [this](const ExecContext& ctx, const Authority& authority, const FtpOptions& opt) -> std::shared_ptr<FtpClient>
        {
            if (failure)
                throw SysError(*failure);

            auto client = std::make_shared<FakeFtpClient>();
            client->addFile("/file.txt", "content");
            client->login(resolveUsername(opt, authority), resolvePassword(opt));
            clients.push_back(client);
            authorities.push_back(authority);
            options.push_back(opt);
            return client;
        };
    }
};


class MockFactory : public DataConnectionFactory
{
public:
    MOCK_METHOD(DataConnection&, getDataConn, (DataConnSlot& slot, DataConnMode mode, const FtpFile* file, const GetClientFun& getClient), (override));
};
}


TEST(FtpFileSystem, Identity)
{
    FtpFileSystem fs;
    EXPECT_EQ(fs.scheme(), "ftp");
    EXPECT_EQ(fs.name(), "File Transfer Protocol");
}


TEST(FtpFileSystem, NewFileAndLocationValidatePaths)
{
    FtpFileSystem fs;
    EXPECT_EQ(fs.newFile("user@host", "/a/b.txt")->uri(), "ftp://user@host/a/b.txt");
    EXPECT_EQ(fs.newLocation("user@host", "/a/")->uri(), "ftp://user@host/a/");

    EXPECT_THROW(fs.newFile("user@host", "a/b.txt"), FileError);
    EXPECT_THROW(fs.newFile("user@host", "/a/"), FileError);
    EXPECT_THROW(fs.newLocation("user@host", "/a"), FileError);
    EXPECT_THROW(fs.newLocation("user@host", "a/"), FileError);
    EXPECT_THROW(fs.newFile("user@", "/a/b.txt"), FileError); //no host
}


TEST(FtpFileSystem, ClientIsDialedOnceAndCached)
{
    RecordingDialer dialer;
    FtpOptions options;
    options.password = "secret";
    FtpFileSystem fs(options, dialer.getter());

    const Authority authority = parseAuthority("bob@host:2121");
    std::shared_ptr<FtpClient> first  = fs.client(ExecContext(), authority);
    std::shared_ptr<FtpClient> second = fs.client(ExecContext(), authority);

    EXPECT_EQ(first, second);
    ASSERT_EQ(dialer.clients.size(), 1u);
    EXPECT_EQ(dialer.authorities[0].port, 2121);
    EXPECT_EQ(dialer.options[0].password, "secret");
    EXPECT_EQ(dialer.clients[0]->countCalls("USER bob"), 1u);
}


TEST(FtpFileSystem, WithOptionsForcesRedial)
{
    RecordingDialer dialer;
    FtpFileSystem fs(FtpOptions(), dialer.getter());
    const Authority authority = parseAuthority("bob@host");

    fs.client(ExecContext(), authority);
    FtpOptions options;
    options.username = "alice";
    fs.withOptions(options);
    EXPECT_EQ(fs.getOptions().username, "alice");

    fs.client(ExecContext(), authority);
    ASSERT_EQ(dialer.clients.size(), 2u);
    EXPECT_EQ(dialer.clients[1]->countCalls("USER alice"), 1u);
}


TEST(FtpFileSystem, OtherServerIsDialedSeparately)
{
    RecordingDialer dialer;
    FtpFileSystem fs(FtpOptions(), dialer.getter());

    fs.client(ExecContext(), parseAuthority("bob@host1"));
    fs.client(ExecContext(), parseAuthority("bob@host2"));
    ASSERT_EQ(dialer.clients.size(), 2u);
    EXPECT_EQ(dialer.authorities[1].host, "host2");
}


TEST(FtpFileSystem, InjectedClientIsUsedAsIs)
{
    RecordingDialer dialer;
    FtpOptions options;
    options.username = "alice";
    FtpFileSystem fs(options, dialer.getter());

    auto client = std::make_shared<FakeFtpClient>();
    fs.withClient(client);
    EXPECT_EQ(fs.getOptions().username, ""); //reset to defaults

    EXPECT_EQ(fs.client(ExecContext(), parseAuthority("bob@host")), client);
    EXPECT_TRUE(dialer.clients.empty());
}


TEST(FtpFileSystem, ConnectErrorIsWrapped)
{
    RecordingDialer dialer;
    dialer.failure = L"Connection refused.";
    FtpFileSystem fs(FtpOptions(), dialer.getter());

    try
    {
        fs.client(ExecContext(), parseAuthority("bob@host:21"));
        FAIL();
    }
    catch (const FileError& e)
    {
        EXPECT_EQ(e.toString(), L"Unable to connect to \"ftp://bob@host:21/\".\n\nConnection refused.");
    }
}


TEST(FtpFileSystem, ConnectErrorFailsFileOperations)
{
    RecordingDialer dialer;
    dialer.failure = L"Connection refused.";
    FtpFileSystem fs(FtpOptions(), dialer.getter());

    std::unique_ptr<File> file = fs.newFile("bob@host", "/file.txt");
    char c = 0;
    EXPECT_THROW(file->read(&c, 1), FileError);
    EXPECT_THROW(file->exists(), FileError);
}


TEST(FtpFileSystem, DataConnRequiresFileForStreams)
{
    FtpFileSystem fs;
    fs.withClient(std::make_shared<FakeFtpClient>());
    const Authority authority = parseAuthority("bob@host");

    EXPECT_THROW(fs.dataConn(ExecContext(), authority, DataConnMode::read,  nullptr), std::logic_error);
    EXPECT_THROW(fs.dataConn(ExecContext(), authority, DataConnMode::write, nullptr), std::logic_error);
    EXPECT_EQ(fs.dataConn(ExecContext(), authority, DataConnMode::singleOp, nullptr).mode(), DataConnMode::singleOp);
}


TEST(FtpFileSystem, InjectedDataConnIsAdoptedByFirstFile)
{
    FtpFileSystem fs;
    auto client = std::make_shared<FakeFtpClient>();
    client->addFile("/file.txt", "content");
    fs.withClient(client);
    fs.withDataConn(std::make_unique<ReadSession>(client->retrFrom("/file.txt", 3)));

    std::unique_ptr<File> file = fs.newFile("bob@host", "/file.txt");
    char buffer[4] = {};
    ASSERT_EQ(file->read(buffer, 4), 4u);
    EXPECT_EQ(std::string(buffer, 4), "tent");
    EXPECT_EQ(client->countCalls("RETR"), 1u); //no second download
    file->close();
}


TEST(FtpFileSystem, CustomFactoryIsUsed)
{
    auto factory = std::make_unique<MockFactory>();
    MockDataConnection dc;
    EXPECT_CALL(*factory, getDataConn(::testing::_, DataConnMode::singleOp, ::testing::_, ::testing::_)).WillOnce(::testing::ReturnRef(dc));

    FtpFileSystem fs(FtpOptions(), nullptr, std::move(factory));
    EXPECT_EQ(&fs.dataConn(ExecContext(), parseAuthority("bob@host"), DataConnMode::singleOp, nullptr), &dc);
}


TEST(FtpFileSystem, DestructorClosesSessionAndQuitsDialedClient)
{
    RecordingDialer dialer;
    {
        FtpFileSystem fs(FtpOptions(), dialer.getter());
        std::unique_ptr<File> file = fs.newFile("bob@host", "/new.txt");
        const std::string data = "abc";
        file->write(data.data(), data.size());
        file.reset(); //session stays open
    }
    ASSERT_EQ(dialer.clients.size(), 1u);
    EXPECT_EQ(dialer.clients[0]->getContent("/new.txt"), "abc");
    EXPECT_EQ(dialer.clients[0]->countCalls("QUIT"), 1u);
}


TEST(FtpFileSystem, DestructorLogsCloseError)
{
    fetchExtraLog();
    auto client = std::make_shared<FakeFtpClient>();
    client->failStorAfterUpload = L"451 Aborted.";
    {
        FtpFileSystem fs;
        fs.withClient(client);
        std::unique_ptr<File> file = fs.newFile("bob@host", "/new.txt");
        file->write("abc", 3);
        file.reset();
    }
    const ErrorLog log = fetchExtraLog();
    ASSERT_EQ(log.size(), 1u);
    EXPECT_NE(log[0].message.find("451 Aborted."), std::string::npos);
    EXPECT_EQ(client->countCalls("QUIT"), 0u); //injected client is left alone
}
