// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#include <cstdlib>
#include <gtest/gtest.h>
#include <vfs/ftp/ftp_options.h>

using namespace rvfs;
using namespace vfs;


namespace
{
class FtpOptionsTest : public ::testing::Test
{
protected:
    void SetUp   () override { clearEnv(); }
    void TearDown() override { clearEnv(); }

    static void clearEnv()
    {
        for (const char* name : {ENV_FTP_USERNAME, ENV_FTP_PASSWORD, ENV_FTP_PROTOCOL, ENV_FTP_DISABLE_EPSV})
            ::unsetenv(name);
    }
};
}


TEST_F(FtpOptionsTest, UsernamePrecedence)
{
    FtpOptions options;
    Authority authority;
    EXPECT_EQ(resolveUsername(options, authority), "anonymous");

    ::setenv(ENV_FTP_USERNAME, "envuser", 1);
    EXPECT_EQ(resolveUsername(options, authority), "envuser");

    authority.userInfo.username = "urluser";
    EXPECT_EQ(resolveUsername(options, authority), "urluser");

    options.username = "optuser";
    EXPECT_EQ(resolveUsername(options, authority), "optuser");
}


TEST_F(FtpOptionsTest, EmptyEnvironmentUsernameCounts)
{
    ::setenv(ENV_FTP_USERNAME, "", 1);
    EXPECT_EQ(resolveUsername(FtpOptions(), Authority()), "");
}


TEST_F(FtpOptionsTest, PasswordPrecedence)
{
    FtpOptions options;
    EXPECT_EQ(resolvePassword(options), "anonymous");

    ::setenv(ENV_FTP_PASSWORD, "envpass", 1);
    EXPECT_EQ(resolvePassword(options), "envpass");

    options.password = "optpass";
    EXPECT_EQ(resolvePassword(options), "optpass");
}


TEST_F(FtpOptionsTest, Protocol)
{
    FtpOptions options;
    EXPECT_EQ(resolveProtocol(options), FtpProtocol::ftp);

    ::setenv(ENV_FTP_PROTOCOL, "ftps", 1);
    EXPECT_EQ(resolveProtocol(options), FtpProtocol::ftps);

    options.protocol = "FTPES";
    EXPECT_EQ(resolveProtocol(options), FtpProtocol::ftpes);

    options.protocol = "SFTP";
    EXPECT_THROW(resolveProtocol(options), SysError);

    EXPECT_EQ(formatProtocol(FtpProtocol::ftpes), "FTPES");
}


TEST_F(FtpOptionsTest, DisableEpsv)
{
    FtpOptions options;
    EXPECT_FALSE(resolveDisableEpsv(options));

    ::setenv(ENV_FTP_DISABLE_EPSV, "TRUE", 1);
    EXPECT_TRUE(resolveDisableEpsv(options));
    ::setenv(ENV_FTP_DISABLE_EPSV, "1", 1);
    EXPECT_TRUE(resolveDisableEpsv(options));
    ::setenv(ENV_FTP_DISABLE_EPSV, "yes", 1);
    EXPECT_FALSE(resolveDisableEpsv(options));

    ::setenv(ENV_FTP_DISABLE_EPSV, "true", 1);
    options.disableEpsv = false;
    EXPECT_FALSE(resolveDisableEpsv(options));
}


TEST_F(FtpOptionsTest, TlsConfigDefaultsToAuthorityHost)
{
    const Authority authority = parseAuthority("bob@ftp.example.com:990");

    TlsConfig cfg = resolveTlsConfig(FtpOptions(), authority);
    EXPECT_EQ(cfg.serverName, "ftp.example.com");
    EXPECT_EQ(cfg.minVersion, TlsVersion::tls1_2);
    EXPECT_FALSE(cfg.verifyPeer);

    FtpOptions options;
    options.tls = TlsConfig{TlsVersion::tls1_3, true, "cert.example.com"};
    cfg = resolveTlsConfig(options, authority);
    EXPECT_EQ(cfg.serverName, "cert.example.com");
    EXPECT_TRUE(cfg.verifyPeer);
}


TEST_F(FtpOptionsTest, Port)
{
    EXPECT_EQ(resolvePort(parseAuthority("host")), DEFAULT_PORT_FTP);
    EXPECT_EQ(resolvePort(parseAuthority("host:2121")), 2121);
}


TEST_F(FtpOptionsTest, ConnectTimeout)
{
    FtpOptions options;
    EXPECT_EQ(resolveConnectTimeout(options, ExecContext()), std::chrono::milliseconds(DEFAULT_DIAL_TIMEOUT));

    options.dialTimeout = std::chrono::milliseconds(2500);
    EXPECT_EQ(resolveConnectTimeout(options, ExecContext()), std::chrono::milliseconds(2500));

    const std::chrono::milliseconds timeout = resolveConnectTimeout(options, ExecContext::withTimeout(std::chrono::milliseconds(500)));
    EXPECT_LE(timeout, std::chrono::milliseconds(500));
    EXPECT_GT(timeout, std::chrono::milliseconds(0));

    ExecContext ctx;
    ctx.cancel();
    EXPECT_THROW(resolveConnectTimeout(options, ctx), SysError);
}
