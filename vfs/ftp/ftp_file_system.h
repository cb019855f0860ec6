// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef FTP_FILE_SYSTEM_H_7730192846510293847
#define FTP_FILE_SYSTEM_H_7730192846510293847

#include <functional>
#include <memory>
#include <optional>
#include "../abstract.h"
#include "../authority.h"
#include "../exec_context.h"
#include "data_conn.h"
#include "ftp_options.h"


namespace vfs
{
using ClientGetter = std::function<std::shared_ptr<FtpClient>(const ExecContext& ctx, const Authority& authority, const FtpOptions& options)>; //throw SysError

/*  owns the one FTP control connection (Client) and the one data connection of all Files and
    Locations created by it => serialize access; interleaved reads and writes of different Files
    close each other's streams                                                                    */
class FtpFileSystem : public FileSystem
{
public:
    FtpFileSystem();
    explicit FtpFileSystem(const FtpOptions& options,
                           const ClientGetter& getClient = nullptr, //nullptr: dialFtpClient()
                           std::unique_ptr<DataConnectionFactory> dataConnFactory = nullptr); //nullptr: FtpDataConnFactory
    ~FtpFileSystem();

    std::unique_ptr<File> newFile(const std::string& volume, const std::string& absFilePath) override; //throw FileError
    std::unique_ptr<Location> newLocation(const std::string& volume, const std::string& absLocPath) override; //throw FileError

    std::string scheme() const override { return "ftp"; }
    std::string name() const override { return "File Transfer Protocol"; }

    FtpFileSystem& withOptions(const FtpOptions& options); //discards the client
    FtpFileSystem& withClient(const std::shared_ptr<FtpClient>& client);
    FtpFileSystem& withDataConn(std::unique_ptr<DataConnection>&& dataConn);

    const FtpOptions& getOptions() const { return options_; }

    std::shared_ptr<FtpClient> client(const ExecContext& ctx, const Authority& authority); //throw FileError

    //"file" may be nullptr for DataConnMode::singleOp only
    DataConnection& dataConn(const ExecContext& ctx, const Authority& authority, DataConnMode mode, const FtpFile* file); //throw SysError

    //mode of the stream session opened for "file", if any
    std::optional<DataConnMode> getStreamMode(const FtpFile& file) const;

    //close the session unless it was opened for another File; next use reconnects
    //also reports the error of a session of "file" that another File's request had to close
    void closeDataConn(const FtpFile& file); //throw SysError

    void onFileDestroyed(const FtpFile& file);

private:
    FtpFileSystem           (const FtpFileSystem&) = delete;
    FtpFileSystem& operator=(const FtpFileSystem&) = delete;

    std::shared_ptr<FtpClient> getClient(const ExecContext& ctx, const Authority& authority); //throw SysError

    FtpOptions options_;
    ClientGetter clientGetter_;
    std::unique_ptr<DataConnectionFactory> dataConnFactory_;

    std::shared_ptr<FtpClient> client_;
    std::optional<Authority> clientAuthority_; //nullopt for injected clients
    DataConnSlot dataConn_;
};
}

#endif //FTP_FILE_SYSTEM_H_7730192846510293847
