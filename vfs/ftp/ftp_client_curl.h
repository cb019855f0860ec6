// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef FTP_CLIENT_CURL_H_4410293847561029387
#define FTP_CLIENT_CURL_H_4410293847561029387

#include <memory>
#include "ftp_client.h"
#include "ftp_options.h"


namespace vfs
{
//connect to "authority" using libcurl and log in with the resolved credentials
std::shared_ptr<FtpClient> dialFtpClient(const ExecContext& ctx, const Authority& authority, const FtpOptions& options); //throw SysError, SysErrorPassword
}

#endif //FTP_CLIENT_CURL_H_4410293847561029387
