// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef SYS_ERROR_H_9812734098123740981
#define SYS_ERROR_H_9812734098123740981

#include <cerrno>
#include <string>
#include "scope_guard.h" //
#include "i18n.h"        //not used by this header, but the "rest of the world" needs it!
#include "utf.h"         //


namespace rvfs
{
//evaluate errno and assemble specific error message
using ErrorCode = int;

ErrorCode getLastError();

std::wstring formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg);
std::wstring formatSystemError(const std::string& functionName, ErrorCode ec);


//A low-level exception class giving (non-translated) detail information only - same conceptional level like errno!
class SysError
{
public:
    explicit SysError(const std::wstring& msg) : msg_(msg) {}
    virtual ~SysError() {}

    const std::wstring& toString() const { return msg_; }

private:
    std::wstring msg_;
};

#define DEFINE_NEW_SYS_ERROR(X) struct X : public rvfs::SysError { X(const std::wstring& msg) : SysError(msg) {} };


#define THROW_LAST_SYS_ERROR(functionName)                           \
    do { const rvfs::ErrorCode ecInternal = rvfs::getLastError(); throw rvfs::SysError(rvfs::formatSystemError(functionName, ecInternal)); } while (false)


//######################## implementation ########################
inline
ErrorCode getLastError()
{
    return errno; //don't use "::" prefix, errno is a macro!
}


std::wstring getSystemErrorDescription(ErrorCode ec); //return empty string on error
}

#endif //SYS_ERROR_H_9812734098123740981
