// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef FILE_ERROR_H_5610928374651092837
#define FILE_ERROR_H_5610928374651092837

#include "sys_error.h" //we'll need this later anyway!


namespace rvfs
{
class FileError //A high-level exception class giving detailed context information for end users
{
public:
    explicit FileError(const std::wstring& msg) : msg_(msg) {}
    FileError(const std::wstring& msg, const std::wstring& details) : msg_(msg + L"\n\n" + details) {}
    virtual ~FileError() {}

    const std::wstring& toString() const { return msg_; }

private:
    std::wstring msg_;
};

#define DEFINE_NEW_FILE_ERROR(X) struct X : public rvfs::FileError { X(const std::wstring& msg) : FileError(msg) {} X(const std::wstring& msg, const std::wstring& descr) : FileError(msg, descr) {} };


#define THROW_LAST_FILE_ERROR(msg, functionName)                           \
    do { const rvfs::ErrorCode ecInternal = rvfs::getLastError(); throw rvfs::FileError(msg, rvfs::formatSystemError(functionName, ecInternal)); } while (false)

//----------- facilitate usage of std::wstring for error messages --------------------

inline std::wstring fmtPath(const std::wstring& displayPath) { return L'"' + displayPath + L'"'; }
inline std::wstring fmtPath(const std::string& displayPath) { return fmtPath(utfTo<std::wstring>(displayPath)); }
inline std::wstring fmtPath(const wchar_t* displayPath) { return fmtPath(std::wstring(displayPath)); } //resolve overload ambiguity
}

#endif //FILE_ERROR_H_5610928374651092837
