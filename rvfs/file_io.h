// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef FILE_IO_H_4756102938475610293
#define FILE_IO_H_4756102938475610293

#include <string>
#include "file_error.h"


namespace rvfs
{
/*  OS-buffered scratch file in the temp folder:
    - created exclusively (mkstemp), opened for reading and writing
    - sequential read/write accesses; rewind() switches from writing to reading
    - deleted again in ~TempFile() unless remove() was called     */
class TempFile
{
public:
    explicit TempFile(const std::string& namePrefix); //throw FileError
    ~TempFile();

    const std::string& getFilePath() const { return filePath_; }

    //may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    size_t tryRead(void* buffer, size_t bytesToRead); //throw FileError

    //may return short! CONTRACT: bytesToWrite > 0
    size_t tryWrite(const void* buffer, size_t bytesToWrite); //throw FileError

    void rewind(); //throw FileError

    void remove(); //throw FileError -> good place to catch errors, otherwise called in ~TempFile()!

private:
    TempFile           (const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    static const int invalidFileHandle = -1;

    int hFile_ = invalidFileHandle;
    std::string filePath_;
};
}

#endif //FILE_IO_H_4756102938475610293
