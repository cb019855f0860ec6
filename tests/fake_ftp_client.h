// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef FAKE_FTP_CLIENT_H_3310293847561029384
#define FAKE_FTP_CLIENT_H_3310293847561029384

#include <algorithm>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <gmock/gmock.h>
#include <vfs/ftp/data_conn.h>
#include <vfs/ftp/ftp_client.h>
#include <vfs/vfs_path.h>


namespace vfs::test
{
//in-memory FTP server behind the FtpClient interface; records each command as "CMD arg"
class FakeFtpClient : public FtpClient
{
public:
    //---------- scripted server state ----------
    void addFile(const std::string& path, const std::string& content, time_t modTime = 1000)
    {
        std::lock_guard dummy(lock_);
        files_[path] = {content, modTime};
    }
    void addFolder(const std::string& path) { std::lock_guard dummy(lock_); folders_.insert(ensureTrailingSlash(path)); }

    std::optional<std::string> getContent(const std::string& path) const
    {
        std::lock_guard dummy(lock_);
        if (auto it = files_.find(path); it != files_.end())
            return it->second.content;
        return std::nullopt;
    }
    time_t getModTime(const std::string& path) const { std::lock_guard dummy(lock_); return files_.at(path).modTime; }
    bool hasFolder(const std::string& path) const { std::lock_guard dummy(lock_); return folders_.contains(ensureTrailingSlash(path)); }

    std::vector<std::string> getCalls() const { std::lock_guard dummy(lock_); return calls_; }
    void clearCalls() { std::lock_guard dummy(lock_); calls_.clear(); }
    size_t countCalls(const std::string& prefix) const
    {
        std::lock_guard dummy(lock_);
        return std::count_if(calls_.begin(), calls_.end(), [&](const std::string& call) { return rvfs::startsWith(call, prefix); });
    }

    //feature flags
    bool mlst = true;
    bool mfmt = true;

    //injected failures
    std::optional<std::wstring> failStorAfterUpload; //STOR fails once all data is read
    std::optional<std::wstring> failStorBeforeUpload; //STOR fails without reading anything
    std::optional<long> failMkdCode;
    std::optional<std::wstring> failList;

    int sourceCloseCount = 0;

    //---------- FtpClient ----------
    void login(const std::string& username, const std::string& password) override { record("USER " + username); }
    void quit() override { record("QUIT"); }

    void deleteFile(const std::string& path) override
    {
        record("DELE " + path);
        std::lock_guard dummy(lock_);
        if (files_.erase(path) == 0)
            throwUnavailable();
    }

    FtpEntry getEntry(const std::string& path) override
    {
        record("MLST " + path);
        std::lock_guard dummy(lock_);
        if (auto it = files_.find(path); it != files_.end())
            return makeEntry(path, it->second);
        throwUnavailable();
    }

    std::vector<FtpEntry> list(const std::string& path) override
    {
        record("LIST " + path);
        std::lock_guard dummy(lock_);
        if (failList)
            throw rvfs::SysError(*failList);

        if (rvfs::endsWith(path, '/'))
        {
            if (path != "/" && !folders_.contains(path))
                throwUnavailable();

            std::vector<FtpEntry> entries;
            for (const auto& [filePath, file] : files_)
                if (getParentPath(filePath) == path)
                    entries.push_back(makeEntry(filePath, file));
            for (const std::string& folderPath : folders_)
                if (folderPath != path && getParentPath(folderPath) == path)
                    entries.push_back({getBaseName(folderPath), FtpEntryType::folder, 0, 0});
            return entries;
        }

        if (auto it = files_.find(path); it != files_.end())
            return {makeEntry(path, it->second)};
        throwUnavailable();
    }

    void makeDir(const std::string& path) override
    {
        record("MKD " + path);
        if (failMkdCode)
            throw SysErrorFtpProtocol(L"MKD failed", *failMkdCode);
        addFolder(path);
    }

    void rename(const std::string& pathFrom, const std::string& pathTo) override
    {
        record("RNFR " + pathFrom + " RNTO " + pathTo);
        std::lock_guard dummy(lock_);
        auto it = files_.find(pathFrom);
        if (it == files_.end())
            throwUnavailable();
        FakeFile file = it->second;
        files_.erase(it);
        file.modTime = ++clock_;
        files_[pathTo] = file;
    }

    std::unique_ptr<FtpByteSource> retrFrom(const std::string& path, uint64_t offset) override
    {
        record("RETR " + path + '@' + rvfs::numberTo<std::string>(offset));
        std::lock_guard dummy(lock_);
        auto it = files_.find(path);
        if (it == files_.end())
            throwUnavailable();

        const std::string& content = it->second.content;
        return std::make_unique<ByteSource>(offset < content.size() ? content.substr(offset) : std::string(), sourceCloseCount);
    }

    void storFrom(const std::string& path, uint64_t offset, const ReadBlockFun& readBlock) override
    {
        record("STOR " + path + '@' + rvfs::numberTo<std::string>(offset));
        if (failStorBeforeUpload)
            throw SysErrorFtpProtocol(*failStorBeforeUpload, 451);

        std::string data;
        char buffer[7]; //odd block size
        for (size_t bytesRead = 0; (bytesRead = readBlock(buffer, sizeof(buffer))) != 0;)
            data.append(buffer, bytesRead);

        if (failStorAfterUpload)
            throw SysErrorFtpProtocol(*failStorAfterUpload, 451);

        std::lock_guard dummy(lock_);
        FakeFile& file = files_[path];
        //REST + STOR: bytes land at the offset, the old tail is cut
        file.content.resize(std::min<size_t>(file.content.size(), offset));
        file.content.resize(offset, '\0');
        file.content += data;
        file.modTime = ++clock_;
    }

    bool isSetTimeSupported() override { return mfmt; }

    void setTime(const std::string& path, time_t modTime) override
    {
        record("MFMT " + path);
        std::lock_guard dummy(lock_);
        auto it = files_.find(path);
        if (it == files_.end())
            throwUnavailable();
        it->second.modTime = modTime;
    }

    bool isTimePreciseInList() override { return mlst; }

private:
    struct FakeFile
    {
        std::string content;
        time_t modTime = 0;
    };

    class ByteSource : public FtpByteSource
    {
    public:
        ByteSource(const std::string& content, int& closeCount) : content_(content), closeCount_(closeCount) {}

        size_t tryRead(void* buffer, size_t bytesToRead) override
        {
            const size_t junkSize = std::min(bytesToRead, content_.size() - pos_);
            std::copy(content_.begin() + pos_, content_.begin() + pos_ + junkSize, static_cast<char*>(buffer));
            pos_ += junkSize;
            return junkSize;
        }

        void close() override
        {
            if (!closed_)
                ++closeCount_;
            closed_ = true;
        }

    private:
        const std::string content_;
        size_t pos_ = 0;
        int& closeCount_;
        bool closed_ = false;
    };

    static FtpEntry makeEntry(const std::string& path, const FakeFile& file) { return {getBaseName(path), FtpEntryType::file, file.content.size(), file.modTime}; }

    [[noreturn]] static void throwUnavailable() { throw SysErrorFtpProtocol(L"550 No such file or directory.", FTP_STATUS_FILE_UNAVAILABLE); }

    void record(const std::string& call) { std::lock_guard dummy(lock_); calls_.push_back(call); }

    mutable std::recursive_mutex lock_;
    std::map<std::string, FakeFile> files_;
    std::set<std::string> folders_;
    std::vector<std::string> calls_;
    time_t clock_ = 5000;
};


class MockDataConnection : public DataConnection
{
public:
    MOCK_METHOD(DataConnMode, mode, (), (const, override));
    MOCK_METHOD(size_t, read, (void* buffer, size_t bytesToRead), (override));
    MOCK_METHOD(size_t, write, (const void* buffer, size_t bytesToWrite), (override));
    MOCK_METHOD(void, close, (), (override));
};
}

#endif //FAKE_FTP_CLIENT_H_3310293847561029384
