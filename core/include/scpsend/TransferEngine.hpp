// Progress-tracked upload of one local file over an authenticated session.
#pragma once
#include "AuthNegotiator.hpp"
#include "Errors.hpp"
#include "SessionTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>

namespace scpsend {

// Open local file plus everything the remote side is told up front.
// Move-only: the engine is the only reader of the file.
class TransferPlan {
public:
    TransferPlan() = default;
    TransferPlan(TransferPlan &&) = default;
    TransferPlan &operator=(TransferPlan &&) = default;
    TransferPlan(const TransferPlan &) = delete;
    TransferPlan &operator=(const TransferPlan &) = delete;

    // Opens local_path read-only and captures its length and times. The
    // length captured here is authoritative for the whole transfer.
    static bool open(const std::string &local_path,
                     const std::string &remote_path,
                     TransferPlan &out,
                     std::string &err);

    bool isOpen() const { return file_ != nullptr; }
    const std::string &localPath() const { return localPath_; }
    const std::string &remotePath() const { return remotePath_; }
    std::uint64_t totalBytes() const { return totalBytes_; }
    std::uint32_t mode() const { return kRemoteFileMode; }
    std::int64_t mtime() const { return mtime_; }
    std::int64_t atime() const { return atime_; }

private:
    friend class TransferEngine;

    struct FileCloser {
        void operator()(std::FILE *f) const {
            if (f)
                std::fclose(f);
        }
    };

    std::unique_ptr<std::FILE, FileCloser> file_;
    std::string localPath_;
    std::string remotePath_;
    std::uint64_t totalBytes_ = 0;
    std::int64_t mtime_ = 0;
    std::int64_t atime_ = 0;
};

class TransferEngine {
public:
    explicit TransferEngine(std::size_t chunk_size = kDefaultChunkSize);

    // Streams plan's file to the remote destination. on_progress is invoked
    // after every fully written chunk and must return promptly. Returns false
    // and fills err on the first failure; nothing is retried except the
    // remainder of a short write.
    bool transfer(AuthenticatedSession &session,
                  TransferPlan &plan,
                  const ProgressCB &on_progress,
                  TransferError &err);

    std::size_t chunkSize() const { return chunkSize_; }
    // WriteChannel::write calls made by the last transfer().
    std::uint64_t writeCalls() const { return writeCalls_; }

private:
    std::size_t chunkSize_;
    std::uint64_t writeCalls_ = 0;
};

} // namespace scpsend
