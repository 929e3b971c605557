// Upload loop: fixed-size chunks in file order, short writes resumed from the
// remainder, progress after each chunk, channel close verified at the end.
#include "scpsend/TransferEngine.hpp"
#include "scpsend/Log.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <vector>

#include <sys/stat.h>

namespace scpsend {

bool TransferPlan::open(const std::string &local_path,
                        const std::string &remote_path,
                        TransferPlan &out,
                        std::string &err) {
    if (local_path.empty()) {
        err = "Local path is empty";
        return false;
    }
    if (remote_path.empty()) {
        err = "Remote path is empty";
        return false;
    }
    std::FILE *f = std::fopen(local_path.c_str(), "rb");
    if (!f) {
        err = "Cannot open local file for reading: " + std::string(std::strerror(errno));
        return false;
    }
    std::unique_ptr<std::FILE, FileCloser> guard(f);

    struct stat st {};
    if (::fstat(::fileno(f), &st) != 0) {
        err = "Cannot stat local file: " + std::string(std::strerror(errno));
        return false;
    }
    if (!S_ISREG(st.st_mode)) {
        err = "Local path is not a regular file";
        return false;
    }

    out.file_ = std::move(guard);
    out.localPath_ = local_path;
    out.remotePath_ = remote_path;
    out.totalBytes_ = st.st_size > 0 ? static_cast<std::uint64_t>(st.st_size) : 0;
    out.mtime_ = static_cast<std::int64_t>(st.st_mtime);
    out.atime_ = static_cast<std::int64_t>(st.st_atime);
    return true;
}

TransferEngine::TransferEngine(std::size_t chunk_size)
    : chunkSize_(chunk_size > 0 ? chunk_size : kDefaultChunkSize) {}

bool TransferEngine::transfer(AuthenticatedSession &session,
                              TransferPlan &plan,
                              const ProgressCB &on_progress,
                              TransferError &err) {
    err = TransferError{};
    writeCalls_ = 0;
    if (!plan.isOpen()) {
        err.kind = TransferError::Kind::LocalReadFailed;
        err.detail = "local file is not open";
        return false;
    }

    std::FILE *lf = plan.file_.get();
    const std::uint64_t total = plan.totalBytes();

    std::string openErr;
    std::unique_ptr<WriteChannel> channel = session.transport().openWriteChannel(
        plan.remotePath(), total, plan.mode(), plan.mtime(), plan.atime(), openErr);
    if (!channel) {
        err.kind = TransferError::Kind::ChannelOpenFailed;
        err.detail = openErr;
        SCPSEND_LOGE("transfer: open remote failed: %s", openErr.c_str());
        return false;
    }
    SCPSEND_LOGI("transfer: %llu bytes, chunk %zu",
                 static_cast<unsigned long long>(total), chunkSize_);

    using clock = std::chrono::steady_clock;
    const auto start = clock::now();
    auto report = [&](std::uint64_t sent) {
        if (on_progress)
            on_progress(ProgressSample{sent, total, clock::now() - start});
    };

    std::vector<char> buf(chunkSize_);
    std::uint64_t sent = 0;

    while (sent < total) {
        const std::size_t want = static_cast<std::size_t>(
            std::min<std::uint64_t>(chunkSize_, total - sent));
        const std::size_t n = std::fread(buf.data(), 1, want, lf);
        if (n == 0) {
            if (std::ferror(lf)) {
                err.kind = TransferError::Kind::LocalReadFailed;
                err.offset = sent;
                err.detail = std::strerror(errno);
            } else {
                // File shrank after the plan was opened.
                err.kind = TransferError::Kind::SizeMismatch;
                err.expected = total;
                err.actual = sent;
            }
            SCPSEND_LOGE("transfer: %s at %llu", transferErrorName(err.kind),
                         static_cast<unsigned long long>(sent));
            return false;
        }

        const char *p = buf.data();
        std::size_t remain = n;
        while (remain > 0) {
            const long w = channel->write(p, remain);
            ++writeCalls_;
            if (w <= 0 || static_cast<std::size_t>(w) > remain) {
                err.kind = TransferError::Kind::RemoteWriteFailed;
                err.offset = sent + (n - remain);
                err.detail = channel->lastError();
                SCPSEND_LOGE("transfer: remote write failed at %llu",
                             static_cast<unsigned long long>(err.offset));
                return false;
            }
            remain -= static_cast<std::size_t>(w);
            p += w;
        }
        sent += n;
        report(sent);
    }

    // Declared size reached: anything still readable means the file grew.
    char next = 0;
    if (std::fread(&next, 1, 1, lf) == 1) {
        // Size from the descriptor; at least one byte past the declared size.
        std::uint64_t actual = total + 1;
        struct stat st {};
        if (::fstat(::fileno(lf), &st) == 0 && st.st_size > 0)
            actual = std::max(actual, static_cast<std::uint64_t>(st.st_size));
        err.kind = TransferError::Kind::SizeMismatch;
        err.expected = total;
        err.actual = actual;
        SCPSEND_LOGE("transfer: local file grew to %llu bytes",
                     static_cast<unsigned long long>(err.actual));
        return false;
    }
    if (std::ferror(lf)) {
        err.kind = TransferError::Kind::LocalReadFailed;
        err.offset = sent;
        err.detail = std::strerror(errno);
        SCPSEND_LOGE("transfer: local read failed at %llu",
                     static_cast<unsigned long long>(sent));
        return false;
    }

    if (total == 0)
        report(0);

    std::string closeErr;
    if (!channel->close(closeErr)) {
        err.kind = TransferError::Kind::RemoteCloseFailed;
        err.detail = closeErr;
        SCPSEND_LOGE("transfer: close failed: %s", closeErr.c_str());
        return false;
    }
    SCPSEND_LOGI("transfer: done");
    return true;
}

} // namespace scpsend
