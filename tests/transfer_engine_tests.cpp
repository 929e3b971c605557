// TransferEngine and TransferPlan against the in-memory transport.
#include "TestSupport.hpp"
#include "scpsend/AuthNegotiator.hpp"
#include "scpsend/MockTransport.hpp"
#include "scpsend/TransferEngine.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

using testsupport::TempDir;
using testsupport::TestContext;
using testsupport::patternBytes;
using scpsend::MockTransport;
using scpsend::ProgressSample;
using scpsend::TransferEngine;
using scpsend::TransferError;
using scpsend::TransferPlan;

namespace {

constexpr std::size_t kChunk = 1024;

// Authenticated session over a mock; the mock pointer stays valid while the
// session lives. setup runs before connecting.
struct Rig {
    MockTransport *mock = nullptr;
    std::unique_ptr<scpsend::AuthenticatedSession> session;

    template <typename Setup>
    explicit Rig(Setup setup) {
        auto m = std::make_unique<MockTransport>();
        mock = m.get();
        mock->setPassword(std::string("pw"));
        setup(*mock);
        scpsend::SessionOptions opt;
        opt.host = "example.test";
        std::string err;
        mock->connect(opt, err);
        std::unique_ptr<scpsend::Transport> owner = std::move(m);
        scpsend::AuthNegotiator neg;
        scpsend::AuthError aerr;
        session = neg.negotiate(owner, "alice",
                                {scpsend::Credential::passwordAuth(std::string("pw"))}, aerr);
    }
    Rig() : Rig([](MockTransport &) {}) {}
};

void test_uploads_exact_bytes(TestContext &t) {
    const std::vector<std::size_t> sizes = {0, 1, kChunk - 1, kChunk, kChunk + 1, 3 * kChunk + 17};
    for (std::size_t n : sizes) {
        const std::string tag = " (size " + std::to_string(n) + ")";
        TempDir dir;
        const std::string payload = patternBytes(n);
        const std::string local = dir.write("payload.bin", payload);

        Rig rig;
        t.check(static_cast<bool>(rig.session), "session established" + tag);
        if (!rig.session)
            continue;

        TransferPlan plan;
        std::string err;
        t.check(TransferPlan::open(local, "/home/alice/payload.bin", plan, err), "plan opens" + tag);
        t.check(plan.totalBytes() == n, "plan length matches file" + tag);

        std::vector<ProgressSample> samples;
        TransferEngine engine(kChunk);
        TransferError xerr;
        const bool ok = engine.transfer(*rig.session, plan,
                                        [&](const ProgressSample &s) { samples.push_back(s); },
                                        xerr);
        t.check(ok, "transfer succeeds" + tag);
        t.check(!xerr.isError(), "no transfer error" + tag);

        const MockTransport::Upload *up = rig.mock->lastUpload();
        t.check(up != nullptr, "remote saw an upload" + tag);
        if (up) {
            t.check(up->path == "/home/alice/payload.bin", "remote path forwarded" + tag);
            t.check(up->declared_size == n, "declared size is the file length" + tag);
            t.check(up->mode == 0644, "remote file mode 0644" + tag);
            t.check(up->data == payload, "remote bytes identical" + tag);
            t.check(up->closed, "remote stream closed" + tag);
        }

        // Monotonic, bounded, ends at total exactly once.
        std::uint64_t prev = 0;
        int atTotal = 0;
        bool monotonic = true;
        bool bounded = true;
        for (const auto &s : samples) {
            if (s.bytes_sent < prev)
                monotonic = false;
            if (s.bytes_sent > n || s.total_bytes != n)
                bounded = false;
            if (s.bytes_sent == n)
                ++atTotal;
            prev = s.bytes_sent;
        }
        t.check(monotonic, "progress never decreases" + tag);
        t.check(bounded, "progress never exceeds total" + tag);
        t.check(atTotal == 1, "progress reaches total exactly once" + tag);
        t.check(!samples.empty() && samples.back().complete(), "last sample is complete" + tag);
        if (n > 0) {
            const std::size_t chunks = (n + kChunk - 1) / kChunk;
            t.check(samples.size() == chunks, "one sample per chunk" + tag);
        }
    }
}

void test_empty_file_single_sample(TestContext &t) {
    TempDir dir;
    const std::string local = dir.write("empty", "");
    Rig rig;
    TransferPlan plan;
    std::string err;
    TransferPlan::open(local, "/tmp/empty", plan, err);

    std::vector<ProgressSample> samples;
    TransferEngine engine(kChunk);
    TransferError xerr;
    const bool ok = engine.transfer(*rig.session, plan,
                                    [&](const ProgressSample &s) { samples.push_back(s); }, xerr);
    t.check(ok, "empty file uploads");
    t.check(samples.size() == 1, "exactly one progress sample");
    if (samples.size() == 1) {
        t.check(samples[0].bytes_sent == 0 && samples[0].total_bytes == 0, "sample is 0/0");
        t.check(samples[0].fraction() == 1.0, "empty transfer reports 100%");
    }
    t.check(engine.writeCalls() == 0, "no data writes for an empty file");
}

void test_short_writes_resumed(TestContext &t) {
    TempDir dir;
    const std::string payload = patternBytes(5000);
    const std::string local = dir.write("data", payload);
    Rig rig([](MockTransport &m) { m.setMaxBytesPerWrite(1); });

    TransferPlan plan;
    std::string err;
    TransferPlan::open(local, "/tmp/data", plan, err);
    TransferEngine engine(kChunk);
    TransferError xerr;
    const bool ok = engine.transfer(*rig.session, plan, {}, xerr);
    t.check(ok, "one-byte writes still complete");
    t.check(engine.writeCalls() >= payload.size(), "every byte needed its own write");
    t.check(rig.mock->writeCalls() == engine.writeCalls(), "engine counts every write call");
    const auto *up = rig.mock->lastUpload();
    t.check(up && up->data == payload, "short writes keep byte order");
}

void test_remote_write_failure_offset(TestContext &t) {
    TempDir dir;
    const std::string local = dir.write("data", patternBytes(5000));
    Rig rig([](MockTransport &m) { m.setFailWriteAtOffset(std::uint64_t(3000)); });

    TransferPlan plan;
    std::string err;
    TransferPlan::open(local, "/tmp/data", plan, err);
    std::vector<ProgressSample> samples;
    TransferEngine engine(kChunk);
    TransferError xerr;
    const bool ok = engine.transfer(*rig.session, plan,
                                    [&](const ProgressSample &s) { samples.push_back(s); }, xerr);
    t.check(!ok, "transfer fails on write error");
    t.check(xerr.kind == TransferError::Kind::RemoteWriteFailed, "RemoteWriteFailed");
    t.check(xerr.offset == 3000, "failure offset is the first unwritten byte");
    t.check(!samples.empty() && samples.back().bytes_sent == 2048,
            "progress stops at the last complete chunk");
    t.checkContains(xerr.describe(), "3000", "message names the offset");
    const auto *up = rig.mock->lastUpload();
    t.check(up && !up->closed, "failed upload is not closed");
}

void test_local_file_shrinks(TestContext &t) {
    TempDir dir;
    const std::string local = dir.write("data", patternBytes(4096));
    Rig rig;

    TransferPlan plan;
    std::string err;
    TransferPlan::open(local, "/tmp/data", plan, err);
    std::filesystem::resize_file(local, 1500);

    TransferEngine engine(kChunk);
    TransferError xerr;
    const bool ok = engine.transfer(*rig.session, plan, {}, xerr);
    t.check(!ok, "shrunk file fails");
    t.check(xerr.kind == TransferError::Kind::SizeMismatch, "SizeMismatch on shrink");
    t.check(xerr.expected == 4096 && xerr.actual == 1500, "expected/actual byte counts");
}

void test_local_file_grows(TestContext &t) {
    TempDir dir;
    const std::string local = dir.write("data", patternBytes(2000));
    Rig rig;

    TransferPlan plan;
    std::string err;
    TransferPlan::open(local, "/tmp/data", plan, err);
    {
        std::ofstream app(local, std::ios::binary | std::ios::app);
        app << "appended";
    }

    TransferEngine engine(kChunk);
    TransferError xerr;
    const bool ok = engine.transfer(*rig.session, plan, {}, xerr);
    t.check(!ok, "grown file fails");
    t.check(xerr.kind == TransferError::Kind::SizeMismatch, "SizeMismatch on growth");
    t.check(xerr.expected == 2000 && xerr.actual == 2008, "growth counted");
    const auto *up = rig.mock->lastUpload();
    t.check(up && up->data.size() == 2000, "never writes past the declared size");
}

// The plan's descriptor is swapped for a directory so every read fails with
// EISDIR. fopen hands out the lowest free descriptor, found up front.
void test_local_read_failure(TestContext &t) {
    TempDir dir;
    const std::string local = dir.write("data", patternBytes(3000));
    Rig rig;

    const int slot = ::open("/dev/null", O_RDONLY);
    t.check(slot >= 0, "a descriptor is available");
    if (slot < 0)
        return;
    ::close(slot);

    TransferPlan plan;
    std::string err;
    t.check(TransferPlan::open(local, "/tmp/data", plan, err), "plan opens");

    struct stat want {};
    struct stat got {};
    const bool sameFile = ::stat(local.c_str(), &want) == 0 && ::fstat(slot, &got) == 0 &&
                          want.st_ino == got.st_ino && want.st_dev == got.st_dev;
    t.check(sameFile, "plan holds the expected descriptor");
    if (!sameFile)
        return;

    const int dirFd = ::open(dir.file("").c_str(), O_RDONLY | O_DIRECTORY);
    t.check(dirFd >= 0, "directory opens");
    if (dirFd < 0)
        return;
    t.check(::dup2(dirFd, slot) == slot, "plan descriptor now reads a directory");
    ::close(dirFd);

    std::vector<ProgressSample> samples;
    TransferEngine engine(kChunk);
    TransferError xerr;
    const bool ok = engine.transfer(*rig.session, plan,
                                    [&](const ProgressSample &s) { samples.push_back(s); }, xerr);
    t.check(!ok, "unreadable local file fails the transfer");
    t.check(xerr.kind == TransferError::Kind::LocalReadFailed, "LocalReadFailed");
    t.check(xerr.offset == 0, "failure offset is the first unread byte");
    t.check(samples.empty(), "no progress before the first chunk");
    t.checkContains(xerr.describe(), "Local read failed at byte 0", "message names the offset");
    t.check(!xerr.detail.empty(), "system reason kept");
    const auto *up = rig.mock->lastUpload();
    t.check(up && up->data.empty() && !up->closed, "nothing sent and stream left open");
}

void test_channel_open_and_close_failures(TestContext &t) {
    TempDir dir;
    const std::string local = dir.write("data", patternBytes(100));
    {
        Rig rig([](MockTransport &m) { m.setFailOpen(true); });
        TransferPlan plan;
        std::string err;
        TransferPlan::open(local, "/root/forbidden", plan, err);
        TransferEngine engine(kChunk);
        TransferError xerr;
        t.check(!engine.transfer(*rig.session, plan, {}, xerr), "open failure fails transfer");
        t.check(xerr.kind == TransferError::Kind::ChannelOpenFailed, "ChannelOpenFailed");
        t.checkContains(xerr.describe(), "Permission denied", "remote reason kept");
    }
    {
        Rig rig([](MockTransport &m) { m.setFailClose(true); });
        TransferPlan plan;
        std::string err;
        TransferPlan::open(local, "/tmp/data", plan, err);
        TransferEngine engine(kChunk);
        TransferError xerr;
        t.check(!engine.transfer(*rig.session, plan, {}, xerr), "close failure fails transfer");
        t.check(xerr.kind == TransferError::Kind::RemoteCloseFailed, "RemoteCloseFailed");
    }
}

void test_plan_open_errors(TestContext &t) {
    TempDir dir;
    TransferPlan plan;
    std::string err;
    t.check(!TransferPlan::open(dir.file("missing"), "/tmp/x", plan, err), "missing file rejected");
    t.check(!err.empty(), "missing file error text");
    err.clear();
    t.check(!TransferPlan::open(dir.file(""), "/tmp/x", plan, err), "directory rejected");
    err.clear();
    const std::string local = dir.write("f", "x");
    t.check(!TransferPlan::open(local, "", plan, err), "empty remote path rejected");
    t.check(!plan.isOpen(), "failed open leaves plan closed");

    TransferEngine engine(0);
    t.check(engine.chunkSize() == scpsend::kDefaultChunkSize, "zero chunk size falls back to default");
}

} // namespace

int main() {
    TestContext t;
    test_uploads_exact_bytes(t);
    test_empty_file_single_sample(t);
    test_short_writes_resumed(t);
    test_remote_write_failure_offset(t);
    test_local_file_shrinks(t);
    test_local_file_grows(t);
    test_local_read_failure(t);
    test_channel_open_and_close_failures(t);
    test_plan_open_errors(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] scpsend_transfer_tests\n";
    return EXIT_SUCCESS;
}
