// Core unit tests without external framework (run via CTest).
#include "TestSupport.hpp"
#include "scpsend/Credentials.hpp"
#include "scpsend/Errors.hpp"
#include "scpsend/MockTransport.hpp"
#include "scpsend/Progress.hpp"
#include "scpsend/Log.hpp"

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <stdlib.h>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <vector>

using testsupport::TestContext;

namespace {

scpsend::SessionOptions validOptions() {
    scpsend::SessionOptions opt;
    opt.host = "example.test";
    return opt;
}

scpsend::ProgressSample sampleAt(std::uint64_t sent, std::uint64_t total, int ms) {
    scpsend::ProgressSample s;
    s.bytes_sent = sent;
    s.total_bytes = total;
    s.elapsed = std::chrono::milliseconds(ms);
    return s;
}

bool near(double a, double b) {
    return std::fabs(a - b) <= std::fabs(b) * 1e-6 + 1e-9;
}

void test_session_defaults(TestContext &t) {
    scpsend::SessionOptions o;
    t.check(o.port == 22, "default port should be 22");
    t.check(o.known_hosts_policy == scpsend::KnownHostsPolicy::Strict,
            "default known_hosts_policy should be Strict");
    t.check(!o.known_hosts_path.has_value(), "known_hosts_path should default to unset");
    t.check(o.timeout_ms > 0, "blocking calls should have a timeout");
    t.check(scpsend::kRemoteFileMode == 0644, "remote files are created 0644");
}

void test_default_credentials(TestContext &t) {
    const auto keys = scpsend::defaultKeyPaths("/home/alice");
    t.check(keys.size() == 3, "three well-known keys");
    if (keys.size() == 3) {
        t.check(keys[0] == "/home/alice/.ssh/id_rsa", "id_rsa first");
        t.check(keys[1] == "/home/alice/.ssh/id_ed25519", "id_ed25519 second");
        t.check(keys[2] == "/home/alice/.ssh/id_ecdsa", "id_ecdsa third");
    }
    t.check(scpsend::defaultKeyPaths("/home/alice/") == keys, "trailing slash tolerated");
    t.check(scpsend::defaultKeyPaths("").empty(), "no home, no keys");

    const auto creds = scpsend::defaultCredentials("/home/alice");
    t.check(creds.size() == 4, "keys plus password");
    if (creds.size() == 4) {
        t.check(creds[0].isKeyFile() && !creds[3].isKeyFile(), "password comes last");
        t.check(!creds[3].password.has_value(), "default password is asked on demand");
    }
    t.check(scpsend::defaultCredentials("/home/alice", false).size() == 3,
            "password fallback can be disabled");
}

void test_credential_labels(TestContext &t) {
    const auto k = scpsend::Credential::keyFile("/k/id_rsa", std::string("phrase"));
    t.check(k.label() == "/k/id_rsa", "key label is its path");
    const auto p = scpsend::Credential::passwordAuth(std::string("secret"));
    t.check(p.label() == "password", "password label hides the value");
    t.check(std::string(scpsend::outcomeKindName(scpsend::AuthOutcome::Kind::Unavailable)) ==
                "unavailable",
            "outcome kind names");
}

void test_auth_error_describe(TestContext &t) {
    scpsend::AuthError none;
    t.check(!none.isError() && none.describe().empty(), "no error, no text");

    scpsend::AuthError e;
    e.kind = scpsend::AuthError::Kind::AllMethodsFailed;
    e.outcomes.push_back({"/k/id_rsa", scpsend::AuthOutcome::Kind::Unavailable, "key file not found"});
    e.outcomes.push_back({"password", scpsend::AuthOutcome::Kind::Rejected, "password refused"});
    const std::string text = e.describe();
    t.checkContains(text, "all methods exhausted", "headline");
    t.checkContains(text, "/k/id_rsa: unavailable (key file not found)", "key line");
    t.checkContains(text, "password: rejected (password refused)", "password line");
    t.check(text.find("/k/id_rsa") < text.find("password:"), "attempt order kept");
}

void test_transfer_error_describe(TestContext &t) {
    scpsend::TransferError e;
    t.check(e.describe().empty(), "no error, no text");

    e.kind = scpsend::TransferError::Kind::RemoteWriteFailed;
    e.offset = 4096;
    e.detail = "broken pipe";
    t.check(e.describe() == "Remote write failed at byte 4096: broken pipe", "write failure text");

    scpsend::TransferError m;
    m.kind = scpsend::TransferError::Kind::SizeMismatch;
    m.expected = 10;
    m.actual = 7;
    t.checkContains(m.describe(), "expected 10 bytes, read 7", "size mismatch text");
    t.check(std::string(scpsend::transferErrorName(m.kind)) == "SizeMismatch", "kind name");
}

void test_connect_validation(TestContext &t) {
    scpsend::MockTransport c;
    std::string err;
    scpsend::SessionOptions opt;
    t.check(!c.connect(opt, err), "connect should fail when host is empty");
    t.checkContains(err, "Host", "empty host error names the host");

    err.clear();
    t.check(c.connect(validOptions(), err), "connect should succeed with a host");
    t.check(c.isConnected(), "mock should report connected after connect");
    t.check(!c.isAuthenticated(), "not authenticated until a method succeeds");
    c.disconnect();
    t.check(!c.isConnected(), "disconnect should flip isConnected to false");
}

void test_mock_channel_requires_auth(TestContext &t) {
    scpsend::MockTransport c;
    std::string err;
    c.connect(validOptions(), err);
    auto ch = c.openWriteChannel("/tmp/x", 3, 0644, 0, 0, err);
    t.check(!ch, "channel refused before authentication");
    t.check(!err.empty(), "refusal explains itself");

    c.setPassword(std::string("pw"));
    t.check(c.authByPassword("alice", "pw").ok(), "password accepted");
    err.clear();
    ch = c.openWriteChannel("/tmp/x", 3, 0644, 0, 0, err);
    t.check(static_cast<bool>(ch), "channel opens once authenticated");
    if (ch) {
        t.check(ch->write("abcd", 4) == -1, "sink refuses bytes past declared size");
        t.check(ch->write("abc", 3) == 3, "declared bytes accepted");
        std::string cerr;
        t.check(ch->close(cerr), "close succeeds once all bytes arrived");
    }
    t.check(c.lastUpload() && c.lastUpload()->data == "abc", "upload recorded");
}

void test_mock_auth_replies(TestContext &t) {
    scpsend::MockTransport c;
    scpsend::MockTransport::KeyBehavior locked;
    locked.passphrase = std::string("pp");
    c.setKey("/k/locked", locked);
    scpsend::MockTransport::KeyBehavior refused;
    refused.accepted = false;
    c.setKey("/k/refused", refused);
    std::string err;
    c.connect(validOptions(), err);

    using Status = scpsend::AuthReply::Status;
    t.check(c.authByKey("a", "/k/unknown", std::nullopt).status == Status::Rejected,
            "unknown key rejected");
    t.check(c.authByKey("a", "/k/refused", std::nullopt).status == Status::Rejected,
            "refused key rejected");
    t.check(c.authByKey("a", "/k/locked", std::nullopt).status == Status::KeyLocked,
            "encrypted key locked without passphrase");
    t.check(c.authByKey("a", "/k/locked", std::string("no")).status == Status::KeyLocked,
            "encrypted key locked with wrong passphrase");
    t.check(c.authByKey("a", "/k/locked", std::string("pp")).ok(), "right passphrase accepted");
    t.check(c.keyAttempts() == 5 && c.passwordAttempts() == 0, "attempt counters");
}

void test_throughput_meter(TestContext &t) {
    scpsend::ThroughputMeter m(std::chrono::milliseconds(500));
    t.check(m.etaSeconds() == -1 && m.bytesPerSecond() == 0.0, "unknown before samples");

    m.update(sampleAt(1000, 100000, 100));
    t.check(near(m.bytesPerSecond(), 10000.0), "average rate before the first window");
    t.check(m.etaSeconds() == 9, "eta from remaining bytes");

    m.update(sampleAt(6000, 100000, 600));
    t.check(near(m.bytesPerSecond(), 10000.0), "rate over the first window");

    m.update(sampleAt(26000, 100000, 1100));
    t.check(near(m.bytesPerSecond(), 40000.0), "rate follows the latest window");
    t.check(m.etaSeconds() == 1, "eta shrinks with the faster rate");

    m.update(sampleAt(100000, 100000, 1200));
    t.check(m.etaSeconds() == 0, "complete transfer has zero eta");

    scpsend::ThroughputMeter empty;
    empty.update(sampleAt(0, 0, 0));
    t.check(empty.etaSeconds() == 0, "empty transfer is complete");
    t.check(sampleAt(0, 0, 0).fraction() == 1.0, "empty transfer is 100%");

    scpsend::ThroughputMeter slow;
    slow.update(sampleAt(1, 10000000000000ULL, 1000));
    t.check(near(slow.bytesPerSecond(), 1.0), "one byte per second");
    t.check(slow.etaSeconds() == std::numeric_limits<int>::max(),
            "eta saturates instead of overflowing");
}

void test_redaction_policy(TestContext &t) {
    t.check(!scpsend::envFlagEnabled(nullptr), "null flag name is off");
    ::setenv("SCPSEND_TEST_FLAG", " Yes ", 1);
    t.check(scpsend::envFlagEnabled("SCPSEND_TEST_FLAG"), "flag values are trimmed and case-folded");
    ::setenv("SCPSEND_TEST_FLAG", "0", 1);
    t.check(!scpsend::envFlagEnabled("SCPSEND_TEST_FLAG"), "0 is off");
    ::unsetenv("SCPSEND_TEST_FLAG");

    ::unsetenv("SCPSEND_LOG_SENSITIVE");
    t.check(!scpsend::sensitiveLoggingEnabled(), "sensitive logging off by default");
    t.check(scpsend::redacted("alice@example.test") == "<redacted>", "identifiers redacted by default");
    t.check(scpsend::redacted("").empty(), "empty stays empty");

    ::setenv("SCPSEND_ENV", "dev", 1);
    ::setenv("SCPSEND_LOG_SENSITIVE", "1", 1);
    t.check(scpsend::redacted("alice") == "alice", "dev opt-in shows identifiers");
    ::unsetenv("SCPSEND_ENV");
    ::unsetenv("SCPSEND_LOG_SENSITIVE");
}

} // namespace

int main() {
    TestContext t;
    test_session_defaults(t);
    test_default_credentials(t);
    test_credential_labels(t);
    test_auth_error_describe(t);
    test_transfer_error_describe(t);
    test_connect_validation(t);
    test_mock_channel_requires_auth(t);
    test_mock_auth_replies(t);
    test_throughput_meter(t);
    test_redaction_policy(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] scpsend_core_tests\n";
    return EXIT_SUCCESS;
}
