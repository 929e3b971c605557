// Basic types shared between the CLI and the core for one upload session.
// Kept plain so the CLI can fill them from settings, options and prompts.
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace scpsend {

constexpr std::uint16_t kDefaultPort = 22;
// Mode the remote file is created with. Not user-configurable.
constexpr std::uint32_t kRemoteFileMode = 0644;
constexpr std::size_t kDefaultChunkSize = 64 * 1024;

// known_hosts validation policy for the server key.
enum class KnownHostsPolicy {
    Strict,    // Requires an exact match in known_hosts.
    AcceptNew, // TOFU: accepts and stores new hosts; rejects changed keys.
    Off        // No verification (not recommended).
};

// Callback answering keyboard-interactive prompts.
// Must return true and fill "responses" with one element per prompt when the
// user supplied them. On false the backend answers with the password.
using KbdIntPromptsCB = std::function<bool(const std::string &name,
                                           const std::string &instruction,
                                           const std::vector<std::string> &prompts,
                                           std::vector<std::string> &responses)>;

struct SessionOptions {
    std::string host;
    std::uint16_t port = kDefaultPort;

    // SSH security
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    // Fingerprint confirmation (TOFU) when known_hosts has no entry.
    // Returns true to accept and store, false to reject.
    std::function<bool(const std::string &host,
                       std::uint16_t port,
                       const std::string &algorithm,
                       const std::string &fingerprint)> hostkey_confirm_cb;

    // Custom keyboard-interactive handling (e.g. OTP/2FA). Optional.
    KbdIntPromptsCB keyboard_interactive_cb;

    // Session-level timeout for blocking libssh2 calls, 0 = none.
    long timeout_ms = 20000;
};

// Point-in-time snapshot of an upload. Emitted after each chunk.
struct ProgressSample {
    std::uint64_t bytes_sent = 0;
    std::uint64_t total_bytes = 0;
    std::chrono::steady_clock::duration elapsed{};

    bool complete() const { return bytes_sent == total_bytes; }

    // 0..1; an empty file is complete from the start.
    double fraction() const {
        if (total_bytes == 0)
            return 1.0;
        return double(bytes_sent) / double(total_bytes);
    }

    double averageBytesPerSecond() const {
        const double secs =
            std::chrono::duration_cast<std::chrono::duration<double>>(elapsed)
                .count();
        if (secs <= 0.000001)
            return 0.0;
        return double(bytes_sent) / secs;
    }
};

using ProgressCB = std::function<void(const ProgressSample &)>;

} // namespace scpsend
