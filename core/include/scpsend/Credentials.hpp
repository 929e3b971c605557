// Credential sources tried by the AuthNegotiator, in priority order, and the
// per-credential outcome record.
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace scpsend {

struct Credential {
    enum class Kind { KeyFile, Password };

    Kind kind = Kind::Password;
    std::string path;                      // KeyFile only
    std::optional<std::string> passphrase; // KeyFile only
    std::optional<std::string> password;   // Password only; empty = ask on demand

    static Credential keyFile(std::string path,
                              std::optional<std::string> passphrase = std::nullopt);
    static Credential passwordAuth(std::optional<std::string> value = std::nullopt);

    bool isKeyFile() const { return kind == Kind::KeyFile; }

    // Display name safe for logs and error messages (never the secret).
    std::string label() const;
};

// Well-known private keys under <home>/.ssh, in the order they are tried.
std::vector<std::string> defaultKeyPaths(const std::string &home);

// Default list: every well-known key, then the password as fallback.
std::vector<Credential> defaultCredentials(const std::string &home,
                                           bool withPassword = true);

struct AuthOutcome {
    enum class Kind { Authenticated, Rejected, Unavailable };

    std::string label;
    Kind kind = Kind::Unavailable;
    std::string reason;
};

const char *outcomeKindName(AuthOutcome::Kind k);

} // namespace scpsend
