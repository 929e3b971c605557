// Credential negotiation: sequential trial with early exit on the first
// accepted credential and a single passphrase re-attempt per encrypted key.
#include "scpsend/AuthNegotiator.hpp"
#include "scpsend/Log.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace scpsend {

namespace {

// Local check only: no network round-trip for keys that cannot be read.
bool keyFileReadable(const std::string &path, std::string &reason) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        reason = "key file not found";
        return false;
    }
    if (!fs::is_regular_file(path, ec)) {
        reason = "not a regular file";
        return false;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        reason = "key file not readable";
        return false;
    }
    return true;
}

AuthOutcome::Kind outcomeFor(AuthReply::Status s) {
    switch (s) {
    case AuthReply::Status::Accepted:
        return AuthOutcome::Kind::Authenticated;
    case AuthReply::Status::Rejected:
    case AuthReply::Status::Disconnected:
        return AuthOutcome::Kind::Rejected;
    case AuthReply::Status::KeyLocked:
    case AuthReply::Status::KeyUnusable:
        return AuthOutcome::Kind::Unavailable;
    }
    return AuthOutcome::Kind::Rejected;
}

std::string reasonFor(const AuthReply &r, const char *fallback) {
    return r.message.empty() ? std::string(fallback) : r.message;
}

} // namespace

const char *negotiatorStateName(AuthNegotiator::State s) {
    switch (s) {
    case AuthNegotiator::State::Idle:
        return "Idle";
    case AuthNegotiator::State::Trying:
        return "Trying";
    case AuthNegotiator::State::Authenticated:
        return "Authenticated";
    case AuthNegotiator::State::Exhausted:
        return "Exhausted";
    }
    return "Unknown";
}

void AuthNegotiator::record(const std::string &label, AuthOutcome::Kind kind,
                            std::string reason) {
    SCPSEND_LOGI("auth: %s -> %s%s%s", label.c_str(), outcomeKindName(kind),
                 reason.empty() ? "" : ": ", reason.c_str());
    outcomes_.push_back(AuthOutcome{label, kind, std::move(reason)});
}

AuthReply AuthNegotiator::tryKey(Transport &t, const std::string &username,
                                 const std::string &path,
                                 const std::optional<std::string> &passphrase,
                                 const std::string &label) {
    if (attemptObserver_)
        attemptObserver_(label);
    ++attempts_;
    return t.authByKey(username, path, passphrase);
}

AuthReply AuthNegotiator::tryPassword(Transport &t, const std::string &username,
                                      const std::string &password) {
    if (attemptObserver_)
        attemptObserver_("password");
    ++attempts_;
    return t.authByPassword(username, password);
}

std::unique_ptr<AuthenticatedSession>
AuthNegotiator::negotiate(std::unique_ptr<Transport> &transport,
                          const std::string &username,
                          const std::vector<Credential> &credentials,
                          AuthError &err) {
    state_ = State::Idle;
    attempts_ = 0;
    outcomes_.clear();
    err = AuthError{};

    auto exhausted = [&]() -> std::unique_ptr<AuthenticatedSession> {
        state_ = State::Exhausted;
        if (transport)
            transport->disconnect();
        err.kind = AuthError::Kind::AllMethodsFailed;
        err.outcomes = outcomes_;
        SCPSEND_LOGE("auth: exhausted after %d attempt(s)", attempts_);
        return nullptr;
    };
    auto authenticated = [&](const std::string &method) {
        state_ = State::Authenticated;
        SCPSEND_LOGI("auth: authenticated as %s via %s",
                     redacted(username).c_str(), method.c_str());
        return std::unique_ptr<AuthenticatedSession>(
            new AuthenticatedSession(std::move(transport), username, method));
    };

    if (!transport || !transport->isConnected())
        return exhausted();

    const std::vector<std::string> methods = transport->offeredMethods(username);
    if (transport->isAuthenticated())
        return authenticated("none");
    auto offered = [&methods](const char *m) {
        return methods.empty() ||
               std::find(methods.begin(), methods.end(), m) != methods.end();
    };

    for (std::size_t i = 0; i < credentials.size(); ++i) {
        state_ = State::Trying;
        const Credential &cred = credentials[i];
        const std::string label = cred.label();

        if (cred.isKeyFile()) {
            std::string reason;
            if (!keyFileReadable(cred.path, reason)) {
                record(label, AuthOutcome::Kind::Unavailable, reason);
                continue;
            }
            if (!offered("publickey")) {
                record(label, AuthOutcome::Kind::Unavailable,
                       "server does not offer publickey");
                continue;
            }

            AuthReply r = tryKey(*transport, username, cred.path, cred.passphrase, label);
            if (r.ok()) {
                record(label, AuthOutcome::Kind::Authenticated, {});
                return authenticated(label);
            }
            if (r.status == AuthReply::Status::Disconnected) {
                record(label, AuthOutcome::Kind::Rejected,
                       reasonFor(r, "connection closed by server"));
                return exhausted();
            }
            if (r.status != AuthReply::Status::KeyLocked || cred.passphrase) {
                record(label, outcomeFor(r.status), reasonFor(r, "key refused"));
                continue;
            }

            // Encrypted key tried without a passphrase: one interactive
            // re-attempt, recorded as its own outcome.
            std::optional<std::string> pp;
            if (passphrasePrompt_)
                pp = passphrasePrompt_(cred.path);
            if (!pp) {
                record(label, AuthOutcome::Kind::Unavailable,
                       "key is encrypted and no passphrase was supplied");
                continue;
            }
            record(label, AuthOutcome::Kind::Unavailable, "key is encrypted");

            const std::string retryLabel = label + " (passphrase)";
            AuthReply r2 = tryKey(*transport, username, cred.path, pp, retryLabel);
            if (r2.ok()) {
                record(retryLabel, AuthOutcome::Kind::Authenticated, {});
                return authenticated(retryLabel);
            }
            record(retryLabel, outcomeFor(r2.status),
                   reasonFor(r2, "key refused"));
            if (r2.status == AuthReply::Status::Disconnected)
                return exhausted();
            continue;
        }

        if (!offered("password") && !offered("keyboard-interactive")) {
            record(label, AuthOutcome::Kind::Unavailable,
                   "server does not offer password authentication");
            continue;
        }
        std::optional<std::string> password = cred.password;
        if (!password && passwordPrompt_)
            password = passwordPrompt_(username);
        if (!password) {
            record(label, AuthOutcome::Kind::Unavailable, "no password supplied");
            continue;
        }
        AuthReply r = tryPassword(*transport, username, *password);
        if (r.ok()) {
            record(label, AuthOutcome::Kind::Authenticated, {});
            return authenticated(label);
        }
        record(label, outcomeFor(r.status), reasonFor(r, "password refused"));
        if (r.status == AuthReply::Status::Disconnected)
            return exhausted();
    }

    return exhausted();
}

} // namespace scpsend
