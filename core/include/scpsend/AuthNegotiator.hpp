// Tries an ordered list of credentials against a connected transport until
// one is accepted or the list is exhausted.
//
// States: Idle -> Trying(i) -> {Trying(i+1) | Authenticated | Exhausted}.
// Authenticated and Exhausted are terminal.
#pragma once
#include "Credentials.hpp"
#include "Errors.hpp"
#include "Transport.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scpsend {

class AuthNegotiator;

// Transport that has completed authentication. Only the negotiator can
// create one, and the transfer engine only accepts this type.
class AuthenticatedSession {
public:
    Transport &transport() { return *transport_; }
    const std::string &username() const { return username_; }
    // Label of the credential that was accepted ("none" if the server
    // required no authentication).
    const std::string &method() const { return method_; }

private:
    friend class AuthNegotiator;
    AuthenticatedSession(std::unique_ptr<Transport> t, std::string user,
                         std::string method)
        : transport_(std::move(t)), username_(std::move(user)),
          method_(std::move(method)) {}

    std::unique_ptr<Transport> transport_;
    std::string username_;
    std::string method_;
};

class AuthNegotiator {
public:
    enum class State { Idle, Trying, Authenticated, Exhausted };

    // Asked at most once per encrypted key. Return nullopt to skip the key.
    using PassphrasePrompt =
        std::function<std::optional<std::string>(const std::string &key_path)>;
    // Asked when a password credential carries no value.
    using PasswordPrompt =
        std::function<std::optional<std::string>(const std::string &username)>;
    // Informational hook fired before each network attempt (label only).
    using AttemptObserver = std::function<void(const std::string &label)>;

    void setPassphrasePrompt(PassphrasePrompt cb) { passphrasePrompt_ = std::move(cb); }
    void setPasswordPrompt(PasswordPrompt cb) { passwordPrompt_ = std::move(cb); }
    void setAttemptObserver(AttemptObserver cb) { attemptObserver_ = std::move(cb); }

    // On success moves the transport into the returned session (leaving
    // `transport` null). Otherwise returns nullptr, fills err and leaves the
    // disconnected transport with the caller.
    std::unique_ptr<AuthenticatedSession> negotiate(std::unique_ptr<Transport> &transport,
                                                    const std::string &username,
                                                    const std::vector<Credential> &credentials,
                                                    AuthError &err);

    State state() const { return state_; }
    // Network authentication exchanges performed by the last negotiate().
    int attempts() const { return attempts_; }
    const std::vector<AuthOutcome> &outcomes() const { return outcomes_; }

private:
    AuthReply tryKey(Transport &t, const std::string &username,
                     const std::string &path,
                     const std::optional<std::string> &passphrase,
                     const std::string &label);
    AuthReply tryPassword(Transport &t, const std::string &username,
                          const std::string &password);
    void record(const std::string &label, AuthOutcome::Kind kind,
                std::string reason);

    PassphrasePrompt passphrasePrompt_;
    PasswordPrompt passwordPrompt_;
    AttemptObserver attemptObserver_;

    State state_ = State::Idle;
    int attempts_ = 0;
    std::vector<AuthOutcome> outcomes_;
};

const char *negotiatorStateName(AuthNegotiator::State s);

} // namespace scpsend
