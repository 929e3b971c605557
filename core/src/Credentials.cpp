#include "scpsend/Credentials.hpp"

#include <utility>

namespace scpsend {

Credential Credential::keyFile(std::string path,
                               std::optional<std::string> passphrase) {
    Credential c;
    c.kind = Kind::KeyFile;
    c.path = std::move(path);
    c.passphrase = std::move(passphrase);
    return c;
}

Credential Credential::passwordAuth(std::optional<std::string> value) {
    Credential c;
    c.kind = Kind::Password;
    c.password = std::move(value);
    return c;
}

std::string Credential::label() const {
    if (kind == Kind::KeyFile)
        return path;
    return "password";
}

std::vector<std::string> defaultKeyPaths(const std::string &home) {
    if (home.empty())
        return {};
    std::string base = home;
    if (base.back() != '/')
        base += '/';
    base += ".ssh/";
    return {base + "id_rsa", base + "id_ed25519", base + "id_ecdsa"};
}

std::vector<Credential> defaultCredentials(const std::string &home,
                                           bool withPassword) {
    std::vector<Credential> out;
    for (auto &p : defaultKeyPaths(home))
        out.push_back(Credential::keyFile(std::move(p)));
    if (withPassword)
        out.push_back(Credential::passwordAuth());
    return out;
}

const char *outcomeKindName(AuthOutcome::Kind k) {
    switch (k) {
    case AuthOutcome::Kind::Authenticated:
        return "authenticated";
    case AuthOutcome::Kind::Rejected:
        return "rejected";
    case AuthOutcome::Kind::Unavailable:
        return "unavailable";
    }
    return "unknown";
}

} // namespace scpsend
