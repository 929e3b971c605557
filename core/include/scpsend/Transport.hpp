// Abstract SSH transport consumed by the core. Concrete backends (libssh2,
// the test mock) implement this API so the negotiator and the transfer loop
// never see the wire protocol.
#pragma once
#include "SessionTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scpsend {

// Result of a single authentication exchange.
struct AuthReply {
    enum class Status {
        Accepted,
        Rejected,     // server refused the credential
        KeyLocked,    // private key is encrypted and needs a (different) passphrase
        KeyUnusable,  // key could not be loaded or decoded locally
        Disconnected  // session dropped; nothing else can be tried
    };

    Status status = Status::Rejected;
    std::string message;

    bool ok() const { return status == Status::Accepted; }
};

// Remote sink for one file, declared with its exact size up front.
class WriteChannel {
public:
    virtual ~WriteChannel() = default;

    // Returns the number of bytes accepted (may be fewer than len), or < 0 on
    // error. Never returns 0 for len > 0.
    virtual long write(const char *data, std::size_t len) = 0;

    // Sends EOF, waits for the remote side to finish and checks its status.
    virtual bool close(std::string &err) = 0;

    // Description of the last write failure.
    virtual std::string lastError() const = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    // TCP connect + SSH handshake + host key verification.
    virtual bool connect(const SessionOptions &opt, std::string &err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Methods the server offers for this user ("publickey", "password", ...).
    // Empty when unknown.
    virtual std::vector<std::string> offeredMethods(const std::string &username) = 0;
    // True once any exchange (including "none") authenticated the session.
    virtual bool isAuthenticated() const = 0;

    virtual AuthReply authByKey(const std::string &username,
                                const std::string &private_key_path,
                                const std::optional<std::string> &passphrase) = 0;

    virtual AuthReply authByPassword(const std::string &username,
                                     const std::string &password) = 0;

    // Opens the remote write target. Returns nullptr and fills err on failure.
    virtual std::unique_ptr<WriteChannel> openWriteChannel(const std::string &remote_path,
                                                           std::uint64_t size,
                                                           std::uint32_t mode,
                                                           std::int64_t mtime,
                                                           std::int64_t atime,
                                                           std::string &err) = 0;
};

} // namespace scpsend
