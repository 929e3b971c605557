#pragma once
#include "Transport.hpp"
#include <string>
#include <vector>

// Forward declarations of the internal libssh2 types
struct _LIBSSH2_SESSION;

namespace scpsend {

class Libssh2Transport : public Transport {
public:
    Libssh2Transport();
    ~Libssh2Transport() override;

    Libssh2Transport(const Libssh2Transport &) = delete;
    Libssh2Transport &operator=(const Libssh2Transport &) = delete;

    bool connect(const SessionOptions &opt, std::string &err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

    std::vector<std::string> offeredMethods(const std::string &username) override;
    bool isAuthenticated() const override;

    AuthReply authByKey(const std::string &username,
                        const std::string &private_key_path,
                        const std::optional<std::string> &passphrase) override;
    AuthReply authByPassword(const std::string &username,
                             const std::string &password) override;

    std::unique_ptr<WriteChannel> openWriteChannel(const std::string &remote_path,
                                                   std::uint64_t size,
                                                   std::uint32_t mode,
                                                   std::int64_t mtime,
                                                   std::int64_t atime,
                                                   std::string &err) override;

private:
    bool connected_ = false;
    int sock_ = -1;
    _LIBSSH2_SESSION *session_ = nullptr;
    SessionOptions opt_{};
    std::string authlist_;

    bool tcpConnect(const std::string &host, std::uint16_t port, std::string &err);
    bool sshHandshake(std::string &err);
    bool verifyHostKey(std::string &err);
    std::string lastSessionError() const;
    AuthReply replyFor(int rc) const;
};

} // namespace scpsend
